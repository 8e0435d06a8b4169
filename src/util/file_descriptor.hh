/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef FILE_DESCRIPTOR_HH
#define FILE_DESCRIPTOR_HH

#include <string>

/* Unix file descriptors (sockets, files, pipes, etc.) */
class FileDescriptor
{
private:
    int fd_;
    bool eof_;

public:
    /* construct from fd number returned by kernel */
    explicit FileDescriptor( const int fd );

    /* free the fd */
    virtual ~FileDescriptor();

    int fd_num( void ) const { return fd_; }

    bool eof( void ) const { return eof_; }

    /* read up to limit bytes; an empty result means end of file */
    std::string read( const size_t limit = BUFFER_SIZE );

    /* read until end of file */
    std::string read_all( void );

    /* write the whole string, retrying on short writes */
    void write( const std::string & buffer );

    void close( void );

    /* forbid copying FileDescriptor objects or assigning them */
    FileDescriptor( const FileDescriptor & other ) = delete;
    const FileDescriptor & operator=( const FileDescriptor & other ) = delete;

    /* allow moving FileDescriptor objects */
    FileDescriptor( FileDescriptor && other );

    static const size_t BUFFER_SIZE = 1024 * 1024;
};

#endif /* FILE_DESCRIPTOR_HH */
