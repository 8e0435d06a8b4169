/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <unistd.h>
#include <fcntl.h>

#include <algorithm>
#include <vector>

#include "file_descriptor.hh"
#include "exception.hh"

using namespace std;

const size_t FileDescriptor::BUFFER_SIZE;

FileDescriptor::FileDescriptor( const int fd )
    : fd_( fd ),
      eof_( false )
{
    /* set close-on-exec flag so our file descriptors
       aren't passed on to unrelated children */
    SystemCall( "fcntl FD_CLOEXEC", fcntl( fd_, F_SETFD, FD_CLOEXEC ) );
}

FileDescriptor::FileDescriptor( FileDescriptor && other )
    : fd_( other.fd_ ),
      eof_( other.eof_ )
{
    other.fd_ = -1;
}

void FileDescriptor::close( void )
{
    if ( fd_ < 0 ) { /* has already been moved away or closed */
        return;
    }

    SystemCall( "close", ::close( fd_ ) );

    fd_ = -1;
}

FileDescriptor::~FileDescriptor()
{
    try {
        close();
    } catch ( const exception & e ) { /* don't throw from destructor */
        print_exception( e );
    }
}

string FileDescriptor::read( const size_t limit )
{
    vector<char> buffer( min( BUFFER_SIZE, limit ) );

    ssize_t bytes_read;
    do {
        bytes_read = ::read( fd_, buffer.data(), buffer.size() );
    } while ( bytes_read < 0 and errno == EINTR );

    SystemCall( "read", bytes_read );

    if ( bytes_read == 0 ) {
        eof_ = true;
    }

    return string( buffer.data(), bytes_read );
}

string FileDescriptor::read_all( void )
{
    string ret;

    while ( not eof_ ) {
        ret.append( read() );
    }

    return ret;
}

void FileDescriptor::write( const string & buffer )
{
    auto it = buffer.begin();

    while ( it != buffer.end() ) {
        ssize_t bytes_written = ::write( fd_, &*it, buffer.end() - it );
        if ( bytes_written < 0 and errno == EINTR ) {
            continue;
        }
        it += SystemCall( "write", bytes_written );
    }
}
