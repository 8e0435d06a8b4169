/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EXCEPTION_HH
#define EXCEPTION_HH

#include <cxxabi.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <typeinfo>

class tagged_error : public std::system_error
{
private:
    std::string attempt_and_error_;

public:
    tagged_error( const std::error_category & category,
                  const std::string & s_attempt,
                  const int error_code )
        : system_error( error_code, category ),
          attempt_and_error_( s_attempt + ": " + std::system_error::what() )
    {}

    const char * what( void ) const noexcept override
    {
        return attempt_and_error_.c_str();
    }
};

class unix_error : public tagged_error
{
public:
    unix_error( const std::string & s_attempt,
                const int s_errno = errno )
        : tagged_error( std::system_category(), s_attempt, s_errno )
    {}
};

/* OS-level failure while realizing or tearing down emulated state */
class provisioning_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

inline std::string demangle( const char * name )
{
    int status = 0;
    std::unique_ptr<char, decltype( &free )> res { abi::__cxa_demangle( name, nullptr, nullptr, &status ), &free };
    return status == 0 ? res.get() : name;
}

inline void print_exception( const std::exception & e, std::ostream & output = std::cerr )
{
    output << "Died on " << demangle( typeid( e ).name() ) << ": " << e.what() << std::endl;
}

/* error-checking wrapper for most syscalls */
inline int SystemCall( const char * s_attempt, const int return_value )
{
    if ( return_value >= 0 ) {
        return return_value;
    }

    throw unix_error( s_attempt );
}

inline int SystemCall( const std::string & s_attempt, const int return_value )
{
    return SystemCall( s_attempt.c_str(), return_value );
}

#endif /* EXCEPTION_HH */
