/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <fcntl.h>
#include <unistd.h>

#include <cstdlib>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "config.h"
#include "exception.hh"
#include "file_descriptor.hh"
#include "util.hh"

using namespace std;

void check_requirements( const int argc, const char * const argv[] )
{
    if ( argc <= 0 ) {
        /* really crazy user */
        throw runtime_error( "missing argv[ 0 ]: argc <= 0" );
    }

    /* verify normal fds are present (stderr hasn't been closed) */
    FileDescriptor( SystemCall( "open /dev/null", open( "/dev/null", O_RDONLY ) ) );

    /* namespaces, links and sysctls all need root */
    if ( geteuid() != 0 ) {
        throw runtime_error( string( argv[ 0 ] ) + ": needs to be run as root" );
    }

    /* verify the tools we drive are installed */
    for ( const char * tool : { IP, SYSCTL, PING } ) {
        if ( access( tool, X_OK ) != 0 ) {
            throw unix_error( string( argv[ 0 ] ) + ": cannot execute " + tool );
        }
    }
}

string safe_getenv( const string & key )
{
    const char * const value = getenv( key.c_str() );
    if ( not value ) {
        throw runtime_error( "missing environment variable: " + key );
    }
    return value;
}

string safe_getenv_or( const string & key, const string & def_val )
{
    const char * const value = getenv( key.c_str() );
    if ( not value ) {
        return def_val;
    }
    return value;
}

unsigned int parse_unsigned( const string & str, const string & what )
{
    if ( str.empty() or str.find_first_not_of( "0123456789" ) != string::npos ) {
        throw runtime_error( "invalid " + what + ": \"" + str + "\"" );
    }

    const unsigned long value = stoul( str );
    if ( value > numeric_limits<unsigned int>::max() ) {
        throw runtime_error( what + " out of range: " + str );
    }

    return value;
}

string join( const vector< string > & command )
{
    if ( command.empty() ) {
        return "";
    }

    return accumulate( command.begin() + 1, command.end(),
                       command.front(),
                       []( const string & a, const string & b ) { return a + " " + b; } );
}

string trim( const string & str )
{
    const string whitespace = " \t\r\n";

    const auto first = str.find_first_not_of( whitespace );
    if ( first == string::npos ) {
        return "";
    }

    const auto last = str.find_last_not_of( whitespace );
    return str.substr( first, last - first + 1 );
}

void split( const string & s, char delim, vector< string > & elems )
{
    stringstream ss( s );
    string item;
    while ( getline( ss, item, delim ) ) {
        elems.push_back( item );
    }
}

vector< string > split( const string & s, char delim )
{
    vector< string > elems;
    split( s, delim, elems );
    return elems;
}
