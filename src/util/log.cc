/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <iostream>
#include <stdexcept>

#include "log.hh"

using namespace std;

static LogLevel current_level = LogLevel::Info;

void set_log_level( const LogLevel level )
{
    current_level = level;
}

void set_log_level( const string & name )
{
    if ( name == "error" ) {
        set_log_level( LogLevel::Error );
    } else if ( name == "warning" ) {
        set_log_level( LogLevel::Warning );
    } else if ( name == "info" ) {
        set_log_level( LogLevel::Info );
    } else if ( name == "debug" ) {
        set_log_level( LogLevel::Debug );
    } else {
        throw runtime_error( "unknown log level \"" + name + "\" (expected error, warning, info or debug)" );
    }
}

LogLevel log_level( void )
{
    return current_level;
}

ostream & log_at( const LogLevel level )
{
    /* a stream without a buffer discards everything written to it */
    static ostream null_stream( nullptr );

    if ( level > current_level ) {
        return null_stream;
    }

    if ( level == LogLevel::Error or level == LogLevel::Warning ) {
        return cerr;
    }

    return cout;
}
