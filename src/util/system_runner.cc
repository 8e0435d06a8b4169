/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include "system_runner.hh"
#include "file_descriptor.hh"
#include "exception.hh"
#include "util.hh"

using namespace std;

int ezexec( const vector< string > & command, const bool path_search )
{
    if ( command.empty() ) {
        throw runtime_error( "ezexec: empty command" );
    }

    /* copy the arguments to mutable structures */
    vector<char *> argv;
    vector<vector<char>> argv_data;

    for ( const auto & arg : command ) {
        vector<char> char_data( arg.size() + 1 );
        copy( arg.begin(), arg.end(), char_data.begin() );
        char_data.back() = 0;
        argv_data.push_back( move( char_data ) );
    }

    for ( auto & arg : argv_data ) {
        argv.push_back( arg.data() );
    }
    argv.push_back( nullptr );

    return SystemCall( "execv" + string( path_search ? "p" : "" ) + " " + command_str( command ),
                       path_search ? execvp( argv.front(), argv.data() )
                                   : execv( argv.front(), argv.data() ) );
}

static int wait_for_child( const pid_t pid, const vector< string > & command )
{
    int status;
    while ( waitpid( pid, &status, 0 ) < 0 ) {
        if ( errno != EINTR ) {
            throw unix_error( "waitpid " + command_str( command ) );
        }
    }

    if ( WIFSIGNALED( status ) ) {
        throw runtime_error( "`" + command_str( command ) + "': process died on signal "
                             + to_string( WTERMSIG( status ) ) );
    }

    return WEXITSTATUS( status );
}

int run_for_status( const vector< string > & command, string & output )
{
    int pipe_fds[ 2 ];
    SystemCall( "pipe2", pipe2( pipe_fds, O_CLOEXEC ) );
    FileDescriptor read_end( pipe_fds[ 0 ] ), write_end( pipe_fds[ 1 ] );

    const pid_t pid = SystemCall( "fork", fork() );

    if ( pid == 0 ) { /* child */
        try {
            SystemCall( "dup2", dup2( write_end.fd_num(), STDOUT_FILENO ) );
            SystemCall( "dup2", dup2( write_end.fd_num(), STDERR_FILENO ) );
            ezexec( command );
        } catch ( const exception & e ) {
            print_exception( e );
        }
        _exit( EXIT_FAILURE );
    }

    write_end.close();
    output = read_end.read_all();

    return wait_for_child( pid, command );
}

string run_and_capture( const vector< string > & command )
{
    string output;
    const int status = run_for_status( command, output );

    if ( status != 0 ) {
        throw runtime_error( "`" + command_str( command ) + "': process exited with failure status "
                             + to_string( status ) + ( output.empty() ? "" : ": " + trim( output ) ) );
    }

    return output;
}

void run( const vector< string > & command )
{
    run_and_capture( command );
}

string command_str( const vector< string > & command )
{
    return join( command );
}
