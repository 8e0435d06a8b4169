/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <chrono>
#include <thread>

#include "linux_namespace_driver.hh"
#include "system_runner.hh"
#include "exception.hh"
#include "config.h"
#include "log.hh"

using namespace std;

LinuxNamespaceDriver::LinuxNamespaceDriver( const unsigned int ping_timeout_s )
    : ping_timeout_s_( ping_timeout_s )
{}

string LinuxNamespaceDriver::checked_run( const vector<string> & command )
{
    debug() << "*** " << command_str( command ) << endl;

    try {
        return run_and_capture( command );
    } catch ( const exception & e ) {
        throw provisioning_error( e.what() );
    }
}

string LinuxNamespaceDriver::ip_in( const string & ns, const vector<string> & args )
{
    vector<string> command = { IP, "-n", ns };
    command.insert( command.end(), args.begin(), args.end() );
    return checked_run( command );
}

void LinuxNamespaceDriver::add_namespace( const string & ns )
{
    checked_run( { IP, "netns", "add", ns } );
}

void LinuxNamespaceDriver::remove_namespace( const string & ns )
{
    checked_run( { IP, "netns", "delete", ns } );
}

void LinuxNamespaceDriver::add_veth_pair( const string & ns_a, const string & interface_a,
                                          const string & ns_b, const string & interface_b )
{
    /* both ends are created directly inside their namespaces, so the
       names never have to be unique in the root namespace */
    checked_run( { IP, "link", "add", "name", interface_a, "netns", ns_a,
                   "type", "veth", "peer", "name", interface_b, "netns", ns_b } );
}

void LinuxNamespaceDriver::add_bridge( const string & ns, const string & bridge )
{
    ip_in( ns, { "link", "add", "name", bridge, "type", "bridge" } );
    ip_in( ns, { "link", "set", "dev", bridge, "up" } );
}

void LinuxNamespaceDriver::attach_to_bridge( const string & ns, const string & port, const string & bridge )
{
    ip_in( ns, { "link", "set", "dev", port, "master", bridge } );
}

void LinuxNamespaceDriver::set_address( const string & ns, const string & interface,
                                        const InterfaceAddress & address )
{
    ip_in( ns, { "addr", "add", address.str(), "dev", interface } );
}

void LinuxNamespaceDriver::set_link_up( const string & ns, const string & interface )
{
    ip_in( ns, { "link", "set", "dev", interface, "up" } );
}

bool LinuxNamespaceDriver::link_is_up( const string & ns, const string & interface )
{
    const string state = ip_in( ns, { "-o", "link", "show", "dev", interface } );
    return state.find( " state UP " ) != string::npos;
}

void LinuxNamespaceDriver::wait_for_link_up( const string & ns, const string & interface,
                                             const unsigned int timeout_ms )
{
    const auto deadline = chrono::steady_clock::now() + chrono::milliseconds( timeout_ms );

    while ( not link_is_up( ns, interface ) ) {
        if ( chrono::steady_clock::now() >= deadline ) {
            throw provisioning_error( ns + ": timed out after " + to_string( timeout_ms )
                                      + " ms waiting for " + interface + " to come up" );
        }
        this_thread::sleep_for( chrono::milliseconds( 10 ) );
    }
}

void LinuxNamespaceDriver::add_route( const string & ns, const InterfaceAddress & destination,
                                      const Address & gateway )
{
    ip_in( ns, { "route", "add", destination.str(), "via", gateway.ip() } );
}

void LinuxNamespaceDriver::add_default_route( const string & ns, const Address & gateway )
{
    ip_in( ns, { "route", "add", "default", "via", gateway.ip() } );
}

string LinuxNamespaceDriver::exec( const string & ns, const string & command )
{
    return checked_run( { IP, "netns", "exec", ns, SHELL, "-c", command } );
}

bool LinuxNamespaceDriver::ping( const string & ns, const Address & destination )
{
    const vector<string> command = { IP, "netns", "exec", ns, PING, "-n", "-q", "-c", "1",
                                     "-W", to_string( ping_timeout_s_ ), destination.ip() };
    debug() << "*** " << command_str( command ) << endl;

    string output;
    const int status = run_for_status( command, output );
    if ( not ping_completed( status, output ) ) {
        warning() << ns << ": ping " << destination.ip() << " failed (status " << status << "): "
                  << output << endl;
    }

    return status == 0;
}

bool ping_completed( const int status, const string & output )
{
    if ( status == 0 ) {
        return true;
    }

    return status == 1 and output.find( "packets transmitted" ) != string::npos;
}
