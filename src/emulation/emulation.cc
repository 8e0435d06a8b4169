/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <unistd.h>

#include <stdexcept>

#include "emulation.hh"
#include "namespace_node.hh"
#include "forwarding_node.hh"
#include "bridge_switch.hh"
#include "topology_error.hh"
#include "exception.hh"
#include "log.hh"

using namespace std;

EmulationOptions::EmulationOptions( void )
    : namespace_prefix( default_namespace_prefix() ),
      link_timeout_ms( 5000 )
{}

string default_namespace_prefix( void )
{
    return "rl" + to_string( getpid() ) + "-";
}

string state_name( const Emulation::State state )
{
    switch ( state ) {
    case Emulation::State::Validated: return "validated";
    case Emulation::State::Provisioned: return "provisioned";
    case Emulation::State::Running: return "running";
    case Emulation::State::Stopped: return "stopped";
    }

    throw runtime_error( "invalid emulation state" );
}

Emulation::Emulation( const Topology & topology,
                      NamespaceDriver & driver,
                      const EmulationOptions & options )
    : topology_( topology ),
      driver_( driver ),
      options_( options ),
      state_( State::Validated ),
      nodes_(),
      by_name_(),
      teardown_errors_()
{
    for ( const auto & node : topology_.nodes() ) {
        unique_ptr<NamespaceNode> base( new NamespaceNode( node.name, namespace_of( node.name ), driver_ ) );

        unique_ptr<EmulatedNode> emulated;
        switch ( node.role ) {
        case NodeRole::Router:
            emulated = with_forwarding( move( base ) );
            break;
        case NodeRole::Switch:
            emulated.reset( new BridgeSwitch( move( base ) ) );
            break;
        case NodeRole::Host:
            emulated = move( base );
            break;
        }

        by_name_[ node.name ] = emulated.get();
        nodes_.push_back( move( emulated ) );
    }
}

Emulation::~Emulation()
{
    stop();
}

string Emulation::namespace_of( const string & node ) const
{
    return options_.namespace_prefix + node;
}

EmulatedNode & Emulation::node( const string & name )
{
    const auto it = by_name_.find( name );
    if ( it == by_name_.end() ) {
        throw unknown_node_error( name );
    }

    return *it->second;
}

void Emulation::start( void )
{
    if ( state_ != State::Validated ) {
        throw runtime_error( "start: emulation of " + topology_.name() + " is already "
                             + state_name( state_ ) );
    }

    state_ = State::Provisioned;

    try {
        info() << "*** Adding nodes:" << endl;
        for ( auto & node : nodes_ ) {
            node->provision();
            info() << node->name() << " ";
        }
        info() << endl;

        info() << "*** Adding links:" << endl;
        for ( const auto & link : topology_.links() ) {
            driver_.add_veth_pair( namespace_of( link.node_a ), link.interface_a,
                                   namespace_of( link.node_b ), link.interface_b );
            info() << "(" << link.node_a << ", " << link.node_b << ") ";
        }
        info() << endl;

        info() << "*** Configuring nodes" << endl;
        for ( size_t i = 0; i < nodes_.size(); i++ ) {
            nodes_[ i ]->activate( node_config( topology_.nodes()[ i ] ) );
        }

        info() << "*** Waiting for links to come up" << endl;
        for ( const auto & node : topology_.nodes() ) {
            for ( const auto & intf : node.interfaces ) {
                driver_.wait_for_link_up( namespace_of( node.name ), intf.name, options_.link_timeout_ms );
            }
        }
    } catch ( const exception & e ) {
        warning() << "*** Could not start " << topology_.name() << " (" << e.what() << "), tearing down" << endl;
        stop();
        throw;
    }

    state_ = State::Running;
}

ProbeReport Emulation::ping_all( void )
{
    if ( state_ != State::Running ) {
        throw runtime_error( "ping_all: emulation of " + topology_.name() + " is "
                             + state_name( state_ ) + ", not running" );
    }

    ProbeReport report;
    const auto hosts = topology_.hosts();

    info() << "*** Ping: testing ping reachability" << endl;

    for ( const auto source : hosts ) {
        info() << source->name << " -> ";

        for ( const auto destination : hosts ) {
            if ( source == destination ) {
                continue;
            }

            bool reachable = false;
            const Topology::Interface * target = destination->primary_interface();

            if ( target != nullptr ) {
                try {
                    reachable = driver_.ping( namespace_of( source->name ), target->address.address() );
                } catch ( const exception & e ) { /* a ping that cannot run is a failed pair */
                    warning() << source->name << ": could not ping " << destination->name << ": "
                              << e.what() << endl;
                }
            }

            report.record( source->name, destination->name, reachable );
            info() << ( reachable ? destination->name : "X" ) << " ";
        }

        info() << endl;
    }

    info() << report.summary() << endl;

    return report;
}

void Emulation::stop( void )
{
    if ( state_ == State::Stopped ) {
        return;
    }

    if ( state_ == State::Validated ) { /* nothing was ever created */
        state_ = State::Stopped;
        return;
    }

    state_ = State::Stopped;

    info() << "*** Stopping " << nodes_.size() << " nodes" << endl;

    for ( auto it = nodes_.rbegin(); it != nodes_.rend(); it++ ) {
        ( *it )->terminate();

        const vector<string> errors = ( *it )->teardown_errors();
        teardown_errors_.insert( teardown_errors_.end(), errors.begin(), errors.end() );
    }

    if ( not teardown_errors_.empty() ) {
        warning() << "*** " << teardown_errors_.size() << " problem(s) while stopping " << topology_.name() << endl;
    }

    info() << "*** Done" << endl;
}
