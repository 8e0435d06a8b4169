/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <deque>

#include "simulated_namespace_driver.hh"
#include "exception.hh"

using namespace std;

static SimulatedNamespaceDriver::InterfaceState new_interface( const bool up, const bool is_bridge )
{
    SimulatedNamespaceDriver::InterfaceState intf;
    intf.up = up;
    intf.is_bridge = is_bridge;
    intf.master = "";
    intf.has_address = false;
    intf.address = InterfaceAddress();
    return intf;
}

SimulatedNamespaceDriver::SimulatedNamespaceDriver( void )
    : namespaces_(),
      veth_peers_(),
      forwarding_at_removal_(),
      calls_(),
      failures_(),
      inherited_forwarding_( false )
{}

void SimulatedNamespaceDriver::call( const string & description )
{
    calls_.push_back( description );

    for ( const auto & prefix : failures_ ) {
        if ( description.compare( 0, prefix.size(), prefix ) == 0 ) {
            throw provisioning_error( "simulated failure: " + description );
        }
    }
}

bool SimulatedNamespaceDriver::called( const string & prefix ) const
{
    return call_index( prefix ) >= 0;
}

int SimulatedNamespaceDriver::call_index( const string & prefix ) const
{
    for ( size_t i = 0; i < calls_.size(); i++ ) {
        if ( calls_[ i ].compare( 0, prefix.size(), prefix ) == 0 ) {
            return i;
        }
    }

    return -1;
}

SimulatedNamespaceDriver::NamespaceState & SimulatedNamespaceDriver::ns_state( const string & ns )
{
    const auto it = namespaces_.find( ns );
    if ( it == namespaces_.end() ) {
        throw provisioning_error( "Cannot open network namespace \"" + ns + "\": No such file or directory" );
    }

    return it->second;
}

const SimulatedNamespaceDriver::NamespaceState & SimulatedNamespaceDriver::namespace_state( const string & ns ) const
{
    const auto it = namespaces_.find( ns );
    if ( it == namespaces_.end() ) {
        throw runtime_error( "no namespace " + ns );
    }

    return it->second;
}

SimulatedNamespaceDriver::InterfaceState & SimulatedNamespaceDriver::interface_state( const string & ns,
                                                                                      const string & interface )
{
    NamespaceState & state = ns_state( ns );
    const auto it = state.interfaces.find( interface );
    if ( it == state.interfaces.end() ) {
        throw provisioning_error( "Cannot find device \"" + interface + "\" in " + ns );
    }

    return it->second;
}

bool SimulatedNamespaceDriver::forwarding_at_removal( const string & ns ) const
{
    const auto it = forwarding_at_removal_.find( ns );
    if ( it == forwarding_at_removal_.end() ) {
        throw runtime_error( "namespace " + ns + " was never removed" );
    }

    return it->second;
}

void SimulatedNamespaceDriver::add_namespace( const string & ns )
{
    call( "add_namespace " + ns );

    if ( has_namespace( ns ) ) {
        throw provisioning_error( "Cannot create namespace file \"" + ns + "\": File exists" );
    }

    NamespaceState state;
    state.interfaces[ "lo" ] = new_interface( false, false );
    state.forwarding = inherited_forwarding_;
    namespaces_[ ns ] = state;
}

void SimulatedNamespaceDriver::remove_namespace( const string & ns )
{
    call( "remove_namespace " + ns );

    const NamespaceState & state = ns_state( ns );
    forwarding_at_removal_[ ns ] = state.forwarding;

    /* deleting one end of a veth pair deletes the other */
    for ( auto it = veth_peers_.begin(); it != veth_peers_.end(); ) {
        if ( it->first.first == ns ) {
            const Endpoint peer = it->second;
            if ( peer.first != ns and has_namespace( peer.first ) ) {
                namespaces_[ peer.first ].interfaces.erase( peer.second );
            }
            veth_peers_.erase( peer );
            it = veth_peers_.erase( it );
        } else {
            ++it;
        }
    }

    namespaces_.erase( ns );
}

void SimulatedNamespaceDriver::add_veth_pair( const string & ns_a, const string & interface_a,
                                              const string & ns_b, const string & interface_b )
{
    call( "add_veth_pair " + ns_a + " " + interface_a + " " + ns_b + " " + interface_b );

    NamespaceState & a = ns_state( ns_a );
    NamespaceState & b = ns_state( ns_b );

    if ( a.interfaces.count( interface_a ) or b.interfaces.count( interface_b ) ) {
        throw provisioning_error( "RTNETLINK answers: File exists" );
    }

    a.interfaces[ interface_a ] = new_interface( false, false );
    b.interfaces[ interface_b ] = new_interface( false, false );

    veth_peers_[ Endpoint( ns_a, interface_a ) ] = Endpoint( ns_b, interface_b );
    veth_peers_[ Endpoint( ns_b, interface_b ) ] = Endpoint( ns_a, interface_a );
}

void SimulatedNamespaceDriver::add_bridge( const string & ns, const string & bridge )
{
    call( "add_bridge " + ns + " " + bridge );

    NamespaceState & state = ns_state( ns );
    if ( state.interfaces.count( bridge ) ) {
        throw provisioning_error( "RTNETLINK answers: File exists" );
    }

    state.interfaces[ bridge ] = new_interface( true, true );
}

void SimulatedNamespaceDriver::attach_to_bridge( const string & ns, const string & port, const string & bridge )
{
    call( "attach_to_bridge " + ns + " " + port + " " + bridge );

    if ( not interface_state( ns, bridge ).is_bridge ) {
        throw provisioning_error( bridge + " is not a bridge" );
    }

    interface_state( ns, port ).master = bridge;
}

void SimulatedNamespaceDriver::set_address( const string & ns, const string & interface,
                                            const InterfaceAddress & address )
{
    call( "set_address " + ns + " " + interface + " " + address.str() );

    InterfaceState & intf = interface_state( ns, interface );
    intf.has_address = true;
    intf.address = address;
}

void SimulatedNamespaceDriver::set_link_up( const string & ns, const string & interface )
{
    call( "set_link_up " + ns + " " + interface );

    interface_state( ns, interface ).up = true;
}

void SimulatedNamespaceDriver::wait_for_link_up( const string & ns, const string & interface,
                                                 const unsigned int timeout_ms )
{
    call( "wait_for_link_up " + ns + " " + interface );

    bool carrier = interface_state( ns, interface ).up;

    /* a veth end has carrier only while its peer is up too */
    const auto peer = veth_peers_.find( Endpoint( ns, interface ) );
    if ( peer != veth_peers_.end() ) {
        carrier = carrier and interface_state( peer->second.first, peer->second.second ).up;
    }

    if ( not carrier ) {
        throw provisioning_error( "timed out after " + to_string( timeout_ms ) + " ms waiting for "
                                  + interface + " in " + ns + " to come up" );
    }
}

void SimulatedNamespaceDriver::add_route( const string & ns, const InterfaceAddress & destination,
                                          const Address & gateway )
{
    call( "add_route " + ns + " " + destination.str() + " via " + gateway.ip() );

    NamespaceState & state = ns_state( ns );

    bool on_link = false;
    for ( const auto & intf : state.interfaces ) {
        if ( intf.second.up and intf.second.has_address and intf.second.address.contains( gateway ) ) {
            on_link = true;
        }
    }

    if ( not on_link ) {
        throw provisioning_error( "RTNETLINK answers: Nexthop has invalid gateway" );
    }

    state.routes.push_back( RouteState { destination, gateway } );
}

void SimulatedNamespaceDriver::add_default_route( const string & ns, const Address & gateway )
{
    add_route( ns, InterfaceAddress( Address(), 0 ), gateway );
}

string SimulatedNamespaceDriver::exec( const string & ns, const string & command )
{
    call( "exec " + ns + " " + command );

    NamespaceState & state = ns_state( ns );

    if ( command.find( "net.ipv4.ip_forward=1" ) != string::npos ) {
        state.forwarding = true;
        return "net.ipv4.ip_forward = 1\n";
    } else if ( command.find( "net.ipv4.ip_forward=0" ) != string::npos ) {
        state.forwarding = false;
        return "net.ipv4.ip_forward = 0\n";
    } else if ( command.find( "-n net.ipv4.ip_forward" ) != string::npos ) {
        return state.forwarding ? "1\n" : "0\n";
    }

    return "";
}

vector<SimulatedNamespaceDriver::Endpoint> SimulatedNamespaceDriver::neighbours( const Endpoint & from ) const
{
    set<Endpoint> visited;
    deque<Endpoint> queue;

    visited.insert( from );
    queue.push_back( from );

    while ( not queue.empty() ) {
        const Endpoint current = queue.front();
        queue.pop_front();

        const NamespaceState & state = namespaces_.at( current.first );
        const InterfaceState & intf = state.interfaces.at( current.second );
        if ( not intf.up ) {
            continue;
        }

        vector<Endpoint> next;

        const auto peer = veth_peers_.find( current );
        if ( peer != veth_peers_.end() ) {
            next.push_back( peer->second );
        }

        if ( not intf.master.empty() and state.interfaces.at( intf.master ).up ) {
            for ( const auto & port : state.interfaces ) {
                if ( port.second.master == intf.master ) {
                    next.push_back( Endpoint( current.first, port.first ) );
                }
            }
        }

        for ( const auto & endpoint : next ) {
            if ( not visited.count( endpoint ) ) {
                visited.insert( endpoint );
                queue.push_back( endpoint );
            }
        }
    }

    vector<Endpoint> ret;
    for ( const auto & endpoint : visited ) {
        const InterfaceState & intf = namespaces_.at( endpoint.first ).interfaces.at( endpoint.second );
        if ( endpoint != from and intf.up and intf.has_address and intf.master.empty() and not intf.is_bridge ) {
            ret.push_back( endpoint );
        }
    }

    return ret;
}

bool SimulatedNamespaceDriver::lookup( const string & ns, const Address & destination,
                                       string & egress, Address & next_hop ) const
{
    const NamespaceState & state = namespaces_.at( ns );
    int best_prefix = -1;

    /* connected routes */
    for ( const auto & intf : state.interfaces ) {
        if ( intf.second.up and intf.second.has_address and intf.second.address.contains( destination )
             and int( intf.second.address.prefix_length() ) > best_prefix ) {
            best_prefix = intf.second.address.prefix_length();
            egress = intf.first;
            next_hop = destination;
        }
    }

    for ( const auto & route : state.routes ) {
        if ( not route.destination.contains( destination )
             or int( route.destination.prefix_length() ) <= best_prefix ) {
            continue;
        }

        for ( const auto & intf : state.interfaces ) {
            if ( intf.second.up and intf.second.has_address and intf.second.address.contains( route.gateway ) ) {
                best_prefix = route.destination.prefix_length();
                egress = intf.first;
                next_hop = route.gateway;
                break;
            }
        }
    }

    return best_prefix >= 0;
}

bool SimulatedNamespaceDriver::owns( const string & ns, const Address & address ) const
{
    for ( const auto & intf : namespaces_.at( ns ).interfaces ) {
        if ( intf.second.has_address and intf.second.address.address() == address ) {
            return true;
        }
    }

    return false;
}

string SimulatedNamespaceDriver::deliver( const string & ns, const Address & destination ) const
{
    string current = ns;

    for ( unsigned int hops = 0; hops < 32; hops++ ) {
        if ( owns( current, destination ) ) {
            return current;
        }

        string egress;
        Address next_hop;
        if ( not lookup( current, destination, egress, next_hop ) ) {
            return "";
        }

        string next;
        for ( const auto & neighbour : neighbours( Endpoint( current, egress ) ) ) {
            const InterfaceState & intf = namespaces_.at( neighbour.first ).interfaces.at( neighbour.second );
            if ( intf.address.address() == next_hop ) {
                next = neighbour.first;
                break;
            }
        }

        if ( next.empty() ) { /* no ARP reply */
            return "";
        }

        if ( not owns( next, destination ) and not namespaces_.at( next ).forwarding ) {
            return "";
        }

        current = next;
    }

    return "";
}

bool SimulatedNamespaceDriver::ping( const string & ns, const Address & destination )
{
    call( "ping " + ns + " " + destination.ip() );

    if ( not has_namespace( ns ) ) {
        throw provisioning_error( "Cannot open network namespace \"" + ns + "\"" );
    }

    string egress;
    Address next_hop;
    if ( not lookup( ns, destination, egress, next_hop ) ) {
        return false;
    }

    const InterfaceState & source = namespaces_.at( ns ).interfaces.at( egress );

    const string target = deliver( ns, destination );
    if ( target.empty() ) {
        return false;
    }

    return deliver( target, source.address.address() ) == ns;
}
