/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <net/if.h>

#include <algorithm>
#include <set>
#include <stdexcept>

#include "topology_builder.hh"
#include "topology_error.hh"
#include "util.hh"

using namespace std;

TopologyBuilder::TopologyBuilder( const string & name )
    : name_( name ),
      nodes_(),
      index_(),
      links_()
{}

TopologyBuilder::DeclaredNode & TopologyBuilder::declared( const string & name )
{
    const auto it = index_.find( name );
    if ( it == index_.end() ) {
        throw unknown_node_error( name );
    }

    return nodes_.at( it->second );
}

void TopologyBuilder::add_node( const string & name,
                                const NodeRole role,
                                const string & address,
                                const string & default_route )
{
    if ( name.empty() ) {
        throw topology_error( "node name must be non-empty" );
    }

    if ( has_node( name ) ) {
        throw duplicate_node_error( name );
    }

    DeclaredNode node;
    node.name = name;
    node.role = role;
    node.address = address;
    node.default_route = default_route;

    index_[ name ] = nodes_.size();
    nodes_.push_back( node );
}

void TopologyBuilder::add_host( const string & name, const string & address, const string & default_route )
{
    add_node( name, NodeRole::Host, address, default_route );
}

void TopologyBuilder::add_router( const string & name, const string & address )
{
    add_node( name, NodeRole::Router, address );
}

void TopologyBuilder::add_switch( const string & name, const string & label )
{
    add_node( name, NodeRole::Switch );
    set_label( name, label );
}

void TopologyBuilder::set_label( const string & node, const string & label )
{
    declared( node ).label = label;
}

void TopologyBuilder::add_route( const string & node, const string & destination, const string & gateway )
{
    declared( node ).routes.push_back( DeclaredRoute { destination, gateway } );
}

void TopologyBuilder::add_link( const string & node_a, const string & node_b, const LinkOptions & options )
{
    for ( const auto & name : { node_a, node_b } ) {
        if ( not has_node( name ) ) {
            throw unknown_node_error( name );
        }
    }

    links_.push_back( DeclaredLink { node_a, node_b, options } );
}

unsigned int TopologyBuilder::remove_link( const string & node_a, const string & node_b )
{
    const auto old_size = links_.size();

    links_.erase( remove_if( links_.begin(), links_.end(),
                             [&]( const DeclaredLink & link ) {
                                 return ( link.node_a == node_a and link.node_b == node_b )
                                     or ( link.node_a == node_b and link.node_b == node_a );
                             } ),
                  links_.end() );

    return old_size - links_.size();
}

/* accepts "a.b.c.d" and "via a.b.c.d" */
static Address parse_gateway( const string & str )
{
    string gateway = trim( str );
    if ( gateway.compare( 0, 4, "via " ) == 0 ) {
        gateway = trim( gateway.substr( 4 ) );
    }

    return Address( gateway );
}

namespace {

/* union-find over node indices, used to merge switches into segments */
class SegmentSets
{
private:
    vector<size_t> parent_;

public:
    explicit SegmentSets( const size_t count ) : parent_( count )
    {
        for ( size_t i = 0; i < count; i++ ) {
            parent_[ i ] = i;
        }
    }

    size_t find( size_t i )
    {
        while ( parent_[ i ] != i ) {
            parent_[ i ] = parent_[ parent_[ i ] ];
            i = parent_[ i ];
        }
        return i;
    }

    void merge( const size_t a, const size_t b )
    {
        const size_t root_a = find( a ), root_b = find( b );
        /* keep the earlier-declared switch as the representative */
        if ( root_a < root_b ) {
            parent_[ root_b ] = root_a;
        } else {
            parent_[ root_a ] = root_b;
        }
    }
};

struct ResolvedEndpoint
{
    size_t node;
    string name;
    bool has_address;
    InterfaceAddress address;
};

}

Topology TopologyBuilder::build( void ) const
{
    vector<string> violations;

    /* node-level declarations */
    vector<Topology::Node> nodes;
    vector<bool> has_node_address( nodes_.size(), false );
    vector<InterfaceAddress> node_address( nodes_.size() );

    for ( size_t i = 0; i < nodes_.size(); i++ ) {
        const DeclaredNode & declared_node = nodes_[ i ];

        Topology::Node node;
        node.name = declared_node.name;
        node.role = declared_node.role;
        node.label = declared_node.label;
        node.has_default_route = false;

        const bool is_switch = declared_node.role == NodeRole::Switch;

        if ( not declared_node.address.empty() ) {
            if ( is_switch ) {
                violations.push_back( "switch " + node.name + " cannot carry an address" );
            } else {
                try {
                    node_address[ i ] = InterfaceAddress( declared_node.address );
                    has_node_address[ i ] = true;
                } catch ( const runtime_error & e ) {
                    violations.push_back( node.name + ": " + e.what() );
                }
            }
        }

        if ( not declared_node.default_route.empty() ) {
            if ( is_switch ) {
                violations.push_back( "switch " + node.name + " cannot carry a default route" );
            } else {
                try {
                    node.default_route = parse_gateway( declared_node.default_route );
                    node.has_default_route = true;
                } catch ( const runtime_error & e ) {
                    violations.push_back( node.name + ": default route: " + e.what() );
                }
            }
        }

        for ( const auto & route : declared_node.routes ) {
            if ( is_switch ) {
                violations.push_back( "switch " + node.name + " cannot carry routes" );
                continue;
            }

            try {
                const InterfaceAddress destination( route.destination );
                if ( not destination.is_network_address() ) {
                    violations.push_back( node.name + ": route destination " + destination.str()
                                          + " has host bits set (did you mean "
                                          + destination.subnet().str() + "?)" );
                    continue;
                }
                node.routes.push_back( Topology::Route { destination, parse_gateway( route.gateway ) } );
            } catch ( const runtime_error & e ) {
                violations.push_back( node.name + ": route to " + route.destination + ": " + e.what() );
            }
        }

        nodes.push_back( node );
    }

    /* interface names: overrides first, then <node>-eth<N> for the rest */
    vector<bool> link_ok( links_.size(), true );
    vector<set<string>> taken( nodes_.size() );
    map<pair<size_t, string>, pair<size_t, string>> override_owner; /* (node, name) -> (link, address) */

    for ( size_t k = 0; k < links_.size(); k++ ) {
        const DeclaredLink & link = links_[ k ];
        const string link_desc = "link " + link.node_a + " <-> " + link.node_b;

        if ( link.node_a == link.node_b ) {
            violations.push_back( link_desc + ": connects a node to itself" );
            link_ok[ k ] = false;
            continue;
        }

        const pair<string, pair<string, string>> sides[ 2 ] = {
            { link.node_a, { link.options.interface_a, link.options.address_a } },
            { link.node_b, { link.options.interface_b, link.options.address_b } } };

        for ( const auto & side : sides ) {
            const string & intf_name = side.second.first;
            if ( intf_name.empty() ) {
                continue;
            }

            const size_t node_index = index_.at( side.first );
            const auto key = make_pair( node_index, intf_name );
            const auto previous = override_owner.find( key );

            if ( previous == override_owner.end() ) {
                override_owner[ key ] = make_pair( k, side.second.second );
                taken[ node_index ].insert( intf_name );
                continue;
            }

            const string & previous_address = previous->second.second;
            const string & address = side.second.second;
            if ( not previous_address.empty() and not address.empty() and previous_address != address ) {
                violations.push_back( "conflicting addresses " + previous_address + " and " + address
                                      + " assigned to " + intf_name + " on " + side.first );
            } else {
                violations.push_back( "interface " + intf_name + " on " + side.first
                                      + " is declared by more than one link" );
            }
            link_ok[ k ] = false;
        }
    }

    vector<unsigned int> next_port( nodes_.size() );
    for ( size_t i = 0; i < nodes_.size(); i++ ) {
        next_port[ i ] = nodes_[ i ].role == NodeRole::Switch ? 1 : 0;
    }

    vector<Topology::Link> links;
    vector<pair<ResolvedEndpoint, ResolvedEndpoint>> resolved_links;

    for ( size_t k = 0; k < links_.size(); k++ ) {
        if ( not link_ok[ k ] ) {
            continue;
        }

        const DeclaredLink & link = links_[ k ];

        ResolvedEndpoint endpoints[ 2 ];
        const string names[ 2 ] = { link.node_a, link.node_b };
        const string overrides[ 2 ] = { link.options.interface_a, link.options.interface_b };
        const string addresses[ 2 ] = { link.options.address_a, link.options.address_b };

        for ( int side = 0; side < 2; side++ ) {
            ResolvedEndpoint & endpoint = endpoints[ side ];
            endpoint.node = index_.at( names[ side ] );
            endpoint.has_address = false;

            if ( not overrides[ side ].empty() ) {
                endpoint.name = overrides[ side ];
            } else {
                do {
                    endpoint.name = names[ side ] + "-eth" + to_string( next_port[ endpoint.node ]++ );
                } while ( taken[ endpoint.node ].count( endpoint.name ) );
                taken[ endpoint.node ].insert( endpoint.name );
            }

            if ( endpoint.name.size() >= IFNAMSIZ ) {
                violations.push_back( "interface name " + endpoint.name + " on " + names[ side ]
                                      + " is longer than " + to_string( IFNAMSIZ - 1 ) + " characters" );
            }

            if ( addresses[ side ].empty() ) {
                continue;
            }

            if ( nodes_[ endpoint.node ].role == NodeRole::Switch ) {
                violations.push_back( "switch port " + endpoint.name + " on " + names[ side ]
                                      + " cannot carry an address" );
                continue;
            }

            try {
                endpoint.address = InterfaceAddress( addresses[ side ] );
                endpoint.has_address = true;
            } catch ( const runtime_error & e ) {
                violations.push_back( names[ side ] + ": " + endpoint.name + ": " + e.what() );
            }
        }

        links.push_back( Topology::Link { names[ 0 ], endpoints[ 0 ].name, names[ 1 ], endpoints[ 1 ].name } );
        resolved_links.push_back( make_pair( endpoints[ 0 ], endpoints[ 1 ] ) );

        for ( int side = 0; side < 2; side++ ) {
            const ResolvedEndpoint & self = endpoints[ side ];
            const ResolvedEndpoint & peer = endpoints[ 1 - side ];

            Topology::Interface intf;
            intf.node = names[ side ];
            intf.name = self.name;
            intf.has_address = self.has_address;
            intf.address = self.address;
            intf.peer_node = names[ 1 - side ];
            intf.peer_name = peer.name;
            nodes[ self.node ].interfaces.push_back( intf );
        }
    }

    /* the node-level address lands on the default (first) interface,
       unless the link already numbered that interface */
    for ( size_t i = 0; i < nodes.size(); i++ ) {
        if ( not has_node_address[ i ] ) {
            continue;
        }

        if ( nodes[ i ].interfaces.empty() ) {
            violations.push_back( nodes[ i ].name + " has address " + node_address[ i ].str()
                                  + " but no links" );
            continue;
        }

        Topology::Interface & default_intf = nodes[ i ].interfaces.front();
        if ( not default_intf.has_address ) {
            default_intf.has_address = true;
            default_intf.address = node_address[ i ];
        }
    }

    for ( const auto & node : nodes ) {
        for ( const auto & intf : node.interfaces ) {
            if ( intf.has_address and not intf.address.is_host_usable() ) {
                violations.push_back( node.name + ": " + intf.name + " address " + intf.address.str()
                                      + " is the network or broadcast address of its subnet" );
            }
        }
    }

    /* each switch is a bridge named after the switch, next to its ports */
    for ( const auto & node : nodes ) {
        if ( not node.is_switch() ) {
            continue;
        }

        if ( node.name.size() >= IFNAMSIZ ) {
            violations.push_back( "switch name " + node.name + " is longer than "
                                  + to_string( IFNAMSIZ - 1 ) + " characters" );
        }

        for ( const auto & intf : node.interfaces ) {
            if ( intf.name == node.name ) {
                violations.push_back( "switch port " + intf.name + " on " + node.name
                                      + " has the same name as the switch" );
            }
        }
    }

    /* segments: switches joined by links form one broadcast domain */
    SegmentSets sets( nodes_.size() );
    for ( const auto & link : resolved_links ) {
        if ( nodes_[ link.first.node ].role == NodeRole::Switch
             and nodes_[ link.second.node ].role == NodeRole::Switch ) {
            sets.merge( link.first.node, link.second.node );
        }
    }

    vector<Topology::Segment> segments;
    map<size_t, size_t> segment_of_root;

    for ( size_t i = 0; i < nodes_.size(); i++ ) {
        if ( nodes_[ i ].role != NodeRole::Switch ) {
            continue;
        }

        const size_t root = sets.find( i );
        if ( not segment_of_root.count( root ) ) {
            segment_of_root[ root ] = segments.size();
            segments.push_back( Topology::Segment { {}, {}, false, InterfaceAddress() } );
        }
        segments[ segment_of_root[ root ] ].switches.push_back( nodes_[ i ].name );
    }

    for ( const auto & link : resolved_links ) {
        const bool a_is_switch = nodes_[ link.first.node ].role == NodeRole::Switch;
        const bool b_is_switch = nodes_[ link.second.node ].role == NodeRole::Switch;

        if ( a_is_switch and b_is_switch ) {
            continue;
        } else if ( a_is_switch ) {
            segments[ segment_of_root.at( sets.find( link.first.node ) ) ].members.push_back(
                make_pair( nodes_[ link.second.node ].name, link.second.name ) );
        } else if ( b_is_switch ) {
            segments[ segment_of_root.at( sets.find( link.second.node ) ) ].members.push_back(
                make_pair( nodes_[ link.first.node ].name, link.first.name ) );
        } else {
            Topology::Segment point_to_point { {}, {}, false, InterfaceAddress() };
            point_to_point.members.push_back( make_pair( nodes_[ link.first.node ].name, link.first.name ) );
            point_to_point.members.push_back( make_pair( nodes_[ link.second.node ].name, link.second.name ) );
            segments.push_back( point_to_point );
        }
    }

    /* drop switches with nothing plugged in */
    segments.erase( remove_if( segments.begin(), segments.end(),
                               []( const Topology::Segment & segment ) { return segment.members.empty(); } ),
                    segments.end() );

    /* one subnet per segment, and no address used twice on it */
    for ( auto & segment : segments ) {
        const string segment_desc = segment.switches.empty()
            ? "link " + segment.members.front().first + " <-> " + segment.members.back().first
            : "segment " + join( segment.switches );

        const Topology::Interface * reference = nullptr;
        map<Address, const Topology::Interface *> used;

        for ( const auto & member : segment.members ) {
            const Topology::Node & node = nodes.at( index_.at( member.first ) );
            const Topology::Interface * intf = nullptr;
            for ( const auto & candidate : node.interfaces ) {
                if ( candidate.name == member.second ) {
                    intf = &candidate;
                }
            }

            if ( intf == nullptr or not intf->has_address ) {
                continue;
            }

            if ( reference == nullptr ) {
                reference = intf;
                segment.has_subnet = true;
                segment.subnet = intf->address.subnet();
            } else if ( not intf->address.same_subnet( reference->address ) ) {
                violations.push_back( segment_desc + ": " + intf->node + " " + intf->name + " "
                                      + intf->address.str() + " is not in subnet " + segment.subnet.str()
                                      + " of " + reference->node + " " + reference->name );
            }

            const auto previous = used.find( intf->address.address() );
            if ( previous != used.end() ) {
                violations.push_back( segment_desc + ": address " + intf->address.address().ip()
                                      + " assigned to both " + previous->second->node + " "
                                      + previous->second->name + " and " + intf->node + " " + intf->name );
            } else {
                used[ intf->address.address() ] = intf;
            }
        }
    }

    if ( not violations.empty() ) {
        throw topology_validation_error( violations );
    }

    return Topology( name_, nodes, links, segments );
}
