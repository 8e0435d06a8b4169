/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "topology.hh"
#include "topology_error.hh"

using namespace std;

string role_name( const NodeRole role )
{
    switch ( role ) {
    case NodeRole::Host: return "host";
    case NodeRole::Router: return "router";
    case NodeRole::Switch: return "switch";
    }

    throw runtime_error( "invalid node role" );
}

const Topology::Interface * Topology::Node::primary_interface( void ) const
{
    for ( const auto & intf : interfaces ) {
        if ( intf.has_address ) {
            return &intf;
        }
    }

    return nullptr;
}

Topology::Topology( const string & name,
                    const vector<Node> & nodes,
                    const vector<Link> & links,
                    const vector<Segment> & segments )
    : name_( name ),
      nodes_( nodes ),
      index_(),
      links_( links ),
      segments_( segments )
{
    for ( size_t i = 0; i < nodes_.size(); i++ ) {
        index_[ nodes_[ i ].name ] = i;
    }
}

const Topology::Node & Topology::node( const string & name ) const
{
    const auto it = index_.find( name );
    if ( it == index_.end() ) {
        throw unknown_node_error( name );
    }

    return nodes_.at( it->second );
}

const Topology::Interface & Topology::interface( const string & node_name, const string & name ) const
{
    for ( const auto & intf : node( node_name ).interfaces ) {
        if ( intf.name == name ) {
            return intf;
        }
    }

    throw runtime_error( node_name + ": no interface named " + name );
}

vector<const Topology::Node *> Topology::with_role( const NodeRole role ) const
{
    vector<const Node *> ret;

    for ( const auto & node : nodes_ ) {
        if ( node.role == role ) {
            ret.push_back( &node );
        }
    }

    return ret;
}

static string segment_heading( const Topology & topology, const Topology::Segment & segment )
{
    for ( const auto & sw : segment.switches ) {
        if ( not topology.node( sw ).label.empty() ) {
            return topology.node( sw ).label;
        }
    }

    if ( segment.switches.empty() ) {
        /* point-to-point link between two non-switch nodes */
        string heading;
        for ( const auto & member : segment.members ) {
            heading += ( heading.empty() ? "" : "-" ) + member.first;
        }
        return heading + " link";
    }

    string heading;
    for ( const auto & sw : segment.switches ) {
        heading += ( heading.empty() ? "" : "/" ) + sw;
    }
    return heading;
}

void print_address_map( ostream & output, const Topology & topology )
{
    for ( const auto & segment : topology.segments() ) {
        vector<const Topology::Interface *> gateways, others;

        for ( const auto & member : segment.members ) {
            const Topology::Interface & intf = topology.interface( member.first, member.second );
            if ( topology.node( member.first ).role == NodeRole::Router ) {
                gateways.push_back( &intf );
            } else {
                others.push_back( &intf );
            }
        }

        /* a segment of routers only is an interconnect; list the routers themselves */
        if ( others.empty() ) {
            others.swap( gateways );
        }

        output << segment_heading( topology, segment ) << ": "
               << ( segment.has_subnet ? segment.subnet.str() : "unnumbered" );

        if ( not gateways.empty() ) {
            output << " (";
            for ( size_t i = 0; i < gateways.size(); i++ ) {
                output << ( i == 0 ? "" : ", " ) << gateways[ i ]->node << " at "
                       << ( gateways[ i ]->has_address ? gateways[ i ]->address.address().ip() : gateways[ i ]->name );
            }
            output << ")";
        }
        output << "\n";

        for ( const auto intf : others ) {
            output << "  " << intf->node << ": "
                   << ( intf->has_address ? intf->address.address().ip() : "unnumbered (" + intf->name + ")" )
                   << "\n";
        }
    }
}
