/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <fcntl.h>

#include <stdexcept>

#include <google/protobuf/text_format.h>

#include "topology_file.hh"
#include "topology_builder.hh"
#include "file_descriptor.hh"
#include "exception.hh"

using namespace std;

static RouterLabProtobufs::Node::Role to_protobuf_role( const NodeRole role )
{
    switch ( role ) {
    case NodeRole::Host: return RouterLabProtobufs::Node::HOST;
    case NodeRole::Router: return RouterLabProtobufs::Node::ROUTER;
    case NodeRole::Switch: return RouterLabProtobufs::Node::SWITCH;
    }

    throw runtime_error( "invalid node role" );
}

static NodeRole from_protobuf_role( const RouterLabProtobufs::Node::Role role )
{
    switch ( role ) {
    case RouterLabProtobufs::Node::HOST: return NodeRole::Host;
    case RouterLabProtobufs::Node::ROUTER: return NodeRole::Router;
    case RouterLabProtobufs::Node::SWITCH: return NodeRole::Switch;
    }

    throw runtime_error( "invalid node role in topology file" );
}

static void fill_endpoint( RouterLabProtobufs::Endpoint * endpoint,
                           const Topology & topology,
                           const string & node,
                           const string & intf_name )
{
    const Topology::Interface & intf = topology.interface( node, intf_name );

    endpoint->set_node( node );
    endpoint->set_interface( intf.name );
    if ( intf.has_address ) {
        endpoint->set_address( intf.address.str() );
    }
}

RouterLabProtobufs::Topology to_protobuf( const Topology & topology )
{
    RouterLabProtobufs::Topology message;
    message.set_name( topology.name() );

    for ( const auto & node : topology.nodes() ) {
        RouterLabProtobufs::Node * node_message = message.add_node();
        node_message->set_name( node.name );
        node_message->set_role( to_protobuf_role( node.role ) );
        if ( not node.label.empty() ) {
            node_message->set_label( node.label );
        }
        if ( node.has_default_route ) {
            node_message->set_default_route( node.default_route.ip() );
        }
        for ( const auto & route : node.routes ) {
            RouterLabProtobufs::Route * route_message = node_message->add_route();
            route_message->set_destination( route.destination.str() );
            route_message->set_gateway( route.gateway.ip() );
        }
    }

    for ( const auto & link : topology.links() ) {
        RouterLabProtobufs::Link * link_message = message.add_link();
        fill_endpoint( link_message->mutable_a(), topology, link.node_a, link.interface_a );
        fill_endpoint( link_message->mutable_b(), topology, link.node_b, link.interface_b );
    }

    return message;
}

Topology from_protobuf( const RouterLabProtobufs::Topology & message )
{
    TopologyBuilder builder( message.has_name() ? message.name() : "topology" );

    for ( const auto & node : message.node() ) {
        const NodeRole role = from_protobuf_role( node.role() );

        builder.add_node( node.name(), role, node.address(), node.default_route() );
        if ( node.has_label() ) {
            builder.set_label( node.name(), node.label() );
        }

        for ( const auto & route : node.route() ) {
            builder.add_route( node.name(), route.destination(), route.gateway() );
        }
    }

    for ( const auto & link : message.link() ) {
        LinkOptions options;
        options.interface_a = link.a().interface();
        options.interface_b = link.b().interface();
        options.address_a = link.a().address();
        options.address_b = link.b().address();

        builder.add_link( link.a().node(), link.b().node(), options );
    }

    return builder.build();
}

Topology load_topology( const string & filename )
{
    FileDescriptor file( SystemCall( "open " + filename, open( filename.c_str(), O_RDONLY ) ) );

    RouterLabProtobufs::Topology message;
    if ( not google::protobuf::TextFormat::ParseFromString( file.read_all(), &message ) ) {
        throw runtime_error( filename + ": invalid topology file" );
    }

    return from_protobuf( message );
}

void save_topology( const Topology & topology, const string & filename )
{
    string text;
    if ( not google::protobuf::TextFormat::PrintToString( to_protobuf( topology ), &text ) ) {
        throw runtime_error( filename + ": could not serialize topology " + topology.name() );
    }

    FileDescriptor file( SystemCall( "open " + filename,
                                     open( filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 00644 ) ) );
    file.write( text );
}
