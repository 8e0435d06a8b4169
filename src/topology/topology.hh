/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TOPOLOGY_HH
#define TOPOLOGY_HH

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "address.hh"

enum class NodeRole { Host, Router, Switch };

std::string role_name( const NodeRole role );

/* A validated, immutable network description. Only TopologyBuilder::build()
   makes one, so every Topology satisfies the builder's invariants: links
   reference known nodes, every interface has a unique name on its node,
   and every LAN segment is numbered from a single subnet. */
class Topology
{
public:
    struct Route
    {
        InterfaceAddress destination; /* a subnet */
        Address gateway;
    };

    struct Interface
    {
        std::string node;
        std::string name;
        bool has_address;
        InterfaceAddress address;
        std::string peer_node;
        std::string peer_name;
    };

    struct Node
    {
        std::string name;
        NodeRole role;
        std::string label;
        std::vector<Interface> interfaces; /* in link declaration order */
        bool has_default_route;
        Address default_route;
        std::vector<Route> routes;

        bool is_switch( void ) const { return role == NodeRole::Switch; }

        /* first addressed interface, or nullptr */
        const Interface * primary_interface( void ) const;
    };

    struct Link
    {
        std::string node_a, interface_a;
        std::string node_b, interface_b;
    };

    /* a broadcast domain: switches joined by links, plus every interface
       plugged into them. A link between two non-switch nodes is a segment
       of its own. */
    struct Segment
    {
        std::vector<std::string> switches;
        std::vector<std::pair<std::string, std::string>> members; /* node, interface */
        bool has_subnet;
        InterfaceAddress subnet;
    };

private:
    std::string name_;
    std::vector<Node> nodes_;
    std::map<std::string, size_t> index_;
    std::vector<Link> links_;
    std::vector<Segment> segments_;

    Topology( const std::string & name,
              const std::vector<Node> & nodes,
              const std::vector<Link> & links,
              const std::vector<Segment> & segments );

    friend class TopologyBuilder;

public:
    const std::string & name( void ) const { return name_; }

    const std::vector<Node> & nodes( void ) const { return nodes_; }
    const std::vector<Link> & links( void ) const { return links_; }
    const std::vector<Segment> & segments( void ) const { return segments_; }

    bool has_node( const std::string & name ) const { return index_.count( name ) > 0; }

    /* throws unknown_node_error */
    const Node & node( const std::string & name ) const;

    /* throws unknown_node_error, or runtime_error if the node has no such interface */
    const Interface & interface( const std::string & node, const std::string & name ) const;

    std::vector<const Node *> with_role( const NodeRole role ) const;
    std::vector<const Node *> hosts( void ) const { return with_role( NodeRole::Host ); }
    std::vector<const Node *> routers( void ) const { return with_role( NodeRole::Router ); }
    std::vector<const Node *> switches( void ) const { return with_role( NodeRole::Switch ); }
};

/* human-readable addressing plan, one block per segment */
void print_address_map( std::ostream & output, const Topology & topology );

#endif /* TOPOLOGY_HH */
