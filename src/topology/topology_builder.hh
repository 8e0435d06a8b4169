/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TOPOLOGY_BUILDER_HH
#define TOPOLOGY_BUILDER_HH

#include <map>
#include <string>
#include <vector>

#include "topology.hh"

/* per-endpoint options of a link; empty strings mean "not given" */
struct LinkOptions
{
    std::string interface_a, interface_b; /* interface name overrides */
    std::string address_a, address_b;     /* "a.b.c.d/len" assigned to that endpoint */
};

/* Collects the declaration of a network and turns it into a Topology.
   add_node and add_link reject names they can check on the spot;
   everything else is checked by build(), which reports every problem
   it finds at once. */
class TopologyBuilder
{
private:
    struct DeclaredRoute
    {
        std::string destination;
        std::string gateway;
    };

    struct DeclaredNode
    {
        std::string name;
        NodeRole role;
        std::string label;
        std::string address;
        std::string default_route;
        std::vector<DeclaredRoute> routes;
    };

    struct DeclaredLink
    {
        std::string node_a, node_b;
        LinkOptions options;
    };

    std::string name_;
    std::vector<DeclaredNode> nodes_;
    std::map<std::string, size_t> index_;
    std::vector<DeclaredLink> links_;

    DeclaredNode & declared( const std::string & name );

public:
    explicit TopologyBuilder( const std::string & name = "topology" );

    /* address is "a.b.c.d/len"; default_route is a gateway address,
       optionally written "via a.b.c.d". Throws duplicate_node_error. */
    void add_node( const std::string & name,
                   const NodeRole role,
                   const std::string & address = "",
                   const std::string & default_route = "" );

    void add_host( const std::string & name,
                   const std::string & address = "",
                   const std::string & default_route = "" );

    void add_router( const std::string & name, const std::string & address = "" );

    /* label names the segment in the address map, e.g. "LAN A" */
    void add_switch( const std::string & name, const std::string & label = "" );

    /* names the node's segment in the address map; throws unknown_node_error */
    void set_label( const std::string & node, const std::string & label );

    /* static route "destination via gateway" on an existing node;
       throws unknown_node_error */
    void add_route( const std::string & node,
                    const std::string & destination,
                    const std::string & gateway );

    /* throws unknown_node_error if either endpoint is not declared */
    void add_link( const std::string & node_a,
                   const std::string & node_b,
                   const LinkOptions & options = LinkOptions() );

    /* removes every link between the two nodes, in either direction;
       returns how many were removed */
    unsigned int remove_link( const std::string & node_a, const std::string & node_b );

    bool has_node( const std::string & name ) const { return index_.count( name ) > 0; }

    /* throws topology_validation_error listing every violation */
    Topology build( void ) const;
};

#endif /* TOPOLOGY_BUILDER_HH */
