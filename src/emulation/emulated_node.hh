/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EMULATED_NODE_HH
#define EMULATED_NODE_HH

#include <string>
#include <vector>

#include "topology.hh"

/* what activate() applies to a node */
struct NodeConfig
{
    std::vector<Topology::Interface> interfaces;
    bool has_default_route;
    Address default_route;
    std::vector<Topology::Route> routes;
};

NodeConfig node_config( const Topology::Node & node );

/* Lifecycle of one node of a running emulation:
   provision() creates its namespace, activate() configures it,
   terminate() tears it down again. */
class EmulatedNode
{
public:
    virtual ~EmulatedNode() {}

    virtual const std::string & name( void ) const = 0;

    virtual void provision( void ) = 0;

    /* throws provisioning_error if the node is not provisioned */
    virtual void activate( const NodeConfig & config ) = 0;

    /* best-effort; never throws, and is safe to call in any state */
    virtual void terminate( void ) = 0;

    /* what terminate() could not undo, oldest first */
    virtual std::vector<std::string> teardown_errors( void ) const = 0;

    /* run a shell command in the node's namespace and return its output */
    virtual std::string cmd( const std::string & command ) = 0;
};

#endif /* EMULATED_NODE_HH */
