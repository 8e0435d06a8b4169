/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef FORWARDING_NODE_HH
#define FORWARDING_NODE_HH

/* Router node */

#include <memory>
#include <string>
#include <vector>

#include "emulated_node.hh"

/* Wraps a node so that it forwards IP packets between its interfaces
   while it is active. Forwarding is switched on only once the wrapped
   node's interfaces are configured. Terminating a provisioned node always
   switches it off, since a new namespace can inherit ip_forward=1 from
   the host. */
class ForwardingNode : public EmulatedNode
{
private:
    std::unique_ptr<EmulatedNode> node_;
    bool provisioned_;
    std::vector<std::string> teardown_errors_;

public:
    explicit ForwardingNode( std::unique_ptr<EmulatedNode> && node );
    ~ForwardingNode();

    const std::string & name( void ) const override { return node_->name(); }

    void provision( void ) override;
    void activate( const NodeConfig & config ) override;
    void terminate( void ) override;
    std::string cmd( const std::string & command ) override { return node_->cmd( command ); }
    std::vector<std::string> teardown_errors( void ) const override;

    /* forbid copying */
    ForwardingNode( const ForwardingNode & other ) = delete;
    ForwardingNode & operator=( const ForwardingNode & other ) = delete;
};

std::unique_ptr<EmulatedNode> with_forwarding( std::unique_ptr<EmulatedNode> && node );

/* reads net.ipv4.ip_forward inside the node's namespace */
bool forwarding_enabled( EmulatedNode & node );

#endif /* FORWARDING_NODE_HH */
