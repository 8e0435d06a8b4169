/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef BRIDGE_SWITCH_HH
#define BRIDGE_SWITCH_HH

#include <memory>
#include <string>
#include <vector>

#include "namespace_node.hh"

/* A LAN switch: a Linux bridge named after the switch, alone in its own
   namespace, with every port of the node enslaved to it. */
class BridgeSwitch : public EmulatedNode
{
private:
    std::unique_ptr<NamespaceNode> node_;

public:
    explicit BridgeSwitch( std::unique_ptr<NamespaceNode> && node );

    const std::string & name( void ) const override { return node_->name(); }

    void provision( void ) override { node_->provision(); }
    void activate( const NodeConfig & config ) override;
    void terminate( void ) override { node_->terminate(); }
    std::string cmd( const std::string & command ) override { return node_->cmd( command ); }
    std::vector<std::string> teardown_errors( void ) const override { return node_->teardown_errors(); }
};

#endif /* BRIDGE_SWITCH_HH */
