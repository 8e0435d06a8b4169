/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef NAMESPACE_NODE_HH
#define NAMESPACE_NODE_HH

#include <string>

#include "emulated_node.hh"
#include "namespace_driver.hh"

/* A host-like node living in its own network namespace */
class NamespaceNode : public EmulatedNode
{
private:
    std::string name_;
    std::string namespace_;
    NamespaceDriver & driver_;
    bool provisioned_;
    std::vector<std::string> teardown_errors_;

    /* true if gateway lies in the subnet of one of the configured interfaces */
    static bool on_link( const NodeConfig & config, const Address & gateway );

public:
    NamespaceNode( const std::string & name, const std::string & ns, NamespaceDriver & driver );
    ~NamespaceNode();

    const std::string & name( void ) const override { return name_; }
    const std::string & namespace_name( void ) const { return namespace_; }
    NamespaceDriver & driver( void ) { return driver_; }
    bool provisioned( void ) const { return provisioned_; }

    void provision( void ) override;
    void activate( const NodeConfig & config ) override;
    void terminate( void ) override;
    std::string cmd( const std::string & command ) override;
    std::vector<std::string> teardown_errors( void ) const override { return teardown_errors_; }

    /* forbid copying */
    NamespaceNode( const NamespaceNode & other ) = delete;
    NamespaceNode & operator=( const NamespaceNode & other ) = delete;
};

#endif /* NAMESPACE_NODE_HH */
