/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "bridge_switch.hh"

using namespace std;

BridgeSwitch::BridgeSwitch( unique_ptr<NamespaceNode> && node )
    : node_( move( node ) )
{
    if ( not node_ ) {
        throw runtime_error( "BridgeSwitch: no node to wrap" );
    }
}

void BridgeSwitch::activate( const NodeConfig & config )
{
    /* ports come up unnumbered */
    node_->activate( config );

    NamespaceDriver & driver = node_->driver();
    const string & ns = node_->namespace_name();

    driver.add_bridge( ns, name() );
    for ( const auto & port : config.interfaces ) {
        driver.attach_to_bridge( ns, port.name, name() );
    }
}
