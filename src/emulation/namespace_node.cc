/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "namespace_node.hh"
#include "exception.hh"
#include "log.hh"

using namespace std;

NodeConfig node_config( const Topology::Node & node )
{
    NodeConfig config;
    config.interfaces = node.interfaces;
    config.has_default_route = node.has_default_route;
    config.default_route = node.default_route;
    config.routes = node.routes;
    return config;
}

NamespaceNode::NamespaceNode( const string & name, const string & ns, NamespaceDriver & driver )
    : name_( name ),
      namespace_( ns ),
      driver_( driver ),
      provisioned_( false ),
      teardown_errors_()
{}

NamespaceNode::~NamespaceNode()
{
    terminate();
}

bool NamespaceNode::on_link( const NodeConfig & config, const Address & gateway )
{
    for ( const auto & intf : config.interfaces ) {
        if ( intf.has_address and intf.address.contains( gateway ) ) {
            return true;
        }
    }

    return false;
}

void NamespaceNode::provision( void )
{
    if ( provisioned_ ) {
        throw provisioning_error( name_ + ": namespace " + namespace_ + " already provisioned" );
    }

    driver_.add_namespace( namespace_ );
    provisioned_ = true;
}

void NamespaceNode::activate( const NodeConfig & config )
{
    if ( not provisioned_ ) {
        throw provisioning_error( name_ + ": namespace " + namespace_ + " is not provisioned" );
    }

    driver_.set_link_up( namespace_, "lo" );

    for ( const auto & intf : config.interfaces ) {
        if ( intf.has_address ) {
            driver_.set_address( namespace_, intf.name, intf.address );
        }
        driver_.set_link_up( namespace_, intf.name );
    }

    /* reachability is a runtime property: a gateway the node cannot reach
       leaves the node without that route rather than failing the run */
    if ( config.has_default_route ) {
        if ( on_link( config, config.default_route ) ) {
            driver_.add_default_route( namespace_, config.default_route );
        } else {
            warning() << name_ << ": skipping default route via " << config.default_route.ip()
                      << ": gateway is not on a local subnet" << endl;
        }
    }

    for ( const auto & route : config.routes ) {
        if ( on_link( config, route.gateway ) ) {
            driver_.add_route( namespace_, route.destination, route.gateway );
        } else {
            warning() << name_ << ": skipping route to " << route.destination.str() << " via "
                      << route.gateway.ip() << ": gateway is not on a local subnet" << endl;
        }
    }
}

void NamespaceNode::terminate( void )
{
    if ( not provisioned_ ) {
        return;
    }

    provisioned_ = false;

    try {
        driver_.remove_namespace( namespace_ );
    } catch ( const exception & e ) { /* keep tearing down the rest */
        teardown_errors_.push_back( name_ + ": " + e.what() );
        print_exception( e );
    }
}

string NamespaceNode::cmd( const string & command )
{
    if ( not provisioned_ ) {
        throw provisioning_error( name_ + ": namespace " + namespace_ + " is not provisioned" );
    }

    return driver_.exec( namespace_, command );
}
