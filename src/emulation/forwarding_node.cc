/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "forwarding_node.hh"
#include "exception.hh"
#include "config.h"
#include "util.hh"

using namespace std;

static const string ENABLE_FORWARDING = string( SYSCTL ) + " -w net.ipv4.ip_forward=1";
static const string DISABLE_FORWARDING = string( SYSCTL ) + " -w net.ipv4.ip_forward=0";
static const string QUERY_FORWARDING = string( SYSCTL ) + " -n net.ipv4.ip_forward";

ForwardingNode::ForwardingNode( unique_ptr<EmulatedNode> && node )
    : node_( move( node ) ),
      provisioned_( false ),
      teardown_errors_()
{
    if ( not node_ ) {
        throw runtime_error( "ForwardingNode: no node to wrap" );
    }
}

ForwardingNode::~ForwardingNode()
{
    terminate();
}

void ForwardingNode::activate( const NodeConfig & config )
{
    /* interfaces first */
    node_->activate( config );

    node_->cmd( ENABLE_FORWARDING );
}

void ForwardingNode::provision( void )
{
    node_->provision();
    provisioned_ = true;
}

void ForwardingNode::terminate( void )
{
    if ( provisioned_ ) {
        provisioned_ = false;

        try {
            node_->cmd( DISABLE_FORWARDING );
        } catch ( const exception & e ) { /* still tear down the node */
            teardown_errors_.push_back( name() + ": disabling forwarding: " + e.what() );
            print_exception( e );
        }
    }

    node_->terminate();
}

vector<string> ForwardingNode::teardown_errors( void ) const
{
    vector<string> ret = teardown_errors_;
    const vector<string> inner = node_->teardown_errors();
    ret.insert( ret.end(), inner.begin(), inner.end() );
    return ret;
}

unique_ptr<EmulatedNode> with_forwarding( unique_ptr<EmulatedNode> && node )
{
    return unique_ptr<EmulatedNode>( new ForwardingNode( move( node ) ) );
}

bool forwarding_enabled( EmulatedNode & node )
{
    return trim( node.cmd( QUERY_FORWARDING ) ) == "1";
}
