/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "forwarding_node.hh"
#include "namespace_node.hh"
#include "simulated_namespace_driver.hh"
#include "exception.hh"
#include "config.h"

using namespace std;

class ForwardingNodeTest : public ::testing::Test
{
protected:
    SimulatedNamespaceDriver driver_;
    ForwardingNode router_;

    ForwardingNodeTest()
        : driver_(),
          router_( unique_ptr<EmulatedNode>( new NamespaceNode( "r1", "rl-test-r1", driver_ ) ) )
    {}

    /* one interface, cabled to a peer namespace */
    NodeConfig cabled( void )
    {
        driver_.add_namespace( "rl-test-peer" );
        driver_.add_veth_pair( "rl-test-r1", "r1-eth0", "rl-test-peer", "peer-eth0" );

        NodeConfig config;
        config.interfaces.push_back( Topology::Interface { "r1", "r1-eth0", true, InterfaceAddress( "10.0.0.1/24" ),
                                                           "peer", "peer-eth0" } );
        config.has_default_route = false;
        return config;
    }

    unsigned int forwarding_changes( const string & value )
    {
        unsigned int count = 0;
        for ( const auto & call : driver_.calls() ) {
            if ( call.find( "net.ipv4.ip_forward=" + value ) != string::npos ) {
                count++;
            }
        }
        return count;
    }
};

TEST_F( ForwardingNodeTest, TerminateWithoutActivate )
{
    router_.provision();

    EXPECT_NO_THROW( router_.terminate() );
    EXPECT_EQ( forwarding_changes( "1" ), 0u );
    EXPECT_EQ( forwarding_changes( "0" ), 1u );
    EXPECT_FALSE( driver_.has_namespace( "rl-test-r1" ) );
    EXPECT_FALSE( driver_.forwarding_at_removal( "rl-test-r1" ) );
}

TEST_F( ForwardingNodeTest, TerminateWithoutActivateClearsInheritedForwarding )
{
    driver_.set_inherited_forwarding( true );
    router_.provision();
    ASSERT_TRUE( forwarding_enabled( router_ ) );

    EXPECT_NO_THROW( router_.terminate() );
    EXPECT_EQ( forwarding_changes( "0" ), 1u );
    EXPECT_FALSE( driver_.forwarding_at_removal( "rl-test-r1" ) );
}

TEST_F( ForwardingNodeTest, TerminateBeforeProvisionDoesNothing )
{
    EXPECT_NO_THROW( router_.terminate() );
    EXPECT_TRUE( driver_.calls().empty() );
    EXPECT_TRUE( router_.teardown_errors().empty() );
}

TEST_F( ForwardingNodeTest, ActivateThenTerminateLeavesForwardingDisabled )
{
    router_.provision();
    router_.activate( cabled() );

    EXPECT_TRUE( forwarding_enabled( router_ ) );

    router_.terminate();

    EXPECT_EQ( forwarding_changes( "1" ), 1u );
    EXPECT_EQ( forwarding_changes( "0" ), 1u );
    EXPECT_FALSE( driver_.forwarding_at_removal( "rl-test-r1" ) );
    EXPECT_TRUE( router_.teardown_errors().empty() );

    /* a second terminate has nothing left to undo */
    router_.terminate();
    EXPECT_EQ( forwarding_changes( "0" ), 1u );
}

TEST_F( ForwardingNodeTest, ForwardingFollowsInterfaceConfiguration )
{
    router_.provision();
    router_.activate( cabled() );

    const int address_set = driver_.call_index( "set_address rl-test-r1 r1-eth0" );
    const int link_up = driver_.call_index( "set_link_up rl-test-r1 r1-eth0" );
    const int forwarding_on = driver_.call_index( "exec rl-test-r1 " + string( SYSCTL ) + " -w net.ipv4.ip_forward=1" );

    ASSERT_GE( address_set, 0 );
    ASSERT_GE( link_up, 0 );
    ASSERT_GE( forwarding_on, 0 );
    EXPECT_LT( address_set, forwarding_on );
    EXPECT_LT( link_up, forwarding_on );
}

TEST_F( ForwardingNodeTest, ActivateUnprovisionedThrows )
{
    NodeConfig config;
    config.has_default_route = false;

    EXPECT_THROW( router_.activate( config ), provisioning_error );
    EXPECT_EQ( forwarding_changes( "1" ), 0u );
}

TEST_F( ForwardingNodeTest, FailedConfigurationNeverEnablesForwarding )
{
    driver_.set_inherited_forwarding( true );
    router_.provision();
    const NodeConfig config = cabled();
    driver_.fail_on( "set_address rl-test-r1" );

    EXPECT_THROW( router_.activate( config ), provisioning_error );
    EXPECT_EQ( forwarding_changes( "1" ), 0u );

    router_.terminate();
    EXPECT_EQ( forwarding_changes( "0" ), 1u );
    EXPECT_FALSE( driver_.has_namespace( "rl-test-r1" ) );
    EXPECT_FALSE( driver_.forwarding_at_removal( "rl-test-r1" ) );
}

TEST_F( ForwardingNodeTest, DisableFailureIsRecordedAndTeardownContinues )
{
    router_.provision();
    router_.activate( cabled() );
    driver_.fail_on( "exec rl-test-r1 " + string( SYSCTL ) + " -w net.ipv4.ip_forward=0" );

    EXPECT_NO_THROW( router_.terminate() );
    EXPECT_FALSE( driver_.has_namespace( "rl-test-r1" ) );
    ASSERT_EQ( router_.teardown_errors().size(), 1u );
    EXPECT_NE( router_.teardown_errors().front().find( "disabling forwarding" ), string::npos );
}

TEST( WithForwardingTest, WrapsAnyNode )
{
    SimulatedNamespaceDriver driver;
    unique_ptr<EmulatedNode> node = with_forwarding(
        unique_ptr<EmulatedNode>( new NamespaceNode( "r2", "rl-test-r2", driver ) ) );

    EXPECT_EQ( node->name(), "r2" );

    node->provision();
    EXPECT_FALSE( forwarding_enabled( *node ) );

    NodeConfig config;
    config.has_default_route = false;
    node->activate( config );
    EXPECT_TRUE( forwarding_enabled( *node ) );

    node.reset();
    EXPECT_FALSE( driver.has_namespace( "rl-test-r2" ) );
    EXPECT_FALSE( driver.forwarding_at_removal( "rl-test-r2" ) );
}
