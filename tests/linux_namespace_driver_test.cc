/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

/* The fixture runs against the real kernel. It needs root and network
   namespace support, and skips itself otherwise. */

#include <unistd.h>

#include <string>

#include <gtest/gtest.h>

#include "linux_namespace_driver.hh"
#include "lab_runner.hh"
#include "three_router_lab.hh"
#include "exception.hh"
#include "log.hh"
#include "util.hh"

using namespace std;

class LinuxNamespaceDriverTest : public ::testing::Test
{
protected:
    LinuxNamespaceDriver driver_;
    string prefix_;

    LinuxNamespaceDriverTest()
        : driver_(),
          prefix_( "rlt" + to_string( getpid() ) + "-" )
    {
        set_log_level( LogLevel::Warning );
    }

    void SetUp() override
    {
        if ( geteuid() != 0 ) {
            GTEST_SKIP() << "needs root";
        }

        const string probe = prefix_ + "probe";
        try {
            driver_.add_namespace( probe );
            driver_.remove_namespace( probe );
        } catch ( const provisioning_error & e ) {
            GTEST_SKIP() << "network namespaces unavailable: " << e.what();
        }
    }
};

TEST_F( LinuxNamespaceDriverTest, ExecRunsInsideNamespace )
{
    const string ns = prefix_ + "exec";
    driver_.add_namespace( ns );

    EXPECT_EQ( trim( driver_.exec( ns, "echo hello" ) ), "hello" );

    /* a fresh namespace has nothing but a loopback device */
    const string links = driver_.exec( ns, "ls /sys/class/net" );
    EXPECT_EQ( trim( links ), "lo" );

    driver_.remove_namespace( ns );
    EXPECT_THROW( driver_.exec( ns, "true" ), provisioning_error );
}

TEST_F( LinuxNamespaceDriverTest, VethPairCarriesPing )
{
    const string left = prefix_ + "left", right = prefix_ + "right";
    driver_.add_namespace( left );
    driver_.add_namespace( right );

    driver_.add_veth_pair( left, "left-eth0", right, "right-eth0" );
    driver_.set_address( left, "left-eth0", InterfaceAddress( "10.99.0.1/30" ) );
    driver_.set_address( right, "right-eth0", InterfaceAddress( "10.99.0.2/30" ) );
    driver_.set_link_up( left, "left-eth0" );
    driver_.set_link_up( right, "right-eth0" );
    driver_.wait_for_link_up( left, "left-eth0", 5000 );

    EXPECT_TRUE( driver_.ping( left, Address( "10.99.0.2" ) ) );
    EXPECT_FALSE( driver_.ping( left, Address( "10.99.0.3" ) ) );

    driver_.remove_namespace( left );
    driver_.remove_namespace( right );
}

TEST_F( LinuxNamespaceDriverTest, ThreeRouterLab )
{
    EmulationOptions options;
    options.namespace_prefix = prefix_;

    const ProbeReport report = run_lab( three_router_lab(), driver_, options );

    EXPECT_EQ( report.attempted(), 30u );
    EXPECT_EQ( report.failed(), 0u ) << report.summary();
}

TEST( PingCompletedTest, TellsNoReplyFromNoPing )
{
    EXPECT_TRUE( ping_completed( 0, "1 packets transmitted, 1 received, 0% packet loss, time 0ms\n" ) );
    EXPECT_TRUE( ping_completed( 1, "1 packets transmitted, 0 received, 100% packet loss, time 0ms\n" ) );

    EXPECT_FALSE( ping_completed( 1, "exec of \"/no/such/ping\" failed: No such file or directory\n" ) );
    EXPECT_FALSE( ping_completed( 1, "" ) );
    EXPECT_FALSE( ping_completed( 2, "connect: Network is unreachable\n" ) );
}
