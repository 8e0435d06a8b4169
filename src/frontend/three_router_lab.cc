/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "three_router_lab.hh"

using namespace std;

static LinkOptions router_port( const string & interface, const string & address )
{
    LinkOptions options;
    options.interface_b = interface;
    options.address_b = address;
    return options;
}

void declare_three_router_lab( TopologyBuilder & builder )
{
    builder.add_router( "rA", "20.10.100.1/24" );
    builder.add_router( "rB", "20.10.100.2/24" );
    builder.add_router( "rC", "20.10.100.3/24" );

    builder.add_switch( "s1", "LAN A" );
    builder.add_switch( "s2", "LAN B" );
    builder.add_switch( "s3", "LAN C" );
    builder.add_switch( "s4", "Router interconnect" );

    builder.add_host( "hA1", "20.10.172.130/26", "via 20.10.172.129" );
    builder.add_host( "hA2", "20.10.172.131/26", "via 20.10.172.129" );

    builder.add_host( "hB1", "20.10.172.2/25", "via 20.10.172.1" );
    builder.add_host( "hB2", "20.10.172.3/25", "via 20.10.172.1" );

    builder.add_host( "hC1", "20.10.172.194/27", "via 20.10.172.193" );
    builder.add_host( "hC2", "20.10.172.195/27", "via 20.10.172.193" );

    /* backbone */
    builder.add_link( "s4", "rA", router_port( "rA-eth1", "20.10.100.1/24" ) );
    builder.add_link( "s4", "rB", router_port( "rB-eth1", "20.10.100.2/24" ) );
    builder.add_link( "s4", "rC", router_port( "rC-eth1", "20.10.100.3/24" ) );

    /* gateways */
    builder.add_link( "s1", "rA", router_port( "rA-eth0", "20.10.172.129/26" ) );
    builder.add_link( "s2", "rB", router_port( "rB-eth0", "20.10.172.1/25" ) );
    builder.add_link( "s3", "rC", router_port( "rC-eth0", "20.10.172.193/27" ) );

    builder.add_link( "hA1", "s1" );
    builder.add_link( "hA2", "s1" );
    builder.add_link( "hB1", "s2" );
    builder.add_link( "hB2", "s2" );
    builder.add_link( "hC1", "s3" );
    builder.add_link( "hC2", "s3" );

    builder.add_route( "rA", "20.10.172.0/25", "20.10.100.2" );
    builder.add_route( "rA", "20.10.172.192/27", "20.10.100.3" );

    builder.add_route( "rB", "20.10.172.128/26", "20.10.100.1" );
    builder.add_route( "rB", "20.10.172.192/27", "20.10.100.3" );

    builder.add_route( "rC", "20.10.172.128/26", "20.10.100.1" );
    builder.add_route( "rC", "20.10.172.0/25", "20.10.100.2" );
}

Topology three_router_lab( void )
{
    TopologyBuilder builder( "three-router-lab" );
    declare_three_router_lab( builder );
    return builder.build();
}
