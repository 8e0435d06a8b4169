/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef THREE_ROUTER_LAB_HH
#define THREE_ROUTER_LAB_HH

#include "topology.hh"
#include "topology_builder.hh"

/* Three LANs, each behind its own router, with the routers joined on a
   shared backbone:

     LAN A  20.10.172.128/26   s1   rA .129   hA1 .130  hA2 .131
     LAN B  20.10.172.0/25     s2   rB .1     hB1 .2    hB2 .3
     LAN C  20.10.172.192/27   s3   rC .193   hC1 .194  hC2 .195
     backbone 20.10.100.0/24   s4   rA .1  rB .2  rC .3

   Every router has static routes to the two remote LANs via the
   other routers' backbone addresses. */
void declare_three_router_lab( TopologyBuilder & builder );

Topology three_router_lab( void );

#endif /* THREE_ROUTER_LAB_HH */
