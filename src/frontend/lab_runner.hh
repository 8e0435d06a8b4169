/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef LAB_RUNNER_HH
#define LAB_RUNNER_HH

#include "emulation.hh"
#include "namespace_driver.hh"
#include "probe_report.hh"
#include "topology.hh"

/* start the topology, print its address map, ping every host pair, stop.
   Unreachable pairs are reported, not thrown; the emulation is stopped
   whatever happens. */
ProbeReport run_lab( const Topology & topology,
                     NamespaceDriver & driver,
                     const EmulationOptions & options = EmulationOptions() );

#endif /* LAB_RUNNER_HH */
