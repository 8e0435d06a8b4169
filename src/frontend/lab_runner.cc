/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "lab_runner.hh"
#include "log.hh"

using namespace std;

ProbeReport run_lab( const Topology & topology,
                     NamespaceDriver & driver,
                     const EmulationOptions & options )
{
    Emulation emulation( topology, driver, options );

    info() << "*** Starting network" << endl;
    emulation.start();

    info() << "Network configuration:" << endl;
    print_address_map( info(), topology );
    info() << endl;

    info() << "Testing connectivity between all hosts" << endl;
    const ProbeReport report = emulation.ping_all();

    info() << "*** Stopping network" << endl;
    emulation.stop();

    return report;
}
