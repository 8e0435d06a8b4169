/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cstdlib>
#include <iostream>

#include "exception.hh"
#include "lab_runner.hh"
#include "linux_namespace_driver.hh"
#include "log.hh"
#include "three_router_lab.hh"
#include "topology_file.hh"
#include "util.hh"

using namespace std;

int main( int argc, char *argv[] )
{
    try {
        check_requirements( argc, argv );

        if ( argc > 2 ) {
            throw runtime_error( "Usage: " + string( argv[ 0 ] ) + " [topology-file]" );
        }

        set_log_level( safe_getenv_or( "ROUTERLAB_VERBOSITY", "info" ) );

        EmulationOptions options;
        options.link_timeout_ms = parse_unsigned( safe_getenv_or( "ROUTERLAB_LINK_TIMEOUT_MS",
                                                                   to_string( options.link_timeout_ms ) ),
                                                  "ROUTERLAB_LINK_TIMEOUT_MS" );

        /* validation happens here, before any namespace exists */
        const Topology topology = argc == 2 ? load_topology( argv[ 1 ] ) : three_router_lab();

        LinuxNamespaceDriver driver;
        run_lab( topology, driver, options );

        return EXIT_SUCCESS;
    } catch ( const exception & e ) {
        print_exception( e );
        return EXIT_FAILURE;
    }
}
