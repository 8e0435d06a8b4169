/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

/* writes the built-in three-router lab as a topology file,
   as a starting point for other topologies */

#include <cstdlib>
#include <iostream>

#include "exception.hh"
#include "three_router_lab.hh"
#include "topology_file.hh"

using namespace std;

int main( int argc, char *argv[] )
{
    try {
        if ( argc <= 0 ) {
            throw runtime_error( "missing argv[ 0 ]: argc <= 0" );
        }

        if ( argc != 2 ) {
            throw runtime_error( "Usage: " + string( argv[ 0 ] ) + " output-file" );
        }

        save_topology( three_router_lab(), argv[ 1 ] );

        return EXIT_SUCCESS;
    } catch ( const exception & e ) {
        print_exception( e );
        return EXIT_FAILURE;
    }
}
