/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "probe_report.hh"

using namespace std;

void ProbeReport::record( const string & source, const string & destination, const bool reachable )
{
    pairs_.push_back( Pair { source, destination, reachable } );
}

vector<ProbeReport::Pair> ProbeReport::failures( void ) const
{
    vector<Pair> ret;

    for ( const auto & pair : pairs_ ) {
        if ( not pair.reachable ) {
            ret.push_back( pair );
        }
    }

    return ret;
}

unsigned int ProbeReport::failed( void ) const
{
    return failures().size();
}

unsigned int ProbeReport::dropped_percent( void ) const
{
    if ( pairs_.empty() ) {
        return 0;
    }

    return 100 * failed() / attempted();
}

bool ProbeReport::reachable( const string & source, const string & destination ) const
{
    for ( const auto & pair : pairs_ ) {
        if ( pair.source == source and pair.destination == destination ) {
            return pair.reachable;
        }
    }

    throw runtime_error( "no probe from " + source + " to " + destination );
}

string ProbeReport::summary( void ) const
{
    return "*** Results: " + to_string( dropped_percent() ) + "% dropped ("
        + to_string( received() ) + "/" + to_string( attempted() ) + " received)";
}
