/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef PROBE_REPORT_HH
#define PROBE_REPORT_HH

#include <string>
#include <vector>

/* outcome of an all-pairs reachability probe */
class ProbeReport
{
public:
    struct Pair
    {
        std::string source;
        std::string destination;
        bool reachable;
    };

private:
    std::vector<Pair> pairs_;

public:
    ProbeReport( void ) : pairs_() {}

    void record( const std::string & source, const std::string & destination, const bool reachable );

    const std::vector<Pair> & pairs( void ) const { return pairs_; }
    std::vector<Pair> failures( void ) const;

    unsigned int attempted( void ) const { return pairs_.size(); }
    unsigned int received( void ) const { return attempted() - failed(); }
    unsigned int failed( void ) const;

    /* whole percent, rounded down, as ping reports loss */
    unsigned int dropped_percent( void ) const;

    bool reachable( const std::string & source, const std::string & destination ) const;

    /* "*** Results: 0% dropped (30/30 received)" */
    std::string summary( void ) const;
};

#endif /* PROBE_REPORT_HH */
