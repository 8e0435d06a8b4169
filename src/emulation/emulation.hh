/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EMULATION_HH
#define EMULATION_HH

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "topology.hh"
#include "emulated_node.hh"
#include "namespace_driver.hh"
#include "probe_report.hh"

struct EmulationOptions
{
    /* prepended to node names to form namespace names */
    std::string namespace_prefix;

    /* how long start() waits for each interface to come up */
    unsigned int link_timeout_ms;

    EmulationOptions( void );
};

/* "rl<pid>-", so that concurrent runs do not share namespaces */
std::string default_namespace_prefix( void );

/* One run of a Topology on a NamespaceDriver.

   Validated -> (start) -> Provisioned -> Running -> (stop) -> Stopped

   start() and stop() can each happen once; stop() on a stopped
   emulation does nothing. A start() that fails part-way tears down
   whatever it created before rethrowing. */
class Emulation
{
public:
    enum class State { Validated, Provisioned, Running, Stopped };

private:
    Topology topology_;
    NamespaceDriver & driver_;
    EmulationOptions options_;
    State state_;

    std::vector<std::unique_ptr<EmulatedNode>> nodes_; /* topology order */
    std::map<std::string, EmulatedNode *> by_name_;
    std::vector<std::string> teardown_errors_;

    std::string namespace_of( const std::string & node ) const;

public:
    Emulation( const Topology & topology,
               NamespaceDriver & driver,
               const EmulationOptions & options = EmulationOptions() );
    ~Emulation();

    /* blocks until every namespace, link, address and route is in place */
    void start( void );

    /* pings every host from every other host */
    ProbeReport ping_all( void );

    void stop( void );

    State state( void ) const { return state_; }
    const Topology & topology( void ) const { return topology_; }

    /* throws unknown_node_error */
    EmulatedNode & node( const std::string & name );

    /* what went wrong while tearing down, if anything */
    const std::vector<std::string> & teardown_errors( void ) const { return teardown_errors_; }

    /* forbid copying */
    Emulation( const Emulation & other ) = delete;
    Emulation & operator=( const Emulation & other ) = delete;
};

std::string state_name( const Emulation::State state );

#endif /* EMULATION_HH */
