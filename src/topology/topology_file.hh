/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TOPOLOGY_FILE_HH
#define TOPOLOGY_FILE_HH

#include <string>

#include "topology.hh"
#include "topology.pb.h"

/* Topologies on disk are RouterLabProtobufs::Topology messages in protobuf
   text format. A saved topology names every interface and carries every
   address on its link, so loading it back yields the same Topology. */

RouterLabProtobufs::Topology to_protobuf( const Topology & topology );

/* runs the message through TopologyBuilder, so a loaded file is validated
   exactly like a declared one */
Topology from_protobuf( const RouterLabProtobufs::Topology & message );

Topology load_topology( const std::string & filename );
void save_topology( const Topology & topology, const std::string & filename );

#endif /* TOPOLOGY_FILE_HH */
