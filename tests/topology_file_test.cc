/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <unistd.h>
#include <fcntl.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "topology_file.hh"
#include "topology_error.hh"
#include "three_router_lab.hh"
#include "file_descriptor.hh"
#include "exception.hh"

using namespace std;

/* a scratch file, removed again on destruction */
class ScratchFile
{
private:
    string name_;

public:
    ScratchFile( void )
        : name_()
    {
        char pattern[] = "/tmp/routerlab-test-XXXXXX";
        FileDescriptor fd( SystemCall( "mkstemp", mkstemp( pattern ) ) );
        name_ = pattern;
    }

    ~ScratchFile() { unlink( name_.c_str() ); }

    const string & name( void ) const { return name_; }

    void write( const string & contents )
    {
        FileDescriptor fd( SystemCall( "open " + name_, open( name_.c_str(), O_WRONLY | O_TRUNC ) ) );
        fd.write( contents );
    }

    ScratchFile( const ScratchFile & other ) = delete;
    ScratchFile & operator=( const ScratchFile & other ) = delete;
};

TEST( TopologyFileTest, SavedLabLoadsBackUnchanged )
{
    const Topology original = three_router_lab();

    ScratchFile file;
    save_topology( original, file.name() );
    const Topology loaded = load_topology( file.name() );

    EXPECT_EQ( loaded.name(), original.name() );
    ASSERT_EQ( loaded.nodes().size(), original.nodes().size() );
    ASSERT_EQ( loaded.links().size(), original.links().size() );

    for ( const auto & node : original.nodes() ) {
        const Topology::Node & copy = loaded.node( node.name );
        EXPECT_EQ( copy.role, node.role );
        EXPECT_EQ( copy.label, node.label );
        EXPECT_EQ( copy.has_default_route, node.has_default_route );
        EXPECT_EQ( copy.default_route, node.default_route );
        ASSERT_EQ( copy.routes.size(), node.routes.size() );
        ASSERT_EQ( copy.interfaces.size(), node.interfaces.size() );

        for ( size_t i = 0; i < node.interfaces.size(); i++ ) {
            EXPECT_EQ( copy.interfaces[ i ].name, node.interfaces[ i ].name );
            EXPECT_EQ( copy.interfaces[ i ].has_address, node.interfaces[ i ].has_address );
            EXPECT_EQ( copy.interfaces[ i ].address, node.interfaces[ i ].address );
            EXPECT_EQ( copy.interfaces[ i ].peer_name, node.interfaces[ i ].peer_name );
        }
    }
}

TEST( TopologyFileTest, HandWrittenTopology )
{
    ScratchFile file;
    file.write( "name: \"pair\"\n"
                "node { name: \"h1\" role: HOST address: \"10.0.0.1/30\" }\n"
                "node { name: \"h2\" role: HOST address: \"10.0.0.2/30\" default_route: \"via 10.0.0.1\" }\n"
                "link { a { node: \"h1\" } b { node: \"h2\" } }\n" );

    const Topology topology = load_topology( file.name() );

    EXPECT_EQ( topology.name(), "pair" );
    EXPECT_EQ( topology.interface( "h1", "h1-eth0" ).address.str(), "10.0.0.1/30" );
    EXPECT_EQ( topology.interface( "h2", "h2-eth0" ).peer_name, "h1-eth0" );
    EXPECT_EQ( topology.node( "h2" ).default_route.ip(), "10.0.0.1" );
}

TEST( TopologyFileTest, LoadedTopologiesAreValidated )
{
    ScratchFile file;

    file.write( "node { name: \"h1\" role: HOST }\n"
                "link { a { node: \"h1\" } b { node: \"ghost\" } }\n" );
    EXPECT_THROW( load_topology( file.name() ), unknown_node_error );

    file.write( "node { name: \"s1\" role: SWITCH }\n"
                "node { name: \"h1\" role: HOST address: \"10.0.0.2/24\" }\n"
                "node { name: \"h2\" role: HOST address: \"10.0.1.2/24\" }\n"
                "link { a { node: \"h1\" } b { node: \"s1\" } }\n"
                "link { a { node: \"h2\" } b { node: \"s1\" } }\n" );
    EXPECT_THROW( load_topology( file.name() ), topology_validation_error );

    file.write( "node { name: \"h1\" role: HOST }\n"
                "node { name: \"h1\" role: ROUTER }\n" );
    EXPECT_THROW( load_topology( file.name() ), duplicate_node_error );
}

TEST( TopologyFileTest, InvalidFile )
{
    ScratchFile file;
    file.write( "node { name: \"h1\" colour: BLUE }\n" );

    EXPECT_THROW( load_topology( file.name() ), runtime_error );
    EXPECT_THROW( load_topology( file.name() + ".missing" ), unix_error );
}
