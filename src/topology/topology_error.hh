/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TOPOLOGY_ERROR_HH
#define TOPOLOGY_ERROR_HH

#include <stdexcept>
#include <string>
#include <vector>

/* declaration-time errors; nothing has touched the OS when these are thrown */
class topology_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class duplicate_node_error : public topology_error
{
private:
    std::string name_;

public:
    explicit duplicate_node_error( const std::string & name )
        : topology_error( "duplicate node name: " + name ),
          name_( name )
    {}

    const std::string & name( void ) const { return name_; }
};

class unknown_node_error : public topology_error
{
private:
    std::string name_;

public:
    explicit unknown_node_error( const std::string & name )
        : topology_error( "unknown node: " + name ),
          name_( name )
    {}

    const std::string & name( void ) const { return name_; }
};

class topology_validation_error : public topology_error
{
private:
    std::vector<std::string> violations_;

    static std::string describe( const std::vector<std::string> & violations )
    {
        std::string ret = "invalid topology (" + std::to_string( violations.size() )
            + ( violations.size() == 1 ? " violation)" : " violations)" );
        for ( const auto & violation : violations ) {
            ret += "\n  " + violation;
        }
        return ret;
    }

public:
    explicit topology_validation_error( const std::vector<std::string> & violations )
        : topology_error( describe( violations ) ),
          violations_( violations )
    {}

    const std::vector<std::string> & violations( void ) const { return violations_; }
};

#endif /* TOPOLOGY_ERROR_HH */
