/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <arpa/inet.h>

#include <stdexcept>

#include "address.hh"
#include "util.hh"

using namespace std;

Address::Address( const string & ip )
    : addr_( 0 )
{
    in_addr parsed;
    if ( inet_pton( AF_INET, ip.c_str(), &parsed ) != 1 ) {
        throw runtime_error( "invalid IPv4 address: \"" + ip + "\"" );
    }

    addr_ = ntohl( parsed.s_addr );
}

string Address::ip( void ) const
{
    in_addr raw;
    raw.s_addr = htonl( addr_ );

    char buffer[ INET_ADDRSTRLEN ];
    if ( inet_ntop( AF_INET, &raw, buffer, sizeof( buffer ) ) == nullptr ) {
        throw runtime_error( "inet_ntop failed" );
    }

    return buffer;
}

InterfaceAddress::InterfaceAddress( const Address & address, const unsigned int prefix_length )
    : address_( address ),
      prefix_length_( prefix_length )
{
    if ( prefix_length_ > 32 ) {
        throw runtime_error( "invalid prefix length: " + to_string( prefix_length_ ) );
    }
}

InterfaceAddress::InterfaceAddress( const string & cidr )
    : address_(),
      prefix_length_( 0 )
{
    const auto slash = cidr.find( '/' );
    if ( slash == string::npos ) {
        throw runtime_error( "missing prefix length in \"" + cidr + "\"" );
    }

    address_ = Address( cidr.substr( 0, slash ) );
    prefix_length_ = parse_unsigned( cidr.substr( slash + 1 ), "prefix length in \"" + cidr + "\"" );

    if ( prefix_length_ > 32 ) {
        throw runtime_error( "invalid prefix length in \"" + cidr + "\"" );
    }
}

uint32_t InterfaceAddress::netmask( void ) const
{
    if ( prefix_length_ == 0 ) {
        return 0;
    }

    return 0xFFFFFFFFu << ( 32 - prefix_length_ );
}

Address InterfaceAddress::network( void ) const
{
    return Address( address_.to_uint32() & netmask() );
}

Address InterfaceAddress::broadcast( void ) const
{
    return Address( address_.to_uint32() | ~netmask() );
}

bool InterfaceAddress::contains( const Address & other ) const
{
    return ( other.to_uint32() & netmask() ) == network().to_uint32();
}

bool InterfaceAddress::same_subnet( const InterfaceAddress & other ) const
{
    return prefix_length_ == other.prefix_length_ and network() == other.network();
}

bool InterfaceAddress::is_host_usable( void ) const
{
    if ( prefix_length_ >= 31 ) {
        return true;
    }

    return address_ != network() and address_ != broadcast();
}

string InterfaceAddress::str( void ) const
{
    return address_.ip() + "/" + to_string( prefix_length_ );
}
