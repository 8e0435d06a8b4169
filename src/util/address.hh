/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef ADDRESS_HH
#define ADDRESS_HH

#include <cstdint>
#include <string>

/* IPv4 host address */
class Address
{
private:
    uint32_t addr_; /* host byte order */

public:
    Address( void ) : addr_( 0 ) {}
    explicit Address( const uint32_t host_order_addr ) : addr_( host_order_addr ) {}

    /* dotted quad, e.g. "20.10.172.129" */
    explicit Address( const std::string & ip );

    uint32_t to_uint32( void ) const { return addr_; }
    std::string ip( void ) const;

    bool operator==( const Address & other ) const { return addr_ == other.addr_; }
    bool operator!=( const Address & other ) const { return addr_ != other.addr_; }
    bool operator<( const Address & other ) const { return addr_ < other.addr_; }
};

/* address of one interface together with its prefix length,
   e.g. "20.10.172.130/26" */
class InterfaceAddress
{
private:
    Address address_;
    unsigned int prefix_length_;

public:
    InterfaceAddress( void ) : address_(), prefix_length_( 0 ) {}
    InterfaceAddress( const Address & address, const unsigned int prefix_length );
    explicit InterfaceAddress( const std::string & cidr );

    const Address & address( void ) const { return address_; }
    unsigned int prefix_length( void ) const { return prefix_length_; }

    uint32_t netmask( void ) const;
    Address network( void ) const;
    Address broadcast( void ) const;

    /* this address with the host bits cleared */
    InterfaceAddress subnet( void ) const { return InterfaceAddress( network(), prefix_length_ ); }

    bool contains( const Address & other ) const;
    bool same_subnet( const InterfaceAddress & other ) const;

    /* a host-usable address is neither the network nor the broadcast address
       (point-to-point /31 and host /32 prefixes have no such reservations) */
    bool is_host_usable( void ) const;
    bool is_network_address( void ) const { return address_ == network(); }

    std::string str( void ) const;

    bool operator==( const InterfaceAddress & other ) const
    {
        return address_ == other.address_ and prefix_length_ == other.prefix_length_;
    }
    bool operator!=( const InterfaceAddress & other ) const { return not operator==( other ); }
};

#endif /* ADDRESS_HH */
