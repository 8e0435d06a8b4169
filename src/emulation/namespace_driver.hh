/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef NAMESPACE_DRIVER_HH
#define NAMESPACE_DRIVER_HH

#include <string>

#include "address.hh"

/* Everything the emulation needs from the operating system. Every
   operation blocks until the change is in place, and throws
   provisioning_error when the OS refuses it. */
class NamespaceDriver
{
public:
    virtual ~NamespaceDriver() {}

    virtual void add_namespace( const std::string & ns ) = 0;

    /* also destroys every interface inside the namespace */
    virtual void remove_namespace( const std::string & ns ) = 0;

    /* virtual Ethernet pair with one end in each namespace */
    virtual void add_veth_pair( const std::string & ns_a, const std::string & interface_a,
                                const std::string & ns_b, const std::string & interface_b ) = 0;

    virtual void add_bridge( const std::string & ns, const std::string & bridge ) = 0;
    virtual void attach_to_bridge( const std::string & ns, const std::string & port,
                                   const std::string & bridge ) = 0;

    virtual void set_address( const std::string & ns, const std::string & interface,
                              const InterfaceAddress & address ) = 0;
    virtual void set_link_up( const std::string & ns, const std::string & interface ) = 0;

    /* blocks until the interface reports it can pass traffic */
    virtual void wait_for_link_up( const std::string & ns, const std::string & interface,
                                   const unsigned int timeout_ms ) = 0;

    virtual void add_route( const std::string & ns, const InterfaceAddress & destination,
                            const Address & gateway ) = 0;
    virtual void add_default_route( const std::string & ns, const Address & gateway ) = 0;

    /* shell command inside the namespace; returns its output */
    virtual std::string exec( const std::string & ns, const std::string & command ) = 0;

    /* one echo request; true if a reply came back */
    virtual bool ping( const std::string & ns, const Address & destination ) = 0;
};

#endif /* NAMESPACE_DRIVER_HH */
