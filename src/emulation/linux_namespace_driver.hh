/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef LINUX_NAMESPACE_DRIVER_HH
#define LINUX_NAMESPACE_DRIVER_HH

#include <string>
#include <vector>

#include "namespace_driver.hh"

/* Named network namespaces, veth pairs and Linux bridges, driven
   through iproute2. Needs root. */
class LinuxNamespaceDriver : public NamespaceDriver
{
private:
    unsigned int ping_timeout_s_;

    /* run a command, turning any failure into a provisioning_error */
    std::string checked_run( const std::vector<std::string> & command );

    /* ip -n <ns> <args...> */
    std::string ip_in( const std::string & ns, const std::vector<std::string> & args );

    bool link_is_up( const std::string & ns, const std::string & interface );

public:
    explicit LinuxNamespaceDriver( const unsigned int ping_timeout_s = 1 );

    void add_namespace( const std::string & ns ) override;
    void remove_namespace( const std::string & ns ) override;

    void add_veth_pair( const std::string & ns_a, const std::string & interface_a,
                        const std::string & ns_b, const std::string & interface_b ) override;

    void add_bridge( const std::string & ns, const std::string & bridge ) override;
    void attach_to_bridge( const std::string & ns, const std::string & port,
                           const std::string & bridge ) override;

    void set_address( const std::string & ns, const std::string & interface,
                      const InterfaceAddress & address ) override;
    void set_link_up( const std::string & ns, const std::string & interface ) override;
    void wait_for_link_up( const std::string & ns, const std::string & interface,
                           const unsigned int timeout_ms ) override;

    void add_route( const std::string & ns, const InterfaceAddress & destination,
                    const Address & gateway ) override;
    void add_default_route( const std::string & ns, const Address & gateway ) override;

    std::string exec( const std::string & ns, const std::string & command ) override;

    bool ping( const std::string & ns, const Address & destination ) override;
};

/* true if ping itself ran: exit status 0 (reply), or 1 together with
   ping's own statistics (no reply). ip netns exec also exits with 1
   when it cannot run ping at all. */
bool ping_completed( const int status, const std::string & output );

#endif /* LINUX_NAMESPACE_DRIVER_HH */
