/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef ADDRESS_HH
#define ADDRESS_HH

#include <netinet/in.h>
#include <string>

/* IPv4 address and port */
class Address
{
private:
    sockaddr_in addr_;

public:
    Address( const sockaddr_in & s_addr );
    Address( const std::string & hostname, const std::string & service );
    Address( const std::string & ip, const uint16_t port );
    Address();

    std::string ip( void ) const;
    uint16_t port( void ) const;
    std::string str( const std::string port_separator = ":" ) const;

    const sockaddr_in & raw_sockaddr_in( void ) const { return addr_; }
    const sockaddr & raw_sockaddr( void ) const
    {
        return *reinterpret_cast<const sockaddr *>( &addr_ );
    }

    bool operator==( const Address & other ) const;
};

#endif /* ADDRESS_HH */
