/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/socket.h>
#include <netinet/in.h>

#include "socket.hh"
#include "exception.hh"

using namespace std;

/* default constructor for socket of (subclassed) domain and type */
Socket::Socket( const int domain, const int type )
    : FileDescriptor( SystemCall( "socket", socket( domain, type, 0 ) ) )
{
}

/* construct from file descriptor */
Socket::Socket( FileDescriptor && fd, const int domain, const int type )
    : FileDescriptor( move( fd ) )
{
    int actual_value;
    socklen_t len;

    /* verify domain */
    len = sizeof( actual_value );
    SystemCall( "getsockopt", getsockopt( fd_num(), SOL_SOCKET, SO_DOMAIN, &actual_value, &len ) );
    if ( (len != sizeof( actual_value )) or (actual_value != domain) ) {
        throw runtime_error( "socket domain mismatch" );
    }

    /* verify type */
    len = sizeof( actual_value );
    SystemCall( "getsockopt", getsockopt( fd_num(), SOL_SOCKET, SO_TYPE, &actual_value, &len ) );
    if ( (len != sizeof( actual_value )) or (actual_value != type) ) {
        throw runtime_error( "socket type mismatch" );
    }
}

/* get the local or peer address the socket is connected to */
Address Socket::get_address( const std::string & name_of_function,
                             const std::function<int(int, sockaddr *, socklen_t *)> & function ) const
{
    sockaddr_in address;
    socklen_t size = sizeof( address );

    SystemCall( name_of_function, function( fd_num(),
                                            reinterpret_cast<sockaddr *>( &address ),
                                            &size ) );

    if ( size != sizeof( address ) ) {
        throw runtime_error( name_of_function + ": sockaddr size mismatch" );
    }

    return Address( address );
}

Address Socket::local_address( void ) const
{
    return get_address( "getsockname", getsockname );
}

Address Socket::peer_address( void ) const
{
    return get_address( "getpeername", getpeername );
}

/* bind socket to a specified local address (usually to listen/accept) */
void Socket::bind( const Address & address )
{
    SystemCall( "bind " + address.str(), ::bind( fd_num(),
                                                 &address.raw_sockaddr(),
                                                 sizeof( address.raw_sockaddr_in() ) ) );
}

/* connect socket to a specified peer address */
void Socket::connect( const Address & address )
{
    SystemCall( "connect " + address.str(), ::connect( fd_num(),
                                                       &address.raw_sockaddr(),
                                                       sizeof( address.raw_sockaddr_in() ) ) );
}

/* mark the socket as listening for incoming connections */
void TCPSocket::listen( const int backlog )
{
    SystemCall( "listen", ::listen( fd_num(), backlog ) );
}

/* accept a new incoming connection */
TCPSocket TCPSocket::accept( void )
{
    register_read();
    return TCPSocket( FileDescriptor( SystemCall( "accept", ::accept( fd_num(), nullptr, nullptr ) ) ) );
}

/* set socket option */
template <typename option_type>
void Socket::setsockopt( const int level, const int option, const option_type & option_value )
{
    SystemCall( "setsockopt", ::setsockopt( fd_num(), level, option,
                                            &option_value, sizeof( option_value ) ) );
}

/* allow local address to be reused sooner, at the cost of some robustness */
void Socket::set_reuseaddr( void )
{
    setsockopt( SOL_SOCKET, SO_REUSEADDR, int( true ) );
}
