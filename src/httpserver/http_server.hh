/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_SERVER_HH
#define HTTP_SERVER_HH

#include "socket.hh"
#include "server_config.hh"
#include "http_router.hh"
#include "backing_store.hh"

class HTTPServer
{
private:
    TCPSocket listener_socket_;

    const HTTPRouter & router_;

    /* may be null; must outlive the server and any connection it spawns */
    HTTPBackingStore * const backing_store_;

    bool threaded_;
    bool verbose_;

public:
    HTTPServer( const ServerConfig & config,
                const HTTPRouter & router,
                HTTPBackingStore * const backing_store = nullptr );

    Address local_address( void ) const { return listener_socket_.local_address(); }

    /* accept one connection and serve it (or hand it to a new thread) */
    void serve_one( void );

    /* accept connections forever */
    void loop( void );

    /* read from the client until it hangs up, answering each chunk */
    static void serve_connection( FileDescriptor & client,
                                  const HTTPRouter & router,
                                  HTTPBackingStore * const backing_store,
                                  const Address & peer,
                                  const bool verbose );
};

#endif /* HTTP_SERVER_HH */
