/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <thread>
#include <iostream>

#include "http_server.hh"
#include "http_connection.hh"
#include "exception.hh"

using namespace std;

HTTPServer::HTTPServer( const ServerConfig & config,
                        const HTTPRouter & router,
                        HTTPBackingStore * const backing_store )
    : listener_socket_(),
      router_( router ),
      backing_store_( backing_store ),
      threaded_( config.threaded ),
      verbose_( config.verbose )
{
    listener_socket_.set_reuseaddr();
    listener_socket_.bind( Address( config.address, to_string( config.port ) ) );
    listener_socket_.listen();

    cerr << "Listening on " << listener_socket_.local_address().str() << endl;
}

void HTTPServer::serve_connection( FileDescriptor & client,
                                   const HTTPRouter & router,
                                   HTTPBackingStore * const backing_store,
                                   const Address & peer,
                                   const bool verbose )
{
    cerr << "client connected " << client.fd_num() << " from " << peer.str() << endl;

    try {
        HTTPConnection connection( router, backing_store, peer, verbose );

        while ( true ) {
            const string chunk = client.read();
            if ( client.eof() ) {
                break;
            }

            const string reply = connection.on_data( chunk );
            if ( not reply.empty() ) {
                client.write( reply );
            }
        }
    } catch ( const exception & e ) {
        print_exception( e );
    }

    cerr << "client disconnected " << client.fd_num() << endl;
}

void HTTPServer::serve_one( void )
{
    TCPSocket client = listener_socket_.accept();
    const Address peer = client.peer_address();

    if ( not threaded_ ) {
        serve_connection( client, router_, backing_store_, peer, verbose_ );
        return;
    }

    /* router and backing store are captured by reference and must persist */
    const HTTPRouter & router = router_;
    HTTPBackingStore * const backing_store = backing_store_;
    const bool verbose = verbose_;

    thread newthread( [&router, backing_store, peer, verbose] ( TCPSocket connection ) {
            serve_connection( connection, router, backing_store, peer, verbose );
        }, move( client ) );

    /* don't wait around for the client to hang up */
    newthread.detach();
}

void HTTPServer::loop( void )
{
    while ( true ) {
        serve_one();
    }
}
