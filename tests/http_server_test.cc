/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/socket.h>
#include <thread>

#include <gtest/gtest.h>

#include "http_server.hh"
#include "sample_routes.hh"
#include "exception.hh"

using namespace std;

/* a connected pair of Unix-domain stream sockets */
class ConnectionPairTest : public ::testing::Test
{
protected:
    HTTPRouter router_ {};
    HTTPMemoryStore store_ {};

    static pair< int, int > make_socketpair( void )
    {
        int fds[ 2 ];
        SystemCall( "socketpair", socketpair( AF_UNIX, SOCK_STREAM, 0, fds ) );
        return make_pair( fds[ 0 ], fds[ 1 ] );
    }

    void SetUp() override
    {
        add_sample_routes( router_ );
    }
};

TEST_F( ConnectionPairTest, ServesUntilClientHangsUp )
{
    const pair< int, int > fds = make_socketpair();
    FileDescriptor server_side( fds.first ), client_side( fds.second );

    client_side.write( "GET /schools/5/classes HTTP/1.1\r\nHost: x\r\n\r\n" );
    SystemCall( "shutdown", shutdown( client_side.fd_num(), SHUT_WR ) );

    HTTPServer::serve_connection( server_side, router_, &store_, Address( "127.0.0.1", 1234 ), false );
    EXPECT_TRUE( server_side.eof() );

    const string expected = "HTTP/1.1 200 OK\nContent-Type: application/json\nContent-Length: 10\n\n{\"id\":\"5\"}";
    EXPECT_EQ( client_side.read(), expected );

    ASSERT_EQ( store_.exchanges().exchange_size(), 1 );
    EXPECT_EQ( store_.exchanges().exchange( 0 ).client_port(), 1234u );
}

TEST_F( ConnectionPairTest, UndecodableRequestIsSkipped )
{
    const pair< int, int > fds = make_socketpair();
    FileDescriptor server_side( fds.first ), client_side( fds.second );

    client_side.write( "GET /\xFF HTTP/1.1\r\n\r\n" );
    SystemCall( "shutdown", shutdown( client_side.fd_num(), SHUT_WR ) );

    HTTPServer::serve_connection( server_side, router_, nullptr, Address(), false );

    /* nothing was written back, so the client sees end of stream */
    EXPECT_EQ( client_side.read(), "" );
    EXPECT_TRUE( client_side.eof() );
}

TEST_F( ConnectionPairTest, ContinueThenBody )
{
    const pair< int, int > fds = make_socketpair();
    FileDescriptor server_side( fds.first ), client_side( fds.second );

    thread server_thread( [&] () {
            HTTPServer::serve_connection( server_side, router_, nullptr, Address(), true );
        } );

    client_side.write( "POST /echo HTTP/1.1\r\nExpect: 100-continue\r\n\r\n" );
    EXPECT_EQ( client_side.read(), "HTTP/1.1 100 Continue\nContent-Type: text/html\nContent-Length: 0\n\n" );

    client_side.write( "[true, 7]" );
    EXPECT_EQ( client_side.read(), "HTTP/1.1 200 OK\nContent-Type: application/json\nContent-Length: 8\n\n[true,7]" );

    SystemCall( "shutdown", shutdown( client_side.fd_num(), SHUT_WR ) );
    server_thread.join();
}

TEST( HTTPServerTest, AcceptsOneTCPConnection )
{
    ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;

    HTTPRouter router;
    add_sample_routes( router );

    HTTPServer server( config, router );
    const Address listening = server.local_address();
    ASSERT_NE( listening.port(), 0 );

    thread server_thread( [&] () { server.serve_one(); } );

    {
        TCPSocket client;
        client.connect( listening );
        client.write( "GET /sample HTTP/1.1\r\n\r\n" );
        EXPECT_EQ( client.read(), "HTTP/1.1 200 OK\nContent-Type: application/json\nContent-Length: 2\n\n{}" );
    } /* hang up */

    server_thread.join();
}

TEST( HTTPServerTest, ThreadedModeServesOverlappingConnections )
{
    ServerConfig config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.threaded = true;

    HTTPRouter router;
    add_sample_routes( router );
    HTTPMemoryStore store;

    HTTPServer server( config, router, &store );
    const Address listening = server.local_address();

    thread acceptor( [&] () {
            server.serve_one();
            server.serve_one();
        } );

    TCPSocket first;
    first.connect( listening );
    first.write( "GET /schools/1/classes HTTP/1.1\r\n\r\n" );
    EXPECT_EQ( first.read(), "HTTP/1.1 200 OK\nContent-Type: application/json\nContent-Length: 10\n\n{\"id\":\"1\"}" );

    /* the first connection is still open; a serial server would never get here */
    TCPSocket second;
    second.connect( listening );
    second.write( "GET /schools/2/classes HTTP/1.1\r\n\r\n" );
    EXPECT_EQ( second.read(), "HTTP/1.1 200 OK\nContent-Type: application/json\nContent-Length: 10\n\n{\"id\":\"2\"}" );

    acceptor.join();

    const TinyHTTPProtobufs::BulkMessage saved = store.exchanges();
    ASSERT_EQ( saved.exchange_size(), 2 );
    EXPECT_EQ( saved.exchange( 0 ).request().path(), "/schools/1/classes" );
    EXPECT_EQ( saved.exchange( 1 ).request().path(), "/schools/2/classes" );

    /* the first connection is answered again after the second one */
    first.write( "GET /sample HTTP/1.1\r\n\r\n" );
    EXPECT_EQ( first.read(), "HTTP/1.1 200 OK\nContent-Type: application/json\nContent-Length: 2\n\n{}" );
}
