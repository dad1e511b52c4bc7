/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "server_config.hh"

using namespace std;

/* getopt wants mutable strings */
static ServerConfig parse( const vector< string > & arguments )
{
    vector< vector< char > > storage;
    for ( const auto & x : arguments ) {
        storage.emplace_back( x.begin(), x.end() );
        storage.back().push_back( '\0' );
    }

    vector< char * > argv;
    for ( auto & x : storage ) {
        argv.push_back( &x[ 0 ] );
    }
    argv.push_back( nullptr );

    return parse_server_config( argv.size() - 1, &argv[ 0 ] );
}

TEST( ServerConfigTest, Defaults )
{
    const ServerConfig config = parse( { "tinyhttpd" } );
    EXPECT_EQ( config.address, "0.0.0.0" );
    EXPECT_EQ( config.port, 8080 );
    EXPECT_FALSE( config.threaded );
    EXPECT_EQ( config.record_folder, "" );
    EXPECT_FALSE( config.verbose );
}

TEST( ServerConfigTest, LongOptions )
{
    const ServerConfig config = parse( { "tinyhttpd", "--address=127.0.0.1", "--port", "9000",
                                         "--threaded", "--record-folder=/tmp/records", "--verbose" } );
    EXPECT_EQ( config.address, "127.0.0.1" );
    EXPECT_EQ( config.port, 9000 );
    EXPECT_TRUE( config.threaded );
    EXPECT_EQ( config.record_folder, "/tmp/records" );
    EXPECT_TRUE( config.verbose );
}

TEST( ServerConfigTest, ShortOptions )
{
    const ServerConfig config = parse( { "tinyhttpd", "-a", "10.1.2.3", "-p1", "-tv" } );
    EXPECT_EQ( config.address, "10.1.2.3" );
    EXPECT_EQ( config.port, 1 );
    EXPECT_TRUE( config.threaded );
    EXPECT_TRUE( config.verbose );
}

TEST( ServerConfigTest, BadPorts )
{
    EXPECT_THROW( parse( { "tinyhttpd", "--port=0" } ), runtime_error );
    EXPECT_THROW( parse( { "tinyhttpd", "--port=65536" } ), runtime_error );
    EXPECT_THROW( parse( { "tinyhttpd", "--port=http" } ), runtime_error );
    EXPECT_THROW( parse( { "tinyhttpd", "--port=-80" } ), runtime_error );
}

TEST( ServerConfigTest, UnknownOptionsAndStrayArguments )
{
    EXPECT_THROW( parse( { "tinyhttpd", "--tls" } ), runtime_error );
    EXPECT_THROW( parse( { "tinyhttpd", "extra" } ), runtime_error );
}
