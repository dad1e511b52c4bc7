/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>
#include <sstream>
#include <fstream>

#include <gtest/gtest.h>

#include <unistd.h>

#include "util.hh"
#include "address.hh"
#include "temp_file.hh"
#include "exception.hh"

using namespace std;

TEST( UtilTest, SplitKeepsEmptyPieces )
{
    const vector< string > pieces = split( "/a//b/", "/" );
    ASSERT_EQ( pieces.size(), 5u );
    EXPECT_EQ( pieces.at( 0 ), "" );
    EXPECT_EQ( pieces.at( 1 ), "a" );
    EXPECT_EQ( pieces.at( 2 ), "" );
    EXPECT_EQ( pieces.at( 3 ), "b" );
    EXPECT_EQ( pieces.at( 4 ), "" );
}

TEST( UtilTest, Myatoi )
{
    EXPECT_EQ( myatoi( "8080" ), 8080 );
    EXPECT_EQ( myatoi( "ff", 16 ), 255 );
    EXPECT_THROW( myatoi( "80x" ), runtime_error );
    EXPECT_THROW( myatoi( "" ), runtime_error );
}

TEST( UtilTest, ValidUtf8 )
{
    EXPECT_TRUE( is_valid_utf8( "plain ascii" ) );
    EXPECT_TRUE( is_valid_utf8( "caf\xC3\xA9" ) );
    EXPECT_TRUE( is_valid_utf8( "\xF0\x9F\x98\x80" ) );
    EXPECT_TRUE( is_valid_utf8( "" ) );
}

TEST( UtilTest, InvalidUtf8 )
{
    EXPECT_FALSE( is_valid_utf8( "\xFF" ) );
    EXPECT_FALSE( is_valid_utf8( "caf\xC3" ) );          /* truncated */
    EXPECT_FALSE( is_valid_utf8( "\xC0\xAF" ) );         /* overlong */
    EXPECT_FALSE( is_valid_utf8( "\xED\xA0\x80" ) );     /* surrogate */
    EXPECT_FALSE( is_valid_utf8( "\xF4\x90\x80\x80" ) ); /* above U+10FFFF */
}

TEST( UtilTest, EquivalentStrings )
{
    EXPECT_TRUE( equivalent_strings( "100-Continue", "100-continue" ) );
    EXPECT_FALSE( equivalent_strings( "100-continue", "100-continued" ) );
}

TEST( UtilTest, PrintExceptionNamesTheType )
{
    ostringstream out;
    print_exception( json_unsupported_type( "no way" ), out );
    EXPECT_EQ( out.str(), "Died on json_unsupported_type: no way\n" );
}

TEST( UtilTest, UniqueFileKeepsItsContents )
{
    string name;
    {
        UniqueFile file( "/tmp/tinyhttp-util-test" );
        name = file.name();
        EXPECT_EQ( name.find( "/tmp/tinyhttp-util-test." ), 0u );
        file.write( "kept" );
    }

    ifstream in( name );
    string contents;
    getline( in, contents );
    EXPECT_EQ( contents, "kept" );

    SystemCall( "unlink", unlink( name.c_str() ) );
}

TEST( UtilTest, Addresses )
{
    const Address literal( "127.0.0.1", 8080 );
    EXPECT_EQ( literal.str(), "127.0.0.1:8080" );
    EXPECT_EQ( Address( "127.0.0.1", "8080" ), literal );
    EXPECT_EQ( Address().str(), "0.0.0.0:0" );
    EXPECT_THROW( Address( "300.1.1.1", 80 ), runtime_error );
}
