/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <gtest/gtest.h>

#include "http_request_parser.hh"
#include "exception.hh"

using namespace std;

static HTTPRequest parse( const string & raw )
{
    return HTTPRequestParser( raw ).parse();
}

TEST( HTTPRequestParserTest, RequestLineFieldsAndBody )
{
    const HTTPRequest request = parse( "GET /a/b HTTP/1.1\r\nHost: x\r\n\r\n\r\nHELLO" );

    EXPECT_EQ( request.header().method(), "GET" );
    EXPECT_EQ( request.header().path(), "/a/b" );
    EXPECT_EQ( request.header().version(), "HTTP/1.1" );

    ASSERT_EQ( request.header().fields().size(), 1u );
    EXPECT_EQ( request.header().get_field( "Host" ), "x" );

    EXPECT_EQ( request.body(), "HELLO" );
}

TEST( HTTPRequestParserTest, BodyKeepsItsOwnLineBreaks )
{
    const HTTPRequest request = parse( "POST /echo HTTP/1.1\r\nContent-Type: text/plain\r\n\r\nline1\r\nline2\r\n" );
    EXPECT_EQ( request.body(), "line1\r\nline2\r\n" );
}

TEST( HTTPRequestParserTest, LaterDuplicateFieldWins )
{
    const HTTPRequest request = parse( "GET / HTTP/1.1\r\nAccept: a\r\nAccept: b\r\n\r\n" );
    ASSERT_EQ( request.header().fields().size(), 1u );
    EXPECT_EQ( request.header().get_field( "Accept" ), "b" );
}

TEST( HTTPRequestParserTest, FieldValuesLoseLeadingWhitespace )
{
    const HTTPRequest request = parse( "GET / HTTP/1.1\r\nX-One:   spaced out \r\nX-Two:\tv:w\r\nX-Three:\r\n\r\n" );
    EXPECT_EQ( request.header().get_field( "X-One" ), "spaced out " );
    EXPECT_EQ( request.header().get_field( "X-Two" ), "v:w" );
    EXPECT_EQ( request.header().get_field( "X-Three" ), "" );
}

TEST( HTTPRequestParserTest, LinesWithoutColonAreSkipped )
{
    const HTTPRequest request = parse( "GET / HTTP/1.1\r\ngarbage line\r\nHost: x\r\n\r\n" );
    ASSERT_EQ( request.header().fields().size(), 1u );
    EXPECT_TRUE( request.header().has_field( "Host" ) );
}

TEST( HTTPRequestParserTest, MissingTerminatorMeansNoBody )
{
    const HTTPRequest request = parse( "PUT /thing HTTP/1.0\r\nHost: x\r\n" );
    EXPECT_EQ( request.header().method(), "PUT" );
    EXPECT_EQ( request.header().version(), "HTTP/1.0" );
    EXPECT_EQ( request.header().get_field( "Host" ), "x" );
    EXPECT_EQ( request.body(), "" );
}

TEST( HTTPRequestParserTest, ShortRequestLine )
{
    const HTTPRequest request = parse( "GET\r\n\r\n" );
    EXPECT_EQ( request.header().method(), "GET" );
    EXPECT_EQ( request.header().path(), "" );
    EXPECT_EQ( request.header().version(), "" );
}

TEST( HTTPRequestParserTest, InvalidUtf8IsRejected )
{
    EXPECT_THROW( parse( "GET / HTTP/1.1\r\nHost: \xFF\r\n\r\n" ), incomplete_request_data );
}

TEST( HTTPRequestParserTest, ExpectContinueIgnoresCase )
{
    EXPECT_TRUE( parse( "POST / HTTP/1.1\r\nExpect: 100-Continue\r\n\r\n" ).header().expects_continue() );
    EXPECT_FALSE( parse( "POST / HTTP/1.1\r\nExpect: nothing\r\n\r\n" ).header().expects_continue() );
    EXPECT_FALSE( parse( "POST / HTTP/1.1\r\n\r\n" ).header().expects_continue() );
}

TEST( HTTPRequestParserTest, MissingFieldThrows )
{
    EXPECT_THROW( parse( "GET / HTTP/1.1\r\n\r\n" ).header().get_field( "Host" ), runtime_error );
}

TEST( HTTPRequestParserTest, RequestRendersWithCRLF )
{
    const HTTPRequest request = parse( "GET /a HTTP/1.1\r\nHost: x\r\n\r\nbody" );
    EXPECT_EQ( request.str(), "GET /a HTTP/1.1\r\nHost: x\r\n\r\nbody" );
}
