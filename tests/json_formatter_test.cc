/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <limits>

#include <gtest/gtest.h>

#include "json_formatter.hh"
#include "exception.hh"

using namespace std;

TEST( JSONFormatterTest, Scalars )
{
    EXPECT_EQ( format_json( JSONValue::null() ), "null" );
    EXPECT_EQ( format_json( JSONValue::boolean( true ) ), "true" );
    EXPECT_EQ( format_json( JSONValue::integer( -42 ) ), "-42" );
    EXPECT_EQ( format_json( JSONValue::text( "hi" ) ), "\"hi\"" );
}

TEST( JSONFormatterTest, TextIsNotEscaped )
{
    EXPECT_EQ( format_json( JSONValue::text( "a\"b" ) ), "\"a\"b\"" );
}

TEST( JSONFormatterTest, Floats )
{
    EXPECT_EQ( format_float( 2.5 ), "2.5" );
    EXPECT_EQ( format_float( 3.0 ), "3.0" );
    EXPECT_EQ( format_float( 0.1 ), "0.1" );
    EXPECT_EQ( format_float( -0.5 ), "-0.5" );
    EXPECT_EQ( format_float( 1e20 ), "100000000000000000000.0" );
    EXPECT_EQ( format_float( 1.5e-7 ), "0.00000015" );
}

TEST( JSONFormatterTest, NonFiniteFloatIsUnsupported )
{
    EXPECT_THROW( format_json( JSONValue::floating( numeric_limits<double>::infinity() ) ),
                  json_unsupported_type );
    EXPECT_THROW( format_json( JSONValue::floating( numeric_limits<double>::quiet_NaN() ) ),
                  json_unsupported_type );
}

TEST( JSONFormatterTest, ContainersHaveNoWhitespace )
{
    JSONValue::Object members;
    members[ "b" ] = JSONValue::array( { JSONValue::integer( 1 ), JSONValue::floating( 2.5 ) } );
    members[ "a" ] = JSONValue::object( JSONValue::Object() );

    EXPECT_EQ( format_json( JSONValue::object( members ) ), "{\"a\":{},\"b\":[1,2.5]}" );
    EXPECT_EQ( format_json( JSONValue::array( JSONValue::Array() ) ), "[]" );
}
