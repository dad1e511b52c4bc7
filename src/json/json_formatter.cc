/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "json_formatter.hh"
#include "exception.hh"

using namespace std;

static string print_double( const char * format, const int precision, const double value )
{
    const int length = snprintf( nullptr, 0, format, precision, value );
    if ( length < 0 ) {
        throw runtime_error( "snprintf failed" );
    }

    vector< char > buffer( length + 1 );
    snprintf( &buffer[ 0 ], buffer.size(), format, precision, value );

    return string( &buffer[ 0 ], length );
}

static bool reads_back( const string & text, const double value )
{
    return strtod( text.c_str(), nullptr ) == value;
}

string format_float( const double value )
{
    if ( not isfinite( value ) ) {
        throw json_unsupported_type( "non-finite float has no JSON rendering" );
    }

    string ret;
    for ( int precision = 1; precision <= 17; precision++ ) {
        ret = print_double( "%.*g", precision, value );
        if ( reads_back( ret, value ) ) {
            break;
        }
    }

    /* the parser has no exponents, so fall back to positional notation */
    if ( ret.find( 'e' ) != string::npos ) {
        for ( int precision = 1; precision <= 1100; precision++ ) {
            ret = print_double( "%.*f", precision, value );
            if ( reads_back( ret, value ) ) {
                break;
            }
        }
    }

    if ( ret.find( '.' ) == string::npos ) {
        ret += ".0";
    }

    return ret;
}

static void append_value( const JSONValue & value, string & out )
{
    switch ( value.type() ) {
    case JSONValue::NULL_VALUE:
        out += "null";
        return;
    case JSONValue::BOOL:
        out += value.as_bool() ? "true" : "false";
        return;
    case JSONValue::INT:
        out += to_string( value.as_int() );
        return;
    case JSONValue::FLOAT:
        out += format_float( value.as_float() );
        return;
    case JSONValue::TEXT:
        out += "\"" + value.as_text() + "\"";
        return;
    case JSONValue::ARRAY:
    {
        out += "[";
        bool first = true;
        for ( const auto & element : value.as_array() ) {
            if ( not first ) {
                out += ",";
            }
            first = false;
            append_value( element, out );
        }
        out += "]";
        return;
    }
    case JSONValue::OBJECT:
    {
        out += "{";
        bool first = true;
        for ( const auto & member : value.as_object() ) {
            if ( not first ) {
                out += ",";
            }
            first = false;
            out += "\"" + member.first + "\":";
            append_value( member.second, out );
        }
        out += "}";
        return;
    }
    }

    throw json_unsupported_type( "unknown JSONValue type tag " + to_string( value.type() ) );
}

string format_json( const JSONValue & value )
{
    string ret;
    append_value( value, ret );
    return ret;
}
