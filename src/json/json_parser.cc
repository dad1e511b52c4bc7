/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cstdlib>
#include <cerrno>
#include <cmath>

#include "json_parser.hh"
#include "exception.hh"

using namespace std;

JSONParser::JSONParser( const string & json )
    : json_( json ),
      cursor_( 0 )
{}

bool JSONParser::is_whitespace( const char ch )
{
    return ch == ' ' or ch == '\t' or ch == '\r' or ch == '\n';
}

void JSONParser::skip_whitespace( void )
{
    while ( not at_end() and is_whitespace( current() ) ) {
        cursor_++;
    }
}

JSONValue JSONParser::parse( void )
{
    cursor_ = 0;
    skip_whitespace();

    if ( at_end() ) {
        throw json_syntax_error( "empty document", cursor_ );
    }

    switch ( current() ) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    default:
        throw json_syntax_error( string( "top-level value must be an object or an array, not '" )
                                 + current() + "'", cursor_ );
    }
}

JSONValue JSONParser::parse_value( void )
{
    if ( at_end() ) {
        throw json_syntax_error( "unterminated structure (expected a value)", cursor_ );
    }

    switch ( current() ) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"':
        return JSONValue::text( parse_string() );
    default:
        return parse_scalar();
    }
}

JSONValue JSONParser::parse_object( void )
{
    const size_t start = cursor_;
    cursor_++; /* the '{' */

    JSONValue::Object members;

    while ( true ) {
        skip_whitespace();

        if ( at_end() ) {
            throw json_syntax_error( "unterminated object", start );
        }

        if ( current() == '}' ) {
            cursor_++;
            return JSONValue::object( members );
        }

        if ( current() != '"' ) {
            throw json_syntax_error( "object key is not a quoted string", cursor_ );
        }

        const string key = parse_string();

        /* the separator: any run of whitespace and colons */
        while ( not at_end() and ( is_whitespace( current() ) or current() == ':' ) ) {
            cursor_++;
        }

        members[ key ] = parse_value();

        skip_whitespace();
        if ( not at_end() and current() == ',' ) {
            cursor_++;
        }
    }
}

JSONValue JSONParser::parse_array( void )
{
    const size_t start = cursor_;
    cursor_++; /* the '[' */

    JSONValue::Array elements;

    while ( true ) {
        skip_whitespace();

        if ( at_end() ) {
            throw json_syntax_error( "unterminated array", start );
        }

        if ( current() == ']' ) {
            cursor_++;
            return JSONValue::array( elements );
        }

        elements.push_back( parse_value() );

        skip_whitespace();
        if ( not at_end() and current() == ',' ) {
            cursor_++;
        }
    }
}

/* returns the raw characters between the quotes */
string JSONParser::parse_string( void )
{
    const size_t start = cursor_;
    cursor_++; /* the opening quote */

    while ( true ) {
        if ( at_end() ) {
            throw json_syntax_error( "unterminated string", start );
        }

        if ( current() == '\\' ) {
            cursor_ += 2;
        } else if ( current() == '"' ) {
            const string ret = json_.substr( start + 1, cursor_ - start - 1 );
            cursor_++;
            return ret;
        } else {
            cursor_++;
        }
    }
}

/* true, false, null, or a number */
JSONValue JSONParser::parse_scalar( void )
{
    const size_t start = cursor_;

    while ( not at_end()
            and current() != ',' and current() != ']' and current() != '}'
            and not is_whitespace( current() ) ) {
        cursor_++;
    }

    if ( at_end() ) {
        throw json_syntax_error( "unterminated structure", start );
    }

    const string span = json_.substr( start, cursor_ - start );

    if ( span.empty() ) {
        throw json_syntax_error( "missing value", start );
    } else if ( span == "true" ) {
        return JSONValue::boolean( true );
    } else if ( span == "false" ) {
        return JSONValue::boolean( false );
    } else if ( span == "null" ) {
        return JSONValue::null();
    }

    if ( span.find_first_not_of( "0123456789+-." ) != string::npos ) {
        throw json_syntax_error( "unrecognized token \"" + span + "\"", start );
    }

    char *end;
    errno = 0;

    if ( span.find( '.' ) != string::npos ) {
        const double value = strtod( span.c_str(), &end );
        /* ERANGE on underflow still leaves a usable (subnormal) value */
        const bool overflow = errno == ERANGE and ( value == HUGE_VAL or value == -HUGE_VAL );
        if ( overflow or end != span.c_str() + span.size() ) {
            throw json_syntax_error( "invalid float \"" + span + "\"", start );
        }
        return JSONValue::floating( value );
    } else {
        const long long value = strtoll( span.c_str(), &end, 10 );
        if ( errno != 0 or end != span.c_str() + span.size() ) {
            throw json_syntax_error( "invalid integer \"" + span + "\"", start );
        }
        return JSONValue::integer( value );
    }
}

JSONValue parse_json( const string & json )
{
    return JSONParser( json ).parse();
}
