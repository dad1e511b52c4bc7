/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <vector>
#include <algorithm>

#include "http_request_parser.hh"
#include "exception.hh"
#include "util.hh"

using namespace std;

const string HTTPRequestParser::TERMINATOR = "\r\n\r\n";

static bool is_blank( const char ch )
{
    return ch == ' ' or ch == '\t' or ch == '\r' or ch == '\n';
}

HTTPRequestParser::HTTPRequestParser( const string & raw )
    : raw_( raw ),
      cursor_( 0 ),
      header_end_( 0 )
{}

size_t HTTPRequestParser::end_of_line( void ) const
{
    const size_t line_end = raw_.find_first_of( "\r\n", cursor_ );
    return min( line_end, header_end_ );
}

HTTPRequest HTTPRequestParser::parse( void )
{
    if ( not is_valid_utf8( raw_ ) ) {
        throw incomplete_request_data( "request bytes are not UTF-8 text" );
    }

    cursor_ = 0;
    header_end_ = min( raw_.find( TERMINATOR ), raw_.size() );

    string method, path, version;
    parse_request_line( method, path, version );

    HTTPFields fields;
    parse_fields( fields );

    const string body = parse_body();

    return HTTPRequest( HTTPRequestHeader( method, path, version, fields ), body );
}

/* the first three space-separated tokens of the first line */
void HTTPRequestParser::parse_request_line( string & method, string & path, string & version )
{
    while ( in_header() and is_blank( raw_.at( cursor_ ) ) ) {
        cursor_++;
    }

    const size_t line_end = end_of_line();

    vector< string > tokens;
    for ( const auto & token : split( raw_.substr( cursor_, line_end - cursor_ ), " " ) ) {
        if ( not token.empty() ) {
            tokens.push_back( token );
        }
    }
    tokens.resize( max( tokens.size(), size_t( 3 ) ) );

    method = tokens.at( 0 );
    path = tokens.at( 1 );
    version = tokens.at( 2 );

    cursor_ = line_end;
}

/* "Key: value" lines until the terminator */
void HTTPRequestParser::parse_fields( HTTPFields & fields )
{
    while ( true ) {
        while ( in_header() and is_blank( raw_.at( cursor_ ) ) ) {
            cursor_++;
        }

        if ( not in_header() ) {
            return;
        }

        const size_t line_end = end_of_line();
        const string line = raw_.substr( cursor_, line_end - cursor_ );
        cursor_ = line_end;

        const size_t colon = line.find( ':' );
        if ( colon == string::npos ) {
            continue; /* not a header field */
        }

        const size_t value_start = line.find_first_not_of( " \t", colon + 1 );

        fields[ line.substr( 0, colon ) ] =
            value_start == string::npos ? string() : line.substr( value_start );
    }
}

string HTTPRequestParser::parse_body( void )
{
    if ( header_end_ == raw_.size() ) {
        return string();
    }

    cursor_ = header_end_ + TERMINATOR.size();

    /* blank lines between the terminator and the body */
    while ( raw_.compare( cursor_, 2, "\r\n" ) == 0 ) {
        cursor_ += 2;
    }

    return raw_.substr( cursor_ );
}
