/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <map>

#include "http_response.hh"

using namespace std;

/* responses end their lines with a bare LF */
static const string LF = "\n";

string HTTPResponse::reason_phrase( const int status )
{
    static const map< int, string > phrases = {
        { 100, "Continue" },
        { 101, "Switching Protocols" },
        { 200, "OK" },
        { 201, "Created" },
        { 202, "Accepted" },
        { 203, "Non-Authoritative Information" },
        { 204, "No Content" },
        { 205, "Reset Content" },
        { 206, "Partial Content" },
        { 300, "Multiple Choices" },
        { 301, "Moved Permanently" },
        { 302, "Found" },
        { 303, "See Other" },
        { 304, "Not Modified" },
        { 305, "Use Proxy" },
        { 307, "Temporary Redirect" },
        { 400, "Bad Request" },
        { 401, "Unauthorized" },
        { 402, "Payment Required" },
        { 403, "Forbidden" },
        { 404, "Not Found" },
        { 405, "Method Not Allowed" },
        { 406, "Not Acceptable" },
        { 407, "Proxy Authentication Required" },
        { 408, "Request Time-out" },
        { 409, "Conflict" },
        { 410, "Gone" },
        { 411, "Length Required" },
        { 412, "Precondition Failed" },
        { 413, "Request Entity Too Large" },
        { 414, "Request-URI Too Large" },
        { 415, "Unsupported Media Type" },
        { 416, "Requested range not satisfiable" },
        { 417, "Expectation Failed" },
        { 500, "Internal Server Error" },
        { 501, "Not Implemented" },
        { 502, "Bad Gateway" },
        { 503, "Service Unavailable" },
        { 504, "Gateway Time-out" },
        { 505, "HTTP Version not supported" }
    };

    const auto it = phrases.find( status );
    if ( it == phrases.end() ) {
        return "Custom";
    }

    return it->second;
}

void HTTPResponse::add_header( const string & key, const string & value )
{
    additional_headers_[ key ] = value;
}

string HTTPResponse::str( void ) const
{
    string ret = "HTTP/1.1 " + to_string( status_ ) + " " + reason() + LF;

    ret.append( HTTPHeader( "Content-Type", content_type_ ).str() + LF );
    ret.append( HTTPHeader( "Content-Length", to_string( body_.size() ) ).str() + LF );

    for ( const auto & header : additional_headers_ ) {
        ret.append( HTTPHeader( header.first, header.second ).str() + LF );
    }

    ret.append( LF );
    ret.append( body_ );

    return ret;
}

HTTPResponse::HTTPResponse( const TinyHTTPProtobufs::HTTPResponse & proto )
    : status_( proto.status() ),
      content_type_( proto.content_type() ),
      body_( proto.body() ),
      additional_headers_()
{
    for ( const auto & header_proto : proto.header() ) {
        const HTTPHeader header( header_proto );
        additional_headers_[ header.key() ] = header.value();
    }
}

TinyHTTPProtobufs::HTTPResponse HTTPResponse::toprotobuf( void ) const
{
    TinyHTTPProtobufs::HTTPResponse ret;

    ret.set_status( status_ );
    ret.set_reason( reason() );
    ret.set_content_type( content_type_ );

    for ( const auto & header : additional_headers_ ) {
        ret.add_header()->CopyFrom( HTTPHeader( header.first, header.second ).toprotobuf() );
    }

    ret.set_body( body_ );

    return ret;
}
