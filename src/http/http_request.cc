/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "http_request.hh"
#include "util.hh"

using namespace std;

static const string CRLF = "\r\n";

HTTPRequestHeader::HTTPRequestHeader( const string & method,
                                      const string & path,
                                      const string & version,
                                      const HTTPFields & fields )
    : method_( method ),
      path_( path ),
      version_( version ),
      fields_( fields )
{}

bool HTTPRequestHeader::has_field( const string & name ) const
{
    return fields_.count( name ) > 0;
}

const string & HTTPRequestHeader::get_field( const string & name ) const
{
    const auto it = fields_.find( name );
    if ( it == fields_.end() ) {
        throw runtime_error( "HTTPRequestHeader: header not found: " + name );
    }

    return it->second;
}

bool HTTPRequestHeader::expects_continue( void ) const
{
    return has_field( "Expect" ) and equivalent_strings( get_field( "Expect" ), "100-continue" );
}

string HTTPRequestHeader::request_line( void ) const
{
    return method_ + " " + path_ + " " + version_;
}

HTTPRequest::HTTPRequest( const HTTPRequestHeader & header, const string & body )
    : header_( header ),
      body_( body )
{}

string HTTPRequest::str( void ) const
{
    string ret = header_.request_line() + CRLF;

    for ( const auto & field : header_.fields() ) {
        ret.append( HTTPHeader( field.first, field.second ).str() + CRLF );
    }

    ret.append( CRLF );
    ret.append( body_ );

    return ret;
}

HTTPRequest::HTTPRequest( const TinyHTTPProtobufs::HTTPRequest & proto )
    : header_(),
      body_( proto.body() )
{
    HTTPFields fields;
    for ( const auto & header_proto : proto.header() ) {
        const HTTPHeader header( header_proto );
        fields[ header.key() ] = header.value();
    }

    header_ = HTTPRequestHeader( proto.method(), proto.path(), proto.version(), fields );
}

TinyHTTPProtobufs::HTTPRequest HTTPRequest::toprotobuf( void ) const
{
    TinyHTTPProtobufs::HTTPRequest ret;

    ret.set_method( header_.method() );
    ret.set_path( header_.path() );
    ret.set_version( header_.version() );

    for ( const auto & field : header_.fields() ) {
        ret.add_header()->CopyFrom( HTTPHeader( field.first, field.second ).toprotobuf() );
    }

    ret.set_body( body_ );

    return ret;
}
