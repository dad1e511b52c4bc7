/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_RESPONSE_HH
#define HTTP_RESPONSE_HH

#include <string>

#include "http_header.hh"
#include "tinyhttp_record.pb.h"

/* response builder, filled in by a route handler and rendered once */
class HTTPResponse
{
private:
    int status_ { 200 };
    std::string content_type_ { "text/html" };
    std::string body_ {};
    HTTPFields additional_headers_ {};

public:
    HTTPResponse() {}

    int status( void ) const { return status_; }
    const std::string & content_type( void ) const { return content_type_; }
    const std::string & body( void ) const { return body_; }
    const HTTPFields & additional_headers( void ) const { return additional_headers_; }

    void set_status( const int status ) { status_ = status; }
    void set_content_type( const std::string & content_type ) { content_type_ = content_type; }
    void set_body( const std::string & body ) { body_ = body; }

    /* replaces an earlier header of the same name */
    void add_header( const std::string & key, const std::string & value );

    std::string reason( void ) const { return reason_phrase( status_ ); }

    /* wire format: status line, Content-Type, Content-Length,
       additional headers, blank line, body */
    std::string str( void ) const;

    /* "Custom" for any status outside the table */
    static std::string reason_phrase( const int status );

    HTTPResponse( const TinyHTTPProtobufs::HTTPResponse & proto );
    TinyHTTPProtobufs::HTTPResponse toprotobuf( void ) const;
};

#endif /* HTTP_RESPONSE_HH */
