/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_REQUEST_HH
#define HTTP_REQUEST_HH

#include <string>

#include "http_header.hh"
#include "tinyhttp_record.pb.h"

/* request line and header fields, without the blank terminator line */
class HTTPRequestHeader
{
private:
    std::string method_, path_, version_;
    HTTPFields fields_;

public:
    HTTPRequestHeader() : method_(), path_(), version_(), fields_() {}

    HTTPRequestHeader( const std::string & method,
                       const std::string & path,
                       const std::string & version,
                       const HTTPFields & fields );

    const std::string & method( void ) const { return method_; }
    const std::string & path( void ) const { return path_; }
    const std::string & version( void ) const { return version_; }
    const HTTPFields & fields( void ) const { return fields_; }

    bool has_field( const std::string & name ) const;
    const std::string & get_field( const std::string & name ) const;

    /* does the client wait for a 100 (Continue) before sending the body? */
    bool expects_continue( void ) const;

    /* "METHOD path version" */
    std::string request_line( void ) const;
};

class HTTPRequest
{
private:
    HTTPRequestHeader header_;
    std::string body_;

public:
    HTTPRequest() : header_(), body_() {}
    HTTPRequest( const HTTPRequestHeader & header, const std::string & body );

    const HTTPRequestHeader & header( void ) const { return header_; }
    const std::string & body( void ) const { return body_; }

    /* request line, header lines, blank line, body */
    std::string str( void ) const;

    HTTPRequest( const TinyHTTPProtobufs::HTTPRequest & proto );
    TinyHTTPProtobufs::HTTPRequest toprotobuf( void ) const;
};

#endif /* HTTP_REQUEST_HH */
