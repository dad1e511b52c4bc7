/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_REQUEST_PARSER_HH
#define HTTP_REQUEST_PARSER_HH

#include <string>

#include "http_request.hh"

/* Splits the raw bytes of one request into header and body in a single
   forward pass. The header section ends at the first CR LF CR LF; whatever
   follows is the body. Throws incomplete_request_data if the bytes are not
   UTF-8 text. */
class HTTPRequestParser
{
private:
    const std::string raw_;
    size_t cursor_;

    /* end of the header section (the terminator, or the end of input) */
    size_t header_end_;

    bool in_header( void ) const { return cursor_ < header_end_; }
    size_t end_of_line( void ) const;

    void parse_request_line( std::string & method, std::string & path, std::string & version );
    void parse_fields( HTTPFields & fields );
    std::string parse_body( void );

public:
    explicit HTTPRequestParser( const std::string & raw );

    HTTPRequest parse( void );

    static const std::string TERMINATOR;
};

#endif /* HTTP_REQUEST_PARSER_HH */
