/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_HEADER_HH
#define HTTP_HEADER_HH

#include <string>
#include <map>

#include "tinyhttp_record.pb.h"

/* one "Key: value" header line */
class HTTPHeader
{
private:
    std::string key_, value_;

public:
    HTTPHeader( const std::string & key, const std::string & value );

    const std::string & key( void ) const { return key_; }
    const std::string & value( void ) const { return value_; }

    std::string str( void ) const { return key_ + ": " + value_; }

    HTTPHeader( const TinyHTTPProtobufs::HTTPHeader & proto );
    TinyHTTPProtobufs::HTTPHeader toprotobuf( void ) const;
};

/* header fields keyed by name; a later field with the same name replaces an earlier one */
typedef std::map< std::string, std::string > HTTPFields;

#endif /* HTTP_HEADER_HH */
