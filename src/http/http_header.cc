/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "http_header.hh"

using namespace std;

HTTPHeader::HTTPHeader( const string & key, const string & value )
    : key_( key ), value_( value )
{
}

HTTPHeader::HTTPHeader( const TinyHTTPProtobufs::HTTPHeader & proto )
    : key_( proto.key() ), value_( proto.value() )
{
}

TinyHTTPProtobufs::HTTPHeader HTTPHeader::toprotobuf( void ) const
{
    TinyHTTPProtobufs::HTTPHeader ret;

    ret.set_key( key_ );
    ret.set_value( value_ );

    return ret;
}
