/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>

#include "backing_store.hh"
#include "temp_file.hh"
#include "file_descriptor.hh"
#include "timestamp.hh"
#include "exception.hh"

using namespace std;

TinyHTTPProtobufs::RequestResponse HTTPBackingStore::make_record( const HTTPRequest & request,
                                                                  const HTTPResponse & response,
                                                                  const Address & client_address )
{
    TinyHTTPProtobufs::RequestResponse ret;

    ret.set_client_ip( client_address.ip() );
    ret.set_client_port( client_address.port() );
    ret.set_timestamp( timestamp() );
    ret.mutable_request()->CopyFrom( request.toprotobuf() );
    ret.mutable_response()->CopyFrom( response.toprotobuf() );

    return ret;
}

HTTPDiskStore::HTTPDiskStore( const string & record_folder )
    : record_folder_( record_folder ),
      mutex_()
{
    if ( record_folder_.empty() ) {
        throw runtime_error( "HTTPDiskStore: empty record folder" );
    }

    if ( record_folder_.back() != '/' ) {
        record_folder_.push_back( '/' );
    }

    struct stat info;
    SystemCall( "stat " + record_folder_, stat( record_folder_.c_str(), &info ) );
    if ( not S_ISDIR( info.st_mode ) ) {
        throw runtime_error( "HTTPDiskStore: not a directory: " + record_folder_ );
    }
}

void HTTPDiskStore::save( const HTTPRequest & request, const HTTPResponse & response,
                          const Address & client_address )
{
    unique_lock<mutex> ul( mutex_ );

    string serialized;
    if ( not make_record( request, response, client_address ).SerializeToString( &serialized ) ) {
        throw runtime_error( "HTTPDiskStore: failure to serialize HTTP request/response pair" );
    }

    /* output file to write current request/response pair protobuf (user has all permissions) */
    UniqueFile file( record_folder_ + "save" );
    file.write( serialized );
}

TinyHTTPProtobufs::RequestResponse HTTPDiskStore::load_record( const string & filename )
{
    FileDescriptor fd( SystemCall( "open " + filename, open( filename.c_str(), O_RDONLY ) ) );

    TinyHTTPProtobufs::RequestResponse ret;
    if ( not ret.ParseFromFileDescriptor( fd.fd_num() ) ) {
        throw runtime_error( filename + ": invalid HTTP request/response record" );
    }

    return ret;
}

HTTPMemoryStore::HTTPMemoryStore()
    : mutex_(),
      exchanges_()
{}

void HTTPMemoryStore::save( const HTTPRequest & request, const HTTPResponse & response,
                            const Address & client_address )
{
    unique_lock<mutex> ul( mutex_ );

    exchanges_.add_exchange()->CopyFrom( make_record( request, response, client_address ) );
}

TinyHTTPProtobufs::BulkMessage HTTPMemoryStore::exchanges( void ) const
{
    unique_lock<mutex> ul( mutex_ );

    return exchanges_;
}
