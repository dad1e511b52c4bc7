/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef BACKING_STORE_HH
#define BACKING_STORE_HH

#include <string>
#include <mutex>

#include "http_request.hh"
#include "http_response.hh"
#include "address.hh"
#include "tinyhttp_record.pb.h"

/* somewhere to keep the request/response pairs a server has answered;
   implementations must be safe to share across connection threads */
class HTTPBackingStore
{
public:
    virtual void save( const HTTPRequest & request, const HTTPResponse & response,
                       const Address & client_address ) = 0;
    virtual ~HTTPBackingStore() {}

    static TinyHTTPProtobufs::RequestResponse make_record( const HTTPRequest & request,
                                                           const HTTPResponse & response,
                                                           const Address & client_address );
};

/* one protobuf file per exchange, named RECORD_FOLDER/save.XXXXXX */
class HTTPDiskStore : public HTTPBackingStore
{
private:
    std::string record_folder_;
    std::mutex mutex_;

public:
    HTTPDiskStore( const std::string & record_folder );
    void save( const HTTPRequest & request, const HTTPResponse & response,
               const Address & client_address ) override;

    const std::string & record_folder( void ) const { return record_folder_; }

    /* read back one file written by save() */
    static TinyHTTPProtobufs::RequestResponse load_record( const std::string & filename );
};

/* keeps every exchange in memory, without limit; meant for tests and
   short-lived embedding, not for a long-running server */
class HTTPMemoryStore : public HTTPBackingStore
{
private:
    mutable std::mutex mutex_;
    TinyHTTPProtobufs::BulkMessage exchanges_;

public:
    HTTPMemoryStore();
    void save( const HTTPRequest & request, const HTTPResponse & response,
               const Address & client_address ) override;

    /* copy of everything saved so far */
    TinyHTTPProtobufs::BulkMessage exchanges( void ) const;
};

#endif /* BACKING_STORE_HH */
