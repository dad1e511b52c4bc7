/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_CONNECTION_HH
#define HTTP_CONNECTION_HH

#include <string>

#include "http_request.hh"
#include "http_response.hh"
#include "http_router.hh"
#include "backing_store.hh"
#include "address.hh"

/* Protocol state of one client connection.

   Each chunk read from the client goes through on_data(), and whatever it
   returns is written back. A request carrying "Expect: 100-continue" is
   answered with a 100 response and held; the next chunk is taken verbatim
   as its body and the completed request goes to the router. */
class HTTPConnection
{
public:
    enum State { IDLE, PENDING_CONTINUATION };

private:
    const HTTPRouter & router_;

    /* may be null */
    HTTPBackingStore * const backing_store_;

    const Address client_address_;

    State state_ { IDLE };

    /* valid while PENDING_CONTINUATION */
    HTTPRequestHeader pending_header_ {};

    bool verbose_;

    std::string dispatch( const HTTPRequest & request );

    std::string on_request_bytes( const std::string & chunk );
    std::string on_continuation_body( const std::string & chunk );

public:
    HTTPConnection( const HTTPRouter & router,
                    HTTPBackingStore * const backing_store = nullptr,
                    const Address & client_address = Address(),
                    const bool verbose = false );

    /* returns the bytes to send back; empty if nothing should be sent */
    std::string on_data( const std::string & chunk );

    State state( void ) const { return state_; }
    const HTTPRequestHeader & pending_header( void ) const { return pending_header_; }

    /* forbid copying */
    HTTPConnection( const HTTPConnection & other ) = delete;
    HTTPConnection & operator=( const HTTPConnection & other ) = delete;
};

#endif /* HTTP_CONNECTION_HH */
