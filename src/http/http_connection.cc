/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <iostream>

#include "http_connection.hh"
#include "http_request_parser.hh"
#include "exception.hh"
#include "util.hh"

using namespace std;

HTTPConnection::HTTPConnection( const HTTPRouter & router,
                                HTTPBackingStore * const backing_store,
                                const Address & client_address,
                                const bool verbose )
    : router_( router ),
      backing_store_( backing_store ),
      client_address_( client_address ),
      verbose_( verbose )
{}

string HTTPConnection::on_data( const string & chunk )
{
    try {
        switch ( state_ ) {
        case IDLE:
            return on_request_bytes( chunk );
        case PENDING_CONTINUATION:
            return on_continuation_body( chunk );
        }
    } catch ( const incomplete_request_data & e ) {
        print_exception( e );
    } catch ( const json_syntax_error & e ) {
        print_exception( e );
    } catch ( const json_unsupported_type & e ) {
        print_exception( e );
    }

    /* drop this message, keep the connection */
    return string();
}

string HTTPConnection::on_request_bytes( const string & chunk )
{
    const HTTPRequest request = HTTPRequestParser( chunk ).parse();

    if ( request.header().expects_continue() ) {
        pending_header_ = request.header();
        state_ = PENDING_CONTINUATION;

        if ( verbose_ ) {
            cerr << client_address_.str() << " " << pending_header_.request_line()
                 << ": waiting for body" << endl;
        }

        HTTPResponse interim;
        interim.set_status( 100 );
        return interim.str();
    }

    return dispatch( request );
}

string HTTPConnection::on_continuation_body( const string & chunk )
{
    /* whatever happens, the held header is used up */
    const HTTPRequestHeader header = pending_header_;
    pending_header_ = HTTPRequestHeader();
    state_ = IDLE;

    if ( not is_valid_utf8( chunk ) ) {
        throw incomplete_request_data( "body of " + header.request_line() + " is not UTF-8 text" );
    }

    return dispatch( HTTPRequest( header, chunk ) );
}

string HTTPConnection::dispatch( const HTTPRequest & request )
{
    const HTTPResponse response = router_.handle( request );

    if ( verbose_ ) {
        cerr << client_address_.str() << " " << request.header().request_line()
             << " -> " << response.status() << " " << response.reason() << endl;
    }

    if ( backing_store_ ) {
        backing_store_->save( request, response, client_address_ );
    }

    return response.str();
}
