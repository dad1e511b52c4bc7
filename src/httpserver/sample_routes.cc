/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include "sample_routes.hh"
#include "json_parser.hh"
#include "json_formatter.hh"
#include "exception.hh"

using namespace std;

static HTTPResponse parameters_as_json( const HTTPRequest &, const RouteParameters & parameters )
{
    JSONValue::Object members;
    for ( const auto & x : parameters ) {
        members[ x.first ] = JSONValue::text( x.second );
    }

    HTTPResponse response;
    response.set_content_type( "application/json" );
    response.set_body( format_json( JSONValue::object( members ) ) );
    return response;
}

static HTTPResponse echo_json( const HTTPRequest & request, const RouteParameters & )
{
    HTTPResponse response;

    try {
        const JSONValue document = parse_json( request.body() );
        response.set_content_type( "application/json" );
        response.set_body( format_json( document ) );
    } catch ( const json_syntax_error & e ) {
        response.set_status( 400 );
        response.set_content_type( "text/plain" );
        response.set_body( string( e.what() ) + "\n" );
    }

    return response;
}

void add_sample_routes( HTTPRouter & router )
{
    router.get( "/", parameters_as_json );
    router.get( "/sample", parameters_as_json );
    router.get( "/schools/:id/classes", parameters_as_json );
    router.get( "/schools/:id/:score/classes/:disco", parameters_as_json );
    router.post( "/echo", echo_json );
}
