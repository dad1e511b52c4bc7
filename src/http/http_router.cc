/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "http_router.hh"
#include "util.hh"

using namespace std;

vector< string > HTTPRouter::split_path( const string & path )
{
    vector< string > ret;

    for ( const auto & segment : split( path, "/" ) ) {
        if ( not segment.empty() ) {
            ret.push_back( segment );
        }
    }

    return ret;
}

bool HTTPRouter::segment_matches( const string & pattern_segment,
                                  const string & requested_segment )
{
    return pattern_segment.front() == ':' or pattern_segment == requested_segment;
}

void HTTPRouter::add_route( const string & method, const string & pattern, const RouteHandler & handler )
{
    if ( not handler ) {
        throw runtime_error( "HTTPRouter: empty handler for " + method + " " + pattern );
    }

    routes_.push_back( Route { method, pattern, split_path( pattern ), handler } );
}

const HTTPRouter::Route * HTTPRouter::find_route( const string & method, const string & path,
                                                  RouteParameters & parameters ) const
{
    const vector< string > requested = split_path( path );

    for ( const auto & route : routes_ ) {
        if ( route.method != method or route.segments.size() != requested.size() ) {
            continue;
        }

        bool matches = true;
        for ( size_t i = 0; i < requested.size(); i++ ) {
            if ( not segment_matches( route.segments.at( i ), requested.at( i ) ) ) {
                matches = false;
                break;
            }
        }

        if ( not matches ) {
            continue;
        }

        parameters.clear();
        for ( size_t i = 0; i < requested.size(); i++ ) {
            if ( route.segments.at( i ).front() == ':' ) {
                parameters[ route.segments.at( i ).substr( 1 ) ] = requested.at( i );
            }
        }

        return &route;
    }

    return nullptr;
}

bool HTTPRouter::match( const string & method, const string & path,
                        string & matched_pattern, RouteParameters & parameters ) const
{
    const Route * const route = find_route( method, path, parameters );
    if ( not route ) {
        return false;
    }

    matched_pattern = route->pattern;
    return true;
}

HTTPResponse HTTPRouter::handle( const HTTPRequest & request ) const
{
    RouteParameters parameters;
    const Route * const route = find_route( request.header().method(), request.header().path(), parameters );

    if ( not route ) {
        return HTTPResponse();
    }

    return route->handler( request, parameters );
}
