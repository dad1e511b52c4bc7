/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef HTTP_ROUTER_HH
#define HTTP_ROUTER_HH

#include <string>
#include <vector>
#include <map>
#include <functional>

#include "http_request.hh"
#include "http_response.hh"

/* names bound by ':' segments of a route pattern */
typedef std::map< std::string, std::string > RouteParameters;

typedef std::function<HTTPResponse( const HTTPRequest & request,
                                    const RouteParameters & parameters )> RouteHandler;

/* Pattern table filled in at startup and only read afterwards.
   A pattern is split on '/' (empty segments dropped); a segment
   starting with ':' matches any one requested segment and binds it. */
class HTTPRouter
{
private:
    struct Route
    {
        std::string method;
        std::string pattern;
        std::vector< std::string > segments;
        RouteHandler handler;
    };

    std::vector< Route > routes_ {};

    static bool segment_matches( const std::string & pattern_segment,
                                 const std::string & requested_segment );

    /* first route matching method and path, or nullptr */
    const Route * find_route( const std::string & method, const std::string & path,
                              RouteParameters & parameters ) const;

public:
    HTTPRouter() {}

    void add_route( const std::string & method, const std::string & pattern, const RouteHandler & handler );

    void get( const std::string & pattern, const RouteHandler & handler ) { add_route( "GET", pattern, handler ); }
    void post( const std::string & pattern, const RouteHandler & handler ) { add_route( "POST", pattern, handler ); }
    void put( const std::string & pattern, const RouteHandler & handler ) { add_route( "PUT", pattern, handler ); }
    void del( const std::string & pattern, const RouteHandler & handler ) { add_route( "DELETE", pattern, handler ); }

    /* does the first route matching method and path exist? if so, fill in its parameters */
    bool match( const std::string & method, const std::string & path,
                std::string & matched_pattern, RouteParameters & parameters ) const;

    /* dispatch to the first matching route; a default response if none matches */
    HTTPResponse handle( const HTTPRequest & request ) const;

    size_t size( void ) const { return routes_.size(); }

    static std::vector< std::string > split_path( const std::string & path );
};

#endif /* HTTP_ROUTER_HH */
