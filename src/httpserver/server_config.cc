/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <getopt.h>

#include <iostream>
#include <stdexcept>
#include <limits>

#include "server_config.hh"
#include "util.hh"

using namespace std;

void usage_error( const string & program_name )
{
    cerr << "Usage: " << program_name << " [OPTION]..." << endl;
    cerr << endl;
    cerr << "Options = --address=IP            (default 0.0.0.0)" << endl;
    cerr << "          --port=PORT             (default 8080)" << endl;
    cerr << "          --threaded              serve each connection on its own thread" << endl;
    cerr << "          --record-folder=DIR     save every request/response pair in DIR" << endl;
    cerr << "          --verbose               log every request" << endl;

    throw runtime_error( "invalid arguments" );
}

static uint16_t parse_port( const string & program_name, const string & text )
{
    long int port = -1;

    try {
        port = myatoi( text );
    } catch ( const exception & e ) {
        cerr << program_name << ": invalid port \"" << text << "\"" << endl;
        usage_error( program_name );
    }

    if ( port <= 0 or port > numeric_limits<uint16_t>::max() ) {
        cerr << program_name << ": port out of range: " << text << endl;
        usage_error( program_name );
    }

    return port;
}

ServerConfig parse_server_config( const int argc, char * const argv[] )
{
    if ( argc <= 0 ) {
        throw runtime_error( "missing argv[ 0 ]: argc <= 0" );
    }

    const string program_name = argv[ 0 ];

    const option command_line_options[] = {
        { "address",       required_argument, nullptr, 'a' },
        { "port",          required_argument, nullptr, 'p' },
        { "threaded",            no_argument, nullptr, 't' },
        { "record-folder", required_argument, nullptr, 'r' },
        { "verbose",             no_argument, nullptr, 'v' },
        { 0,                               0, nullptr, 0 }
    };

    ServerConfig config;

    /* start over in case the command line has been parsed before */
    optind = 0;

    while ( true ) {
        const int opt = getopt_long( argc, argv, "a:p:tr:v", command_line_options, nullptr );
        if ( opt == -1 ) { /* end of options */
            break;
        }

        switch ( opt ) {
        case 'a':
            config.address = optarg;
            break;
        case 'p':
            config.port = parse_port( program_name, optarg );
            break;
        case 't':
            config.threaded = true;
            break;
        case 'r':
            config.record_folder = optarg;
            break;
        case 'v':
            config.verbose = true;
            break;
        default:
            usage_error( program_name );
            break;
        }
    }

    if ( optind != argc ) {
        cerr << program_name << ": unexpected argument \"" << argv[ optind ] << "\"" << endl;
        usage_error( program_name );
    }

    return config;
}
