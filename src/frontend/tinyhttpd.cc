/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cstdlib>
#include <iostream>
#include <memory>

#include "server_config.hh"
#include "http_server.hh"
#include "sample_routes.hh"
#include "backing_store.hh"
#include "exception.hh"

using namespace std;

int main( int argc, char *argv[] )
{
    try {
        const ServerConfig config = parse_server_config( argc, argv );

        HTTPRouter router;
        add_sample_routes( router );

        unique_ptr<HTTPDiskStore> disk_store;
        if ( not config.record_folder.empty() ) {
            disk_store.reset( new HTTPDiskStore( config.record_folder ) );
            cerr << "Recording exchanges in " << disk_store->record_folder() << endl;
        }

        HTTPServer server( config, router, disk_store.get() );
        server.loop();
    } catch ( const exception & e ) {
        print_exception( e );
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
