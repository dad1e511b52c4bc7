/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cstdlib>
#include <iostream>

#include "backing_store.hh"
#include "http_request.hh"
#include "http_response.hh"
#include "exception.hh"

using namespace std;

int main( int argc, char *argv[] )
{
    try {
        if ( argc != 2 ) {
            cerr << "Usage: " << argv[ 0 ] << " RECORD" << endl;
            return EXIT_FAILURE;
        }

        const TinyHTTPProtobufs::RequestResponse record = HTTPDiskStore::load_record( argv[ 1 ] );

        cout << "client: " << record.client_ip() << ":" << record.client_port() << endl;
        cout << "timestamp: " << record.timestamp() << endl << endl;

        cout << HTTPRequest( record.request() ).str() << endl;
        cout << HTTPResponse( record.response() ).str() << endl;
    } catch ( const exception & e ) {
        print_exception( e );
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
