/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef SERVER_CONFIG_HH
#define SERVER_CONFIG_HH

#include <string>
#include <cstdint>

struct ServerConfig
{
    std::string address { "0.0.0.0" };
    uint16_t port { 8080 };

    /* serve each connection on its own thread instead of one at a time */
    bool threaded { false };

    /* save every exchange here as a protobuf file; empty means don't */
    std::string record_folder {};

    /* log every request */
    bool verbose { false };
};

/* parse the command line; prints usage and throws std::runtime_error on bad input */
ServerConfig parse_server_config( const int argc, char * const argv[] );

void usage_error( const std::string & program_name );

#endif /* SERVER_CONFIG_HH */
