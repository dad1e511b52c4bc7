/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <sys/types.h>
#include <dirent.h>
#include <memory>
#include <algorithm>
#include <locale>
#include <cstdint>
#include <cstdlib>
#include <cerrno>

#include "util.hh"
#include "exception.hh"

using namespace std;

long int myatoi( const string & str, const int base )
{
    if ( str.empty() ) {
        throw runtime_error( "Invalid integer string: empty" );
    }

    char *end;

    errno = 0;
    const long int ret = strtol( str.c_str(), &end, base );

    if ( errno != 0 ) {
        throw unix_error( "strtol (" + str + ")" );
    } else if ( end != str.c_str() + str.size() ) {
        throw runtime_error( "Invalid integer: " + str );
    }

    return ret;
}

vector< string > split( const string & str, const string & separator )
{
    if ( separator.empty() ) {
        throw runtime_error( "split: empty separator" );
    }

    vector< string > ret;

    size_t start = 0;
    while ( true ) {
        const size_t next = str.find( separator, start );
        if ( next == string::npos ) {
            ret.push_back( str.substr( start ) );
            return ret;
        }

        ret.push_back( str.substr( start, next - start ) );
        start = next + separator.size();
    }
}

bool is_valid_utf8( const string & buffer )
{
    size_t i = 0;
    while ( i < buffer.size() ) {
        const unsigned char lead = buffer[ i ];

        size_t continuation_bytes;
        uint32_t code_point;

        if ( lead < 0x80 ) {
            i++;
            continue;
        } else if ( (lead & 0xE0) == 0xC0 ) {
            continuation_bytes = 1;
            code_point = lead & 0x1F;
        } else if ( (lead & 0xF0) == 0xE0 ) {
            continuation_bytes = 2;
            code_point = lead & 0x0F;
        } else if ( (lead & 0xF8) == 0xF0 ) {
            continuation_bytes = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if ( i + continuation_bytes >= buffer.size() ) {
            return false; /* truncated sequence */
        }

        for ( size_t j = 1; j <= continuation_bytes; j++ ) {
            const unsigned char byte = buffer[ i + j ];
            if ( (byte & 0xC0) != 0x80 ) {
                return false;
            }
            code_point = (code_point << 6) | (byte & 0x3F);
        }

        /* reject overlong encodings, surrogates, and out-of-range values */
        static const uint32_t minimum[] = { 0, 0x80, 0x800, 0x10000 };
        if ( code_point < minimum[ continuation_bytes ]
             or (code_point >= 0xD800 and code_point <= 0xDFFF)
             or code_point > 0x10FFFF ) {
            return false;
        }

        i += continuation_bytes + 1;
    }

    return true;
}

bool equivalent_strings( const string & a, const string & b )
{
    const locale C_locale;

    if ( a.size() != b.size() ) {
        return false;
    }

    for ( size_t i = 0; i < a.size(); i++ ) {
        if ( tolower( a[ i ], C_locale ) != tolower( b[ i ], C_locale ) ) {
            return false;
        }
    }

    return true;
}

vector< string > list_directory_contents( const string & dir )
{
    struct Closedir {
        void operator()( DIR *x ) const { SystemCall( "closedir", closedir( x ) ); }
    };

    unique_ptr< DIR, Closedir > dp( opendir( dir.c_str() ) );
    if ( not dp ) {
        throw unix_error( "opendir (" + dir + ")" );
    }

    vector< string > ret;
    while ( const dirent *dirp = readdir( dp.get() ) ) {
        if ( string( dirp->d_name ) != "." and string( dirp->d_name ) != ".." ) {
            ret.push_back( dir + dirp->d_name );
        }
    }

    sort( ret.begin(), ret.end() );

    return ret;
}
