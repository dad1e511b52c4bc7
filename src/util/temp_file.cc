/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cstdlib>
#include <unistd.h>

#include "temp_file.hh"
#include "exception.hh"

using namespace std;

static vector<char> to_mutable( const string & str )
{
    vector< char > ret;
    for ( const auto & ch : str ) {
        ret.push_back( ch );
    }
    ret.push_back( 0 ); /* null terminate */

    return ret;
}

UniqueFile::UniqueFile( const string & filename_prefix )
    : mutable_temp_filename_( to_mutable( filename_prefix + ".XXXXXX" ) ),
      fd_( SystemCall( "mkstemp " + filename_prefix, mkstemp( &mutable_temp_filename_[ 0 ] ) ) )
{}

string UniqueFile::name( void ) const
{
    return string( mutable_temp_filename_.begin(), mutable_temp_filename_.end() - 1 );
}

void UniqueFile::write( const string & contents )
{
    fd_.write( contents );
}
