/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef UTIL_HH
#define UTIL_HH

#include <string>
#include <cstring>
#include <vector>

template <typename T> void zero( T & x ) { memset( &x, 0, sizeof( x ) ); }

/* strict string to integer conversion; throws on trailing garbage or overflow */
long int myatoi( const std::string & str, const int base = 10 );

/* split on every occurrence of separator; empty pieces are kept */
std::vector< std::string > split( const std::string & str, const std::string & separator );

/* does the buffer hold well-formed UTF-8 text? */
bool is_valid_utf8( const std::string & buffer );

/* compare two strings for (case-insensitive) equality,
   in ASCII without sensitivity to locale */
bool equivalent_strings( const std::string & a, const std::string & b );

/* directory must end in '/'; entries are returned with the directory prepended */
std::vector< std::string > list_directory_contents( const std::string & dir );

#endif /* UTIL_HH */
