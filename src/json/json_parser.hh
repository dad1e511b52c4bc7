/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef JSON_PARSER_HH
#define JSON_PARSER_HH

#include <string>

#include "json_value.hh"

/* Recursive-descent JSON reader over an immutable input with one cursor.

   This is deliberately not a full JSON implementation:
   - the top level must be an object or an array
   - commas between elements are optional
   - backslash escapes are not decoded; a backslash only keeps
     the next character from ending the string
   - numbers have no exponent; a '.' anywhere in the span makes a float

   Throws json_syntax_error on malformed input. */
class JSONParser
{
private:
    const std::string json_;
    size_t cursor_;

    bool at_end( void ) const { return cursor_ >= json_.size(); }
    char current( void ) const { return json_.at( cursor_ ); }

    void skip_whitespace( void );

    JSONValue parse_value( void );
    JSONValue parse_object( void );
    JSONValue parse_array( void );
    std::string parse_string( void );
    JSONValue parse_scalar( void );

public:
    explicit JSONParser( const std::string & json );

    /* parse the whole document; text after the top-level value is ignored */
    JSONValue parse( void );

    size_t cursor( void ) const { return cursor_; }

    static bool is_whitespace( const char ch );
};

/* convenience wrapper */
JSONValue parse_json( const std::string & json );

#endif /* JSON_PARSER_HH */
