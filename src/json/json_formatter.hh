/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef JSON_FORMATTER_HH
#define JSON_FORMATTER_HH

#include <string>

#include "json_value.hh"

/* Render a value as compact JSON text (no inserted whitespace).
   Strings are quoted but not escaped, the mirror image of JSONParser.
   Throws json_unsupported_type for anything that has no JSON rendering. */
std::string format_json( const JSONValue & value );

/* shortest decimal text that reads back as the same double, always with a '.' */
std::string format_float( const double value );

#endif /* JSON_FORMATTER_HH */
