/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef JSON_VALUE_HH
#define JSON_VALUE_HH

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <memory>

/* immutable JSON value: exactly one of seven variants */
class JSONValue
{
public:
    enum Type { NULL_VALUE, BOOL, INT, FLOAT, TEXT, ARRAY, OBJECT };

    typedef std::vector< JSONValue > Array;
    typedef std::map< std::string, JSONValue > Object;

private:
    Type type_;

    bool bool_;
    int64_t int_;
    double float_;

    /* payloads are shared between copies; nothing mutates them after construction */
    std::shared_ptr< const std::string > text_;
    std::shared_ptr< const Array > array_;
    std::shared_ptr< const Object > object_;

    explicit JSONValue( const Type type );

    void check_type( const Type expected ) const;

public:
    /* null */
    JSONValue();

    static JSONValue null( void ) { return JSONValue(); }
    static JSONValue boolean( const bool value );
    static JSONValue integer( const int64_t value );
    static JSONValue floating( const double value );
    static JSONValue text( const std::string & value );
    static JSONValue array( const Array & elements );
    static JSONValue object( const Object & members );

    Type type( void ) const { return type_; }
    bool is_null( void ) const { return type_ == NULL_VALUE; }

    /* typed accessors throw std::runtime_error on a variant mismatch */
    bool as_bool( void ) const;
    int64_t as_int( void ) const;
    double as_float( void ) const;
    const std::string & as_text( void ) const;
    const Array & as_array( void ) const;
    const Object & as_object( void ) const;

    /* deep comparison; values of different variants are never equal */
    bool operator==( const JSONValue & other ) const;
    bool operator!=( const JSONValue & other ) const { return not operator==( other ); }

    static std::string type_name( const Type type );
};

#endif /* JSON_VALUE_HH */
