/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "json_value.hh"

using namespace std;

JSONValue::JSONValue( const Type type )
    : type_( type ),
      bool_( false ),
      int_( 0 ),
      float_( 0 ),
      text_(),
      array_(),
      object_()
{}

JSONValue::JSONValue()
    : JSONValue( NULL_VALUE )
{}

JSONValue JSONValue::boolean( const bool value )
{
    JSONValue ret( BOOL );
    ret.bool_ = value;
    return ret;
}

JSONValue JSONValue::integer( const int64_t value )
{
    JSONValue ret( INT );
    ret.int_ = value;
    return ret;
}

JSONValue JSONValue::floating( const double value )
{
    JSONValue ret( FLOAT );
    ret.float_ = value;
    return ret;
}

JSONValue JSONValue::text( const string & value )
{
    JSONValue ret( TEXT );
    ret.text_ = make_shared< const string >( value );
    return ret;
}

JSONValue JSONValue::array( const Array & elements )
{
    JSONValue ret( ARRAY );
    ret.array_ = make_shared< const Array >( elements );
    return ret;
}

JSONValue JSONValue::object( const Object & members )
{
    JSONValue ret( OBJECT );
    ret.object_ = make_shared< const Object >( members );
    return ret;
}

void JSONValue::check_type( const Type expected ) const
{
    if ( type_ != expected ) {
        throw runtime_error( "JSONValue: expected " + type_name( expected )
                             + ", have " + type_name( type_ ) );
    }
}

bool JSONValue::as_bool( void ) const
{
    check_type( BOOL );
    return bool_;
}

int64_t JSONValue::as_int( void ) const
{
    check_type( INT );
    return int_;
}

double JSONValue::as_float( void ) const
{
    check_type( FLOAT );
    return float_;
}

const string & JSONValue::as_text( void ) const
{
    check_type( TEXT );
    return *text_;
}

const JSONValue::Array & JSONValue::as_array( void ) const
{
    check_type( ARRAY );
    return *array_;
}

const JSONValue::Object & JSONValue::as_object( void ) const
{
    check_type( OBJECT );
    return *object_;
}

bool JSONValue::operator==( const JSONValue & other ) const
{
    if ( type_ != other.type_ ) {
        return false;
    }

    switch ( type_ ) {
    case NULL_VALUE:
        return true;
    case BOOL:
        return bool_ == other.bool_;
    case INT:
        return int_ == other.int_;
    case FLOAT:
        return float_ == other.float_;
    case TEXT:
        return *text_ == *other.text_;
    case ARRAY:
        return *array_ == *other.array_;
    case OBJECT:
        return *object_ == *other.object_;
    }

    throw runtime_error( "JSONValue: unknown type tag " + to_string( type_ ) );
}

string JSONValue::type_name( const Type type )
{
    switch ( type ) {
    case NULL_VALUE: return "null";
    case BOOL: return "bool";
    case INT: return "int";
    case FLOAT: return "float";
    case TEXT: return "text";
    case ARRAY: return "array";
    case OBJECT: return "object";
    }

    return "unknown (" + to_string( type ) + ")";
}
