/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EXCEPTION_HH
#define EXCEPTION_HH

#include <system_error>
#include <stdexcept>
#include <iostream>
#include <typeinfo>
#include <memory>
#include <cstdlib>

#include <cxxabi.h>

class tagged_error : public std::system_error
{
private:
    std::string attempt_and_error_;

public:
    tagged_error( const std::error_category & category,
                  const std::string & s_attempt,
                  const int error_code )
        : system_error( error_code, category ),
          attempt_and_error_( s_attempt + ": " + std::system_error::what() )
    {}

    const char * what( void ) const noexcept override
    {
        return attempt_and_error_.c_str();
    }
};

class unix_error : public tagged_error
{
public:
    unix_error( const std::string & s_attempt,
                const int s_errno = errno )
        : tagged_error( std::system_category(), s_attempt, s_errno )
    {}
};

/* a JSON document that the parser cannot make sense of */
class json_syntax_error : public std::runtime_error
{
public:
    json_syntax_error( const std::string & s_what, const size_t s_position )
        : runtime_error( s_what + " at offset " + std::to_string( s_position ) ),
          position_( s_position )
    {}

    size_t position( void ) const { return position_; }

private:
    size_t position_;
};

/* a JSONValue the formatter does not know how to render */
class json_unsupported_type : public std::runtime_error
{
public:
    json_unsupported_type( const std::string & s_what )
        : runtime_error( s_what )
    {}
};

/* raw bytes of a request that cannot be read as text */
class incomplete_request_data : public std::runtime_error
{
public:
    incomplete_request_data( const std::string & s_what )
        : runtime_error( s_what )
    {}
};

inline void print_exception( const std::exception & e, std::ostream & output = std::cerr )
{
    struct Free {
        void operator()( char * x ) const { free( x ); }
    };

    int status = 0;
    std::unique_ptr<char, Free> demangled { abi::__cxa_demangle( typeid( e ).name(), nullptr, nullptr, &status ) };

    output << "Died on " << ( demangled ? demangled.get() : typeid( e ).name() ) << ": " << e.what() << std::endl;
}

/* error-checking wrapper for most syscalls */
inline int SystemCall( const std::string & s_attempt, const int return_value )
{
    if ( return_value >= 0 ) {
        return return_value;
    }

    throw unix_error( s_attempt );
}

#endif
