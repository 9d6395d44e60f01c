////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#include <parley/error/error.hpp>

#include <boost/assert.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

namespace
{
    std::string quoted_argument( std::string_view const param_name )
    {
        std::string message{ "Argument '" };
        message.append( param_name );
        message += '\'';
        return message;
    }
} // anonymous namespace

char const * to_string( errc const kind ) noexcept
{
    switch ( kind )
    {
        case errc::invalid_argument      : return "invalid argument";
        case errc::out_of_range          : return "out of range";
        case errc::not_found             : return "not found";
        case errc::internal_inconsistency: return "internal inconsistency";
    }
    BOOST_ASSERT_MSG( false, "Unknown parley::errc value" );
    return "unknown";
}

argument_error::argument_error( std::string param_name, std::string const & message )
    : argument_error( errc::invalid_argument, std::move( param_name ), message ) {}

argument_error::argument_error( errc const kind, std::string param_name, std::string const & message )
    :
    std::invalid_argument{ message },
    error                { kind },
    param_name_          { std::move( param_name ) }
{}

argument_null_error::argument_null_error( std::string param_name )
    : argument_error( param_name, "Value cannot be null. (Parameter '" + param_name + "')" ) {}

argument_out_of_range::argument_out_of_range( std::string param_name, std::string actual_value, std::string const & message )
    :
    argument_error( errc::out_of_range, std::move( param_name ), message + " Actual value: " + actual_value + '.' ),
    actual_value_ { std::move( actual_value ) }
{}

not_found_error::not_found_error( std::string const & message )
    : std::runtime_error{ message }, error{ errc::not_found } {}

internal_inconsistency::internal_inconsistency( std::string const & message )
    : std::logic_error{ message }, error{ errc::internal_inconsistency } {}


namespace detail
{
    void throw_failed_condition( std::string_view const param_name )
    {
        throw argument_error( std::string{ param_name }, quoted_argument( param_name ) + " failed condition." );
    }

    void throw_argument_null( std::string_view const param_name )
    {
        throw argument_null_error( std::string{ param_name } );
    }

    void throw_null_or_empty( std::string_view const param_name )
    {
        throw argument_error( std::string{ param_name }, quoted_argument( param_name ) + " cannot be null or empty." );
    }

    void throw_contains_null( std::string_view const param_name )
    {
        throw argument_error( std::string{ param_name }, quoted_argument( param_name ) + " cannot contain null elements." );
    }

    void throw_empty( std::string_view const param_name )
    {
        std::string message{ param_name };
        message += " cannot be empty";
        throw argument_error( std::string{ param_name }, message );
    }

    void throw_outside_range( std::string_view const param_name, std::string actual, std::string_view const min, std::string_view const max )
    {
        auto message{ quoted_argument( param_name ) };
        message += " must be within the range ";
        message.append( min );
        message += " - ";
        message.append( max );
        message += " (inclusive).";
        throw argument_out_of_range( std::string{ param_name }, std::move( actual ), message );
    }

    void throw_factory_returned_null()
    {
        throw internal_inconsistency( "failure_factory returned null when it should have returned an exception." );
    }

    void throw_not_found    ( std::string const & message ) { throw not_found_error       ( message ); }
    void throw_inconsistency( std::string const & message ) { throw internal_inconsistency( message ); }

    void rethrow( std::exception_ptr const & failure )
    {
        if ( !failure )
            throw_factory_returned_null();
        std::rethrow_exception( failure );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
