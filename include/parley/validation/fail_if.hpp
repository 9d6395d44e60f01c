////////////////////////////////////////////////////////////////////////////////
/// Guard-clause precondition helpers.
///
/// Every helper returns its subject on success so checks chain:
///   auto const & name{ fail_if_null_or_empty( raw_name, "name" ) };
///   auto const   port{ fail_if_outside_range( fail_if_null( p_cfg, "cfg" )->port, 1, 65535, "port" ) };
/// An lvalue subject is returned by reference, an rvalue one by value.
///
/// Failures are reported by throwing (see error/error.hpp); the throw sites
/// live out of line in cold functions so the checks inline to a compare and a
/// predicted-not-taken branch.
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
#pragma once

#include <parley/error/error.hpp>
#include <parley/nullable.hpp>
#include <parley/sequence/search.hpp>

#include <boost/assert.hpp>
#include <boost/lexical_cast.hpp>

#include <concepts>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

/// Callables producing the exception to throw. Returning a null
/// exception_ptr is a bug in the factory and is reported as
/// internal_inconsistency.
template <typename F>
concept failure_factory =
    std::invocable<F &> &&
    std::convertible_to<std::invoke_result_t<F &>, std::exception_ptr>;

template <typename P, typename T>
concept predicate_for = std::predicate<P &, std::remove_reference_t<T> const &>;

/// Convenience failure_factory body:
///   fail_if( x, x > limit, []{ return make_failure<std::overflow_error>( "x" ); } )
template <typename Exception, typename ... Args>
[[ nodiscard ]] std::exception_ptr make_failure( Args && ... args )
{
    return std::make_exception_ptr( Exception( std::forward<Args>( args )... ) );
}


namespace detail
{
    template <typename F>
    constexpr void check_not_null( F const & callable, std::string_view const param_name )
    {
        if ( is_null( callable ) ) [[ unlikely ]]
            throw_argument_null( param_name );
    }

    template <typename F>
    [[ noreturn ]] void raise( F & factory )
    {
        rethrow( std::invoke( factory ) );
    }

    template <typename T>
    [[ nodiscard ]] std::string to_text( T const & value )
    {
        return boost::lexical_cast<std::string>( value );
    }
} // namespace detail


//==============================================================================
// fail_if
//==============================================================================

template <typename T>
constexpr T fail_if( T && value, bool const condition, std::string_view const param_name )
{
    if ( condition ) [[ unlikely ]]
        detail::throw_failed_condition( param_name );
    return std::forward<T>( value );
}

template <typename T, predicate_for<T> Predicate>
constexpr T fail_if( T && value, Predicate && predicate, std::string_view const param_name )
{
    detail::check_not_null( predicate, "condition" );
    bool const condition{ std::invoke( predicate, std::as_const( value ) ) };
    return fail_if( std::forward<T>( value ), condition, param_name );
}

template <typename T, failure_factory Factory>
constexpr T fail_if( T && value, bool const condition, Factory && factory )
{
    detail::check_not_null( factory, "failure_factory" );
    if ( condition ) [[ unlikely ]]
        detail::raise( factory );
    return std::forward<T>( value );
}

template <typename T, predicate_for<T> Predicate, failure_factory Factory>
constexpr T fail_if( T && value, Predicate && predicate, Factory && factory )
{
    detail::check_not_null( predicate, "condition" );
    bool const condition{ std::invoke( predicate, std::as_const( value ) ) };
    return fail_if( std::forward<T>( value ), condition, std::forward<Factory>( factory ) );
}


//==============================================================================
// Absent values
//==============================================================================

/// Throws argument_null_error when value is absent. Values of non-nullable
/// types are never absent and pass through.
template <typename T>
constexpr T fail_if_null( T && value, std::string_view const param_name )
{
    if ( is_null( value ) ) [[ unlikely ]]
        detail::throw_argument_null( param_name );
    return std::forward<T>( value );
}

template <typename T, failure_factory Factory>
constexpr T fail_if_null( T && value, Factory && factory )
{
    bool const absent{ is_null( value ) };
    return fail_if( std::forward<T>( value ), absent, std::forward<Factory>( factory ) );
}

/// Throws argument_error when a string or sequence is absent or empty.
template <emptiable T>
constexpr T fail_if_null_or_empty( T && value, std::string_view const param_name )
{
    if ( is_null_or_empty( value ) ) [[ unlikely ]]
        detail::throw_null_or_empty( param_name );
    return std::forward<T>( value );
}

template <emptiable T, failure_factory Factory>
constexpr T fail_if_null_or_empty( T && value, Factory && factory )
{
    bool const null_or_empty{ is_null_or_empty( value ) };
    return fail_if( std::forward<T>( value ), null_or_empty, std::forward<Factory>( factory ) );
}

/// Throws argument_error when any element of the sequence is absent. An
/// absent sequence has no absent elements (combine with fail_if_null to
/// reject it as well).
template <sequence_argument S>
constexpr S fail_if_contains_null( S && sequence, std::string_view const param_name )
{
    if ( contains_null( sequence ) ) [[ unlikely ]]
        detail::throw_contains_null( param_name );
    return std::forward<S>( sequence );
}

template <sequence_argument S, failure_factory Factory>
constexpr S fail_if_contains_null( S && sequence, Factory && factory )
{
    bool const has_null{ contains_null( sequence ) };
    return fail_if( std::forward<S>( sequence ), has_null, std::forward<Factory>( factory ) );
}


//==============================================================================
// Numeric bounds
//==============================================================================

template <typename T>
concept arithmetic = std::is_arithmetic_v<std::remove_cvref_t<T>> && !std::same_as<std::remove_cvref_t<T>, bool>;

template <arithmetic T>
constexpr T fail_if_negative( T && value, std::string_view const param_name )
{
    if constexpr ( std::is_signed_v<std::remove_cvref_t<T>> )
    {
        if ( value < 0 ) [[ unlikely ]]
            detail::throw_failed_condition( param_name );
    }
    return std::forward<T>( value );
}

template <arithmetic T>
constexpr T fail_if_not_positive( T && value, std::string_view const param_name )
{
    if ( value <= 0 ) [[ unlikely ]]
        detail::throw_failed_condition( param_name );
    return std::forward<T>( value );
}

/// Throws argument_out_of_range unless min <= value <= max.
template <arithmetic T>
constexpr T fail_if_outside_range
(
    T && value,
    std::type_identity_t<std::remove_cvref_t<T>> const min_value,
    std::type_identity_t<std::remove_cvref_t<T>> const max_value,
    std::string_view const param_name
)
{
    BOOST_ASSERT_MSG( !( max_value < min_value ), "Empty range" );
    if ( value < min_value || value > max_value ) [[ unlikely ]]
        detail::throw_outside_range( param_name, detail::to_text( value ), detail::to_text( min_value ), detail::to_text( max_value ) );
    return std::forward<T>( value );
}


//==============================================================================
// Type requirements (checked at compile time)
//==============================================================================

/// A variable of type To can be assigned a From.
template <typename From, typename To>
concept assignable_to = std::assignable_from<To &, From>;

/// Passes value through if it can be assigned to a Target; anything else
/// does not compile.
template <typename Target, typename T>
requires assignable_to<T, Target>
constexpr T fail_if_not_assignable_to( T && value, std::string_view /*param_name*/ ) noexcept
{
    return std::forward<T>( value );
}

/// Compiles only for default constructible types; yields the type tag so the
/// check can be used in expressions.
template <typename T>
requires std::default_initializable<T>
constexpr std::type_identity<T> fail_if_missing_default_constructor( std::string_view /*param_name*/ ) noexcept
{
    return {};
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
