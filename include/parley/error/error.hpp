////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
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

#include <parley/config.hpp>

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

enum class errc : std::uint8_t
{
    invalid_argument,
    out_of_range,
    not_found,
    internal_inconsistency
};

[[ nodiscard ]] char const * to_string( errc ) noexcept;

/// Common mixin of every exception parley throws: lets callers branch on the
/// failure kind with a single catch( parley::error const & ).
class error
{
public:
    [[ nodiscard ]] errc kind() const noexcept { return kind_; }

protected:
    explicit error( errc const kind ) noexcept : kind_{ kind } {}
    error( error const & ) = default;
    error & operator=( error const & ) = default;
    virtual ~error() = default;

private:
    errc kind_;
}; // class error


/// A precondition on a supplied value failed.
class argument_error
    :
    public std::invalid_argument,
    public error
{
public:
    argument_error( std::string param_name, std::string const & message );

    [[ nodiscard ]] std::string const & param_name() const noexcept { return param_name_; }

protected:
    argument_error( errc, std::string param_name, std::string const & message );

private:
    std::string param_name_;
}; // class argument_error

/// A required value was absent (null pointer, empty optional, empty callable).
class argument_null_error : public argument_error
{
public:
    explicit argument_null_error( std::string param_name );
}; // class argument_null_error

/// A numeric value fell outside an inclusive [min, max] bound.
class argument_out_of_range : public argument_error
{
public:
    argument_out_of_range( std::string param_name, std::string actual_value, std::string const & message );

    [[ nodiscard ]] std::string const & actual_value() const noexcept { return actual_value_; }

private:
    std::string actual_value_;
}; // class argument_out_of_range

/// A required ancestor/descendant does not exist.
class not_found_error
    :
    public std::runtime_error,
    public error
{
public:
    explicit not_found_error( std::string const & message );
}; // class not_found_error

/// A failure-producing callback failed to produce a failure, or an internal
/// invariant was observed broken at runtime.
class internal_inconsistency
    :
    public std::logic_error,
    public error
{
public:
    explicit internal_inconsistency( std::string const & message );
}; // class internal_inconsistency


namespace detail
{
    [[ noreturn ]] PARLEY_COLD void throw_failed_condition     ( std::string_view param_name );
    [[ noreturn ]] PARLEY_COLD void throw_argument_null        ( std::string_view param_name );
    [[ noreturn ]] PARLEY_COLD void throw_null_or_empty        ( std::string_view param_name );
    [[ noreturn ]] PARLEY_COLD void throw_contains_null        ( std::string_view param_name );
    [[ noreturn ]] PARLEY_COLD void throw_empty                ( std::string_view param_name );
    [[ noreturn ]] PARLEY_COLD void throw_outside_range        ( std::string_view param_name, std::string actual, std::string_view min, std::string_view max );
    [[ noreturn ]] PARLEY_COLD void throw_factory_returned_null();
    [[ noreturn ]] PARLEY_COLD void throw_not_found            ( std::string const & message );
    [[ noreturn ]] PARLEY_COLD void throw_inconsistency        ( std::string const & message );
    // Throws internal_inconsistency for a null failure.
    [[ noreturn ]] PARLEY_COLD void rethrow                    ( std::exception_ptr const & failure );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
