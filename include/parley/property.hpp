////////////////////////////////////////////////////////////////////////////////
///
/// \file property.hpp
/// ------------------
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

#include <parley/validation/fail_if.hpp>

#include <functional>
#include <utility>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

/// Stores value into field only if the two differ under equal, so that
/// bound observers are not re-notified (and binding cycles cannot form) on
/// no-op assignments.
///
/// Returns whether the field was written.
template <typename T, typename U, typename Equal = std::equal_to<>>
requires std::predicate<Equal &, U const &, T const &>
constexpr bool set_if_different( T & field, U && value, Equal equal = {} )
{
    detail::check_not_null( equal, "equality_checker" );
    if ( std::invoke( equal, std::as_const( value ), std::as_const( field ) ) )
        return false;
    field = std::forward<U>( value );
    return true;
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
