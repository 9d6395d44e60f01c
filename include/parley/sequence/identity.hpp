////////////////////////////////////////////////////////////////////////////////
/// Reference-identity hashing and equality.
///
/// Two values are equal under reference_equal_to only if they designate the
/// very same object (see identity_of() in nullable.hpp): shared_ptrs to one
/// object are equal, two distinct objects that compare == are not. The hash
/// is derived from the object's address, never from its contents.
///
/// Both functors are transparent so they also serve heterogeneous lookup.
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

#include <parley/nullable.hpp>

#include <boost/container_hash/hash.hpp>

#include <cstddef>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

struct reference_hash
{
    using is_transparent = void;

    template <typename T>
    [[ nodiscard ]] std::size_t operator()( T const & value ) const noexcept
    {
        return boost::hash<void const *>{}( identity_of( value ) );
    }
}; // struct reference_hash

struct reference_equal_to
{
    using is_transparent = void;

    template <typename L, typename R>
    [[ nodiscard ]] constexpr bool operator()( L const & left, R const & right ) const noexcept
    {
        return identity_of( left ) == identity_of( right );
    }
}; // struct reference_equal_to

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
