////////////////////////////////////////////////////////////////////////////////
/// Emptiness, membership and positional search over ranges.
///
/// Every function accepts either a range or a nullable handle to one
/// (pointer, smart pointer, optional). An absent handle is never an error
/// here: it is empty, contains nothing and matches nothing.
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

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

/// Anything the sequence helpers accept in a "sequence" position.
template <typename T>
concept sequence_argument = std::ranges::range<T> || nullable_range<T>;

/// Anything that has a notion of "null or empty".
template <typename T>
concept emptiable = c_string<T> || sequence_argument<T>;

/// index_of result for "no match".
inline constexpr std::ptrdiff_t no_index{ -1 };


namespace detail
{
    template <typename S> struct sequence_range                   { using type = S; };
    template <nullable_range S> struct sequence_range<S>          { using type = std::remove_reference_t<decltype( *std::declval<S &>() )>; };

    /// The range type a sequence argument designates.
    template <typename S> using sequence_range_t = typename sequence_range<std::remove_reference_t<S>>::type;
    template <typename S> using sequence_value_t = std::ranges::range_value_t<sequence_range_t<S>>;

    /// Pointer to the range an argument designates, nullptr if it is an absent
    /// handle.
    template <sequence_argument T>
    [[ nodiscard ]] constexpr auto range_of( T & argument ) noexcept
    {
        if constexpr ( nullable_range<T> )
            return is_null( argument ) ? nullptr : std::addressof( *argument );
        else
            return std::addressof( argument );
    }

    /// The range an argument designates; throws argument_null_error for an
    /// absent handle.
    template <sequence_argument T>
    [[ nodiscard ]] constexpr decltype( auto ) required_range( T & argument, std::string_view const param_name )
    {
        if constexpr ( nullable_range<T> )
        {
            if ( is_null( argument ) ) [[ unlikely ]]
                throw_argument_null( param_name );
            return *argument;
        }
        else
        {
            return ( argument );
        }
    }
} // namespace detail


template <std::ranges::range R>
[[ nodiscard ]] constexpr bool any( R && range )
{
    return std::ranges::begin( range ) != std::ranges::end( range );
}

template <emptiable T>
[[ nodiscard ]] constexpr bool is_null_or_empty( T && value )
{
    if constexpr ( c_string<T> )
    {
        std::decay_t<T> const p_chars{ value };
        return !p_chars || *p_chars == 0;
    }
    else
    {
        auto const p_range{ detail::range_of( value ) };
        return !p_range || !any( *p_range );
    }
}

/// True if any element of the sequence is absent. An absent sequence
/// contains no nulls.
template <sequence_argument S>
[[ nodiscard ]] constexpr bool contains_null( S && sequence )
{
    auto const p_range{ detail::range_of( sequence ) };
    return p_range && std::ranges::any_of( *p_range, []( auto const & element ) { return is_null( element ); } );
}

/// A sequence that can be searched repeatedly.
template <typename S>
concept multipass_sequence = sequence_argument<S> && std::ranges::forward_range<detail::sequence_range_t<S> &>;

/// True if at least one element of other also appears in self. self is
/// searched once per element of other so it must be multipass, other may be
/// single pass.
template <multipass_sequence S, sequence_argument O>
[[ nodiscard ]] constexpr bool contains_any( S && self, O && other )
{
    auto const p_self { detail::range_of( self  ) };
    auto const p_other{ detail::range_of( other ) };
    if ( !p_self || !p_other )
        return false;
    return std::ranges::any_of( *p_other, [ p_self ]( auto const & element ) {
        return std::ranges::find( *p_self, element ) != std::ranges::end( *p_self );
    } );
}

/// True if every element of other also appears in self (vacuously true for
/// an empty other, false if either is absent).
template <multipass_sequence S, sequence_argument O>
[[ nodiscard ]] constexpr bool contains_all( S && self, O && other )
{
    auto const p_self { detail::range_of( self  ) };
    auto const p_other{ detail::range_of( other ) };
    if ( !p_self || !p_other )
        return false;
    return std::ranges::all_of( *p_other, [ p_self ]( auto const & element ) {
        return std::ranges::find( *p_self, element ) != std::ranges::end( *p_self );
    } );
}


/// Index of the first element at or after start_index satisfying predicate,
/// no_index if none does. A negative start_index is treated as zero.
template <std::ranges::input_range R, typename Predicate>
requires std::predicate<Predicate &, std::ranges::range_reference_t<R>>
[[ nodiscard ]] constexpr std::ptrdiff_t index_of( R && range, Predicate predicate, std::ptrdiff_t const start_index = 0 )
{
    auto index{ std::max<std::ptrdiff_t>( start_index, 0 ) };
    auto       pos{ std::ranges::begin( range ) };
    auto const end{ std::ranges::end  ( range ) };
    if ( std::ranges::advance( pos, index, end ) != 0 )
        return no_index;
    for ( ; pos != end; ++pos, ++index )
    {
        if ( std::invoke( predicate, *pos ) )
            return index;
    }
    return no_index;
}

template <std::ranges::input_range R, typename T>
requires( !std::predicate<T const &, std::ranges::range_reference_t<R>> )
[[ nodiscard ]] constexpr std::ptrdiff_t index_of( R && range, T const & value, std::ptrdiff_t const start_index = 0 )
{
    return index_of( std::forward<R>( range ), [ &value ]( auto const & element ) { return element == value; }, start_index );
}


/// Throws argument_error if the range has no elements, otherwise returns it.
template <std::ranges::range R>
constexpr R fail_if_empty( R && range, std::string_view const param_name )
{
    if ( !any( range ) ) [[ unlikely ]]
        detail::throw_empty( param_name );
    return std::forward<R>( range );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
