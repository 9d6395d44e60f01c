////////////////////////////////////////////////////////////////////////////////
/// Sequence comparison: lexicographic three-way ordering, element-wise and
/// multiset (order-insensitive) equality.
///
/// Contents:
///   - three_way( comp, a, b )        : -1/0/+1 from any supported comparer
///   - compare_sequences( l, r[, c] ) : lexicographic three-way comparison
///   - sequence_equal( l, r )         : element-wise, order sensitive
///   - are_contents_equal( l, r )     : same elements in the same quantities
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

#include <parley/sequence/counting.hpp>
#include <parley/sequence/search.hpp>
#include <parley/validation/fail_if.hpp>

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <concepts>
#include <functional>
#include <memory>
#include <ranges>
#include <type_traits>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

//==============================================================================
// three_way
//==============================================================================

/// Three-tier dispatch on what the comparer returns:
///   1. a std::*_ordering (e.g. std::compare_three_way)
///   2. a signed integer, negative/zero/positive (strcmp-style comparers)
///   3. bool: a strict weak ordering predicate (e.g. std::less), which costs
///      a second call for the "greater" test
/// Unordered partial_ordering results (NaNs) compare as equal.
template <typename Comp, typename L, typename R>
[[ nodiscard ]] constexpr int three_way( Comp const & comp, L const & left, R const & right )
{
    using result_t = std::remove_cvref_t<std::invoke_result_t<Comp const &, L const &, R const &>>;
    if constexpr ( std::same_as<result_t, bool> )
    {
        if ( std::invoke( comp, left, right ) ) return -1;
        if ( std::invoke( comp, right, left ) ) return +1;
        return 0;
    }
    else if constexpr ( std::signed_integral<result_t> )
    {
        auto const result{ std::invoke( comp, left, right ) };
        return ( result > 0 ) - ( result < 0 );
    }
    else
    {
        auto const result{ std::invoke( comp, left, right ) };
        if ( result < 0 ) return -1;
        if ( result > 0 ) return +1;
        return 0;
    }
}


//==============================================================================
// compare_sequences
//==============================================================================

/// Lexicographic three-way comparison of two sequences.
///
/// The sequences are equal if they have the same length and every pair of
/// elements compares equal. If one is a proper prefix of the other the
/// shorter one is less. Otherwise the first unequal pair decides.
///
/// Returns -1, 0 or +1. Throws argument_null_error if either sequence or the
/// comparer is absent.
template <sequence_argument L, sequence_argument R, typename Comp = std::compare_three_way>
[[ nodiscard ]] constexpr int compare_sequences( L && left, R && right, Comp const & comparer = {} )
{
    auto & lhs{ detail::required_range( left , "left"  ) };
    auto & rhs{ detail::required_range( right, "right" ) };
    fail_if_null( comparer, "comparer" );

    if constexpr ( std::same_as<std::remove_cvref_t<decltype( lhs )>, std::remove_cvref_t<decltype( rhs )>> )
    {
        if ( std::addressof( lhs ) == std::addressof( rhs ) )
            return 0;
    }

    auto       l_pos{ std::ranges::begin( lhs ) };
    auto const l_end{ std::ranges::end  ( lhs ) };
    auto       r_pos{ std::ranges::begin( rhs ) };
    auto const r_end{ std::ranges::end  ( rhs ) };
    for ( ; l_pos != l_end; ++l_pos, ++r_pos )
    {
        if ( r_pos == r_end )
            return +1;
        if ( auto const result{ three_way( comparer, *l_pos, *r_pos ) }; result != 0 )
            return result;
    }
    return ( r_pos != r_end ) ? -1 : 0;
}


//==============================================================================
// sequence_equal
//==============================================================================

/// Element-wise equality (with ==), in order. Sequences of different length
/// are unequal. Throws argument_null_error if either is absent.
template <sequence_argument L, sequence_argument R>
[[ nodiscard ]] constexpr bool sequence_equal( L && self, R && other )
{
    auto & lhs{ detail::required_range( self , "self"  ) };
    auto & rhs{ detail::required_range( other, "other" ) };

    if constexpr ( std::ranges::sized_range<decltype( lhs )> && std::ranges::sized_range<decltype( rhs )> )
    {
        if ( std::ranges::size( lhs ) != std::ranges::size( rhs ) )
            return false;
    }

    auto       l_pos{ std::ranges::begin( lhs ) };
    auto const l_end{ std::ranges::end  ( lhs ) };
    auto       r_pos{ std::ranges::begin( rhs ) };
    auto const r_end{ std::ranges::end  ( rhs ) };
    for ( ; ; ++l_pos, ++r_pos )
    {
        bool const l_done{ l_pos == l_end };
        bool const r_done{ r_pos == r_end };
        if ( l_done || r_done )
            return l_done && r_done;
        if ( !( *l_pos == *r_pos ) )
            return false;
    }
}


//==============================================================================
// are_contents_equal
//==============================================================================

/// True iff both sequences hold equal elements in equal quantities,
/// regardless of order. Two absent-or-empty sequences are equal.
///
/// Works by occurrence counting (hash + equality) so the element type needs
/// no ordering.
template <
    sequence_argument L,
    sequence_argument R,
    typename Hash  = boost::hash<detail::sequence_value_t<L>>,
    typename Equal = std::equal_to<>
>
requires std::same_as<detail::sequence_value_t<L>, detail::sequence_value_t<R>>
[[ nodiscard ]] bool are_contents_equal( L && left, R && right, Hash const & hash = {}, Equal const & equal = {} )
{
    bool const left_empty { is_null_or_empty( left  ) };
    bool const right_empty{ is_null_or_empty( right ) };
    if ( left_empty || right_empty )
        return left_empty && right_empty;

    auto & lhs{ *detail::range_of( left  ) };
    auto & rhs{ *detail::range_of( right ) };

    auto counts{ detail::count_items( lhs, hash, equal ) };
    using key_t = typename decltype( counts )::key_type;
    for ( auto && element : rhs )
    {
        auto const p_count{ counts.find( key_t( element ) ) };
        if ( p_count == counts.end() || p_count->second == 0 )
            return false;
        --p_count->second;
    }
    return std::ranges::all_of( counts, []( auto const & entry ) { return entry.second == 0; } );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
