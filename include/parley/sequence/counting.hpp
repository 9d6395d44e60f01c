////////////////////////////////////////////////////////////////////////////////
/// Grouping by equality: per-item occurrence counts, duplicate-object
/// detection and first-per-key selection.
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

#include <parley/sequence/identity.hpp>
#include <parley/sequence/search.hpp>

#include <boost/container_hash/hash.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

namespace detail
{
    /// Counting table key that refers to an element in place instead of
    /// copying it. Keeps the element's address so identity comparers see the
    /// original object.
    template <typename T>
    class element_ref
    {
    public:
        explicit element_ref( T const & element ) noexcept : p_element_{ std::addressof( element ) } {}

        [[ nodiscard ]] T const & get() const noexcept { return *p_element_; }

    private:
        T const * p_element_;
    }; // class element_ref

    template <typename T> [[ nodiscard ]] T const & unwrap( element_ref<T> const & key ) noexcept { return key.get(); }
    template <typename T> [[ nodiscard ]] T const & unwrap( T const & key               ) noexcept { return key; }

    // Ranges yielding lvalues are counted in place, the rest (e.g. iota or
    // transform views) by value.
    template <typename R>
    using count_key_t = std::conditional_t
    <
        std::is_lvalue_reference_v<std::ranges::range_reference_t<R>>,
        element_ref<std::ranges::range_value_t<R>>,
        std::ranges::range_value_t<R>
    >;

    template <typename Hash>
    struct key_hash
    {
        template <typename Key>
        std::size_t operator()( Key const & key ) const { return std::invoke( hash, unwrap( key ) ); }

        [[ no_unique_address ]] Hash hash;
    }; // struct key_hash

    template <typename Equal>
    struct key_equal
    {
        template <typename Key>
        bool operator()( Key const & left, Key const & right ) const { return std::invoke( equal, unwrap( left ), unwrap( right ) ); }

        [[ no_unique_address ]] Equal equal;
    }; // struct key_equal

    template <std::ranges::input_range R, typename Hash, typename Equal>
    [[ nodiscard ]] auto count_items( R && range, Hash const & hash, Equal const & equal )
    {
        using key_t = count_key_t<R>;
        boost::unordered_map<key_t, std::size_t, key_hash<Hash>, key_equal<Equal>> counts
        (
            0, key_hash<Hash>{ hash }, key_equal<Equal>{ equal }
        );
        for ( auto && element : range )
            ++counts[ key_t( element ) ];
        return counts;
    }
} // namespace detail


template <typename T>
using item_count = std::pair<T, std::size_t>;

/// Groups the elements by equality (Hash + Equal) and reports how many times
/// each distinct element occurs. The order of the groups is unspecified.
/// Throws argument_null_error for an absent sequence.
template
<
    sequence_argument S,
    typename Hash  = boost::hash<detail::sequence_value_t<S>>,
    typename Equal = std::equal_to<>
>
[[ nodiscard ]] std::vector<item_count<detail::sequence_value_t<S>>>
get_counts_by_item( S && sequence, Hash const & hash = {}, Equal const & equal = {} )
{
    auto & range{ detail::required_range( sequence, "self" ) };
    auto const counts{ detail::count_items( range, hash, equal ) };

    std::vector<item_count<detail::sequence_value_t<S>>> result;
    result.reserve( counts.size() );
    for ( auto const & [ key, count ] : counts )
        result.emplace_back( detail::unwrap( key ), count );
    return result;
}

/// True iff some object appears more than once in the sequence, by identity
/// (reference_equal_to) rather than by value.
template <sequence_argument S>
[[ nodiscard ]] bool contains_multiple_references_to_same_object( S && sequence )
{
    auto & range{ detail::required_range( sequence, "self" ) };
    auto const counts{ detail::count_items( range, reference_hash{}, reference_equal_to{} ) };
    return std::ranges::any_of( counts, []( auto const & entry ) { return entry.second > 1; } );
}

/// The first element for every distinct key, in first-occurrence order.
template <sequence_argument S, typename KeySelector>
[[ nodiscard ]] std::vector<detail::sequence_value_t<S>> distinct_by( S && sequence, KeySelector key_selector )
{
    auto & range{ detail::required_range( sequence, "self" ) };
    using key_t = std::remove_cvref_t<std::invoke_result_t<KeySelector &, std::ranges::range_reference_t<decltype( range )>>>;

    boost::unordered_set<key_t, boost::hash<key_t>> seen_keys;
    std::vector<detail::sequence_value_t<S>> result;
    for ( auto && element : range )
    {
        if ( seen_keys.insert( std::invoke( key_selector, element ) ).second )
            result.emplace_back( element );
    }
    return result;
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
