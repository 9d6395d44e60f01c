////////////////////////////////////////////////////////////////////////////////
/// Order-preserving filtering and stable ordering by an integral key.
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

#include <parley/sequence/search.hpp>

#include <boost/sort/spinsort/spinsort.hpp>

#include <algorithm>
#include <concepts>
#include <functional>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

/// Lazy view of the non-absent elements, in their original relative order.
/// For a range of std::optional<T> the view yields the contained Ts.
///
/// A nullable handle to a range is dereferenced (and must outlive the view);
/// an absent one throws argument_null_error.
template <sequence_argument S>
[[ nodiscard ]] constexpr auto remove_nulls( S && sequence )
{
    if constexpr ( nullable_range<S> )
    {
        return remove_nulls( detail::required_range( sequence, "self" ) );
    }
    else
    {
        auto present{ std::views::filter( std::forward<S>( sequence ), []( auto const & element ) { return !is_null( element ); } ) };
        using reference = std::ranges::range_reference_t<decltype( present )>;
        if constexpr ( !is_optional<std::ranges::range_value_t<S>> )
            return present;
        // optionals held by the source are unwrapped in place, produced ones
        // (e.g. by a transform) are moved out of before they expire
        else if constexpr ( std::is_lvalue_reference_v<reference> )
            return std::move( present ) | std::views::transform( []( auto & element ) -> decltype( auto ) { return *element; } );
        else
            return std::move( present ) | std::views::transform( []( auto && element ) { return *std::move( element ); } );
    }
}


template <typename KeySelector, typename T>
concept integral_key_selector = std::integral<std::remove_cvref_t<std::invoke_result_t<KeySelector &, T const &>>>;

namespace detail
{
    template <bool descending, typename S, typename KeySelector>
    [[ nodiscard ]] std::vector<sequence_value_t<S>> order_by_integral_key( S & sequence, KeySelector & key_selector )
    {
        auto & range{ required_range( sequence, "self" ) };
        std::vector<sequence_value_t<S>> ordered;
        if constexpr ( std::ranges::sized_range<decltype( range )> )
            ordered.reserve( std::ranges::size( range ) );
        std::ranges::copy( range, std::back_inserter( ordered ) );
        boost::sort::spinsort
        (
            ordered.begin(), ordered.end(),
            [ &key_selector ]( auto const & left, auto const & right )
            {
                if constexpr ( descending ) return std::invoke( key_selector, right ) < std::invoke( key_selector, left  );
                else                        return std::invoke( key_selector, left  ) < std::invoke( key_selector, right );
            }
        );
        return ordered;
    }
} // namespace detail

/// Stable sort by an integral key, ascending. Elements with equal keys keep
/// their relative order.
template <sequence_argument S, integral_key_selector<detail::sequence_value_t<S>> KeySelector>
[[ nodiscard ]] std::vector<detail::sequence_value_t<S>> order_by_numeric( S && sequence, KeySelector key_selector )
{
    return detail::order_by_integral_key<false>( sequence, key_selector );
}

/// Stable sort by an integral key, descending.
template <sequence_argument S, integral_key_selector<detail::sequence_value_t<S>> KeySelector>
[[ nodiscard ]] std::vector<detail::sequence_value_t<S>> order_by_numeric_descending( S && sequence, KeySelector key_selector )
{
    return detail::order_by_integral_key<true>( sequence, key_selector );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
