////////////////////////////////////////////////////////////////////////////////
/// Minimal owning element tree: a reference host for the visual tree
/// helpers, also used by the console front end to lay out its page.
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

#include <parley/tree/visual_tree.hpp>

#include <boost/container/small_vector.hpp>

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace parley::tree
{
//------------------------------------------------------------------------------

class element
{
public:
    element() noexcept = default;
    explicit element( std::string name ) noexcept : name_{ std::move( name ) } {}
    element( element const & ) = delete;
    element & operator=( element const & ) = delete;
    virtual ~element();

    [[ nodiscard ]] std::string const & name() const noexcept { return name_; }

    [[ nodiscard ]] element * parent() const noexcept { return p_parent_; }

    [[ nodiscard ]] std::size_t child_count() const noexcept { return children_.size(); }
    [[ nodiscard ]] element &   child( std::size_t index ) const;

    /// Takes ownership of child and returns it. Throws argument_null_error for
    /// a null child.
    element & add_child( std::unique_ptr<element> child );

    template <std::derived_from<element> Element, typename ... Args>
    Element & emplace_child( Args && ... args )
    {
        auto p_child{ std::make_unique<Element>( std::forward<Args>( args )... ) };
        auto & child{ *p_child };
        add_child( std::move( p_child ) );
        return child;
    }

    /// Detaches child and hands its ownership back to the caller. Throws
    /// not_found_error if child is not a direct child of this element.
    std::unique_ptr<element> remove_child( element const & child );

private:
    std::string name_;
    element *   p_parent_{ nullptr };
    boost::container::small_vector<std::unique_ptr<element>, 4> children_;
}; // class element


template <>
struct visual_tree_traits<element>
{
    static element *   parent     ( element const & node ) noexcept { return node.parent(); }
    static std::size_t child_count( element const & node ) noexcept { return node.child_count(); }
    static element &   child      ( element const & node, std::size_t const index ) { return node.child( index ); }
}; // struct visual_tree_traits<element>

//------------------------------------------------------------------------------
} // namespace parley::tree
//------------------------------------------------------------------------------
