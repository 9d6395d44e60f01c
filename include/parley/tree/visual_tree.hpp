////////////////////////////////////////////////////////////////////////////////
/// Visual tree traversal over host-provided element trees.
///
/// A host makes its node type walkable by specializing visual_tree_traits:
///
///   template <> struct visual_tree_traits<my_node>
///   {
///       static my_node *    parent     ( my_node const & ) noexcept;
///       static std::size_t  child_count( my_node const & ) noexcept;
///       static my_node &    child      ( my_node const &, std::size_t index );
///       // optional: template <typename T> static T * as( my_node & );
///       // optional: static std::string type_name( my_node const & );
///   };
///
/// Typed searches (find_visual_ancestor<T> & co.) test the dynamic type with
/// the traits' as<T>() if provided, dynamic_cast otherwise.
///
/// Contents:
///   - visual_ancestors( n )    : lazy forward view, nearest (parent) first
///   - visual_children( n )     : lazy forward view over the direct children
///   - visual_descendants( n )  : lazy input view, breadth first
///   - [try_]find_visual_ancestor<T>  / [try_]find_visual_descendant<T>
///   - visual_ancestors_as_string( n )
///   - has_focus, visual_ancestor_has_focus, visual_descendant_has_focus
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
#include <parley/error/error.hpp>
#include <parley/validation/fail_if.hpp>

#include <boost/assert.hpp>
#include <boost/core/demangle.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <concepts>
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
//------------------------------------------------------------------------------
namespace parley::tree
{
//------------------------------------------------------------------------------

template <typename Node>
struct visual_tree_traits; // specialized by hosts

template <typename Node>
concept visual_tree_node = requires( Node & node, std::size_t const index )
{
    { visual_tree_traits<Node>::parent     ( node        ) } -> std::convertible_to<Node *>;
    { visual_tree_traits<Node>::child_count( node        ) } -> std::convertible_to<std::size_t>;
    { visual_tree_traits<Node>::child      ( node, index ) } -> std::same_as<Node &>;
};


namespace detail
{
    template <typename T, typename Node>
    [[ nodiscard ]] T * as( Node & node )
    {
        using traits = visual_tree_traits<Node>;
        if constexpr ( requires{ traits::template as<T>( node ); } )
            return traits::template as<T>( node );
        else if constexpr ( std::derived_from<Node, T> )
            return &node;
        else
            return dynamic_cast<T *>( &node );
    }

    /// Unqualified type name: "ns::detail::widget<int>" -> "widget<int>".
    [[ nodiscard ]] std::string unqualified_name( std::string qualified_name );

    template <typename T>
    [[ nodiscard ]] std::string type_name() { return unqualified_name( boost::core::demangle( typeid( T ).name() ) ); }

    template <typename Node>
    [[ nodiscard ]] std::string type_name( Node const & node )
    {
        using traits = visual_tree_traits<Node>;
        if constexpr ( requires{ { traits::type_name( node ) } -> std::convertible_to<std::string>; } )
            return traits::type_name( node );
        else
            return unqualified_name( boost::core::demangle( typeid( node ).name() ) );
    }

    [[ noreturn ]] PARLEY_COLD void throw_not_found( std::string_view relation, std::string const & type_name, bool with_predicate );

    /// Default search predicate: every node of the requested type matches.
    struct any_node
    {
        constexpr bool operator()( auto const & ) const noexcept { return true; }
    }; // struct any_node
} // namespace detail


//==============================================================================
// Ancestors
//==============================================================================

template <visual_tree_node Node>
class ancestors_view : public std::ranges::view_interface<ancestors_view<Node>>
{
public:
    class iterator
        : public boost::stl_interfaces::iterator_interface<iterator, std::forward_iterator_tag, Node>
    {
        using base_type = boost::stl_interfaces::iterator_interface<iterator, std::forward_iterator_tag, Node>;

    public:
        iterator() noexcept = default;
        explicit iterator( Node * const p_node ) noexcept : p_node_{ p_node } {}

        Node & operator*() const noexcept { BOOST_ASSERT( p_node_ ); return *p_node_; }

        iterator & operator++() noexcept { p_node_ = visual_tree_traits<Node>::parent( **this ); return *this; }
        using base_type::operator++;

        friend bool operator==( iterator const & left, iterator const & right ) noexcept { return left.p_node_ == right.p_node_; }
        bool operator==( std::default_sentinel_t ) const noexcept { return p_node_ == nullptr; }

    private:
        Node * p_node_{ nullptr };
    }; // class iterator

    ancestors_view() noexcept = default;
    explicit ancestors_view( Node & node ) noexcept : p_node_{ &node } {}

    iterator                begin() const noexcept { return iterator{ visual_tree_traits<Node>::parent( *p_node_ ) }; }
    std::default_sentinel_t end  () const noexcept { return {}; }

private:
    Node * p_node_{ nullptr };
}; // class ancestors_view

/// All ancestors of node, nearest (the parent) first, farthest (the root)
/// last.
template <visual_tree_node Node>
[[ nodiscard ]] ancestors_view<Node> visual_ancestors( Node & node ) noexcept { return ancestors_view<Node>{ node }; }

template <visual_tree_node Node>
[[ nodiscard ]] ancestors_view<Node> visual_ancestors( Node * const p_node ) { return visual_ancestors( *fail_if_null( p_node, "node" ) ); }

/// Ancestor type names, nearest first, joined with PARLEY_ANCESTOR_SEPARATOR.
template <visual_tree_node Node>
[[ nodiscard ]] std::string visual_ancestors_as_string( Node & node )
{
    std::string names;
    for ( Node & ancestor : visual_ancestors( node ) )
    {
        if ( !names.empty() )
            names += PARLEY_ANCESTOR_SEPARATOR;
        names += detail::type_name( ancestor );
    }
    return names;
}


//==============================================================================
// Children
//==============================================================================

template <visual_tree_node Node>
class children_view : public std::ranges::view_interface<children_view<Node>>
{
public:
    class iterator
        : public boost::stl_interfaces::iterator_interface<iterator, std::forward_iterator_tag, Node>
    {
        using base_type = boost::stl_interfaces::iterator_interface<iterator, std::forward_iterator_tag, Node>;

    public:
        iterator() noexcept = default;
        iterator( Node & parent, std::size_t const index ) noexcept : p_parent_{ &parent }, index_{ index } {}

        Node & operator*() const { return visual_tree_traits<Node>::child( *p_parent_, index_ ); }

        iterator & operator++() noexcept { ++index_; return *this; }
        using base_type::operator++;

        friend bool operator==( iterator const & left, iterator const & right ) noexcept
        {
            return left.p_parent_ == right.p_parent_ && left.index_ == right.index_;
        }
        // the child count is re-read so that the host stays authoritative
        bool operator==( std::default_sentinel_t ) const noexcept { return index_ >= visual_tree_traits<Node>::child_count( *p_parent_ ); }

    private:
        Node *      p_parent_{ nullptr };
        std::size_t index_   { 0 };
    }; // class iterator

    children_view() noexcept = default;
    explicit children_view( Node & node ) noexcept : p_node_{ &node } {}

    iterator                begin() const noexcept { return { *p_node_, 0 }; }
    std::default_sentinel_t end  () const noexcept { return {}; }

private:
    Node * p_node_{ nullptr };
}; // class children_view

template <visual_tree_node Node>
[[ nodiscard ]] children_view<Node> visual_children( Node & node ) noexcept { return children_view<Node>{ node }; }

template <visual_tree_node Node>
[[ nodiscard ]] children_view<Node> visual_children( Node * const p_node ) { return visual_children( *fail_if_null( p_node, "node" ) ); }


//==============================================================================
// Descendants
//==============================================================================

/// Breadth-first traversal: all children, then all grandchildren etc. The
/// iterator owns the frontier queue, so copies traverse independently.
template <visual_tree_node Node>
class descendants_view : public std::ranges::view_interface<descendants_view<Node>>
{
public:
    class iterator
        : public boost::stl_interfaces::iterator_interface<iterator, std::input_iterator_tag, Node>
    {
        using base_type = boost::stl_interfaces::iterator_interface<iterator, std::input_iterator_tag, Node>;

    public:
        iterator() = default;
        explicit iterator( Node & root ) { enqueue_children( root ); }

        Node & operator*() const noexcept { BOOST_ASSERT( !frontier_.empty() ); return *frontier_.front(); }

        iterator & operator++()
        {
            BOOST_ASSERT( !frontier_.empty() );
            Node & current{ *frontier_.front() };
            frontier_.pop_front();
            enqueue_children( current );
            return *this;
        }
        using base_type::operator++;

        bool operator==( std::default_sentinel_t ) const noexcept { return frontier_.empty(); }

    private:
        void enqueue_children( Node & node )
        {
            for ( Node & child : visual_children( node ) )
                frontier_.push_back( &child );
        }

        std::deque<Node *> frontier_;
    }; // class iterator

    descendants_view() noexcept = default;
    explicit descendants_view( Node & node ) noexcept : p_node_{ &node } {}

    iterator                begin() const { return iterator{ *p_node_ }; }
    std::default_sentinel_t end  () const noexcept { return {}; }

private:
    Node * p_node_{ nullptr };
}; // class descendants_view

template <visual_tree_node Node>
[[ nodiscard ]] descendants_view<Node> visual_descendants( Node & node ) noexcept { return descendants_view<Node>{ node }; }

template <visual_tree_node Node>
[[ nodiscard ]] descendants_view<Node> visual_descendants( Node * const p_node ) { return visual_descendants( *fail_if_null( p_node, "node" ) ); }


//==============================================================================
// Typed searches
//==============================================================================

/// Nearest ancestor that is a T and satisfies predicate; nullptr if none.
template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T * try_find_visual_ancestor( Node & node, Predicate predicate = {} )
{
    parley::detail::check_not_null( predicate, "predicate" );
    for ( Node & ancestor : visual_ancestors( node ) )
    {
        if ( auto * const p_match{ detail::as<T>( ancestor ) }; p_match && std::invoke( predicate, *p_match ) )
            return p_match;
    }
    return nullptr;
}

template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T * try_find_visual_ancestor( Node * const p_node, Predicate predicate = {} )
{
    return try_find_visual_ancestor<T>( *fail_if_null( p_node, "node" ), std::move( predicate ) );
}

/// Nearest ancestor that is a T and satisfies predicate; throws
/// not_found_error if there is none.
template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T & find_visual_ancestor( Node & node, Predicate predicate = {} )
{
    if ( auto * const p_match{ try_find_visual_ancestor<T>( node, std::move( predicate ) ) } )
        return *p_match;
    detail::throw_not_found( "ancestor", detail::type_name<T>(), !std::same_as<Predicate, detail::any_node> );
}

template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T & find_visual_ancestor( Node * const p_node, Predicate predicate = {} )
{
    return find_visual_ancestor<T>( *fail_if_null( p_node, "node" ), std::move( predicate ) );
}

/// Closest (breadth-first) descendant that is a T and satisfies predicate;
/// nullptr if none.
template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T * try_find_visual_descendant( Node & node, Predicate predicate = {} )
{
    parley::detail::check_not_null( predicate, "predicate" );
    for ( Node & descendant : visual_descendants( node ) )
    {
        if ( auto * const p_match{ detail::as<T>( descendant ) }; p_match && std::invoke( predicate, *p_match ) )
            return p_match;
    }
    return nullptr;
}

template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T * try_find_visual_descendant( Node * const p_node, Predicate predicate = {} )
{
    return try_find_visual_descendant<T>( *fail_if_null( p_node, "node" ), std::move( predicate ) );
}

/// Closest (breadth-first) descendant that is a T and satisfies predicate;
/// throws not_found_error if there is none.
template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T & find_visual_descendant( Node & node, Predicate predicate = {} )
{
    if ( auto * const p_match{ try_find_visual_descendant<T>( node, std::move( predicate ) ) } )
        return *p_match;
    detail::throw_not_found( "descendant", detail::type_name<T>(), !std::same_as<Predicate, detail::any_node> );
}

template <typename T, visual_tree_node Node, typename Predicate = detail::any_node>
requires std::predicate<Predicate &, T &>
[[ nodiscard ]] T & find_visual_descendant( Node * const p_node, Predicate predicate = {} )
{
    return find_visual_descendant<T>( *fail_if_null( p_node, "node" ), std::move( predicate ) );
}


//==============================================================================
// Focus
//==============================================================================
// The host's focus manager is consulted by the caller; p_focused may be null
// (nothing has focus).

template <visual_tree_node Node>
[[ nodiscard ]] bool has_focus( Node const & node, std::type_identity_t<Node> const * const p_focused ) noexcept
{
    return &node == p_focused;
}

template <visual_tree_node Node>
[[ nodiscard ]] bool visual_ancestor_has_focus( Node & node, std::type_identity_t<Node> const * const p_focused )
{
    return p_focused && try_find_visual_ancestor<Node>( node, [ = ]( Node const & ancestor ) { return has_focus( ancestor, p_focused ); } );
}

template <visual_tree_node Node>
[[ nodiscard ]] bool visual_descendant_has_focus( Node & node, std::type_identity_t<Node> const * const p_focused )
{
    return p_focused && try_find_visual_descendant<Node>( node, [ = ]( Node const & descendant ) { return has_focus( descendant, p_focused ); } );
}

//------------------------------------------------------------------------------
} // namespace parley::tree
//------------------------------------------------------------------------------
