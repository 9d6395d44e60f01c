////////////////////////////////////////////////////////////////////////////////
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
#include <parley/tree/element.hpp>

#include <parley/validation/fail_if.hpp>

#include <algorithm>
//------------------------------------------------------------------------------
namespace parley::tree
{
//------------------------------------------------------------------------------

element::~element() = default;

element & element::child( std::size_t const index ) const
{
    if ( children_.empty() ) [[ unlikely ]]
        parley::detail::throw_empty( "children" );
    return *children_[ fail_if_outside_range( index, 0, children_.size() - 1, "index" ) ];
}

element & element::add_child( std::unique_ptr<element> child )
{
    auto & added{ *fail_if_null( child, "child" ) };
    BOOST_ASSERT_MSG( !added.p_parent_, "An owned element cannot have another parent" );
    added.p_parent_ = this;
    children_.push_back( std::move( child ) );
    return added;
}

std::unique_ptr<element> element::remove_child( element const & child )
{
    auto const p_slot{ std::ranges::find_if( children_, [ &child ]( auto const & p_owned ) { return p_owned.get() == &child; } ) };
    if ( p_slot == children_.end() ) [[ unlikely ]]
        parley::detail::throw_not_found( "'" + child.name() + "' is not a child of '" + name() + "'." );
    auto detached{ std::move( *p_slot ) };
    children_.erase( p_slot );
    detached->p_parent_ = nullptr;
    return detached;
}

//------------------------------------------------------------------------------
} // namespace parley::tree
//------------------------------------------------------------------------------
