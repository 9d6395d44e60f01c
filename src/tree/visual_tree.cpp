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
#include <parley/tree/visual_tree.hpp>
//------------------------------------------------------------------------------
namespace parley::tree::detail
{
//------------------------------------------------------------------------------

std::string unqualified_name( std::string qualified_name )
{
    // template arguments may themselves be qualified: only the scope of the
    // outermost name is stripped
    auto const template_start{ qualified_name.find( '<' ) };
    auto const scope_end     { qualified_name.rfind( "::", template_start ) };
    if ( scope_end != std::string::npos )
        qualified_name.erase( 0, scope_end + 2 );
    return qualified_name;
}

void throw_not_found( std::string_view const relation, std::string const & type_name, bool const with_predicate )
{
    std::string message{ "No " };
    message.append( relation );
    message += " of type '";
    message += type_name;
    message += with_predicate ? "' matches the predicate." : "' found.";
    parley::detail::throw_not_found( message );
}

//------------------------------------------------------------------------------
} // namespace parley::tree::detail
//------------------------------------------------------------------------------
