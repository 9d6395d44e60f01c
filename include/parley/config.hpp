////////////////////////////////////////////////////////////////////////////////
///
/// \file config.hpp
/// ----------------
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

#include <boost/config.hpp>
//------------------------------------------------------------------------------
#if defined( __GNUC__ ) || defined( __clang__ )
#   define PARLEY_COLD     [[ gnu::cold ]]
#   define PARLEY_NOINLINE [[ gnu::noinline ]]
#   define PARLEY_PURE     [[ gnu::pure ]]
#else
#   define PARLEY_COLD
#   define PARLEY_NOINLINE BOOST_NOINLINE
#   define PARLEY_PURE
#endif

// Identities of the two chat participants (overridable with -D).
#ifndef PARLEY_DEFAULT_SPEAKER_LOCAL
#   define PARLEY_DEFAULT_SPEAKER_LOCAL  "Me"
#endif
#ifndef PARLEY_DEFAULT_SPEAKER_REMOTE
#   define PARLEY_DEFAULT_SPEAKER_REMOTE "Solomon"
#endif

// Separator used when rendering an ancestor chain as a single string.
#ifndef PARLEY_ANCESTOR_SEPARATOR
#   define PARLEY_ANCESTOR_SEPARATOR '.'
#endif
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

inline constexpr char const default_local_speaker [] = PARLEY_DEFAULT_SPEAKER_LOCAL ;
inline constexpr char const default_remote_speaker[] = PARLEY_DEFAULT_SPEAKER_REMOTE;

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
