////////////////////////////////////////////////////////////////////////////////
///
/// \file sequence.hpp
/// ------------------
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

#include <parley/sequence/compare.hpp>
#include <parley/sequence/counting.hpp>
#include <parley/sequence/identity.hpp>
#include <parley/sequence/ordering.hpp>
#include <parley/sequence/search.hpp>
//------------------------------------------------------------------------------
