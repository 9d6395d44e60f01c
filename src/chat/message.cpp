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
#include <parley/chat/message.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace parley::chat
{
//------------------------------------------------------------------------------

message::message( std::string speaker, std::string text )
    : speaker_{ std::move( speaker ) }, text_{ std::move( text ) } {}

std::string message::to_string() const
{
    std::string rendered;
    rendered.reserve( speaker_.size() + 2 + text_.size() );
    rendered += speaker_;
    rendered += ": ";
    rendered += text_;
    return rendered;
}

//------------------------------------------------------------------------------
} // namespace parley::chat
//------------------------------------------------------------------------------
