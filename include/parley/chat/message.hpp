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
#pragma once

#include <string>
//------------------------------------------------------------------------------
namespace parley::chat
{
//------------------------------------------------------------------------------

/// One line of a conversation.
class message
{
public:
    message( std::string speaker, std::string text );

    [[ nodiscard ]] std::string const & speaker() const noexcept { return speaker_; }
    [[ nodiscard ]] std::string const & text   () const noexcept { return text_;    }

    /// "speaker: text"
    [[ nodiscard ]] std::string to_string() const;

    friend bool operator==( message const &, message const & ) = default;

private:
    std::string speaker_;
    std::string text_;
}; // class message

//------------------------------------------------------------------------------
} // namespace parley::chat
//------------------------------------------------------------------------------
