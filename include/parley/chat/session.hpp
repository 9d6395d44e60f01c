////////////////////////////////////////////////////////////////////////////////
/// Two-party chat session: the message history, the text being typed and
/// whose turn it is.
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

#include <parley/chat/message.hpp>
#include <parley/config.hpp>

#include <array>
#include <span>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace parley::chat
{
//------------------------------------------------------------------------------

class session
{
public:
    session();
    /// Throws argument_error if either identity is empty or both are equal.
    session( std::string local_speaker, std::string remote_speaker );

    [[ nodiscard ]] std::string const & local_speaker  () const noexcept { return speakers_[ 0 ]; }
    [[ nodiscard ]] std::string const & remote_speaker () const noexcept { return speakers_[ 1 ]; }
    [[ nodiscard ]] std::string const & current_speaker() const noexcept { return current_speaker_; }
    [[ nodiscard ]] std::string const & pending_text   () const noexcept { return pending_text_; }

    [[ nodiscard ]] std::span<message const> history() const noexcept { return history_; }

    /// Returns whether the pending text changed.
    bool set_pending_text( std::string text );

    /// Appends the pending text as a message of the current speaker, clears
    /// it and passes the turn to the other participant.
    message const & send();

    void toggle_speaker();

private:
    std::array<std::string, 2> speakers_;
    std::string                current_speaker_;
    std::string                pending_text_;
    std::vector<message>       history_;
}; // class session

//------------------------------------------------------------------------------
} // namespace parley::chat
//------------------------------------------------------------------------------
