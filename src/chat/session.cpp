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
#include <parley/chat/session.hpp>

#include <parley/error/error.hpp>
#include <parley/property.hpp>
#include <parley/validation/fail_if.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace parley::chat
{
//------------------------------------------------------------------------------

session::session() : session( default_local_speaker, default_remote_speaker ) {}

session::session( std::string local_speaker, std::string remote_speaker )
    :
    speakers_
    {
        fail_if_null_or_empty( std::move( local_speaker  ), "local_speaker"  ),
        fail_if_null_or_empty( std::move( remote_speaker ), "remote_speaker" )
    }
{
    fail_if( speakers_[ 1 ], speakers_[ 0 ] == speakers_[ 1 ], "remote_speaker" );
    current_speaker_ = speakers_[ 0 ];
}

bool session::set_pending_text( std::string text )
{
    return set_if_different( pending_text_, std::move( text ) );
}

message const & session::send()
{
    auto const & sent{ history_.emplace_back( current_speaker_, std::move( pending_text_ ) ) };
    pending_text_.clear();
    toggle_speaker();
    return sent;
}

void session::toggle_speaker()
{
    if      ( current_speaker_ == speakers_[ 0 ] ) current_speaker_ = speakers_[ 1 ];
    else if ( current_speaker_ == speakers_[ 1 ] ) current_speaker_ = speakers_[ 0 ];
    else
        parley::detail::throw_inconsistency( "Current speaker '" + current_speaker_ + "' is not a participant of the session." );
}

//------------------------------------------------------------------------------
} // namespace parley::chat
//------------------------------------------------------------------------------
