////////////////////////////////////////////////////////////////////////////////
/// parley-chat: line based console front end for a two-party chat session.
///
/// Every non-empty input line is sent on behalf of the current speaker, after
/// which the turn passes to the other participant. "/quit" (or end of input)
/// ends the session.
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
#include <parley/tree/element.hpp>
#include <parley/tree/visual_tree.hpp>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace parley::chat
{
//------------------------------------------------------------------------------

namespace
{
    using tree::element;

    struct page       : element { using element::element; };
    struct panel      : element { using element::element; };
    struct transcript : element { using element::element; };
    struct text_box   : element { using element::element; };
    struct button     : element { using element::element; };

    // page
    //   panel "conversation"
    //     transcript
    //   panel "input"
    //     text_box
    //     button "send"
    void build( page & root )
    {
        root.emplace_child<panel>( "conversation" ).emplace_child<transcript>( "transcript" );
        auto & input{ root.emplace_child<panel>( "input" ) };
        input.emplace_child<text_box>( "message" );
        input.emplace_child<button  >( "send"    );
    }

    constexpr std::string_view quit_command{ "/quit" };

    int run()
    {
        session conversation;

        page chat_page{ "chat" };
        build( chat_page );
        element & root{ chat_page };

        // the input line stands in for the text box, which is what has focus
        element & input_box  { tree::find_visual_descendant<text_box>( root ) };
        element & send_button{ tree::find_visual_descendant<button>( root, []( button const & b ) { return b.name() == "send"; } ) };
        element const * const p_focused{ &input_box };

        std::printf( "Chatting as %s and %s (%s ends the session)\n", conversation.local_speaker().c_str(), conversation.remote_speaker().c_str(), quit_command.data() );
        std::printf( "[focus in %s: %s]\n", tree::visual_ancestors_as_string( input_box ).c_str(), tree::visual_descendant_has_focus( root, p_focused ) ? "yes" : "no" );
        std::printf( "[enter presses %s in %s]\n", send_button.name().c_str(), tree::visual_ancestors_as_string( send_button ).c_str() );

        for ( std::string line; ; )
        {
            std::printf( "%s> ", conversation.current_speaker().c_str() );
            std::fflush( stdout );
            if ( !std::getline( std::cin, line ) || line == quit_command )
                break;
            if ( line.empty() )
                continue;
            conversation.set_pending_text( std::move( line ) );
            std::puts( conversation.send().to_string().c_str() );
        }

        std::printf( "\n%zu message(s) exchanged.\n", conversation.history().size() );
        return EXIT_SUCCESS;
    }
} // anonymous namespace

//------------------------------------------------------------------------------
} // namespace parley::chat
//------------------------------------------------------------------------------

int main()
{
    try
    {
        return parley::chat::run();
    }
    catch ( parley::error const & e )
    {
        std::fprintf( stderr, "parley-chat: %s: %s\n", parley::to_string( e.kind() ), dynamic_cast<std::exception const &>( e ).what() );
    }
    catch ( std::exception const & e )
    {
        std::fprintf( stderr, "parley-chat: %s\n", e.what() );
    }
    return EXIT_FAILURE;
}
