// Change-detecting assignment.
#include <parley/property.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <string>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

TEST( set_if_different, writes_only_on_change )
{
    std::string title{ "draft" };
    EXPECT_FALSE( set_if_different( title, "draft" ) );
    EXPECT_EQ   ( title, "draft" );
    EXPECT_TRUE ( set_if_different( title, std::string{ "final" } ) );
    EXPECT_EQ   ( title, "final" );
    EXPECT_FALSE( set_if_different( title, std::string{ "final" } ) );
}

TEST( set_if_different, custom_equality )
{
    double position{ 1.0 };
    auto const close_enough{ []( double const l, double const r ) { return std::abs( l - r ) < 0.01; } };
    EXPECT_FALSE( set_if_different( position, 1.001, close_enough ) );
    EXPECT_EQ   ( position, 1.0 );
    EXPECT_TRUE ( set_if_different( position, 1.5, close_enough ) );
    EXPECT_EQ   ( position, 1.5 );
}

TEST( set_if_different, null_equality_checker )
{
    int value{ 0 };
    std::function<bool( int const &, int const & )> const no_checker;
    try
    {
        (void)set_if_different( value, 1, no_checker );
        FAIL() << "expected argument_null_error";
    }
    catch ( argument_null_error const & e )
    {
        EXPECT_EQ( e.param_name(), "equality_checker" );
    }
    EXPECT_EQ( value, 0 );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
