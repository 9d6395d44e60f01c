// Guard-clause helpers: pass-through on success, error kind and message on
// failure.
#include <parley/validation/fail_if.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// fail_if
////////////////////////////////////////////////////////////////////////////////

TEST( fail_if, passes_value_through )
{
    EXPECT_EQ( fail_if( 42, false, "x" ), 42 );
    EXPECT_EQ( fail_if( 42, []( int const v ) { return v < 0; }, "x" ), 42 );

    std::string name{ "parley" };
    auto & same{ fail_if( name, false, "name" ) };
    EXPECT_EQ( &same, &name );
}

TEST( fail_if, condition_throws_argument_error )
{
    try
    {
        (void)fail_if( 7, true, "count" );
        FAIL() << "expected argument_error";
    }
    catch ( argument_error const & e )
    {
        EXPECT_EQ( e.param_name(), "count" );
        EXPECT_EQ( e.kind(), errc::invalid_argument );
        EXPECT_STREQ( e.what(), "Argument 'count' failed condition." );
    }
}

TEST( fail_if, predicate_sees_the_value )
{
    auto const is_odd{ []( int const v ) { return v % 2 != 0; } };
    EXPECT_EQ  ( fail_if( 4, is_odd, "even" ), 4 );
    EXPECT_THROW( (void)fail_if( 5, is_odd, "even" ), argument_error );
}

TEST( fail_if, null_predicate )
{
    std::function<bool( int const & )> const empty;
    try
    {
        (void)fail_if( 1, empty, "x" );
        FAIL() << "expected argument_null_error";
    }
    catch ( argument_null_error const & e )
    {
        EXPECT_EQ( e.param_name(), "condition" );
    }
}

TEST( fail_if, failure_factory )
{
    auto const overflow{ []{ return make_failure<std::overflow_error>( "too big" ); } };
    EXPECT_EQ   ( fail_if( 3, false, overflow ), 3 );
    EXPECT_THROW( (void)fail_if( 3, true, overflow ), std::overflow_error );
    EXPECT_THROW( (void)fail_if( 3, []( int ) { return true; }, overflow ), std::overflow_error );
}

TEST( fail_if, factory_returning_null_is_an_inconsistency )
{
    auto const broken{ []{ return std::exception_ptr{}; } };
    EXPECT_THROW( (void)fail_if( 3, true, broken ), internal_inconsistency );
    // not invoked unless the condition holds
    EXPECT_NO_THROW( (void)fail_if( 3, false, broken ) );
}

////////////////////////////////////////////////////////////////////////////////
// Absent values
////////////////////////////////////////////////////////////////////////////////

TEST( fail_if_null, pointers_and_handles )
{
    int value{ 5 };
    int * const p_value{ &value };
    EXPECT_EQ( fail_if_null( p_value, "p" ), p_value );

    int * const p_null{ nullptr };
    try
    {
        (void)fail_if_null( p_null, "p_null" );
        FAIL() << "expected argument_null_error";
    }
    catch ( argument_null_error const & e )
    {
        EXPECT_EQ   ( e.param_name(), "p_null" );
        EXPECT_STREQ( e.what(), "Value cannot be null. (Parameter 'p_null')" );
    }

    EXPECT_THROW( (void)fail_if_null( std::unique_ptr<int>{}, "u" ), argument_null_error );
    EXPECT_THROW( (void)fail_if_null( std::optional<int>{}  , "o" ), argument_null_error );
    EXPECT_EQ   ( *fail_if_null( std::make_unique<int>( 3 ), "u" ), 3 );
}

TEST( fail_if_null, non_nullable_types_always_pass )
{
    EXPECT_EQ( fail_if_null( std::string{}, "s" ), "" );
    EXPECT_EQ( fail_if_null( 0, "zero" ), 0 );
}

TEST( fail_if_null_or_empty, strings )
{
    EXPECT_EQ( fail_if_null_or_empty( std::string{ "abc" }, "s" ), "abc" );
    EXPECT_THROW( (void)fail_if_null_or_empty( std::string{}, "s" ), argument_error );

    char const * const p_null{ nullptr };
    char const * const p_blank{ "" };
    EXPECT_THROW( (void)fail_if_null_or_empty( p_null , "c" ), argument_error );
    EXPECT_THROW( (void)fail_if_null_or_empty( p_blank, "c" ), argument_error );
    EXPECT_STREQ( fail_if_null_or_empty( "text", "c" ), "text" );

    try
    {
        (void)fail_if_null_or_empty( std::string{}, "title" );
        FAIL() << "expected argument_error";
    }
    catch ( argument_error const & e )
    {
        EXPECT_STREQ( e.what(), "Argument 'title' cannot be null or empty." );
    }
}

TEST( fail_if_null_or_empty, sequences )
{
    std::vector<int> const filled{ 1 };
    std::vector<int> const empty;
    std::vector<int> const * const p_absent{ nullptr };
    EXPECT_EQ   ( fail_if_null_or_empty( filled, "v" ).size(), 1U );
    EXPECT_THROW( (void)fail_if_null_or_empty( empty   , "v" ), argument_error );
    EXPECT_THROW( (void)fail_if_null_or_empty( p_absent, "v" ), argument_error );
}

TEST( fail_if_contains_null, scans_elements )
{
    int a{ 1 }, b{ 2 };
    std::vector<int *> const all { &a, &b };
    std::vector<int *> const hole{ &a, nullptr, &b };
    EXPECT_EQ( fail_if_contains_null( all, "items" ).size(), 2U );

    try
    {
        (void)fail_if_contains_null( hole, "items" );
        FAIL() << "expected argument_error";
    }
    catch ( argument_error const & e )
    {
        EXPECT_STREQ( e.what(), "Argument 'items' cannot contain null elements." );
    }

    // an absent sequence has no absent elements
    std::vector<int *> const * const p_absent{ nullptr };
    EXPECT_NO_THROW( (void)fail_if_contains_null( p_absent, "items" ) );
}

TEST( fail_if_null, failure_factory )
{
    auto const missing{ []{ return make_failure<std::invalid_argument>( "no handler" ); } };
    auto const broken { []{ return std::exception_ptr{}; } };

    int value{ 5 };
    int * const p_value{ &value };
    int * const p_null { nullptr };
    EXPECT_EQ( fail_if_null( p_value, missing ), p_value );
    EXPECT_EQ( *fail_if_null( std::optional<int>{ 2 }, missing ), 2 );

    try
    {
        (void)fail_if_null( p_null, missing );
        FAIL() << "expected std::invalid_argument";
    }
    catch ( std::invalid_argument const & e )
    {
        EXPECT_STREQ( e.what(), "no handler" );
    }
    EXPECT_THROW( (void)fail_if_null( std::unique_ptr<int>{}, missing ), std::invalid_argument );
    EXPECT_THROW( (void)fail_if_null( p_null, broken ), internal_inconsistency );
    EXPECT_NO_THROW( (void)fail_if_null( p_value, broken ) );
}

TEST( fail_if_null_or_empty, failure_factory )
{
    auto const blank { []{ return make_failure<std::length_error>( "blank title" ); } };
    auto const broken{ []{ return std::exception_ptr{}; } };

    std::string title{ "minutes" };
    EXPECT_EQ( &fail_if_null_or_empty( title, blank ), &title );
    std::vector<int> const * const p_absent{ nullptr };
    std::vector<int> const filled{ 1, 2 };
    EXPECT_EQ( fail_if_null_or_empty( &filled, blank ), &filled );

    try
    {
        (void)fail_if_null_or_empty( std::string{}, blank );
        FAIL() << "expected std::length_error";
    }
    catch ( std::length_error const & e )
    {
        EXPECT_STREQ( e.what(), "blank title" );
    }
    EXPECT_THROW( (void)fail_if_null_or_empty( p_absent, blank ), std::length_error );
    EXPECT_THROW( (void)fail_if_null_or_empty( std::vector<int>{}, broken ), internal_inconsistency );
    EXPECT_NO_THROW( (void)fail_if_null_or_empty( filled, broken ) );
}

TEST( fail_if_contains_null, failure_factory )
{
    auto const hole  { []{ return make_failure<std::domain_error>( "missing recipient" ); } };
    auto const broken{ []{ return std::exception_ptr{}; } };

    int a{ 1 }, b{ 2 };
    std::vector<int *> const all { &a, &b };
    std::vector<int *> const gaps{ &a, nullptr };
    EXPECT_EQ( &fail_if_contains_null( all, hole ), &all );

    try
    {
        (void)fail_if_contains_null( gaps, hole );
        FAIL() << "expected std::domain_error";
    }
    catch ( std::domain_error const & e )
    {
        EXPECT_STREQ( e.what(), "missing recipient" );
    }
    EXPECT_THROW( (void)fail_if_contains_null( &gaps, hole ), std::domain_error );
    EXPECT_THROW( (void)fail_if_contains_null( gaps, broken ), internal_inconsistency );
    EXPECT_NO_THROW( (void)fail_if_contains_null( all, broken ) );
}

////////////////////////////////////////////////////////////////////////////////
// Numeric bounds
////////////////////////////////////////////////////////////////////////////////

TEST( fail_if_outside_range, inclusive_bounds )
{
    EXPECT_EQ( fail_if_outside_range(  5, 1, 10, "x" ),  5 );
    EXPECT_EQ( fail_if_outside_range(  1, 1, 10, "x" ),  1 );
    EXPECT_EQ( fail_if_outside_range( 10, 1, 10, "x" ), 10 );
    EXPECT_THROW( (void)fail_if_outside_range(  0, 1, 10, "x" ), argument_out_of_range );
}

TEST( fail_if_outside_range, reports_value_and_range )
{
    try
    {
        (void)fail_if_outside_range( 11, 1, 10, "x" );
        FAIL() << "expected argument_out_of_range";
    }
    catch ( argument_out_of_range const & e )
    {
        EXPECT_EQ   ( e.param_name  (), "x"  );
        EXPECT_EQ   ( e.actual_value(), "11" );
        EXPECT_EQ   ( e.kind(), errc::out_of_range );
        EXPECT_STREQ( e.what(), "Argument 'x' must be within the range 1 - 10 (inclusive). Actual value: 11." );
    }
    // also catchable as the base kinds
    EXPECT_THROW( (void)fail_if_outside_range( 2.5, 0.0, 1.0, "ratio" ), std::invalid_argument );
}

TEST( fail_if_negative, signed_and_unsigned )
{
    EXPECT_EQ   ( fail_if_negative( 0, "n" ), 0 );
    EXPECT_THROW( (void)fail_if_negative( -1, "n" ), argument_error );
    EXPECT_EQ   ( fail_if_negative( 3U, "n" ), 3U );

    EXPECT_EQ   ( fail_if_not_positive( 1, "n" ), 1 );
    EXPECT_THROW( (void)fail_if_not_positive( 0   , "n" ), argument_error );
    EXPECT_THROW( (void)fail_if_not_positive( -0.5, "n" ), argument_error );
}

////////////////////////////////////////////////////////////////////////////////
// Type requirements
////////////////////////////////////////////////////////////////////////////////

namespace
{
    struct base    { virtual ~base() = default; };
    struct derived : base {};
    struct no_default { explicit no_default( int ) {} };
} // anonymous namespace

static_assert(  assignable_to<derived *, base *>    );
static_assert( !assignable_to<base *   , derived *> );

template <typename T>
concept default_constructor_checkable = requires{ fail_if_missing_default_constructor<T>( "T" ); };
static_assert(  default_constructor_checkable<std::string> );
static_assert( !default_constructor_checkable<no_default>  );

TEST( fail_if_not_assignable_to, passes_compatible_values )
{
    derived d;
    derived * const p_d{ &d };
    base * const p_b{ fail_if_not_assignable_to<base *>( p_d, "p_d" ) };
    EXPECT_EQ( p_b, &d );

    [[ maybe_unused ]] auto const tag{ fail_if_missing_default_constructor<derived>( "derived" ) };
    static_assert( std::is_same_v<decltype( tag )::type, derived> );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
