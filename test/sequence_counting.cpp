// Occurrence counting, duplicate object detection and distinct-by-key
// selection.
#include <parley/sequence/counting.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <ranges>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

namespace
{
    template <typename T>
    std::map<T, std::size_t> as_map( std::vector<item_count<T>> const & counts )
    {
        std::map<T, std::size_t> sorted;
        for ( auto const & [ item, count ] : counts )
            EXPECT_TRUE( sorted.emplace( item, count ).second ) << "group reported twice";
        return sorted;
    }

    struct person
    {
        std::string name;
        int         age;

        bool operator==( person const & ) const = default;
    }; // struct person
} // anonymous namespace

////////////////////////////////////////////////////////////////////////////////
// get_counts_by_item
////////////////////////////////////////////////////////////////////////////////

TEST( get_counts_by_item, groups_equal_elements )
{
    std::vector<std::string> const letters{ "a", "b", "a", "c", "b", "a" };
    auto const counts{ as_map( get_counts_by_item( letters ) ) };
    std::map<std::string, std::size_t> const expected{ { "a", 3 }, { "b", 2 }, { "c", 1 } };
    EXPECT_EQ( counts, expected );
}

TEST( get_counts_by_item, lazy_ranges_and_handles )
{
    auto const counts{ as_map( get_counts_by_item( std::views::iota( 0, 9 ) | std::views::transform( []( int const v ) { return v % 3; } ) ) ) };
    std::map<int, std::size_t> const expected{ { 0, 3 }, { 1, 3 }, { 2, 3 } };
    EXPECT_EQ( counts, expected );

    auto const p_numbers{ std::make_unique<std::vector<int>>( std::vector<int>{ 4, 4 } ) };
    auto const from_handle{ get_counts_by_item( p_numbers ) };
    ASSERT_EQ( from_handle.size(), 1U );
    EXPECT_EQ( from_handle.front(), ( item_count<int>{ 4, 2 } ) );

    std::vector<int> const * const p_absent{ nullptr };
    EXPECT_THROW( (void)get_counts_by_item( p_absent ), argument_null_error );
    EXPECT_TRUE ( get_counts_by_item( std::vector<int>{} ).empty() );
}

TEST( get_counts_by_item, custom_hash_and_equality )
{
    std::vector<person> const people{ { "ann", 30 }, { "bob", 30 }, { "cid", 41 } };
    auto const by_age_hash { []( person const & p ) { return std::hash<int>{}( p.age ); } };
    auto const by_age_equal{ []( person const & l, person const & r ) { return l.age == r.age; } };
    auto const counts{ get_counts_by_item( people, by_age_hash, by_age_equal ) };

    ASSERT_EQ( counts.size(), 2U );
    auto const thirty{ std::ranges::find_if( counts, []( auto const & entry ) { return entry.first.age == 30; } ) };
    ASSERT_NE( thirty, counts.end() );
    EXPECT_EQ( thirty->second, 2U );
}

////////////////////////////////////////////////////////////////////////////////
// contains_multiple_references_to_same_object
////////////////////////////////////////////////////////////////////////////////

TEST( contains_multiple_references_to_same_object, pointers )
{
    auto const shared{ std::make_shared<person>( "ann", 30 ) };
    auto const twin  { std::make_shared<person>( "ann", 30 ) };

    EXPECT_TRUE ( contains_multiple_references_to_same_object( std::vector{ shared, twin, shared } ) );
    EXPECT_FALSE( contains_multiple_references_to_same_object( std::vector{ shared, twin } ) );

    person a{ "a", 1 }, b{ "a", 1 };
    EXPECT_TRUE ( contains_multiple_references_to_same_object( std::vector<person *>{ &a, &b, &a } ) );
    EXPECT_FALSE( contains_multiple_references_to_same_object( std::vector<person *>{ &a, &b } ) );
}

TEST( contains_multiple_references_to_same_object, references )
{
    person a{ "a", 1 }, b{ "a", 1 };
    using ref = std::reference_wrapper<person const>;
    EXPECT_TRUE ( contains_multiple_references_to_same_object( std::vector<ref>{ a, a } ) );
    EXPECT_FALSE( contains_multiple_references_to_same_object( std::vector<ref>{ a, b } ) );

    // equal values stored by value are distinct objects
    std::vector<person> const values{ a, a, a };
    EXPECT_FALSE( contains_multiple_references_to_same_object( values ) );
}

////////////////////////////////////////////////////////////////////////////////
// distinct_by
////////////////////////////////////////////////////////////////////////////////

TEST( distinct_by, first_per_key_in_order )
{
    std::vector<person> const people{ { "ann", 30 }, { "bob", 41 }, { "cid", 30 }, { "dan", 17 }, { "eve", 41 } };
    auto const distinct{ distinct_by( people, &person::age ) };
    std::vector<person> const expected{ { "ann", 30 }, { "bob", 41 }, { "dan", 17 } };
    EXPECT_EQ( distinct, expected );

    auto const by_initial{ distinct_by( std::vector<std::string>{ "pear", "plum", "apple", "peach", "avocado" }, []( std::string const & s ) { return s.front(); } ) };
    EXPECT_EQ( by_initial, ( std::vector<std::string>{ "pear", "apple" } ) );

    EXPECT_TRUE( distinct_by( std::vector<int>{}, std::negate<>{} ).empty() );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
