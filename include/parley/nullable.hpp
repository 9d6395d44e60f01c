////////////////////////////////////////////////////////////////////////////////
/// Absent-value and object-identity traits shared by the validation and
/// sequence helpers.
///
/// Contents:
///   - is_nullable<T>    : trait: can a T hold "no value"?  User specializations
///                         are intended (e.g. for handle types).
///   - nullable          : concept over is_nullable (cvref-stripped)
///   - is_null( v )      : absent test for nullables, constant false otherwise
///   - nullable_range    : a nullable handle to a range (pointer, optional...)
///   - c_string          : NUL terminated character strings
///   - identity_of( v )  : address of the object a value refers to
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

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
//------------------------------------------------------------------------------
namespace parley
{
//------------------------------------------------------------------------------

template <typename T> constexpr bool is_optional{ false };
template <typename T> constexpr bool is_optional<std::optional<T>>{ true };

template <typename T> constexpr bool is_reference_wrapper{ false };
template <typename T> constexpr bool is_reference_wrapper<std::reference_wrapper<T>>{ true };

/// Types whose values can be "absent". Deliberately a whitelist: comparing an
/// arbitrary type against nullptr also compiles for e.g. std::string (through
/// the char const * overloads) with entirely different semantics.
template <typename T> constexpr bool is_nullable{ std::is_pointer_v<T> || std::is_member_pointer_v<T> || std::is_null_pointer_v<T> };
template <typename T>             constexpr bool is_nullable<std::optional  <T   >>{ true };
template <typename T, typename D> constexpr bool is_nullable<std::unique_ptr<T, D>>{ true };
template <typename T>             constexpr bool is_nullable<std::shared_ptr<T   >>{ true };
template <typename Signature>     constexpr bool is_nullable<std::function  <Signature>>{ true };

template <typename T>
concept nullable = is_nullable<std::remove_cvref_t<T>>;

template <typename T>
[[ nodiscard ]] constexpr bool is_null( T const & value ) noexcept
{
    if constexpr ( is_optional<T> )
        return !value.has_value();
    else if constexpr ( nullable<T> )
        return value == nullptr;
    else
        return false;
}


template <typename T>
concept character = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t> || std::same_as<T, char16_t> || std::same_as<T, char32_t>;

/// NUL terminated strings: character pointers and character arrays (string
/// literals). Arrays are ranges as well, but their extent includes the
/// terminator so they are tested by their C string length instead.
template <typename T>
concept c_string =
    std::is_pointer_v<std::decay_t<T>> &&
    character<std::remove_cv_t<std::remove_pointer_t<std::decay_t<T>>>>;

/// A nullable handle (pointer, smart pointer, optional) whose target is a
/// range.
template <typename T>
concept nullable_range =
    nullable<T> && !c_string<T> &&
    requires( T const & handle ) { requires std::ranges::range<decltype( *handle )>; };


/// The address identifying the object a value refers to: the pointee for
/// pointer-like values, the referent for reference_wrappers and the value
/// itself for everything else.
template <typename T>
[[ nodiscard ]] constexpr void const * identity_of( T const & value ) noexcept
{
    if constexpr ( std::is_pointer_v<T> )
        return static_cast<void const *>( value );
    else if constexpr ( is_reference_wrapper<T> )
        return std::addressof( value.get() );
    else if constexpr ( nullable<T> && requires{ { value.get() } -> std::convertible_to<void const *>; } )
        return value.get();
    else
        return std::addressof( value );
}

//------------------------------------------------------------------------------
} // namespace parley
//------------------------------------------------------------------------------
