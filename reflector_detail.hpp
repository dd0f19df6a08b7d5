#pragma once

#include <type_traits>
#include <tuple>
#include <utility>
#include <concepts>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/pfr.hpp>
#include "fixed_string.hpp"

namespace reflector
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name> class Field;
template <typename T> class Channel;
class Any;
class Value;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

/**
 * @brief Trait to check if a lambda can be invoked with a given type
 *
 * Provides a nested Predicate template that evaluates to true_type if
 * Lambda can be called with an argument of type T.
 */
template <typename Lambda>
struct DoesLambdaSupportType
{
    template <typename T>
    struct Predicate : std::bool_constant<requires { std::declval<Lambda>()(std::declval<T>()); }> {};
};

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name> struct is_field_helper<Field<T, Name>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

//-----------------------------------------------------------------------------
// Standard library shape detection
//-----------------------------------------------------------------------------

template <typename T> struct is_std_array : std::false_type {};
template <typename T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T> struct is_duration : std::false_type {};
template <typename Rep, typename Period> struct is_duration<std::chrono::duration<Rep, Period>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_shared_ptr : std::false_type {};
template <typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

/// The type a pointer-like T refers to
template <typename T> struct pointee_of { using type = typename T::element_type; };
template <typename T> struct pointee_of<T*> { using type = T; };
template <typename T> struct pointee_of<std::optional<T>> { using type = T; };

/// Types that can be aggregate-enumerated by Boost.PFR without tripping its static asserts
template <typename T>
constexpr bool kIsPfrCandidate = std::is_class_v<T> && std::is_aggregate_v<T> && ! std::is_union_v<T>
                              && ! is_std_array<T>::value && ! std::is_polymorphic_v<T>;

/// Returns the number of Field<> members in struct T
template <typename T>
constexpr std::size_t num_fields()
{
    if constexpr (kIsPfrCandidate<T>)
        return std::tuple_size_v<decltype(filter_tuple<is_field>(boost::pfr::structure_tie(std::declval<T&>())))>;

    return 0;
}

/// True for structs built out of Field<> members
template <typename T>
constexpr bool kIsRecord = num_fields<T>() >= 1;

/// Byte sequences are reinterpreted as text rather than formatted element by element
template <typename T>
constexpr bool kIsByte = std::is_same_v<T, std::uint8_t> || std::is_same_v<T, std::byte>;

/// Types with a canonical "render as text" member
template <typename T>
concept Stringer = requires (T const& t) { { t.toString() } -> std::convertible_to<std::string>; };

template <typename T>
concept OStreamable = requires (std::ostream& o, T const& t) { o << t; };

//-----------------------------------------------------------------------------
// Tuple helpers used by Value::visit
//-----------------------------------------------------------------------------

template<template<typename, typename> class Cls, typename T>
struct BindFirst
{
    template <typename U>
    struct Result
    {
        using type = Cls<T, U>;
    };
};

/// Helper to transform tuple element types
template <typename Tuple, template<typename> class Transform>
struct transform_tuple;

template <typename... Ts, template<typename> class Transform>
struct transform_tuple<std::tuple<Ts...>, Transform> {
    using type = std::tuple<typename Transform<Ts>::type...>;
};

// Helper class to apply a variadic template to the element types of a tuple
template <template<typename...> class Transform, typename Tuple>
struct apply_tuple;

template <template<typename...> class Transform, typename... Ts>
struct apply_tuple<Transform, std::tuple<Ts...>> {
    using type = Transform<Ts...>;
};

template <typename T> struct add_const_lvalue_ref { using type = T const&; };
} // namespace detail

} // namespace reflector
