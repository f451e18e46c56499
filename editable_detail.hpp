#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include "fixed_string.hpp"

namespace editable
{

// Forward declarations needed by detail namespace
template <fixstr::fixed_string Name> struct Field;
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
        // Helper that returns either a single-element tuple or empty tuple
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
    struct Predicate : std::bool_constant<std::is_invocable_v<Lambda, T>> {};
};

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <fixstr::fixed_string Name> struct is_field_helper<Field<Name>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

//-----------------------------------------------------------------------------
// Compile-time field lookup by name
//-----------------------------------------------------------------------------

/**
 * @brief Position of the field called FieldName in a tuple of Field<> types
 *
 * value equals the number of fields if no field carries that name.
 */
template <fixstr::fixed_string FieldName, typename Tuple>
struct FieldIndex;

template <fixstr::fixed_string FieldName, typename... Fields>
struct FieldIndex<FieldName, std::tuple<Fields...>>
{
    static constexpr std::size_t value = std::invoke([]
    {
        constexpr std::string_view wanted = FieldName;
        constexpr std::array<bool, sizeof...(Fields)> matches = {{ (Fields::fieldname() == wanted)... }};
        return static_cast<std::size_t>(std::distance(matches.begin(), std::find(matches.begin(), matches.end(), true)));
    });
};

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

// Helper class to transform a tuple to a variant
template <template<typename...> class Transform, typename Tuple>
struct apply_tuple;

template <template<typename...> class Transform, typename... Ts>
struct apply_tuple<Transform, std::tuple<Ts...>> {
    using type = Transform<Ts...>;
};

template <typename T> struct add_lvalue_ref { using type = T&; };
template <typename T> struct add_const_lvalue_ref { using type = T const&; };

//-----------------------------------------------------------------------------
// Numeric classification of the fundamental value types
//-----------------------------------------------------------------------------

/// bool and std::int64_t compare as exact integers
template <typename T>
inline constexpr bool kIsIntegral = std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t>;

/// integers and doubles compare with each other by numeric value
template <typename T>
inline constexpr bool kIsNumeric = kIsIntegral<T> || std::is_same_v<T, double>;
} // namespace detail

} // namespace editable
