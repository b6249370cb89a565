#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration utilities for mipdsl
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a COUNT sentinel, a size constant
and a compile-time name table. The library uses them for every closed set of
labels it prints: error kinds, variable types, constraint senses, objective
directions and solve failure kinds.

KEY COMPONENTS
--------------
• MIPDSL_DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT
• MIPDSL_DECLARE_ENUM_WITH_NAMES: the above + <Name>_NAMES + to_string()
• EnumArray<Enum, T>: fixed array indexed by an enumerator
• enum_size / is_valid_enum_value / enum_from_value / enum_from_name

USAGE EXAMPLES
--------------
    MIPDSL_DECLARE_ENUM_WITH_NAMES(Color, Red, Green, Blue);

    static_assert(Color_COUNT == 3);
    std::string_view n = to_string(Color::Green);      // "Green"
    auto c = enum_from_name<Color>("Blue", Color_NAMES);   // Color::Blue

    EnumArray<Color, int> hits{};
    hits[Color::Red] += 1;

DEPENDENCIES
------------
• <array>, <cstddef>, <optional>, <string_view>, <type_traits>

THREAD SAFETY
-------------
• All generated entities are constexpr or immutable

EXCEPTION SAFETY
----------------
• Everything here is noexcept except EnumArray::at (std::out_of_range)

===============================================================================
*/

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace mipdsl {

namespace enum_detail {

    /// @brief Split a stringized enumerator list ("A, B, C") into names
    template<std::size_t N>
    constexpr std::array<std::string_view, N> split_names(std::string_view list) noexcept
    {
        std::array<std::string_view, N> out{};
        std::size_t pos = 0;
        for (std::size_t i = 0; i < N; ++i) {
            while (pos < list.size() && (list[pos] == ' ' || list[pos] == ','))
                ++pos;
            std::size_t end = pos;
            while (end < list.size() && list[end] != ',' && list[end] != ' ')
                ++end;
            out[i] = list.substr(pos, end - pos);
            pos = end;
        }
        return out;
    }

} // namespace enum_detail

} // namespace mipdsl

/**
 * @macro MIPDSL_DECLARE_ENUM_WITH_COUNT
 * @brief Declares `enum class Name { ..., COUNT }` and `Name_COUNT`
 *
 * @note COUNT is always the last enumerator and is not a domain value.
 */
#define MIPDSL_DECLARE_ENUM_WITH_COUNT(Name, ...)                          \
    enum class Name { __VA_ARGS__, COUNT };                                \
    inline constexpr std::size_t Name##_COUNT =                            \
        static_cast<std::size_t>(Name::COUNT)

/**
 * @macro MIPDSL_DECLARE_ENUM_WITH_NAMES
 * @brief Like MIPDSL_DECLARE_ENUM_WITH_COUNT, plus a name table and to_string
 *
 * @details
 * Expands to the enum, `Name_COUNT`, `Name_NAMES` (an array of
 * std::string_view holding the enumerator spellings) and an ADL-visible
 * `to_string(Name)` returning the spelling, or "COUNT" for the sentinel.
 * Must be used at namespace scope.
 *
 * @example
 *     MIPDSL_DECLARE_ENUM_WITH_NAMES(Sense, LessEqual, GreaterEqual, Equal);
 *     to_string(Sense::Equal);   // "Equal"
 */
#define MIPDSL_DECLARE_ENUM_WITH_NAMES(Name, ...)                          \
    MIPDSL_DECLARE_ENUM_WITH_COUNT(Name, __VA_ARGS__);                     \
    inline constexpr std::array<std::string_view, Name##_COUNT>            \
        Name##_NAMES = ::mipdsl::enum_detail::split_names<Name##_COUNT>(   \
            #__VA_ARGS__);                                                 \
    constexpr std::string_view to_string(Name value) noexcept              \
    {                                                                      \
        const auto i = static_cast<std::size_t>(value);                    \
        return i < Name##_COUNT ? Name##_NAMES[i] : std::string_view("COUNT"); \
    }                                                                      \
    static_assert(Name##_COUNT > 0, #Name " needs at least one enumerator")

namespace mipdsl {

/**
 * @brief Number of user enumerators of an enum declared with the macros above
 */
template<typename Enum>
    requires std::is_enum_v<Enum>
constexpr std::size_t enum_size() noexcept
{
    return static_cast<std::size_t>(Enum::COUNT);
}

/**
 * @brief True if the raw integer maps to a user enumerator (COUNT excluded)
 */
template<typename Enum>
    requires std::is_enum_v<Enum>
constexpr bool is_valid_enum_value(std::underlying_type_t<Enum> raw) noexcept
{
    return raw >= 0 && static_cast<std::size_t>(raw) < enum_size<Enum>();
}

/**
 * @brief Convert a raw integer to an enumerator, nullopt when out of range
 */
template<typename Enum>
    requires std::is_enum_v<Enum>
constexpr std::optional<Enum> enum_from_value(std::underlying_type_t<Enum> raw) noexcept
{
    if (!is_valid_enum_value<Enum>(raw))
        return std::nullopt;
    return static_cast<Enum>(raw);
}

/**
 * @brief Look an enumerator up by its spelling in a name table
 *
 * @example
 *     enum_from_name<VarType>("Binary", VarType_NAMES);   // VarType::Binary
 */
template<typename Enum, std::size_t N>
    requires std::is_enum_v<Enum>
constexpr std::optional<Enum> enum_from_name(std::string_view name,
                                             const std::array<std::string_view, N>& names) noexcept
{
    for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == name)
            return static_cast<Enum>(i);
    }
    return std::nullopt;
}

/**
 * @class EnumArray
 * @brief Fixed-size array indexed directly by enumerators
 */
template<typename Enum, typename T>
    requires std::is_enum_v<Enum>
struct EnumArray {
    std::array<T, enum_size<Enum>()> data{};

    constexpr T& operator[](Enum e) noexcept { return data[static_cast<std::size_t>(e)]; }
    constexpr const T& operator[](Enum e) const noexcept { return data[static_cast<std::size_t>(e)]; }

    T& at(Enum e)
    {
        const auto i = static_cast<std::size_t>(e);
        if (i >= data.size())
            throw std::out_of_range("EnumArray::at: enumerator out of range");
        return data[i];
    }

    static constexpr std::size_t size() noexcept { return enum_size<Enum>(); }

    auto begin() noexcept { return data.begin(); }
    auto end() noexcept { return data.end(); }
    auto begin() const noexcept { return data.begin(); }
    auto end() const noexcept { return data.end(); }
};

} // namespace mipdsl
