#pragma once
/*
===============================================================================
NAMING — Canonical names for variable instances and constraints
===============================================================================

OVERVIEW
--------
Maps a variable family and an index tuple to a canonical identifier such as
`ship(S1,C2)`, generates constraint ids and automatic constraint names, and
interpolates `{symbol}` placeholders in descriptions.

Canonical names must be injective: two distinct index tuples of one family
never share a name. Each index component is rendered on its own and then
sanitized, never the joined string, so that:

    integers    -> decimal             3, -12
    reals       -> shortest real form  2.5, 3.0, 1e+30, inf
    strings     -> as-is, but escaped with "_" when the first character
                   could start a number in LP syntax (e E + - . digit),
                   when it is "_", when it is empty, or when the whole
                   string is "inf" or "nan"

Inside string components, characters that are structural in the name
(`,` `(` `)` `%`) or not permitted in LP names are percent-encoded (%2C).
The three renderings above are pairwise disjoint, which is what makes the
mapping injective.

KEY COMPONENTS
--------------
• isFamilyName: validate [A-Za-z][A-Za-z0-9_]*
• renderComponent: per-component rendering + sanitization
• canonicalName: family(c1,c2,...) or bare family for scalars
• constraintId / autoConstraintName: "c00000007", "constraint_S1_3"
• interpolate: "Supply {s}" -> "Supply S1"
• isLpName: does a name survive CPLEX LP syntax unchanged
• concat: stream-based string building for messages

USAGE EXAMPLES
--------------
    canonicalName("ship", {Scalar("S1"), Scalar("C2")});  // "ship(S1,C2)"
    canonicalName("cost", {Scalar("e5")});                // "cost(_e5)"
    canonicalName("x", {Scalar(1), Scalar(1.0)});         // "x(1,1.0)"
    canonicalName("z", {});                               // "z"
    constraintId(7);                                      // "c00000007"

DEPENDENCIES
------------
• parameters.h (Scalar), errors.h (DslError for unknown placeholders)
• <format>, <sstream>, <concepts>, <span>

THREAD SAFETY
-------------
• All functions are pure

EXCEPTION SAFETY
----------------
• interpolate throws DslError(UndefinedSymbol) for unknown placeholders
• Everything else only throws std::bad_alloc

===============================================================================
*/

#include "errors.h"
#include "parameters.h"

#include <concepts>
#include <cstddef>
#include <format>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace mipdsl {

namespace naming_detail {

    template<typename T>
    concept Streamable = requires(std::ostream& os, const T& value) {
        { os << value } -> std::same_as<std::ostream&>;
    };

    inline bool isAsciiAlpha(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    inline bool isAsciiDigit(char c) noexcept { return c >= '0' && c <= '9'; }

    /// Characters a string component may keep verbatim
    inline bool isPlainChar(char c) noexcept
    {
        if (isAsciiAlpha(c) || isAsciiDigit(c))
            return true;
        switch (c) {
            case '_': case '.': case '!': case '#': case '$': case '&':
            case '/': case ';': case '?': case '@': case '\'': case '{':
            case '}': case '|': case '~':
                return true;
            default:
                return false;
        }
    }

    /// A leading character that would let a string read as a number
    inline bool needsEscapePrefix(std::string_view s) noexcept
    {
        if (s.empty() || s == "inf" || s == "nan")
            return true;
        char c = s.front();
        return c == 'e' || c == 'E' || c == '_' || c == '+' || c == '-' || c == '.'
            || isAsciiDigit(c);
    }

    inline void percentEncode(std::string& out, char c)
    {
        out += std::format("%{:02X}", static_cast<unsigned>(static_cast<unsigned char>(c)));
    }

} // namespace naming_detail

/// Prefix marking a string component that would otherwise look numeric
inline constexpr std::string_view ESCAPE_PREFIX = "_";

/// Longest name CPLEX LP readers accept
inline constexpr std::size_t LP_NAME_LIMIT = 255;

/**
 * @brief Concatenate streamable parts into a string
 *
 * @example
 *     concat("x", '(', 3, ')');   // "x(3)"
 */
template<naming_detail::Streamable... Args>
std::string concat(const Args&... parts)
{
    std::ostringstream os;
    (os << ... << parts);
    return os.str();
}

/**
 * @brief True for family names of the form [A-Za-z][A-Za-z0-9_]*
 */
inline bool isFamilyName(std::string_view name) noexcept
{
    if (name.empty() || !naming_detail::isAsciiAlpha(name.front()))
        return false;
    for (char c : name) {
        if (!naming_detail::isAsciiAlpha(c) && !naming_detail::isAsciiDigit(c) && c != '_')
            return false;
    }
    return true;
}

/**
 * @brief Sanitize a raw string index component
 *
 * @details Percent-encodes every character outside the plain set, then adds
 *          ESCAPE_PREFIX when the original could read as a number.
 */
inline std::string sanitizeComponent(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size() + 1);
    if (naming_detail::needsEscapePrefix(raw))
        out += ESCAPE_PREFIX;
    for (char c : raw) {
        if (naming_detail::isPlainChar(c))
            out += c;
        else
            naming_detail::percentEncode(out, c);
    }
    return out;
}

/**
 * @brief Render one index value for use inside a canonical name
 */
inline std::string renderComponent(const Scalar& value)
{
    if (value.is_string())
        return sanitizeComponent(value.as_string());
    return value.to_string();
}

/**
 * @brief Canonical identifier of a variable instance
 *
 * @return `family(c1,c2,...)`, or `family` for the empty tuple
 * @complexity O(total rendered length)
 */
inline std::string canonicalName(std::string_view family, std::span<const Scalar> index)
{
    if (index.empty())
        return std::string(family);

    std::string out(family);
    out += '(';
    for (std::size_t i = 0; i < index.size(); ++i) {
        if (i > 0)
            out += ',';
        out += renderComponent(index[i]);
    }
    out += ')';
    return out;
}

/// @brief Constraint id: "c" followed by an 8-digit counter
inline std::string constraintId(std::size_t counter)
{
    return std::format("c{:08}", counter);
}

/**
 * @brief Name for a generated constraint that has no description
 * @return "constraint_<v1>_<v2>..." with raw value renderings
 */
inline std::string autoConstraintName(std::span<const Scalar> values)
{
    std::string out = "constraint";
    for (const auto& v : values) {
        out += '_';
        out += v.to_string();
    }
    return out;
}

/**
 * @brief Replace `{symbol}` placeholders using a lookup function
 *
 * @param text    Template, e.g. "Supply of {s} to {c}"
 * @param lookup  Callable `std::optional<std::string>(std::string_view)`
 *
 * @details `{{` and `}}` produce literal braces. A `{` with no matching `}`
 *          is copied literally.
 *
 * @throws DslError(UndefinedSymbol) when lookup returns nullopt
 */
template<typename Lookup>
    requires std::invocable<Lookup&, std::string_view>
std::string interpolate(std::string_view text, Lookup&& lookup)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '{' && i + 1 < text.size() && text[i + 1] == '{') {
            out += '{';
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < text.size() && text[i + 1] == '}') {
            out += '}';
            i += 2;
            continue;
        }
        if (c == '{') {
            auto close = text.find('}', i + 1);
            if (close == std::string_view::npos) {
                out.append(text.substr(i));
                break;
            }
            std::string_view name = text.substr(i + 1, close - i - 1);
            std::optional<std::string> value = lookup(name);
            if (!value) {
                throw DslError(ErrorKind::UndefinedSymbol, std::string(name),
                    std::format("'{}' in description \"{}\" is not a bound symbol", name, text));
            }
            out += *value;
            i = close + 1;
            continue;
        }
        out += c;
        ++i;
    }
    return out;
}

/**
 * @brief True if a name can be written to a CPLEX LP file unchanged
 *
 * @details LP names are at most 255 characters, do not start with a digit,
 *          a period or e/E, and use letters, digits and !"#$%&()/,.;?@_`'{}|~
 */
inline bool isLpName(std::string_view name) noexcept
{
    if (name.empty() || name.size() > LP_NAME_LIMIT)
        return false;
    char first = name.front();
    if (naming_detail::isAsciiDigit(first) || first == '.' || first == 'e' || first == 'E')
        return false;
    for (char c : name) {
        if (naming_detail::isAsciiAlpha(c) || naming_detail::isAsciiDigit(c))
            continue;
        switch (c) {
            case '!': case '"': case '#': case '$': case '%': case '&': case '(':
            case ')': case '/': case ',': case '.': case ';': case '?': case '@':
            case '_': case '`': case '\'': case '{': case '}': case '|': case '~':
                continue;
            default:
                return false;
        }
    }
    return true;
}

} // namespace mipdsl
