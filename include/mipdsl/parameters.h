#pragma once
/*
===============================================================================
PARAMETERS — Model parameter values for mipdsl
===============================================================================

OVERVIEW
--------
Model parameters are externally supplied constant data: scalars, lists and
key/value maps nested to any depth. Expressions read them through symbols
(`supply`), key access (`supply[s]`) and field access (`food.calories`).
Generator bindings hold the same Value type, and so do the metadata and
solver-setting stores.

KEY COMPONENTS
--------------
• Scalar: integer, real or string. Index values and map keys are Scalars.
• Value: empty, Scalar, List or Map. Lists and maps are immutable and shared.
• ParameterMap: named Values (std::map, ordered for deterministic output)

DESIGN PHILOSOPHY
-----------------
• Integers and reals stay distinct: Scalar(1) != Scalar(1.0)
• Containers are immutable after construction so copies are cheap
• Typed access mirrors a small any-like API: is<T>, try_get, get, get_or

USAGE EXAMPLES
--------------
    ParameterMap params;
    params["supply"] = Value::map({{"S1", 20}, {"S2", 25}});
    params["sizes"]  = Value::list({3, 5, 8});

    const Value& s = params["supply"];
    s.find("S2")->as_number();      // 25.0
    params["sizes"].at(1);          // Value(5)

    Value v = 3;
    v.is<long long>();              // true
    v.get_or<std::string>("none");  // "none"

DEPENDENCIES
------------
• <variant>, <map>, <vector>, <memory>, <format>

THREAD SAFETY
-------------
• Values are safe to read concurrently; containers are shared immutable data

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_variant_access on type mismatch
• at() throws std::out_of_range; find() never throws
• Everything else offers the strong guarantee

===============================================================================
*/

#include <cmath>
#include <concepts>
#include <cstddef>
#include <format>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mipdsl {

// =============================================================================
// SCALAR
// =============================================================================

/**
 * @class Scalar
 * @brief Integer, real or string atom
 *
 * @details
 * Scalars are ordered first by alternative (integer < real < string) and then
 * by value, which gives maps and index domains a total, deterministic order.
 */
class Scalar {
public:
    using Storage = std::variant<long long, double, std::string>;

    Scalar() : v_(0LL) {}

    template<std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    Scalar(T v) : v_(static_cast<long long>(v)) {}

    template<std::floating_point T>
    Scalar(T v) : v_(static_cast<double>(v)) {}

    Scalar(std::string v) : v_(std::move(v)) {}
    Scalar(std::string_view v) : v_(std::string(v)) {}
    Scalar(const char* v) : v_(std::string(v)) {}

    bool is_integer() const noexcept { return std::holds_alternative<long long>(v_); }
    bool is_real() const noexcept { return std::holds_alternative<double>(v_); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v_); }
    bool is_number() const noexcept { return !is_string(); }

    /// @brief True for integers and for whole reals representable as long long
    bool is_integral() const noexcept
    {
        if (is_integer())
            return true;
        if (is_real()) {
            double d = std::get<double>(v_);
            return std::isfinite(d) && std::floor(d) == d
                   && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
        }
        return false;
    }

    long long as_integer() const
    {
        if (is_integer())
            return std::get<long long>(v_);
        if (is_integral())
            return static_cast<long long>(std::get<double>(v_));
        throw std::bad_variant_access();
    }

    double as_number() const
    {
        if (is_integer())
            return static_cast<double>(std::get<long long>(v_));
        return std::get<double>(v_);
    }

    const std::string& as_string() const { return std::get<std::string>(v_); }

    const Storage& storage() const noexcept { return v_; }

    /**
     * @brief Raw text rendering
     * @details Integers in decimal; reals in shortest round-trip form that
     *          always shows it is a real ("3.0", "2.5", "1e+30", "inf");
     *          strings verbatim.
     */
    std::string to_string() const
    {
        if (is_integer())
            return std::format("{}", std::get<long long>(v_));
        if (is_real())
            return render_real(std::get<double>(v_));
        return std::get<std::string>(v_);
    }

    static std::string render_real(double d)
    {
        std::string s = std::format("{}", d);
        if (s.find_first_of(".eEn") == std::string::npos)
            s += ".0";
        return s;
    }

    friend bool operator==(const Scalar& a, const Scalar& b) { return a.v_ == b.v_; }
    friend bool operator!=(const Scalar& a, const Scalar& b) { return !(a.v_ == b.v_); }
    friend bool operator<(const Scalar& a, const Scalar& b) { return a.v_ < b.v_; }

private:
    Storage v_;
};

class Value;

using List = std::vector<Value>;
using Map = std::map<Scalar, Value>;

// =============================================================================
// VALUE
// =============================================================================

/**
 * @class Value
 * @brief Parameter value: empty, scalar, list or map
 */
class Value {
public:
    using Storage = std::variant<std::monostate, Scalar, std::shared_ptr<const List>,
                                 std::shared_ptr<const Map>>;

    Value() = default;
    Value(Scalar s) : v_(std::move(s)) {}

    template<std::integral T>
        requires(!std::same_as<T, bool> && !std::same_as<T, char>)
    Value(T v) : v_(Scalar(v)) {}

    template<std::floating_point T>
    Value(T v) : v_(Scalar(v)) {}

    Value(std::string v) : v_(Scalar(std::move(v))) {}
    Value(std::string_view v) : v_(Scalar(v)) {}
    Value(const char* v) : v_(Scalar(v)) {}

    Value(List items) : v_(std::make_shared<const List>(std::move(items))) {}
    Value(Map entries) : v_(std::make_shared<const Map>(std::move(entries))) {}

    static Value list(std::initializer_list<Value> items) { return Value(List(items)); }

    static Value map(std::initializer_list<std::pair<const Scalar, Value>> entries)
    {
        return Value(Map(entries));
    }

    // ------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------

    bool has_value() const noexcept { return !std::holds_alternative<std::monostate>(v_); }
    bool is_scalar() const noexcept { return std::holds_alternative<Scalar>(v_); }
    bool is_list() const noexcept { return std::holds_alternative<std::shared_ptr<const List>>(v_); }
    bool is_map() const noexcept { return std::holds_alternative<std::shared_ptr<const Map>>(v_); }
    bool is_number() const noexcept { return is_scalar() && std::get<Scalar>(v_).is_number(); }
    bool is_string() const noexcept { return is_scalar() && std::get<Scalar>(v_).is_string(); }

    /**
     * @brief Type test for the scalar alternatives and the containers
     * @tparam T long long, double, std::string, List or Map
     */
    template<typename T>
    bool is() const noexcept
    {
        if constexpr (std::same_as<T, List>)
            return is_list();
        else if constexpr (std::same_as<T, Map>)
            return is_map();
        else
            return is_scalar() && std::holds_alternative<T>(std::get<Scalar>(v_).storage());
    }

    // ------------------------------------------------------------------------
    // Typed access
    // ------------------------------------------------------------------------

    template<typename T>
    const T& get() const
    {
        if constexpr (std::same_as<T, List>)
            return *std::get<std::shared_ptr<const List>>(v_);
        else if constexpr (std::same_as<T, Map>)
            return *std::get<std::shared_ptr<const Map>>(v_);
        else
            return std::get<T>(std::get<Scalar>(v_).storage());
    }

    template<typename T>
    std::optional<std::reference_wrapper<const T>> try_get() const noexcept
    {
        if (!is<T>())
            return std::nullopt;
        return std::cref(get<T>());
    }

    template<typename T>
    T get_or(const T& default_value) const
    {
        if (is<T>())
            return get<T>();
        return default_value;
    }

    const Scalar& as_scalar() const { return std::get<Scalar>(v_); }
    const List& as_list() const { return get<List>(); }
    const Map& as_map() const { return get<Map>(); }

    /// @brief Numeric value of an integer or real scalar
    double as_number() const { return as_scalar().as_number(); }

    std::optional<double> try_number() const noexcept
    {
        if (!is_number())
            return std::nullopt;
        return std::get<Scalar>(v_).as_number();
    }

    /// @brief Number of list elements or map entries, 0 for scalars
    std::size_t size() const noexcept
    {
        if (is_list())
            return as_list().size();
        if (is_map())
            return as_map().size();
        return 0;
    }

    // ------------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------------

    /**
     * @brief Map lookup; nullptr if this is not a map or the key is absent
     * @details An integral real key also matches the equal integer key.
     */
    const Value* find(const Scalar& key) const noexcept
    {
        if (!is_map())
            return nullptr;
        const Map& m = as_map();
        if (auto it = m.find(key); it != m.end())
            return &it->second;
        if (key.is_real() && key.is_integral()) {
            if (auto it = m.find(Scalar(key.as_integer())); it != m.end())
                return &it->second;
        }
        return nullptr;
    }

    /// @brief List element at a 0-based position; nullptr when out of range
    const Value* element(long long index) const noexcept
    {
        if (!is_list() || index < 0)
            return nullptr;
        const List& l = as_list();
        if (static_cast<std::size_t>(index) >= l.size())
            return nullptr;
        return &l[static_cast<std::size_t>(index)];
    }

    const Value& at(std::size_t index) const
    {
        const Value* v = element(static_cast<long long>(index));
        if (!v)
            throw std::out_of_range(std::format("Value::at: index {} out of range", index));
        return *v;
    }

    const Value& at(const Scalar& key) const
    {
        const Value* v = find(key);
        if (!v)
            throw std::out_of_range(std::format("Value::at: missing key '{}'", key.to_string()));
        return *v;
    }

    /**
     * @brief Enumerate the values a generator ranges over
     * @return list elements, or map keys in key order; nullopt for scalars
     */
    std::optional<std::vector<Value>> enumerate() const
    {
        if (is_list())
            return as_list();
        if (is_map()) {
            std::vector<Value> keys;
            keys.reserve(as_map().size());
            for (const auto& [k, _] : as_map())
                keys.emplace_back(k);
            return keys;
        }
        return std::nullopt;
    }

    /// @brief Human-readable rendering: 3, 2.5, S1, [1, 2], {S1: 20}
    std::string to_string() const
    {
        if (is_scalar())
            return as_scalar().to_string();
        if (is_list()) {
            std::string out = "[";
            bool first = true;
            for (const auto& v : as_list()) {
                if (!first)
                    out += ", ";
                first = false;
                out += v.to_string();
            }
            return out + "]";
        }
        if (is_map()) {
            std::string out = "{";
            bool first = true;
            for (const auto& [k, v] : as_map()) {
                if (!first)
                    out += ", ";
                first = false;
                out += k.to_string() + ": " + v.to_string();
            }
            return out + "}";
        }
        return "<empty>";
    }

    void reset() noexcept { v_ = std::monostate{}; }

    friend bool operator==(const Value& a, const Value& b)
    {
        if (a.v_.index() != b.v_.index())
            return false;
        if (a.is_scalar())
            return a.as_scalar() == b.as_scalar();
        if (a.is_list())
            return a.as_list() == b.as_list();
        if (a.is_map())
            return a.as_map() == b.as_map();
        return true;
    }

private:
    Storage v_;
};

/// @brief Named parameter store
using ParameterMap = std::map<std::string, Value, std::less<>>;

} // namespace mipdsl
