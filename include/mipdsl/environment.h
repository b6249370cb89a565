#pragma once
/*
===============================================================================
ENVIRONMENT — Binding and symbol environments
===============================================================================

OVERVIEW
--------
A BindingEnvironment is the ordered list of symbol -> value bindings active
at one point of a generator product. Later entries shadow earlier ones, so a
nested `for` simply appends. Each binding remembers whether a generator of
the current declaration introduced it or whether it came from the caller's
problem-level scope.

A SymbolEnvironment answers "what is this name?" for the compiler. It looks
at bindings first, then model parameters, then variable families, and
reports everything it found so the compiler can apply its ambiguity rules.

USAGE EXAMPLES
--------------
    BindingEnvironment env;
    env = env.with("s", Value("S1"));
    env.find("s")->value;                         // "S1"

    SymbolEnvironment symbols(params, registry, env);
    Resolution r = symbols.resolve("supply");
    r.kind;                                       // SymbolKind::Parameter

THREAD SAFETY
-------------
• Read-only once built

EXCEPTION SAFETY
----------------
• resolve() does not throw; callers turn Undefined into a DslError

===============================================================================
*/

#include "enum_utils.h"
#include "parameters.h"
#include "variables.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mipdsl {

MIPDSL_DECLARE_ENUM_WITH_NAMES(BindingOrigin, Generator, Caller);

/**
 * @struct Binding
 * @brief One symbol bound to a value
 */
struct Binding {
    std::string name;
    Value value;
    BindingOrigin origin = BindingOrigin::Generator;
};

/**
 * @class BindingEnvironment
 * @brief Ordered bindings; the innermost (last) binding of a name wins
 */
class BindingEnvironment {
public:
    BindingEnvironment() = default;

    /// @brief Innermost binding of a name, nullptr if unbound
    const Binding* find(std::string_view name) const noexcept
    {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->name == name)
                return &*it;
        }
        return nullptr;
    }

    bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

    void bind(std::string name, Value value, BindingOrigin origin = BindingOrigin::Generator)
    {
        entries_.push_back(Binding{std::move(name), std::move(value), origin});
    }

    /// @brief Copy with one more binding appended
    BindingEnvironment with(std::string name, Value value,
                            BindingOrigin origin = BindingOrigin::Generator) const
    {
        BindingEnvironment out = *this;
        out.bind(std::move(name), std::move(value), origin);
        return out;
    }

    /// @brief Remove the innermost binding
    void pop() noexcept
    {
        if (!entries_.empty())
            entries_.pop_back();
    }

    const std::vector<Binding>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Generator bindings as (name, rendered value), outermost first
     * @details Caller bindings are omitted; they do not vary per point.
     */
    std::vector<std::pair<std::string, std::string>> describe() const
    {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto& b : entries_) {
            if (b.origin == BindingOrigin::Generator)
                out.emplace_back(b.name, b.value.to_string());
        }
        return out;
    }

private:
    std::vector<Binding> entries_;
};

MIPDSL_DECLARE_ENUM_WITH_NAMES(SymbolKind, Binding, Parameter, VariableFamily, Undefined);

/**
 * @struct Resolution
 * @brief Result of a symbol lookup
 *
 * @details `kind` follows the lookup order. The pointers record every
 *          entity the name matched, so shadowing can be checked.
 */
struct Resolution {
    SymbolKind kind = SymbolKind::Undefined;
    const Binding* binding = nullptr;
    const Value* parameter = nullptr;
    const VariableFamily* family = nullptr;

    /// @brief The value for Binding and Parameter results
    const Value* value() const noexcept
    {
        if (kind == SymbolKind::Binding)
            return &binding->value;
        if (kind == SymbolKind::Parameter)
            return parameter;
        return nullptr;
    }
};

/**
 * @class SymbolEnvironment
 * @brief Read-only view over bindings, parameters and the variable registry
 */
class SymbolEnvironment {
public:
    SymbolEnvironment(const ParameterMap& parameters, const VariableRegistry& registry,
                      const BindingEnvironment& bindings) noexcept
        : parameters_(&parameters), registry_(&registry), bindings_(&bindings)
    {
    }

    /**
     * @brief Resolve a bare identifier
     * @complexity O(bindings + log parameters + log families)
     */
    Resolution resolve(std::string_view name) const
    {
        Resolution r;
        r.binding = bindings_->find(name);
        if (auto it = parameters_->find(name); it != parameters_->end())
            r.parameter = &it->second;
        r.family = registry_->family(name);

        if (r.binding)
            r.kind = SymbolKind::Binding;
        else if (r.parameter)
            r.kind = SymbolKind::Parameter;
        else if (r.family)
            r.kind = SymbolKind::VariableFamily;
        return r;
    }

    const ParameterMap& parameters() const noexcept { return *parameters_; }
    const VariableRegistry& registry() const noexcept { return *registry_; }
    const BindingEnvironment& bindings() const noexcept { return *bindings_; }

private:
    const ParameterMap* parameters_;
    const VariableRegistry* registry_;
    const BindingEnvironment* bindings_;
};

} // namespace mipdsl
