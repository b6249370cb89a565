#pragma once
/*
===============================================================================
ERRORS — Structured compilation errors for mipdsl
===============================================================================

OVERVIEW
--------
Every failure detected while declaring variables, compiling expressions or
assembling constraints is reported as a DslError. The error carries a kind
from a closed taxonomy, the offending symbol, the text of the offending
sub-expression and, once it has crossed a declaration boundary, the
declaration label and the generator bindings active at the time.

KEY COMPONENTS
--------------
• ErrorKind: closed taxonomy with a compile-time name table
• ErrorContext: declaration label + binding snapshot + expression text
• DslError: std::runtime_error subclass carrying kind and context

USAGE EXAMPLES
--------------
    try {
        problem.constraints({gen("s", sym("suppliers"))},
                            sum(ship(sym("s"), _)) <= sym("supplly")[sym("s")]);
    } catch (const DslError& e) {
        e.kind();                 // ErrorKind::UndefinedConstant
        e.symbol();               // "supplly"
        e.context().bindings;     // {{"s", "S1"}}
        std::cerr << e.what();
    }

    // what():
    // UndefinedConstant: 'supplly' is not a parameter
    //   in constraints #1
    //   at supplly[s]
    //   with s = S1

THREAD SAFETY
-------------
• Immutable after construction except for attach(), called by the thrower

EXCEPTION SAFETY
----------------
• Construction may throw std::bad_alloc; accessors are noexcept

===============================================================================
*/

#include "enum_utils.h"

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mipdsl {

MIPDSL_DECLARE_ENUM_WITH_NAMES(ErrorKind,
    UndefinedSymbol,
    UndefinedVariable,
    UndefinedConstant,
    AmbiguousSymbol,
    DuplicateFamily,
    InvalidBounds,
    IndexOutOfBounds,
    MissingKey,
    NonlinearExpression,
    UnsupportedOperation,
    WildcardOutsideAggregation,
    UnresolvedWildcardDomain,
    InvalidDirection,
    ArityMismatch,
    TypeMismatch,
    InvalidDomain,
    InvalidDeclaration);

/**
 * @struct ErrorContext
 * @brief Where an error happened
 */
struct ErrorContext {
    /// Declaration label, e.g. "constraints \"Supply {s}\"" or "objective"
    std::string declaration;

    /// Generator bindings active at the failure, innermost last
    std::vector<std::pair<std::string, std::string>> bindings;

    bool empty() const noexcept { return declaration.empty() && bindings.empty(); }
};

/**
 * @class DslError
 * @brief Structured compilation error
 */
class DslError : public std::runtime_error {
public:
    DslError(ErrorKind kind, std::string symbol, std::string message,
             std::string expression = {})
        : std::runtime_error(message)
        , kind_(kind)
        , symbol_(std::move(symbol))
        , message_(std::move(message))
        , expression_(std::move(expression))
    {
        render();
    }

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& symbol() const noexcept { return symbol_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& expression() const noexcept { return expression_; }
    const ErrorContext& context() const noexcept { return context_; }

    const char* what() const noexcept override { return full_.c_str(); }

    /// @brief Record the sub-expression text unless an inner frame already did
    void attachExpression(std::string text)
    {
        if (expression_.empty()) {
            expression_ = std::move(text);
            render();
        }
    }

    /// @brief Record the binding snapshot unless an inner frame already did
    void attachBindings(std::vector<std::pair<std::string, std::string>> bindings)
    {
        if (context_.bindings.empty() && !bindings.empty()) {
            context_.bindings = std::move(bindings);
            render();
        }
    }

    /// @brief Record the enclosing declaration unless already set
    void attachDeclaration(std::string label)
    {
        if (context_.declaration.empty()) {
            context_.declaration = std::move(label);
            render();
        }
    }

private:
    void render()
    {
        full_ = std::format("{}: {}", to_string(kind_), message_);
        if (!context_.declaration.empty())
            full_ += std::format("\n  in {}", context_.declaration);
        if (!expression_.empty())
            full_ += std::format("\n  at {}", expression_);
        if (!context_.bindings.empty()) {
            full_ += "\n  with ";
            bool first = true;
            for (const auto& [name, value] : context_.bindings) {
                if (!first)
                    full_ += ", ";
                first = false;
                full_ += std::format("{} = {}", name, value);
            }
        }
    }

    ErrorKind kind_;
    std::string symbol_;
    std::string message_;
    std::string expression_;
    ErrorContext context_;
    std::string full_;
};

} // namespace mipdsl
