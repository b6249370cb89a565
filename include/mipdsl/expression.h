#pragma once
/*
===============================================================================
EXPRESSION — Symbolic expression trees and the builder front end
===============================================================================

OVERVIEW
--------
Expressions are immutable trees of tagged-variant nodes shared through
std::shared_ptr<const Node>. They are produced by a small builder API and
operator overloads, and consumed by the ExpressionCompiler. Nothing here
knows about variables, parameters or polynomials: a `Call` node is just a
name with arguments until the compiler resolves it.

Node kinds:

    Literal   3, 2.5, "S1", or any parameter Value embedded directly
    Symbol    s, supply, n
    Wildcard  _ (aggregate over every value of this index position)
    Call      ship(s, c)           variable access
    Access    supply[s]            list/map lookup
    Field     food.calories        string-key map lookup
    Negate    -a
    Binary    a + b, a - b, a * b, a / b
    Compare   a <= b, a >= b, a == b, a < b, a > b, a != b
    Logical   a && b, a || b, !a
    Sum       sum(body)
    For       for s <- S, c <- C if cond: body
    Range     first..last (inclusive)
    ListOf    [a, b, c]

KEY COMPONENTS
--------------
• Expr: handle to a shared node; implicit from numbers and strings
• Clause: generator clause (symbol, domain, optional filter)
• Family: callable helper producing Call nodes, `ship(s, c)`
• Builders: lit, str, sym, wildcard, call, sum, forall, gen, range, list
• toString(): readable rendering used in error messages
• references(): free-symbol test used to detect dependent generators

USAGE EXAMPLES
--------------
    Family ship("ship");
    auto s = sym("s"), c = sym("c");
    const Expr _ = wildcard();

    // sum(ship(s, _)) <= supply[s]
    Expr supplyRow = sum(ship(s, _)) <= sym("supply")[s];

    // sum(for s <- suppliers, c <- customers: cost[s][c] * ship(s, c))
    Expr totalCost = sum({gen("s", sym("suppliers")), gen("c", sym("customers"))},
                         sym("cost")[s][c] * ship(s, c));

    // for i <- 1..n if i != 3
    Clause odd = gen("i", range(1, sym("n"))).where(sym("i") != 3);

DEPENDENCIES
------------
• parameters.h (Value for literals), enum_utils.h (kind names)

THREAD SAFETY
-------------
• Nodes are immutable; Expr handles may be shared across threads

EXCEPTION SAFETY
----------------
• Builders offer the strong guarantee; as<T>() throws std::bad_variant_access

===============================================================================
*/

#include "enum_utils.h"
#include "parameters.h"

#include <concepts>
#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace mipdsl {

MIPDSL_DECLARE_ENUM_WITH_NAMES(ExprKind,
    Literal, Symbol, Wildcard, Call, Access, Field, Negate, Binary,
    Compare, Logical, Sum, For, Range, ListOf);

MIPDSL_DECLARE_ENUM_WITH_NAMES(BinaryOp, Add, Sub, Mul, Div);
MIPDSL_DECLARE_ENUM_WITH_NAMES(CompareOp, LessEqual, GreaterEqual, Equal, Less, Greater, NotEqual);
MIPDSL_DECLARE_ENUM_WITH_NAMES(LogicalOp, And, Or, Not);

struct Node;

/**
 * @class Expr
 * @brief Handle to an immutable expression node
 */
class Expr {
public:
    template<std::integral T>
        requires(!std::same_as<T, bool>)
    Expr(T value);

    template<std::floating_point T>
    Expr(T value);

    Expr(const char* text);
    Expr(std::string text);
    Expr(Value value);

    explicit Expr(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    ExprKind kind() const;
    const Node& node() const noexcept { return *node_; }
    const std::shared_ptr<const Node>& shared() const noexcept { return node_; }

    /// @brief Typed view of the node payload, e.g. e.as<CallNode>()
    template<typename T>
    const T& as() const;

    template<typename T>
    bool is() const;

    /// @brief Key access: supply[s]
    Expr operator[](const Expr& key) const;

    /// @brief Field access: food.field("calories")
    Expr field(std::string name) const;

    /// @brief Same node, for identity comparisons
    bool same(const Expr& other) const noexcept { return node_ == other.node_; }

private:
    std::shared_ptr<const Node> node_;
};

/**
 * @struct Clause
 * @brief Generator clause `symbol <- domain [if filter]`
 */
struct Clause {
    std::string symbol;
    Expr domain;
    std::optional<Expr> filter;

    /// @brief Copy of this clause with a filter (combined with && if one exists)
    Clause where(Expr condition) const;
};

// =============================================================================
// NODE PAYLOADS
// =============================================================================

struct LiteralNode { Value value; };
struct SymbolNode { std::string name; };
struct WildcardNode {};

struct CallNode {
    std::string family;
    std::vector<Expr> args;
    /// Set on accesses produced by wildcard expansion: an unregistered tuple
    /// contributes nothing instead of creating a new instance.
    bool skipMissing = false;
};

struct AccessNode { Expr base; Expr key; };
struct FieldNode { Expr base; std::string name; };
struct NegateNode { Expr operand; };
struct BinaryNode { BinaryOp op; Expr lhs; Expr rhs; };
struct CompareNode { CompareOp op; Expr lhs; Expr rhs; };
struct LogicalNode { LogicalOp op; std::vector<Expr> operands; };
struct SumNode { Expr body; };
struct ForNode { std::vector<Clause> clauses; Expr body; };
struct RangeNode { Expr first; Expr last; };
struct ListOfNode { std::vector<Expr> items; };

/// Alternative order matches ExprKind
struct Node {
    std::variant<LiteralNode, SymbolNode, WildcardNode, CallNode, AccessNode, FieldNode,
                 NegateNode, BinaryNode, CompareNode, LogicalNode, SumNode, ForNode,
                 RangeNode, ListOfNode>
        data;
};

template<typename T>
Expr makeExpr(T payload)
{
    return Expr(std::make_shared<const Node>(Node{std::move(payload)}));
}

// -----------------------------------------------------------------------------
// Expr out-of-line members
// -----------------------------------------------------------------------------

template<std::integral T>
    requires(!std::same_as<T, bool>)
Expr::Expr(T value) : Expr(makeExpr(LiteralNode{Value(static_cast<long long>(value))})) {}

template<std::floating_point T>
Expr::Expr(T value) : Expr(makeExpr(LiteralNode{Value(static_cast<double>(value))})) {}

inline Expr::Expr(const char* text) : Expr(makeExpr(LiteralNode{Value(text)})) {}
inline Expr::Expr(std::string text) : Expr(makeExpr(LiteralNode{Value(std::move(text))})) {}
inline Expr::Expr(Value value) : Expr(makeExpr(LiteralNode{std::move(value)})) {}

inline ExprKind Expr::kind() const
{
    return static_cast<ExprKind>(node_->data.index());
}

template<typename T>
const T& Expr::as() const
{
    return std::get<T>(node_->data);
}

template<typename T>
bool Expr::is() const
{
    return std::holds_alternative<T>(node_->data);
}

inline Expr Expr::operator[](const Expr& key) const
{
    return makeExpr(AccessNode{*this, key});
}

inline Expr Expr::field(std::string name) const
{
    return makeExpr(FieldNode{*this, std::move(name)});
}

// =============================================================================
// BUILDERS
// =============================================================================

inline Expr lit(Value value) { return Expr(std::move(value)); }
inline Expr str(std::string text) { return Expr(Value(std::move(text))); }
inline Expr sym(std::string name) { return makeExpr(SymbolNode{std::move(name)}); }
inline Expr wildcard() { return makeExpr(WildcardNode{}); }

inline Expr call(std::string family, std::vector<Expr> args)
{
    return makeExpr(CallNode{std::move(family), std::move(args)});
}

/**
 * @class Family
 * @brief Callable front-end handle for a variable family name
 *
 * @example
 *     Family x("x");
 *     x(sym("i"), 3);   // Call node x(i, 3)
 *     x();              // scalar access
 */
class Family {
public:
    explicit Family(std::string name) : name_(std::move(name)) {}

    const std::string& name() const noexcept { return name_; }

    template<typename... Args>
    Expr operator()(Args&&... args) const
    {
        return call(name_, std::vector<Expr>{Expr(std::forward<Args>(args))...});
    }

private:
    std::string name_;
};

inline Expr sum(Expr body) { return makeExpr(SumNode{std::move(body)}); }

inline Expr forall(std::vector<Clause> clauses, Expr body)
{
    return makeExpr(ForNode{std::move(clauses), std::move(body)});
}

/// @brief sum(for clauses: body)
inline Expr sum(std::vector<Clause> clauses, Expr body)
{
    return sum(forall(std::move(clauses), std::move(body)));
}

inline Clause gen(std::string symbol, Expr domain)
{
    return Clause{std::move(symbol), std::move(domain), std::nullopt};
}

/// @brief Inclusive integer range first..last
inline Expr range(Expr first, Expr last)
{
    return makeExpr(RangeNode{std::move(first), std::move(last)});
}

inline Expr list(std::vector<Expr> items) { return makeExpr(ListOfNode{std::move(items)}); }

inline Expr list(std::initializer_list<Expr> items)
{
    return list(std::vector<Expr>(items));
}

// -----------------------------------------------------------------------------
// Operators
// -----------------------------------------------------------------------------

inline Expr operator+(const Expr& a, const Expr& b) { return makeExpr(BinaryNode{BinaryOp::Add, a, b}); }
inline Expr operator-(const Expr& a, const Expr& b) { return makeExpr(BinaryNode{BinaryOp::Sub, a, b}); }
inline Expr operator*(const Expr& a, const Expr& b) { return makeExpr(BinaryNode{BinaryOp::Mul, a, b}); }
inline Expr operator/(const Expr& a, const Expr& b) { return makeExpr(BinaryNode{BinaryOp::Div, a, b}); }
inline Expr operator-(const Expr& a) { return makeExpr(NegateNode{a}); }

inline Expr operator<=(const Expr& a, const Expr& b) { return makeExpr(CompareNode{CompareOp::LessEqual, a, b}); }
inline Expr operator>=(const Expr& a, const Expr& b) { return makeExpr(CompareNode{CompareOp::GreaterEqual, a, b}); }
inline Expr operator==(const Expr& a, const Expr& b) { return makeExpr(CompareNode{CompareOp::Equal, a, b}); }
inline Expr operator<(const Expr& a, const Expr& b) { return makeExpr(CompareNode{CompareOp::Less, a, b}); }
inline Expr operator>(const Expr& a, const Expr& b) { return makeExpr(CompareNode{CompareOp::Greater, a, b}); }
inline Expr operator!=(const Expr& a, const Expr& b) { return makeExpr(CompareNode{CompareOp::NotEqual, a, b}); }

inline Expr operator&&(const Expr& a, const Expr& b) { return makeExpr(LogicalNode{LogicalOp::And, {a, b}}); }
inline Expr operator||(const Expr& a, const Expr& b) { return makeExpr(LogicalNode{LogicalOp::Or, {a, b}}); }
inline Expr operator!(const Expr& a) { return makeExpr(LogicalNode{LogicalOp::Not, {a}}); }

inline Clause Clause::where(Expr condition) const
{
    Clause out = *this;
    out.filter = filter ? (*filter && condition) : std::move(condition);
    return out;
}

// =============================================================================
// TRAVERSAL
// =============================================================================

/**
 * @brief Call fn(child) for every direct child, clause domains and filters included
 */
template<typename Fn>
void forEachChild(const Expr& e, Fn&& fn)
{
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, CallNode>) {
            for (const auto& a : n.args)
                fn(a);
        } else if constexpr (std::is_same_v<T, AccessNode>) {
            fn(n.base);
            fn(n.key);
        } else if constexpr (std::is_same_v<T, FieldNode>) {
            fn(n.base);
        } else if constexpr (std::is_same_v<T, NegateNode>) {
            fn(n.operand);
        } else if constexpr (std::is_same_v<T, BinaryNode> || std::is_same_v<T, CompareNode>) {
            fn(n.lhs);
            fn(n.rhs);
        } else if constexpr (std::is_same_v<T, LogicalNode>) {
            for (const auto& o : n.operands)
                fn(o);
        } else if constexpr (std::is_same_v<T, SumNode>) {
            fn(n.body);
        } else if constexpr (std::is_same_v<T, ForNode>) {
            for (const auto& c : n.clauses) {
                fn(c.domain);
                if (c.filter)
                    fn(*c.filter);
            }
            fn(n.body);
        } else if constexpr (std::is_same_v<T, RangeNode>) {
            fn(n.first);
            fn(n.last);
        } else if constexpr (std::is_same_v<T, ListOfNode>) {
            for (const auto& i : n.items)
                fn(i);
        }
    }, e.node().data);
}

/**
 * @brief True if the expression mentions any of the given symbol names
 * @note Conservative: symbols shadowed by inner clauses still count.
 */
inline bool references(const Expr& e, const std::set<std::string, std::less<>>& names)
{
    if (names.empty())
        return false;
    if (e.is<SymbolNode>())
        return names.contains(e.as<SymbolNode>().name);
    bool found = false;
    forEachChild(e, [&](const Expr& child) {
        if (!found && references(child, names))
            found = true;
    });
    return found;
}

// =============================================================================
// RENDERING
// =============================================================================

namespace expr_detail {

    inline int precedence(const Expr& e)
    {
        switch (e.kind()) {
            case ExprKind::Logical: {
                auto op = e.as<LogicalNode>().op;
                return op == LogicalOp::Or ? 1 : op == LogicalOp::And ? 2 : 6;
            }
            case ExprKind::Compare: return 3;
            case ExprKind::Binary: {
                auto op = e.as<BinaryNode>().op;
                return (op == BinaryOp::Add || op == BinaryOp::Sub) ? 4 : 5;
            }
            case ExprKind::Negate: return 6;
            case ExprKind::Range: return 0;
            default: return 7;
        }
    }

    inline std::string_view symbolOf(BinaryOp op)
    {
        switch (op) {
            case BinaryOp::Add: return "+";
            case BinaryOp::Sub: return "-";
            case BinaryOp::Mul: return "*";
            case BinaryOp::Div: return "/";
            default: return "?";
        }
    }

    inline std::string_view symbolOf(CompareOp op)
    {
        switch (op) {
            case CompareOp::LessEqual: return "<=";
            case CompareOp::GreaterEqual: return ">=";
            case CompareOp::Equal: return "==";
            case CompareOp::Less: return "<";
            case CompareOp::Greater: return ">";
            case CompareOp::NotEqual: return "!=";
            default: return "?";
        }
    }

} // namespace expr_detail

std::string toString(const Expr& e);

namespace expr_detail {

    inline std::string wrap(const Expr& e, int minPrecedence)
    {
        std::string s = toString(e);
        return precedence(e) < minPrecedence ? "(" + s + ")" : s;
    }

    inline std::string renderLiteral(const Value& v)
    {
        if (v.is_string())
            return "\"" + v.as_scalar().as_string() + "\"";
        return v.to_string();
    }

    inline std::string renderClauses(const std::vector<Clause>& clauses)
    {
        std::string out;
        for (std::size_t i = 0; i < clauses.size(); ++i) {
            if (i > 0)
                out += ", ";
            out += clauses[i].symbol + " <- " + toString(clauses[i].domain);
            if (clauses[i].filter)
                out += " if " + toString(*clauses[i].filter);
        }
        return out;
    }

    inline std::string renderList(const std::vector<Expr>& items)
    {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0)
                out += ", ";
            out += toString(items[i]);
        }
        return out;
    }

} // namespace expr_detail

/**
 * @brief Readable rendering of an expression
 * @example "sum(ship(s, _)) <= supply[s]"
 */
inline std::string toString(const Expr& e)
{
    using namespace expr_detail;
    return std::visit([&](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, LiteralNode>) {
            return renderLiteral(n.value);
        } else if constexpr (std::is_same_v<T, SymbolNode>) {
            return n.name;
        } else if constexpr (std::is_same_v<T, WildcardNode>) {
            return "_";
        } else if constexpr (std::is_same_v<T, CallNode>) {
            return n.family + "(" + renderList(n.args) + ")";
        } else if constexpr (std::is_same_v<T, AccessNode>) {
            return wrap(n.base, 7) + "[" + toString(n.key) + "]";
        } else if constexpr (std::is_same_v<T, FieldNode>) {
            return wrap(n.base, 7) + "." + n.name;
        } else if constexpr (std::is_same_v<T, NegateNode>) {
            return "-" + wrap(n.operand, 6);
        } else if constexpr (std::is_same_v<T, BinaryNode>) {
            int p = precedence(e);
            return wrap(n.lhs, p) + " " + std::string(symbolOf(n.op)) + " " + wrap(n.rhs, p + 1);
        } else if constexpr (std::is_same_v<T, CompareNode>) {
            return wrap(n.lhs, 4) + " " + std::string(symbolOf(n.op)) + " " + wrap(n.rhs, 4);
        } else if constexpr (std::is_same_v<T, LogicalNode>) {
            if (n.op == LogicalOp::Not)
                return "!" + wrap(n.operands.front(), 6);
            int p = precedence(e);
            std::string sep = n.op == LogicalOp::And ? " && " : " || ";
            std::string out;
            for (std::size_t i = 0; i < n.operands.size(); ++i) {
                if (i > 0)
                    out += sep;
                out += wrap(n.operands[i], p + 1);
            }
            return out;
        } else if constexpr (std::is_same_v<T, SumNode>) {
            return "sum(" + toString(n.body) + ")";
        } else if constexpr (std::is_same_v<T, ForNode>) {
            return "for " + renderClauses(n.clauses) + ": " + toString(n.body);
        } else if constexpr (std::is_same_v<T, RangeNode>) {
            return wrap(n.first, 4) + ".." + wrap(n.last, 4);
        } else {
            return "[" + renderList(n.items) + "]";
        }
    }, e.node().data);
}

} // namespace mipdsl
