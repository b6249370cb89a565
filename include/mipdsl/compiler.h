#pragma once
/*
===============================================================================
COMPILER — Expression-to-polynomial compilation
===============================================================================

OVERVIEW
--------
The ExpressionCompiler turns an expression tree, under one binding
environment, into a canonical Polynomial (arithmetic over variables) or a
Value (constant sub-expressions: indices, keys, bounds, domains, filters).
It resolves symbols through a SymbolEnvironment built over the problem's
parameters and variable registry, instantiates variables on first use, and
expands `sum`/`for` aggregations through the GeneratorExpander.

Dispatch, by node kind:

    Literal          number -> constant polynomial
    Symbol           binding / parameter -> constant; scalar family -> variable;
                     indexed family -> sum of its registered instances
    Call  x(i, j)    indices evaluated to scalars, instance -> 1 * x(i,j)
    Access / Field   nested list/map lookup -> constant
    + -              termwise
    *                at most one side may contain variables
    /                divisor must be a non-zero constant
    -a               negate
    sum / for        expand, compile the body per point, add up
    a op b (top)     lhs - rhs moved left, constants folded right

WILDCARDS
---------
Inside an aggregation body (not counting nested aggregations):

  • if exactly one variable access carries wildcards, each wildcard position
    ranges over the registry's recorded domain for that position, and only
    registered instances contribute
        sum(x(i, _))            -> x(i,1) + x(i,2) + ...
  • otherwise every wildcard denotes the same value, ranging over the
    intersection of the domains implied at each occurrence (registry
    positions, keys of indexed constants)
        sum(cost[_] * buy(_))   -> cost[a]*buy(a) + cost[b]*buy(b) + ...

A wildcard must be a whole argument or key: x(_ + 1) is an error.
An empty intersection of two or more domains is UnresolvedWildcardDomain.

Hidden binding names are "_1", "_2", ... (independent positions) and "_"
(shared value); they show up in error contexts.

KEY COMPONENTS
--------------
• CompiledComparison: lhs polynomial, sense, folded rhs
• ExpressionCompiler: compile, evaluate, evaluateNumber, compileComparison
  (and ClauseEvaluator for the GeneratorExpander)

USAGE EXAMPLES
--------------
    VariableRegistry reg;
    ParameterMap params{{"supply", Value::map({{"S1", 20}, {"S2", 25}})}};
    reg.declareFamily("ship", VarType::Continuous, Bounds{0.0, {}}, "", 2);
    ...
    ExpressionCompiler compiler(reg, params);
    BindingEnvironment env = BindingEnvironment{}.with("s", Value("S1"));
    auto row = compiler.compileComparison(sum(ship(sym("s"), _)) <= sym("supply")[sym("s")], env);
    // row.lhs == ship(S1,C1) + ship(S1,C2), row.sense == LessEqual, row.rhs == 20

THREAD SAFETY
-------------
• Not thread-safe: compilation instantiates variables in the registry

EXCEPTION SAFETY
----------------
• Every failure is a DslError carrying the sub-expression text and the
  generator bindings active at the failure
• Basic guarantee on the registry (instances created before a failure
  remain); Problem rolls the registry back to a checkpoint for atomicity

===============================================================================
*/

#include "constraints.h"
#include "environment.h"
#include "errors.h"
#include "expression.h"
#include "generators.h"
#include "parameters.h"
#include "polynomial.h"
#include "variables.h"

#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mipdsl {

/**
 * @struct CompiledComparison
 * @brief Normalized `lhs sense rhs` with a constant-free lhs
 */
struct CompiledComparison {
    Polynomial lhs;
    Sense sense = Sense::LessEqual;
    double rhs = 0.0;
};

namespace compile_detail {

    /// One wildcard-bearing node of an aggregation body
    struct WildcardSite {
        Expr node;
        bool isCall = false;
        std::vector<std::size_t> positions;
    };

    inline bool isWildcard(const Expr& e) { return e.is<WildcardNode>(); }

    inline bool isAggregation(const Expr& e) { return e.is<SumNode>() || e.is<ForNode>(); }

    /// Collect wildcard sites, not descending into nested aggregations
    inline void collectSites(const Expr& e, std::vector<WildcardSite>& out)
    {
        if (isAggregation(e))
            return;
        if (e.is<CallNode>()) {
            const auto& call = e.as<CallNode>();
            WildcardSite site{e, true, {}};
            for (std::size_t k = 0; k < call.args.size(); ++k) {
                if (isWildcard(call.args[k]))
                    site.positions.push_back(k);
            }
            if (!site.positions.empty())
                out.push_back(std::move(site));
        } else if (e.is<AccessNode>()) {
            if (isWildcard(e.as<AccessNode>().key))
                out.push_back(WildcardSite{e, false, {}});
        }
        forEachChild(e, [&](const Expr& child) { collectSites(child, out); });
    }

    /// True if the tree holds a wildcard outside nested aggregations
    inline bool containsWildcard(const Expr& e)
    {
        if (isWildcard(e))
            return true;
        if (isAggregation(e))
            return false;
        bool found = false;
        forEachChild(e, [&](const Expr& child) {
            if (!found && containsWildcard(child))
                found = true;
        });
        return found;
    }

    using WildcardNamer = std::function<std::string(std::size_t position)>;

    /**
     * Replace direct wildcard call arguments and access keys by symbols.
     * Calls that had wildcards are marked skipMissing. Nested aggregations
     * are left untouched.
     */
    inline Expr rewriteWildcards(const Expr& e, const WildcardNamer& name)
    {
        if (isAggregation(e))
            return e;

        auto rw = [&](const Expr& child) { return rewriteWildcards(child, name); };

        return std::visit([&](const auto& n) -> Expr {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, CallNode>) {
                CallNode out{n.family, {}, n.skipMissing};
                for (std::size_t k = 0; k < n.args.size(); ++k) {
                    if (isWildcard(n.args[k])) {
                        out.args.push_back(sym(name(k)));
                        out.skipMissing = true;
                    } else {
                        out.args.push_back(rw(n.args[k]));
                    }
                }
                return makeExpr(std::move(out));
            } else if constexpr (std::is_same_v<T, AccessNode>) {
                Expr key = isWildcard(n.key) ? sym(name(0)) : rw(n.key);
                return makeExpr(AccessNode{rw(n.base), std::move(key)});
            } else if constexpr (std::is_same_v<T, FieldNode>) {
                return makeExpr(FieldNode{rw(n.base), n.name});
            } else if constexpr (std::is_same_v<T, NegateNode>) {
                return makeExpr(NegateNode{rw(n.operand)});
            } else if constexpr (std::is_same_v<T, BinaryNode>) {
                return makeExpr(BinaryNode{n.op, rw(n.lhs), rw(n.rhs)});
            } else if constexpr (std::is_same_v<T, CompareNode>) {
                return makeExpr(CompareNode{n.op, rw(n.lhs), rw(n.rhs)});
            } else if constexpr (std::is_same_v<T, LogicalNode>) {
                LogicalNode out{n.op, {}};
                for (const auto& o : n.operands)
                    out.operands.push_back(rw(o));
                return makeExpr(std::move(out));
            } else if constexpr (std::is_same_v<T, RangeNode>) {
                return makeExpr(RangeNode{rw(n.first), rw(n.last)});
            } else if constexpr (std::is_same_v<T, ListOfNode>) {
                ListOfNode out;
                for (const auto& i : n.items)
                    out.items.push_back(rw(i));
                return makeExpr(std::move(out));
            } else {
                return e;
            }
        }, e.node().data);
    }

    /// Exact integer + - *, or nullopt when the result does not fit in long long
    inline std::optional<long long> integerArithmetic(BinaryOp op, long long a, long long b)
    {
        constexpr long long hi = std::numeric_limits<long long>::max();
        constexpr long long lo = std::numeric_limits<long long>::min();
        switch (op) {
            case BinaryOp::Add:
                if ((b > 0 && a > hi - b) || (b < 0 && a < lo - b))
                    return std::nullopt;
                return a + b;
            case BinaryOp::Sub:
                if ((b < 0 && a > hi + b) || (b > 0 && a < lo + b))
                    return std::nullopt;
                return a - b;
            case BinaryOp::Mul:
                if (a == 0 || b == 0)
                    return 0LL;
                if (a > 0 ? (b > 0 ? a > hi / b : b < lo / a)
                          : (b > 0 ? a < lo / b : b < hi / a))
                    return std::nullopt;
                return a * b;
            default:
                return std::nullopt;
        }
    }

    /// True if a wildcard is used other than as a direct call argument or access key
    inline bool hasEmbeddedWildcard(const Expr& e)
    {
        if (isAggregation(e))
            return false;
        if (isWildcard(e))
            return true;
        bool found = false;
        auto visit = [&](const Expr& child) {
            if (!found && !isWildcard(child) && hasEmbeddedWildcard(child))
                found = true;
        };
        if (e.is<CallNode>() || e.is<AccessNode>()) {
            forEachChild(e, visit);
        } else {
            forEachChild(e, [&](const Expr& child) {
                if (!found && hasEmbeddedWildcard(child))
                    found = true;
            });
        }
        return found;
    }

    inline Domain toDomain(const std::vector<Scalar>& values)
    {
        Domain out;
        out.reserve(values.size());
        for (const auto& v : values)
            out.emplace_back(v);
        return out;
    }

} // namespace compile_detail

/**
 * @class ExpressionCompiler
 * @brief Compiles expressions against a registry and parameter set
 */
class ExpressionCompiler final : public ClauseEvaluator {
public:
    ExpressionCompiler(VariableRegistry& registry, const ParameterMap& parameters) noexcept
        : registry_(&registry), parameters_(&parameters)
    {
    }

    /**
     * @brief Compile an arithmetic expression to a polynomial
     * @throws DslError on any resolution, linearity or shape failure
     */
    Polynomial compile(const Expr& e, const BindingEnvironment& env)
    {
        return std::visit([&](const auto& n) -> Polynomial {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, LiteralNode>) {
                return Polynomial::constant(toNumber(n.value, e, env));
            } else if constexpr (std::is_same_v<T, SymbolNode>) {
                return compileSymbol(n, e, env);
            } else if constexpr (std::is_same_v<T, WildcardNode>) {
                wildcardOutside(e, env);
            } else if constexpr (std::is_same_v<T, CallNode>) {
                return compileCall(n, e, env);
            } else if constexpr (std::is_same_v<T, AccessNode> || std::is_same_v<T, FieldNode>) {
                return Polynomial::constant(toNumber(evaluate(e, env), e, env));
            } else if constexpr (std::is_same_v<T, NegateNode>) {
                return -compile(n.operand, env);
            } else if constexpr (std::is_same_v<T, BinaryNode>) {
                return compileBinary(n, e, env);
            } else if constexpr (std::is_same_v<T, CompareNode> || std::is_same_v<T, LogicalNode>) {
                fail(ErrorKind::UnsupportedOperation, "",
                     "comparisons and logical operators are only allowed at the top of a "
                     "constraint or in generator filters", e, env);
            } else if constexpr (std::is_same_v<T, SumNode>) {
                if (n.body.template is<ForNode>())
                    return compile(n.body, env);
                return compileAggregateBody(n.body, env);
            } else if constexpr (std::is_same_v<T, ForNode>) {
                return compileFor(n, env);
            } else {
                fail(ErrorKind::TypeMismatch, "", "a range or list is not a number", e, env);
            }
        }, e.node().data);
    }

    /**
     * @brief Evaluate a constant expression
     * @details Integer arithmetic stays integral for + - *; comparisons and
     *          logical operators yield 1 or 0.
     */
    Value evaluate(const Expr& e, const BindingEnvironment& env)
    {
        return std::visit([&](const auto& n) -> Value {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, LiteralNode>) {
                return n.value;
            } else if constexpr (std::is_same_v<T, SymbolNode>) {
                return symbolValue(n.name, e, env);
            } else if constexpr (std::is_same_v<T, WildcardNode>) {
                wildcardOutside(e, env);
            } else if constexpr (std::is_same_v<T, CallNode>) {
                fail(ErrorKind::TypeMismatch, n.family,
                     std::format("variable access '{}' where a constant is required", toString(e)), e, env);
            } else if constexpr (std::is_same_v<T, AccessNode>) {
                return evaluateAccess(n, e, env);
            } else if constexpr (std::is_same_v<T, FieldNode>) {
                Value base = containerValue(n.base, env);
                if (!base.is_map()) {
                    fail(ErrorKind::TypeMismatch, n.name,
                         std::format("field '{}' requested from non-map value {}", n.name, base.to_string()), e, env);
                }
                const Value* v = base.find(Scalar(n.name));
                if (!v)
                    fail(ErrorKind::MissingKey, n.name, std::format("field '{}' not found", n.name), e, env);
                return *v;
            } else if constexpr (std::is_same_v<T, NegateNode>) {
                Scalar s = numberScalar(evaluate(n.operand, env), e, env);
                if (s.is_integer()) {
                    if (auto exact = compile_detail::integerArithmetic(BinaryOp::Sub, 0, s.as_integer()))
                        return Value(*exact);
                }
                return Value(-s.as_number());
            } else if constexpr (std::is_same_v<T, BinaryNode>) {
                return arithmetic(n.op, evaluate(n.lhs, env), evaluate(n.rhs, env), e, env);
            } else if constexpr (std::is_same_v<T, CompareNode>) {
                return Value(compareValues(n.op, evaluate(n.lhs, env), evaluate(n.rhs, env), e, env) ? 1 : 0);
            } else if constexpr (std::is_same_v<T, LogicalNode>) {
                return Value(evaluateLogical(n, e, env) ? 1 : 0);
            } else if constexpr (std::is_same_v<T, SumNode> || std::is_same_v<T, ForNode>) {
                Polynomial p = compile(e, env);
                if (p.hasVariables()) {
                    fail(ErrorKind::TypeMismatch, "",
                         "aggregation over variables where a constant is required", e, env);
                }
                return Value(p.constantTerm());
            } else if constexpr (std::is_same_v<T, RangeNode>) {
                return evaluateRange(n, e, env);
            } else {
                List items;
                items.reserve(n.items.size());
                for (const auto& item : n.items)
                    items.push_back(evaluate(item, env));
                return Value(std::move(items));
            }
        }, e.node().data);
    }

    /// @brief Evaluate to a number (bounds, coefficients)
    double evaluateNumber(const Expr& e, const BindingEnvironment& env)
    {
        return toNumber(evaluate(e, env), e, env);
    }

    /**
     * @brief Compile a top-level comparison into a normalized row
     *
     * @details Variable terms of both sides end up on the left, constants of
     *          both sides are folded into the right-hand side.
     *
     * @throws DslError(UnsupportedOperation) if `e` is not <=, >= or ==
     */
    CompiledComparison compileComparison(const Expr& e, const BindingEnvironment& env)
    {
        if (!e.is<CompareNode>()) {
            fail(ErrorKind::UnsupportedOperation, "",
                 "a constraint must be a comparison (<=, >= or ==)", e, env);
        }
        const auto& cmp = e.as<CompareNode>();
        std::optional<Sense> sense = senseOf(cmp.op);
        if (!sense) {
            fail(ErrorKind::UnsupportedOperation, "",
                 "strict and not-equal comparisons cannot be constraints", e, env);
        }

        Polynomial diff = compile(cmp.lhs, env) - compile(cmp.rhs, env);
        CompiledComparison out;
        out.rhs = -diff.constantTerm();
        if (out.rhs == 0.0)
            out.rhs = 0.0;
        out.lhs = diff.withoutConstant();
        out.sense = *sense;
        return out;
    }

    // ------------------------------------------------------------------------
    // ClauseEvaluator
    // ------------------------------------------------------------------------

    Domain domainValues(const Expr& domain, const BindingEnvironment& env) override
    {
        Value v = evaluate(domain, env);
        std::optional<std::vector<Value>> items = v.enumerate();
        if (!items) {
            fail(ErrorKind::InvalidDomain, "",
                 std::format("generator domain evaluates to {}, which is not a list, range or map",
                             v.to_string()), domain, env);
        }
        return std::move(*items);
    }

    bool accepts(const Expr& filter, const BindingEnvironment& env) override
    {
        return truthy(evaluate(filter, env), filter, env);
    }

    VariableRegistry& registry() noexcept { return *registry_; }
    const ParameterMap& parameters() const noexcept { return *parameters_; }

private:
    // ------------------------------------------------------------------------
    // Failure helpers
    // ------------------------------------------------------------------------

    [[noreturn]] static void fail(ErrorKind kind, std::string symbol, std::string message,
                                  const Expr& at, const BindingEnvironment& env)
    {
        DslError err(kind, std::move(symbol), std::move(message), toString(at));
        err.attachBindings(env.describe());
        throw err;
    }

    [[noreturn]] static void wildcardOutside(const Expr& at, const BindingEnvironment& env)
    {
        fail(ErrorKind::WildcardOutsideAggregation, "_",
             "wildcard index outside of a sum or for aggregation", at, env);
    }

    /// Run a registry call, stamping registry errors with expression and bindings
    template<typename Fn>
    static decltype(auto) stamped(const Expr& at, const BindingEnvironment& env, Fn&& fn)
    {
        try {
            return fn();
        } catch (DslError& err) {
            err.attachExpression(toString(at));
            err.attachBindings(env.describe());
            throw;
        }
    }

    // ------------------------------------------------------------------------
    // Symbols
    // ------------------------------------------------------------------------

    Resolution resolve(const std::string& name, const Expr& at, const BindingEnvironment& env) const
    {
        SymbolEnvironment symbols(*parameters_, *registry_, env);
        Resolution r = symbols.resolve(name);
        if (r.family && r.kind != SymbolKind::VariableFamily) {
            const bool generatorShadow =
                r.kind == SymbolKind::Binding && r.binding->origin == BindingOrigin::Generator;
            if (!generatorShadow) {
                fail(ErrorKind::AmbiguousSymbol, name,
                     std::format("'{}' names both a {} and a variable family", name,
                                 r.kind == SymbolKind::Binding ? "caller binding" : "parameter"),
                     at, env);
            }
        }
        return r;
    }

    Value symbolValue(const std::string& name, const Expr& at, const BindingEnvironment& env) const
    {
        Resolution r = resolve(name, at, env);
        switch (r.kind) {
            case SymbolKind::Binding:
            case SymbolKind::Parameter:
                return *r.value();
            case SymbolKind::VariableFamily:
                fail(ErrorKind::TypeMismatch, name,
                     std::format("'{}' is a variable family where a constant is required", name), at, env);
            default:
                fail(ErrorKind::UndefinedSymbol, name,
                     std::format("'{}' is not a generator binding, parameter or variable family", name),
                     at, env);
        }
    }

    Polynomial compileSymbol(const SymbolNode& n, const Expr& at, const BindingEnvironment& env)
    {
        Resolution r = resolve(n.name, at, env);
        switch (r.kind) {
            case SymbolKind::Binding:
            case SymbolKind::Parameter:
                return Polynomial::constant(toNumber(*r.value(), at, env));
            case SymbolKind::VariableFamily: {
                if (r.family->arity() != 0) {
                    Polynomial total;
                    for (std::size_t id : r.family->instanceIds())
                        total += Polynomial::variable(registry_->instances()[id].name);
                    return total;
                }
                std::string name = stamped(at, env, [&] {
                    return registry_->instantiate(n.name, IndexTuple{}).name;
                });
                return Polynomial::variable(std::move(name));
            }
            default:
                fail(ErrorKind::UndefinedSymbol, n.name,
                     std::format("'{}' is not a generator binding, parameter or variable family", n.name),
                     at, env);
        }
    }

    // ------------------------------------------------------------------------
    // Variable access
    // ------------------------------------------------------------------------

    Polynomial compileCall(const CallNode& n, const Expr& at, const BindingEnvironment& env)
    {
        const VariableFamily* family = registry_->family(n.family);
        if (!family)
            undefinedFamily(n.family, at, env);

        IndexTuple index;
        index.reserve(n.args.size());
        for (const auto& arg : n.args) {
            if (compile_detail::isWildcard(arg))
                wildcardOutside(at, env);
            index.push_back(indexScalar(arg, env));
        }

        if (index.size() != family->arity()) {
            fail(ErrorKind::ArityMismatch, n.family,
                 std::format("'{}' takes {} indices, got {}", n.family, family->arity(), index.size()),
                 at, env);
        }

        if (n.skipMissing) {
            const VariableInstance* inst = registry_->find(n.family, index);
            return inst ? Polynomial::variable(inst->name) : Polynomial{};
        }

        std::string name = stamped(at, env, [&] {
            return registry_->instantiate(n.family, index).name;
        });
        return Polynomial::variable(std::move(name));
    }

    [[noreturn]] void undefinedFamily(const std::string& name, const Expr& at,
                                      const BindingEnvironment& env) const
    {
        SymbolEnvironment symbols(*parameters_, *registry_, env);
        Resolution r = symbols.resolve(name);
        std::string what = r.kind == SymbolKind::Binding ? "a generator binding"
                         : r.kind == SymbolKind::Parameter ? "a parameter"
                                                           : "not declared";
        fail(ErrorKind::UndefinedVariable, name,
             std::format("'{}' is {}, not a variable family", name, what), at, env);
    }

    Scalar indexScalar(const Expr& arg, const BindingEnvironment& env)
    {
        Value v = evaluate(arg, env);
        if (!v.is_scalar()) {
            fail(ErrorKind::TypeMismatch, "",
                 std::format("index must be a number or string, got {}", v.to_string()), arg, env);
        }
        return v.as_scalar();
    }

    // ------------------------------------------------------------------------
    // Arithmetic
    // ------------------------------------------------------------------------

    Polynomial compileBinary(const BinaryNode& n, const Expr& at, const BindingEnvironment& env)
    {
        Polynomial a = compile(n.lhs, env);
        Polynomial b = compile(n.rhs, env);
        switch (n.op) {
            case BinaryOp::Add:
                return a + b;
            case BinaryOp::Sub:
                return a - b;
            case BinaryOp::Mul:
                if (a.hasVariables() && b.hasVariables()) {
                    fail(ErrorKind::NonlinearExpression, "",
                         std::format("product of two variable expressions ({}) * ({})",
                                     a.toString(), b.toString()), at, env);
                }
                return a.hasVariables() ? a * b.constantTerm() : b * a.constantTerm();
            default: {
                if (b.hasVariables()) {
                    fail(ErrorKind::UnsupportedOperation, "",
                         "division by an expression containing variables", at, env);
                }
                double divisor = b.constantTerm();
                if (divisor == 0.0)
                    fail(ErrorKind::UnsupportedOperation, "", "division by zero", at, env);
                return a / divisor;
            }
        }
    }

    static double toNumber(const Value& v, const Expr& at, const BindingEnvironment& env)
    {
        if (!v.is_number()) {
            fail(ErrorKind::TypeMismatch, "",
                 std::format("expected a number, got {}", v.has_value() ? v.to_string() : "nothing"),
                 at, env);
        }
        return v.as_number();
    }

    static Scalar numberScalar(const Value& v, const Expr& at, const BindingEnvironment& env)
    {
        toNumber(v, at, env);
        return v.as_scalar();
    }

    static Value arithmetic(BinaryOp op, const Value& lv, const Value& rv, const Expr& at,
                            const BindingEnvironment& env)
    {
        Scalar a = numberScalar(lv, at, env);
        Scalar b = numberScalar(rv, at, env);
        if (a.is_integer() && b.is_integer() && op != BinaryOp::Div) {
            if (auto exact = compile_detail::integerArithmetic(op, a.as_integer(), b.as_integer()))
                return Value(*exact);
        }
        switch (op) {
            case BinaryOp::Add:
                return Value(a.as_number() + b.as_number());
            case BinaryOp::Sub:
                return Value(a.as_number() - b.as_number());
            case BinaryOp::Mul:
                return Value(a.as_number() * b.as_number());
            default:
                if (b.as_number() == 0.0)
                    fail(ErrorKind::UnsupportedOperation, "", "division by zero", at, env);
                return Value(a.as_number() / b.as_number());
        }
    }

    static bool compareValues(CompareOp op, const Value& a, const Value& b, const Expr& at,
                              const BindingEnvironment& env)
    {
        const bool ordering = op == CompareOp::Less || op == CompareOp::LessEqual
                           || op == CompareOp::Greater || op == CompareOp::GreaterEqual;
        if (a.is_number() && b.is_number()) {
            double x = a.as_number(), y = b.as_number();
            switch (op) {
                case CompareOp::Less: return x < y;
                case CompareOp::LessEqual: return x <= y;
                case CompareOp::Greater: return x > y;
                case CompareOp::GreaterEqual: return x >= y;
                case CompareOp::Equal: return x == y;
                default: return x != y;
            }
        }
        if (a.is_string() && b.is_string()) {
            const auto& x = a.as_scalar().as_string();
            const auto& y = b.as_scalar().as_string();
            switch (op) {
                case CompareOp::Less: return x < y;
                case CompareOp::LessEqual: return x <= y;
                case CompareOp::Greater: return x > y;
                case CompareOp::GreaterEqual: return x >= y;
                case CompareOp::Equal: return x == y;
                default: return x != y;
            }
        }
        if (ordering) {
            fail(ErrorKind::TypeMismatch, "",
                 std::format("cannot order {} and {}", a.to_string(), b.to_string()), at, env);
        }
        return (op == CompareOp::Equal) == (a == b);
    }

    static bool truthy(const Value& v, const Expr& at, const BindingEnvironment& env)
    {
        return toNumber(v, at, env) != 0.0;
    }

    bool evaluateLogical(const LogicalNode& n, const Expr& at, const BindingEnvironment& env)
    {
        switch (n.op) {
            case LogicalOp::Not:
                return !truthy(evaluate(n.operands.front(), env), at, env);
            case LogicalOp::And:
                for (const auto& o : n.operands) {
                    if (!truthy(evaluate(o, env), o, env))
                        return false;
                }
                return true;
            default:
                for (const auto& o : n.operands) {
                    if (truthy(evaluate(o, env), o, env))
                        return true;
                }
                return false;
        }
    }

    Value evaluateRange(const RangeNode& n, const Expr& at, const BindingEnvironment& env)
    {
        Scalar first = numberScalar(evaluate(n.first, env), at, env);
        Scalar last = numberScalar(evaluate(n.last, env), at, env);
        if (!first.is_integral() || !last.is_integral()) {
            fail(ErrorKind::TypeMismatch, "",
                 std::format("range bounds must be integers, got {}..{}", first.to_string(),
                             last.to_string()), at, env);
        }
        List items;
        const long long lo = first.as_integer(), hi = last.as_integer();
        if (lo <= hi) {
            for (long long i = lo;; ++i) {
                items.emplace_back(i);
                if (i == hi)
                    break;
            }
        }
        return Value(std::move(items));
    }

    // ------------------------------------------------------------------------
    // Constant access
    // ------------------------------------------------------------------------

    /// Resolve the base of an access chain; bare names must be parameters or bindings
    Value containerValue(const Expr& base, const BindingEnvironment& env)
    {
        if (!base.is<SymbolNode>())
            return evaluate(base, env);

        const std::string& name = base.as<SymbolNode>().name;
        Resolution r = resolve(name, base, env);
        switch (r.kind) {
            case SymbolKind::Binding:
            case SymbolKind::Parameter:
                return *r.value();
            case SymbolKind::VariableFamily:
                fail(ErrorKind::UndefinedConstant, name,
                     std::format("'{}' is a variable family, not a parameter", name), base, env);
            default:
                fail(ErrorKind::UndefinedConstant, name,
                     std::format("'{}' is not a parameter", name), base, env);
        }
    }

    Value evaluateAccess(const AccessNode& n, const Expr& at, const BindingEnvironment& env)
    {
        Value container = containerValue(n.base, env);
        if (compile_detail::isWildcard(n.key))
            wildcardOutside(at, env);
        Value keyValue = evaluate(n.key, env);
        if (!keyValue.is_scalar()) {
            fail(ErrorKind::TypeMismatch, "",
                 std::format("key must be a number or string, got {}", keyValue.to_string()), at, env);
        }
        const Scalar& key = keyValue.as_scalar();

        if (container.is_list()) {
            if (!key.is_integral()) {
                fail(ErrorKind::TypeMismatch, key.to_string(),
                     std::format("list index must be an integer, got {}", key.to_string()), at, env);
            }
            const Value* v = container.element(key.as_integer());
            if (!v) {
                fail(ErrorKind::IndexOutOfBounds, key.to_string(),
                     std::format("index {} is out of bounds for a list of length {}", key.as_integer(),
                                 container.size()), at, env);
            }
            return *v;
        }
        if (container.is_map()) {
            const Value* v = container.find(key);
            if (!v) {
                fail(ErrorKind::MissingKey, key.to_string(),
                     std::format("key '{}' not found", key.to_string()), at, env);
            }
            return *v;
        }
        fail(ErrorKind::TypeMismatch, "",
             std::format("cannot index into {}", container.has_value() ? container.to_string() : "nothing"),
             at, env);
    }

    // ------------------------------------------------------------------------
    // Aggregation
    // ------------------------------------------------------------------------

    Polynomial compileFor(const ForNode& n, const BindingEnvironment& env)
    {
        Polynomial total;
        GeneratorExpander expander(*this);
        expander.forEach(n.clauses, env, [&](const BindingEnvironment& point) {
            total += compileAggregateBody(n.body, point);
        });
        return total;
    }

    Polynomial compileAggregateBody(const Expr& body, const BindingEnvironment& env)
    {
        if (compile_detail::hasEmbeddedWildcard(body)) {
            fail(ErrorKind::WildcardOutsideAggregation, "_",
                 "a wildcard must be a whole index argument or key, not part of an index expression",
                 body, env);
        }

        std::vector<compile_detail::WildcardSite> sites;
        compile_detail::collectSites(body, sites);
        if (sites.empty())
            return compile(body, env);

        if (sites.size() == 1 && sites.front().isCall)
            return expandIndependent(body, sites.front(), env);
        return expandShared(body, sites, env);
    }

    /// One variable access with wildcards: every wildcard position ranges on its own
    Polynomial expandIndependent(const Expr& body, const compile_detail::WildcardSite& site,
                                 const BindingEnvironment& env)
    {
        const auto& call = site.node.as<CallNode>();
        requireFamily(call, site.node, env);

        auto hidden = [](std::size_t position) { return std::format("_{}", position + 1); };

        std::vector<Clause> clauses;
        for (std::size_t position : site.positions) {
            Domain domain = compile_detail::toDomain(stamped(site.node, env, [&] {
                return registry_->wildcardDomain(call.family, position);
            }));
            clauses.push_back(gen(hidden(position), lit(Value(std::move(domain)))));
        }

        Expr rewritten = compile_detail::rewriteWildcards(body, hidden);
        Polynomial total;
        GeneratorExpander expander(*this);
        expander.forEach(clauses, env, [&](const BindingEnvironment& point) {
            total += compile(rewritten, point);
        });
        return total;
    }

    /// Several wildcard sites: one shared value over the intersected domain
    Polynomial expandShared(const Expr& body, const std::vector<compile_detail::WildcardSite>& sites,
                            const BindingEnvironment& env)
    {
        std::optional<Domain> domain;
        std::size_t sources = 0;
        auto merge = [&](Domain d) {
            ++sources;
            domain = domain ? domainIntersection(*domain, d) : std::move(d);
        };

        for (const auto& site : sites) {
            if (site.isCall) {
                const auto& call = site.node.as<CallNode>();
                requireFamily(call, site.node, env);
                for (std::size_t position : site.positions) {
                    merge(compile_detail::toDomain(stamped(site.node, env, [&] {
                        return registry_->wildcardDomain(call.family, position);
                    })));
                }
            } else {
                const Expr& base = site.node.as<AccessNode>().base;
                if (compile_detail::containsWildcard(base))
                    continue;
                merge(keysOf(containerValue(base, env), site.node, env));
            }
        }

        const Expr& anchor = sites.front().node;
        if (!domain) {
            fail(ErrorKind::UnresolvedWildcardDomain, "_",
                 "no domain can be inferred for the wildcard", anchor, env);
        }
        if (domain->empty() && sources > 1) {
            fail(ErrorKind::UnresolvedWildcardDomain, "_",
                 "the domains implied for the shared wildcard have no value in common", anchor, env);
        }

        auto hidden = [](std::size_t) { return std::string("_"); };
        Expr rewritten = compile_detail::rewriteWildcards(body, hidden);
        Polynomial total;
        GeneratorExpander expander(*this);
        expander.forEach({gen("_", lit(Value(std::move(*domain))))}, env,
                         [&](const BindingEnvironment& point) { total += compile(rewritten, point); });
        return total;
    }

    void requireFamily(const CallNode& call, const Expr& at, const BindingEnvironment& env) const
    {
        const VariableFamily* family = registry_->family(call.family);
        if (!family)
            undefinedFamily(call.family, at, env);
        if (call.args.size() != family->arity()) {
            fail(ErrorKind::ArityMismatch, call.family,
                 std::format("'{}' takes {} indices, got {}", call.family, family->arity(),
                             call.args.size()), at, env);
        }
    }

    /// Keys a wildcard can take when indexing a constant container
    static Domain keysOf(const Value& container, const Expr& at, const BindingEnvironment& env)
    {
        if (container.is_map())
            return *container.enumerate();
        if (container.is_list()) {
            Domain out;
            for (std::size_t i = 0; i < container.size(); ++i)
                out.emplace_back(static_cast<long long>(i));
            return out;
        }
        fail(ErrorKind::TypeMismatch, "",
             std::format("cannot index into {}", container.to_string()), at, env);
    }

    VariableRegistry* registry_;
    const ParameterMap* parameters_;
};

} // namespace mipdsl
