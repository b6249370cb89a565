#pragma once
/*
===============================================================================
PROBLEM — Problem model and declaration entry points
===============================================================================

OVERVIEW
--------
A Problem aggregates everything a solver needs: the variable registry, the
ordered constraint set, the objective and the model parameters. It is built
by a sequence of declarations:

    Problem p("transport", "Ship goods at minimum cost", Direction::Minimize, params);
    p.variables("ship", {gen("s", sym("suppliers")), gen("c", sym("customers"))},
                VarType::Continuous, {lit(0), {}}, "Ship {s} to {c}")
     .constraints({gen("s", sym("suppliers"))},
                  sum(ship(s, _)) <= sym("supply")[s], "Supply {s}")
     .objective(sum({gen("s", sym("suppliers")), gen("c", sym("customers"))},
                    sym("cost")[s][c] * ship(s, c)));

Each declaration expands its generator clauses, compiles every point and
commits the result only if all points succeed. A failure leaves the problem
exactly as it was before the call.

KEY COMPONENTS
--------------
• Direction / parseDirection: minimize or maximize
• BoundSpec: optional lower/upper bound expressions
• Objective: compiled polynomial plus direction
• LinearForm: variable-id/coefficient view for solver adapters
• Problem: variables, constraints, objective, bind, linearForm
• modify(): copy a problem and apply further declarations to the copy

DESIGN PHILOSOPHY
-----------------
• Value semantics: copying a Problem yields an independent model
• Declarations run in place and truncate what they added on failure
  (strong guarantee); the rollback costs what the declaration added, not
  the size of the model
• A later objective replaces an earlier one
• Errors carry the declaration label in their context

TRACING
-------
setTrace(&std::clog) writes one line per committed declaration. Building
with MIPDSL_DEBUG defined turns tracing on by default.

THREAD SAFETY
-------------
• Not thread-safe; one Problem has one logical owner

EXCEPTION SAFETY
----------------
• variables/constraints/objective: strong guarantee, DslError on failure
• linearForm: DslError(UndefinedVariable) for names outside the registry

===============================================================================
*/

#include "compiler.h"
#include "constraints.h"
#include "enum_utils.h"
#include "environment.h"
#include "errors.h"
#include "expression.h"
#include "generators.h"
#include "naming.h"
#include "parameters.h"
#include "polynomial.h"
#include "variables.h"

#include <algorithm>
#include <cstddef>
#include <format>
#include <iostream>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mipdsl {

MIPDSL_DECLARE_ENUM_WITH_NAMES(Direction, Minimize, Maximize);

/**
 * @brief Parse an optimization direction
 * @throws DslError(InvalidDirection) for anything but minimize/maximize
 *         (British spellings accepted)
 */
inline Direction parseDirection(std::string_view text)
{
    if (text == "minimize" || text == "minimise")
        return Direction::Minimize;
    if (text == "maximize" || text == "maximise")
        return Direction::Maximize;
    throw DslError(ErrorKind::InvalidDirection, std::string(text),
        std::format("'{}' is not an optimization direction (expected minimize or maximize)", text));
}

inline std::string_view directionKeyword(Direction d) noexcept
{
    return d == Direction::Maximize ? "maximize" : "minimize";
}

/**
 * @struct BoundSpec
 * @brief Bound expressions of a variables declaration; absent = unbounded
 */
struct BoundSpec {
    std::optional<Expr> lower;
    std::optional<Expr> upper;
};

/**
 * @struct Objective
 */
struct Objective {
    Polynomial polynomial;
    Direction direction = Direction::Minimize;
};

/**
 * @struct LinearForm
 * @brief Polynomial keyed by variable id, constant kept apart
 */
struct LinearForm {
    std::vector<std::pair<std::size_t, double>> terms;
    double constant = 0.0;
};

/**
 * @class Problem
 * @brief Optimization problem built from declarations
 */
class Problem {
public:
    explicit Problem(std::string name, std::string description = {},
                     std::optional<Direction> direction = std::nullopt, ParameterMap parameters = {})
        : name_(std::move(name)),
          description_(std::move(description)),
          direction_(direction),
          parameters_(std::move(parameters))
    {
#ifdef MIPDSL_DEBUG
        trace_ = &std::clog;
#endif
    }

    // ------------------------------------------------------------------------
    // Declarations
    // ------------------------------------------------------------------------

    /**
     * @brief Declare an indexed variable family and its instances
     *
     * @param family      Family name (letter first, then letters/digits/_)
     * @param generators  One clause per index position, outermost first
     * @param type        Continuous, Integer or Binary
     * @param bounds      Bound expressions; may reference generator symbols
     * @param description Optional text with {symbol} placeholders
     *
     * @details One instance per generator point, with bounds evaluated and
     *          description interpolated at that point. The values taken at
     *          each index position become the declared wildcard domain of
     *          that position.
     *
     * @throws DslError (DuplicateFamily, InvalidBounds, InvalidDeclaration,
     *         TypeMismatch, ...) with this declaration in its context
     */
    Problem& variables(const std::string& family, const std::vector<Clause>& generators, VarType type,
                       const BoundSpec& bounds = {}, const std::string& description = {})
    {
        std::string label = generators.empty()
            ? std::format("variables {}", family)
            : std::format("variables {}({})", family, expr_detail::renderClauses(generators));

        return commit(label, [&] {
            return declareVariables(family, generators, type, bounds, description);
        });
    }

    /// @brief Declare a scalar (unindexed) variable
    Problem& variables(const std::string& family, VarType type, const BoundSpec& bounds = {},
                       const std::string& description = {})
    {
        return variables(family, std::vector<Clause>{}, type, bounds, description);
    }

    /**
     * @brief Declare one constraint per generator point
     *
     * @details The comparison is compiled at every point and normalized to
     *          `lhs sense rhs`. Names come from the interpolated description,
     *          or `constraint_<values>` when there is none, or the row id
     *          when there are no generators either.
     *
     * @throws DslError; no row of the declaration is kept on failure
     */
    Problem& constraints(const std::vector<Clause>& generators, const Expr& comparison,
                         const std::string& description = {})
    {
        std::string label = description.empty()
            ? std::format("constraints {}", toString(comparison))
            : std::format("constraints \"{}\"", description);

        return commit(label, [&] {
            return declareConstraints(label, generators, comparison, description);
        });
    }

    Problem& constraints(const Expr& comparison, const std::string& description = {})
    {
        return constraints(std::vector<Clause>{}, comparison, description);
    }

    /**
     * @brief Set the objective, replacing any earlier one
     * @throws DslError(InvalidDirection) for an unknown direction string
     */
    Problem& objective(const Expr& expr, Direction direction)
    {
        std::string label = std::format("objective {} {}", directionKeyword(direction), toString(expr));
        return commit(label, [&] {
            ExpressionCompiler compiler(registry_, parameters_);
            Polynomial p = compiler.compile(expr, callerScope_);
            objective_ = Objective{std::move(p), direction};
            return std::size_t{1};
        });
    }

    Problem& objective(const Expr& expr, std::string_view direction)
    {
        try {
            return objective(expr, parseDirection(direction));
        } catch (DslError& err) {
            err.attachExpression(toString(expr));
            err.attachDeclaration(std::format("objective {}", toString(expr)));
            throw;
        }
    }

    /// @brief Objective in the problem's default direction
    Problem& objective(const Expr& expr)
    {
        if (!direction_) {
            DslError err(ErrorKind::InvalidDirection, "",
                         "no direction given and the problem has no default direction", toString(expr));
            err.attachDeclaration(std::format("objective {}", toString(expr)));
            throw err;
        }
        return objective(expr, *direction_);
    }

    /**
     * @brief Bind a name in the caller scope of later declarations
     * @details Caller bindings never shadow a variable family of the same
     *          name; such a use is AmbiguousSymbol.
     */
    Problem& bind(std::string name, Value value)
    {
        callerScope_.bind(std::move(name), std::move(value), BindingOrigin::Caller);
        return *this;
    }

    // ------------------------------------------------------------------------
    // Read interface
    // ------------------------------------------------------------------------

    const std::string& name() const noexcept { return name_; }
    const std::string& description() const noexcept { return description_; }
    const std::optional<Direction>& direction() const noexcept { return direction_; }

    const VariableRegistry& registry() const noexcept { return registry_; }
    const ConstraintSet& constraintSet() const noexcept { return constraints_; }
    const std::optional<Objective>& objective() const noexcept { return objective_; }
    const ParameterMap& parameters() const noexcept { return parameters_; }
    const BindingEnvironment& callerScope() const noexcept { return callerScope_; }

    /// @brief Direction the objective is optimized in (minimize when unset)
    Direction effectiveDirection() const noexcept
    {
        if (objective_)
            return objective_->direction;
        return direction_.value_or(Direction::Minimize);
    }

    ParameterMap& metadata() noexcept { return metadata_; }
    const ParameterMap& metadata() const noexcept { return metadata_; }

    /**
     * @brief Solver-boundary view of a polynomial: (variable id, coefficient)
     *        pairs in id order plus the constant term
     * @throws DslError(NonlinearExpression) for a monomial of degree > 1
     * @throws DslError(UndefinedVariable) for a name not in the registry
     */
    LinearForm linearForm(const Polynomial& p) const
    {
        LinearForm out;
        for (const auto& [monomial, coef] : p.terms()) {
            if (monomial.empty()) {
                out.constant += coef;
                continue;
            }
            if (monomial.size() > 1) {
                throw DslError(ErrorKind::NonlinearExpression, monomial.front(),
                    std::format("monomial of degree {} in {}", monomial.size(), p.toString()));
            }
            const VariableInstance* inst = registry_.findByName(monomial.front());
            if (!inst) {
                throw DslError(ErrorKind::UndefinedVariable, monomial.front(),
                    std::format("'{}' is not a registered variable", monomial.front()));
            }
            out.terms.emplace_back(inst->id, coef);
        }
        std::sort(out.terms.begin(), out.terms.end());
        return out;
    }

    // ------------------------------------------------------------------------
    // Tracing
    // ------------------------------------------------------------------------

    void setTrace(std::ostream* os) noexcept { trace_ = os; }
    std::ostream* trace() const noexcept { return trace_; }

private:
    /// Append-only state a declaration can grow
    struct Checkpoint {
        VariableRegistry::Checkpoint registry;
        ConstraintSet::Checkpoint constraints;
        std::size_t nextConstraint = 0;
    };

    /**
     * Run a declaration in place, truncating what it added if it throws.
     * The callback returns the number of items it produced, for the trace
     * line, and must assign objective_ only as its last step.
     */
    template<typename Fn>
    Problem& commit(const std::string& label, Fn&& declare)
    {
        const Checkpoint cp{registry_.checkpoint(), constraints_.checkpoint(), nextConstraint_};
        std::size_t produced = 0;
        try {
            produced = declare();
        } catch (DslError& err) {
            rollback(cp);
            err.attachDeclaration(label);
            throw;
        } catch (...) {
            rollback(cp);
            throw;
        }

        if (trace_) {
            *trace_ << std::format("[mipdsl] {}: {} -> {} item(s), {} variables, {} constraints\n",
                                   name_, label, produced, registry_.size(), constraints_.size());
        }
        return *this;
    }

    void rollback(const Checkpoint& cp)
    {
        registry_.rollback(cp.registry);
        constraints_.rollback(cp.constraints);
        nextConstraint_ = cp.nextConstraint;
    }

    std::size_t declareVariables(const std::string& family, const std::vector<Clause>& generators,
                                 VarType type, const BoundSpec& boundSpec, const std::string& description)
    {
        ExpressionCompiler compiler(registry_, parameters_);

        std::set<std::string, std::less<>> symbols;
        for (const auto& c : generators)
            symbols.insert(c.symbol);
        auto isConstant = [&](const std::optional<Expr>& e) { return !e || !references(*e, symbols); };

        // A bound template is kept when no bound depends on the index
        Bounds familyBounds;
        if (isConstant(boundSpec.lower) && isConstant(boundSpec.upper))
            familyBounds = evaluateBounds(compiler, boundSpec, callerScope_);

        registry_.declareFamily(family, type, familyBounds, description, generators.size());

        std::vector<std::vector<Scalar>> domains(generators.size());
        std::vector<std::set<Scalar>> seen(generators.size());

        GeneratorExpander expander(compiler);
        std::size_t count = expander.forEach(generators, callerScope_, [&](const BindingEnvironment& env) {
            IndexTuple index = generatorValues(generators, env);
            for (std::size_t p = 0; p < index.size(); ++p) {
                if (seen[p].insert(index[p]).second)
                    domains[p].push_back(index[p]);
            }

            Bounds b = evaluateBounds(compiler, boundSpec, env);
            std::string text = description.empty() ? std::string{} : interpolateAt(description, env);
            try {
                registry_.instantiate(family, index, b, std::move(text));
            } catch (DslError& err) {
                err.attachBindings(env.describe());
                throw;
            }
        });

        for (std::size_t p = 0; p < domains.size(); ++p)
            registry_.declareDomain(family, p, std::move(domains[p]));
        return count;
    }

    std::size_t declareConstraints(const std::string& label, const std::vector<Clause>& generators,
                                   const Expr& comparison, const std::string& description)
    {
        ExpressionCompiler compiler(registry_, parameters_);
        GeneratorExpander expander(compiler);

        constraints_.beginGroup(label);
        std::size_t count = expander.forEach(generators, callerScope_, [&](const BindingEnvironment& env) {
            CompiledComparison row = compiler.compileComparison(comparison, env);

            std::string id = constraintId(nextConstraint_++);
            std::string rowName;
            if (!description.empty())
                rowName = interpolateAt(description, env);
            else if (!generators.empty())
                rowName = autoConstraintName(generatorValues(generators, env));
            else
                rowName = id;

            constraints_.add(Constraint{std::move(id), std::move(rowName), std::move(row.lhs),
                                        row.sense, row.rhs});
        });
        constraints_.endGroup();
        return count;
    }

    Bounds evaluateBounds(ExpressionCompiler& compiler, const BoundSpec& boundSpec,
                          const BindingEnvironment& env) const
    {
        Bounds b;
        if (boundSpec.lower)
            b.lower = compiler.evaluateNumber(*boundSpec.lower, env);
        if (boundSpec.upper)
            b.upper = compiler.evaluateNumber(*boundSpec.upper, env);
        return b;
    }

    /// Values bound by the clause symbols at one point, in clause order
    static IndexTuple generatorValues(const std::vector<Clause>& generators, const BindingEnvironment& env)
    {
        IndexTuple out;
        out.reserve(generators.size());
        for (const auto& c : generators) {
            const Binding* b = env.find(c.symbol);
            if (!b->value.is_scalar()) {
                DslError err(ErrorKind::TypeMismatch, c.symbol,
                    std::format("generator '{}' is bound to {}, which cannot be an index", c.symbol,
                                b->value.to_string()));
                err.attachBindings(env.describe());
                throw err;
            }
            out.push_back(b->value.as_scalar());
        }
        return out;
    }

    /// Interpolate {symbol} placeholders from bindings, then scalar parameters
    std::string interpolateAt(const std::string& text, const BindingEnvironment& env) const
    {
        try {
            return interpolate(text, [&](std::string_view name) -> std::optional<std::string> {
                if (const Binding* b = env.find(name))
                    return b->value.to_string();
                if (auto it = parameters_.find(name); it != parameters_.end() && it->second.is_scalar())
                    return it->second.to_string();
                return std::nullopt;
            });
        } catch (DslError& err) {
            err.attachBindings(env.describe());
            throw;
        }
    }

    std::string name_;
    std::string description_;
    std::optional<Direction> direction_;
    ParameterMap parameters_;
    ParameterMap metadata_;
    BindingEnvironment callerScope_;

    VariableRegistry registry_;
    ConstraintSet constraints_;
    std::optional<Objective> objective_;
    std::size_t nextConstraint_ = 0;

    std::ostream* trace_ = nullptr;
};

/**
 * @brief Re-enter a problem definition
 *
 * @details Applies `block(Problem&)` to a copy of `base` and returns it. If
 *          the block throws, nothing escapes but the exception; `base` and
 *          every other copy are untouched.
 *
 * @example
 *     Problem extended = modify(p, [](Problem& q) {
 *         q.constraints(sym("total") <= 100, "Budget");
 *     });
 */
template<typename Fn>
Problem modify(Problem base, Fn&& block)
{
    block(base);
    return base;
}

} // namespace mipdsl
