/*
===============================================================================
GENERATORS — Generator clause expansion for mipdsl
===============================================================================

OVERVIEW
--------
Expands generator clauses `s <- suppliers, c <- customers if cost[s][c] > 0`
into the sequence of binding environments they describe and runs a callback
once per point. The first clause is the outermost loop, so the last clause
varies fastest, exactly like nested for-loops.

Domains are expressions. A domain that does not mention any symbol bound by
an earlier clause is evaluated once before iteration starts; a domain that
does (`j <- neighbors[i]`) is evaluated again for every binding of the
outer clauses. Filters are checked right after their clause binds its
symbol, so later clauses are never entered for rejected points.

KEY COMPONENTS
--------------
• Domain: materialized std::vector<Value>
• ClauseEvaluator: interface the compiler implements to evaluate domains
  and filters
• GeneratorExpander: forEach / expand / points
• domainIntersection: order-preserving intersection for wildcard inference

DESIGN PHILOSOPHY
-----------------
• Deterministic order: domain order, then clause order
• Zero-length domains produce zero points, never an error
• Evaluation is delegated, so this layer never touches parameters or
  variables directly

USAGE EXAMPLES
--------------
    GeneratorExpander expander(compiler);
    std::size_t n = expander.forEach(
        {gen("i", range(1, 3)), gen("j", range(sym("i"), 3))},
        BindingEnvironment{},
        [&](const BindingEnvironment& env) { ... });
    // points: (1,1) (1,2) (1,3) (2,2) (2,3) (3,3); n == 6

PERFORMANCE NOTES
-----------------
• One binding push/pop per visited point; independent domains are
  evaluated once per expansion

THREAD SAFETY
-------------
• Stateless apart from the evaluator reference

EXCEPTION SAFETY
----------------
• Errors from domain/filter evaluation or from the callback propagate
  unchanged; the caller's base environment is never modified

===============================================================================
*/

#pragma once

#include "environment.h"
#include "expression.h"
#include "parameters.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mipdsl {

    using Domain = std::vector<Value>;

    /**
     * @brief Values of `a` that also occur in `b`, in `a`'s order
     */
    inline Domain domainIntersection(const Domain& a, const Domain& b)
    {
        Domain out;
        for (const auto& v : a) {
            for (const auto& w : b) {
                if (v == w) {
                    out.push_back(v);
                    break;
                }
            }
        }
        return out;
    }

    /**
     * @class ClauseEvaluator
     * @brief Evaluates clause domains and filters under an environment
     */
    class ClauseEvaluator {
    public:
        virtual ~ClauseEvaluator() = default;

        /// @brief Values a domain expression ranges over
        virtual Domain domainValues(const Expr& domain, const BindingEnvironment& env) = 0;

        /// @brief Truth of a filter expression
        virtual bool accepts(const Expr& filter, const BindingEnvironment& env) = 0;
    };

    /**
     * @class GeneratorExpander
     * @brief Cartesian expansion of generator clauses
     */
    class GeneratorExpander {
    public:
        explicit GeneratorExpander(ClauseEvaluator& evaluator) noexcept
            : evaluator_(&evaluator)
        {
        }

        /**
         * @brief Run fn(env) once per point of the clause product
         *
         * @param clauses  Generator clauses, outermost first
         * @param base     Environment the clause bindings are appended to
         * @param fn       Callback `void(const BindingEnvironment&)`
         * @return Number of points visited
         */
        template<typename Fn>
        std::size_t forEach(const std::vector<Clause>& clauses, const BindingEnvironment& base,
                            Fn&& fn) const
        {
            std::vector<std::optional<Domain>> fixed(clauses.size());
            std::set<std::string, std::less<>> earlier;
            for (std::size_t k = 0; k < clauses.size(); ++k) {
                if (!references(clauses[k].domain, earlier))
                    fixed[k] = evaluator_->domainValues(clauses[k].domain, base);
                earlier.insert(clauses[k].symbol);
            }

            BindingEnvironment env = base;
            std::size_t count = 0;
            visit(0, clauses, fixed, env, fn, count);
            return count;
        }

        /**
         * @brief Collect fn(env) for every point
         * @return Results in expansion order
         */
        template<typename Fn>
        auto expand(const std::vector<Clause>& clauses, const BindingEnvironment& base, Fn&& fn) const
        {
            using R = std::invoke_result_t<Fn&, const BindingEnvironment&>;
            std::vector<R> out;
            forEach(clauses, base, [&](const BindingEnvironment& env) { out.push_back(fn(env)); });
            return out;
        }

        /// @brief Materialize every point
        std::vector<BindingEnvironment> points(const std::vector<Clause>& clauses,
                                               const BindingEnvironment& base) const
        {
            return expand(clauses, base, [](const BindingEnvironment& env) { return env; });
        }

    private:
        template<typename Fn>
        void visit(std::size_t k, const std::vector<Clause>& clauses,
                   const std::vector<std::optional<Domain>>& fixed, BindingEnvironment& env,
                   Fn& fn, std::size_t& count) const
        {
            if (k == clauses.size()) {
                fn(static_cast<const BindingEnvironment&>(env));
                ++count;
                return;
            }

            const Clause& clause = clauses[k];
            Domain local;
            const Domain* domain = nullptr;
            if (fixed[k]) {
                domain = &*fixed[k];
            } else {
                local = evaluator_->domainValues(clause.domain, env);
                domain = &local;
            }

            for (const Value& v : *domain) {
                env.bind(clause.symbol, v, BindingOrigin::Generator);
                const bool keep = !clause.filter || evaluator_->accepts(*clause.filter, env);
                if (keep)
                    visit(k + 1, clauses, fixed, env, fn, count);
                env.pop();
            }
        }

        ClauseEvaluator* evaluator_;
    };

} // namespace mipdsl
