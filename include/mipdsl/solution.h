#pragma once
/*
===============================================================================
SOLUTION — Solver results
===============================================================================

Overview
--------
What a solver adapter hands back for a Problem: either a Solution (status,
objective value, one value per variable instance keyed by canonical name) or
a SolveFailure saying why there is none. Solver outcomes are values, not
exceptions; only programming errors throw.

Typical Usage
-------------
    SolveResult r = solver.solve(problem);
    if (r.ok()) {
        const Solution& s = r.solution();
        double shipped = s.value("ship", {Scalar("S1"), Scalar("C1")});
    } else if (r.failure().kind == FailureKind::Infeasible) {
        ...
    }

===============================================================================
*/

#include "enum_utils.h"
#include "naming.h"
#include "parameters.h"

#include <format>
#include <initializer_list>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace mipdsl {

/**
 * @brief Assignment of values to variable instances
 */
struct Solution {
    std::string status;              ///< Solver status name, e.g. "OPTIMAL"
    double objectiveValue = 0.0;
    std::map<std::string, double, std::less<>> values;   ///< canonical name -> value

    bool contains(std::string_view name) const { return values.find(name) != values.end(); }

    /// @throws std::out_of_range for a name without a value
    double value(std::string_view name) const
    {
        auto it = values.find(name);
        if (it == values.end())
            throw std::out_of_range(std::format("Solution::value: no variable '{}'", name));
        return it->second;
    }

    double value(std::string_view family, std::span<const Scalar> index) const
    {
        return value(canonicalName(family, index));
    }

    double value(std::string_view family, std::initializer_list<Scalar> index) const
    {
        return value(family, std::span<const Scalar>(index.begin(), index.size()));
    }

    /// @brief Value or fallback when the variable is absent
    double valueOr(std::string_view name, double fallback) const
    {
        auto it = values.find(name);
        return it == values.end() ? fallback : it->second;
    }
};

MIPDSL_DECLARE_ENUM_WITH_NAMES(FailureKind,
    Infeasible, Unbounded, InfeasibleOrUnbounded, SolverUnavailable, SolverError, NoSolution);

/**
 * @brief Why a solve produced no solution
 */
struct SolveFailure {
    FailureKind kind = FailureKind::SolverError;
    std::string message;
    int code = 0;   ///< Solver status or error code, 0 when not applicable

    std::string toString() const
    {
        if (message.empty())
            return std::string(to_string(kind));
        return std::format("{}: {}", to_string(kind), message);
    }
};

/**
 * @brief Solution or SolveFailure
 */
class SolveResult {
public:
    SolveResult(Solution s) : v_(std::move(s)) {}
    SolveResult(SolveFailure f) : v_(std::move(f)) {}

    bool ok() const noexcept { return std::holds_alternative<Solution>(v_); }
    explicit operator bool() const noexcept { return ok(); }

    /// @throws std::logic_error when the result is a failure
    const Solution& solution() const
    {
        if (!ok())
            throw std::logic_error("SolveResult::solution: " + failure().toString());
        return std::get<Solution>(v_);
    }

    /// @throws std::logic_error when the result is a solution
    const SolveFailure& failure() const
    {
        if (ok())
            throw std::logic_error("SolveResult::failure: result holds a solution");
        return std::get<SolveFailure>(v_);
    }

    const Solution* tryGetSolution() const noexcept { return std::get_if<Solution>(&v_); }

private:
    std::variant<Solution, SolveFailure> v_;
};

} // namespace mipdsl
