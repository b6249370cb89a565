#pragma once
/*
===============================================================================
DIAGNOSTICS — Problem analysis and reporting
===============================================================================

Overview
--------
Utilities for looking at a compiled Problem without a solver:

    * Problem statistics (variable counts by type, rows by sense, non-zeros)
    * Solution quality (constraint, bound and integrality violations)
    * One-line summaries and a full human-readable report

Design Philosophy
-----------------
1. Free functions over Problem, no state of their own
2. Small result structs
3. Output goes to a caller-supplied std::ostream; nothing is printed
   unless asked

Typical Usage
-------------
    auto stats = mipdsl::computeStatistics(problem);
    std::cout << mipdsl::modelSummary(problem) << "\n";
    // "6 vars (2 bin), 4 constrs, 12 nz"

    mipdsl::printReport(problem, std::cout);

    if (result.ok()) {
        auto q = mipdsl::computeSolutionQuality(problem, result.solution());
        if (q.maxConstrViolation > 1e-6) { ... }
    }

===============================================================================
*/

#include "constraints.h"
#include "problem.h"
#include "solution.h"
#include "variables.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <ostream>
#include <string>

namespace mipdsl {

// =============================================================================
// PROBLEM STATISTICS
// =============================================================================

/**
 * @brief Snapshot of problem size and composition
 */
struct ProblemStatistics {
    std::size_t numFamilies = 0;     ///< Declared variable families
    std::size_t numVars = 0;         ///< Variable instances
    std::size_t numBinary = 0;
    std::size_t numInteger = 0;      ///< General integers (binaries excluded)
    std::size_t numContinuous = 0;
    std::size_t numFree = 0;         ///< Variables without any finite bound
    std::size_t numConstrs = 0;
    std::size_t numLessEqual = 0;
    std::size_t numGreaterEqual = 0;
    std::size_t numEqual = 0;
    std::size_t numNonZeros = 0;     ///< Non-zero coefficients over all rows
    std::size_t numObjTerms = 0;     ///< Variable terms in the objective
};

/**
 * @brief Compute statistics for a problem
 *
 * @example
 *     auto stats = computeStatistics(problem);
 *     std::cout << stats.numVars << " vars, " << stats.numNonZeros << " nz\n";
 */
inline ProblemStatistics computeStatistics(const Problem& problem)
{
    ProblemStatistics stats;
    const VariableRegistry& reg = problem.registry();

    stats.numFamilies = reg.families().size();
    stats.numVars = reg.size();
    for (const auto& v : reg.instances()) {
        switch (v.type) {
            case VarType::Binary: ++stats.numBinary; break;
            case VarType::Integer: ++stats.numInteger; break;
            default: ++stats.numContinuous; break;
        }
        if (std::isinf(v.lowerBound()) && std::isinf(v.upperBound()))
            ++stats.numFree;
    }

    stats.numConstrs = problem.constraintSet().size();
    for (const auto& c : problem.constraintSet()) {
        switch (c.sense) {
            case Sense::LessEqual: ++stats.numLessEqual; break;
            case Sense::GreaterEqual: ++stats.numGreaterEqual; break;
            default: ++stats.numEqual; break;
        }
        stats.numNonZeros += c.lhs.size();
    }

    if (const auto& obj = problem.objective())
        stats.numObjTerms = obj->polynomial.withoutConstant().size();

    return stats;
}

// =============================================================================
// CONVENIENCE FUNCTIONS
// =============================================================================

/// @brief True if the problem has no binary or integer variables
inline bool isLP(const Problem& problem)
{
    const auto& instances = problem.registry().instances();
    return std::none_of(instances.begin(), instances.end(),
                        [](const VariableInstance& v) { return v.type != VarType::Continuous; });
}

inline bool isMIP(const Problem& problem)
{
    return !isLP(problem);
}

/**
 * @brief Brief summary string
 * @return e.g. "100 vars (50 bin, 10 int), 200 constrs, 640 nz"
 */
inline std::string modelSummary(const Problem& problem)
{
    auto stats = computeStatistics(problem);

    std::string result = std::format("{} vars", stats.numVars);
    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::format("{} bin", stats.numBinary);
            if (stats.numInteger > 0)
                result += ", ";
        }
        if (stats.numInteger > 0)
            result += std::format("{} int", stats.numInteger);
        result += ")";
    }
    result += std::format(", {} constrs, {} nz", stats.numConstrs, stats.numNonZeros);
    return result;
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/**
 * @brief Violation metrics of a solution against the problem it solves
 */
struct SolutionQuality {
    double maxConstrViolation = 0.0;
    double sumConstrViolation = 0.0;
    double maxBoundViolation = 0.0;
    double maxIntViolation = 0.0;     ///< Distance to the nearest integer
    std::string worstConstraint;      ///< Name of the most violated row, empty if none
};

/**
 * @brief Recompute violations from the solution values
 * @throws std::out_of_range if the solution misses a variable used by a row
 */
inline SolutionQuality computeSolutionQuality(const Problem& problem, const Solution& solution)
{
    SolutionQuality quality;

    for (const auto& c : problem.constraintSet()) {
        double v = violation(c, solution.values);
        quality.sumConstrViolation += v;
        if (v > quality.maxConstrViolation) {
            quality.maxConstrViolation = v;
            quality.worstConstraint = c.name;
        }
    }

    for (const auto& inst : problem.registry().instances()) {
        auto it = solution.values.find(inst.name);
        if (it == solution.values.end())
            continue;
        double x = it->second;
        double below = inst.lowerBound() - x;
        double above = x - inst.upperBound();
        quality.maxBoundViolation = std::max({quality.maxBoundViolation, below, above});
        if (inst.type != VarType::Continuous)
            quality.maxIntViolation = std::max(quality.maxIntViolation, std::fabs(x - std::round(x)));
    }

    return quality;
}

// =============================================================================
// REPORT
// =============================================================================

namespace diagnostics_detail {

    inline std::string renderBound(double b)
    {
        if (std::isinf(b))
            return b > 0 ? "+inf" : "-inf";
        return Scalar::render_real(b);
    }

} // namespace diagnostics_detail

/**
 * @brief Write a readable dump of the problem
 *
 * @details Header and statistics, then variables with type and bounds,
 *          constraints grouped by declaration, and the objective.
 */
inline void printReport(const Problem& problem, std::ostream& os)
{
    auto stats = computeStatistics(problem);

    os << std::format("Problem: {}\n", problem.name());
    if (!problem.description().empty())
        os << std::format("  {}\n", problem.description());
    os << std::format("  {} ({})\n\n", modelSummary(problem), isMIP(problem) ? "MIP" : "LP");

    os << std::format("Variables ({} in {} families, {} free)\n", stats.numVars, stats.numFamilies,
                      stats.numFree);
    for (const auto& v : problem.registry().instances()) {
        os << std::format("  {:<24} {:<10} [{}, {}]", v.name, to_string(v.type),
                          diagnostics_detail::renderBound(v.lowerBound()),
                          diagnostics_detail::renderBound(v.upperBound()));
        if (!v.description.empty())
            os << "  " << v.description;
        os << '\n';
    }

    os << std::format("\nConstraints ({}: {} <=, {} >=, {} =)\n", stats.numConstrs, stats.numLessEqual,
                      stats.numGreaterEqual, stats.numEqual);
    const ConstraintSet& rows = problem.constraintSet();
    for (const auto& group : rows.groups()) {
        os << std::format("  # {} ({} rows)\n", group.label, group.count);
        for (std::size_t i = group.first; i < group.first + group.count; ++i)
            os << "  " << rows[i].toString() << '\n';
    }

    os << '\n';
    if (const auto& obj = problem.objective())
        os << std::format("Objective: {} {}\n", directionKeyword(obj->direction), obj->polynomial.toString());
    else
        os << "Objective: none\n";
}

} // namespace mipdsl
