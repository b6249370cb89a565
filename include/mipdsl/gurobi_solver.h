#pragma once
/*
===============================================================================
GUROBI SOLVER — Solver adapter on the Gurobi C++ API
===============================================================================

Overview
--------
GurobiSolver hands a compiled Problem to Gurobi and turns the outcome into
a SolveResult:

    * Environment creation (GRBEnv, deferred start)
    * Model translation (buildModel: variables, rows, objective)
    * Parameter assignment from named setters and presets
    * Optimization and status mapping
    * Solution extraction keyed by canonical variable name

Like a template method, solve() runs

    configureEnvironment(env);   // hook
    env.start();
    buildModel(problem, model);
    beforeOptimize(model);       // hook
    model.optimize();
    afterOptimize(model);        // hook

so derived solvers can add warm starts, callbacks or extra parameters.

Solver outcomes never escape as exceptions. License and environment
problems become SolverUnavailable, other GRBExceptions SolverError.

Parameters
----------
Every named setter records its value in settings() under
"param:<GurobiName>", and the recorded values are applied to the
environment before it starts:

    GurobiSolver solver;
    solver.timeLimit(30);                 // settings()["param:TimeLimit"] = 30.0
    solver.applyPreset(SolverPreset::Quiet);
    solver.setParam("Heuristics", 0.5);   // anything else Gurobi knows

Typical Usage
-------------
    GurobiSolver solver;
    solver.mipGapLimit(0.01);
    SolveResult r = solver.solve(problem);
    if (r.ok())
        std::cout << r.solution().objectiveValue << "\n";
    else
        std::cout << r.failure().toString() << "\n";

===============================================================================
*/

#include "gurobi_c++.h"

#include "enum_utils.h"
#include "parameters.h"
#include "problem.h"
#include "solution.h"
#include "variables.h"

#include <cmath>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mipdsl {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert a Gurobi status code to its name
 *
 * @example
 *     statusString(GRB_OPTIMAL);   // "OPTIMAL"
 *     statusString(42);            // "UNKNOWN(42)"
 */
inline std::string statusString(int status)
{
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return std::format("UNKNOWN({})", status);
    }
}

// =============================================================================
// MODEL TRANSLATION
// =============================================================================

namespace gurobi_detail {

    inline char typeChar(VarType t) noexcept
    {
        switch (t) {
            case VarType::Binary: return GRB_BINARY;
            case VarType::Integer: return GRB_INTEGER;
            default: return GRB_CONTINUOUS;
        }
    }

    inline char senseChar(Sense s) noexcept
    {
        switch (s) {
            case Sense::LessEqual: return GRB_LESS_EQUAL;
            case Sense::GreaterEqual: return GRB_GREATER_EQUAL;
            default: return GRB_EQUAL;
        }
    }

    inline double clampInfinity(double v) noexcept
    {
        if (std::isinf(v))
            return v > 0 ? GRB_INFINITY : -GRB_INFINITY;
        return v;
    }

    inline GRBLinExpr toLinExpr(const LinearForm& form, const std::vector<GRBVar>& vars)
    {
        GRBLinExpr expr(form.constant);
        for (const auto& [id, coef] : form.terms)
            expr += coef * vars[id];
        return expr;
    }

} // namespace gurobi_detail

/**
 * @brief Translate a problem into an existing Gurobi model
 * @return Gurobi variables indexed by variable instance id
 * @throws GRBException on Gurobi errors
 */
inline std::vector<GRBVar> buildModel(const Problem& problem, GRBModel& model)
{
    std::vector<GRBVar> vars;
    vars.reserve(problem.registry().size());
    for (const auto& v : problem.registry().instances()) {
        vars.push_back(model.addVar(gurobi_detail::clampInfinity(v.lowerBound()),
                                    gurobi_detail::clampInfinity(v.upperBound()),
                                    0.0, gurobi_detail::typeChar(v.type), v.name));
    }

    for (const auto& c : problem.constraintSet()) {
        GRBLinExpr lhs = gurobi_detail::toLinExpr(problem.linearForm(c.lhs), vars);
        model.addConstr(lhs, gurobi_detail::senseChar(c.sense), c.rhs, c.name);
    }

    GRBLinExpr objective;
    if (const auto& obj = problem.objective())
        objective = gurobi_detail::toLinExpr(problem.linearForm(obj->polynomial), vars);
    model.setObjective(objective,
                       problem.effectiveDirection() == Direction::Maximize ? GRB_MAXIMIZE : GRB_MINIMIZE);

    model.update();
    return vars;
}

// =============================================================================
// SOLVER
// =============================================================================

/// @brief Predefined parameter configurations
MIPDSL_DECLARE_ENUM_WITH_NAMES(SolverPreset, Fast, Accurate, Feasibility, Quiet, Debug);

/**
 * @class GurobiSolver
 * @brief Solves Problems with Gurobi; settings are recorded and replayed
 */
class GurobiSolver {
public:
    GurobiSolver() = default;
    virtual ~GurobiSolver() = default;

    // -------------------------------------------------------------------------
    // Parameter Configuration
    // -------------------------------------------------------------------------

    /**
     * @brief Record any Gurobi parameter by name
     * @example
     *     solver.setParam("Heuristics", 0.5);   // settings()["param:Heuristics"]
     */
    void setParam(const std::string& name, Value value)
    {
        settings_["param:" + name] = std::move(value);
    }

    /// @brief Time limit in seconds (TimeLimit)
    void timeLimit(double seconds) { setParam("TimeLimit", seconds); }

    /// @brief Relative MIP gap, 0.01 = 1% (MIPGap)
    void mipGapLimit(double gap) { setParam("MIPGap", gap); }

    /// @brief Thread count, 0 = automatic (Threads)
    void threads(int n) { setParam("Threads", n); }

    void quiet() { setParam("OutputFlag", 0); }
    void verbose() { setParam("OutputFlag", 1); }

    /// @brief -1 auto, 0 off, 1 conservative, 2 aggressive (Presolve)
    void presolve(int level) { setParam("Presolve", level); }

    /// @brief 0 balanced, 1 feasibility, 2 optimality, 3 bound (MIPFocus)
    void mipFocus(int focus) { setParam("MIPFocus", focus); }

    /**
     * @brief Apply a predefined configuration
     *
     * @details
     *   - Fast: TimeLimit=60, MIPGap=5%, Threads=0
     *   - Accurate: TimeLimit=3600, MIPGap=0.01%
     *   - Feasibility: MIPFocus=1
     *   - Quiet: OutputFlag=0
     *   - Debug: OutputFlag=1, Presolve=0
     *
     * The preset name is recorded under "param:Preset" and not sent to Gurobi.
     */
    void applyPreset(SolverPreset p)
    {
        switch (p) {
            case SolverPreset::Fast:
                timeLimit(60.0);
                mipGapLimit(0.05);
                threads(0);
                break;
            case SolverPreset::Accurate:
                timeLimit(3600.0);
                mipGapLimit(0.0001);
                break;
            case SolverPreset::Feasibility:
                mipFocus(1);
                break;
            case SolverPreset::Quiet:
                quiet();
                break;
            case SolverPreset::Debug:
                verbose();
                presolve(0);
                break;
            default:
                return;
        }
        settings_["param:Preset"] = std::string(to_string(p));
    }

    ParameterMap& settings() noexcept { return settings_; }
    const ParameterMap& settings() const noexcept { return settings_; }

    // -------------------------------------------------------------------------
    // Solve
    // -------------------------------------------------------------------------

    /**
     * @brief Optimize a problem
     * @return Solution, or SolveFailure for infeasible/unbounded problems,
     *         missing licenses, Gurobi errors and runs without a solution
     */
    SolveResult solve(const Problem& problem)
    {
        try {
            GRBEnv env(true);
            applySettings(env);
            configureEnvironment(env);
            env.start();

            GRBModel model(env);
            std::vector<GRBVar> vars = buildModel(problem, model);

            beforeOptimize(model);
            model.optimize();
            afterOptimize(model);

            return extract(problem, model, vars);
        } catch (const GRBException& e) {
            int code = e.getErrorCode();
            FailureKind kind = code == GRB_ERROR_NO_LICENSE ? FailureKind::SolverUnavailable
                                                            : FailureKind::SolverError;
            return SolveFailure{kind, e.getMessage(), code};
        }
    }

protected:
    // -------------------------------------------------------------------------
    // Template-method hooks for derived solvers
    // -------------------------------------------------------------------------

    /// @brief Adjust the environment before it starts (license server, log file)
    virtual void configureEnvironment(GRBEnv& env) {}

    /// @brief Last chance to touch the model (warm starts, callbacks)
    virtual void beforeOptimize(GRBModel& model) {}

    virtual void afterOptimize(GRBModel& model) {}

private:
    void applySettings(GRBEnv& env) const
    {
        constexpr std::string_view prefix = "param:";
        for (const auto& [key, value] : settings_) {
            if (!key.starts_with(prefix) || key == "param:Preset")
                continue;
            env.set(key.substr(prefix.size()), value.to_string());
        }
    }

    static SolveResult extract(const Problem& problem, GRBModel& model, const std::vector<GRBVar>& vars)
    {
        int status = model.get(GRB_IntAttr_Status);
        switch (status) {
            case GRB_INFEASIBLE:
                return SolveFailure{FailureKind::Infeasible, statusString(status), status};
            case GRB_UNBOUNDED:
                return SolveFailure{FailureKind::Unbounded, statusString(status), status};
            case GRB_INF_OR_UNBD:
                return SolveFailure{FailureKind::InfeasibleOrUnbounded, statusString(status), status};
            default:
                break;
        }
        if (model.get(GRB_IntAttr_SolCount) == 0)
            return SolveFailure{FailureKind::NoSolution, statusString(status), status};

        Solution s;
        s.status = statusString(status);
        s.objectiveValue = model.get(GRB_DoubleAttr_ObjVal);
        for (const auto& inst : problem.registry().instances())
            s.values.emplace(inst.name, vars[inst.id].get(GRB_DoubleAttr_X));
        return s;
    }

    ParameterMap settings_;
};

} // namespace mipdsl
