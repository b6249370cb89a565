#pragma once
/*
===============================================================================
MIPDSL — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the modeling layer: expression builders, the compiler,
the Problem model, diagnostics and LP export. The Gurobi adapter is not
included here so that models can be built and exported without a Gurobi
installation; include "gurobi_solver.h" (target mipdsl_gurobi) to solve.

WHAT'S INCLUDED
---------------
• enum_utils.h   - Enum declaration macros and helpers
• parameters.h   - Scalar / Value parameter store
• errors.h       - DslError and ErrorKind
• naming.h       - Canonical names, interpolation, LP-name checks
• polynomial.h   - Canonical polynomial
• expression.h   - Expression tree and builders (sym, sum, gen, ...)
• variables.h    - Variable families and the registry
• environment.h  - Binding and symbol environments
• generators.h   - Generator clause expansion
• constraints.h  - Constraint rows and the constraint set
• compiler.h     - Expression-to-polynomial compiler
• problem.h      - Problem model and declarations
• solution.h     - Solution / SolveFailure / SolveResult
• diagnostics.h  - Statistics, solution quality, reports
• lp_writer.h    - CPLEX LP export

QUICK START
-----------
    #include <mipdsl/mipdsl.h>
    using namespace mipdsl;

    ParameterMap params{
        {"suppliers", Value::list({"S1", "S2"})},
        {"customers", Value::list({"C1", "C2"})},
        {"supply", Value::map({{"S1", 20}, {"S2", 25}})},
    };
    Problem p("transport", "", Direction::Minimize, params);

    Family ship("ship");
    const Expr s = sym("s"), _ = wildcard();
    p.variables("ship", {gen("s", sym("suppliers")), gen("c", sym("customers"))},
                VarType::Continuous, {lit(0), {}});
    p.constraints({gen("s", sym("suppliers"))}, sum(ship(s, _)) <= sym("supply")[s], "Supply {s}");

    std::cout << toLpString(p);

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format>
• Gurobi Optimizer 10.0+ with the C++ API, only for gurobi_solver.h

CONFIGURATION
-------------
• MIPDSL_DEBUG: Problem traces every declaration to std::clog by default

===============================================================================
*/

// ============================================================================
// FOUNDATION
// ============================================================================

#include "enum_utils.h"
#include "parameters.h"
#include "errors.h"
#include "naming.h"
#include "polynomial.h"

// ============================================================================
// FRONT END AND CORE
// ============================================================================

#include "expression.h"
#include "variables.h"
#include "environment.h"
#include "generators.h"
#include "constraints.h"
#include "compiler.h"

// ============================================================================
// MODEL AND OUTPUT
// ============================================================================

#include "problem.h"
#include "solution.h"
#include "diagnostics.h"
#include "lp_writer.h"
