/*
===============================================================================
TEST DIAGNOSTICS — Tests for diagnostics.h and solution.h
===============================================================================

OVERVIEW
--------
Validates solver-free analysis of a compiled Problem:
- Problem statistics and the one-line summary
- Solution quality against a hand-written assignment
- The readable report
- Solution and SolveResult accessors

TEST ORGANIZATION
-----------------
• Section A: Statistics
• Section B: Solution quality
• Section C: Report
• Section D: Solve results

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• diagnostics.h - System under test
• solution.h - Result types

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <mipdsl/diagnostics.h>
#include <mipdsl/solution.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace mipdsl;

// ============================================================================
// TEST SUPPORT
// ============================================================================

namespace {

    /**
     * Plant location: ship(s, c) >= 0, open(s) binary, spare free.
     * 5 rows with 11 non-zeros, 6 objective terms.
     */
    Problem makePlant()
    {
        const Family ship("ship"), open("open");
        Expr s = sym("s"), c = sym("c"), _ = wildcard();

        ParameterMap data{
            {"suppliers", Value::list({"S1", "S2"})},
            {"customers", Value::list({"C1", "C2"})},
            {"supply", Value::map({{"S1", 20}, {"S2", 25}})},
            {"demand", Value::map({{"C1", 15}, {"C2", 30}})},
        };

        Problem p("plant", "Open plants and ship", Direction::Minimize, data);
        p.variables("ship", {gen("s", sym("suppliers")), gen("c", sym("customers"))},
                    VarType::Continuous, {lit(0), {}})
         .variables("open", {gen("s", sym("suppliers"))}, VarType::Binary)
         .variables("spare", VarType::Continuous)
         .constraints({gen("s", sym("suppliers"))}, sum(ship(s, _)) <= sym("supply")[s] * open(s), "Supply {s}")
         .constraints({gen("c", sym("customers"))}, sum(ship(_, c)) >= sym("demand")[c], "Demand {c}")
         .constraints(sym("spare") == 0, "spare")
         .objective(sum({gen("s", sym("suppliers")), gen("c", sym("customers"))}, ship(s, c))
                    + sum({gen("s", sym("suppliers"))}, 100 * open(s)));
        return p;
    }

    Solution plantSolution()
    {
        Solution s;
        s.status = "OPTIMAL";
        s.values = {
            {"ship(S1,C1)", 15.0}, {"ship(S1,C2)", 10.0},
            {"ship(S2,C1)", -0.25}, {"ship(S2,C2)", 20.0},
            {"open(S1)", 1.0}, {"open(S2)", 0.5}, {"spare", 0.0},
        };
        return s;
    }

} // namespace

// ============================================================================
// SECTION A: STATISTICS
// ============================================================================

/**
 * @test Statistics::Counts
 * @brief Variables by type, rows by sense, non-zeros and objective terms
 *
 * @covers computeStatistics()
 */
TEST_CASE("A1: Statistics::Counts", "[diagnostics][statistics]")
{
    auto stats = computeStatistics(makePlant());

    REQUIRE(stats.numFamilies == 3);
    REQUIRE(stats.numVars == 7);
    REQUIRE(stats.numBinary == 2);
    REQUIRE(stats.numInteger == 0);
    REQUIRE(stats.numContinuous == 5);
    REQUIRE(stats.numFree == 1);
    REQUIRE(stats.numConstrs == 5);
    REQUIRE(stats.numLessEqual == 2);
    REQUIRE(stats.numGreaterEqual == 2);
    REQUIRE(stats.numEqual == 1);
    REQUIRE(stats.numNonZeros == 11);
    REQUIRE(stats.numObjTerms == 6);
}

/**
 * @test Statistics::Summary
 * @brief modelSummary and the LP/MIP classification
 *
 * @covers modelSummary()
 * @covers isLP()
 * @covers isMIP()
 */
TEST_CASE("A2: Statistics::Summary", "[diagnostics][statistics]")
{
    Problem plant = makePlant();
    REQUIRE(modelSummary(plant) == "7 vars (2 bin), 5 constrs, 11 nz");
    REQUIRE(isMIP(plant));

    Problem lp("lp");
    lp.variables("a", VarType::Continuous).variables("b", VarType::Continuous);
    REQUIRE(isLP(lp));
    REQUIRE(modelSummary(lp) == "2 vars, 0 constrs, 0 nz");

    lp.variables("k", VarType::Integer).variables("z", VarType::Binary);
    REQUIRE(modelSummary(lp) == "4 vars (1 bin, 1 int), 0 constrs, 0 nz");
}

// ============================================================================
// SECTION B: SOLUTION QUALITY
// ============================================================================

/**
 * @test Quality::Violations
 * @brief Row, bound and integrality violations of a hand-made assignment
 *
 * @scenario open(S2) = 0.5 and ship(S2,C1) = -0.25
 * @given Supply rows 25 <= 20 and 19.75 <= 12.5
 * @when Computing quality
 * @then Worst row "Supply S2" at 7.25, bound 0.25, integrality 0.5
 *
 * @covers computeSolutionQuality()
 */
TEST_CASE("B1: Quality::Violations", "[diagnostics][quality]")
{
    auto q = computeSolutionQuality(makePlant(), plantSolution());

    REQUIRE(q.maxConstrViolation == 7.25);
    REQUIRE(q.worstConstraint == "Supply S2");
    REQUIRE(q.sumConstrViolation == 5.0 + 7.25 + 0.25);
    REQUIRE(q.maxBoundViolation == 0.25);
    REQUIRE(q.maxIntViolation == 0.5);
}

/**
 * @test Quality::MissingValues
 * @brief A row over a variable without a value cannot be evaluated
 *
 * @covers computeSolutionQuality()
 */
TEST_CASE("B2: Quality::MissingValues", "[diagnostics][quality]")
{
    Solution partial = plantSolution();
    partial.values.erase("spare");
    REQUIRE_THROWS_AS(computeSolutionQuality(makePlant(), partial), std::out_of_range);

    Problem empty("empty");
    auto q = computeSolutionQuality(empty, Solution{});
    REQUIRE(q.maxConstrViolation == 0.0);
    REQUIRE(q.worstConstraint.empty());
}

// ============================================================================
// SECTION C: REPORT
// ============================================================================

/**
 * @test Report::Sections
 * @brief printReport lists header, variables, grouped rows and objective
 *
 * @covers printReport()
 */
TEST_CASE("C1: Report::Sections", "[diagnostics][report]")
{
    std::ostringstream os;
    printReport(makePlant(), os);
    std::string text = os.str();

    REQUIRE(text.starts_with("Problem: plant\n  Open plants and ship\n"));
    REQUIRE(text.find("  7 vars (2 bin), 5 constrs, 11 nz (MIP)\n") != std::string::npos);
    REQUIRE(text.find("Variables (7 in 3 families, 1 free)\n") != std::string::npos);
    REQUIRE(text.find("[0.0, +inf]") != std::string::npos);
    REQUIRE(text.find("[0.0, 1.0]") != std::string::npos);
    REQUIRE(text.find("[-inf, +inf]") != std::string::npos);
    REQUIRE(text.find("Constraints (5: 2 <=, 2 >=, 1 =)\n") != std::string::npos);
    REQUIRE(text.find("  # constraints \"Supply {s}\" (2 rows)\n") != std::string::npos);
    REQUIRE(text.find("  Demand C2: ship(S1,C2) + ship(S2,C2) >= 30.0\n") != std::string::npos);
    REQUIRE(text.find("Objective: minimize ") != std::string::npos);

    std::ostringstream bare;
    printReport(Problem("bare"), bare);
    REQUIRE(bare.str().find("Objective: none\n") != std::string::npos);
}

// ============================================================================
// SECTION D: SOLVE RESULTS
// ============================================================================

/**
 * @test Results::SolutionLookup
 * @brief Values by canonical name or by family and index
 *
 * @covers Solution::value()
 * @covers Solution::valueOr()
 */
TEST_CASE("D1: Results::SolutionLookup", "[diagnostics][results]")
{
    Solution s = plantSolution();
    REQUIRE(s.value("ship(S1,C2)") == 10.0);
    REQUIRE(s.value("ship", {"S2", "C2"}) == 20.0);
    REQUIRE(s.contains("open(S1)"));
    REQUIRE_FALSE(s.contains("open(S3)"));
    REQUIRE(s.valueOr("open(S3)", -1.0) == -1.0);
    REQUIRE_THROWS_AS(s.value("open(S3)"), std::out_of_range);
}

/**
 * @test Results::SolutionOrFailure
 * @brief SolveResult holds exactly one of Solution and SolveFailure
 *
 * @covers SolveResult
 * @covers SolveFailure::toString()
 */
TEST_CASE("D2: Results::SolutionOrFailure", "[diagnostics][results]")
{
    SolveResult good(plantSolution());
    REQUIRE(good.ok());
    REQUIRE(static_cast<bool>(good));
    REQUIRE(good.solution().status == "OPTIMAL");
    REQUIRE(good.tryGetSolution() != nullptr);
    REQUIRE_THROWS_AS(good.failure(), std::logic_error);

    SolveResult bad(SolveFailure{FailureKind::Infeasible, "INFEASIBLE", 3});
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.failure().kind == FailureKind::Infeasible);
    REQUIRE(bad.failure().toString() == "Infeasible: INFEASIBLE");
    REQUIRE(bad.tryGetSolution() == nullptr);
    REQUIRE_THROWS_AS(bad.solution(), std::logic_error);

    REQUIRE(SolveFailure{FailureKind::NoSolution}.toString() == "NoSolution");
}
