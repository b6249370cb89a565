/*
===============================================================================
TEST COMPILER — Tests for compiler.h
===============================================================================

OVERVIEW
--------
Validates the expression-to-polynomial compiler: dispatch by node kind,
linearity checks, constant evaluation, container access, symbol resolution,
aggregation, both wildcard modes and the context attached to errors.

TEST ORGANIZATION
-----------------
• Section A: Polynomial compilation and linearity
• Section B: Constant evaluation and access
• Section C: Symbol resolution and ambiguity
• Section D: Aggregation and wildcards
• Section E: Error context and determinism

TEST STRATEGY
-------------
• Results are compared through Polynomial::toString, which is canonical
• Every failure is checked for its ErrorKind

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• compiler.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <mipdsl/compiler.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace mipdsl;

// ============================================================================
// TEST SUPPORT
// ============================================================================

namespace {

    template<typename Fn>
    std::optional<ErrorKind> errorOf(Fn&& fn)
    {
        try {
            fn();
        } catch (const DslError& e) {
            return e.kind();
        }
        return std::nullopt;
    }

    /// Transportation-style data with a sparse ship family
    struct CompilerFixture {
        ParameterMap params{
            {"n", 4},
            {"sizes", Value::list({3, 5, 8})},
            {"supply", Value::map({{"S1", 20}, {"S2", 25}})},
            {"cost", Value::map({{"a", 2}, {"b", 3}, {"c", 4}})},
            {"far", Value::map({{"z", 1}})},
            {"food", Value::map({{"cal", 80}})},
        };
        VariableRegistry registry;
        ExpressionCompiler compiler{registry, params};
        BindingEnvironment none;

        Family x{"x"};
        Family ship{"ship"};
        Family buy{"buy"};
        const Expr s = sym("s");
        const Expr _ = wildcard();

        CompilerFixture()
        {
            registry.declareFamily("x", VarType::Continuous, {}, {}, 1);
            registry.declareFamily("z", VarType::Binary);
            registry.declareFamily("ship", VarType::Continuous, {0.0, std::nullopt}, {}, 2);
            registry.declareFamily("buy", VarType::Integer, {}, {}, 1);
            registry.declareFamily("empty", VarType::Continuous, {}, {}, 1);

            registry.instantiate("ship", {"S1", "C1"});
            registry.instantiate("ship", {"S1", "C2"});
            registry.instantiate("ship", {"S2", "C1"});
            registry.instantiate("buy", {"a"});
            registry.instantiate("buy", {"b"});
        }

        std::string text(const Expr& e, const BindingEnvironment& env)
        {
            return compiler.compile(e, env).toString();
        }

        std::string text(const Expr& e) { return text(e, none); }
    };

    BindingEnvironment at(std::string name, Value value)
    {
        return BindingEnvironment{}.with(std::move(name), std::move(value));
    }

} // namespace

// ============================================================================
// SECTION A: POLYNOMIAL COMPILATION
// ============================================================================

/**
 * @test Dispatch::ConstantsAndVariables
 * @brief Literals and parameters become constants; calls become variables
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("A1: Dispatch::ConstantsAndVariables", "[compiler][dispatch]")
{
    CompilerFixture f;

    REQUIRE(f.text(lit(3)) == "3");
    REQUIRE(f.text(sym("n")) == "4");
    REQUIRE(f.text(f.x(1) * 2 + 3) == "2 x(1) + 3");
    REQUIRE(f.text(sym("z")) == "z");
    REQUIRE(f.text(-f.x(2)) == "-x(2)");
    REQUIRE(f.registry.find("x", {1}) != nullptr);

    SECTION("Non-numeric operands") {
        REQUIRE(errorOf([&] { f.text(str("a")); }) == ErrorKind::TypeMismatch);
        REQUIRE(errorOf([&] { f.text(range(1, 3)); }) == ErrorKind::TypeMismatch);
        REQUIRE(errorOf([&] { f.text(f.x(1) <= 2); }) == ErrorKind::UnsupportedOperation);
    }

    SECTION("Arity") {
        REQUIRE(errorOf([&] { f.text(f.x(1, 2)); }) == ErrorKind::ArityMismatch);
        REQUIRE(errorOf([&] { f.text(call("z", {1})); }) == ErrorKind::ArityMismatch);
        REQUIRE(errorOf([&] { f.text(f.x(sym("sizes"))); }) == ErrorKind::TypeMismatch);
    }
}

/**
 * @test Linearity::ProductsAndDivision
 * @brief Products need a constant side; divisors must be non-zero constants
 *
 * @scenario Common modeling mistakes
 * @given x(1) * x(2), 2 / x(1), x(1) / 0
 * @when Compiling
 * @then NonlinearExpression and UnsupportedOperation; constant factors fold
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("A2: Linearity::ProductsAndDivision", "[compiler][linearity]")
{
    CompilerFixture f;

    REQUIRE(f.text((f.x(1) + 1) * (lit(3) - 1)) == "2 x(1) + 2");
    REQUIRE(f.text(sym("n") * f.x(1)) == "4 x(1)");
    REQUIRE(f.text(f.x(1) / 2) == "0.5 x(1)");
    REQUIRE(f.text(f.x(1) - f.x(1)) == "0");

    REQUIRE(errorOf([&] { f.text(f.x(1) * f.x(2)); }) == ErrorKind::NonlinearExpression);
    REQUIRE(errorOf([&] { f.text(2 / f.x(1)); }) == ErrorKind::UnsupportedOperation);
    REQUIRE(errorOf([&] { f.text(f.x(1) / (sym("n") - 4)); }) == ErrorKind::UnsupportedOperation);
}

/**
 * @test Comparison::Normalization
 * @brief Variables move left, constants fold right, sense is kept
 *
 * @covers ExpressionCompiler::compileComparison()
 */
TEST_CASE("A3: Comparison::Normalization", "[compiler][comparison]")
{
    CompilerFixture f;

    auto row = f.compiler.compileComparison(f.x(1) + 5 <= 2 * f.x(2) + 20, f.none);
    REQUIRE(row.lhs.toString() == "x(1) - 2 x(2)");
    REQUIRE(row.sense == Sense::LessEqual);
    REQUIRE(row.rhs == 15.0);

    auto eq = f.compiler.compileComparison(f.x(1) == 0, f.none);
    REQUIRE(eq.sense == Sense::Equal);
    REQUIRE(eq.rhs == 0.0);
    REQUIRE_FALSE(std::signbit(eq.rhs));

    auto ge = f.compiler.compileComparison(lit(10) >= f.x(3), f.none);
    REQUIRE(ge.lhs.toString() == "-x(3)");
    REQUIRE(ge.sense == Sense::GreaterEqual);
    REQUIRE(ge.rhs == -10.0);

    REQUIRE(errorOf([&] { f.compiler.compileComparison(f.x(1) < 3, f.none); })
            == ErrorKind::UnsupportedOperation);
    REQUIRE(errorOf([&] { f.compiler.compileComparison(f.x(1) != 3, f.none); })
            == ErrorKind::UnsupportedOperation);
    REQUIRE(errorOf([&] { f.compiler.compileComparison(f.x(1) + 3, f.none); })
            == ErrorKind::UnsupportedOperation);
}

/**
 * @test Comparison::ConstantQuotients
 * @brief Quotients folded into a row match scalar division exactly
 *
 * @covers ExpressionCompiler::compileComparison()
 */
TEST_CASE("A4: Comparison::ConstantQuotients", "[compiler][comparison]")
{
    CompilerFixture f;

    auto row = f.compiler.compileComparison(f.x(1) <= lit(3) / 5, f.none);
    REQUIRE(row.rhs == 3.0 / 5.0);

    auto scaled = f.compiler.compileComparison(3 * f.x(1) / 5 >= 1, f.none);
    REQUIRE(scaled.lhs.coefficient("x(1)") == 3.0 / 5.0);
}

// ============================================================================
// SECTION B: CONSTANT EVALUATION
// ============================================================================

/**
 * @test Evaluate::Arithmetic
 * @brief Integer arithmetic stays integral except for division
 *
 * @covers ExpressionCompiler::evaluate()
 */
TEST_CASE("B1: Evaluate::Arithmetic", "[compiler][evaluate]")
{
    CompilerFixture f;
    auto eval = [&](const Expr& e) { return f.compiler.evaluate(e, f.none); };

    REQUIRE(eval(lit(2) + 3) == Value(5));
    REQUIRE(eval(lit(2.0) + 3) == Value(5.0));
    REQUIRE(eval(lit(7) / 2) == Value(3.5));
    REQUIRE(eval(-sym("n")) == Value(-4));
    REQUIRE(eval(lit(2) < 3) == Value(1));
    REQUIRE(eval(str("a") == "b") == Value(0));
    REQUIRE(eval(lit(1) && lit(0)) == Value(0));
    REQUIRE(eval(!lit(0)) == Value(1));
    REQUIRE(eval(range(1, 3)) == Value::list({1, 2, 3}));
    REQUIRE(f.compiler.evaluateNumber(sym("supply")["S2"], f.none) == 25.0);

    REQUIRE(errorOf([&] { eval(lit(1) / 0); }) == ErrorKind::UnsupportedOperation);
    REQUIRE(errorOf([&] { eval(range(1.5, 3)); }) == ErrorKind::TypeMismatch);
    REQUIRE(errorOf([&] { eval(str("a") < 1); }) == ErrorKind::TypeMismatch);
    REQUIRE(errorOf([&] { eval(f.x(1)); }) == ErrorKind::TypeMismatch);
}

/**
 * @test Evaluate::ContainerAccess
 * @brief Lists are 0-based; maps report missing keys
 *
 * @scenario sizes = [3, 5, 8], supply = {S1: 20, S2: 25}
 * @given Valid and invalid keys
 * @when Evaluating accesses
 * @then Values, IndexOutOfBounds, MissingKey or TypeMismatch as appropriate
 *
 * @covers ExpressionCompiler::evaluate()
 */
TEST_CASE("B2: Evaluate::ContainerAccess", "[compiler][access]")
{
    CompilerFixture f;
    auto eval = [&](const Expr& e) { return f.compiler.evaluate(e, f.none); };
    Expr sizes = sym("sizes");

    REQUIRE(eval(sizes[0]) == Value(3));
    REQUIRE(eval(sizes[2]) == Value(8));
    REQUIRE(eval(sizes[1.0]) == Value(5));
    REQUIRE(eval(sym("supply")["S1"]) == Value(20));
    REQUIRE(eval(sym("food").field("cal")) == Value(80));

    REQUIRE(errorOf([&] { eval(sizes[3]); }) == ErrorKind::IndexOutOfBounds);
    REQUIRE(errorOf([&] { eval(sizes[-1]); }) == ErrorKind::IndexOutOfBounds);
    REQUIRE(errorOf([&] { eval(sizes[0.5]); }) == ErrorKind::TypeMismatch);
    REQUIRE(errorOf([&] { eval(sym("supply")["S9"]); }) == ErrorKind::MissingKey);
    REQUIRE(errorOf([&] { eval(sym("food").field("fat")); }) == ErrorKind::MissingKey);
    REQUIRE(errorOf([&] { eval(sym("n")[0]); }) == ErrorKind::TypeMismatch);
}

/**
 * @test Evaluate::IntegerLimits
 * @brief Integer results that do not fit in 64 bits become reals
 *
 * @scenario Arithmetic and ranges at the edge of the integer type
 * @given max + 1, min - 1, max * 2, -min and the range max-1..max
 * @when Evaluating
 * @then Overflowing results are reals; ranges end at the bound
 *
 * @covers ExpressionCompiler::evaluate()
 */
TEST_CASE("B3: Evaluate::IntegerLimits", "[compiler][evaluate]")
{
    CompilerFixture f;
    auto eval = [&](const Expr& e) { return f.compiler.evaluate(e, f.none); };
    const long long max = std::numeric_limits<long long>::max();
    const long long min = std::numeric_limits<long long>::min();
    const Expr big(max), small(min);

    Value sum = eval(big + 1);
    REQUIRE(sum.as_scalar().is_real());
    REQUIRE(sum.as_number() == 9223372036854775808.0);

    REQUIRE(eval(small - 1).as_scalar().is_real());
    REQUIRE(eval(big * 2).as_number() == 2.0 * 9223372036854775808.0);
    REQUIRE(eval(small * -1).as_scalar().is_real());
    REQUIRE(eval(-small).as_number() == 9223372036854775808.0);
    REQUIRE(eval(-big) == Value(-max));
    REQUIRE(eval(big - 1) == Value(max - 1));
    REQUIRE(eval(small + 1) == Value(min + 1));
    REQUIRE(eval(lit(-3) * 4) == Value(-12));

    REQUIRE(eval(range(big - 1, big)) == Value::list({max - 1, max}));
    REQUIRE(eval(range(small, small + 1)) == Value::list({min, min + 1}));
    REQUIRE(eval(range(big, big - 1)).size() == 0);

    REQUIRE(errorOf([&] { eval(sym("sizes")[1e19]); }) == ErrorKind::TypeMismatch);
    REQUIRE(errorOf([&] { eval(range(0, 1e19)); }) == ErrorKind::TypeMismatch);
}

// ============================================================================
// SECTION C: SYMBOL RESOLUTION
// ============================================================================

/**
 * @test Resolution::UndefinedNames
 * @brief Unknown names are classified by where they were used
 *
 * @covers ExpressionCompiler::compile()
 * @covers ExpressionCompiler::evaluate()
 */
TEST_CASE("C1: Resolution::UndefinedNames", "[compiler][resolution]")
{
    CompilerFixture f;

    try {
        f.text(sym("nope") + 1);
        FAIL("expected DslError");
    } catch (const DslError& e) {
        REQUIRE(e.kind() == ErrorKind::UndefinedSymbol);
        REQUIRE(e.symbol() == "nope");
    }

    try {
        f.text(call("n", {1}));
        FAIL("expected DslError");
    } catch (const DslError& e) {
        REQUIRE(e.kind() == ErrorKind::UndefinedVariable);
        REQUIRE(e.message().find("parameter") != std::string::npos);
    }

    REQUIRE(errorOf([&] { f.text(call("y", {1})); }) == ErrorKind::UndefinedVariable);
    REQUIRE(errorOf([&] { f.text(sym("demand")["C1"]); }) == ErrorKind::UndefinedConstant);
    REQUIRE(errorOf([&] { f.text(sym("x")[1]); }) == ErrorKind::UndefinedConstant);
}

/**
 * @test Resolution::Ambiguity
 * @brief Generator bindings shadow families; parameters and caller bindings do not
 *
 * @scenario A name shared by a variable family and a constant
 * @given Family "x" plus a parameter, caller binding or generator binding "x"
 * @when Compiling the bare symbol
 * @then Only the generator binding resolves; the others are AmbiguousSymbol
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("C2: Resolution::Ambiguity", "[compiler][resolution]")
{
    CompilerFixture f;

    REQUIRE(f.text(sym("x"), at("x", Value(2))) == "2");

    BindingEnvironment caller = BindingEnvironment{}.with("x", Value(2), BindingOrigin::Caller);
    REQUIRE(errorOf([&] { f.text(sym("x"), caller); }) == ErrorKind::AmbiguousSymbol);

    ParameterMap params{{"x", 1}};
    VariableRegistry registry;
    registry.declareFamily("x", VarType::Continuous);
    ExpressionCompiler compiler(registry, params);
    REQUIRE(errorOf([&] { compiler.compile(sym("x"), {}); }) == ErrorKind::AmbiguousSymbol);

    SECTION("Calls always name the family") {
        REQUIRE(f.text(f.x(sym("x")), at("x", Value(7))) == "x(7)");
    }
}

/**
 * @test Resolution::BareIndexedFamily
 * @brief A bare indexed family stands for the sum of its registered instances
 *
 * @scenario ship has three instances, empty has none
 * @given sym("ship"), 2 * sym("buy") and sym("empty")
 * @when Compiling
 * @then The instance sums, zero for no instances, and no new instances
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("C3: Resolution::BareIndexedFamily", "[compiler][resolution]")
{
    CompilerFixture f;

    REQUIRE(f.text(sym("ship")) == "ship(S1,C1) + ship(S1,C2) + ship(S2,C1)");
    REQUIRE(f.text(2 * sym("buy") + 1) == "2 buy(a) + 2 buy(b) + 1");
    REQUIRE(f.text(sym("empty")) == "0");
    REQUIRE(f.registry.size() == 5);

    f.registry.instantiate("buy", {"c"});
    REQUIRE(f.text(sym("buy")) == "buy(a) + buy(b) + buy(c)");

    REQUIRE(errorOf([&] { f.compiler.evaluate(sym("ship"), f.none); }) == ErrorKind::TypeMismatch);
}

// ============================================================================
// SECTION D: AGGREGATION AND WILDCARDS
// ============================================================================

/**
 * @test Aggregation::ExplicitGenerators
 * @brief sum over clauses adds the body per point; nested sums compose
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("D1: Aggregation::ExplicitGenerators", "[compiler][aggregation]")
{
    CompilerFixture f;
    Expr i = sym("i");

    REQUIRE(f.text(sum({gen("i", range(1, 3))}, f.x(i))) == "x(1) + x(2) + x(3)");
    REQUIRE(f.text(sum({gen("i", range(0, 2))}, sym("sizes")[i])) == "16");
    REQUIRE(f.text(sum({gen("i", range(1, 3)).where(i != 2)}, i * f.x(i))) == "x(1) + 3 x(3)");
    REQUIRE(f.text(sum({gen("i", range(1, 0))}, f.x(i))) == "0");
}

/**
 * @test Wildcards::IndependentPositions
 * @brief A single access with wildcards ranges over registered instances only
 *
 * @scenario Sparse ship: (S1,C1), (S1,C2), (S2,C1)
 * @given sum(ship(s, _)) and sum(ship(_, _))
 * @when Compiling
 * @then Only registered tuples appear and nothing new is instantiated
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("D2: Wildcards::IndependentPositions", "[compiler][wildcard]")
{
    CompilerFixture f;
    const Expr& _ = f._;

    REQUIRE(f.text(sum(f.ship(f.s, _)), at("s", Value("S1"))) == "ship(S1,C1) + ship(S1,C2)");
    REQUIRE(f.text(sum(f.ship(f.s, _)), at("s", Value("S2"))) == "ship(S2,C1)");
    REQUIRE(f.text(sum(f.ship(_, _))) == "ship(S1,C1) + ship(S1,C2) + ship(S2,C1)");
    REQUIRE(f.text(sum(f.ship(_, "C2"))) == "ship(S1,C2)");
    REQUIRE(f.registry.size() == 5);

    SECTION("Equivalent to explicit generators over the recorded domain") {
        auto env = at("s", Value("S1"));
        auto viaWildcard = f.compiler.compile(sum(f.ship(f.s, _)), env);
        auto viaGenerator = f.compiler.compile(
            sum({gen("c", list({"C1", "C2"}))}, f.ship(f.s, sym("c"))), env);
        REQUIRE(viaWildcard == viaGenerator);
    }

    SECTION("Nested inside an explicit sum") {
        REQUIRE(f.text(sum({gen("s", sym("supply"))}, sum(f.ship(f.s, _))))
                == "ship(S1,C1) + ship(S1,C2) + ship(S2,C1)");
    }
}

/**
 * @test Wildcards::SharedValue
 * @brief Several wildcard sites share one value over the intersected domain
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("D3: Wildcards::SharedValue", "[compiler][wildcard]")
{
    CompilerFixture f;
    const Expr& _ = f._;

    REQUIRE(f.text(sum(sym("cost")[_] * f.buy(_))) == "2 buy(a) + 3 buy(b)");
    REQUIRE(f.text(sum(sym("cost")[_])) == "9");
    REQUIRE(f.text(sum(sym("sizes")[_])) == "16");

    REQUIRE(errorOf([&] { f.text(sum(sym("far")[_] * f.buy(_))); })
            == ErrorKind::UnresolvedWildcardDomain);

    SECTION("An empty source empties the intersection") {
        ParameterMap params = f.params;
        params.insert_or_assign("nothing", Value(Map{}));
        ExpressionCompiler compiler(f.registry, params);

        REQUIRE(errorOf([&] { compiler.compile(sum(sym("nothing")[_] * f.buy(_)), f.none); })
                == ErrorKind::UnresolvedWildcardDomain);
        REQUIRE(compiler.compile(sum(sym("nothing")[_]), f.none).isZero());
    }
}

/**
 * @test Wildcards::Errors
 * @brief Wildcards outside aggregations and unknown domains are rejected
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("D4: Wildcards::Errors", "[compiler][wildcard]")
{
    CompilerFixture f;
    const Expr& _ = f._;

    REQUIRE(errorOf([&] { f.text(f.x(_)); }) == ErrorKind::WildcardOutsideAggregation);
    REQUIRE(errorOf([&] { f.text(sym("cost")[_]); }) == ErrorKind::WildcardOutsideAggregation);
    REQUIRE(errorOf([&] { f.text(_); }) == ErrorKind::WildcardOutsideAggregation);
    REQUIRE(errorOf([&] { f.text(sum(call("empty", {_}))); }) == ErrorKind::UnresolvedWildcardDomain);
    REQUIRE(errorOf([&] { f.text(sum(call("nope", {_}))); }) == ErrorKind::UndefinedVariable);

    SECTION("Wildcards inside index expressions") {
        try {
            f.text(sum(f.x(_ + 1)));
            FAIL("expected DslError");
        } catch (const DslError& e) {
            REQUIRE(e.kind() == ErrorKind::WildcardOutsideAggregation);
            REQUIRE(e.message().find("part of an index expression") != std::string::npos);
            REQUIRE(e.expression() == toString(f.x(_ + 1)));
        }
        REQUIRE(errorOf([&] { f.text(sum(sym("sizes")[_ * 2])); })
                == ErrorKind::WildcardOutsideAggregation);
        REQUIRE(errorOf([&] { f.text(sum(f.x(-_))); }) == ErrorKind::WildcardOutsideAggregation);
    }
}

// ============================================================================
// SECTION E: ERROR CONTEXT AND DETERMINISM
// ============================================================================

/**
 * @test ErrorContext::ExpressionAndBindings
 * @brief Errors carry the failing sub-expression and the active bindings
 *
 * @scenario sizes has three elements, the generator runs to 3
 * @given sum(for i <- 1..3: sizes[i])
 * @when The access at i = 3 fails
 * @then The error names "sizes[i]" and the binding i = 3
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("E1: ErrorContext::ExpressionAndBindings", "[compiler][errors]")
{
    CompilerFixture f;
    Expr i = sym("i");

    try {
        f.text(sum({gen("i", range(1, 3))}, sym("sizes")[i]));
        FAIL("expected DslError");
    } catch (const DslError& e) {
        REQUIRE(e.kind() == ErrorKind::IndexOutOfBounds);
        REQUIRE(e.expression() == "sizes[i]");
        REQUIRE(e.context().bindings.size() == 1);
        REQUIRE(e.context().bindings[0].first == "i");
        REQUIRE(e.context().bindings[0].second == "3");
        REQUIRE(std::string(e.what()).find("with i = 3") != std::string::npos);
    }
}

/**
 * @test Determinism::RepeatedCompilation
 * @brief Compiling the same expression twice yields the same polynomial
 *
 * @covers ExpressionCompiler::compile()
 */
TEST_CASE("E2: Determinism::RepeatedCompilation", "[compiler][determinism]")
{
    CompilerFixture f;
    Expr e = sum({gen("s", sym("supply"))}, sym("supply")[f.s] * sum(f.ship(f.s, f._)));

    auto first = f.compiler.compile(e, f.none);
    auto second = f.compiler.compile(e, f.none);
    REQUIRE(first == second);
    REQUIRE(first.toString() == "20 ship(S1,C1) + 20 ship(S1,C2) + 25 ship(S2,C1)");
}
