/*
===============================================================================
TEST EXPRESSION — Tests for expression.h
===============================================================================

OVERVIEW
--------
Validates the expression front end: builders and operator overloads produce
the right node kinds, clauses carry filters, traversal reaches every child
and rendering is readable and correctly parenthesized.

TEST ORGANIZATION
-----------------
• Section A: Builders and node kinds
• Section B: Clauses and generators
• Section C: Traversal and references
• Section D: Rendering

TEST STRATEGY
-------------
• Builders are checked structurally through kind() and as<T>()
• Rendering is checked by exact strings since error messages embed it

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• expression.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <mipdsl/expression.h>

#include <set>
#include <string>
#include <variant>

using namespace mipdsl;

// ============================================================================
// SECTION A: BUILDERS
// ============================================================================

/**
 * @test Builders::Literals
 * @brief Numbers and strings convert implicitly to literal nodes
 *
 * @covers Expr::Expr()
 * @covers lit()
 * @covers str()
 */
TEST_CASE("A1: Builders::Literals", "[expression][builders]")
{
    Expr i = 3;
    Expr r = 2.5;
    Expr s = "S1";

    REQUIRE(i.kind() == ExprKind::Literal);
    REQUIRE(i.as<LiteralNode>().value == Value(3));
    REQUIRE(r.as<LiteralNode>().value == Value(2.5));
    REQUIRE(s.as<LiteralNode>().value == Value("S1"));
    REQUIRE(str("e5").as<LiteralNode>().value.is_string());

    Expr table = lit(Value::map({{"a", 1}}));
    REQUIRE(table.as<LiteralNode>().value.is_map());

    REQUIRE_THROWS_AS(i.as<SymbolNode>(), std::bad_variant_access);
}

/**
 * @test Builders::SymbolsCallsAndAccess
 * @brief sym, wildcard, Family calls, [] and field build the matching nodes
 *
 * @covers sym()
 * @covers wildcard()
 * @covers Family::operator()
 * @covers Expr::operator[]
 * @covers Expr::field()
 */
TEST_CASE("A2: Builders::SymbolsCallsAndAccess", "[expression][builders]")
{
    Family ship("ship");
    const Expr s = sym("s"), _ = wildcard();

    Expr c = ship(s, _);
    REQUIRE(c.kind() == ExprKind::Call);
    REQUIRE(c.as<CallNode>().family == "ship");
    REQUIRE(c.as<CallNode>().args.size() == 2);
    REQUIRE(c.as<CallNode>().args[1].kind() == ExprKind::Wildcard);
    REQUIRE_FALSE(c.as<CallNode>().skipMissing);

    Family z("z");
    REQUIRE(z().as<CallNode>().args.empty());

    Expr a = sym("supply")[s];
    REQUIRE(a.kind() == ExprKind::Access);
    REQUIRE(a.as<AccessNode>().key.as<SymbolNode>().name == "s");

    Expr f = sym("food").field("calories");
    REQUIRE(f.kind() == ExprKind::Field);
    REQUIRE(f.as<FieldNode>().name == "calories");
}

/**
 * @test Builders::Operators
 * @brief Arithmetic, comparison and logical operators build trees, not values
 *
 * @scenario x + 1 <= 5 must stay symbolic
 * @given Operator overloads on Expr
 * @when Combining expressions
 * @then Nodes carry the operator and operands
 *
 * @covers operator+
 * @covers operator<=
 * @covers operator&&
 */
TEST_CASE("A3: Builders::Operators", "[expression][builders]")
{
    Expr x = sym("x");

    Expr e = x + 1 <= 5;
    REQUIRE(e.kind() == ExprKind::Compare);
    REQUIRE(e.as<CompareNode>().op == CompareOp::LessEqual);
    REQUIRE(e.as<CompareNode>().lhs.as<BinaryNode>().op == BinaryOp::Add);

    REQUIRE((x == 2).as<CompareNode>().op == CompareOp::Equal);
    REQUIRE((x != 2).as<CompareNode>().op == CompareOp::NotEqual);
    REQUIRE((x / 2).as<BinaryNode>().op == BinaryOp::Div);
    REQUIRE((-x).kind() == ExprKind::Negate);
    REQUIRE((!x).as<LogicalNode>().op == LogicalOp::Not);
    REQUIRE((x > 1 && x < 4).as<LogicalNode>().operands.size() == 2);
}

/**
 * @test Builders::Aggregates
 * @brief sum, forall, range and list build aggregation nodes
 *
 * @covers sum()
 * @covers forall()
 * @covers range()
 * @covers list()
 */
TEST_CASE("A4: Builders::Aggregates", "[expression][builders]")
{
    Family x("x");
    Expr i = sym("i");

    Expr plain = sum(x(wildcard()));
    REQUIRE(plain.kind() == ExprKind::Sum);
    REQUIRE(plain.as<SumNode>().body.kind() == ExprKind::Call);

    Expr generated = sum({gen("i", range(1, 3))}, x(i));
    REQUIRE(generated.kind() == ExprKind::Sum);
    const auto& body = generated.as<SumNode>().body;
    REQUIRE(body.kind() == ExprKind::For);
    REQUIRE(body.as<ForNode>().clauses.size() == 1);
    REQUIRE(body.as<ForNode>().clauses[0].domain.kind() == ExprKind::Range);

    Expr l = list({1, 2, i});
    REQUIRE(l.as<ListOfNode>().items.size() == 3);
}

// ============================================================================
// SECTION B: CLAUSES
// ============================================================================

/**
 * @test Clauses::Filters
 * @brief where() adds a filter and combines repeated filters with &&
 *
 * @covers gen()
 * @covers Clause::where()
 */
TEST_CASE("B1: Clauses::Filters", "[expression][clauses]")
{
    Expr i = sym("i");
    Clause c = gen("i", range(1, sym("n")));
    REQUIRE(c.symbol == "i");
    REQUIRE_FALSE(c.filter.has_value());

    Clause odd = c.where(i != 3);
    REQUIRE(odd.filter.has_value());
    REQUIRE_FALSE(c.filter.has_value());

    Clause both = odd.where(i > 1);
    REQUIRE(both.filter->kind() == ExprKind::Logical);
    REQUIRE(both.filter->as<LogicalNode>().op == LogicalOp::And);
}

// ============================================================================
// SECTION C: TRAVERSAL
// ============================================================================

/**
 * @test Traversal::Children
 * @brief forEachChild visits clause domains, filters and the body
 *
 * @covers forEachChild()
 */
TEST_CASE("C1: Traversal::Children", "[expression][traversal]")
{
    Expr i = sym("i");
    Expr f = forall({gen("i", sym("I")).where(i > 0)}, i * 2);

    int count = 0;
    forEachChild(f, [&](const Expr&) { ++count; });
    REQUIRE(count == 3);

    count = 0;
    forEachChild(sym("leaf"), [&](const Expr&) { ++count; });
    REQUIRE(count == 0);
}

/**
 * @test Traversal::References
 * @brief references() finds free symbols anywhere in the tree
 *
 * @covers references()
 */
TEST_CASE("C2: Traversal::References", "[expression][traversal]")
{
    Expr s = sym("s");
    Expr bound = sym("capacity")[s] * 2;

    REQUIRE(references(bound, {"s"}));
    REQUIRE_FALSE(references(bound, {"c"}));
    REQUIRE_FALSE(references(bound, {}));
    REQUIRE(references(sum({gen("c", sym("C"))}, sym("c")), {"c"}));
}

/**
 * @test Traversal::SharedNodes
 * @brief Copies share their node; separately built equal trees do not
 *
 * @covers Expr::same()
 */
TEST_CASE("C3: Traversal::SharedNodes", "[expression][traversal]")
{
    Expr a = sym("x");
    Expr b = a;
    REQUIRE(a.same(b));
    REQUIRE_FALSE(a.same(sym("x")));
}

// ============================================================================
// SECTION D: RENDERING
// ============================================================================

/**
 * @test Rendering::Readable
 * @brief toString renders the builder syntax back
 *
 * @covers toString()
 */
TEST_CASE("D1: Rendering::Readable", "[expression][rendering]")
{
    Family ship("ship");
    const Expr s = sym("s"), _ = wildcard();

    REQUIRE(toString(sum(ship(s, _)) <= sym("supply")[s]) == "sum(ship(s, _)) <= supply[s]");
    REQUIRE(toString(str("S1")) == "\"S1\"");
    REQUIRE(toString(Expr(1.0)) == "1.0");
    REQUIRE(toString(sym("food").field("cal")) == "food.cal");
    REQUIRE(toString(list({1, 2, s})) == "[1, 2, s]");
    REQUIRE(toString(range(1, sym("n"))) == "1..n");
    REQUIRE(toString(forall({gen("s", sym("S"))}, ship(s, 1))) == "for s <- S: ship(s, 1)");
    REQUIRE(toString(gen("i", range(1, sym("n"))).where(sym("i") != 3).filter.value()) == "i != 3");
}

/**
 * @test Rendering::Parentheses
 * @brief Parentheses appear only where precedence requires them
 *
 * @covers toString()
 */
TEST_CASE("D2: Rendering::Parentheses", "[expression][rendering]")
{
    Expr a = sym("a"), b = sym("b"), c = sym("c");

    REQUIRE(toString(a + b * 2) == "a + b * 2");
    REQUIRE(toString((a + b) * 2) == "(a + b) * 2");
    REQUIRE(toString(a - (b - c)) == "a - (b - c)");
    REQUIRE(toString(a - b - c) == "a - b - c");
    REQUIRE(toString(-(a + 1)) == "-(a + 1)");
    REQUIRE(toString(!(a > 1)) == "!(a > 1)");
    REQUIRE(toString(a || (b && c)) == "a || b && c");
    REQUIRE(toString((a || b) && c) == "(a || b) && c");
}
