#include <gtest/gtest.h>

#include <memory>

#include "ast.hpp"
#include "lexer.hpp"
#include "parser.hpp"

// Helper: parse source and keep the parser around for its diagnostics
struct ParseOutcome {
    std::unique_ptr<Program> program;
    std::vector<Diagnostic> errors;
};

ParseOutcome parseSource(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    NodeIdAllocator ids;
    Parser parser(tokens, ids);
    ParseOutcome out;
    out.program = parser.parse();
    out.errors = parser.errors();
    return out;
}

std::string render(const std::string& source) {
    ParseOutcome out = parseSource(source);
    EXPECT_TRUE(out.errors.empty()) << (out.errors.empty() ? "" : out.errors[0].to_string());
    return out.program->to_string();
}

// ---- expressions ----
TEST(ParserTest, MultiplicationBindsTighterThanAddition) {
    EXPECT_EQ(render("1 + 2 * 3;"), "(; (+ 1 (* 2 3)))");
}

TEST(ParserTest, BinaryOperatorsAreLeftAssociative) {
    EXPECT_EQ(render("1 - 2 - 3;"), "(; (- (- 1 2) 3))");
    EXPECT_EQ(render("8 / 4 / 2;"), "(; (/ (/ 8 4) 2))");
}

TEST(ParserTest, AssignmentIsRightAssociative) {
    EXPECT_EQ(render("a = b = 3;"), "(; (= a (= b 3)))");
}

TEST(ParserTest, PrecedenceLadder) {
    EXPECT_EQ(render("a or b and c == d < e + f * -g;"),
        "(; (or a (and b (== c (< d (+ e (* f (- g))))))))");
}

TEST(ParserTest, ComparisonBelowEquality) {
    EXPECT_EQ(render("1 < 2 == true;"), "(; (== (< 1 2) true))");
}

TEST(ParserTest, UnaryOperatorsNest) {
    EXPECT_EQ(render("!!true;"), "(; (! (! true)))");
    EXPECT_EQ(render("- -1;"), "(; (- (- 1)))");
}

TEST(ParserTest, GroupingOverridesPrecedence) {
    EXPECT_EQ(render("(1 + 2) * 3;"), "(; (* (group (+ 1 2)) 3))");
}

TEST(ParserTest, Literals) {
    EXPECT_EQ(render("nil; true; false; 2.5; \"hi\";"),
        "(; nil)\n(; true)\n(; false)\n(; 2.5)\n(; \"hi\")");
}

TEST(ParserTest, CallAndPropertyChains) {
    EXPECT_EQ(render("a.b(1, 2).c();"), "(; (call (. (call (. a b) 1 2) c)))");
    EXPECT_EQ(render("f()();"), "(; (call (call f)))");
}

TEST(ParserTest, PropertyAssignmentBecomesSet) {
    EXPECT_EQ(render("a.b.c = 1;"), "(; (.= (. a b) c 1))");
}

TEST(ParserTest, ThisAndSuper) {
    EXPECT_EQ(render("this.x; super.m(1);"), "(; (. this x))\n(; (call (super m) 1))");
}

TEST(ParserTest, ExpressionNodesGetDistinctIds) {
    ParseOutcome out = parseSource("a + b;");
    const auto& stmt = std::get<ExpressionStmt>(out.program->body[0]->node);
    const auto& bin = std::get<BinaryExpr>(stmt.expression->node);
    EXPECT_NE(stmt.expression->id, bin.left->id);
    EXPECT_NE(bin.left->id, bin.right->id);
}

// ---- statements ----
TEST(ParserTest, VarDeclarations) {
    EXPECT_EQ(render("var a; var b = 1;"), "(var a)\n(var b 1)");
}

TEST(ParserTest, BlocksAndIf) {
    EXPECT_EQ(render("if (a) { print 1; } else print 2;"),
        "(if a (block (print 1)) (print 2))");
}

TEST(ParserTest, DanglingElseBindsToNearestIf) {
    EXPECT_EQ(render("if (a) if (b) print 1; else print 2;"),
        "(if a (if b (print 1) (print 2)))");
}

TEST(ParserTest, WhileLoop) {
    EXPECT_EQ(render("while (x < 3) x = x + 1;"), "(while (< x 3) (; (= x (+ x 1))))");
}

TEST(ParserTest, ForLoopDesugarsToBlockAndWhile) {
    EXPECT_EQ(render("for (var i = 0; i < 3; i = i + 1) print i;"),
        "(block (var i 0) (while (< i 3) (print i) (= i (+ i 1))))");
}

TEST(ParserTest, ForLoopWithEmptyClauses) {
    EXPECT_EQ(render("for (;;) break;"), "(block (while true (break)))");
}

TEST(ParserTest, ForLoopWithExpressionInitializer) {
    EXPECT_EQ(render("for (i = 0; i < 1;) continue;"),
        "(block (; (= i 0)) (while (< i 1) (continue)))");
}

TEST(ParserTest, FunctionDeclaration) {
    EXPECT_EQ(render("fun add(a, b) { return a + b; }"),
        "(fun add (a b) (return (+ a b)))");
    EXPECT_EQ(render("fun f() { return; }"), "(fun f () (return))");
}

TEST(ParserTest, ClassDeclaration) {
    EXPECT_EQ(render("class B < A { init(x) { this.x = x; } get() { return this.x; } }"),
        "(class B < A (fun init (x) (; (.= this x x))) (fun get () (return (. this x))))");
}

// ---- errors ----
TEST(ParserTest, ReportsMissingSemicolon) {
    ParseOutcome out = parseSource("print 1");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].type, "SyntaxError");
    EXPECT_EQ(out.errors[0].message, "Expected ';' after value. (at end)");
}

TEST(ParserTest, ReportsOffendingLexeme) {
    ParseOutcome out = parseSource("var 1 = 2;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message, "Expected variable name. (at '1')");
    EXPECT_EQ(out.errors[0].loc.col, 5);
}

TEST(ParserTest, InvalidAssignmentTargetDoesNotStopParsing) {
    ParseOutcome out = parseSource("1 + 2 = 3; print 4;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message, "Invalid assignment target. (at '=')");
    // no synchronisation happened, both statements survive
    EXPECT_EQ(out.program->body.size(), 2u);
}

TEST(ParserTest, RecoversAndReportsMultipleErrors) {
    ParseOutcome out = parseSource("var = 1;\nprint 2;\nprint (3;\nvar ok = 4;");
    ASSERT_EQ(out.errors.size(), 2u);
    EXPECT_EQ(out.errors[0].loc.line, 1);
    EXPECT_EQ(out.errors[1].loc.line, 3);
    // the two good declarations are kept
    EXPECT_EQ(out.program->to_string(), "(print 2)\n(var ok 4)");
}

TEST(ParserTest, ErrorInsideBlockKeepsRestOfBlock) {
    ParseOutcome out = parseSource("{ print ; print 1; }");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message, "Expected expression. (at ';')");
    EXPECT_EQ(out.program->to_string(), "(block (print 1))");
}

TEST(ParserTest, SuperRequiresMethodName) {
    ParseOutcome out = parseSource("super;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message, "Expected '.' after 'super'. (at ';')");
}

TEST(ParserTest, UnclosedBlockIsReportedAtEnd) {
    ParseOutcome out = parseSource("fun f() { print 1;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message, "Expected '}' after block. (at end)");
}

TEST(ParserTest, TooManyArguments) {
    std::string args;
    for (int i = 0; i < 256; ++i) {
        if (i) args += ", ";
        args += "1";
    }
    ParseOutcome out = parseSource("f(" + args + ");");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message, "Can't have more than 255 arguments. (at '1')");
    EXPECT_EQ(out.program->body.size(), 1u);
}
