#include <gtest/gtest.h>

#include <memory>

#include "lexer.hpp"
#include "parser.hpp"
#include "resolver.hpp"

// Helper: parse (must succeed) and resolve into a fresh table
struct Resolved {
    std::unique_ptr<Program> program;
    ScopeTable table;
    std::vector<Diagnostic> errors;
};

std::unique_ptr<Resolved> resolveSource(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    NodeIdAllocator ids;
    Parser parser(tokens, ids);

    auto out = std::make_unique<Resolved>();
    out->program = parser.parse();
    EXPECT_FALSE(lexer.had_error());
    EXPECT_FALSE(parser.had_error());

    Resolver resolver(out->table);
    resolver.resolve(*out->program);
    out->errors = resolver.errors();
    return out;
}

std::vector<std::string> messagesOf(const std::string& source) {
    auto r = resolveSource(source);
    std::vector<std::string> msgs;
    for (const auto& d : r->errors) {
        EXPECT_EQ(d.type, "ResolutionError");
        msgs.push_back(d.message);
    }
    return msgs;
}

// Finds the expression of the first print statement inside nested blocks
const Expr* firstPrintExpr(const std::vector<StmtPtr>& stmts) {
    for (const auto& s : stmts) {
        if (auto p = std::get_if<PrintStmt>(&s->node)) return p->expression.get();
        if (auto b = std::get_if<BlockStmt>(&s->node)) {
            if (auto e = firstPrintExpr(b->statements)) return e;
        }
        if (auto f = std::get_if<FunctionStmt>(&s->node)) {
            if (auto e = firstPrintExpr(f->decl->body)) return e;
        }
    }
    return nullptr;
}

// ---- depths ----
TEST(ResolverTest, GlobalsAreLeftUnresolved) {
    auto r = resolveSource("var a = 1; print a;");
    EXPECT_TRUE(r->errors.empty());
    EXPECT_TRUE(r->table.empty());
}

TEST(ResolverTest, LocalInSameBlockHasDepthZero) {
    auto r = resolveSource("{ var a = 1; print a; }");
    const Expr* use = firstPrintExpr(r->program->body);
    ASSERT_NE(use, nullptr);
    ASSERT_EQ(r->table.count(use->id), 1u);
    EXPECT_EQ(r->table.at(use->id), 0);
}

TEST(ResolverTest, CountsEnclosingBlocks) {
    auto r = resolveSource("{ var a = 1; { { print a; } } }");
    const Expr* use = firstPrintExpr(r->program->body);
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(r->table.at(use->id), 2);
}

TEST(ResolverTest, ParametersLiveInTheFunctionScope) {
    auto r = resolveSource("fun f(x) { print x; }");
    const Expr* use = firstPrintExpr(r->program->body);
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(r->table.at(use->id), 0);
}

TEST(ResolverTest, ClosureCapturesOuterFunctionLocal) {
    auto r = resolveSource("fun outer() { var n = 0; fun inner() { print n; } }");
    EXPECT_TRUE(r->errors.empty());
    ASSERT_EQ(r->table.size(), 1u);
    EXPECT_EQ(r->table.begin()->second, 1);
}

TEST(ResolverTest, ShadowingPicksInnermostDeclaration) {
    auto r = resolveSource("{ var a = 1; { var a = 2; print a; } }");
    const Expr* use = firstPrintExpr(r->program->body);
    ASSERT_NE(use, nullptr);
    EXPECT_EQ(r->table.at(use->id), 0);
}

TEST(ResolverTest, ThisAndSuperDepthsInsideMethods) {
    auto r = resolveSource(
        "class A { m() {} }\n"
        "class B < A { m() { this; super.m; } }");
    EXPECT_TRUE(r->errors.empty());

    const auto& cls = std::get<ClassStmt>(r->program->body[1]->node);
    const auto& body = cls.methods[0]->body;
    const Expr* this_expr = std::get<ExpressionStmt>(body[0]->node).expression.get();
    const Expr* super_expr = std::get<ExpressionStmt>(body[1]->node).expression.get();

    // method scope -> 'this' scope -> 'super' scope
    EXPECT_EQ(r->table.at(this_expr->id), 1);
    EXPECT_EQ(r->table.at(super_expr->id), 2);
}

// ---- static errors ----
TEST(ResolverTest, RejectsReadInOwnInitializer) {
    auto msgs = messagesOf("{ var a = a; }");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "Can't read local variable in its own initializer.");
}

TEST(ResolverTest, GlobalMayReferToItselfInInitializer) {
    EXPECT_TRUE(messagesOf("var a = 1; var a = a;").empty());
}

TEST(ResolverTest, RejectsRedeclarationInLocalScope) {
    auto msgs = messagesOf("fun f() { var a; var a; }");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "Already a variable with this name in this scope.");
}

TEST(ResolverTest, RejectsDuplicateParameters) {
    auto msgs = messagesOf("fun f(a, a) {}");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "Already a variable with this name in this scope.");
}

TEST(ResolverTest, RejectsTopLevelReturn) {
    auto msgs = messagesOf("return 1;");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "Can't return from top-level code.");
}

TEST(ResolverTest, RejectsValueReturnFromInitializer) {
    auto msgs = messagesOf("class A { init() { return 1; } }");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "Can't return a value from an initializer.");
}

TEST(ResolverTest, AllowsBareReturnFromInitializer) {
    EXPECT_TRUE(messagesOf("class A { init() { return; } }").empty());
}

TEST(ResolverTest, RejectsBreakAndContinueOutsideLoops) {
    auto msgs = messagesOf("break; continue;");
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], "Can't use 'break' outside of a loop.");
    EXPECT_EQ(msgs[1], "Can't use 'continue' outside of a loop.");
}

TEST(ResolverTest, FunctionBodyDoesNotInheritEnclosingLoop) {
    auto msgs = messagesOf("while (true) { fun f() { break; } break; }");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "Can't use 'break' outside of a loop.");
}

TEST(ResolverTest, RejectsThisOutsideClass) {
    auto msgs = messagesOf("print this; fun f() { return this; }");
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], "Can't use 'this' outside of a class.");
}

TEST(ResolverTest, RejectsMisplacedSuper) {
    auto msgs = messagesOf("super.m(); class A { m() { super.m(); } }");
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], "Can't use 'super' outside of a class.");
    EXPECT_EQ(msgs[1], "Can't use 'super' in a class with no superclass.");
}

TEST(ResolverTest, RejectsSelfInheritance) {
    auto msgs = messagesOf("class A < A {}");
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "A class can't inherit from itself.");
}

TEST(ResolverTest, AccumulatesErrorsInSourceOrder) {
    auto r = resolveSource("return;\n{ var x = x; }\nbreak;");
    ASSERT_EQ(r->errors.size(), 3u);
    EXPECT_EQ(r->errors[0].loc.line, 1);
    EXPECT_EQ(r->errors[1].loc.line, 2);
    EXPECT_EQ(r->errors[2].loc.line, 3);
}
