#include <gtest/gtest.h>

#include <sstream>

#include "runner.hpp"

// Runs a script in a fresh session and returns what it printed
static std::string runScript(const std::string& source, RunResult* result = nullptr) {
    std::ostringstream out;
    Runner runner(out);
    RunResult r = runner.run_source(source, "script.ql");
    if (result) *result = r;
    return out.str();
}

class ReplSessionTest : public ::testing::Test {
   protected:
    std::ostringstream out;
    Runner runner{out};

    std::string feed(const std::string& input) {
        out.str("");
        last = runner.run_repl_unit(input);
        return out.str();
    }

    RunResult last;
};

// ---- classification ----
TEST(RunnerTest, SuccessfulRun) {
    RunResult r;
    EXPECT_EQ(runScript("print \"hello\";", &r), "hello\n");
    EXPECT_EQ(r.status, RunStatus::OK);
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_EQ(r.exit_code(), 0);
}

TEST(RunnerTest, LexicalErrorsAreSyntaxErrors) {
    RunResult r;
    EXPECT_EQ(runScript("print 1; @", &r), "");
    EXPECT_EQ(r.status, RunStatus::SYNTAX_ERROR);
    EXPECT_EQ(r.exit_code(), 65);
}

TEST(RunnerTest, SyntaxErrorsPreventExecution) {
    RunResult r;
    // the first statement is fine but nothing may run
    EXPECT_EQ(runScript("print 1;\nprint ;\nvar = 2;", &r), "");
    EXPECT_EQ(r.status, RunStatus::SYNTAX_ERROR);
    ASSERT_EQ(r.diagnostics.size(), 2u);
    EXPECT_EQ(r.diagnostics[0].loc.line, 2);
    EXPECT_EQ(r.diagnostics[1].loc.line, 3);
    EXPECT_EQ(r.diagnostics[0].loc.filename, "script.ql");
}

TEST(RunnerTest, LexerErrorsComeBeforeParserErrors) {
    RunResult r;
    runScript("print ;\nvar x = $;", &r);
    ASSERT_GE(r.diagnostics.size(), 2u);
    EXPECT_EQ(r.diagnostics[0].message, "Unexpected character '$'.");
}

TEST(RunnerTest, StaticErrorsPreventExecution) {
    RunResult r;
    EXPECT_EQ(runScript("print \"before\";\n{ var a = a; }", &r), "");
    EXPECT_EQ(r.status, RunStatus::STATIC_ERROR);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].type, "ResolutionError");
    EXPECT_EQ(r.exit_code(), 65);
}

TEST(RunnerTest, RuntimeErrorStopsAtFirstFailure) {
    RunResult r;
    EXPECT_EQ(runScript("print 1;\nprint nil + 1;\nprint 2;", &r), "1\n");
    EXPECT_EQ(r.status, RunStatus::RUNTIME_ERROR);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].type, "TypeError");
    EXPECT_EQ(r.diagnostics[0].loc.line, 2);
    EXPECT_EQ(r.exit_code(), 70);
}

TEST(RunnerTest, DiagnosticQuotesSourceLine) {
    RunResult r;
    runScript("var a = 1;\nprint a + \"x\";", &r);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    std::string text = r.diagnostics[0].to_string();
    EXPECT_NE(text.find("TypeError at script.ql:2:"), std::string::npos);
    EXPECT_NE(text.find("Operands must be two numbers or two strings."), std::string::npos);
    EXPECT_NE(text.find(" * 2 | print a + \"x\";"), std::string::npos);
}

TEST(RunnerTest, SameProgramTwiceGivesSameOutput) {
    const std::string program =
        "class Counter { init() { this.n = 0; } tick() { this.n = this.n + 1; return this.n; } }\n"
        "var c = Counter();\n"
        "for (var i = 0; i < 3; i = i + 1) print c.tick();\n"
        "fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); }\n"
        "print fib(10);";
    std::string first = runScript(program);
    std::string second = runScript(program);
    EXPECT_EQ(first, "1\n2\n3\n55\n");
    EXPECT_EQ(first, second);
}

TEST(RunnerTest, ExitStopsTheScriptWithItsCode) {
    RunResult r;
    EXPECT_EQ(runScript("print 1;\nexit(3);\nprint 2;", &r), "1\n");
    EXPECT_EQ(r.status, RunStatus::EXIT);
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_EQ(r.exit_code(), 3);
}

TEST(RunnerTest, ExitFromInsideCallsAndLoops) {
    RunResult r;
    runScript("fun stop() { while (true) { quit(); } }\nstop();\nprint \"unreachable\";", &r);
    EXPECT_EQ(r.status, RunStatus::EXIT);
    EXPECT_EQ(r.exit_code(), 0);
}

TEST(RunnerTest, BadExitCodeIsARuntimeError) {
    RunResult r;
    runScript("exit(nil);", &r);
    EXPECT_EQ(r.status, RunStatus::RUNTIME_ERROR);
    EXPECT_EQ(r.exit_code(), 70);
}

TEST(RunnerTest, ScriptsDoNotEchoExpressions) {
    EXPECT_EQ(runScript("1 + 2;"), "");
}

// ---- REPL session ----
TEST_F(ReplSessionTest, EchoesSingleExpression) {
    EXPECT_EQ(feed("1 + 2;"), "3\n");
    EXPECT_TRUE(last.ok());
}

TEST_F(ReplSessionTest, DoesNotEchoNil) {
    EXPECT_EQ(feed("nil;"), "");
    EXPECT_EQ(feed("var x;"), "");
}

TEST_F(ReplSessionTest, DefinitionsPersistAcrossInputs) {
    feed("var count = 10;");
    feed("fun bump() { count = count + 1; return count; }");
    EXPECT_EQ(feed("bump();"), "11\n");
    EXPECT_EQ(feed("count;"), "11\n");
}

TEST_F(ReplSessionTest, ClosuresOutliveTheirInput) {
    feed("fun make() { var n = 0; fun inc() { n = n + 1; return n; } return inc; }");
    feed("var c = make();");
    feed("c();");
    EXPECT_EQ(feed("c();"), "2\n");
}

TEST_F(ReplSessionTest, ClassesPersistAcrossInputs) {
    feed("class A { hi() { return \"hi\"; } }");
    feed("class B < A { hi() { return super.hi() + \"!\"; } }");
    EXPECT_EQ(feed("B().hi();"), "hi!\n");
}

TEST_F(ReplSessionTest, MultiStatementInputRunsWithoutEcho) {
    EXPECT_EQ(feed("var a = 1; a + 1;"), "");
    EXPECT_EQ(feed("print a;"), "1\n");
}

TEST_F(ReplSessionTest, ErrorsDoNotEndTheSession) {
    feed("var kept = \"yes\";");

    feed("print ;");
    EXPECT_EQ(last.status, RunStatus::SYNTAX_ERROR);

    feed("return 1;");
    EXPECT_EQ(last.status, RunStatus::STATIC_ERROR);

    feed("undefined_thing;");
    EXPECT_EQ(last.status, RunStatus::RUNTIME_ERROR);

    EXPECT_EQ(feed("kept;"), "yes\n");
}

TEST_F(ReplSessionTest, DefinitionsBeforeRuntimeErrorPersist) {
    feed("var early = 1; nil.boom; var late = 2;");
    EXPECT_EQ(last.status, RunStatus::RUNTIME_ERROR);
    EXPECT_EQ(feed("early;"), "1\n");

    feed("late;");
    EXPECT_EQ(last.status, RunStatus::RUNTIME_ERROR);
    EXPECT_EQ(last.diagnostics[0].message, "Undefined variable 'late'.");
}

TEST_F(ReplSessionTest, ExitEndsTheSessionWithItsCode) {
    EXPECT_EQ(feed("exit(4);"), "");
    EXPECT_EQ(last.status, RunStatus::EXIT);
    EXPECT_EQ(last.exit_code(), 4);
}

TEST_F(ReplSessionTest, DiagnosticsNameTheReplSource) {
    feed("1 +;");
    ASSERT_FALSE(last.diagnostics.empty());
    EXPECT_EQ(last.diagnostics[0].loc.filename, "<repl>");
}
