// src/runner.cpp
#include "runner.hpp"

#include "lexer.hpp"
#include "parser.hpp"
#include "resolver.hpp"

int RunResult::exit_code() const {
    switch (status) {
        case RunStatus::OK:
            return 0;
        case RunStatus::SYNTAX_ERROR:
        case RunStatus::STATIC_ERROR:
            return 65;
        case RunStatus::RUNTIME_ERROR:
            return 70;
        case RunStatus::EXIT:
            return requested_exit;
    }
    return 70;
}

Runner::Runner(std::ostream& out) : evaluator_(out) {}

RunResult Runner::run_source(const std::string& source, const std::string& filename) {
    return run(source, filename, false);
}

RunResult Runner::run_repl_unit(const std::string& source) {
    return run(source, "<repl>", true);
}

RunResult Runner::run(const std::string& source, const std::string& filename, bool echo) {
    RunResult result;

    sources.push_back(std::make_unique<SourceManager>(filename, source));
    const SourceManager* mgr = sources.back().get();

    Lexer lexer(source, filename, mgr);
    std::vector<Token> tokens = lexer.tokenize();

    Parser parser(tokens, ids);
    std::unique_ptr<Program> program = parser.parse();

    // scanner errors come first, then parser errors, each in source order
    result.diagnostics = lexer.errors();
    result.diagnostics.insert(result.diagnostics.end(), parser.errors().begin(), parser.errors().end());
    if (!result.diagnostics.empty()) {
        result.status = RunStatus::SYNTAX_ERROR;
        return result;
    }

    Resolver resolver(evaluator_.scope_table());
    resolver.resolve(*program);
    if (resolver.had_error()) {
        result.status = RunStatus::STATIC_ERROR;
        result.diagnostics = resolver.errors();
        return result;
    }

    try {
        const ExpressionStmt* single = nullptr;
        if (echo && program->body.size() == 1) {
            single = std::get_if<ExpressionStmt>(&program->body.front()->node);
        }

        if (single) {
            Value value = evaluator_.evaluate_expression(*single->expression);
            if (!std::holds_alternative<std::monostate>(value)) {
                evaluator_.output() << evaluator_.value_to_string(value) << std::endl;
            }
        } else {
            evaluator_.interpret(*program);
        }
    } catch (const QuillError& e) {
        result.status = RunStatus::RUNTIME_ERROR;
        result.diagnostics.emplace_back(e.type(), e.message(), e.location());
    } catch (const ExitRequest& e) {
        result.status = RunStatus::EXIT;
        result.requested_exit = e.code();
    }

    return result;
}
