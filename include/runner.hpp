#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "QuillError.hpp"
#include "SourceManager.hpp"
#include "ast.hpp"
#include "evaluator.hpp"

enum class RunStatus {
    OK,
    SYNTAX_ERROR,   // lexical or parse errors; nothing was resolved or run
    STATIC_ERROR,   // resolver errors; nothing was run
    RUNTIME_ERROR,  // execution stopped at the first runtime error
    EXIT            // exit() or quit() was called
};

struct RunResult {
    RunStatus status = RunStatus::OK;
    std::vector<Diagnostic> diagnostics;
    int requested_exit = 0;  // set for EXIT

    bool ok() const { return status == RunStatus::OK; }

    // 0 success, 65 syntax / static errors, 70 runtime error, or the code
    // passed to exit()
    int exit_code() const;
};

// One interpreter session: scan -> parse -> resolve -> evaluate. Everything
// a later input may depend on (globals, resolver depths, node ids, source
// text for diagnostics) lives as long as the Runner.
class Runner {
   public:
    explicit Runner(std::ostream& out = std::cout);

    // Runs a whole script.
    RunResult run_source(const std::string& source, const std::string& filename);

    // Runs one REPL input against the same session. An input that is a
    // single expression statement has its value echoed unless it is nil.
    RunResult run_repl_unit(const std::string& source);

   private:
    Evaluator evaluator_;
    NodeIdAllocator ids;
    std::vector<std::unique_ptr<SourceManager>> sources;

    RunResult run(const std::string& source, const std::string& filename, bool echo);
};
