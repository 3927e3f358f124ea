// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include "ClassRuntime.hpp"
#include "globals.hpp"

Evaluator::~Evaluator() = default;

Evaluator::Evaluator(std::ostream& out) : out(out), global_env(std::make_shared<Environment>(nullptr)) {
    init_globals(global_env, this);
}

// ----------------- Program evaluation -----------------
void Evaluator::interpret(const Program& program) {
    for (const auto& stmt : program.body) {
        ExecResult r = execute(*stmt, global_env);
        // the resolver rejects break/continue/return that could get here
        if (r.kind != ExecResult::Kind::NORMAL) {
            throw QuillError("InternalError", "Control flow statement escaped to top level.", stmt->token.loc);
        }
    }
}

Value Evaluator::evaluate_expression(const Expr& expr) {
    return evaluate(expr, global_env);
}
