// src/evaluator/StatementEval.cpp
#include <type_traits>
#include <utility>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

ExecResult Evaluator::execute(const Stmt& stmt, const EnvPtr& env) {
    return std::visit([&](const auto& node) -> ExecResult {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, ExpressionStmt>) {
            evaluate(*node.expression, env);
            return ExecResult::normal();
        } else if constexpr (std::is_same_v<T, PrintStmt>) {
            Value value = evaluate(*node.expression, env);
            out << value_to_string(value) << std::endl;
            return ExecResult::normal();
        } else if constexpr (std::is_same_v<T, VarStmt>) {
            Value value;
            if (node.initializer) value = evaluate(*node.initializer, env);
            env->define(node.name.value, value);
            return ExecResult::normal();
        } else if constexpr (std::is_same_v<T, BlockStmt>) {
            return execute_block(node.statements, std::make_shared<Environment>(env));
        } else if constexpr (std::is_same_v<T, IfStmt>) {
            if (is_truthy(evaluate(*node.condition, env))) {
                return execute(*node.then_branch, env);
            }
            if (node.else_branch) return execute(*node.else_branch, env);
            return ExecResult::normal();
        } else if constexpr (std::is_same_v<T, WhileStmt>) {
            return execute_while(node, env);
        } else if constexpr (std::is_same_v<T, BreakStmt>) {
            return ExecResult::make(ExecResult::Kind::BREAK);
        } else if constexpr (std::is_same_v<T, ContinueStmt>) {
            return ExecResult::make(ExecResult::Kind::CONTINUE);
        } else if constexpr (std::is_same_v<T, ReturnStmt>) {
            Value value;
            if (node.value) value = evaluate(*node.value, env);
            return ExecResult::make_return(value);
        } else if constexpr (std::is_same_v<T, FunctionStmt>) {
            env->define(node.decl->name.value, std::make_shared<FunctionValue>(node.decl, env));
            return ExecResult::normal();
        } else if constexpr (std::is_same_v<T, ClassStmt>) {
            execute_class(node, env);
            return ExecResult::normal();
        } else {
            static_assert(always_false_v<T>, "unhandled statement kind");
        }
    },
        stmt.node);
}

// Runs the statements in env (already created by the caller) and stops at
// the first result that is not NORMAL.
ExecResult Evaluator::execute_block(const std::vector<StmtPtr>& statements, const EnvPtr& env) {
    for (const auto& s : statements) {
        ExecResult r = execute(*s, env);
        if (r.kind != ExecResult::Kind::NORMAL) return r;
    }
    return ExecResult::normal();
}

ExecResult Evaluator::execute_while(const WhileStmt& node, const EnvPtr& env) {
    while (is_truthy(evaluate(*node.condition, env))) {
        ExecResult r = execute(*node.body, env);
        if (r.kind == ExecResult::Kind::BREAK) break;
        if (r.kind == ExecResult::Kind::RETURN) return r;
        // NORMAL and CONTINUE both fall through to the increment
        if (node.increment) evaluate(*node.increment, env);
    }
    return ExecResult::normal();
}

void Evaluator::execute_class(const ClassStmt& node, const EnvPtr& env) {
    ClassPtr superclass;
    if (node.superclass) {
        Value super_val = evaluate(*node.superclass, env);
        if (!std::holds_alternative<ClassPtr>(super_val)) {
            throw QuillError("TypeError", "Superclass must be a class.", node.superclass->token.loc);
        }
        superclass = std::get<ClassPtr>(super_val);
    }

    // the name is visible (as nil) while the methods are being captured
    env->define(node.name.value, std::monostate{});

    EnvPtr method_env = env;
    if (superclass) {
        method_env = std::make_shared<Environment>(env);
        method_env->define("super", superclass);
    }

    auto klass = std::make_shared<ClassValue>();
    klass->name = node.name.value;
    klass->super = superclass;
    klass->token = node.name;
    for (const auto& method : node.methods) {
        bool is_init = method->name.value == "init";
        klass->methods[method->name.value] = std::make_shared<FunctionValue>(method, method_env, is_init);
    }

    env->define(node.name.value, klass);
}
