// src/evaluator/ExpressionEval.cpp
#include <type_traits>
#include <utility>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate(const Expr& expr, const EnvPtr& env) {
    return std::visit([&](const auto& node) -> Value {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, LiteralExpr>) {
            return std::visit([](const auto& v) -> Value { return v; }, node.value);
        } else if constexpr (std::is_same_v<T, GroupingExpr>) {
            return evaluate(*node.expression, env);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            return eval_unary(node, env);
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            return eval_binary(node, env);
        } else if constexpr (std::is_same_v<T, LogicalExpr>) {
            return eval_logical(node, env);
        } else if constexpr (std::is_same_v<T, VariableExpr>) {
            return lookup_variable(expr, node.name, env);
        } else if constexpr (std::is_same_v<T, AssignExpr>) {
            Value value = evaluate(*node.value, env);
            assign_variable(expr, node.name, value, env);
            return value;
        } else if constexpr (std::is_same_v<T, CallExpr>) {
            return eval_call(node, env);
        } else if constexpr (std::is_same_v<T, GetExpr>) {
            return eval_get(node, env);
        } else if constexpr (std::is_same_v<T, SetExpr>) {
            return eval_set(node, env);
        } else if constexpr (std::is_same_v<T, ThisExpr>) {
            return lookup_variable(expr, node.keyword, env);
        } else if constexpr (std::is_same_v<T, SuperExpr>) {
            return eval_super(expr, node, env);
        } else {
            static_assert(always_false_v<T>, "unhandled expression kind");
        }
    },
        expr.node);
}

// Locals are read at the exact distance the resolver computed; anything the
// resolver did not record is a global.
Value Evaluator::lookup_variable(const Expr& expr, const Token& name, const EnvPtr& env) {
    auto it = locals.find(expr.id);
    if (it != locals.end()) {
        return env->get_at(it->second, name);
    }
    return global_env->get(name);
}

void Evaluator::assign_variable(const Expr& expr, const Token& name, const Value& value, const EnvPtr& env) {
    auto it = locals.find(expr.id);
    if (it != locals.end()) {
        env->assign_at(it->second, name, value);
        return;
    }
    global_env->assign(name, value);
}

Value Evaluator::eval_unary(const UnaryExpr& node, const EnvPtr& env) {
    Value right = evaluate(*node.right, env);

    switch (node.op.type) {
        case TokenType::MINUS:
            return -expect_number(right, node.op);
        case TokenType::NOT:
            return !is_truthy(right);
        default:
            throw QuillError("InternalError", "Unknown unary operator '" + node.op.value + "'.", node.op.loc);
    }
}

Value Evaluator::eval_binary(const BinaryExpr& node, const EnvPtr& env) {
    // operands are evaluated left to right before any type check
    Value left = evaluate(*node.left, env);
    Value right = evaluate(*node.right, env);
    const Token& op = node.op;

    switch (op.type) {
        case TokenType::EQUALITY:
            return is_equal(left, right);
        case TokenType::NOTEQUAL:
            return !is_equal(left, right);
        case TokenType::PLUS:
            if (std::holds_alternative<double>(left) && std::holds_alternative<double>(right)) {
                return std::get<double>(left) + std::get<double>(right);
            }
            if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
                return std::get<std::string>(left) + std::get<std::string>(right);
            }
            throw QuillError("TypeError", "Operands must be two numbers or two strings.", op.loc);
        default:
            break;
    }

    if (!std::holds_alternative<double>(left) || !std::holds_alternative<double>(right)) {
        throw QuillError("TypeError", "Operands must be numbers.", op.loc);
    }
    double a = std::get<double>(left);
    double b = std::get<double>(right);

    switch (op.type) {
        case TokenType::MINUS:
            return a - b;
        case TokenType::STAR:
            return a * b;
        case TokenType::SLASH:
            // IEEE semantics: x/0 is +-Infinity or NaN, not an error
            return a / b;
        case TokenType::GREATERTHAN:
            return a > b;
        case TokenType::GREATEROREQUALTHAN:
            return a >= b;
        case TokenType::LESSTHAN:
            return a < b;
        case TokenType::LESSOREQUALTHAN:
            return a <= b;
        default:
            throw QuillError("InternalError", "Unknown binary operator '" + op.value + "'.", op.loc);
    }
}

// Yields the operand that decided the outcome, not a boolean.
Value Evaluator::eval_logical(const LogicalExpr& node, const EnvPtr& env) {
    Value left = evaluate(*node.left, env);

    if (node.op.type == TokenType::OR) {
        if (is_truthy(left)) return left;
    } else {
        if (!is_truthy(left)) return left;
    }
    return evaluate(*node.right, env);
}

Value Evaluator::eval_call(const CallExpr& node, const EnvPtr& env) {
    Value callee = evaluate(*node.callee, env);

    std::vector<Value> args;
    args.reserve(node.arguments.size());
    for (const auto& arg : node.arguments) {
        args.push_back(evaluate(*arg, env));
    }

    return call_value(callee, args, node.paren);
}

// Own fields first, then methods up the class chain. A method comes back
// bound to the instance it was read from.
Value Evaluator::eval_get(const GetExpr& node, const EnvPtr& env) {
    Value object = evaluate(*node.object, env);

    if (!std::holds_alternative<InstancePtr>(object)) {
        throw QuillError("TypeError", "Only instances have properties.", node.name.loc);
    }
    InstancePtr instance = std::get<InstancePtr>(object);

    auto it = instance->fields.find(node.name.value);
    if (it != instance->fields.end()) return it->second;

    FunctionPtr method = instance->klass->find_method(node.name.value);
    if (method) return std::make_shared<BoundMethodValue>(instance, method);

    throw QuillError("ReferenceError", "Undefined property '" + node.name.value + "'.", node.name.loc);
}

Value Evaluator::eval_set(const SetExpr& node, const EnvPtr& env) {
    Value object = evaluate(*node.object, env);

    if (!std::holds_alternative<InstancePtr>(object)) {
        throw QuillError("TypeError", "Only instances have fields.", node.name.loc);
    }

    Value value = evaluate(*node.value, env);
    std::get<InstancePtr>(object)->fields[node.name.value] = value;
    return value;
}

// 'super' sits in the environment just outside the one holding 'this'.
Value Evaluator::eval_super(const Expr& expr, const SuperExpr& node, const EnvPtr& env) {
    auto it = locals.find(expr.id);
    if (it == locals.end()) {
        throw QuillError("InternalError", "Unresolved 'super' expression.", node.keyword.loc);
    }
    int depth = it->second;

    Value super_val = env->get_at(depth, node.keyword);
    Token this_tok(TokenType::THIS, "this", node.keyword.loc);
    Value this_val = env->get_at(depth - 1, this_tok);

    if (!std::holds_alternative<ClassPtr>(super_val) || !std::holds_alternative<InstancePtr>(this_val)) {
        throw QuillError("InternalError", "Malformed method environment for 'super'.", node.keyword.loc);
    }
    ClassPtr superclass = std::get<ClassPtr>(super_val);
    InstancePtr receiver = std::get<InstancePtr>(this_val);

    FunctionPtr method = superclass->find_method(node.method.value);
    if (!method) {
        throw QuillError("ReferenceError", "Undefined property '" + node.method.value + "'.", node.method.loc);
    }
    return std::make_shared<BoundMethodValue>(receiver, method);
}
