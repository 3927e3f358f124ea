// src/resolver.cpp
#include "resolver.hpp"

#include <type_traits>
#include <utility>

Resolver::Resolver(ScopeTable& table) : table(table) {}

void Resolver::resolve(const Program& program) {
    resolve_statements(program.body);
}

void Resolver::resolve_statements(const std::vector<StmtPtr>& statements) {
    for (const auto& s : statements) {
        if (s) resolve_stmt(*s);
    }
}

void Resolver::begin_scope() {
    scopes.emplace_back();
}

void Resolver::end_scope() {
    scopes.pop_back();
}

// Adds the name to the innermost scope as "declared but not ready" so that a
// read inside its own initializer can be caught.
void Resolver::declare(const Token& name) {
    if (scopes.empty()) return;

    auto& scope = scopes.back();
    if (scope.count(name.value)) {
        error(name, "Already a variable with this name in this scope.");
    }
    scope[name.value] = false;
}

void Resolver::define(const Token& name) {
    if (scopes.empty()) return;
    scopes.back()[name.value] = true;
}

// Innermost scope holding the name wins. Not found anywhere: assume global
// and leave the node out of the table.
void Resolver::resolve_local(const Expr& expr, const Token& name) {
    for (int i = static_cast<int>(scopes.size()) - 1; i >= 0; --i) {
        if (scopes[i].count(name.value)) {
            table[expr.id] = static_cast<int>(scopes.size()) - 1 - i;
            return;
        }
    }
}

void Resolver::resolve_function(const FunctionDecl& fn, FunctionType type) {
    FunctionType enclosing_function = current_function;
    int enclosing_loops = loop_depth;
    current_function = type;
    // a function body starts outside of any loop, even when declared in one
    loop_depth = 0;

    begin_scope();
    for (const auto& param : fn.params) {
        declare(param);
        define(param);
    }
    resolve_statements(fn.body);
    end_scope();

    loop_depth = enclosing_loops;
    current_function = enclosing_function;
}

void Resolver::error(const Token& tok, const std::string& message) {
    errors_.emplace_back("ResolutionError", message, tok.loc);
}

void Resolver::resolve_stmt(const Stmt& stmt) {
    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, ExpressionStmt>) {
            resolve_expr(*node.expression);
        } else if constexpr (std::is_same_v<T, PrintStmt>) {
            resolve_expr(*node.expression);
        } else if constexpr (std::is_same_v<T, VarStmt>) {
            declare(node.name);
            if (node.initializer) resolve_expr(*node.initializer);
            define(node.name);
        } else if constexpr (std::is_same_v<T, BlockStmt>) {
            begin_scope();
            resolve_statements(node.statements);
            end_scope();
        } else if constexpr (std::is_same_v<T, IfStmt>) {
            resolve_expr(*node.condition);
            resolve_stmt(*node.then_branch);
            if (node.else_branch) resolve_stmt(*node.else_branch);
        } else if constexpr (std::is_same_v<T, WhileStmt>) {
            resolve_expr(*node.condition);
            loop_depth++;
            resolve_stmt(*node.body);
            loop_depth--;
            if (node.increment) resolve_expr(*node.increment);
        } else if constexpr (std::is_same_v<T, BreakStmt>) {
            if (loop_depth == 0) error(node.keyword, "Can't use 'break' outside of a loop.");
        } else if constexpr (std::is_same_v<T, ContinueStmt>) {
            if (loop_depth == 0) error(node.keyword, "Can't use 'continue' outside of a loop.");
        } else if constexpr (std::is_same_v<T, ReturnStmt>) {
            if (current_function == FunctionType::NONE) {
                error(node.keyword, "Can't return from top-level code.");
            }
            if (node.value) {
                if (current_function == FunctionType::INITIALIZER) {
                    error(node.keyword, "Can't return a value from an initializer.");
                }
                resolve_expr(*node.value);
            }
        } else if constexpr (std::is_same_v<T, FunctionStmt>) {
            // defined before the body so the function can call itself
            declare(node.decl->name);
            define(node.decl->name);
            resolve_function(*node.decl, FunctionType::FUNCTION);
        } else if constexpr (std::is_same_v<T, ClassStmt>) {
            ClassType enclosing_class = current_class;
            current_class = ClassType::CLASS;

            declare(node.name);
            define(node.name);

            if (node.superclass) {
                const auto& super_name = std::get<VariableExpr>(node.superclass->node).name;
                if (super_name.value == node.name.value) {
                    error(super_name, "A class can't inherit from itself.");
                }
                current_class = ClassType::SUBCLASS;
                resolve_expr(*node.superclass);

                // methods of a subclass close over a scope holding 'super'
                begin_scope();
                scopes.back()["super"] = true;
            }

            // ... and every method closes over a scope holding 'this'
            begin_scope();
            scopes.back()["this"] = true;

            for (const auto& method : node.methods) {
                FunctionType type = method->name.value == "init" ? FunctionType::INITIALIZER : FunctionType::METHOD;
                resolve_function(*method, type);
            }

            end_scope();
            if (node.superclass) end_scope();

            current_class = enclosing_class;
        } else {
            static_assert(always_false_v<T>, "unhandled statement kind");
        }
    },
        stmt.node);
}

void Resolver::resolve_expr(const Expr& expr) {
    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, LiteralExpr>) {
            // nothing to resolve
        } else if constexpr (std::is_same_v<T, GroupingExpr>) {
            resolve_expr(*node.expression);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            resolve_expr(*node.right);
        } else if constexpr (std::is_same_v<T, BinaryExpr> || std::is_same_v<T, LogicalExpr>) {
            resolve_expr(*node.left);
            resolve_expr(*node.right);
        } else if constexpr (std::is_same_v<T, VariableExpr>) {
            if (!scopes.empty()) {
                auto it = scopes.back().find(node.name.value);
                if (it != scopes.back().end() && it->second == false) {
                    error(node.name, "Can't read local variable in its own initializer.");
                }
            }
            resolve_local(expr, node.name);
        } else if constexpr (std::is_same_v<T, AssignExpr>) {
            resolve_expr(*node.value);
            resolve_local(expr, node.name);
        } else if constexpr (std::is_same_v<T, CallExpr>) {
            resolve_expr(*node.callee);
            for (const auto& arg : node.arguments) resolve_expr(*arg);
        } else if constexpr (std::is_same_v<T, GetExpr>) {
            // property names are looked up dynamically
            resolve_expr(*node.object);
        } else if constexpr (std::is_same_v<T, SetExpr>) {
            resolve_expr(*node.value);
            resolve_expr(*node.object);
        } else if constexpr (std::is_same_v<T, ThisExpr>) {
            if (current_class == ClassType::NONE) {
                error(node.keyword, "Can't use 'this' outside of a class.");
                return;
            }
            resolve_local(expr, node.keyword);
        } else if constexpr (std::is_same_v<T, SuperExpr>) {
            if (current_class == ClassType::NONE) {
                error(node.keyword, "Can't use 'super' outside of a class.");
                return;
            }
            if (current_class != ClassType::SUBCLASS) {
                error(node.keyword, "Can't use 'super' in a class with no superclass.");
                return;
            }
            resolve_local(expr, node.keyword);
        } else {
            static_assert(always_false_v<T>, "unhandled expression kind");
        }
    },
        expr.node);
}
