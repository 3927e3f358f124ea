// src/ast.cpp
#include "ast.hpp"

#include <string>

#include "number_format.hpp"

namespace {

std::string literal_to_string(const LiteralValue& v) {
    if (std::holds_alternative<std::monostate>(v)) return "nil";
    if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (auto d = std::get_if<double>(&v)) return number_to_string(*d);
    return "\"" + std::get<std::string>(v) + "\"";
}

std::string opt(const ExprPtr& e) {
    return e ? e->to_string() : "<null>";
}

std::string opt(const StmtPtr& s) {
    return s ? s->to_string() : "<null>";
}

struct ExprPrinter {
    std::string operator()(const LiteralExpr& n) const { return literal_to_string(n.value); }
    std::string operator()(const GroupingExpr& n) const { return "(group " + opt(n.expression) + ")"; }
    std::string operator()(const UnaryExpr& n) const { return "(" + n.op.value + " " + opt(n.right) + ")"; }
    std::string operator()(const BinaryExpr& n) const {
        return "(" + n.op.value + " " + opt(n.left) + " " + opt(n.right) + ")";
    }
    std::string operator()(const LogicalExpr& n) const {
        return "(" + n.op.value + " " + opt(n.left) + " " + opt(n.right) + ")";
    }
    std::string operator()(const VariableExpr& n) const { return n.name.value; }
    std::string operator()(const AssignExpr& n) const { return "(= " + n.name.value + " " + opt(n.value) + ")"; }
    std::string operator()(const CallExpr& n) const {
        std::string s = "(call " + opt(n.callee);
        for (const auto& a : n.arguments) s += " " + opt(a);
        return s + ")";
    }
    std::string operator()(const GetExpr& n) const { return "(. " + opt(n.object) + " " + n.name.value + ")"; }
    std::string operator()(const SetExpr& n) const {
        return "(.= " + opt(n.object) + " " + n.name.value + " " + opt(n.value) + ")";
    }
    std::string operator()(const ThisExpr&) const { return "this"; }
    std::string operator()(const SuperExpr& n) const { return "(super " + n.method.value + ")"; }
};

struct StmtPrinter {
    std::string operator()(const ExpressionStmt& n) const { return "(; " + opt(n.expression) + ")"; }
    std::string operator()(const PrintStmt& n) const { return "(print " + opt(n.expression) + ")"; }
    std::string operator()(const VarStmt& n) const {
        if (!n.initializer) return "(var " + n.name.value + ")";
        return "(var " + n.name.value + " " + n.initializer->to_string() + ")";
    }
    std::string operator()(const BlockStmt& n) const {
        std::string s = "(block";
        for (const auto& st : n.statements) s += " " + opt(st);
        return s + ")";
    }
    std::string operator()(const IfStmt& n) const {
        std::string s = "(if " + opt(n.condition) + " " + opt(n.then_branch);
        if (n.else_branch) s += " " + n.else_branch->to_string();
        return s + ")";
    }
    std::string operator()(const WhileStmt& n) const {
        std::string s = "(while " + opt(n.condition) + " " + opt(n.body);
        if (n.increment) s += " " + n.increment->to_string();
        return s + ")";
    }
    std::string operator()(const BreakStmt&) const { return "(break)"; }
    std::string operator()(const ContinueStmt&) const { return "(continue)"; }
    std::string operator()(const ReturnStmt& n) const {
        if (!n.value) return "(return)";
        return "(return " + n.value->to_string() + ")";
    }
    std::string operator()(const FunctionStmt& n) const {
        return n.decl ? function_to_string(*n.decl) : "(fun <null>)";
    }
    std::string operator()(const ClassStmt& n) const {
        std::string s = "(class " + n.name.value;
        if (n.superclass) s += " < " + n.superclass->to_string();
        for (const auto& m : n.methods) s += " " + (m ? function_to_string(*m) : "<null>");
        return s + ")";
    }
};

}  // namespace

std::string Expr::to_string() const {
    return std::visit(ExprPrinter{}, node);
}

std::string Stmt::to_string() const {
    return std::visit(StmtPrinter{}, node);
}

std::string Program::to_string() const {
    std::string s;
    for (const auto& st : body) {
        if (!s.empty()) s += "\n";
        s += opt(st);
    }
    return s;
}

std::string function_to_string(const FunctionDecl& fn) {
    std::string s = "(fun " + fn.name.value + " (";
    for (size_t i = 0; i < fn.params.size(); ++i) {
        if (i) s += " ";
        s += fn.params[i].value;
    }
    s += ")";
    for (const auto& st : fn.body) s += " " + opt(st);
    return s + ")";
}
