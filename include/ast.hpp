#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "token.hpp"

// The node set is closed (it is fixed by the grammar), so each family is a
// std::variant and consumers dispatch with std::visit. A consumer missing an
// alternative fails to compile.

// for the static_assert closing an if-constexpr chain inside std::visit
template <typename>
inline constexpr bool always_false_v = false;

// Identity of an expression node, unique within one interpreter session.
// The resolver's depth table is keyed by it.
using NodeId = std::size_t;

// Resolver output: for each resolved VariableExpr / AssignExpr / ThisExpr /
// SuperExpr, the number of environments between the use and its binding.
// Nodes absent from the table are globals.
using ScopeTable = std::unordered_map<NodeId, int>;

class NodeIdAllocator {
   public:
    NodeId next() { return next_++; }

   private:
    NodeId next_ = 1;
};

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

// nil / boolean / number / string
using LiteralValue = std::variant<std::monostate, bool, double, std::string>;

// ----- Expressions -----

struct LiteralExpr {
    LiteralValue value;
};

struct GroupingExpr {
    ExprPtr expression;
};

struct UnaryExpr {
    Token op;  // "!" or "-"
    ExprPtr right;
};

struct BinaryExpr {
    ExprPtr left;
    Token op;
    ExprPtr right;
};

// 'and' / 'or': kept apart from BinaryExpr because they short-circuit
struct LogicalExpr {
    ExprPtr left;
    Token op;
    ExprPtr right;
};

struct VariableExpr {
    Token name;
};

struct AssignExpr {
    Token name;
    ExprPtr value;
};

struct CallExpr {
    ExprPtr callee;
    Token paren;  // closing ')' for diagnostics
    std::vector<ExprPtr> arguments;
};

struct GetExpr {
    ExprPtr object;
    Token name;
};

// obj.name = value (produced from a GetExpr assignment target)
struct SetExpr {
    ExprPtr object;
    Token name;
    ExprPtr value;
};

struct ThisExpr {
    Token keyword;
};

// super.method
struct SuperExpr {
    Token keyword;
    Token method;
};

struct Expr {
    using Kind = std::variant<
        LiteralExpr,
        GroupingExpr,
        UnaryExpr,
        BinaryExpr,
        LogicalExpr,
        VariableExpr,
        AssignExpr,
        CallExpr,
        GetExpr,
        SetExpr,
        ThisExpr,
        SuperExpr>;

    NodeId id = 0;
    Token token;  // filename, line, column for diagnostics (set by the parser)
    Kind node;

    Expr(NodeId i, const Token& tok, Kind k) : id(i), token(tok), node(std::move(k)) {}

    // Lisp-style rendering, e.g. (+ 1 (* 2 3)); used by tests and --ast
    std::string to_string() const;
};

// ----- Statements -----

struct ExpressionStmt {
    ExprPtr expression;
};

struct PrintStmt {
    ExprPtr expression;
};

struct VarStmt {
    Token name;
    ExprPtr initializer;  // may be null
};

struct BlockStmt {
    std::vector<StmtPtr> statements;
};

struct IfStmt {
    ExprPtr condition;
    StmtPtr then_branch;
    StmtPtr else_branch;  // may be null
};

// A desugared 'for' keeps its increment here so that it still runs when the
// body ends with 'continue'.
struct WhileStmt {
    ExprPtr condition;
    StmtPtr body;
    ExprPtr increment;  // may be null
};

struct BreakStmt {
    Token keyword;
};

struct ContinueStmt {
    Token keyword;
};

struct ReturnStmt {
    Token keyword;
    ExprPtr value;  // may be null
};

// Shared between the AST and every function value built from it, so a
// closure keeps its body alive after a REPL input's AST has been dropped.
struct FunctionDecl {
    Token name;
    std::vector<Token> params;
    std::vector<StmtPtr> body;
};
using FunctionDeclPtr = std::shared_ptr<const FunctionDecl>;

struct FunctionStmt {
    FunctionDeclPtr decl;
};

struct ClassStmt {
    Token name;
    ExprPtr superclass;  // VariableExpr or null
    std::vector<FunctionDeclPtr> methods;
};

struct Stmt {
    using Kind = std::variant<
        ExpressionStmt,
        PrintStmt,
        VarStmt,
        BlockStmt,
        IfStmt,
        WhileStmt,
        BreakStmt,
        ContinueStmt,
        ReturnStmt,
        FunctionStmt,
        ClassStmt>;

    Token token;
    Kind node;

    Stmt(const Token& tok, Kind k) : token(tok), node(std::move(k)) {}

    std::string to_string() const;
};

struct Program {
    std::vector<StmtPtr> body;

    std::string to_string() const;
};

std::string function_to_string(const FunctionDecl& fn);
