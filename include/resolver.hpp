#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "QuillError.hpp"
#include "ast.hpp"

// Static pass between parsing and evaluation. Works out, for every local
// variable reference, how many scopes separate it from its declaration and
// records that in the session's ScopeTable. Also rejects programs that are
// syntactically fine but meaningless ('return' at top level, 'this' outside
// a class, and so on).
class Resolver {
   public:
    explicit Resolver(ScopeTable& table);

    // Walks the whole program; errors are collected, not thrown.
    void resolve(const Program& program);

    const std::vector<Diagnostic>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

   private:
    enum class FunctionType {
        NONE,
        FUNCTION,
        METHOD,
        INITIALIZER
    };

    enum class ClassType {
        NONE,
        CLASS,
        SUBCLASS
    };

    ScopeTable& table;
    std::vector<Diagnostic> errors_;

    // name -> "definition finished"; the global scope is never on this stack
    std::vector<std::unordered_map<std::string, bool>> scopes;
    FunctionType current_function = FunctionType::NONE;
    ClassType current_class = ClassType::NONE;
    int loop_depth = 0;

    void resolve_statements(const std::vector<StmtPtr>& statements);
    void resolve_stmt(const Stmt& stmt);
    void resolve_expr(const Expr& expr);
    void resolve_function(const FunctionDecl& fn, FunctionType type);
    void resolve_local(const Expr& expr, const Token& name);

    void begin_scope();
    void end_scope();
    void declare(const Token& name);
    void define(const Token& name);

    void error(const Token& tok, const std::string& message);
};
