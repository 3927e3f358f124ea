#pragma once
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "QuillError.hpp"
#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    // ids come from the session allocator so that nodes parsed from
    // different REPL inputs never share an identity
    Parser(const std::vector<Token>& tokens, NodeIdAllocator& ids);

    // Parses every declaration it can. Syntax errors are collected in
    // errors(); a declaration that failed is left out of the program.
    std::unique_ptr<Program> parse();

    const std::vector<Diagnostic>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

    static constexpr size_t MAX_ARGUMENTS = 255;

   private:
    // Thrown to unwind out of a broken declaration; caught in parse().
    struct ParseError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    std::vector<Token> tokens;
    size_t position = 0;
    NodeIdAllocator& ids;
    std::vector<Diagnostic> errors_;

    const Token& peek() const;
    const Token& previous() const;
    bool is_at_end() const;
    bool check(TokenType t) const;

    Token consume();
    bool match(TokenType t);
    template <typename... Ts>
    bool match_any(Ts... types) {
        for (TokenType t : {types...}) {
            if (match(t)) return true;
        }
        return false;
    }
    Token expect(TokenType t, const std::string& errMsg);

    // records a diagnostic; the caller decides whether to throw
    ParseError error(const Token& tok, const std::string& message);
    void synchronize();

    ExprPtr make_expr(const Token& tok, Expr::Kind node);
    StmtPtr make_stmt(const Token& tok, Stmt::Kind node);

    // expression parsing (precedence chain)
    ExprPtr parse_expression();
    ExprPtr parse_assignment();
    ExprPtr parse_logical_or();
    ExprPtr parse_logical_and();
    ExprPtr parse_equality();
    ExprPtr parse_comparison();
    ExprPtr parse_additive();
    ExprPtr parse_multiplicative();
    ExprPtr parse_unary();
    ExprPtr parse_call();
    ExprPtr finish_call(ExprPtr callee);
    ExprPtr parse_primary();

    // declarations / statements
    StmtPtr parse_declaration();
    StmtPtr parse_statement();
    StmtPtr parse_variable_declaration();
    StmtPtr parse_print_statement();
    StmtPtr parse_expression_statement();

    // function / class parsing
    StmtPtr parse_function_declaration();
    FunctionDeclPtr parse_function(const std::string& kind);
    StmtPtr parse_class_declaration();
    StmtPtr parse_return_statement();

    // control-flow parsing
    StmtPtr parse_if_statement();
    StmtPtr parse_while_statement();
    StmtPtr parse_for_statement();  // desugars into block + while
    StmtPtr parse_continue_statement();
    StmtPtr parse_break_statement();

    // '{' declaration* '}' ; caller has already consumed '{'
    std::vector<StmtPtr> parse_block();
};
