// src/parser/blocks.cpp
#include <memory>
#include <utility>

#include "parser.hpp"

// block -> "{" declaration* "}" ; the opening brace is already consumed.
// Declarations recover individually, so one bad line inside a block does not
// throw away the rest of it.
std::vector<StmtPtr> Parser::parse_block() {
    std::vector<StmtPtr> statements;
    while (!check(TokenType::CLOSEBRACE) && !is_at_end()) {
        StmtPtr decl = parse_declaration();
        if (decl) statements.push_back(std::move(decl));
    }
    expect(TokenType::CLOSEBRACE, "Expected '}' after block.");
    return statements;
}

StmtPtr Parser::parse_function_declaration() {
    Token funTok = previous();
    FunctionDeclPtr fn = parse_function("function");
    return make_stmt(funTok, FunctionStmt{fn});
}

// function -> IDENTIFIER "(" parameters? ")" block
// kind is "function" or "method", only used in messages
FunctionDeclPtr Parser::parse_function(const std::string& kind) {
    auto fn = std::make_shared<FunctionDecl>();
    fn->name = expect(TokenType::IDENTIFIER, "Expected " + kind + " name.");

    expect(TokenType::OPENPARENTHESIS, "Expected '(' after " + kind + " name.");
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (fn->params.size() >= MAX_ARGUMENTS) {
                error(peek(), "Can't have more than " + std::to_string(MAX_ARGUMENTS) + " parameters.");
            }
            fn->params.push_back(expect(TokenType::IDENTIFIER, "Expected parameter name."));
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after parameters.");

    expect(TokenType::OPENBRACE, "Expected '{' before " + kind + " body.");
    fn->body = parse_block();
    return fn;
}

// classDecl -> "class" IDENTIFIER ( "<" IDENTIFIER )? "{" function* "}"
StmtPtr Parser::parse_class_declaration() {
    Token name = expect(TokenType::IDENTIFIER, "Expected class name.");

    ExprPtr superclass;
    if (match(TokenType::LESSTHAN)) {
        Token superName = expect(TokenType::IDENTIFIER, "Expected superclass name.");
        superclass = make_expr(superName, VariableExpr{superName});
    }

    expect(TokenType::OPENBRACE, "Expected '{' before class body.");

    std::vector<FunctionDeclPtr> methods;
    while (!check(TokenType::CLOSEBRACE) && !is_at_end()) {
        methods.push_back(parse_function("method"));
    }

    expect(TokenType::CLOSEBRACE, "Expected '}' after class body.");
    return make_stmt(name, ClassStmt{name, std::move(superclass), std::move(methods)});
}
