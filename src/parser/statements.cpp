// src/parser/statements.cpp
#include <utility>

#include "parser.hpp"

// declaration -> classDecl | funDecl | varDecl | statement
// This is the recovery point: a syntax error anywhere inside the declaration
// unwinds to here, the parser resynchronises and the declaration is dropped.
StmtPtr Parser::parse_declaration() {
    try {
        if (match(TokenType::CLASS)) return parse_class_declaration();
        if (match(TokenType::FUN)) return parse_function_declaration();
        if (match(TokenType::VAR)) return parse_variable_declaration();
        return parse_statement();
    } catch (const ParseError&) {
        synchronize();
        return nullptr;
    }
}

StmtPtr Parser::parse_statement() {
    switch (peek().type) {
        case TokenType::PRINT:
            consume();
            return parse_print_statement();
        case TokenType::IF:
            consume();
            return parse_if_statement();
        case TokenType::WHILE:
            consume();
            return parse_while_statement();
        case TokenType::FOR:
            consume();
            return parse_for_statement();
        case TokenType::BREAK:
            consume();
            return parse_break_statement();
        case TokenType::CONTINUE:
            consume();
            return parse_continue_statement();
        case TokenType::RETURN:
            consume();
            return parse_return_statement();
        case TokenType::OPENBRACE: {
            Token brace = consume();
            return make_stmt(brace, BlockStmt{parse_block()});
        }
        default:
            return parse_expression_statement();
    }
}

// varDecl -> "var" IDENTIFIER ( "=" expression )? ";"   ('var' already consumed)
StmtPtr Parser::parse_variable_declaration() {
    Token name = expect(TokenType::IDENTIFIER, "Expected variable name.");

    ExprPtr initializer;
    if (match(TokenType::ASSIGN)) {
        initializer = parse_expression();
    }

    expect(TokenType::SEMICOLON, "Expected ';' after variable declaration.");
    return make_stmt(name, VarStmt{name, std::move(initializer)});
}

StmtPtr Parser::parse_print_statement() {
    Token keyword = previous();
    ExprPtr value = parse_expression();
    expect(TokenType::SEMICOLON, "Expected ';' after value.");
    return make_stmt(keyword, PrintStmt{std::move(value)});
}

StmtPtr Parser::parse_expression_statement() {
    Token start = peek();
    ExprPtr expr = parse_expression();
    expect(TokenType::SEMICOLON, "Expected ';' after expression.");
    return make_stmt(start, ExpressionStmt{std::move(expr)});
}
