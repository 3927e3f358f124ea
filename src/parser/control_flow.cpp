// src/parser/control_flow.cpp
#include <utility>

#include "parser.hpp"

// ---------- control-flow: if / else ----------
// the keyword has already been consumed by parse_statement
StmtPtr Parser::parse_if_statement() {
    Token ifTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'if'.");
    ExprPtr cond = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after if condition.");

    StmtPtr then_branch = parse_statement();
    StmtPtr else_branch;
    // a dangling else binds to the nearest if
    if (match(TokenType::ELSE)) {
        else_branch = parse_statement();
    }

    return make_stmt(ifTok, IfStmt{std::move(cond), std::move(then_branch), std::move(else_branch)});
}

// ---------- loops ----------
StmtPtr Parser::parse_while_statement() {
    Token whileTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'while'.");
    ExprPtr cond = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after while condition.");
    StmtPtr body = parse_statement();

    return make_stmt(whileTok, WhileStmt{std::move(cond), std::move(body), nullptr});
}

// for ( init ; cond ; incr ) body
//   =>  { init; while (cond or true) body [incr] }
// The increment stays attached to the while node instead of being appended
// to the body, so 'continue' inside the body cannot skip it.
StmtPtr Parser::parse_for_statement() {
    Token forTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'for'.");

    StmtPtr initializer;
    if (match(TokenType::SEMICOLON)) {
        // no initializer
    } else if (match(TokenType::VAR)) {
        initializer = parse_variable_declaration();
    } else {
        initializer = parse_expression_statement();
    }

    ExprPtr condition;
    if (!check(TokenType::SEMICOLON)) {
        condition = parse_expression();
    }
    Token condEnd = expect(TokenType::SEMICOLON, "Expected ';' after loop condition.");

    ExprPtr increment;
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        increment = parse_expression();
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after for clauses.");

    StmtPtr body = parse_statement();

    if (!condition) condition = make_expr(condEnd, LiteralExpr{true});

    StmtPtr loop = make_stmt(forTok, WhileStmt{std::move(condition), std::move(body), std::move(increment)});

    std::vector<StmtPtr> statements;
    if (initializer) statements.push_back(std::move(initializer));
    statements.push_back(std::move(loop));
    return make_stmt(forTok, BlockStmt{std::move(statements)});
}

// continue and break controls for loops; placement is checked by the resolver
StmtPtr Parser::parse_continue_statement() {
    Token keyword = previous();
    expect(TokenType::SEMICOLON, "Expected ';' after 'continue'.");
    return make_stmt(keyword, ContinueStmt{keyword});
}

StmtPtr Parser::parse_break_statement() {
    Token keyword = previous();
    expect(TokenType::SEMICOLON, "Expected ';' after 'break'.");
    return make_stmt(keyword, BreakStmt{keyword});
}

StmtPtr Parser::parse_return_statement() {
    Token keyword = previous();
    ExprPtr value;
    if (!check(TokenType::SEMICOLON)) {
        value = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expected ';' after return value.");
    return make_stmt(keyword, ReturnStmt{keyword, std::move(value)});
}
