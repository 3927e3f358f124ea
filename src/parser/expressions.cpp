// src/parser/expressions.cpp
#include <cstdlib>
#include <utility>

#include "parser.hpp"

ExprPtr Parser::parse_expression() {
    return parse_assignment();
}

// assignment -> ( call "." )? IDENTIFIER "=" assignment | logic_or
// The left side is parsed as an ordinary expression first and then checked:
// only a variable or a property get can be assigned to.
ExprPtr Parser::parse_assignment() {
    ExprPtr expr = parse_logical_or();

    if (match(TokenType::ASSIGN)) {
        Token equals = previous();
        ExprPtr value = parse_assignment();

        if (auto var = std::get_if<VariableExpr>(&expr->node)) {
            Token name = var->name;
            return make_expr(name, AssignExpr{name, std::move(value)});
        }
        if (auto get = std::get_if<GetExpr>(&expr->node)) {
            Token name = get->name;
            return make_expr(name, SetExpr{std::move(get->object), name, std::move(value)});
        }

        // reported, but the parser is not confused: no synchronisation
        error(equals, "Invalid assignment target.");
    }

    return expr;
}

ExprPtr Parser::parse_logical_or() {
    ExprPtr left = parse_logical_and();
    while (match(TokenType::OR)) {
        Token op = previous();
        ExprPtr right = parse_logical_and();
        left = make_expr(op, LogicalExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

ExprPtr Parser::parse_logical_and() {
    ExprPtr left = parse_equality();
    while (match(TokenType::AND)) {
        Token op = previous();
        ExprPtr right = parse_equality();
        left = make_expr(op, LogicalExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

ExprPtr Parser::parse_equality() {
    ExprPtr left = parse_comparison();
    while (match_any(TokenType::EQUALITY, TokenType::NOTEQUAL)) {
        Token op = previous();
        ExprPtr right = parse_comparison();
        left = make_expr(op, BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

ExprPtr Parser::parse_comparison() {
    ExprPtr left = parse_additive();
    while (match_any(TokenType::GREATERTHAN, TokenType::GREATEROREQUALTHAN,
        TokenType::LESSTHAN, TokenType::LESSOREQUALTHAN)) {
        Token op = previous();
        ExprPtr right = parse_additive();
        left = make_expr(op, BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

ExprPtr Parser::parse_additive() {
    ExprPtr left = parse_multiplicative();
    while (match_any(TokenType::PLUS, TokenType::MINUS)) {
        Token op = previous();
        ExprPtr right = parse_multiplicative();
        left = make_expr(op, BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

ExprPtr Parser::parse_multiplicative() {
    ExprPtr left = parse_unary();
    while (match_any(TokenType::STAR, TokenType::SLASH)) {
        Token op = previous();
        ExprPtr right = parse_unary();
        left = make_expr(op, BinaryExpr{std::move(left), op, std::move(right)});
    }
    return left;
}

ExprPtr Parser::parse_unary() {
    if (match_any(TokenType::NOT, TokenType::MINUS)) {
        Token op = previous();
        ExprPtr right = parse_unary();
        return make_expr(op, UnaryExpr{op, std::move(right)});
    }
    return parse_call();
}

// call -> primary ( "(" arguments? ")" | "." IDENTIFIER )*
ExprPtr Parser::parse_call() {
    ExprPtr expr = parse_primary();

    while (true) {
        if (match(TokenType::OPENPARENTHESIS)) {
            expr = finish_call(std::move(expr));
        } else if (match(TokenType::DOT)) {
            Token name = expect(TokenType::IDENTIFIER, "Expected property name after '.'.");
            expr = make_expr(name, GetExpr{std::move(expr), name});
        } else {
            break;
        }
    }

    return expr;
}

ExprPtr Parser::finish_call(ExprPtr callee) {
    std::vector<ExprPtr> arguments;
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (arguments.size() >= MAX_ARGUMENTS) {
                error(peek(), "Can't have more than " + std::to_string(MAX_ARGUMENTS) + " arguments.");
            }
            arguments.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }

    Token paren = expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after arguments.");
    return make_expr(paren, CallExpr{std::move(callee), paren, std::move(arguments)});
}

ExprPtr Parser::parse_primary() {
    const Token& t = peek();

    switch (t.type) {
        case TokenType::FALSE:
            consume();
            return make_expr(previous(), LiteralExpr{false});
        case TokenType::TRUE:
            consume();
            return make_expr(previous(), LiteralExpr{true});
        case TokenType::NIL:
            consume();
            return make_expr(previous(), LiteralExpr{std::monostate{}});
        case TokenType::NUMBER: {
            consume();
            double value = std::strtod(previous().value.c_str(), nullptr);
            return make_expr(previous(), LiteralExpr{value});
        }
        case TokenType::STRING:
            consume();
            return make_expr(previous(), LiteralExpr{previous().value});
        case TokenType::THIS:
            consume();
            return make_expr(previous(), ThisExpr{previous()});
        case TokenType::SUPER: {
            Token keyword = consume();
            expect(TokenType::DOT, "Expected '.' after 'super'.");
            Token method = expect(TokenType::IDENTIFIER, "Expected superclass method name.");
            return make_expr(keyword, SuperExpr{keyword, method});
        }
        case TokenType::IDENTIFIER:
            consume();
            return make_expr(previous(), VariableExpr{previous()});
        case TokenType::OPENPARENTHESIS: {
            Token open = consume();
            ExprPtr inner = parse_expression();
            expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression.");
            return make_expr(open, GroupingExpr{std::move(inner)});
        }
        default:
            break;
    }

    throw error(t, "Expected expression.");
}
