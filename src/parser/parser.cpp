// src/parser/parser.cpp
#include "parser.hpp"

#include <utility>

Parser::Parser(const std::vector<Token>& tokens, NodeIdAllocator& ids) : tokens(tokens), ids(ids) {
    // a token stream always ends with EOF; tolerate hand-built ones that don't
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        TokenLocation loc = this->tokens.empty() ? TokenLocation("<eof>", 1, 1, 0) : this->tokens.back().loc;
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", loc);
    }
}

std::unique_ptr<Program> Parser::parse() {
    auto program = std::make_unique<Program>();
    while (!is_at_end()) {
        StmtPtr decl = parse_declaration();
        if (decl) program->body.push_back(std::move(decl));
    }
    return program;
}

// Return current token (the EOF token once the stream is exhausted)
const Token& Parser::peek() const {
    return tokens[position];
}

const Token& Parser::previous() const {
    return tokens[position == 0 ? 0 : position - 1];
}

bool Parser::is_at_end() const {
    return peek().type == TokenType::EOF_TOKEN;
}

bool Parser::check(TokenType t) const {
    return peek().type == t;
}

// Consume and return the current token; EOF is never stepped over
Token Parser::consume() {
    if (!is_at_end()) position++;
    return previous();
}

bool Parser::match(TokenType t) {
    if (check(t)) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (check(t)) return consume();
    throw error(peek(), errMsg);
}

Parser::ParseError Parser::error(const Token& tok, const std::string& message) {
    std::string where = tok.type == TokenType::EOF_TOKEN ? "at end" : "at '" + tok.value + "'";
    errors_.emplace_back("SyntaxError", message + " (" + where + ")", tok.loc);
    return ParseError(message);
}

// Panic-mode recovery: skip to just after a ';' or to the next token that
// can start a statement.
void Parser::synchronize() {
    consume();
    while (!is_at_end()) {
        if (previous().type == TokenType::SEMICOLON) return;

        switch (peek().type) {
            case TokenType::CLASS:
            case TokenType::FUN:
            case TokenType::VAR:
            case TokenType::FOR:
            case TokenType::IF:
            case TokenType::WHILE:
            case TokenType::PRINT:
            case TokenType::RETURN:
            case TokenType::BREAK:
            case TokenType::CONTINUE:
                return;
            default:
                break;
        }
        consume();
    }
}

ExprPtr Parser::make_expr(const Token& tok, Expr::Kind node) {
    return std::make_unique<Expr>(ids.next(), tok, std::move(node));
}

StmtPtr Parser::make_stmt(const Token& tok, Stmt::Kind node) {
    return std::make_unique<Stmt>(tok, std::move(node));
}
