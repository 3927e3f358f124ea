#pragma once

#include <string>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table and print_tokens)
enum class TokenType {
    // -----------------------
    // Punctuation (single-character / structural)
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    COMMA,
    DOT,
    SEMICOLON,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,

    // -----------------------
    // Comparison / assignment / negation
    // -----------------------
    NOT,
    NOTEQUAL,
    ASSIGN,
    EQUALITY,
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    STRING,
    NUMBER,

    // -----------------------
    // Keywords
    // -----------------------
    AND,
    OR,
    VAR,
    FUN,
    CLASS,
    IF,
    ELSE,
    WHILE,
    FOR,
    BREAK,
    CONTINUE,
    RETURN,
    PRINT,
    TRUE,
    FALSE,
    NIL,
    THIS,
    SUPER,

    EOF_TOKEN
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // lexeme; string contents (without quotes) for STRING
    TokenLocation loc;  // file:line:col and length/span

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}

// Stable name of a token type, used by the token dump and parser messages.
const char* token_type_name(TokenType t);
