#pragma once

#include <string>
#include <vector>

#include "QuillError.hpp"
#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "", const SourceManager* mgr = nullptr);

    // Scans the whole source. Always ends with an EOF_TOKEN; lexical errors
    // are collected in errors() and the offending characters are skipped.
    std::vector<Token> tokenize();

    const std::vector<Diagnostic>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

   private:
    const std::string src;
    const std::string filename;
    size_t i = 0;
    int line = 1;
    int col = 1;

    const SourceManager* src_mgr = nullptr;
    std::vector<Diagnostic> errors_;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();
    bool match(char expected);

    TokenLocation make_location(int tok_line, int tok_col, int tok_length) const;

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);
    void report(const std::string& message, int err_line, int err_col, int err_length = 1);

    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    void skip_line_comment();
};
