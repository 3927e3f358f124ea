#include "lexer.hpp"

#include <cctype>
#include <unordered_map>

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (eof() || peek() != expected) return false;
    advance();
    return true;
}

TokenLocation Lexer::make_location(int tok_line, int tok_col, int tok_length) const {
    return TokenLocation(filename.empty() ? "<repl>" : filename, tok_line, tok_col, tok_length, src_mgr);
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    out.emplace_back(type, value, make_location(tok_line, tok_col, len));
}

void Lexer::report(const std::string& message, int err_line, int err_col, int err_length) {
    errors_.emplace_back("SyntaxError", message, make_location(err_line, err_col, err_length));
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

// Strings have no escapes; they may span lines. start_index points at the
// opening quote, and an unterminated string is reported where it started.
void Lexer::scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    advance();  // opening quote
    std::string val;
    while (!eof() && peek() != '"') {
        val.push_back(advance());
    }

    if (eof()) {
        report("Unterminated string.", tok_line, tok_col, static_cast<int>(i - start_index));
        return;
    }

    advance();  // closing quote
    add_token(out, TokenType::STRING, val, tok_line, tok_col, static_cast<int>(i - start_index));
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string val;
    while (std::isdigit((unsigned char)peek())) val.push_back(advance());

    if (peek() == '.') {
        if (!std::isdigit((unsigned char)peek_next())) {
            // "12." is rejected; the dot is swallowed so scanning resumes after it
            int dot_col = col;
            advance();
            report("Invalid number '" + val + ".': expected digits after '.'.", tok_line, dot_col);
            return;
        }
        val.push_back(advance());
        while (std::isdigit((unsigned char)peek())) val.push_back(advance());
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::NUMBER, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string id;
    while (!eof()) {
        char c = peek();
        if (std::isalnum((unsigned char)c) || c == '_')
            id.push_back(advance());
        else
            break;
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"and", TokenType::AND},
        {"or", TokenType::OR},

        // declarations
        {"var", TokenType::VAR},
        {"fun", TokenType::FUN},
        {"class", TokenType::CLASS},

        // control flow
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
        {"while", TokenType::WHILE},
        {"for", TokenType::FOR},
        {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},
        {"return", TokenType::RETURN},
        {"print", TokenType::PRINT},

        // keyword literals
        {"true", TokenType::TRUE},
        {"false", TokenType::FALSE},
        {"nil", TokenType::NIL},

        // classes
        {"this", TokenType::THIS},
        {"super", TokenType::SUPER},
    };

    auto it = keywords.find(id);
    int tok_length = static_cast<int>(i - start_index);
    add_token(out, it != keywords.end() ? it->second : TokenType::IDENTIFIER, id, tok_line, tok_col, tok_length);
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    int tok_line = line;
    int tok_col = col;

    // whitespace / newlines
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        return;
    }

    switch (c) {
        case '(':
            advance();
            add_token(out, TokenType::OPENPARENTHESIS, "(", tok_line, tok_col);
            return;
        case ')':
            advance();
            add_token(out, TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col);
            return;
        case '{':
            advance();
            add_token(out, TokenType::OPENBRACE, "{", tok_line, tok_col);
            return;
        case '}':
            advance();
            add_token(out, TokenType::CLOSEBRACE, "}", tok_line, tok_col);
            return;
        case ',':
            advance();
            add_token(out, TokenType::COMMA, ",", tok_line, tok_col);
            return;
        case '.':
            advance();
            add_token(out, TokenType::DOT, ".", tok_line, tok_col);
            return;
        case ';':
            advance();
            add_token(out, TokenType::SEMICOLON, ";", tok_line, tok_col);
            return;
        case '+':
            advance();
            add_token(out, TokenType::PLUS, "+", tok_line, tok_col);
            return;
        case '-':
            advance();
            add_token(out, TokenType::MINUS, "-", tok_line, tok_col);
            return;
        case '*':
            advance();
            add_token(out, TokenType::STAR, "*", tok_line, tok_col);
            return;
        case '/':
            advance();
            if (peek() == '/') {
                skip_line_comment();
                return;
            }
            add_token(out, TokenType::SLASH, "/", tok_line, tok_col);
            return;

        // one or two character operators (maximal munch)
        case '!':
            advance();
            if (match('='))
                add_token(out, TokenType::NOTEQUAL, "!=", tok_line, tok_col);
            else
                add_token(out, TokenType::NOT, "!", tok_line, tok_col);
            return;
        case '=':
            advance();
            if (match('='))
                add_token(out, TokenType::EQUALITY, "==", tok_line, tok_col);
            else
                add_token(out, TokenType::ASSIGN, "=", tok_line, tok_col);
            return;
        case '<':
            advance();
            if (match('='))
                add_token(out, TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col);
            else
                add_token(out, TokenType::LESSTHAN, "<", tok_line, tok_col);
            return;
        case '>':
            advance();
            if (match('='))
                add_token(out, TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col);
            else
                add_token(out, TokenType::GREATERTHAN, ">", tok_line, tok_col);
            return;

        case '"':
            scan_string(out, tok_line, tok_col, i);
            return;
        default:
            break;
    }

    if (std::isdigit((unsigned char)c)) {
        scan_number(out, tok_line, tok_col, i);
        return;
    }

    // identifier or keyword
    if (std::isalpha((unsigned char)c) || c == '_') {
        scan_identifier_or_keyword(out, tok_line, tok_col, i);
        return;
    }

    // unknown char: report, skip, keep scanning
    advance();
    report(std::string("Unexpected character '") + c + "'.", tok_line, tok_col);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}
