#include <iostream>
#include <string>

#include "print_debug.hpp"

const char* token_type_name(TokenType t) {
    switch (t) {
        case TokenType::OPENPARENTHESIS: return "OPENPARENTHESIS";
        case TokenType::CLOSEPARENTHESIS: return "CLOSEPARENTHESIS";
        case TokenType::OPENBRACE: return "OPENBRACE";
        case TokenType::CLOSEBRACE: return "CLOSEBRACE";
        case TokenType::COMMA: return "COMMA";
        case TokenType::DOT: return "DOT";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::STAR: return "STAR";
        case TokenType::SLASH: return "SLASH";
        case TokenType::NOT: return "NOT";
        case TokenType::NOTEQUAL: return "NOTEQUAL";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::EQUALITY: return "EQUALITY";
        case TokenType::GREATERTHAN: return "GREATERTHAN";
        case TokenType::GREATEROREQUALTHAN: return "GREATEROREQUALTHAN";
        case TokenType::LESSTHAN: return "LESSTHAN";
        case TokenType::LESSOREQUALTHAN: return "LESSOREQUALTHAN";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::STRING: return "STRING";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::VAR: return "VAR";
        case TokenType::FUN: return "FUN";
        case TokenType::CLASS: return "CLASS";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::WHILE: return "WHILE";
        case TokenType::FOR: return "FOR";
        case TokenType::BREAK: return "BREAK";
        case TokenType::CONTINUE: return "CONTINUE";
        case TokenType::RETURN: return "RETURN";
        case TokenType::PRINT: return "PRINT";
        case TokenType::TRUE: return "TRUE";
        case TokenType::FALSE: return "FALSE";
        case TokenType::NIL: return "NIL";
        case TokenType::THIS: return "THIS";
        case TokenType::SUPER: return "SUPER";
        case TokenType::EOF_TOKEN: return "EOF_TOKEN";
    }
    return "TOKEN(?)";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& os) {
    os << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        os << i << ": " << token_type_name(tok.type)
           << " value='" << tok.value << "'"
           << " file='" << tok.filename() << "'"
           << " line=" << tok.line() << " col=" << tok.col() << "\n";
    }
    os << "---- END TOKEN DUMP ----\n";
}
