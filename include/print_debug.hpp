#pragma once
#include <iostream>
#include <vector>

#include "QuillError.hpp"
#include "ast.hpp"
#include "token.hpp"

void print_tokens(const std::vector<Token>& tokens, std::ostream& os = std::cout);

void print_program_debug(const Program& program, std::ostream& os = std::cout);

// Writes each diagnostic as "Type at file:line:col", message, source trace.
void print_diagnostics(const std::vector<Diagnostic>& diagnostics, std::ostream& os, bool color);
