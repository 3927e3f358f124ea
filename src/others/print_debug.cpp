#include "print_debug.hpp"

#include <iostream>

#include "colors.hpp"

// One top-level declaration per line, each as its Lisp-style form, e.g.
//   (var x (+ 1 2))
//   (print x)
void print_program_debug(const Program& program, std::ostream& os) {
    os << "---- AST (" << program.body.size() << " declarations) ----\n";
    for (const auto& stmt : program.body) {
        os << stmt->token.loc.to_string() << "  " << stmt->to_string() << "\n";
    }
    os << "---- END AST ----\n";
}

void print_diagnostics(const std::vector<Diagnostic>& diagnostics, std::ostream& os, bool color) {
    for (const auto& d : diagnostics) {
        if (!color) {
            os << d.to_string() << "\n";
            continue;
        }
        os << Color::bright_red << d.type << Color::reset
           << " at " << Color::cyan << d.loc.to_string() << Color::reset << "\n"
           << d.message << "\n"
           << Color::bright_black << " --> Traced at:\n"
           << d.loc.get_line_trace() << Color::reset << "\n";
    }
}
