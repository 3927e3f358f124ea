#include "repl.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "linenoise.h"
#include "print_debug.hpp"
#include "runner.hpp"

namespace fs = std::filesystem;

// An input that failed only because it stopped too early (an open block, an
// unfinished call, a string still open) is kept and the next line appended.
static bool is_likely_incomplete_input(const RunResult& result) {
    if (result.status != RunStatus::SYNTAX_ERROR) return false;
    for (const auto& d : result.diagnostics) {
        const std::string& msg = d.message;
        if (msg == "Unterminated string.") return true;
        static const std::string at_end = "(at end)";
        if (msg.size() >= at_end.size() && msg.compare(msg.size() - at_end.size(), at_end.size(), at_end) == 0) {
            return true;
        }
    }
    return false;
}

// Return the count of *unclosed* bracket-like tokens: {...}, (...)
// This ignores characters inside double quotes and after '//' comments.
static int unclosed_brackets_depth(const std::string& s) {
    int braces = 0, paren = 0;
    bool in_string = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_string) {
            if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
            continue;
        }
        if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
            while (i < s.size() && s[i] != '\n') ++i;
            continue;
        }

        if (c == '{')
            ++braces;
        else if (c == '}')
            --braces;
        else if (c == '(')
            ++paren;
        else if (c == ')')
            --paren;
    }

    int openOnly = 0;
    if (braces > 0) openOnly += braces;
    if (paren > 0) openOnly += paren;
    return openOnly;  // zero if all balanced (or more closes than opens)
}

static bool is_blank(const std::string& s) {
    for (unsigned char c : s)
        if (!std::isspace(c)) return false;
    return true;
}

static std::optional<fs::path> get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return std::nullopt;
}

static fs::path history_file_in_home() {
    auto home = get_home_dir();
    if (home.has_value()) {
        return home.value() / ".quill_history";
    }
    return fs::current_path() / ".quill_history";
}

int run_repl_mode(bool color) {
    std::string buffer;
    Runner runner(std::cout);

    std::cout << "quill v" << QUILL_VERSION << " | built on " << __DATE__ << "\n";
    std::cout << "Quill REPL - type 'exit' or 'quit' or Ctrl-D to quit\n";

    fs::path history_path = history_file_in_home();
    linenoiseHistoryLoad(history_path.string().c_str());

    std::string last_added_history;
    int exit_code = 0;

    while (true) {
        std::string prompt = buffer.empty() ? ">>> " : "... ";
        char* raw = linenoise(prompt.c_str());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        if (buffer.empty() && (line == "exit" || line == "quit")) break;

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        // a blank line while continuing forces evaluation so the user can
        // always get out of a broken multi-line input
        bool force = !buffer.empty() && is_blank(line);

        buffer += line;
        buffer.push_back('\n');

        if (is_blank(buffer)) {
            buffer.clear();
            continue;
        }

        if (!force && unclosed_brackets_depth(buffer) > 0) continue;

        RunResult result = runner.run_repl_unit(buffer);
        if (!force && is_likely_incomplete_input(result)) continue;

        if (result.status == RunStatus::EXIT) {
            exit_code = result.exit_code();
            break;
        }

        if (!result.ok()) {
            std::cout.flush();
            print_diagnostics(result.diagnostics, std::cerr, color);
        }
        buffer.clear();
    }

    linenoiseHistorySave(history_path.string().c_str());
    return exit_code;
}
