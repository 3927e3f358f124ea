#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Runtime failure raised by the evaluator. The first one thrown aborts the
// run; the Runner turns it into a RUNTIME_ERROR diagnostic.
class QuillError : public std::runtime_error {
   public:
    QuillError(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(type, message, loc)),
                                    type_(type),
                                    message_(message),
                                    loc_(loc) {}

    const std::string& type() const { return type_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }

    static std::string format_message(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) {
        return type + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }

   private:
    std::string type_;
    std::string message_;
    TokenLocation loc_;
};

// One collected error from the scanner, parser or resolver (or the single
// runtime error of a run, once the Runner has caught it).
struct Diagnostic {
    std::string type;  // "SyntaxError", "ResolutionError", "TypeError", ...
    std::string message;
    TokenLocation loc;

    Diagnostic() = default;
    Diagnostic(const std::string& t, const std::string& m, const TokenLocation& l)
        : type(t), message(m), loc(l) {}

    std::string to_string() const {
        return QuillError::format_message(type, message, loc);
    }
};

// Raised by exit() / quit(). Not an error: it unwinds the run and the
// Runner hands the code to whoever drives the session.
class ExitRequest : public std::exception {
   public:
    explicit ExitRequest(int code) : code_(code) {}

    int code() const { return code_; }
    const char* what() const noexcept override { return "exit requested"; }

   private:
    int code_;
};
