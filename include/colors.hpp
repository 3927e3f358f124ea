#pragma once
#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <string>  // for std::string

namespace Color {
// Diagnostics go to stderr, so that is the stream checked by default.
inline bool supports_color(int fd = STDERR_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";
const std::string green = "\033[32m";
const std::string yellow = "\033[33m";
const std::string cyan = "\033[36m";

const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";
const std::string bright_cyan = "\033[96m";
}  // namespace Color
