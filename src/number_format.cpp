// src/number_format.cpp
#include "number_format.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

// Shortest "%.Ne" rendering that reads back as exactly num.
std::string shortest_scientific(double num) {
    char buf[40];
    for (int precision = 0; precision < 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision, num);
        if (std::strtod(buf, nullptr) == num) return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.16e", num);
    return buf;
}

}  // namespace

std::string number_to_string(double num) {
    if (std::isnan(num)) return "NaN";
    if (std::isinf(num)) return num > 0 ? "inf" : "-inf";
    if (num == 0) return std::signbit(num) ? "-0" : "0";

    // d.ddddde[+-]x  ->  significant digits and decimal exponent
    std::string sci = shortest_scientific(num);
    bool negative = sci[0] == '-';
    size_t e_pos = sci.find('e');
    std::string digits;
    for (size_t i = negative ? 1 : 0; i < e_pos; ++i) {
        if (sci[i] != '.') digits.push_back(sci[i]);
    }
    int exponent = std::atoi(sci.c_str() + e_pos + 1);

    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    // plain positional notation at any magnitude, never an exponent
    std::string out;
    int int_len = exponent + 1;
    if (int_len <= 0) {
        out = "0." + std::string(static_cast<size_t>(-int_len), '0') + digits;
    } else if (static_cast<size_t>(int_len) >= digits.size()) {
        out = digits + std::string(int_len - digits.size(), '0');
    } else {
        out = digits.substr(0, int_len) + "." + digits.substr(int_len);
    }
    return negative ? "-" + out : out;
}
