#pragma once
#include <string>

// Display form of a number: the shortest digits that read back as the same
// double, in positional notation (no exponent) and without a trailing ".0"
// for integral values. Non-finite values print as inf, -inf and NaN.
std::string number_to_string(double num);
