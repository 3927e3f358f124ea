#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <random>
#include <string>
#include <vector>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "globals.hpp"

namespace {

constexpr double MAX_SAFE_INTEGER = 9007199254740992.0;  // 2^53

std::mt19937& rng() {
    static std::mt19937 engine{std::random_device{}()};
    return engine;
}

bool is_integer(const Value& v) {
    if (!std::holds_alternative<double>(v)) return false;
    double d = std::get<double>(v);
    return std::isfinite(d) && std::floor(d) == d;
}

Value builtin_clock(const std::vector<Value>&, EnvPtr, const Token&) {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

Value builtin_type(const std::vector<Value>& args, EnvPtr, const Token&) {
    return Evaluator::type_name(args[0]);
}

Value builtin_rand(const std::vector<Value>&, EnvPtr, const Token&) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng());
}

Value builtin_randint(const std::vector<Value>& args, EnvPtr, const Token& tok) {
    if (!is_integer(args[0]) || !is_integer(args[1])) {
        throw QuillError("TypeError", "randint() expects two integer arguments.", tok.loc);
    }
    double low_d = std::get<double>(args[0]);
    double high_d = std::get<double>(args[1]);
    // beyond 2^53 doubles stop being consecutive integers
    if (std::fabs(low_d) > MAX_SAFE_INTEGER || std::fabs(high_d) > MAX_SAFE_INTEGER) {
        throw QuillError("RangeError", "randint() bounds must be between -2^53 and 2^53.", tok.loc);
    }
    long long low = static_cast<long long>(low_d);
    long long high = static_cast<long long>(high_d);
    if (low > high) {
        throw QuillError("RangeError", "randint() lower bound is greater than upper bound.", tok.loc);
    }
    std::uniform_int_distribution<long long> dist(low, high);
    return static_cast<double>(dist(rng()));
}

Value builtin_round(const std::vector<Value>& args, EnvPtr, const Token& tok) {
    if (!std::holds_alternative<double>(args[0])) {
        throw QuillError("TypeError", "round() expects a number and a precision.", tok.loc);
    }
    if (!is_integer(args[1]) || std::get<double>(args[1]) < 0) {
        throw QuillError("TypeError", "round() precision must be a non-negative integer.", tok.loc);
    }
    double value = std::get<double>(args[0]);
    double scale = std::pow(10.0, std::get<double>(args[1]));
    return std::round(value * scale) / scale;
}

Value builtin_exit(const std::vector<Value>& args, EnvPtr, const Token& tok) {
    if (!is_integer(args[0])) {
        throw QuillError("TypeError", "exit() expects an integer exit code.", tok.loc);
    }
    double code = std::get<double>(args[0]);
    if (code < INT_MIN || code > INT_MAX) {
        throw QuillError("RangeError", "exit() code is out of range.", tok.loc);
    }
    throw ExitRequest(static_cast<int>(code));
}

Value builtin_quit(const std::vector<Value>&, EnvPtr, const Token&) {
    throw ExitRequest(0);
}

}  // namespace

void init_globals(EnvPtr env, Evaluator* evaluator) {
    if (!env) return;

    auto add_fn = [&](const std::string& name, size_t arity, NativeFn impl, const std::string& doc) {
        env->define(name, std::make_shared<FunctionValue>(name, arity, std::move(impl), doc));
    };

    add_fn("clock", 0, builtin_clock, "Returns the number of seconds since the Unix epoch.");
    add_fn("type", 1, builtin_type, "Returns the name of the type of the given value.");
    add_fn("rand", 0, builtin_rand, "Returns a number between 0 and 1.");
    add_fn("randint", 2, builtin_randint, "Returns an integer between the two provided bounds, inclusive.");
    add_fn("round", 2, builtin_round, "Rounds a number to a given precision in decimal digits.");
    add_fn("exit", 1, builtin_exit, "Stops the program with the given exit code.");
    add_fn("quit", 0, builtin_quit, "Stops the program with exit code 0.");

    add_fn("help", 1, [evaluator](const std::vector<Value>& args, EnvPtr, const Token&) -> Value {
        std::ostream& out = evaluator->output();
        const Value& v = args[0];

        FunctionPtr fn;
        if (std::holds_alternative<FunctionPtr>(v)) fn = std::get<FunctionPtr>(v);
        if (std::holds_alternative<BoundMethodPtr>(v)) fn = std::get<BoundMethodPtr>(v)->method;

        if (fn && !fn->doc.empty()) {
            out << fn->name << "\n\t" << fn->doc << std::endl;
        } else {
            out << "No documentation available." << std::endl;
        }
        return std::monostate{};
    },
        "Prints the documentation of the given function.");

    add_fn("dir", 0, [evaluator](const std::vector<Value>&, EnvPtr, const Token&) -> Value {
        EnvPtr globals = evaluator->globals();
        std::vector<std::string> names;
        names.reserve(globals->values.size());
        for (const auto& kv : globals->values) names.push_back(kv.first);
        std::sort(names.begin(), names.end());

        std::ostream& out = evaluator->output();
        for (const auto& name : names) out << name << "\n";
        out.flush();
        return std::monostate{};
    },
        "Prints all the names defined in the global scope.");
}
