// src/evaluator/EvaluatorHelper.cpp
#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "number_format.hpp"

// ----------------- Evaluator helpers -----------------

std::string Evaluator::type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "nil";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (std::holds_alternative<FunctionPtr>(v)) return "function";
    if (std::holds_alternative<BoundMethodPtr>(v)) return "function";
    if (std::holds_alternative<ClassPtr>(v)) return "class";
    return "instance";
}

// nil and false are falsy; 0 and "" are not
bool Evaluator::is_truthy(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return false;
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    return true;
}

// Different kinds are never equal. Numbers compare with IEEE ==, so NaN is
// not equal to itself; reference kinds compare by identity.
bool Evaluator::is_equal(const Value& a, const Value& b) {
    return a == b;
}

double Evaluator::expect_number(const Value& v, const Token& op) {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    throw QuillError("TypeError", "Operand must be a number.", op.loc);
}

std::string Evaluator::value_to_string(const Value& v) const {
    if (std::holds_alternative<std::monostate>(v)) return "nil";
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<double>(v)) return number_to_string(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<FunctionPtr>(v)) {
        const auto& fn = std::get<FunctionPtr>(v);
        return (fn->is_native ? "<native fn " : "<fn ") + fn->name + ">";
    }
    if (std::holds_alternative<BoundMethodPtr>(v)) {
        return "<fn " + std::get<BoundMethodPtr>(v)->method->name + ">";
    }
    if (std::holds_alternative<ClassPtr>(v)) {
        return "<class " + std::get<ClassPtr>(v)->name + ">";
    }
    return "<instance " + std::get<InstancePtr>(v)->klass->name + ">";
}
