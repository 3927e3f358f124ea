// src/evaluator/FunctionCall.cpp
#include <string>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

namespace {

// Counts nested calls for the lifetime of one call, unwinding included.
class CallDepthGuard {
   public:
    CallDepthGuard(int& depth, const Token& callToken) : depth_(depth) {
        if (depth_ >= Evaluator::MAX_CALL_DEPTH) {
            throw QuillError("RangeError", "Maximum call depth exceeded.", callToken.loc);
        }
        ++depth_;
    }
    ~CallDepthGuard() { --depth_; }

    CallDepthGuard(const CallDepthGuard&) = delete;
    CallDepthGuard& operator=(const CallDepthGuard&) = delete;

   private:
    int& depth_;
};

}  // namespace

Value Evaluator::call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken) {
    if (std::holds_alternative<FunctionPtr>(callee)) {
        return call_function(std::get<FunctionPtr>(callee), args, callToken);
    }
    if (std::holds_alternative<BoundMethodPtr>(callee)) {
        const auto& bound = std::get<BoundMethodPtr>(callee);
        return call_function_with_receiver(bound->method, bound->receiver, args, callToken);
    }
    if (std::holds_alternative<ClassPtr>(callee)) {
        return instantiate(std::get<ClassPtr>(callee), args, callToken);
    }
    throw QuillError("TypeError", "Can only call functions and classes.", callToken.loc);
}

void Evaluator::check_arity(size_t expected, size_t got, const Token& callToken) {
    if (expected != got) {
        throw QuillError("TypeError",
            "Expected " + std::to_string(expected) + " arguments but got " + std::to_string(got) + ".",
            callToken.loc);
    }
}

Value Evaluator::call_function(const FunctionPtr& fn, const std::vector<Value>& args, const Token& callToken) {
    check_arity(fn->arity(), args.size(), callToken);
    CallDepthGuard guard(call_depth, callToken);

    if (fn->is_native) {
        return fn->native_impl(args, fn->closure, callToken);
    }
    return run_function_body(fn, fn->closure, args);
}

// A bound call gets one extra environment holding 'this' between the
// method's closure and its parameters.
Value Evaluator::call_function_with_receiver(const FunctionPtr& fn, const InstancePtr& receiver, const std::vector<Value>& args, const Token& callToken) {
    check_arity(fn->arity(), args.size(), callToken);
    CallDepthGuard guard(call_depth, callToken);

    auto this_env = std::make_shared<Environment>(fn->closure);
    this_env->define("this", receiver);

    Value result = run_function_body(fn, this_env, args);
    // init always hands back the instance, whatever its body returned
    if (fn->is_initializer) return receiver;
    return result;
}

Value Evaluator::run_function_body(const FunctionPtr& fn, const EnvPtr& closure, const std::vector<Value>& args) {
    auto local = std::make_shared<Environment>(closure);
    const auto& params = fn->declaration->params;
    for (size_t i = 0; i < params.size(); ++i) {
        local->define(params[i].value, args[i]);
    }

    ExecResult r = execute_block(fn->declaration->body, local);
    if (r.kind == ExecResult::Kind::RETURN) return r.value;
    return std::monostate{};
}

Value Evaluator::instantiate(const ClassPtr& klass, const std::vector<Value>& args, const Token& callToken) {
    auto instance = std::make_shared<InstanceValue>(klass);

    FunctionPtr init = klass->find_method("init");
    if (init) {
        call_function_with_receiver(init, instance, args, callToken);
    } else {
        check_arity(0, args.size(), callToken);
    }
    return instance;
}
