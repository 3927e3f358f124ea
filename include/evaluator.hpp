#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "QuillError.hpp"
#include "ast.hpp"
#include "token.hpp"

class Environment;
using EnvPtr = std::shared_ptr<Environment>;

struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ClassValue;
using ClassPtr = std::shared_ptr<ClassValue>;

struct InstanceValue;
using InstancePtr = std::shared_ptr<InstanceValue>;

struct BoundMethodValue;
using BoundMethodPtr = std::shared_ptr<BoundMethodValue>;

// Value: std::monostate is nil. Functions, classes, instances and bound
// methods have reference semantics through the shared pointers.
using Value = std::variant<
    std::monostate,
    bool,
    double,
    std::string,
    FunctionPtr,
    ClassPtr,
    InstancePtr,
    BoundMethodPtr>;

using NativeFn = std::function<Value(const std::vector<Value>&, EnvPtr, const Token&)>;

struct FunctionValue {
    std::string name;
    FunctionDeclPtr declaration;  // null for natives
    EnvPtr closure;  // null for natives
    Token token;
    bool is_initializer = false;

    bool is_native = false;
    size_t native_arity = 0;
    NativeFn native_impl;

    // shown by help(); set for builtins only
    std::string doc;

    // user-defined function or method
    FunctionValue(
        const FunctionDeclPtr& decl,
        const EnvPtr& env,
        bool initializer = false) : name(decl->name.value),
                                    declaration(decl),
                                    closure(env),
                                    token(decl->name),
                                    is_initializer(initializer) {}

    // native builtin
    FunctionValue(
        const std::string& nm,
        size_t arity,
        NativeFn impl,
        const std::string& docstring = "") : name(nm),
                                             is_native(true),
                                             native_arity(arity),
                                             native_impl(std::move(impl)),
                                             doc(docstring) {}

    size_t arity() const {
        return is_native ? native_arity : declaration->params.size();
    }
};

class Environment {
   public:
    Environment(EnvPtr parent = nullptr) : parent(parent) {}

    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // creates or overwrites the binding in this environment only
    void define(const std::string& name, const Value& value);

    // walks the chain outwards; throws ReferenceError if nowhere
    Value get(const Token& name) const;
    void assign(const Token& name, const Value& value);

    // exact lookups at a distance computed by the resolver
    Value get_at(int depth, const Token& name);
    void assign_at(int depth, const Token& name, const Value& value);

    Environment* ancestor(int depth);
};

// Outcome of executing one statement. Loops consume BREAK and CONTINUE,
// calls consume RETURN; anything else bubbles up unchanged.
struct ExecResult {
    enum class Kind {
        NORMAL,
        BREAK,
        CONTINUE,
        RETURN
    };

    Kind kind = Kind::NORMAL;
    Value value;  // set for RETURN

    static ExecResult normal() { return ExecResult{}; }
    static ExecResult make(Kind k) {
        ExecResult r;
        r.kind = k;
        return r;
    }
    static ExecResult make_return(const Value& v) {
        ExecResult r;
        r.kind = Kind::RETURN;
        r.value = v;
        return r;
    }
};

class Evaluator {
   public:
    // 'print' and the printing builtins write to out
    explicit Evaluator(std::ostream& out = std::cout);
    ~Evaluator();

    // Executes the program's statements in the global environment. The first
    // runtime error aborts execution and propagates as a QuillError.
    void interpret(const Program& program);

    // For REPL print on the go.
    Value evaluate_expression(const Expr& expr);

    std::string value_to_string(const Value& v) const;
    static std::string type_name(const Value& v);
    static bool is_truthy(const Value& v);
    static bool is_equal(const Value& a, const Value& b);

    EnvPtr globals() const { return global_env; }

    // Filled by the Resolver before each interpret() call. Entries from
    // earlier REPL inputs stay valid because node ids are never reused.
    ScopeTable& scope_table() { return locals; }

    std::ostream& output() { return out; }

    static constexpr int MAX_CALL_DEPTH = 3000;

   private:
    std::ostream& out;
    EnvPtr global_env;
    ScopeTable locals;
    int call_depth = 0;

    // expressions
    Value evaluate(const Expr& expr, const EnvPtr& env);
    Value eval_unary(const UnaryExpr& node, const EnvPtr& env);
    Value eval_binary(const BinaryExpr& node, const EnvPtr& env);
    Value eval_logical(const LogicalExpr& node, const EnvPtr& env);
    Value eval_call(const CallExpr& node, const EnvPtr& env);
    Value eval_get(const GetExpr& node, const EnvPtr& env);
    Value eval_set(const SetExpr& node, const EnvPtr& env);
    Value eval_super(const Expr& expr, const SuperExpr& node, const EnvPtr& env);

    Value lookup_variable(const Expr& expr, const Token& name, const EnvPtr& env);
    void assign_variable(const Expr& expr, const Token& name, const Value& value, const EnvPtr& env);

    // statements
    ExecResult execute(const Stmt& stmt, const EnvPtr& env);
    ExecResult execute_block(const std::vector<StmtPtr>& statements, const EnvPtr& env);
    ExecResult execute_while(const WhileStmt& node, const EnvPtr& env);
    void execute_class(const ClassStmt& node, const EnvPtr& env);

    // calls
    Value call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken);
    Value call_function(const FunctionPtr& fn, const std::vector<Value>& args, const Token& callToken);
    Value call_function_with_receiver(const FunctionPtr& fn, const InstancePtr& receiver, const std::vector<Value>& args, const Token& callToken);
    Value run_function_body(const FunctionPtr& fn, const EnvPtr& closure, const std::vector<Value>& args);
    Value instantiate(const ClassPtr& klass, const std::vector<Value>& args, const Token& callToken);
    void check_arity(size_t expected, size_t got, const Token& callToken);

    // helpers
    double expect_number(const Value& v, const Token& op);
};
