#pragma once
#include <memory>
#include <string>
#include <unordered_map>

#include "evaluator.hpp"

// A minimal runtime representation for classes
struct ClassValue {
    std::string name;
    ClassPtr super;  // parent class (if any)
    // methods declared directly in this class; inherited ones are found
    // through super
    std::unordered_map<std::string, FunctionPtr> methods;
    // token for diagnostics
    Token token;

    // own methods shadow inherited ones
    FunctionPtr find_method(const std::string& method_name) const {
        auto it = methods.find(method_name);
        if (it != methods.end()) return it->second;
        if (super) return super->find_method(method_name);
        return nullptr;
    }
};

struct InstanceValue {
    ClassPtr klass;
    // fields shadow methods of the same name
    std::unordered_map<std::string, Value> fields;

    explicit InstanceValue(const ClassPtr& k) : klass(k) {}
};

// A method read off an instance: calling it runs the method with 'this'
// bound to receiver.
struct BoundMethodValue {
    InstancePtr receiver;
    FunctionPtr method;

    BoundMethodValue(const InstancePtr& r, const FunctionPtr& m) : receiver(r), method(m) {}
};
