//src/evaluator/Environment.cpp
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

void Environment::define(const std::string& name, const Value& value) {
   // Redefinition in the same environment just replaces the value
   // (allowed at global scope, rejected earlier by the resolver elsewhere).
   values[name] = value;
}

Value Environment::get(const Token& name) const {
   auto it = values.find(name.value);
   if (it != values.end()) return it->second;
   if (parent) return parent->get(name);
   throw QuillError("ReferenceError", "Undefined variable '" + name.value + "'.", name.loc);
}

void Environment::assign(const Token& name, const Value& value) {
   auto it = values.find(name.value);
   if (it != values.end()) {
      it->second = value;
      return;
   }
   if (parent) {
      parent->assign(name, value);
      return;
   }
   throw QuillError("ReferenceError", "Undefined variable '" + name.value + "'.", name.loc);
}

Environment* Environment::ancestor(int depth) {
   Environment* env = this;
   for (int i = 0; i < depth && env; ++i) {
      env = env->parent.get();
   }
   return env;
}

// The resolver guarantees the binding is there; a miss means the depth table
// and the environment chain disagree.
Value Environment::get_at(int depth, const Token& name) {
   Environment* env = ancestor(depth);
   if (env) {
      auto it = env->values.find(name.value);
      if (it != env->values.end()) return it->second;
   }
   throw QuillError("InternalError",
       "Resolved variable '" + name.value + "' not found at depth " + std::to_string(depth) + ".",
       name.loc);
}

void Environment::assign_at(int depth, const Token& name, const Value& value) {
   Environment* env = ancestor(depth);
   if (env) {
      auto it = env->values.find(name.value);
      if (it != env->values.end()) {
         it->second = value;
         return;
      }
   }
   throw QuillError("InternalError",
       "Resolved variable '" + name.value + "' not found at depth " + std::to_string(depth) + ".",
       name.loc);
}
