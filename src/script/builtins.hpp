#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "script/value.hpp"

namespace codeact::script {

// Process-wide, immutable table of built-in functions and classes.
class Builtins {
public:
    static const Builtins& Instance();

    const Value* Find(const std::string& name) const { return names_.Find(name); }
    // Built-in class by name, including ones not bound as builtins
    // (NoneType, function, module, ...). Null when unknown.
    std::shared_ptr<ClassObject> Class(const std::string& name) const;
    const Namespace& names() const { return names_; }

private:
    Builtins();

    void AddClass(const std::shared_ptr<ClassObject>& cls, bool bind = true);
    std::shared_ptr<ClassObject> AddExceptionClass(const std::string& name, const std::string& base);
    void AddFunction(const std::string& name, BuiltinFunction::Body body);

    Namespace names_;
    std::unordered_map<std::string, std::shared_ptr<ClassObject>> classes_;
};

// Instance of the named built-in exception class carrying `message`.
Value MakeException(const std::string& type_name, const std::string& message);
Value MakeException(const std::string& type_name, std::vector<Value> args);

}  // namespace codeact::script
