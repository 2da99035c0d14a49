#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "script/ast.hpp"
#include "script/value.hpp"

namespace codeact::script {

// Statement-level rules shared by both execution strategies.

using Bindings = std::vector<std::pair<std::string, Value>>;

// Names bound by an import statement. Every module goes through
// Runtime::ImportModule and therefore through the capability policy.
Bindings ImportBindings(Runtime& rt, const ImportStmt& stmt);
Bindings ImportBindings(Runtime& rt, const ImportFromStmt& stmt);

// The exception instance `raise value` throws. Classes are instantiated
// without arguments.
Value MakeRaisable(Runtime& rt, const Value& value);

// Guest class with at most one base. Built-in value types cannot be
// subclassed.
std::shared_ptr<ClassObject> NewUserClass(const std::string& name, const std::vector<Value>& bases);

// Maps call arguments onto `params`. `defaults` belong to the trailing
// parameters. Raises TypeError the way a guest call would.
std::vector<Value> BindArguments(const std::string& function, const std::vector<std::string>& params,
                                 const std::vector<Value>& defaults, CallArgs args);

// `left op= right`; lists are extended in place.
Value InPlaceOperation(BinaryOp op, const Value& left, const Value& right, Runtime& rt);

void DeleteAttribute(const Value& object, const std::string& name);

// True for decorators that synthesize members instead of wrapping.
bool IsNativeDecorator(const Value& decorator);

// One replacement field of an f-string.
std::string FormatField(Runtime& rt, const Value& value, char conversion, const std::string& spec);

// Raises AssertionError carrying `message` when given.
[[noreturn]] void RaiseAssertion(const Value* message);

}  // namespace codeact::script
