#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "script/ast.hpp"
#include "script/value.hpp"

namespace codeact::script {

bool Truthy(const Value& value);

// Class of any value, including the built-in classes of primitives.
std::shared_ptr<ClassObject> ClassOf(const Value& value);
std::string TypeName(const Value& value);
bool IsInstance(const Value& value, const ClassObject& cls);

// Guest-visible renderings. When `rt` is given, user-defined __repr__ and
// __str__ methods are honoured.
std::string Repr(const Value& value, Runtime* rt = nullptr);
std::string Str(const Value& value, Runtime* rt = nullptr);
std::string FormatFloat(double value);
std::string FormatWithSpec(const Value& value, const std::string& spec, Runtime* rt = nullptr);
// printf-style `format % args`.
std::string PercentFormat(const std::string& format, const Value& args);
// str.format() replacement fields.
std::string StrFormat(Runtime& rt, const std::string& format, const CallArgs& args);
// "Type: message" for a guest exception instance.
std::string DescribeException(const Value& exception);

bool Identical(const Value& a, const Value& b);
bool Equals(const Value& a, const Value& b, Runtime* rt = nullptr);
// Dictionary key equality; raises TypeError for unhashable keys.
bool KeyEquals(const Value& a, const Value& b);
void RequireHashable(const Value& key);

Value BinaryOperation(BinaryOp op, const Value& left, const Value& right);
Value UnaryOperation(UnaryOp op, const Value& operand);
bool Compare(CompareOp op, const Value& left, const Value& right, Runtime& rt);
bool LessThan(const Value& left, const Value& right, Runtime& rt);
bool Contains(const Value& container, const Value& item, Runtime& rt);

// Method of a built-in value type bound to `receiver`; None when the type
// has no such method.
Value BuiltinTypeMethod(const Value& receiver, const std::string& name);
Value GetAttribute(Runtime& rt, const Value& object, const std::string& name);
bool HasAttribute(Runtime& rt, const Value& object, const std::string& name);
void SetAttribute(Runtime& rt, const Value& object, const std::string& name, Value value);

Value GetItem(Runtime& rt, const Value& object, const Value& index);
void SetItem(Runtime& rt, const Value& object, const Value& index, Value value);
void DelItem(Runtime& rt, const Value& object, const Value& index);

// Calls `body` for every element; iteration stops when it returns false.
// Lists are walked by live index so appends during iteration are seen.
void ForEach(Runtime& rt, const Value& iterable, const std::function<bool(const Value&)>& body);
std::vector<Value> ToVector(Runtime& rt, const Value& iterable);
// Unpacks `value` into exactly `count` elements.
std::vector<Value> Unpack(Runtime& rt, const Value& value, std::size_t count);

Value CallValue(Runtime& rt, const Value& callee, CallArgs args);
Value CallValue(Runtime& rt, const Value& callee, std::vector<Value> positional);

// True when `exception` is an instance of `handler` (a class or a tuple of
// classes). Raises TypeError for anything else.
bool ExceptionMatches(const Value& exception, const Value& handler);

}  // namespace codeact::script
