#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>

#include "script/value.hpp"

namespace codeact::script {

// Argument helpers for natively implemented functions. Each raises a guest
// TypeError on misuse.
void CheckArity(const CallArgs& args, const std::string& name, std::size_t min, std::size_t max);
void CheckKeywords(const CallArgs& args, const std::string& name, std::initializer_list<const char*> allowed);
// Positional argument `index`, or the keyword `keyword` when given. Null
// when neither was passed.
const Value* Argument(const CallArgs& args, std::size_t index, const char* keyword = nullptr);

std::int64_t IntArgument(const Value& value, const std::string& what);
double NumberArgument(const Value& value, const std::string& what);
const std::string& StrArgument(const Value& value, const std::string& what);

inline Value NativeFunction(std::string name, BuiltinFunction::Body body) {
    return Value(std::make_shared<BuiltinFunction>(std::move(name), std::move(body)));
}

}  // namespace codeact::script
