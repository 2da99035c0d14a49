#include "script/native.hpp"

#include <algorithm>
#include <cstring>

#include "script/errors.hpp"
#include "script/operations.hpp"

namespace codeact::script {

void CheckArity(const CallArgs& args, const std::string& name, std::size_t min, std::size_t max) {
    const std::size_t given = args.positional.size();
    if (given >= min && given <= max) {
        return;
    }
    if (min == max) {
        ThrowError("TypeError", name + "() takes exactly " + std::to_string(min) + " argument" +
                                    (min == 1 ? "" : "s") + " (" + std::to_string(given) + " given)");
    }
    if (given < min) {
        ThrowError("TypeError", name + " expected at least " + std::to_string(min) + " argument" +
                                    (min == 1 ? "" : "s") + ", got " + std::to_string(given));
    }
    ThrowError("TypeError", name + " expected at most " + std::to_string(max) + " argument" +
                                (max == 1 ? "" : "s") + ", got " + std::to_string(given));
}

void CheckKeywords(const CallArgs& args, const std::string& name, std::initializer_list<const char*> allowed) {
    for (const auto& entry : args.keywords) {
        const bool known = std::any_of(allowed.begin(), allowed.end(), [&](const char* candidate) {
            return entry.first == candidate;
        });
        if (!known) {
            ThrowError("TypeError", name + "() got an unexpected keyword argument '" + entry.first + "'");
        }
    }
}

const Value* Argument(const CallArgs& args, std::size_t index, const char* keyword) {
    if (index < args.positional.size()) {
        return &args.positional[index];
    }
    if (keyword != nullptr) {
        return args.Keyword(keyword);
    }
    return nullptr;
}

std::int64_t IntArgument(const Value& value, const std::string& what) {
    if (value.IsInt() || value.IsBool()) {
        return value.AsInt();
    }
    ThrowError("TypeError", what + " must be an integer, not '" + TypeName(value) + "'");
}

double NumberArgument(const Value& value, const std::string& what) {
    if (value.IsNumber()) {
        return value.AsFloat();
    }
    ThrowError("TypeError", what + " must be a real number, not '" + TypeName(value) + "'");
}

const std::string& StrArgument(const Value& value, const std::string& what) {
    if (value.IsStr()) {
        return value.AsStr();
    }
    ThrowError("TypeError", what + " must be str, not '" + TypeName(value) + "'");
}

}  // namespace codeact::script
