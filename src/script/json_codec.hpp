#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "script/value.hpp"

namespace codeact::script {

// Converts a guest value to JSON. Values without a JSON form raise
// TypeError, or are rendered with repr() when `repr_fallback` is set.
nlohmann::ordered_json ToJson(const Value& value, bool repr_fallback, Runtime* rt = nullptr);
Value FromJson(const nlohmann::ordered_json& json);

// Serializes with the guest's default separators (", " and ": ") when
// `indent` is negative, pretty-printed otherwise.
std::string DumpJson(const nlohmann::ordered_json& json, int indent);

}  // namespace codeact::script
