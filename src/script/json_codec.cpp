#include "script/json_codec.hpp"

#include <cmath>
#include <limits>

#include "script/errors.hpp"
#include "script/operations.hpp"

namespace codeact::script {
namespace {

std::string JsonKey(const Value& key) {
    switch (key.kind()) {
        case Value::Kind::kStr: return key.AsStr();
        case Value::Kind::kInt: return std::to_string(key.AsInt());
        case Value::Kind::kFloat: return FormatFloat(key.AsFloat());
        case Value::Kind::kBool: return key.AsBool() ? "true" : "false";
        case Value::Kind::kNone: return "null";
        case Value::Kind::kObject: break;
    }
    ThrowError("TypeError", "keys must be str, int, float, bool or None, not " + TypeName(key));
}

std::string DumpCompact(const nlohmann::ordered_json& json) {
    if (json.is_object()) {
        std::string out = "{";
        bool first = true;
        for (auto it = json.begin(); it != json.end(); ++it) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += nlohmann::ordered_json(it.key()).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace) + ": " + DumpCompact(it.value());
        }
        return out + "}";
    }
    if (json.is_array()) {
        std::string out = "[";
        bool first = true;
        for (const auto& item : json) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += DumpCompact(item);
        }
        return out + "]";
    }
    if (json.is_number_float()) {
        const double number = json.get<double>();
        if (std::isnan(number)) {
            return "NaN";
        }
        if (std::isinf(number)) {
            return number < 0 ? "-Infinity" : "Infinity";
        }
        return FormatFloat(number);
    }
    return json.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

}  // namespace

nlohmann::ordered_json ToJson(const Value& value, bool repr_fallback, Runtime* rt) {
    switch (value.kind()) {
        case Value::Kind::kNone: return nullptr;
        case Value::Kind::kBool: return value.AsBool();
        case Value::Kind::kInt: return value.AsInt();
        case Value::Kind::kFloat: return value.AsFloat();
        case Value::Kind::kStr: return value.AsStr();
        case Value::Kind::kObject: break;
    }
    if (auto list = value.As<ListObject>()) {
        auto array = nlohmann::ordered_json::array();
        for (const auto& item : list->items) {
            array.push_back(ToJson(item, repr_fallback, rt));
        }
        return array;
    }
    if (auto tuple = value.As<TupleObject>()) {
        auto array = nlohmann::ordered_json::array();
        for (const auto& item : tuple->items) {
            array.push_back(ToJson(item, repr_fallback, rt));
        }
        return array;
    }
    if (auto dict = value.As<DictObject>()) {
        auto object = nlohmann::ordered_json::object();
        for (const auto& entry : dict->entries) {
            if (repr_fallback && entry.first.IsObject()) {
                object[Repr(entry.first, rt)] = ToJson(entry.second, repr_fallback, rt);
                continue;
            }
            object[JsonKey(entry.first)] = ToJson(entry.second, repr_fallback, rt);
        }
        return object;
    }
    if (repr_fallback) {
        return Repr(value, rt);
    }
    ThrowError("TypeError", "Object of type " + TypeName(value) + " is not JSON serializable");
}

Value FromJson(const nlohmann::ordered_json& json) {
    switch (json.type()) {
        case nlohmann::ordered_json::value_t::null:
            return Value();
        case nlohmann::ordered_json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
            return Value(json.get<std::int64_t>());
        case nlohmann::ordered_json::value_t::number_unsigned: {
            const auto number = json.get<std::uint64_t>();
            if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(static_cast<double>(number));
            }
            return Value(static_cast<std::int64_t>(number));
        }
        case nlohmann::ordered_json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            std::vector<Value> items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(FromJson(item));
            }
            return MakeList(std::move(items));
        }
        case nlohmann::ordered_json::value_t::object: {
            auto dict = std::make_shared<DictObject>();
            for (auto it = json.begin(); it != json.end(); ++it) {
                dict->Set(Value(it.key()), FromJson(it.value()));
            }
            return Value(dict);
        }
        default:
            break;
    }
    ThrowError("ValueError", "unsupported JSON value");
}

std::string DumpJson(const nlohmann::ordered_json& json, int indent) {
    if (indent < 0) {
        return DumpCompact(json);
    }
    return json.dump(indent, ' ', true, nlohmann::json::error_handler_t::replace);
}

}  // namespace codeact::script
