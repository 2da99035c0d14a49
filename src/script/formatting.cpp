#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/operations.hpp"
#include "script/runtime.hpp"
#include "utils/common.hpp"

namespace codeact::script {
namespace {

// Guards against self-referencing containers.
thread_local int repr_depth = 0;

class ReprDepthGuard {
public:
    ReprDepthGuard() { ++repr_depth; }
    ~ReprDepthGuard() { --repr_depth; }
    bool exceeded() const { return repr_depth > 64; }
};

std::string QuoteString(const std::string& text) {
    const bool has_single = text.find('\'') != std::string::npos;
    const bool has_double = text.find('"') != std::string::npos;
    const char quote = has_single && !has_double ? '"' : '\'';
    std::string out(1, quote);
    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c == quote) {
                    out.push_back('\\');
                    out.push_back(c);
                } else if (byte < 0x20 || byte == 0x7f) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\x%02x", byte);
                    out += buffer;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back(quote);
    return out;
}

std::string JoinRepr(const std::vector<Value>& items, Runtime* rt) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += Repr(items[i], rt);
    }
    return out;
}

bool IsException(const InstanceObject& instance) {
    const auto base = Builtins::Instance().Class("BaseException");
    return base && instance.cls->IsSubclassOf(*base);
}

std::vector<Value> ExceptionArgs(const InstanceObject& instance) {
    if (const Value* args = instance.attrs.Find("args")) {
        if (auto tuple = args->As<TupleObject>()) {
            return tuple->items;
        }
    }
    return {};
}

std::string ExceptionMessage(const InstanceObject& instance) {
    const auto args = ExceptionArgs(instance);
    if (args.empty()) {
        return "";
    }
    if (args.size() == 1) {
        const auto key_error = Builtins::Instance().Class("KeyError");
        if (key_error && instance.cls->IsSubclassOf(*key_error)) {
            return Repr(args.front());
        }
        return Str(args.front());
    }
    return Repr(MakeTuple(args));
}

// Calls a user-defined dunder returning str, if the class defines one.
bool CallStringDunder(Runtime* rt, const std::shared_ptr<InstanceObject>& instance, const std::string& name,
                      std::string& out) {
    if (rt == nullptr) {
        return false;
    }
    const Value* method = instance->cls->Lookup(name);
    if (method == nullptr) {
        return false;
    }
    const Value result = CallValue(*rt, *method, std::vector<Value>{Value(instance)});
    if (!result.IsStr()) {
        ThrowError("TypeError", name + " returned non-string (type " + TypeName(result) + ")");
    }
    out = result.AsStr();
    return true;
}

struct FormatSpec {
    char fill = ' ';
    char align = 0;
    char sign = '-';
    bool zero = false;
    int width = 0;
    bool thousands = false;
    int precision = -1;
    char type = 0;
};

FormatSpec ParseSpec(const std::string& spec) {
    FormatSpec out;
    std::size_t i = 0;
    auto is_align = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
    if (spec.size() >= 2 && is_align(spec[1])) {
        out.fill = spec[0];
        out.align = spec[1];
        i = 2;
    } else if (!spec.empty() && is_align(spec[0])) {
        out.align = spec[0];
        i = 1;
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
        out.sign = spec[i++];
    }
    if (i < spec.size() && spec[i] == '0') {
        out.zero = true;
        ++i;
    }
    while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
        out.width = out.width * 10 + (spec[i++] - '0');
    }
    if (i < spec.size() && spec[i] == ',') {
        out.thousands = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '.') {
        ++i;
        if (i >= spec.size() || !std::isdigit(static_cast<unsigned char>(spec[i]))) {
            ThrowError("ValueError", "Format specifier missing precision");
        }
        out.precision = 0;
        while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
            out.precision = out.precision * 10 + (spec[i++] - '0');
        }
    }
    if (i < spec.size()) {
        out.type = spec[i++];
    }
    if (i != spec.size()) {
        ThrowError("ValueError", "Invalid format specifier '" + spec + "'");
    }
    return out;
}

std::string GroupThousands(const std::string& digits) {
    const std::size_t dot = digits.find_first_of(".eE");
    std::string integral = digits.substr(0, dot);
    const std::string rest = dot == std::string::npos ? "" : digits.substr(dot);
    std::string grouped;
    int count = 0;
    for (auto it = integral.rbegin(); it != integral.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }
    return grouped + rest;
}

std::string Pad(const std::string& sign, const std::string& body, const FormatSpec& spec, char default_align) {
    const std::size_t length = sign.size() + utils::CodePointCount(body);
    if (spec.width <= 0 || static_cast<std::size_t>(spec.width) <= length) {
        return sign + body;
    }
    const std::size_t padding = static_cast<std::size_t>(spec.width) - length;
    char align = spec.align != 0 ? spec.align : default_align;
    char fill = spec.fill;
    if (spec.zero && spec.align == 0) {
        align = '=';
        fill = '0';
    }
    switch (align) {
        case '<':
            return sign + body + std::string(padding, fill);
        case '^': {
            const std::size_t left = padding / 2;
            return std::string(left, fill) + sign + body + std::string(padding - left, fill);
        }
        case '=':
            return sign + std::string(padding, fill) + body;
        default:
            return std::string(padding, fill) + sign + body;
    }
}

std::string FormatNumber(const Value& value, const FormatSpec& spec) {
    char type = spec.type;
    const bool integral = value.IsInt() || value.IsBool();
    if (type == 0) {
        type = integral ? 'd' : (spec.precision >= 0 ? 'g' : 0);
    }
    std::string sign;
    std::string body;
    if (type == 'd' || type == 'x' || type == 'X' || type == 'o' || type == 'b') {
        if (!integral) {
            ThrowError("ValueError", std::string("Unknown format code '") + type + "' for object of type '" +
                                         TypeName(value) + "'");
        }
        const std::int64_t number = value.AsInt();
        const bool negative = number < 0;
        const std::uint64_t magnitude =
            negative ? static_cast<std::uint64_t>(-(number + 1)) + 1 : static_cast<std::uint64_t>(number);
        if (type == 'd') {
            body = std::to_string(magnitude);
        } else if (type == 'b') {
            std::uint64_t rest = magnitude;
            do {
                body.insert(body.begin(), static_cast<char>('0' + (rest & 1)));
                rest >>= 1;
            } while (rest != 0);
        } else {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), type == 'x' ? "%llx" : type == 'X' ? "%llX" : "%llo",
                          static_cast<unsigned long long>(magnitude));
            body = buffer;
        }
        if (negative) {
            sign = "-";
        } else if (spec.sign == '+') {
            sign = "+";
        } else if (spec.sign == ' ') {
            sign = " ";
        }
    } else {
        double number = value.AsFloat();
        if (type == 0) {
            body = FormatFloat(std::fabs(number));
        } else {
            const int precision = spec.precision >= 0 ? spec.precision : 6;
            const char* pattern = nullptr;
            bool percent = false;
            switch (type) {
                case 'f': pattern = "%.*f"; break;
                case 'F': pattern = "%.*F"; break;
                case 'e': pattern = "%.*e"; break;
                case 'E': pattern = "%.*E"; break;
                case 'g': pattern = "%.*g"; break;
                case 'G': pattern = "%.*G"; break;
                case '%':
                    pattern = "%.*f";
                    percent = true;
                    number *= 100.0;
                    break;
                default:
                    ThrowError("ValueError", std::string("Unknown format code '") + type + "' for object of type '" +
                                                 TypeName(value) + "'");
            }
            char buffer[512];
            std::snprintf(buffer, sizeof(buffer), pattern, precision, std::fabs(number));
            body = buffer;
            if (percent) {
                body += "%";
            }
        }
        if (std::signbit(number) && !std::isnan(number)) {
            sign = "-";
        } else if (spec.sign == '+') {
            sign = "+";
        } else if (spec.sign == ' ') {
            sign = " ";
        }
    }
    if (spec.thousands) {
        body = GroupThousands(body);
    }
    return Pad(sign, body, spec, '>');
}

}  // namespace

std::string FormatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    if (value == 0.0) {
        return std::signbit(value) ? "-0.0" : "0.0";
    }
    // Shortest scientific rendering that round-trips.
    char buffer[64];
    for (int precision = 0; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    std::string text = buffer;
    std::string sign;
    if (text[0] == '-') {
        sign = "-";
        text = text.substr(1);
    }
    const std::size_t e = text.find('e');
    const int exponent = std::atoi(text.c_str() + e + 1);
    std::string digits;
    for (std::size_t i = 0; i < e; ++i) {
        if (text[i] != '.') {
            digits.push_back(text[i]);
        }
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    if (exponent >= -4 && exponent < 16) {
        std::string out;
        if (exponent >= 0) {
            const std::size_t integral = static_cast<std::size_t>(exponent) + 1;
            if (digits.size() <= integral) {
                out = digits + std::string(integral - digits.size(), '0') + ".0";
            } else {
                out = digits.substr(0, integral) + "." + digits.substr(integral);
            }
        } else {
            out = "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
        }
        return sign + out;
    }
    std::string mantissa = digits.substr(0, 1);
    if (digits.size() > 1) {
        mantissa += "." + digits.substr(1);
    }
    char exponent_text[16];
    std::snprintf(exponent_text, sizeof(exponent_text), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    return sign + mantissa + exponent_text;
}

std::string Repr(const Value& value, Runtime* rt) {
    switch (value.kind()) {
        case Value::Kind::kNone:
            return "None";
        case Value::Kind::kBool:
            return value.AsBool() ? "True" : "False";
        case Value::Kind::kInt:
            return std::to_string(value.AsInt());
        case Value::Kind::kFloat:
            return FormatFloat(value.AsFloat());
        case Value::Kind::kStr:
            return QuoteString(value.AsStr());
        case Value::Kind::kObject:
            break;
    }

    ReprDepthGuard guard;
    if (guard.exceeded()) {
        return "...";
    }
    const ObjectPtr& object = value.AsObject();
    if (auto list = std::dynamic_pointer_cast<ListObject>(object)) {
        return "[" + JoinRepr(list->items, rt) + "]";
    }
    if (auto tuple = std::dynamic_pointer_cast<TupleObject>(object)) {
        return "(" + JoinRepr(tuple->items, rt) + (tuple->items.size() == 1 ? ",)" : ")");
    }
    if (auto dict = std::dynamic_pointer_cast<DictObject>(object)) {
        std::string out = "{";
        for (std::size_t i = 0; i < dict->entries.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += Repr(dict->entries[i].first, rt) + ": " + Repr(dict->entries[i].second, rt);
        }
        return out + "}";
    }
    if (auto range = std::dynamic_pointer_cast<RangeObject>(object)) {
        std::string out = "range(" + std::to_string(range->start) + ", " + std::to_string(range->stop);
        if (range->step != 1) {
            out += ", " + std::to_string(range->step);
        }
        return out + ")";
    }
    if (auto instance = std::dynamic_pointer_cast<InstanceObject>(object)) {
        std::string out;
        if (CallStringDunder(rt, instance, "__repr__", out)) {
            return out;
        }
        if (IsException(*instance)) {
            return instance->cls->name + "(" + JoinRepr(ExceptionArgs(*instance), rt) + ")";
        }
        return "<" + instance->cls->name + " object>";
    }
    if (auto cls = std::dynamic_pointer_cast<ClassObject>(object)) {
        return "<class '" + cls->name + "'>";
    }
    if (auto module = std::dynamic_pointer_cast<ModuleObject>(object)) {
        return "<module '" + module->name + "'>";
    }
    if (auto method = std::dynamic_pointer_cast<BoundMethod>(object)) {
        return "<bound method " + method->Name() + ">";
    }
    if (auto builtin = std::dynamic_pointer_cast<BuiltinFunction>(object)) {
        return "<built-in function " + builtin->Name() + ">";
    }
    if (auto function = std::dynamic_pointer_cast<FunctionObject>(object)) {
        return "<function " + function->Name() + ">";
    }
    return "<" + object->TypeName() + " object>";
}

std::string Str(const Value& value, Runtime* rt) {
    if (value.IsStr()) {
        return value.AsStr();
    }
    if (auto instance = value.As<InstanceObject>()) {
        std::string out;
        if (CallStringDunder(rt, instance, "__str__", out)) {
            return out;
        }
        if (IsException(*instance) && (rt == nullptr || instance->cls->Lookup("__repr__") == nullptr)) {
            return ExceptionMessage(*instance);
        }
    }
    return Repr(value, rt);
}

std::string DescribeException(const Value& exception) {
    auto instance = exception.As<InstanceObject>();
    if (!instance) {
        return Str(exception);
    }
    const std::string message = IsException(*instance) ? ExceptionMessage(*instance) : Str(exception);
    return message.empty() ? instance->cls->name : instance->cls->name + ": " + message;
}

std::string FormatWithSpec(const Value& value, const std::string& spec, Runtime* rt) {
    if (spec.empty()) {
        return Str(value, rt);
    }
    const FormatSpec parsed = ParseSpec(spec);
    if (value.IsNumber() && parsed.type != 's') {
        return FormatNumber(value, parsed);
    }
    if (parsed.type != 0 && parsed.type != 's') {
        ThrowError("ValueError", std::string("Unknown format code '") + parsed.type + "' for object of type '" +
                                     TypeName(value) + "'");
    }
    if (parsed.type == 's' && !value.IsStr()) {
        ThrowError("ValueError", "Unknown format code 's' for object of type '" + TypeName(value) + "'");
    }
    std::string text = Str(value, rt);
    if (parsed.precision >= 0 && text.size() > static_cast<std::size_t>(parsed.precision)) {
        text.resize(static_cast<std::size_t>(parsed.precision));
    }
    return Pad("", text, parsed, '<');
}

std::string PercentFormat(const std::string& format, const Value& args) {
    std::vector<Value> values;
    if (auto tuple = args.As<TupleObject>()) {
        values = tuple->items;
    } else {
        values.push_back(args);
    }
    std::size_t next = 0;
    std::string out;
    for (std::size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%') {
            out.push_back(format[i]);
            continue;
        }
        ++i;
        if (i >= format.size()) {
            ThrowError("ValueError", "incomplete format");
        }
        if (format[i] == '%') {
            out.push_back('%');
            continue;
        }
        std::string spec;
        char align = 0;
        while (i < format.size() && (format[i] == '-' || format[i] == '+' || format[i] == ' ' || format[i] == '0')) {
            if (format[i] == '-') {
                align = '<';
            } else if (format[i] == '0') {
                spec.push_back('0');
            } else {
                spec.insert(spec.begin(), format[i]);
            }
            ++i;
        }
        if (align != 0) {
            spec.insert(spec.begin(), align);
        }
        while (i < format.size() && (std::isdigit(static_cast<unsigned char>(format[i])) || format[i] == '.')) {
            spec.push_back(format[i++]);
        }
        if (i >= format.size()) {
            ThrowError("ValueError", "incomplete format");
        }
        const char conversion = format[i];
        if (next >= values.size()) {
            ThrowError("TypeError", "not enough arguments for format string");
        }
        const Value& value = values[next++];
        switch (conversion) {
            case 's':
                out += FormatWithSpec(Value(Str(value)), spec);
                break;
            case 'r':
                out += FormatWithSpec(Value(Repr(value)), spec);
                break;
            case 'd':
            case 'i': {
                if (!value.IsNumber()) {
                    ThrowError("TypeError", "%" + std::string(1, conversion) + " format: a real number is required, not " +
                                                TypeName(value));
                }
                if (value.IsFloat()) {
                    const double d = value.AsFloat();
                    if (std::isnan(d)) {
                        ThrowError("ValueError", "cannot convert float NaN to integer");
                    }
                    if (std::isinf(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
                        ThrowError("OverflowError", "float too large to format as %" + std::string(1, conversion));
                    }
                }
                const std::int64_t integral =
                    value.IsFloat() ? static_cast<std::int64_t>(value.AsFloat()) : value.AsInt();
                out += FormatWithSpec(Value(integral), spec + "d");
                break;
            }
            case 'f':
            case 'F':
            case 'e':
            case 'E':
            case 'g':
            case 'G':
                if (!value.IsNumber()) {
                    ThrowError("TypeError", "must be real number, not " + TypeName(value));
                }
                out += FormatWithSpec(Value(value.AsFloat()), spec + conversion);
                break;
            case 'x':
            case 'X':
            case 'o':
                if (!value.IsInt() && !value.IsBool()) {
                    ThrowError("TypeError", "%" + std::string(1, conversion) + " format: an integer is required, not " +
                                                TypeName(value));
                }
                out += FormatWithSpec(Value(value.AsInt()), spec + conversion);
                break;
            default:
                ThrowError("ValueError", std::string("unsupported format character '") + conversion + "'");
        }
    }
    if (next < values.size()) {
        ThrowError("TypeError", "not all arguments converted during string formatting");
    }
    return out;
}

std::string StrFormat(Runtime& rt, const std::string& format, const CallArgs& args) {
    std::string out;
    std::size_t auto_index = 0;
    for (std::size_t i = 0; i < format.size(); ++i) {
        const char c = format[i];
        if (c == '}') {
            if (i + 1 < format.size() && format[i + 1] == '}') {
                out.push_back('}');
                ++i;
                continue;
            }
            ThrowError("ValueError", "Single '}' encountered in format string");
        }
        if (c != '{') {
            out.push_back(c);
            continue;
        }
        if (i + 1 < format.size() && format[i + 1] == '{') {
            out.push_back('{');
            ++i;
            continue;
        }
        const std::size_t close = format.find('}', i);
        if (close == std::string::npos) {
            ThrowError("ValueError", "Single '{' encountered in format string");
        }
        std::string field = format.substr(i + 1, close - i - 1);
        std::string spec;
        char conversion = 0;
        const std::size_t colon = field.find(':');
        if (colon != std::string::npos) {
            spec = field.substr(colon + 1);
            field = field.substr(0, colon);
        }
        const std::size_t bang = field.find('!');
        if (bang != std::string::npos) {
            if (bang + 1 < field.size()) {
                conversion = field[bang + 1];
            }
            field = field.substr(0, bang);
        }

        Value value;
        if (field.empty() || std::isdigit(static_cast<unsigned char>(field[0]))) {
            const std::size_t index = field.empty() ? auto_index++ : std::stoul(field);
            if (index >= args.positional.size()) {
                ThrowError("IndexError", "Replacement index " + std::to_string(index) +
                                             " out of range for positional args tuple");
            }
            value = args.positional[index];
        } else {
            const Value* keyword = args.Keyword(field);
            if (keyword == nullptr) {
                throw ScriptException(MakeException("KeyError", std::vector<Value>{Value(field)}));
            }
            value = *keyword;
        }
        if (conversion == 'r') {
            value = Value(Repr(value, &rt));
        } else if (conversion == 's') {
            value = Value(Str(value, &rt));
        }
        out += FormatWithSpec(value, spec, &rt);
        i = close;
    }
    return out;
}

}  // namespace codeact::script
