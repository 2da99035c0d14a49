#include "script/builtins.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "script/errors.hpp"
#include "script/json_codec.hpp"
#include "script/native.hpp"
#include "script/operations.hpp"
#include "script/runtime.hpp"
#include "utils/common.hpp"

namespace codeact::script {
namespace {

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::int64_t FloatToInt(double value) {
    if (std::isnan(value)) {
        ThrowError("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(value)) {
        ThrowError("OverflowError", "cannot convert float infinity to integer");
    }
    const double truncated = std::trunc(value);
    if (truncated >= 9223372036854775808.0 || truncated < -9223372036854775808.0) {
        ThrowError("OverflowError", "int too large to convert");
    }
    return static_cast<std::int64_t>(truncated);
}

std::int64_t ParseInt(const std::string& text, int base) {
    const std::string trimmed = utils::Trim(text);
    std::string digits;
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        if (trimmed[i] == '_' && i > 0 && i + 1 < trimmed.size()) {
            continue;
        }
        digits.push_back(trimmed[i]);
    }
    auto invalid = [&]() {
        ThrowError("ValueError",
                   "invalid literal for int() with base " + std::to_string(base) + ": " + Repr(Value(text)));
    };
    if (digits.empty()) {
        invalid();
    }
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(digits.c_str(), &end, base);
    if (end == digits.c_str() || *end != '\0' || std::isspace(static_cast<unsigned char>(digits[0]))) {
        invalid();
    }
    if (errno == ERANGE) {
        ThrowError("OverflowError", "int too large to convert");
    }
    return parsed;
}

double ParseFloat(const std::string& text) {
    const std::string trimmed = utils::Trim(text);
    const std::string lowered = Lower(trimmed);
    if (lowered == "inf" || lowered == "+inf" || lowered == "infinity" || lowered == "+infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (lowered == "-inf" || lowered == "-infinity") {
        return -std::numeric_limits<double>::infinity();
    }
    if (lowered == "nan" || lowered == "+nan" || lowered == "-nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    char* end = nullptr;
    const double parsed = trimmed.empty() ? 0.0 : std::strtod(trimmed.c_str(), &end);
    if (trimmed.empty() || end == trimmed.c_str() || *end != '\0' || lowered.find('x') != std::string::npos) {
        ThrowError("ValueError", "could not convert string to float: " + Repr(Value(text)));
    }
    return parsed;
}

std::string EncodeUtf8(std::int64_t code) {
    if (code < 0 || code > 0x10FFFF) {
        ThrowError("ValueError", "chr() arg not in range(0x110000)");
    }
    std::string out;
    utils::AppendUtf8(out, static_cast<std::uint32_t>(code));
    return out;
}

std::int64_t DecodeUtf8(const std::string& text) {
    const auto first = static_cast<unsigned char>(text.empty() ? 0 : text[0]);
    std::size_t length = 1;
    std::uint32_t code = first;
    if (first >= 0xF0) {
        length = 4;
        code = first & 0x07;
    } else if (first >= 0xE0) {
        length = 3;
        code = first & 0x0F;
    } else if (first >= 0xC0) {
        length = 2;
        code = first & 0x1F;
    }
    if (text.size() != length) {
        ThrowError("TypeError", "ord() expected a character, but string of length " +
                                    std::to_string(utils::CodePointCount(text)) + " found");
    }
    for (std::size_t i = 1; i < length; ++i) {
        code = (code << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return code;
}

Value Extreme(Runtime& rt, CallArgs& args, const std::string& name, bool want_max) {
    CheckKeywords(args, name, {"key", "default"});
    if (args.positional.empty()) {
        ThrowError("TypeError", name + " expected at least 1 argument, got 0");
    }
    std::vector<Value> items =
        args.positional.size() == 1 ? ToVector(rt, args.positional[0]) : args.positional;
    if (items.empty()) {
        if (const Value* fallback = args.Keyword("default")) {
            return *fallback;
        }
        ThrowError("ValueError", name + "() arg is an empty sequence");
    }
    const Value* key = args.Keyword("key");
    auto key_of = [&](const Value& item) {
        return key != nullptr && !key->IsNone() ? CallValue(rt, *key, std::vector<Value>{item}) : item;
    };
    Value best = items.front();
    Value best_key = key_of(best);
    for (std::size_t i = 1; i < items.size(); ++i) {
        Value candidate_key = key_of(items[i]);
        const bool better = want_max ? LessThan(best_key, candidate_key, rt) : LessThan(candidate_key, best_key, rt);
        if (better) {
            best = items[i];
            best_key = std::move(candidate_key);
        }
    }
    return best;
}

void CheckProtectedName(const std::string& name) {
    if (utils::StartsWith(name, "_")) {
        ThrowError("AttributeError", "access to protected attribute '" + name + "' is not allowed");
    }
}

std::shared_ptr<ClassObject> NewClass(const std::string& name, std::shared_ptr<ClassObject> base) {
    auto cls = std::make_shared<ClassObject>(name, std::move(base));
    cls->builtin = true;
    return cls;
}

}  // namespace

const Builtins& Builtins::Instance() {
    static const Builtins instance;
    return instance;
}

std::shared_ptr<ClassObject> Builtins::Class(const std::string& name) const {
    const auto it = classes_.find(name);
    return it == classes_.end() ? nullptr : it->second;
}

void Builtins::AddClass(const std::shared_ptr<ClassObject>& cls, bool bind) {
    classes_[cls->name] = cls;
    if (bind) {
        names_.Set(cls->name, Value(cls));
    }
}

std::shared_ptr<ClassObject> Builtins::AddExceptionClass(const std::string& name, const std::string& base) {
    auto cls = NewClass(name, Class(base));
    AddClass(cls);
    return cls;
}

void Builtins::AddFunction(const std::string& name, BuiltinFunction::Body body) {
    names_.Set(name, NativeFunction(name, std::move(body)));
}

Builtins::Builtins() {
    auto object = NewClass("object", nullptr);
    AddClass(object);

    auto uninstantiable = [](const std::string& name) {
        return [name](Runtime&, CallArgs&) -> Value {
            ThrowError("TypeError", "cannot create '" + name + "' instances");
        };
    };
    for (const char* name : {"NoneType", "function", "builtin_function_or_method", "method", "module"}) {
        auto cls = NewClass(name, object);
        cls->constructor = uninstantiable(name);
        AddClass(cls, false);
    }

    auto type = NewClass("type", object);
    type->constructor = [](Runtime&, CallArgs& args) {
        CheckArity(args, "type", 1, 1);
        return Value(ClassOf(args.positional[0]));
    };
    AddClass(type);

    auto int_class = NewClass("int", object);
    int_class->constructor = [](Runtime&, CallArgs& args) {
        CheckArity(args, "int", 0, 2);
        CheckKeywords(args, "int", {"base"});
        if (args.positional.empty()) {
            return Value(0);
        }
        const Value& value = args.positional[0];
        const Value* base = Argument(args, 1, "base");
        if (base != nullptr) {
            const std::int64_t radix = IntArgument(*base, "base");
            if (radix != 0 && (radix < 2 || radix > 36)) {
                ThrowError("ValueError", "int() base must be >= 2 and <= 36, or 0");
            }
            return Value(ParseInt(StrArgument(value, "int() argument"), static_cast<int>(radix)));
        }
        if (value.IsBool() || value.IsInt()) {
            return Value(value.AsInt());
        }
        if (value.IsFloat()) {
            return Value(FloatToInt(value.AsFloat()));
        }
        if (value.IsStr()) {
            return Value(ParseInt(value.AsStr(), 10));
        }
        ThrowError("TypeError", "int() argument must be a string or a real number, not '" + TypeName(value) + "'");
    };
    AddClass(int_class);

    auto bool_class = NewClass("bool", int_class);
    bool_class->constructor = [](Runtime&, CallArgs& args) {
        CheckArity(args, "bool", 0, 1);
        return Value(!args.positional.empty() && Truthy(args.positional[0]));
    };
    AddClass(bool_class);

    auto float_class = NewClass("float", object);
    float_class->constructor = [](Runtime&, CallArgs& args) {
        CheckArity(args, "float", 0, 1);
        if (args.positional.empty()) {
            return Value(0.0);
        }
        const Value& value = args.positional[0];
        if (value.IsNumber()) {
            return Value(value.AsFloat());
        }
        if (value.IsStr()) {
            return Value(ParseFloat(value.AsStr()));
        }
        ThrowError("TypeError", "float() argument must be a string or a real number, not '" + TypeName(value) + "'");
    };
    AddClass(float_class);

    auto str_class = NewClass("str", object);
    str_class->constructor = [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "str", 0, 1);
        return Value(args.positional.empty() ? std::string() : Str(args.positional[0], &rt));
    };
    AddClass(str_class);

    auto list_class = NewClass("list", object);
    list_class->constructor = [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "list", 0, 1);
        return MakeList(args.positional.empty() ? std::vector<Value>{} : ToVector(rt, args.positional[0]));
    };
    AddClass(list_class);

    auto tuple_class = NewClass("tuple", object);
    tuple_class->constructor = [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "tuple", 0, 1);
        return MakeTuple(args.positional.empty() ? std::vector<Value>{} : ToVector(rt, args.positional[0]));
    };
    AddClass(tuple_class);

    auto dict_class = NewClass("dict", object);
    dict_class->constructor = [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "dict", 0, 1);
        auto dict = std::make_shared<DictObject>();
        if (!args.positional.empty()) {
            if (auto other = args.positional[0].As<DictObject>()) {
                dict->entries = other->entries;
            } else {
                for (const auto& pair : ToVector(rt, args.positional[0])) {
                    const auto kv = Unpack(rt, pair, 2);
                    dict->Set(kv[0], kv[1]);
                }
            }
        }
        for (const auto& keyword : args.keywords) {
            dict->Set(Value(keyword.first), keyword.second);
        }
        return Value(dict);
    };
    AddClass(dict_class);

    auto range_class = NewClass("range", object);
    range_class->constructor = [](Runtime&, CallArgs& args) {
        CheckArity(args, "range", 1, 3);
        std::int64_t start = 0;
        std::int64_t stop = 0;
        std::int64_t step = 1;
        if (args.positional.size() == 1) {
            stop = IntArgument(args.positional[0], "range() argument");
        } else {
            start = IntArgument(args.positional[0], "range() argument");
            stop = IntArgument(args.positional[1], "range() argument");
            if (args.positional.size() == 3) {
                step = IntArgument(args.positional[2], "range() argument");
            }
        }
        if (step == 0) {
            ThrowError("ValueError", "range() arg 3 must not be zero");
        }
        return Value(std::make_shared<RangeObject>(start, stop, step));
    };
    AddClass(range_class);

    // Exception hierarchy.
    auto base_exception = NewClass("BaseException", object);
    base_exception->attrs.Set("__init__", NativeFunction("__init__", [](Runtime&, CallArgs& args) {
        if (!args.keywords.empty()) {
            ThrowError("TypeError", "exceptions do not take keyword arguments");
        }
        auto self = args.positional.empty() ? nullptr : args.positional[0].As<InstanceObject>();
        if (!self) {
            ThrowError("TypeError", "descriptor '__init__' requires an exception instance");
        }
        self->attrs.Set("args", MakeTuple(std::vector<Value>(args.positional.begin() + 1, args.positional.end())));
        return Value();
    }));
    AddClass(base_exception);
    AddExceptionClass("Exception", "BaseException");
    AddExceptionClass("ValueError", "Exception");
    AddExceptionClass("TypeError", "Exception");
    AddExceptionClass("LookupError", "Exception");
    AddExceptionClass("KeyError", "LookupError");
    AddExceptionClass("IndexError", "LookupError");
    AddExceptionClass("AttributeError", "Exception");
    AddExceptionClass("ArithmeticError", "Exception");
    AddExceptionClass("ZeroDivisionError", "ArithmeticError");
    AddExceptionClass("OverflowError", "ArithmeticError");
    AddExceptionClass("NameError", "Exception");
    AddExceptionClass("UnboundLocalError", "NameError");
    AddExceptionClass("ImportError", "Exception");
    AddExceptionClass("ModuleNotFoundError", "ImportError");
    AddExceptionClass("RuntimeError", "Exception");
    AddExceptionClass("NotImplementedError", "RuntimeError");
    AddExceptionClass("RecursionError", "RuntimeError");
    AddExceptionClass("StopIteration", "Exception");
    AddExceptionClass("AssertionError", "Exception");

    AddFunction("print", [](Runtime& rt, CallArgs& args) {
        CheckKeywords(args, "print", {"sep", "end", "flush"});
        std::string sep = " ";
        std::string end = "\n";
        if (const Value* value = args.Keyword("sep"); value != nullptr && !value->IsNone()) {
            sep = StrArgument(*value, "sep");
        }
        if (const Value* value = args.Keyword("end"); value != nullptr && !value->IsNone()) {
            end = StrArgument(*value, "end");
        }
        std::string line;
        for (std::size_t i = 0; i < args.positional.size(); ++i) {
            if (i > 0) {
                line += sep;
            }
            line += Str(args.positional[i], &rt);
        }
        rt.Write(line + end);
        return Value();
    });
    AddFunction("len", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "len", 1, 1);
        const Value& value = args.positional[0];
        if (value.IsStr()) return Value(static_cast<std::int64_t>(utils::CodePointCount(value.AsStr())));
        if (auto list = value.As<ListObject>()) return Value(static_cast<std::int64_t>(list->items.size()));
        if (auto tuple = value.As<TupleObject>()) return Value(static_cast<std::int64_t>(tuple->items.size()));
        if (auto dict = value.As<DictObject>()) return Value(static_cast<std::int64_t>(dict->entries.size()));
        if (auto range = value.As<RangeObject>()) return Value(range->Length());
        if (auto instance = value.As<InstanceObject>()) {
            if (const Value* method = instance->cls->Lookup("__len__")) {
                return CallValue(rt, *method, std::vector<Value>{value});
            }
        }
        ThrowError("TypeError", "object of type '" + TypeName(value) + "' has no len()");
    });
    AddFunction("repr", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "repr", 1, 1);
        return Value(Repr(args.positional[0], &rt));
    });
    AddFunction("format", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "format", 1, 2);
        const std::string spec = args.positional.size() > 1 ? StrArgument(args.positional[1], "format spec") : "";
        return Value(FormatWithSpec(args.positional[0], spec, &rt));
    });
    AddFunction("isinstance", [](Runtime&, CallArgs& args) {
        CheckArity(args, "isinstance", 2, 2);
        const Value& target = args.positional[1];
        if (auto cls = target.As<ClassObject>()) {
            return Value(IsInstance(args.positional[0], *cls));
        }
        if (auto tuple = target.As<TupleObject>()) {
            for (const auto& item : tuple->items) {
                auto cls = item.As<ClassObject>();
                if (!cls) {
                    ThrowError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
                }
                if (IsInstance(args.positional[0], *cls)) {
                    return Value(true);
                }
            }
            return Value(false);
        }
        ThrowError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
    });
    AddFunction("issubclass", [](Runtime&, CallArgs& args) {
        CheckArity(args, "issubclass", 2, 2);
        auto cls = args.positional[0].As<ClassObject>();
        auto base = args.positional[1].As<ClassObject>();
        if (!cls || !base) {
            ThrowError("TypeError", "issubclass() arguments must be classes");
        }
        return Value(cls->IsSubclassOf(*base));
    });
    AddFunction("hasattr", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "hasattr", 2, 2);
        const std::string& name = StrArgument(args.positional[1], "attribute name");
        CheckProtectedName(name);
        return Value(HasAttribute(rt, args.positional[0], name));
    });
    AddFunction("getattr", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "getattr", 2, 3);
        const std::string& name = StrArgument(args.positional[1], "attribute name");
        CheckProtectedName(name);
        if (args.positional.size() == 3 && !HasAttribute(rt, args.positional[0], name)) {
            return args.positional[2];
        }
        return GetAttribute(rt, args.positional[0], name);
    });
    AddFunction("setattr", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "setattr", 3, 3);
        const std::string& name = StrArgument(args.positional[1], "attribute name");
        CheckProtectedName(name);
        SetAttribute(rt, args.positional[0], name, args.positional[2]);
        return Value();
    });
    AddFunction("min", [](Runtime& rt, CallArgs& args) { return Extreme(rt, args, "min", false); });
    AddFunction("max", [](Runtime& rt, CallArgs& args) { return Extreme(rt, args, "max", true); });
    AddFunction("sum", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "sum", 1, 2);
        CheckKeywords(args, "sum", {"start"});
        const Value* start = Argument(args, 1, "start");
        Value total = start != nullptr ? *start : Value(0);
        if (total.IsStr()) {
            ThrowError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
        }
        ForEach(rt, args.positional[0], [&](const Value& item) {
            total = BinaryOperation(BinaryOp::kAdd, total, item);
            return true;
        });
        return total;
    });
    AddFunction("abs", [](Runtime&, CallArgs& args) {
        CheckArity(args, "abs", 1, 1);
        const Value& value = args.positional[0];
        if (value.IsFloat()) {
            return Value(std::fabs(value.AsFloat()));
        }
        if (value.IsInt() || value.IsBool()) {
            return value.AsInt() < 0 ? UnaryOperation(UnaryOp::kNeg, value) : Value(value.AsInt());
        }
        ThrowError("TypeError", "bad operand type for abs(): '" + TypeName(value) + "'");
    });
    AddFunction("round", [](Runtime&, CallArgs& args) {
        CheckArity(args, "round", 1, 2);
        CheckKeywords(args, "round", {"ndigits"});
        const Value& value = args.positional[0];
        const Value* ndigits = Argument(args, 1, "ndigits");
        if (!value.IsNumber()) {
            ThrowError("TypeError", "type " + TypeName(value) + " doesn't define __round__ method");
        }
        if (ndigits == nullptr || ndigits->IsNone()) {
            if (!value.IsFloat()) {
                return Value(value.AsInt());
            }
            return Value(FloatToInt(std::nearbyint(value.AsFloat())));
        }
        const std::int64_t digits = IntArgument(*ndigits, "ndigits");
        if (!value.IsFloat()) {
            return Value(value.AsInt());
        }
        const double scale = std::pow(10.0, static_cast<double>(digits));
        const double scaled = value.AsFloat() * scale;
        if (!std::isfinite(scaled)) {
            return Value(value.AsFloat());
        }
        return Value(std::nearbyint(scaled) / scale);
    });
    AddFunction("sorted", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "sorted", 1, 1);
        CheckKeywords(args, "sorted", {"key", "reverse"});
        auto list = std::make_shared<ListObject>(ToVector(rt, args.positional[0]));
        CallArgs sort_args;
        sort_args.keywords = args.keywords;
        CallValue(rt, BuiltinTypeMethod(Value(list), "sort"), std::move(sort_args));
        return Value(list);
    });
    AddFunction("reversed", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "reversed", 1, 1);
        std::vector<Value> items = ToVector(rt, args.positional[0]);
        std::reverse(items.begin(), items.end());
        return MakeList(std::move(items));
    });
    AddFunction("enumerate", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "enumerate", 1, 2);
        CheckKeywords(args, "enumerate", {"start"});
        const Value* start = Argument(args, 1, "start");
        std::int64_t index = start != nullptr ? IntArgument(*start, "start") : 0;
        std::vector<Value> out;
        ForEach(rt, args.positional[0], [&](const Value& item) {
            out.push_back(MakeTuple({Value(index++), item}));
            return true;
        });
        return MakeList(std::move(out));
    });
    AddFunction("zip", [](Runtime& rt, CallArgs& args) {
        std::vector<std::vector<Value>> columns;
        std::size_t shortest = std::numeric_limits<std::size_t>::max();
        for (const auto& iterable : args.positional) {
            columns.push_back(ToVector(rt, iterable));
            shortest = std::min(shortest, columns.back().size());
        }
        std::vector<Value> rows;
        if (columns.empty()) {
            return MakeList(std::move(rows));
        }
        for (std::size_t i = 0; i < shortest; ++i) {
            std::vector<Value> row;
            for (const auto& column : columns) {
                row.push_back(column[i]);
            }
            rows.push_back(MakeTuple(std::move(row)));
        }
        return MakeList(std::move(rows));
    });
    AddFunction("any", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "any", 1, 1);
        bool result = false;
        ForEach(rt, args.positional[0], [&](const Value& item) {
            result = Truthy(item);
            return !result;
        });
        return Value(result);
    });
    AddFunction("all", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "all", 1, 1);
        bool result = true;
        ForEach(rt, args.positional[0], [&](const Value& item) {
            result = Truthy(item);
            return result;
        });
        return Value(result);
    });
    AddFunction("divmod", [](Runtime&, CallArgs& args) {
        CheckArity(args, "divmod", 2, 2);
        return MakeTuple({BinaryOperation(BinaryOp::kFloorDiv, args.positional[0], args.positional[1]),
                          BinaryOperation(BinaryOp::kMod, args.positional[0], args.positional[1])});
    });
    AddFunction("chr", [](Runtime&, CallArgs& args) {
        CheckArity(args, "chr", 1, 1);
        return Value(EncodeUtf8(IntArgument(args.positional[0], "chr() argument")));
    });
    AddFunction("ord", [](Runtime&, CallArgs& args) {
        CheckArity(args, "ord", 1, 1);
        return Value(DecodeUtf8(StrArgument(args.positional[0], "ord() argument")));
    });
    AddFunction("__import__", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "__import__", 1, 1);
        return rt.ImportModule(StrArgument(args.positional[0], "module name"));
    });
    AddFunction("format_exc", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "format_exc", 0, 0);
        return Value(rt.FormatHandledException());
    });
    AddFunction("safe_json_dumps", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "safe_json_dumps", 1, 1);
        CheckKeywords(args, "safe_json_dumps", {"indent"});
        const Value* indent = args.Keyword("indent");
        const int width = indent != nullptr && !indent->IsNone()
                              ? static_cast<int>(IntArgument(*indent, "indent"))
                              : -1;
        return Value(DumpJson(ToJson(args.positional[0], true, &rt), width));
    });
}

Value MakeException(const std::string& type_name, std::vector<Value> args) {
    auto cls = Builtins::Instance().Class(type_name);
    if (!cls) {
        cls = Builtins::Instance().Class("RuntimeError");
    }
    auto instance = std::make_shared<InstanceObject>(cls);
    instance->attrs.Set("args", MakeTuple(std::move(args)));
    return Value(instance);
}

Value MakeException(const std::string& type_name, const std::string& message) {
    return MakeException(type_name, std::vector<Value>{Value(message)});
}

void ThrowError(const std::string& type_name, const std::string& message) {
    throw ScriptException(MakeException(type_name, message));
}

}  // namespace codeact::script
