#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <thread>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/json_codec.hpp"
#include "script/module_registry.hpp"
#include "script/native.hpp"
#include "script/operations.hpp"
#include "script/runtime.hpp"

namespace codeact::script {
namespace {

void AddFunction(ModuleObject& module, const std::string& name, BuiltinFunction::Body body) {
    module.members.Set(name, NativeFunction(name, std::move(body)));
}

double DomainChecked(double result) {
    if (std::isnan(result)) {
        ThrowError("ValueError", "math domain error");
    }
    if (std::isinf(result)) {
        ThrowError("OverflowError", "math range error");
    }
    return result;
}

void AddUnaryMath(ModuleObject& module, const std::string& name, double (*function)(double)) {
    AddFunction(module, name, [name, function](Runtime&, CallArgs& args) {
        CheckArity(args, name, 1, 1);
        const double x = NumberArgument(args.positional[0], "math." + name + "() argument");
        if (std::isnan(x) || std::isinf(x)) {
            return Value(function(x));
        }
        return Value(DomainChecked(function(x)));
    });
}

std::int64_t ToIntegral(double value, const std::string& name) {
    if (std::isnan(value)) {
        ThrowError("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(value) || value >= 9.2233720368547758e18 || value < -9.2233720368547758e18) {
        ThrowError("OverflowError", "cannot convert float infinity to integer in " + name + "()");
    }
    return static_cast<std::int64_t>(value);
}

std::shared_ptr<ModuleObject> MakeMathModule(Runtime&) {
    auto module = std::make_shared<ModuleObject>("math");
    module->members.Set("pi", Value(3.141592653589793));
    module->members.Set("e", Value(2.718281828459045));
    module->members.Set("tau", Value(6.283185307179586));
    module->members.Set("inf", Value(std::numeric_limits<double>::infinity()));
    module->members.Set("nan", Value(std::numeric_limits<double>::quiet_NaN()));

    AddFunction(*module, "sqrt", [](Runtime&, CallArgs& args) {
        CheckArity(args, "sqrt", 1, 1);
        const double x = NumberArgument(args.positional[0], "math.sqrt() argument");
        if (x < 0) {
            ThrowError("ValueError", "math domain error");
        }
        return Value(std::sqrt(x));
    });
    AddUnaryMath(*module, "exp", [](double x) { return std::exp(x); });
    AddUnaryMath(*module, "sin", [](double x) { return std::sin(x); });
    AddUnaryMath(*module, "cos", [](double x) { return std::cos(x); });
    AddUnaryMath(*module, "tan", [](double x) { return std::tan(x); });
    AddUnaryMath(*module, "asin", [](double x) { return std::asin(x); });
    AddUnaryMath(*module, "acos", [](double x) { return std::acos(x); });
    AddUnaryMath(*module, "atan", [](double x) { return std::atan(x); });
    AddUnaryMath(*module, "fabs", [](double x) { return std::fabs(x); });
    AddUnaryMath(*module, "degrees", [](double x) { return x * 180.0 / 3.141592653589793; });
    AddUnaryMath(*module, "radians", [](double x) { return x * 3.141592653589793 / 180.0; });

    AddFunction(*module, "log", [](Runtime&, CallArgs& args) {
        CheckArity(args, "log", 1, 2);
        const double x = NumberArgument(args.positional[0], "math.log() argument");
        if (x <= 0) {
            ThrowError("ValueError", "math domain error");
        }
        if (args.positional.size() == 1) {
            return Value(std::log(x));
        }
        const double base = NumberArgument(args.positional[1], "math.log() base");
        if (base <= 0 || base == 1.0) {
            ThrowError(base == 1.0 ? "ZeroDivisionError" : "ValueError",
                       base == 1.0 ? "float division by zero" : "math domain error");
        }
        return Value(std::log(x) / std::log(base));
    });
    for (const char* name : {"log10", "log2"}) {
        const std::string label = name;
        AddFunction(*module, label, [label](Runtime&, CallArgs& args) {
            CheckArity(args, label, 1, 1);
            const double x = NumberArgument(args.positional[0], "math." + label + "() argument");
            if (x <= 0) {
                ThrowError("ValueError", "math domain error");
            }
            return Value(label == "log10" ? std::log10(x) : std::log2(x));
        });
    }
    AddFunction(*module, "pow", [](Runtime&, CallArgs& args) {
        CheckArity(args, "pow", 2, 2);
        const double x = NumberArgument(args.positional[0], "math.pow() argument");
        const double y = NumberArgument(args.positional[1], "math.pow() exponent");
        if (x == 0.0 && y < 0) {
            ThrowError("ValueError", "math domain error");
        }
        return Value(DomainChecked(std::pow(x, y)));
    });
    AddFunction(*module, "atan2", [](Runtime&, CallArgs& args) {
        CheckArity(args, "atan2", 2, 2);
        return Value(std::atan2(NumberArgument(args.positional[0], "math.atan2() argument"),
                                NumberArgument(args.positional[1], "math.atan2() argument")));
    });
    AddFunction(*module, "hypot", [](Runtime&, CallArgs& args) {
        double total = 0.0;
        for (const auto& value : args.positional) {
            const double x = NumberArgument(value, "math.hypot() argument");
            total += x * x;
        }
        return Value(std::sqrt(total));
    });
    for (const char* name : {"floor", "ceil", "trunc"}) {
        const std::string label = name;
        AddFunction(*module, label, [label](Runtime&, CallArgs& args) {
            CheckArity(args, label, 1, 1);
            const Value& value = args.positional[0];
            if (value.IsInt() || value.IsBool()) {
                return Value(value.AsInt());
            }
            const double x = NumberArgument(value, "math." + label + "() argument");
            const double rounded = label == "floor" ? std::floor(x) : (label == "ceil" ? std::ceil(x) : std::trunc(x));
            return Value(ToIntegral(rounded, label));
        });
    }
    for (const char* name : {"isnan", "isinf", "isfinite"}) {
        const std::string label = name;
        AddFunction(*module, label, [label](Runtime&, CallArgs& args) {
            CheckArity(args, label, 1, 1);
            const double x = NumberArgument(args.positional[0], "math." + label + "() argument");
            if (label == "isnan") {
                return Value(std::isnan(x));
            }
            return Value(label == "isinf" ? std::isinf(x) : std::isfinite(x));
        });
    }
    AddFunction(*module, "isclose", [](Runtime&, CallArgs& args) {
        CheckArity(args, "isclose", 2, 2);
        CheckKeywords(args, "isclose", {"rel_tol", "abs_tol"});
        const double a = NumberArgument(args.positional[0], "math.isclose() argument");
        const double b = NumberArgument(args.positional[1], "math.isclose() argument");
        const Value* rel = args.Keyword("rel_tol");
        const Value* abs_tol = args.Keyword("abs_tol");
        const double rel_tol = rel != nullptr ? NumberArgument(*rel, "rel_tol") : 1e-9;
        const double abs_limit = abs_tol != nullptr ? NumberArgument(*abs_tol, "abs_tol") : 0.0;
        if (rel_tol < 0 || abs_limit < 0) {
            ThrowError("ValueError", "tolerances must be non-negative");
        }
        if (a == b) {
            return Value(true);
        }
        if (std::isinf(a) || std::isinf(b)) {
            return Value(false);
        }
        const double diff = std::fabs(b - a);
        return Value(diff <= std::fabs(rel_tol * b) || diff <= std::fabs(rel_tol * a) || diff <= abs_limit);
    });
    AddFunction(*module, "factorial", [](Runtime&, CallArgs& args) {
        CheckArity(args, "factorial", 1, 1);
        const std::int64_t n = IntArgument(args.positional[0], "factorial() argument");
        if (n < 0) {
            ThrowError("ValueError", "factorial() not defined for negative values");
        }
        Value result(static_cast<std::int64_t>(1));
        for (std::int64_t i = 2; i <= n; ++i) {
            result = BinaryOperation(BinaryOp::kMul, result, Value(i));
        }
        return result;
    });
    AddFunction(*module, "gcd", [](Runtime&, CallArgs& args) {
        std::int64_t result = 0;
        for (const auto& value : args.positional) {
            result = std::gcd(result, IntArgument(value, "gcd() argument"));
        }
        return Value(result < 0 ? -result : result);
    });
    return module;
}

std::shared_ptr<ModuleObject> MakeTimeModule(Runtime&) {
    auto module = std::make_shared<ModuleObject>("time");
    AddFunction(*module, "time", [](Runtime&, CallArgs& args) {
        CheckArity(args, "time", 0, 0);
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return Value(std::chrono::duration<double>(now).count());
    });
    for (const char* name : {"monotonic", "perf_counter"}) {
        const std::string label = name;
        AddFunction(*module, label, [label](Runtime&, CallArgs& args) {
            CheckArity(args, label, 0, 0);
            const auto now = std::chrono::steady_clock::now().time_since_epoch();
            return Value(std::chrono::duration<double>(now).count());
        });
    }
    AddFunction(*module, "sleep", [](Runtime&, CallArgs& args) {
        CheckArity(args, "sleep", 1, 1);
        const double seconds = NumberArgument(args.positional[0], "sleep() argument");
        if (std::isnan(seconds)) {
            ThrowError("ValueError", "Invalid value NaN (not a number)");
        }
        if (seconds < 0) {
            ThrowError("ValueError", "sleep length must be non-negative");
        }
        if (std::isinf(seconds)) {
            ThrowError("OverflowError", "sleep length is too large");
        }
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
        return Value();
    });
    return module;
}

std::int64_t RandomBelow(std::mt19937_64& engine, std::int64_t low, std::int64_t high) {
    std::uniform_int_distribution<std::int64_t> distribution(low, high);
    return distribution(engine);
}

std::shared_ptr<ModuleObject> MakeRandomModule(Runtime&) {
    auto module = std::make_shared<ModuleObject>("random");
    auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());

    AddFunction(*module, "seed", [engine](Runtime&, CallArgs& args) {
        CheckArity(args, "seed", 0, 1);
        if (args.positional.empty() || args.positional[0].IsNone()) {
            engine->seed(std::random_device{}());
        } else if (args.positional[0].IsStr()) {
            engine->seed(std::hash<std::string>{}(args.positional[0].AsStr()));
        } else {
            engine->seed(static_cast<std::uint64_t>(IntArgument(args.positional[0], "seed")));
        }
        return Value();
    });
    AddFunction(*module, "random", [engine](Runtime&, CallArgs& args) {
        CheckArity(args, "random", 0, 0);
        return Value(std::uniform_real_distribution<double>(0.0, 1.0)(*engine));
    });
    AddFunction(*module, "uniform", [engine](Runtime&, CallArgs& args) {
        CheckArity(args, "uniform", 2, 2);
        const double a = NumberArgument(args.positional[0], "uniform() argument");
        const double b = NumberArgument(args.positional[1], "uniform() argument");
        return Value(a + (b - a) * std::uniform_real_distribution<double>(0.0, 1.0)(*engine));
    });
    AddFunction(*module, "randint", [engine](Runtime&, CallArgs& args) {
        CheckArity(args, "randint", 2, 2);
        const std::int64_t a = IntArgument(args.positional[0], "randint() argument");
        const std::int64_t b = IntArgument(args.positional[1], "randint() argument");
        if (b < a) {
            ThrowError("ValueError", "empty range for randint()");
        }
        return Value(RandomBelow(*engine, a, b));
    });
    AddFunction(*module, "randrange", [engine](Runtime&, CallArgs& args) {
        CheckArity(args, "randrange", 1, 3);
        std::int64_t start = 0;
        std::int64_t stop = IntArgument(args.positional[0], "randrange() argument");
        std::int64_t step = 1;
        if (args.positional.size() > 1) {
            start = stop;
            stop = IntArgument(args.positional[1], "randrange() argument");
        }
        if (args.positional.size() > 2) {
            step = IntArgument(args.positional[2], "randrange() step");
        }
        if (step == 0) {
            ThrowError("ValueError", "zero step for randrange()");
        }
        const std::int64_t count = RangeObject(start, stop, step).Length();
        if (count <= 0) {
            ThrowError("ValueError", "empty range for randrange()");
        }
        return Value(start + step * RandomBelow(*engine, 0, count - 1));
    });
    AddFunction(*module, "choice", [engine](Runtime& rt, CallArgs& args) {
        CheckArity(args, "choice", 1, 1);
        const auto items = ToVector(rt, args.positional[0]);
        if (items.empty()) {
            ThrowError("IndexError", "Cannot choose from an empty sequence");
        }
        return items[static_cast<std::size_t>(RandomBelow(*engine, 0, static_cast<std::int64_t>(items.size()) - 1))];
    });
    AddFunction(*module, "shuffle", [engine](Runtime&, CallArgs& args) {
        CheckArity(args, "shuffle", 1, 1);
        auto list = args.positional[0].As<ListObject>();
        if (!list) {
            ThrowError("TypeError", "shuffle() argument must be a list, not '" + TypeName(args.positional[0]) + "'");
        }
        std::shuffle(list->items.begin(), list->items.end(), *engine);
        return Value();
    });
    AddFunction(*module, "sample", [engine](Runtime& rt, CallArgs& args) {
        CheckArity(args, "sample", 2, 2);
        auto items = ToVector(rt, args.positional[0]);
        const std::int64_t k = IntArgument(args.positional[1], "sample() k");
        if (k < 0 || k > static_cast<std::int64_t>(items.size())) {
            ThrowError("ValueError", "Sample larger than population or is negative");
        }
        std::shuffle(items.begin(), items.end(), *engine);
        items.resize(static_cast<std::size_t>(k));
        return MakeList(std::move(items));
    });
    return module;
}

std::shared_ptr<ModuleObject> MakeJsonModule(Runtime&) {
    auto module = std::make_shared<ModuleObject>("json");
    AddFunction(*module, "dumps", [](Runtime& rt, CallArgs& args) {
        CheckArity(args, "dumps", 1, 1);
        CheckKeywords(args, "dumps", {"indent", "default"});
        const Value* indent = args.Keyword("indent");
        const int width = indent != nullptr && !indent->IsNone()
                              ? static_cast<int>(IntArgument(*indent, "indent"))
                              : -1;
        const Value* fallback = args.Keyword("default");
        const bool repr_fallback = fallback != nullptr && fallback->As<ClassObject>() &&
                                   fallback->As<ClassObject>() == Builtins::Instance().Class("str");
        return Value(DumpJson(ToJson(args.positional[0], repr_fallback, &rt), width));
    });
    AddFunction(*module, "loads", [](Runtime&, CallArgs& args) {
        CheckArity(args, "loads", 1, 1);
        const std::string& text = StrArgument(args.positional[0], "the JSON object");
        nlohmann::ordered_json parsed;
        try {
            parsed = nlohmann::ordered_json::parse(text);
        } catch (const nlohmann::json::parse_error& error) {
            ThrowError("ValueError", std::string("Expecting value: ") + error.what());
        }
        return FromJson(parsed);
    });
    return module;
}

// dataclasses

struct FieldSpec {
    std::string name;
    bool has_default = false;
    Value default_value;
    Value default_factory;
};

class FieldState : public NativeState {
public:
    bool has_default = false;
    Value default_value;
    Value default_factory;
};

std::shared_ptr<ClassObject> FieldClass() {
    static const auto cls = [] {
        auto field = std::make_shared<ClassObject>("Field", Builtins::Instance().Class("object"));
        field->builtin = true;
        return field;
    }();
    return cls;
}

bool IsMutableDefault(const Value& value) {
    return value.As<ListObject>() || value.As<DictObject>();
}

std::vector<FieldSpec> CollectFields(ClassObject& cls) {
    std::vector<const ClassObject*> chain;
    for (const ClassObject* current = &cls; current != nullptr; current = current->base.get()) {
        chain.insert(chain.begin(), current);
    }
    std::vector<FieldSpec> fields;
    for (const ClassObject* current : chain) {
        for (const auto& annotation : current->annotations) {
            FieldSpec spec;
            spec.name = annotation.first;
            if (const Value* value = current->attrs.Find(annotation.first)) {
                if (auto field = value->As<InstanceObject>(); field && field->cls == FieldClass()) {
                    auto state = std::static_pointer_cast<FieldState>(field->native);
                    spec.has_default = state->has_default || !state->default_factory.IsNone();
                    spec.default_value = state->default_value;
                    spec.default_factory = state->default_factory;
                } else {
                    spec.has_default = true;
                    spec.default_value = *value;
                }
            } else if (current != &cls) {
                const Value* inherited = current->Lookup(annotation.first);
                if (inherited != nullptr) {
                    spec.has_default = true;
                    spec.default_value = *inherited;
                }
            }
            bool replaced = false;
            for (auto& existing : fields) {
                if (existing.name == spec.name) {
                    existing = spec;
                    replaced = true;
                }
            }
            if (!replaced) {
                fields.push_back(spec);
            }
        }
    }
    return fields;
}

Value SynthesizedInit(const std::string& class_name, std::vector<FieldSpec> fields) {
    return NativeFunction("__init__", [class_name, fields](Runtime& rt, CallArgs& args) {
        auto self = args.positional.empty() ? nullptr : args.positional[0].As<InstanceObject>();
        if (!self) {
            ThrowError("TypeError", "__init__() requires a " + class_name + " instance");
        }
        const std::size_t given = args.positional.size() - 1;
        if (given > fields.size()) {
            ThrowError("TypeError", "__init__() takes " + std::to_string(fields.size() + 1) +
                                        " positional arguments but " + std::to_string(given + 1) + " were given");
        }
        std::vector<bool> assigned(fields.size(), false);
        for (std::size_t i = 0; i < given; ++i) {
            self->attrs.Set(fields[i].name, args.positional[i + 1]);
            assigned[i] = true;
        }
        for (const auto& keyword : args.keywords) {
            std::size_t index = 0;
            while (index < fields.size() && fields[index].name != keyword.first) {
                ++index;
            }
            if (index == fields.size()) {
                ThrowError("TypeError", "__init__() got an unexpected keyword argument '" + keyword.first + "'");
            }
            if (assigned[index]) {
                ThrowError("TypeError", "__init__() got multiple values for argument '" + keyword.first + "'");
            }
            self->attrs.Set(keyword.first, keyword.second);
            assigned[index] = true;
        }
        std::vector<std::string> missing;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (assigned[i]) {
                continue;
            }
            if (!fields[i].default_factory.IsNone()) {
                self->attrs.Set(fields[i].name, CallValue(rt, fields[i].default_factory, std::vector<Value>{}));
            } else if (fields[i].has_default) {
                self->attrs.Set(fields[i].name, fields[i].default_value);
            } else {
                missing.push_back("'" + fields[i].name + "'");
            }
        }
        if (!missing.empty()) {
            std::string names = missing.front();
            for (std::size_t i = 1; i < missing.size(); ++i) {
                names += (i + 1 == missing.size() ? " and " : ", ") + missing[i];
            }
            ThrowError("TypeError", "__init__() missing " + std::to_string(missing.size()) + " required positional argument" +
                                        (missing.size() == 1 ? "" : "s") + ": " + names);
        }
        if (const Value* post_init = self->cls->Lookup("__post_init__")) {
            CallValue(rt, *post_init, std::vector<Value>{args.positional[0]});
        }
        return Value();
    });
}

Value ApplyDataclass(const Value& target) {
    auto cls = target.As<ClassObject>();
    if (!cls || cls->builtin) {
        ThrowError("TypeError", "dataclass() should be called on a class, not '" + TypeName(target) + "'");
    }
    const auto fields = CollectFields(*cls);
    bool seen_default = false;
    for (const auto& field : fields) {
        if (field.has_default) {
            seen_default = true;
        } else if (seen_default) {
            ThrowError("TypeError", "non-default argument '" + field.name + "' follows default argument");
        }
        if (field.has_default && IsMutableDefault(field.default_value)) {
            ThrowError("ValueError", "mutable default <class '" + TypeName(field.default_value) + "'> for field " +
                                         field.name + " is not allowed: use default_factory");
        }
    }
    for (const auto& field : fields) {
        Value* attr = cls->attrs.Find(field.name);
        if (attr == nullptr || !attr->As<InstanceObject>() || attr->As<InstanceObject>()->cls != FieldClass()) {
            continue;
        }
        if (!field.default_factory.IsNone() || !field.has_default) {
            cls->attrs.Erase(field.name);
        } else {
            *attr = field.default_value;
        }
    }

    std::vector<std::string> names;
    auto field_map = std::make_shared<DictObject>();
    for (const auto& field : fields) {
        names.push_back(field.name);
        std::string annotation;
        for (const ClassObject* current = cls.get(); current != nullptr && annotation.empty(); current = current->base.get()) {
            for (const auto& entry : current->annotations) {
                if (entry.first == field.name) {
                    annotation = entry.second;
                }
            }
        }
        field_map->Set(Value(field.name), Value(annotation));
    }

    const std::string class_name = cls->name;
    if (!cls->attrs.Contains("__init__")) {
        cls->attrs.Set("__init__", SynthesizedInit(class_name, fields));
    }
    if (!cls->attrs.Contains("__repr__")) {
        cls->attrs.Set("__repr__", NativeFunction("__repr__", [names](Runtime& rt, CallArgs& args) {
            CheckArity(args, "__repr__", 1, 1);
            auto self = args.positional[0].As<InstanceObject>();
            if (!self) {
                ThrowError("TypeError", "__repr__() requires a dataclass instance");
            }
            std::string out = self->cls->name + "(";
            for (std::size_t i = 0; i < names.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                const Value* value = self->attrs.Find(names[i]);
                out += names[i] + "=" + (value != nullptr ? Repr(*value, &rt) : std::string("<unset>"));
            }
            return Value(out + ")");
        }));
    }
    if (!cls->attrs.Contains("__eq__")) {
        cls->attrs.Set("__eq__", NativeFunction("__eq__", [names](Runtime& rt, CallArgs& args) {
            CheckArity(args, "__eq__", 2, 2);
            auto self = args.positional[0].As<InstanceObject>();
            auto other = args.positional[1].As<InstanceObject>();
            if (!self || !other || self->cls != other->cls) {
                return Value(false);
            }
            for (const auto& name : names) {
                const Value* a = self->attrs.Find(name);
                const Value* b = other->attrs.Find(name);
                if (a == nullptr || b == nullptr || !Equals(*a, *b, &rt)) {
                    return Value(false);
                }
            }
            return Value(true);
        }));
    }
    std::vector<Value> match_args;
    for (const auto& name : names) {
        match_args.push_back(Value(name));
    }
    cls->attrs.Set("__match_args__", MakeTuple(std::move(match_args)));
    cls->attrs.Set("__dataclass_fields__", Value(field_map));
    return target;
}

bool IsDataclassInstance(const Value& value) {
    auto instance = value.As<InstanceObject>();
    return instance && instance->cls->Lookup("__dataclass_fields__") != nullptr;
}

Value AsDict(const Value& value) {
    if (IsDataclassInstance(value)) {
        auto instance = value.As<InstanceObject>();
        auto fields = instance->cls->Lookup("__dataclass_fields__")->As<DictObject>();
        auto result = std::make_shared<DictObject>();
        for (const auto& entry : fields->entries) {
            const Value* field = instance->attrs.Find(entry.first.AsStr());
            result->Set(entry.first, field != nullptr ? AsDict(*field) : Value());
        }
        return Value(result);
    }
    if (auto list = value.As<ListObject>()) {
        std::vector<Value> items;
        for (const auto& item : list->items) {
            items.push_back(AsDict(item));
        }
        return MakeList(std::move(items));
    }
    if (auto tuple = value.As<TupleObject>()) {
        std::vector<Value> items;
        for (const auto& item : tuple->items) {
            items.push_back(AsDict(item));
        }
        return MakeTuple(std::move(items));
    }
    if (auto dict = value.As<DictObject>()) {
        auto result = std::make_shared<DictObject>();
        for (const auto& entry : dict->entries) {
            result->Set(AsDict(entry.first), AsDict(entry.second));
        }
        return Value(result);
    }
    return value;
}

// Flagged as a native decorator: it synthesizes members on the class and
// only takes effect where a decoration pass runs.
Value DataclassDecorator() {
    return Value(std::make_shared<BuiltinFunction>(
        "dataclass",
        [](Runtime&, CallArgs& args) -> Value {
            CheckArity(args, "dataclass", 0, 1);
            CheckKeywords(args, "dataclass", {"init", "repr", "eq"});
            if (args.positional.empty()) {
                return DataclassDecorator();
            }
            return ApplyDataclass(args.positional[0]);
        },
        true));
}

std::shared_ptr<ModuleObject> MakeDataclassesModule(Runtime&) {
    auto module = std::make_shared<ModuleObject>("dataclasses");
    module->members.Set("dataclass", DataclassDecorator());
    AddFunction(*module, "field", [](Runtime&, CallArgs& args) {
        CheckArity(args, "field", 0, 0);
        CheckKeywords(args, "field", {"default", "default_factory"});
        auto state = std::make_shared<FieldState>();
        if (const Value* value = args.Keyword("default")) {
            state->has_default = true;
            state->default_value = *value;
        }
        if (const Value* factory = args.Keyword("default_factory")) {
            if (state->has_default) {
                ThrowError("ValueError", "cannot specify both default and default_factory");
            }
            state->default_factory = *factory;
        }
        auto field = std::make_shared<InstanceObject>(FieldClass());
        field->native = state;
        return Value(field);
    });
    AddFunction(*module, "asdict", [](Runtime&, CallArgs& args) {
        CheckArity(args, "asdict", 1, 1);
        if (!IsDataclassInstance(args.positional[0])) {
            ThrowError("TypeError", "asdict() should be called on dataclass instances");
        }
        return AsDict(args.positional[0]);
    });
    AddFunction(*module, "is_dataclass", [](Runtime&, CallArgs& args) {
        CheckArity(args, "is_dataclass", 1, 1);
        const Value& value = args.positional[0];
        if (auto cls = value.As<ClassObject>()) {
            return Value(cls->Lookup("__dataclass_fields__") != nullptr);
        }
        return Value(IsDataclassInstance(value));
    });
    return module;
}

std::shared_ptr<ModuleObject> MakeTypingModule(Runtime&) {
    auto module = std::make_shared<ModuleObject>("typing");
    const auto object = Builtins::Instance().Class("object");
    for (const char* name : {"Any", "Optional", "Union", "List", "Dict", "Tuple", "Callable", "Sequence",
                             "Iterable", "Mapping", "ClassVar"}) {
        auto alias = std::make_shared<ClassObject>(name, object);
        alias->builtin = true;
        alias->constructor = [label = std::string(name)](Runtime&, CallArgs&) -> Value {
            ThrowError("TypeError", "Cannot instantiate typing." + label);
        };
        module->members.Set(name, Value(alias));
    }
    module->members.Set("TYPE_CHECKING", Value(false));
    return module;
}

}  // namespace

void RegisterStandardModules(ModuleRegistry& registry) {
    registry.Register("math", MakeMathModule);
    registry.Register("time", MakeTimeModule);
    registry.Register("random", MakeRandomModule);
    registry.Register("json", MakeJsonModule);
    registry.Register("dataclasses", MakeDataclassesModule);
    registry.Register("typing", MakeTypingModule);
}

}  // namespace codeact::script
