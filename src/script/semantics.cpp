#include "script/semantics.hpp"

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/operations.hpp"
#include "script/runtime.hpp"

namespace codeact::script {

Bindings ImportBindings(Runtime& rt, const ImportStmt& stmt) {
    Bindings bindings;
    for (const auto& alias : stmt.names) {
        Value module = rt.ImportModule(alias.name);
        if (!alias.asname.empty()) {
            bindings.emplace_back(alias.asname, module);
            continue;
        }
        const auto dot = alias.name.find('.');
        if (dot == std::string::npos) {
            bindings.emplace_back(alias.name, module);
        } else {
            const std::string top = alias.name.substr(0, dot);
            bindings.emplace_back(top, rt.ImportModule(top));
        }
    }
    return bindings;
}

Bindings ImportBindings(Runtime& rt, const ImportFromStmt& stmt) {
    Bindings bindings;
    const Value module = rt.ImportModule(stmt.module);
    auto object = module.As<ModuleObject>();
    for (const auto& alias : stmt.names) {
        if (alias.name == "*") {
            for (const auto& name : object->members.Names()) {
                if (!name.empty() && name[0] != '_') {
                    bindings.emplace_back(name, *object->members.Find(name));
                }
            }
            continue;
        }
        const Value* member = object->members.Find(alias.name);
        if (member == nullptr) {
            ThrowError("ImportError", "cannot import name '" + alias.name + "' from '" + stmt.module + "'");
        }
        bindings.emplace_back(alias.asname.empty() ? alias.name : alias.asname, *member);
    }
    return bindings;
}

Value MakeRaisable(Runtime& rt, const Value& value) {
    const auto base = Builtins::Instance().Class("BaseException");
    if (auto cls = value.As<ClassObject>()) {
        if (cls->IsSubclassOf(*base)) {
            return CallValue(rt, value, std::vector<Value>{});
        }
    } else if (IsInstance(value, *base)) {
        return value;
    }
    ThrowError("TypeError", "exceptions must derive from BaseException");
}

std::shared_ptr<ClassObject> NewUserClass(const std::string& name, const std::vector<Value>& bases) {
    if (bases.size() > 1) {
        ThrowError("TypeError", "multiple inheritance is not supported");
    }
    std::shared_ptr<ClassObject> base = Builtins::Instance().Class("object");
    if (!bases.empty()) {
        base = bases.front().As<ClassObject>();
        if (!base) {
            ThrowError("TypeError", "bases must be types, not '" + TypeName(bases.front()) + "'");
        }
        if (base->constructor) {
            ThrowError("TypeError", "subclassing built-in type '" + base->name + "' is not supported");
        }
    }
    return std::make_shared<ClassObject>(name, base);
}

std::vector<Value> BindArguments(const std::string& function, const std::vector<std::string>& params,
                                 const std::vector<Value>& defaults, CallArgs args) {
    const std::size_t first_default = params.size() - defaults.size();
    if (args.positional.size() > params.size()) {
        const std::string expected = defaults.empty()
                                         ? std::to_string(params.size())
                                         : "from " + std::to_string(first_default) + " to " + std::to_string(params.size());
        ThrowError("TypeError", function + "() takes " + expected + " positional argument" +
                                    (params.size() == 1 && defaults.empty() ? "" : "s") + " but " +
                                    std::to_string(args.positional.size()) +
                                    (args.positional.size() == 1 ? " was" : " were") + " given");
    }
    std::vector<Value> values(params.size());
    std::vector<bool> bound(params.size(), false);
    for (std::size_t i = 0; i < args.positional.size(); ++i) {
        values[i] = std::move(args.positional[i]);
        bound[i] = true;
    }
    for (auto& keyword : args.keywords) {
        std::size_t index = 0;
        while (index < params.size() && params[index] != keyword.first) {
            ++index;
        }
        if (index == params.size()) {
            ThrowError("TypeError", function + "() got an unexpected keyword argument '" + keyword.first + "'");
        }
        if (bound[index]) {
            ThrowError("TypeError", function + "() got multiple values for argument '" + keyword.first + "'");
        }
        values[index] = std::move(keyword.second);
        bound[index] = true;
    }
    std::vector<std::string> missing;
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (bound[i]) {
            continue;
        }
        if (i >= first_default) {
            values[i] = defaults[i - first_default];
        } else {
            missing.push_back("'" + params[i] + "'");
        }
    }
    if (!missing.empty()) {
        std::string names = missing.front();
        for (std::size_t i = 1; i < missing.size(); ++i) {
            names += (i + 1 == missing.size() ? " and " : ", ") + missing[i];
        }
        ThrowError("TypeError", function + "() missing " + std::to_string(missing.size()) +
                                    " required positional argument" + (missing.size() == 1 ? "" : "s") + ": " +
                                    names);
    }
    return values;
}

Value InPlaceOperation(BinaryOp op, const Value& left, const Value& right, Runtime& rt) {
    if (op == BinaryOp::kAdd) {
        if (auto list = left.As<ListObject>()) {
            if (!right.IsObject() && !right.IsStr()) {
                ThrowError("TypeError", "'" + TypeName(right) + "' object is not iterable");
            }
            auto items = ToVector(rt, right);
            list->items.insert(list->items.end(), items.begin(), items.end());
            return left;
        }
    }
    return BinaryOperation(op, left, right);
}

void DeleteAttribute(const Value& object, const std::string& name) {
    if (auto instance = object.As<InstanceObject>()) {
        if (instance->attrs.Erase(name)) {
            return;
        }
        ThrowError("AttributeError", "'" + instance->cls->name + "' object has no attribute '" + name + "'");
    }
    if (auto cls = object.As<ClassObject>()) {
        if (cls->builtin) {
            ThrowError("TypeError", "cannot delete '" + name + "' attribute of immutable type '" + cls->name + "'");
        }
        if (cls->attrs.Erase(name)) {
            return;
        }
        ThrowError("AttributeError", "type object '" + cls->name + "' has no attribute '" + name + "'");
    }
    ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

bool IsNativeDecorator(const Value& decorator) {
    auto function = decorator.As<BuiltinFunction>();
    return function && function->native_decorator();
}

std::string FormatField(Runtime& rt, const Value& value, char conversion, const std::string& spec) {
    if (conversion == 'r' || conversion == 'a') {
        return FormatWithSpec(Value(Repr(value, &rt)), spec, &rt);
    }
    if (conversion == 's') {
        return FormatWithSpec(Value(Str(value, &rt)), spec, &rt);
    }
    return FormatWithSpec(value, spec, &rt);
}

void RaiseAssertion(const Value* message) {
    if (message == nullptr) {
        throw ScriptException(MakeException("AssertionError", std::vector<Value>{}));
    }
    throw ScriptException(MakeException("AssertionError", std::vector<Value>{*message}));
}

}  // namespace codeact::script
