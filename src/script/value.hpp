#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace codeact::script {

class Object;
class Runtime;
using ObjectPtr = std::shared_ptr<Object>;

class Value {
public:
    enum class Kind {
        kNone,
        kBool,
        kInt,
        kFloat,
        kStr,
        kObject
    };

    Value() = default;
    Value(bool value) : data_(value) {}
    Value(int value) : data_(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : data_(value) {}
    Value(double value) : data_(value) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(ObjectPtr object) : data_(std::move(object)) {
        if (!std::get<ObjectPtr>(data_)) {
            data_ = std::monostate{};
        }
    }
    template <typename T, typename = std::enable_if_t<std::is_base_of_v<Object, T>>>
    Value(std::shared_ptr<T> object) : Value(ObjectPtr(std::move(object))) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool IsNone() const { return kind() == Kind::kNone; }
    bool IsBool() const { return kind() == Kind::kBool; }
    bool IsInt() const { return kind() == Kind::kInt; }
    bool IsFloat() const { return kind() == Kind::kFloat; }
    bool IsStr() const { return kind() == Kind::kStr; }
    bool IsObject() const { return kind() == Kind::kObject; }
    bool IsNumber() const { return IsBool() || IsInt() || IsFloat(); }

    bool AsBool() const { return std::get<bool>(data_); }
    const std::string& AsStr() const { return std::get<std::string>(data_); }
    const ObjectPtr& AsObject() const { return std::get<ObjectPtr>(data_); }
    // Integral view of bool and int.
    std::int64_t AsInt() const {
        return IsBool() ? (AsBool() ? 1 : 0) : std::get<std::int64_t>(data_);
    }
    double AsFloat() const {
        return IsFloat() ? std::get<double>(data_) : static_cast<double>(AsInt());
    }

    template <typename T>
    std::shared_ptr<T> As() const {
        if (!IsObject()) {
            return nullptr;
        }
        return std::dynamic_pointer_cast<T>(AsObject());
    }

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, ObjectPtr> data_;
};

// Insertion-ordered name -> value mapping. Used for the session context,
// class and instance attributes and module members.
class Namespace {
public:
    bool Contains(const std::string& name) const;
    const Value* Find(const std::string& name) const;
    Value* Find(const std::string& name);
    void Set(const std::string& name, Value value);
    bool Erase(const std::string& name);
    void Clear();
    // Removes every binding and hands the values to the caller.
    std::vector<Value> TakeValues();

    const std::vector<std::string>& Names() const { return order_; }
    std::size_t Size() const { return order_.size(); }
    bool Empty() const { return order_.empty(); }

private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, Value> values_;
};

struct CallArgs {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;

    const Value* Keyword(const std::string& name) const;
};

class Object : public std::enable_shared_from_this<Object> {
public:
    virtual ~Object() = default;
    virtual std::string TypeName() const = 0;
};

class ListObject : public Object {
public:
    ListObject() = default;
    explicit ListObject(std::vector<Value> values) : items(std::move(values)) {}
    ~ListObject() override;
    std::string TypeName() const override { return "list"; }

    std::vector<Value> items;
};

class TupleObject : public Object {
public:
    TupleObject() = default;
    explicit TupleObject(std::vector<Value> values) : items(std::move(values)) {}
    ~TupleObject() override;
    std::string TypeName() const override { return "tuple"; }

    std::vector<Value> items;
};

class DictObject : public Object {
public:
    ~DictObject() override;
    std::string TypeName() const override { return "dict"; }

    Value* Find(const Value& key);
    const Value* Find(const Value& key) const;
    void Set(const Value& key, Value value);
    bool Erase(const Value& key);

    std::vector<std::pair<Value, Value>> entries;
};

class RangeObject : public Object {
public:
    RangeObject(std::int64_t start, std::int64_t stop, std::int64_t step)
        : start(start), stop(stop), step(step) {}
    std::string TypeName() const override { return "range"; }
    std::int64_t Length() const;

    std::int64_t start;
    std::int64_t stop;
    std::int64_t step;
};

class ModuleObject : public Object {
public:
    explicit ModuleObject(std::string name) : name(std::move(name)) {}
    std::string TypeName() const override { return "module"; }

    std::string name;
    Namespace members;
};

// Opaque host-side state attached to instances of native classes.
class NativeState {
public:
    virtual ~NativeState() = default;
};

class CallableObject : public Object {
public:
    virtual std::string Name() const = 0;
    virtual Value Call(Runtime& rt, CallArgs args) = 0;
};

class BuiltinFunction : public CallableObject {
public:
    using Body = std::function<Value(Runtime&, CallArgs&)>;

    BuiltinFunction(std::string name, Body body, bool native_decorator = false)
        : name_(std::move(name)), body_(std::move(body)), native_decorator_(native_decorator) {}

    std::string TypeName() const override { return "builtin_function_or_method"; }
    std::string Name() const override { return name_; }
    Value Call(Runtime& rt, CallArgs args) override { return body_(rt, args); }

    // Native decorators synthesize members on the decorated declaration and
    // need a genuine decoration pass to do so.
    bool native_decorator() const { return native_decorator_; }

private:
    std::string name_;
    Body body_;
    bool native_decorator_ = false;
};

// Base of guest-defined functions; each execution strategy supplies its own.
class FunctionObject : public CallableObject {
public:
    std::string TypeName() const override { return "function"; }
};

class BoundMethod : public CallableObject {
public:
    BoundMethod(Value self, std::shared_ptr<CallableObject> function)
        : self(std::move(self)), function(std::move(function)) {}

    std::string TypeName() const override { return "method"; }
    std::string Name() const override { return function->Name(); }
    Value Call(Runtime& rt, CallArgs args) override;

    Value self;
    std::shared_ptr<CallableObject> function;
};

class ClassObject : public CallableObject {
public:
    using Constructor = std::function<Value(Runtime&, CallArgs&)>;

    ClassObject(std::string name, std::shared_ptr<ClassObject> base)
        : name(std::move(name)), base(std::move(base)) {}

    std::string TypeName() const override { return "type"; }
    std::string Name() const override { return name; }
    Value Call(Runtime& rt, CallArgs args) override;

    // Looks the attribute up along the inheritance chain.
    const Value* Lookup(const std::string& attr) const;
    bool IsSubclassOf(const ClassObject& other) const;

    std::string name;
    std::shared_ptr<ClassObject> base;
    Namespace attrs;
    // Field name -> annotation text, in declaration order.
    std::vector<std::pair<std::string, std::string>> annotations;
    // Native decorators that were evaluated but never applied.
    std::vector<std::string> unapplied_decorators;
    bool builtin = false;
    // Set for built-in value types (int, str, list, ...).
    Constructor constructor;
};

class InstanceObject : public Object {
public:
    explicit InstanceObject(std::shared_ptr<ClassObject> cls) : cls(std::move(cls)) {}
    ~InstanceObject() override;
    std::string TypeName() const override { return cls->name; }

    std::shared_ptr<ClassObject> cls;
    Namespace attrs;
    std::shared_ptr<NativeState> native;
};

Value MakeList(std::vector<Value> items);
// Empties every guest container and user class reachable from `ns`, then
// clears it. Reference cycles among those objects are released with it.
void ReleaseGraph(Namespace& ns);
Value MakeTuple(std::vector<Value> items);

}  // namespace codeact::script
