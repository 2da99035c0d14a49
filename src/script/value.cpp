#include "script/value.hpp"

#include <algorithm>
#include <unordered_set>

#include "script/errors.hpp"
#include "script/operations.hpp"

namespace codeact::script {
namespace {

void CollectObjects(std::vector<Value>& values, std::vector<ObjectPtr>& out) {
    for (const Value& value : values) {
        if (value.IsObject()) {
            out.push_back(value.AsObject());
        }
    }
    values.clear();
}

// Moves the references `object` holds into `out`. Builtin classes are shared
// by every session and keep their members.
void Detach(Object& object, std::vector<ObjectPtr>& out) {
    if (auto* list = dynamic_cast<ListObject*>(&object)) {
        CollectObjects(list->items, out);
    } else if (auto* tuple = dynamic_cast<TupleObject*>(&object)) {
        CollectObjects(tuple->items, out);
    } else if (auto* dict = dynamic_cast<DictObject*>(&object)) {
        std::vector<Value> values;
        values.reserve(dict->entries.size() * 2);
        for (auto& entry : dict->entries) {
            values.push_back(std::move(entry.first));
            values.push_back(std::move(entry.second));
        }
        dict->entries.clear();
        CollectObjects(values, out);
    } else if (auto* instance = dynamic_cast<InstanceObject*>(&object)) {
        std::vector<Value> values = instance->attrs.TakeValues();
        CollectObjects(values, out);
    } else if (auto* cls = dynamic_cast<ClassObject*>(&object)) {
        if (!cls->builtin) {
            std::vector<Value> values = cls->attrs.TakeValues();
            CollectObjects(values, out);
        }
    }
}

// Drops nested containers through an explicit worklist; a chain of a
// hundred thousand singly owned lists must not recurse through destructors.
void ReleaseNested(std::vector<Value>& items) {
    std::vector<ObjectPtr> pending;
    CollectObjects(items, pending);
    while (!pending.empty()) {
        ObjectPtr object = std::move(pending.back());
        pending.pop_back();
        if (object.use_count() == 1) {
            Detach(*object, pending);
        }
    }
}

}  // namespace

ListObject::~ListObject() {
    ReleaseNested(items);
}

TupleObject::~TupleObject() {
    ReleaseNested(items);
}

DictObject::~DictObject() {
    std::vector<Value> values;
    values.reserve(entries.size() * 2);
    for (auto& entry : entries) {
        values.push_back(std::move(entry.first));
        values.push_back(std::move(entry.second));
    }
    entries.clear();
    ReleaseNested(values);
}

InstanceObject::~InstanceObject() {
    std::vector<Value> values = attrs.TakeValues();
    ReleaseNested(values);
}

void ReleaseGraph(Namespace& ns) {
    std::vector<ObjectPtr> reachable;
    std::unordered_set<const Object*> seen;
    std::vector<ObjectPtr> frontier;
    std::vector<Value> roots = ns.TakeValues();
    CollectObjects(roots, frontier);
    while (!frontier.empty()) {
        ObjectPtr object = std::move(frontier.back());
        frontier.pop_back();
        if (!seen.insert(object.get()).second) {
            continue;
        }
        const auto* cls = dynamic_cast<const ClassObject*>(object.get());
        const bool container = dynamic_cast<const ListObject*>(object.get()) != nullptr ||
                               dynamic_cast<const TupleObject*>(object.get()) != nullptr ||
                               dynamic_cast<const DictObject*>(object.get()) != nullptr ||
                               dynamic_cast<const InstanceObject*>(object.get()) != nullptr ||
                               (cls != nullptr && !cls->builtin);
        if (!container) {
            continue;
        }
        // Walk a copy so the object keeps its contents until every reachable
        // node is known.
        std::vector<ObjectPtr> children;
        if (const auto* list = dynamic_cast<const ListObject*>(object.get())) {
            std::vector<Value> items = list->items;
            CollectObjects(items, children);
        } else if (const auto* tuple = dynamic_cast<const TupleObject*>(object.get())) {
            std::vector<Value> items = tuple->items;
            CollectObjects(items, children);
        } else if (const auto* dict = dynamic_cast<const DictObject*>(object.get())) {
            std::vector<Value> items;
            for (const auto& entry : dict->entries) {
                items.push_back(entry.first);
                items.push_back(entry.second);
            }
            CollectObjects(items, children);
        } else {
            const Namespace& attrs = cls != nullptr ? cls->attrs
                                                    : static_cast<const InstanceObject*>(object.get())->attrs;
            std::vector<Value> items;
            for (const auto& name : attrs.Names()) {
                items.push_back(*attrs.Find(name));
            }
            CollectObjects(items, children);
            if (cls == nullptr) {
                frontier.push_back(static_cast<const InstanceObject*>(object.get())->cls);
            }
        }
        frontier.insert(frontier.end(), children.begin(), children.end());
        reachable.push_back(std::move(object));
    }
    std::vector<ObjectPtr> released;
    for (const ObjectPtr& object : reachable) {
        Detach(*object, released);
    }
    // `released` and `reachable` now hold the only references left; dropping
    // them frees each node without recursion since every node is empty.
    released.clear();
    reachable.clear();
}

bool Namespace::Contains(const std::string& name) const {
    return values_.count(name) > 0;
}

const Value* Namespace::Find(const std::string& name) const {
    const auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
}

Value* Namespace::Find(const std::string& name) {
    const auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
}

void Namespace::Set(const std::string& name, Value value) {
    const auto it = values_.find(name);
    if (it != values_.end()) {
        it->second = std::move(value);
        return;
    }
    order_.push_back(name);
    values_.emplace(name, std::move(value));
}

bool Namespace::Erase(const std::string& name) {
    if (values_.erase(name) == 0) {
        return false;
    }
    order_.erase(std::find(order_.begin(), order_.end(), name));
    return true;
}

void Namespace::Clear() {
    order_.clear();
    values_.clear();
}

std::vector<Value> Namespace::TakeValues() {
    std::vector<Value> values;
    values.reserve(order_.size());
    for (const auto& name : order_) {
        values.push_back(std::move(values_[name]));
    }
    Clear();
    return values;
}

const Value* CallArgs::Keyword(const std::string& name) const {
    for (const auto& entry : keywords) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

Value* DictObject::Find(const Value& key) {
    RequireHashable(key);
    for (auto& entry : entries) {
        if (KeyEquals(entry.first, key)) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Value* DictObject::Find(const Value& key) const {
    RequireHashable(key);
    for (const auto& entry : entries) {
        if (KeyEquals(entry.first, key)) {
            return &entry.second;
        }
    }
    return nullptr;
}

void DictObject::Set(const Value& key, Value value) {
    if (Value* existing = Find(key)) {
        *existing = std::move(value);
        return;
    }
    entries.emplace_back(key, std::move(value));
}

bool DictObject::Erase(const Value& key) {
    RequireHashable(key);
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (KeyEquals(it->first, key)) {
            entries.erase(it);
            return true;
        }
    }
    return false;
}

std::int64_t RangeObject::Length() const {
    if (step > 0 && start < stop) {
        return (stop - start + step - 1) / step;
    }
    if (step < 0 && start > stop) {
        return (start - stop - step - 1) / (-step);
    }
    return 0;
}

Value BoundMethod::Call(Runtime& rt, CallArgs args) {
    args.positional.insert(args.positional.begin(), self);
    return function->Call(rt, std::move(args));
}

const Value* ClassObject::Lookup(const std::string& attr) const {
    for (const ClassObject* cls = this; cls != nullptr; cls = cls->base.get()) {
        if (const Value* value = cls->attrs.Find(attr)) {
            return value;
        }
    }
    return nullptr;
}

bool ClassObject::IsSubclassOf(const ClassObject& other) const {
    for (const ClassObject* cls = this; cls != nullptr; cls = cls->base.get()) {
        if (cls == &other) {
            return true;
        }
    }
    return false;
}

Value ClassObject::Call(Runtime& rt, CallArgs args) {
    if (constructor) {
        return constructor(rt, args);
    }
    auto self = std::static_pointer_cast<ClassObject>(shared_from_this());
    auto instance = std::make_shared<InstanceObject>(self);
    const Value* init = Lookup("__init__");
    if (init == nullptr) {
        if (!args.positional.empty() || !args.keywords.empty()) {
            if (!unapplied_decorators.empty()) {
                ThrowError("TypeError",
                           name + "() takes no arguments: the __init__ that @" + unapplied_decorators.front() +
                               " generates was never synthesized because the interpreted sandbox runs no "
                               "native decoration pass");
            }
            ThrowError("TypeError", name + "() takes no arguments");
        }
        return Value(instance);
    }
    args.positional.insert(args.positional.begin(), Value(instance));
    const Value result = CallValue(rt, *init, std::move(args));
    if (!result.IsNone()) {
        ThrowError("TypeError", "__init__() should return None, not '" + script::TypeName(result) + "'");
    }
    return Value(instance);
}

Value MakeList(std::vector<Value> items) {
    return Value(std::make_shared<ListObject>(std::move(items)));
}

Value MakeTuple(std::vector<Value> items) {
    return Value(std::make_shared<TupleObject>(std::move(items)));
}

}  // namespace codeact::script
