#include "script/operations.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/runtime.hpp"
#include "utils/common.hpp"

namespace codeact::script {
namespace {

constexpr std::int64_t kIntMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kIntMin = std::numeric_limits<std::int64_t>::min();
constexpr std::size_t kMaxRepeatedLength = 100000000;

[[noreturn]] void IntegerOverflow() {
    ThrowError("OverflowError", "integer result out of range");
}

std::int64_t CheckedAdd(std::int64_t a, std::int64_t b) {
    if ((b > 0 && a > kIntMax - b) || (b < 0 && a < kIntMin - b)) {
        IntegerOverflow();
    }
    return a + b;
}

std::int64_t CheckedSub(std::int64_t a, std::int64_t b) {
    if ((b < 0 && a > kIntMax + b) || (b > 0 && a < kIntMin + b)) {
        IntegerOverflow();
    }
    return a - b;
}

std::int64_t CheckedMul(std::int64_t a, std::int64_t b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    if (a > 0) {
        if (b > 0 ? a > kIntMax / b : b < kIntMin / a) {
            IntegerOverflow();
        }
    } else {
        if (b > 0 ? a < kIntMin / b : b < kIntMax / a) {
            IntegerOverflow();
        }
    }
    return a * b;
}

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        ThrowError("ZeroDivisionError", "integer division or modulo by zero");
    }
    if (a == kIntMin && b == -1) {
        IntegerOverflow();
    }
    std::int64_t quotient = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --quotient;
    }
    return quotient;
}

std::int64_t FloorMod(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        ThrowError("ZeroDivisionError", "integer modulo by zero");
    }
    if (b == -1) {
        return 0;
    }
    std::int64_t remainder = a % b;
    if (remainder != 0 && ((remainder < 0) != (b < 0))) {
        remainder += b;
    }
    return remainder;
}

Value IntPow(std::int64_t base, std::int64_t exponent) {
    if (exponent < 0) {
        if (base == 0) {
            ThrowError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        return Value(std::pow(static_cast<double>(base), static_cast<double>(exponent)));
    }
    std::int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = CheckedMul(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = CheckedMul(base, base);
        }
    }
    return Value(result);
}

double CheckFinite(double result, double a, double b) {
    if (std::isinf(result) && std::isfinite(a) && std::isfinite(b)) {
        ThrowError("OverflowError", "numerical result out of range");
    }
    return result;
}

Value FloatArithmetic(BinaryOp op, double a, double b) {
    switch (op) {
        case BinaryOp::kAdd: return Value(a + b);
        case BinaryOp::kSub: return Value(a - b);
        case BinaryOp::kMul: return Value(a * b);
        case BinaryOp::kDiv:
            if (b == 0.0) {
                ThrowError("ZeroDivisionError", "float division by zero");
            }
            return Value(a / b);
        case BinaryOp::kFloorDiv:
            if (b == 0.0) {
                ThrowError("ZeroDivisionError", "float floor division by zero");
            }
            return Value(std::floor(a / b));
        case BinaryOp::kMod: {
            if (b == 0.0) {
                ThrowError("ZeroDivisionError", "float modulo");
            }
            double remainder = std::fmod(a, b);
            if (remainder != 0.0 && ((remainder < 0) != (b < 0))) {
                remainder += b;
            }
            return Value(remainder);
        }
        case BinaryOp::kPow:
            if (a == 0.0 && b < 0) {
                ThrowError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            }
            if (a < 0 && std::floor(b) != b) {
                ThrowError("ValueError", "math domain error");
            }
            return Value(CheckFinite(std::pow(a, b), a, b));
    }
    return Value();
}

Value IntArithmetic(BinaryOp op, std::int64_t a, std::int64_t b) {
    switch (op) {
        case BinaryOp::kAdd: return Value(CheckedAdd(a, b));
        case BinaryOp::kSub: return Value(CheckedSub(a, b));
        case BinaryOp::kMul: return Value(CheckedMul(a, b));
        case BinaryOp::kDiv:
            if (b == 0) {
                ThrowError("ZeroDivisionError", "division by zero");
            }
            return Value(static_cast<double>(a) / static_cast<double>(b));
        case BinaryOp::kFloorDiv: return Value(FloorDiv(a, b));
        case BinaryOp::kMod: return Value(FloorMod(a, b));
        case BinaryOp::kPow: return IntPow(a, b);
    }
    return Value();
}

std::vector<Value> Repeat(const std::vector<Value>& items, std::int64_t count) {
    std::vector<Value> out;
    if (count <= 0 || items.empty()) {
        return out;
    }
    if (items.size() * static_cast<std::size_t>(count) > kMaxRepeatedLength) {
        ThrowError("OverflowError", "repeated sequence is too long");
    }
    out.reserve(items.size() * static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        out.insert(out.end(), items.begin(), items.end());
    }
    return out;
}

std::string RepeatString(const std::string& text, std::int64_t count) {
    if (count <= 0 || text.empty()) {
        return "";
    }
    if (text.size() * static_cast<std::size_t>(count) > kMaxRepeatedLength) {
        ThrowError("OverflowError", "repeated string is too long");
    }
    std::string out;
    out.reserve(text.size() * static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        out += text;
    }
    return out;
}

bool IsIntegral(const Value& value) {
    return value.IsInt() || value.IsBool();
}

[[noreturn]] void UnsupportedOperands(BinaryOp op, const Value& left, const Value& right) {
    if (op == BinaryOp::kAdd && left.IsStr()) {
        ThrowError("TypeError", "can only concatenate str (not \"" + TypeName(right) + "\") to str");
    }
    ThrowError("TypeError", std::string("unsupported operand type(s) for ") + OperatorSymbol(op) + ": '" +
                                TypeName(left) + "' and '" + TypeName(right) + "'");
}

// -1, 0 or 1; raises TypeError for unordered operands.
int ThreeWay(const Value& left, const Value& right, const char* symbol, Runtime& rt) {
    if (left.IsNumber() && right.IsNumber()) {
        if (left.IsFloat() || right.IsFloat()) {
            const double a = left.AsFloat();
            const double b = right.AsFloat();
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        const std::int64_t a = left.AsInt();
        const std::int64_t b = right.AsInt();
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    if (left.IsStr() && right.IsStr()) {
        const int result = left.AsStr().compare(right.AsStr());
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }
    const std::vector<Value>* a = nullptr;
    const std::vector<Value>* b = nullptr;
    if (auto l = left.As<ListObject>()) {
        if (auto r = right.As<ListObject>()) {
            a = &l->items;
            b = &r->items;
        }
    } else if (auto left_tuple = left.As<TupleObject>()) {
        if (auto right_tuple = right.As<TupleObject>()) {
            a = &left_tuple->items;
            b = &right_tuple->items;
        }
    }
    if (a != nullptr) {
        const std::size_t n = std::min(a->size(), b->size());
        for (std::size_t i = 0; i < n; ++i) {
            if (!Equals((*a)[i], (*b)[i], &rt)) {
                return ThreeWay((*a)[i], (*b)[i], symbol, rt);
            }
        }
        return a->size() < b->size() ? -1 : (a->size() > b->size() ? 1 : 0);
    }
    ThrowError("TypeError", std::string("'") + symbol + "' not supported between instances of '" +
                                TypeName(left) + "' and '" + TypeName(right) + "'");
}

std::int64_t NormalizeIndex(const Value& index, std::size_t size, const std::string& type_name) {
    if (!IsIntegral(index)) {
        ThrowError("TypeError", type_name + " indices must be integers, not '" + TypeName(index) + "'");
    }
    std::int64_t i = index.AsInt();
    if (i < 0) {
        i += static_cast<std::int64_t>(size);
    }
    if (i < 0 || i >= static_cast<std::int64_t>(size)) {
        ThrowError("IndexError", type_name + " index out of range");
    }
    return i;
}

Value BindIfFunction(const Value& self, const Value& attribute) {
    auto callable = attribute.As<CallableObject>();
    if (!callable || attribute.As<ClassObject>() || attribute.As<BoundMethod>()) {
        return attribute;
    }
    return Value(std::make_shared<BoundMethod>(self, callable));
}

}  // namespace

bool Truthy(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::kNone: return false;
        case Value::Kind::kBool: return value.AsBool();
        case Value::Kind::kInt: return value.AsInt() != 0;
        case Value::Kind::kFloat: return value.AsFloat() != 0.0;
        case Value::Kind::kStr: return !value.AsStr().empty();
        case Value::Kind::kObject: break;
    }
    if (auto list = value.As<ListObject>()) return !list->items.empty();
    if (auto tuple = value.As<TupleObject>()) return !tuple->items.empty();
    if (auto dict = value.As<DictObject>()) return !dict->entries.empty();
    if (auto range = value.As<RangeObject>()) return range->Length() > 0;
    return true;
}

std::shared_ptr<ClassObject> ClassOf(const Value& value) {
    const Builtins& builtins = Builtins::Instance();
    switch (value.kind()) {
        case Value::Kind::kNone: return builtins.Class("NoneType");
        case Value::Kind::kBool: return builtins.Class("bool");
        case Value::Kind::kInt: return builtins.Class("int");
        case Value::Kind::kFloat: return builtins.Class("float");
        case Value::Kind::kStr: return builtins.Class("str");
        case Value::Kind::kObject: break;
    }
    const ObjectPtr& object = value.AsObject();
    if (auto instance = std::dynamic_pointer_cast<InstanceObject>(object)) return instance->cls;
    if (std::dynamic_pointer_cast<ClassObject>(object)) return builtins.Class("type");
    if (std::dynamic_pointer_cast<BoundMethod>(object)) return builtins.Class("method");
    if (std::dynamic_pointer_cast<BuiltinFunction>(object)) return builtins.Class("builtin_function_or_method");
    if (std::dynamic_pointer_cast<FunctionObject>(object)) return builtins.Class("function");
    if (auto cls = builtins.Class(object->TypeName())) return cls;
    return builtins.Class("object");
}

std::string TypeName(const Value& value) {
    if (value.IsObject()) {
        return value.AsObject()->TypeName();
    }
    return ClassOf(value)->name;
}

bool IsInstance(const Value& value, const ClassObject& cls) {
    return ClassOf(value)->IsSubclassOf(cls);
}

bool Identical(const Value& a, const Value& b) {
    if (a.kind() != b.kind()) {
        return false;
    }
    switch (a.kind()) {
        case Value::Kind::kNone: return true;
        case Value::Kind::kBool: return a.AsBool() == b.AsBool();
        case Value::Kind::kInt: return a.AsInt() == b.AsInt();
        case Value::Kind::kFloat: return a.AsFloat() == b.AsFloat();
        case Value::Kind::kStr: return a.AsStr() == b.AsStr();
        case Value::Kind::kObject: return a.AsObject() == b.AsObject();
    }
    return false;
}

bool Equals(const Value& a, const Value& b, Runtime* rt) {
    if (a.IsNumber() && b.IsNumber()) {
        if (a.IsFloat() || b.IsFloat()) {
            return a.AsFloat() == b.AsFloat();
        }
        return a.AsInt() == b.AsInt();
    }
    if (a.IsStr() && b.IsStr()) {
        return a.AsStr() == b.AsStr();
    }
    if (a.IsNone() || b.IsNone()) {
        return a.IsNone() && b.IsNone();
    }
    if (!a.IsObject() || !b.IsObject()) {
        return false;
    }
    if (a.AsObject() == b.AsObject()) {
        return true;
    }
    auto sequence_equals = [rt](const std::vector<Value>& x, const std::vector<Value>& y) {
        if (x.size() != y.size()) {
            return false;
        }
        for (std::size_t i = 0; i < x.size(); ++i) {
            if (!Equals(x[i], y[i], rt)) {
                return false;
            }
        }
        return true;
    };
    if (auto l = a.As<ListObject>()) {
        auto r = b.As<ListObject>();
        return r && sequence_equals(l->items, r->items);
    }
    if (auto l = a.As<TupleObject>()) {
        auto r = b.As<TupleObject>();
        return r && sequence_equals(l->items, r->items);
    }
    if (auto l = a.As<DictObject>()) {
        auto r = b.As<DictObject>();
        if (!r || l->entries.size() != r->entries.size()) {
            return false;
        }
        for (const auto& entry : l->entries) {
            const Value* other = r->Find(entry.first);
            if (other == nullptr || !Equals(entry.second, *other, rt)) {
                return false;
            }
        }
        return true;
    }
    if (auto l = a.As<RangeObject>()) {
        auto r = b.As<RangeObject>();
        return r && l->start == r->start && l->stop == r->stop && l->step == r->step;
    }
    if (auto instance = a.As<InstanceObject>()) {
        if (rt != nullptr) {
            if (const Value* eq = instance->cls->Lookup("__eq__")) {
                return Truthy(CallValue(*rt, *eq, std::vector<Value>{a, b}));
            }
        }
    }
    return false;
}

void RequireHashable(const Value& key) {
    if (key.As<ListObject>() || key.As<DictObject>()) {
        ThrowError("TypeError", "unhashable type: '" + TypeName(key) + "'");
    }
    if (auto tuple = key.As<TupleObject>()) {
        for (const auto& item : tuple->items) {
            RequireHashable(item);
        }
    }
}

bool KeyEquals(const Value& a, const Value& b) {
    if (a.IsNumber() && b.IsNumber()) {
        if (a.IsFloat() || b.IsFloat()) {
            return a.AsFloat() == b.AsFloat();
        }
        return a.AsInt() == b.AsInt();
    }
    if (a.IsStr() && b.IsStr()) {
        return a.AsStr() == b.AsStr();
    }
    if (a.IsNone() || b.IsNone()) {
        return a.IsNone() && b.IsNone();
    }
    if (!a.IsObject() || !b.IsObject()) {
        return false;
    }
    auto l = a.As<TupleObject>();
    auto r = b.As<TupleObject>();
    if (l && r) {
        if (l->items.size() != r->items.size()) {
            return false;
        }
        for (std::size_t i = 0; i < l->items.size(); ++i) {
            if (!KeyEquals(l->items[i], r->items[i])) {
                return false;
            }
        }
        return true;
    }
    return a.AsObject() == b.AsObject();
}

Value BinaryOperation(BinaryOp op, const Value& left, const Value& right) {
    if (left.IsNumber() && right.IsNumber()) {
        if (left.IsFloat() || right.IsFloat()) {
            return FloatArithmetic(op, left.AsFloat(), right.AsFloat());
        }
        return IntArithmetic(op, left.AsInt(), right.AsInt());
    }
    switch (op) {
        case BinaryOp::kAdd:
            if (left.IsStr() && right.IsStr()) {
                return Value(left.AsStr() + right.AsStr());
            }
            if (auto l = left.As<ListObject>()) {
                if (auto r = right.As<ListObject>()) {
                    std::vector<Value> items = l->items;
                    items.insert(items.end(), r->items.begin(), r->items.end());
                    return MakeList(std::move(items));
                }
            }
            if (auto l = left.As<TupleObject>()) {
                if (auto r = right.As<TupleObject>()) {
                    std::vector<Value> items = l->items;
                    items.insert(items.end(), r->items.begin(), r->items.end());
                    return MakeTuple(std::move(items));
                }
            }
            break;
        case BinaryOp::kMul: {
            const Value* sequence = IsIntegral(right) ? &left : (IsIntegral(left) ? &right : nullptr);
            if (sequence == nullptr) {
                break;
            }
            const std::int64_t count = sequence == &left ? right.AsInt() : left.AsInt();
            if (sequence->IsStr()) {
                return Value(RepeatString(sequence->AsStr(), count));
            }
            if (auto list = sequence->As<ListObject>()) {
                return MakeList(Repeat(list->items, count));
            }
            if (auto tuple = sequence->As<TupleObject>()) {
                return MakeTuple(Repeat(tuple->items, count));
            }
            break;
        }
        case BinaryOp::kMod:
            if (left.IsStr()) {
                return Value(PercentFormat(left.AsStr(), right));
            }
            break;
        default:
            break;
    }
    UnsupportedOperands(op, left, right);
}

Value UnaryOperation(UnaryOp op, const Value& operand) {
    if (op == UnaryOp::kNot) {
        return Value(!Truthy(operand));
    }
    if (operand.IsFloat()) {
        return Value(op == UnaryOp::kNeg ? -operand.AsFloat() : operand.AsFloat());
    }
    if (IsIntegral(operand)) {
        const std::int64_t value = operand.AsInt();
        if (op == UnaryOp::kPos) {
            return Value(value);
        }
        if (value == kIntMin) {
            IntegerOverflow();
        }
        return Value(-value);
    }
    ThrowError("TypeError", std::string("bad operand type for unary ") + (op == UnaryOp::kNeg ? "-" : "+") +
                                ": '" + TypeName(operand) + "'");
}

bool Compare(CompareOp op, const Value& left, const Value& right, Runtime& rt) {
    switch (op) {
        case CompareOp::kEq: return Equals(left, right, &rt);
        case CompareOp::kNotEq: return !Equals(left, right, &rt);
        case CompareOp::kLt: return ThreeWay(left, right, "<", rt) < 0;
        case CompareOp::kLtE: return ThreeWay(left, right, "<=", rt) <= 0;
        case CompareOp::kGt: return ThreeWay(left, right, ">", rt) > 0;
        case CompareOp::kGtE: return ThreeWay(left, right, ">=", rt) >= 0;
        case CompareOp::kIn: return Contains(right, left, rt);
        case CompareOp::kNotIn: return !Contains(right, left, rt);
        case CompareOp::kIs: return Identical(left, right);
        case CompareOp::kIsNot: return !Identical(left, right);
    }
    return false;
}

bool LessThan(const Value& left, const Value& right, Runtime& rt) {
    return ThreeWay(left, right, "<", rt) < 0;
}

bool Contains(const Value& container, const Value& item, Runtime& rt) {
    if (container.IsStr()) {
        if (!item.IsStr()) {
            ThrowError("TypeError", "'in <string>' requires string as left operand, not " + TypeName(item));
        }
        return container.AsStr().find(item.AsStr()) != std::string::npos;
    }
    if (auto dict = container.As<DictObject>()) {
        return dict->Find(item) != nullptr;
    }
    if (auto range = container.As<RangeObject>()) {
        if (!IsIntegral(item)) {
            return false;
        }
        const std::int64_t value = item.AsInt();
        if (range->step > 0 ? (value < range->start || value >= range->stop)
                            : (value > range->start || value <= range->stop)) {
            return false;
        }
        return (value - range->start) % range->step == 0;
    }
    if (container.As<ListObject>() || container.As<TupleObject>()) {
        bool found = false;
        ForEach(rt, container, [&](const Value& element) {
            found = Equals(element, item, &rt);
            return !found;
        });
        return found;
    }
    ThrowError("TypeError", "argument of type '" + TypeName(container) + "' is not iterable");
}

Value GetAttribute(Runtime& rt, const Value& object, const std::string& name) {
    (void)rt;
    if (auto instance = object.As<InstanceObject>()) {
        if (name == "__class__") {
            return Value(instance->cls);
        }
        if (const Value* value = instance->attrs.Find(name)) {
            return *value;
        }
        if (const Value* value = instance->cls->Lookup(name)) {
            return BindIfFunction(object, *value);
        }
        ThrowError("AttributeError", "'" + instance->cls->name + "' object has no attribute '" + name + "'");
    }
    if (auto cls = object.As<ClassObject>()) {
        if (name == "__name__") {
            return Value(cls->name);
        }
        if (const Value* value = cls->Lookup(name)) {
            return *value;
        }
        ThrowError("AttributeError", "type object '" + cls->name + "' has no attribute '" + name + "'");
    }
    if (auto module = object.As<ModuleObject>()) {
        if (name == "__name__") {
            return Value(module->name);
        }
        if (const Value* value = module->members.Find(name)) {
            return *value;
        }
        ThrowError("AttributeError", "module '" + module->name + "' has no attribute '" + name + "'");
    }
    if (auto callable = object.As<CallableObject>()) {
        if (name == "__name__") {
            return Value(callable->Name());
        }
    }
    Value method = BuiltinTypeMethod(object, name);
    if (!method.IsNone()) {
        return method;
    }
    ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

bool HasAttribute(Runtime& rt, const Value& object, const std::string& name) {
    try {
        GetAttribute(rt, object, name);
        return true;
    } catch (const ScriptException& error) {
        const auto attribute_error = Builtins::Instance().Class("AttributeError");
        if (IsInstance(error.exception(), *attribute_error)) {
            return false;
        }
        throw;
    }
}

void SetAttribute(Runtime& rt, const Value& object, const std::string& name, Value value) {
    (void)rt;
    if (auto instance = object.As<InstanceObject>()) {
        instance->attrs.Set(name, std::move(value));
        return;
    }
    if (auto cls = object.As<ClassObject>()) {
        if (cls->builtin) {
            ThrowError("TypeError", "cannot set '" + name + "' attribute of immutable type '" + cls->name + "'");
        }
        cls->attrs.Set(name, std::move(value));
        return;
    }
    if (auto module = object.As<ModuleObject>()) {
        module->members.Set(name, std::move(value));
        return;
    }
    ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

Value GetItem(Runtime& rt, const Value& object, const Value& index) {
    (void)rt;
    if (auto list = object.As<ListObject>()) {
        return list->items[static_cast<std::size_t>(NormalizeIndex(index, list->items.size(), "list"))];
    }
    if (auto tuple = object.As<TupleObject>()) {
        return tuple->items[static_cast<std::size_t>(NormalizeIndex(index, tuple->items.size(), "tuple"))];
    }
    if (object.IsStr()) {
        const std::vector<std::string> points = utils::SplitCodePoints(object.AsStr());
        return Value(points[static_cast<std::size_t>(NormalizeIndex(index, points.size(), "string"))]);
    }
    if (auto dict = object.As<DictObject>()) {
        if (const Value* value = dict->Find(index)) {
            return *value;
        }
        throw ScriptException(MakeException("KeyError", std::vector<Value>{index}));
    }
    if (auto range = object.As<RangeObject>()) {
        const std::int64_t i = NormalizeIndex(index, static_cast<std::size_t>(range->Length()), "range object");
        return Value(range->start + i * range->step);
    }
    if (object.As<ClassObject>()) {
        // Generic aliases such as list[int] or typing.List[int] evaluate to
        // the class itself.
        return object;
    }
    ThrowError("TypeError", "'" + TypeName(object) + "' object is not subscriptable");
}

void SetItem(Runtime& rt, const Value& object, const Value& index, Value value) {
    (void)rt;
    if (auto list = object.As<ListObject>()) {
        list->items[static_cast<std::size_t>(NormalizeIndex(index, list->items.size(), "list"))] = std::move(value);
        return;
    }
    if (auto dict = object.As<DictObject>()) {
        dict->Set(index, std::move(value));
        return;
    }
    ThrowError("TypeError", "'" + TypeName(object) + "' object does not support item assignment");
}

void DelItem(Runtime& rt, const Value& object, const Value& index) {
    (void)rt;
    if (auto list = object.As<ListObject>()) {
        const std::int64_t i = NormalizeIndex(index, list->items.size(), "list");
        list->items.erase(list->items.begin() + i);
        return;
    }
    if (auto dict = object.As<DictObject>()) {
        if (!dict->Erase(index)) {
            throw ScriptException(MakeException("KeyError", std::vector<Value>{index}));
        }
        return;
    }
    ThrowError("TypeError", "'" + TypeName(object) + "' object does not support item deletion");
}

void ForEach(Runtime& rt, const Value& iterable, const std::function<bool(const Value&)>& body) {
    (void)rt;
    if (auto list = iterable.As<ListObject>()) {
        for (std::size_t i = 0; i < list->items.size(); ++i) {
            const Value item = list->items[i];
            if (!body(item)) {
                return;
            }
        }
        return;
    }
    if (auto tuple = iterable.As<TupleObject>()) {
        for (const auto& item : tuple->items) {
            if (!body(item)) {
                return;
            }
        }
        return;
    }
    if (iterable.IsStr()) {
        const std::vector<std::string> points = utils::SplitCodePoints(iterable.AsStr());
        for (const std::string& point : points) {
            if (!body(Value(point))) {
                return;
            }
        }
        return;
    }
    if (auto dict = iterable.As<DictObject>()) {
        std::vector<Value> keys;
        keys.reserve(dict->entries.size());
        for (const auto& entry : dict->entries) {
            keys.push_back(entry.first);
        }
        for (const auto& key : keys) {
            if (!body(key)) {
                return;
            }
        }
        return;
    }
    if (auto range = iterable.As<RangeObject>()) {
        const std::int64_t length = range->Length();
        for (std::int64_t i = 0; i < length; ++i) {
            if (!body(Value(range->start + i * range->step))) {
                return;
            }
        }
        return;
    }
    ThrowError("TypeError", "'" + TypeName(iterable) + "' object is not iterable");
}

std::vector<Value> ToVector(Runtime& rt, const Value& iterable) {
    if (auto list = iterable.As<ListObject>()) {
        return list->items;
    }
    if (auto tuple = iterable.As<TupleObject>()) {
        return tuple->items;
    }
    std::vector<Value> out;
    ForEach(rt, iterable, [&](const Value& item) {
        out.push_back(item);
        return true;
    });
    return out;
}

std::vector<Value> Unpack(Runtime& rt, const Value& value, std::size_t count) {
    if (!value.IsObject() && !value.IsStr()) {
        ThrowError("TypeError", "cannot unpack non-iterable " + TypeName(value) + " object");
    }
    std::vector<Value> items = ToVector(rt, value);
    if (items.size() < count) {
        ThrowError("ValueError", "not enough values to unpack (expected " + std::to_string(count) + ", got " +
                                     std::to_string(items.size()) + ")");
    }
    if (items.size() > count) {
        ThrowError("ValueError", "too many values to unpack (expected " + std::to_string(count) + ")");
    }
    return items;
}

Value CallValue(Runtime& rt, const Value& callee, CallArgs args) {
    auto callable = callee.As<CallableObject>();
    if (!callable) {
        ThrowError("TypeError", "'" + TypeName(callee) + "' object is not callable");
    }
    return callable->Call(rt, std::move(args));
}

Value CallValue(Runtime& rt, const Value& callee, std::vector<Value> positional) {
    CallArgs args;
    args.positional = std::move(positional);
    return CallValue(rt, callee, std::move(args));
}

bool ExceptionMatches(const Value& exception, const Value& handler) {
    const auto base = Builtins::Instance().Class("BaseException");
    if (auto cls = handler.As<ClassObject>()) {
        if (!cls->IsSubclassOf(*base)) {
            ThrowError("TypeError", "catching classes that do not inherit from BaseException is not allowed");
        }
        return IsInstance(exception, *cls);
    }
    if (auto tuple = handler.As<TupleObject>()) {
        for (const auto& item : tuple->items) {
            if (ExceptionMatches(exception, item)) {
                return true;
            }
        }
        return false;
    }
    ThrowError("TypeError", "catching classes that do not inherit from BaseException is not allowed");
}

}  // namespace codeact::script
