#include <algorithm>
#include <cctype>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/native.hpp"
#include "script/operations.hpp"
#include "script/runtime.hpp"
#include "utils/common.hpp"

namespace codeact::script {
namespace {

std::string Strip(const std::string& text, const std::string& chars, bool left, bool right) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    if (left) {
        while (begin < end && chars.find(text[begin]) != std::string::npos) {
            ++begin;
        }
    }
    if (right) {
        while (end > begin && chars.find(text[end - 1]) != std::string::npos) {
            --end;
        }
    }
    return text.substr(begin, end - begin);
}

std::vector<Value> Split(const std::string& text, const Value* separator, std::int64_t max_split) {
    std::vector<Value> parts;
    if (separator == nullptr || separator->IsNone()) {
        std::size_t i = 0;
        while (i < text.size()) {
            while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            if (i >= text.size()) {
                break;
            }
            if (max_split >= 0 && static_cast<std::int64_t>(parts.size()) >= max_split) {
                parts.push_back(Value(Strip(text.substr(i), " \t\r\n\f\v", false, true)));
                return parts;
            }
            const std::size_t start = i;
            while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            parts.push_back(Value(text.substr(start, i - start)));
        }
        return parts;
    }
    const std::string& sep = StrArgument(*separator, "separator");
    if (sep.empty()) {
        ThrowError("ValueError", "empty separator");
    }
    std::size_t start = 0;
    while (true) {
        if (max_split >= 0 && static_cast<std::int64_t>(parts.size()) >= max_split) {
            break;
        }
        const std::size_t found = text.find(sep, start);
        if (found == std::string::npos) {
            break;
        }
        parts.push_back(Value(text.substr(start, found - start)));
        start = found + sep.size();
    }
    parts.push_back(Value(text.substr(start)));
    return parts;
}

bool AffixMatches(const std::string& text, const Value& affix, bool prefix) {
    auto matches = [&](const Value& candidate) {
        const std::string& value = StrArgument(candidate, prefix ? "startswith arg" : "endswith arg");
        if (value.size() > text.size()) {
            return false;
        }
        return prefix ? text.compare(0, value.size(), value) == 0
                      : text.compare(text.size() - value.size(), value.size(), value) == 0;
    };
    if (auto tuple = affix.As<TupleObject>()) {
        return std::any_of(tuple->items.begin(), tuple->items.end(), matches);
    }
    return matches(affix);
}

std::string ChangeCase(std::string text, bool upper) {
    for (auto& c : text) {
        const auto byte = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(byte) : std::tolower(byte));
    }
    return text;
}

std::size_t CountOccurrences(const std::string& text, const std::string& sub) {
    if (sub.empty()) {
        return text.size() + 1;
    }
    std::size_t count = 0;
    for (std::size_t pos = text.find(sub); pos != std::string::npos; pos = text.find(sub, pos + sub.size())) {
        ++count;
    }
    return count;
}

template <typename Predicate>
bool AllChars(const std::string& text, Predicate predicate) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [&](char c) {
        return predicate(static_cast<unsigned char>(c));
    });
}

Value StrMethod(const std::string& self, const std::string& name) {
    const std::string qualified = "str." + name;
    if (name == "upper" || name == "lower") {
        const bool upper = name == "upper";
        return NativeFunction(name, [self, upper, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            return Value(ChangeCase(self, upper));
        });
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        const bool left = name != "rstrip";
        const bool right = name != "lstrip";
        return NativeFunction(name, [self, left, right, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 1);
            std::string chars = " \t\r\n\f\v";
            if (!args.positional.empty() && !args.positional[0].IsNone()) {
                chars = StrArgument(args.positional[0], qualified + " arg");
            }
            return Value(Strip(self, chars, left, right));
        });
    }
    if (name == "split") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 2);
            CheckKeywords(args, qualified, {"sep", "maxsplit"});
            const Value* max_split = Argument(args, 1, "maxsplit");
            return MakeList(Split(self, Argument(args, 0, "sep"),
                                  max_split != nullptr ? IntArgument(*max_split, "maxsplit") : -1));
        });
    }
    if (name == "splitlines") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            std::vector<Value> lines;
            std::size_t start = 0;
            for (std::size_t i = 0; i < self.size(); ++i) {
                if (self[i] == '\n') {
                    std::size_t end = i;
                    if (end > start && self[end - 1] == '\r') {
                        --end;
                    }
                    lines.push_back(Value(self.substr(start, end - start)));
                    start = i + 1;
                }
            }
            if (start < self.size()) {
                lines.push_back(Value(self.substr(start)));
            }
            return MakeList(std::move(lines));
        });
    }
    if (name == "join") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            std::string out;
            bool first = true;
            ForEach(rt, args.positional[0], [&](const Value& item) {
                if (!item.IsStr()) {
                    ThrowError("TypeError", "sequence item: expected str instance, " + TypeName(item) + " found");
                }
                if (!first) {
                    out += self;
                }
                out += item.AsStr();
                first = false;
                return true;
            });
            return Value(out);
        });
    }
    if (name == "replace") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 2, 3);
            const std::string& old_text = StrArgument(args.positional[0], "replace() argument 1");
            const std::string& new_text = StrArgument(args.positional[1], "replace() argument 2");
            std::int64_t remaining = args.positional.size() > 2 ? IntArgument(args.positional[2], "count") : -1;
            if (old_text.empty()) {
                return Value(self);
            }
            std::string out;
            std::size_t start = 0;
            while (remaining != 0) {
                const std::size_t found = self.find(old_text, start);
                if (found == std::string::npos) {
                    break;
                }
                out += self.substr(start, found - start) + new_text;
                start = found + old_text.size();
                --remaining;
            }
            out += self.substr(start);
            return Value(out);
        });
    }
    if (name == "startswith" || name == "endswith") {
        const bool prefix = name == "startswith";
        return NativeFunction(name, [self, prefix, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            return Value(AffixMatches(self, args.positional[0], prefix));
        });
    }
    if (name == "find" || name == "index") {
        const bool raise = name == "index";
        return NativeFunction(name, [self, raise, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            const std::size_t found = self.find(StrArgument(args.positional[0], qualified + " arg"));
            if (found == std::string::npos) {
                if (raise) {
                    ThrowError("ValueError", "substring not found");
                }
                return Value(-1);
            }
            return Value(static_cast<std::int64_t>(utils::CodePointCount(self.substr(0, found))));
        });
    }
    if (name == "count") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            const std::string& sub = StrArgument(args.positional[0], qualified + " arg");
            return Value(static_cast<std::int64_t>(CountOccurrences(self, sub)));
        });
    }
    if (name == "format") {
        return NativeFunction(name, [self](Runtime& rt, CallArgs& args) {
            return Value(StrFormat(rt, self, args));
        });
    }
    if (name == "isdigit" || name == "isalpha" || name == "isalnum" || name == "isspace" ||
        name == "isupper" || name == "islower") {
        return NativeFunction(name, [self, name, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            if (name == "isdigit") {
                return Value(AllChars(self, [](unsigned char c) { return std::isdigit(c) != 0; }));
            }
            if (name == "isalpha") {
                return Value(AllChars(self, [](unsigned char c) { return std::isalpha(c) != 0; }));
            }
            if (name == "isalnum") {
                return Value(AllChars(self, [](unsigned char c) { return std::isalnum(c) != 0; }));
            }
            if (name == "isspace") {
                return Value(AllChars(self, [](unsigned char c) { return std::isspace(c) != 0; }));
            }
            const bool want_upper = name == "isupper";
            bool cased = false;
            for (const char c : self) {
                const auto byte = static_cast<unsigned char>(c);
                if (std::isalpha(byte)) {
                    cased = true;
                    if ((std::isupper(byte) != 0) != want_upper) {
                        return Value(false);
                    }
                }
            }
            return Value(cased);
        });
    }
    if (name == "title" || name == "capitalize") {
        const bool title = name == "title";
        return NativeFunction(name, [self, title, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            std::string out = self;
            bool start = true;
            for (std::size_t i = 0; i < out.size(); ++i) {
                const auto byte = static_cast<unsigned char>(out[i]);
                if (title) {
                    out[i] = static_cast<char>(start ? std::toupper(byte) : std::tolower(byte));
                    start = !std::isalpha(byte);
                } else {
                    out[i] = static_cast<char>(i == 0 ? std::toupper(byte) : std::tolower(byte));
                }
            }
            return Value(out);
        });
    }
    if (name == "zfill" || name == "ljust" || name == "rjust" || name == "center") {
        return NativeFunction(name, [self, name, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, name == "zfill" ? 1 : 2);
            const std::int64_t width = IntArgument(args.positional[0], "width");
            const std::size_t length = utils::CodePointCount(self);
            if (width <= static_cast<std::int64_t>(length)) {
                return Value(self);
            }
            const std::size_t padding = static_cast<std::size_t>(width) - length;
            if (name == "zfill") {
                const bool signed_value = !self.empty() && (self[0] == '-' || self[0] == '+');
                if (signed_value) {
                    return Value(self.substr(0, 1) + std::string(padding, '0') + self.substr(1));
                }
                return Value(std::string(padding, '0') + self);
            }
            char fill = ' ';
            if (args.positional.size() > 1) {
                const std::string& fill_text = StrArgument(args.positional[1], "fill character");
                if (fill_text.size() != 1) {
                    ThrowError("TypeError", "The fill character must be exactly one character long");
                }
                fill = fill_text[0];
            }
            if (name == "ljust") {
                return Value(self + std::string(padding, fill));
            }
            if (name == "rjust") {
                return Value(std::string(padding, fill) + self);
            }
            const std::size_t left = padding / 2;
            return Value(std::string(left, fill) + self + std::string(padding - left, fill));
        });
    }
    return Value();
}

void SortValues(Runtime& rt, std::vector<Value>& items, const Value* key, bool reverse) {
    if (key == nullptr || key->IsNone()) {
        std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b) {
            return reverse ? LessThan(b, a, rt) : LessThan(a, b, rt);
        });
        return;
    }
    std::vector<std::pair<Value, Value>> keyed;
    keyed.reserve(items.size());
    for (const auto& item : items) {
        keyed.emplace_back(CallValue(rt, *key, std::vector<Value>{item}), item);
    }
    std::stable_sort(keyed.begin(), keyed.end(), [&](const auto& a, const auto& b) {
        return reverse ? LessThan(b.first, a.first, rt) : LessThan(a.first, b.first, rt);
    });
    for (std::size_t i = 0; i < items.size(); ++i) {
        items[i] = keyed[i].second;
    }
}

std::int64_t IndexOf(const std::vector<Value>& items, const Value& needle, Runtime& rt) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (Equals(items[i], needle, &rt)) {
            return static_cast<std::int64_t>(i);
        }
    }
    return -1;
}

std::int64_t CountOf(const std::vector<Value>& items, const Value& needle, Runtime& rt) {
    std::int64_t count = 0;
    for (const auto& item : items) {
        if (Equals(item, needle, &rt)) {
            ++count;
        }
    }
    return count;
}

Value ListMethod(const std::shared_ptr<ListObject>& self, const std::string& name) {
    const std::string qualified = "list." + name;
    if (name == "append") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            self->items.push_back(args.positional[0]);
            return Value();
        });
    }
    if (name == "extend") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            std::vector<Value> extra = ToVector(rt, args.positional[0]);
            self->items.insert(self->items.end(), extra.begin(), extra.end());
            return Value();
        });
    }
    if (name == "insert") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 2, 2);
            const auto size = static_cast<std::int64_t>(self->items.size());
            std::int64_t index = IntArgument(args.positional[0], "index");
            if (index < 0) {
                index = std::max<std::int64_t>(0, index + size);
            }
            index = std::min(index, size);
            self->items.insert(self->items.begin() + index, args.positional[1]);
            return Value();
        });
    }
    if (name == "pop") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 1);
            if (self->items.empty()) {
                ThrowError("IndexError", "pop from empty list");
            }
            const auto size = static_cast<std::int64_t>(self->items.size());
            std::int64_t index = args.positional.empty() ? size - 1 : IntArgument(args.positional[0], "index");
            if (index < 0) {
                index += size;
            }
            if (index < 0 || index >= size) {
                ThrowError("IndexError", "pop index out of range");
            }
            Value item = self->items[static_cast<std::size_t>(index)];
            self->items.erase(self->items.begin() + index);
            return item;
        });
    }
    if (name == "remove") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            const std::int64_t index = IndexOf(self->items, args.positional[0], rt);
            if (index < 0) {
                ThrowError("ValueError", "list.remove(x): x not in list");
            }
            self->items.erase(self->items.begin() + index);
            return Value();
        });
    }
    if (name == "index") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            const std::int64_t index = IndexOf(self->items, args.positional[0], rt);
            if (index < 0) {
                ThrowError("ValueError", Repr(args.positional[0], &rt) + " is not in list");
            }
            return Value(index);
        });
    }
    if (name == "count") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            return Value(CountOf(self->items, args.positional[0], rt));
        });
    }
    if (name == "clear") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            self->items.clear();
            return Value();
        });
    }
    if (name == "reverse") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            std::reverse(self->items.begin(), self->items.end());
            return Value();
        });
    }
    if (name == "copy") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            return MakeList(self->items);
        });
    }
    if (name == "sort") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            CheckKeywords(args, qualified, {"key", "reverse"});
            const Value* reverse = args.Keyword("reverse");
            std::vector<Value> items = self->items;
            SortValues(rt, items, args.Keyword("key"), reverse != nullptr && Truthy(*reverse));
            self->items = std::move(items);
            return Value();
        });
    }
    return Value();
}

Value TupleMethod(const std::shared_ptr<TupleObject>& self, const std::string& name) {
    const std::string qualified = "tuple." + name;
    if (name == "count") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            return Value(CountOf(self->items, args.positional[0], rt));
        });
    }
    if (name == "index") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 1, 1);
            const std::int64_t index = IndexOf(self->items, args.positional[0], rt);
            if (index < 0) {
                ThrowError("ValueError", "tuple.index(x): x not in tuple");
            }
            return Value(index);
        });
    }
    return Value();
}

Value DictMethod(const std::shared_ptr<DictObject>& self, const std::string& name) {
    const std::string qualified = "dict." + name;
    if (name == "keys" || name == "values" || name == "items") {
        return NativeFunction(name, [self, name, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            std::vector<Value> out;
            out.reserve(self->entries.size());
            for (const auto& entry : self->entries) {
                if (name == "keys") {
                    out.push_back(entry.first);
                } else if (name == "values") {
                    out.push_back(entry.second);
                } else {
                    out.push_back(MakeTuple({entry.first, entry.second}));
                }
            }
            return MakeList(std::move(out));
        });
    }
    if (name == "get") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 2);
            if (const Value* value = self->Find(args.positional[0])) {
                return *value;
            }
            return args.positional.size() > 1 ? args.positional[1] : Value();
        });
    }
    if (name == "pop") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 2);
            if (const Value* value = self->Find(args.positional[0])) {
                Value result = *value;
                self->Erase(args.positional[0]);
                return result;
            }
            if (args.positional.size() > 1) {
                return args.positional[1];
            }
            throw ScriptException(MakeException("KeyError", std::vector<Value>{args.positional[0]}));
        });
    }
    if (name == "setdefault") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 1, 2);
            if (const Value* value = self->Find(args.positional[0])) {
                return *value;
            }
            Value fallback = args.positional.size() > 1 ? args.positional[1] : Value();
            self->Set(args.positional[0], fallback);
            return fallback;
        });
    }
    if (name == "update") {
        return NativeFunction(name, [self, qualified](Runtime& rt, CallArgs& args) {
            CheckArity(args, qualified, 0, 1);
            if (!args.positional.empty()) {
                if (auto other = args.positional[0].As<DictObject>()) {
                    const auto entries = other->entries;
                    for (const auto& entry : entries) {
                        self->Set(entry.first, entry.second);
                    }
                } else {
                    for (const auto& pair : ToVector(rt, args.positional[0])) {
                        const auto kv = Unpack(rt, pair, 2);
                        self->Set(kv[0], kv[1]);
                    }
                }
            }
            for (const auto& keyword : args.keywords) {
                self->Set(Value(keyword.first), keyword.second);
            }
            return Value();
        });
    }
    if (name == "clear") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            self->entries.clear();
            return Value();
        });
    }
    if (name == "copy") {
        return NativeFunction(name, [self, qualified](Runtime&, CallArgs& args) {
            CheckArity(args, qualified, 0, 0);
            auto copy = std::make_shared<DictObject>();
            copy->entries = self->entries;
            return Value(copy);
        });
    }
    return Value();
}

}  // namespace

Value BuiltinTypeMethod(const Value& receiver, const std::string& name) {
    if (receiver.IsStr()) {
        return StrMethod(receiver.AsStr(), name);
    }
    if (auto list = receiver.As<ListObject>()) {
        return ListMethod(list, name);
    }
    if (auto tuple = receiver.As<TupleObject>()) {
        return TupleMethod(tuple, name);
    }
    if (auto dict = receiver.As<DictObject>()) {
        return DictMethod(dict, name);
    }
    return Value();
}

}  // namespace codeact::script
