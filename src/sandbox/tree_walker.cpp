#include "sandbox/tree_walker.hpp"

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/operations.hpp"
#include "script/semantics.hpp"
#include "utils/logging.hpp"

namespace codeact::sandbox {

using script::Value;

namespace {

constexpr std::int64_t kMaxWhileIterations = 1000000;

struct BreakSignal {};
struct ContinueSignal {};
struct ReturnSignal {
    Value value;
};

bool IsDunder(const std::string& name) {
    return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

void CheckDunderAccess(const std::string& name) {
    static const std::unordered_set<std::string> allowed = {
        "__init__", "__name__", "__class__", "__repr__", "__str__", "__eq__", "__len__", "__post_init__",
        "__match_args__"
    };
    if (IsDunder(name) && allowed.count(name) == 0) {
        script::ThrowError("AttributeError", "Forbidden access to dunder attribute: " + name);
    }
}

class InterpretedFunction : public script::FunctionObject {
public:
    InterpretedFunction(std::shared_ptr<script::FunctionDefStmt> def, std::vector<Value> defaults,
                        std::shared_ptr<Scope> closure, std::weak_ptr<script::Namespace> globals)
        : def_(std::move(def)), defaults_(std::move(defaults)), closure_(std::move(closure)),
          globals_(std::move(globals)) {
        for (const auto& param : def_->params) {
            params_.push_back(param.name);
        }
    }

    std::string Name() const override { return def_->name; }

    Value Call(script::Runtime& rt, script::CallArgs args) override {
        auto globals = globals_.lock();
        if (!globals) {
            script::ThrowError("RuntimeError", "function '" + def_->name + "' outlived its session context");
        }
        auto scope = std::make_shared<Scope>();
        scope->enclosing = closure_;
        auto values = script::BindArguments(def_->name, params_, defaults_, std::move(args));
        for (std::size_t i = 0; i < params_.size(); ++i) {
            scope->locals->Set(params_[i], std::move(values[i]));
        }
        script::Runtime::CallScope frame(rt, def_->name);
        try {
            TreeWalker walker(rt, globals, scope);
            walker.ExecBlock(def_->body);
        } catch (ReturnSignal& signal) {
            return std::move(signal.value);
        } catch (script::ScriptException& error) {
            rt.AttachTrace(error);
            throw;
        }
        return Value();
    }

private:
    std::shared_ptr<script::FunctionDefStmt> def_;
    std::vector<std::string> params_;
    std::vector<Value> defaults_;
    std::shared_ptr<Scope> closure_;
    std::weak_ptr<script::Namespace> globals_;
};

}  // namespace

TreeWalker::TreeWalker(script::Runtime& rt, std::shared_ptr<script::Namespace> globals, std::shared_ptr<Scope> scope)
    : rt_(rt), globals_(std::move(globals)), scope_(std::move(scope)) {}

// ---------------------------------------------------------------------------
// Names

bool TreeWalker::BindsGlobally(const std::string& name) const {
    return !scope_ || scope_->declared_globals.count(name) > 0;
}

std::shared_ptr<Scope> TreeWalker::ClosureScope() const {
    if (scope_ && scope_->is_class) {
        return scope_->enclosing;
    }
    return scope_;
}

Value TreeWalker::Load(const std::string& name) {
    if (!BindsGlobally(name)) {
        if (const Value* value = scope_->locals->Find(name)) {
            return *value;
        }
        for (const Scope* scope = scope_->enclosing.get(); scope != nullptr; scope = scope->enclosing.get()) {
            if (const Value* value = scope->locals->Find(name)) {
                return *value;
            }
        }
    }
    if (const Value* value = globals_->Find(name)) {
        return *value;
    }
    if (const Value* value = rt_.LookupFallback(name)) {
        return *value;
    }
    script::ThrowError("NameError", "name '" + name + "' is not defined");
}

void TreeWalker::Store(const std::string& name, Value value) {
    if (BindsGlobally(name)) {
        globals_->Set(name, std::move(value));
        return;
    }
    scope_->locals->Set(name, std::move(value));
}

void TreeWalker::Assign(const script::Expr& target, Value value) {
    switch (target.kind) {
        case script::ExprKind::kName:
            Store(static_cast<const script::NameExpr&>(target).id, std::move(value));
            return;
        case script::ExprKind::kAttribute: {
            const auto& attribute = static_cast<const script::AttributeExpr&>(target);
            CheckDunderAccess(attribute.attr);
            script::SetAttribute(rt_, Eval(*attribute.object), attribute.attr, std::move(value));
            return;
        }
        case script::ExprKind::kSubscript: {
            const auto& subscript = static_cast<const script::SubscriptExpr&>(target);
            const Value object = Eval(*subscript.object);
            script::SetItem(rt_, object, Eval(*subscript.index), std::move(value));
            return;
        }
        case script::ExprKind::kTuple:
        case script::ExprKind::kList: {
            const auto& elements = static_cast<const script::SequenceExpr&>(target).elements;
            auto items = script::Unpack(rt_, value, elements.size());
            for (std::size_t i = 0; i < elements.size(); ++i) {
                Assign(*elements[i], std::move(items[i]));
            }
            return;
        }
        default:
            break;
    }
    script::ThrowError("RuntimeError", std::string("cannot assign to ") + script::KindName(target.kind));
}

// ---------------------------------------------------------------------------
// Statements

void TreeWalker::ExecBlock(const script::Block& block) {
    for (const auto& stmt : block) {
        Exec(stmt);
    }
}

void TreeWalker::Exec(const script::StmtPtr& stmt) {
    rt_.SetLine(stmt->line);
    switch (stmt->kind) {
        case script::StmtKind::kExpr:
            Eval(*static_cast<const script::ExprStmt&>(*stmt).value);
            return;
        case script::StmtKind::kAssign: {
            const auto& assign = static_cast<const script::AssignStmt&>(*stmt);
            const Value value = Eval(*assign.value);
            for (const auto& target : assign.targets) {
                Assign(*target, value);
            }
            return;
        }
        case script::StmtKind::kAugAssign:
            ExecAugAssign(static_cast<const script::AugAssignStmt&>(*stmt));
            return;
        case script::StmtKind::kAnnAssign: {
            const auto& assign = static_cast<const script::AnnAssignStmt&>(*stmt);
            if (assign.value) {
                Assign(*assign.target, Eval(*assign.value));
            }
            return;
        }
        case script::StmtKind::kIf:
            ExecIf(static_cast<const script::IfStmt&>(*stmt));
            return;
        case script::StmtKind::kWhile:
            ExecWhile(static_cast<const script::WhileStmt&>(*stmt));
            return;
        case script::StmtKind::kFor:
            ExecFor(static_cast<const script::ForStmt&>(*stmt));
            return;
        case script::StmtKind::kBreak:
            throw BreakSignal{};
        case script::StmtKind::kContinue:
            throw ContinueSignal{};
        case script::StmtKind::kPass:
            return;
        case script::StmtKind::kReturn: {
            const auto& ret = static_cast<const script::ReturnStmt&>(*stmt);
            throw ReturnSignal{ret.value ? Eval(*ret.value) : Value()};
        }
        case script::StmtKind::kFunctionDef:
            ExecFunctionDef(std::static_pointer_cast<script::FunctionDefStmt>(stmt));
            return;
        case script::StmtKind::kClassDef:
            ExecClassDef(static_cast<const script::ClassDefStmt&>(*stmt));
            return;
        case script::StmtKind::kImport:
            for (auto& binding : script::ImportBindings(rt_, static_cast<const script::ImportStmt&>(*stmt))) {
                Store(binding.first, std::move(binding.second));
            }
            return;
        case script::StmtKind::kImportFrom:
            for (auto& binding : script::ImportBindings(rt_, static_cast<const script::ImportFromStmt&>(*stmt))) {
                Store(binding.first, std::move(binding.second));
            }
            return;
        case script::StmtKind::kTry:
            ExecTry(static_cast<const script::TryStmt&>(*stmt));
            return;
        case script::StmtKind::kRaise: {
            const auto& raise = static_cast<const script::RaiseStmt&>(*stmt);
            if (!raise.exception) {
                if (const script::ScriptException* active = rt_.CurrentHandled()) {
                    throw script::ScriptException(*active);
                }
                script::ThrowError("RuntimeError", "No active exception to reraise");
            }
            throw script::ScriptException(script::MakeRaisable(rt_, Eval(*raise.exception)));
        }
        case script::StmtKind::kGlobal:
            if (scope_) {
                for (const auto& name : static_cast<const script::GlobalStmt&>(*stmt).names) {
                    scope_->declared_globals.insert(name);
                }
            }
            return;
        case script::StmtKind::kDelete:
            for (const auto& target : static_cast<const script::DeleteStmt&>(*stmt).targets) {
                ExecDelete(*target);
            }
            return;
        case script::StmtKind::kAssert: {
            const auto& assertion = static_cast<const script::AssertStmt&>(*stmt);
            if (!script::Truthy(Eval(*assertion.test))) {
                if (assertion.message) {
                    const Value message = Eval(*assertion.message);
                    script::RaiseAssertion(&message);
                }
                script::RaiseAssertion(nullptr);
            }
            return;
        }
        case script::StmtKind::kMatch:
            script::ThrowError("NotImplementedError",
                               "match statements are not supported by the interpreted sandbox");
    }
}

void TreeWalker::ExecIf(const script::IfStmt& stmt) {
    if (script::Truthy(Eval(*stmt.test))) {
        ExecBlock(stmt.body);
    } else {
        ExecBlock(stmt.orelse);
    }
}

void TreeWalker::ExecWhile(const script::WhileStmt& stmt) {
    std::int64_t iterations = 0;
    while (script::Truthy(Eval(*stmt.test))) {
        if (++iterations > kMaxWhileIterations) {
            script::ThrowError("RuntimeError", "Maximum number of " + std::to_string(kMaxWhileIterations) +
                                                   " iterations in While loop exceeded");
        }
        try {
            ExecBlock(stmt.body);
        } catch (const BreakSignal&) {
            return;
        } catch (const ContinueSignal&) {
        }
    }
}

void TreeWalker::ExecFor(const script::ForStmt& stmt) {
    const Value iterable = Eval(*stmt.iter);
    script::ForEach(rt_, iterable, [&](const Value& item) {
        Assign(*stmt.target, item);
        try {
            ExecBlock(stmt.body);
        } catch (const BreakSignal&) {
            return false;
        } catch (const ContinueSignal&) {
        }
        return true;
    });
}

void TreeWalker::ExecTry(const script::TryStmt& stmt) {
    std::exception_ptr pending;
    try {
        bool raised = false;
        try {
            ExecBlock(stmt.body);
        } catch (script::ScriptException& error) {
            raised = true;
            rt_.AttachTrace(error);
            const script::ExceptHandler* matched = nullptr;
            for (const auto& handler : stmt.handlers) {
                if (!handler.type || script::ExceptionMatches(error.exception(), Eval(*handler.type))) {
                    matched = &handler;
                    break;
                }
            }
            if (matched == nullptr) {
                throw;
            }
            script::Runtime::HandlerScope handling(rt_, error);
            if (!matched->name.empty()) {
                Store(matched->name, error.exception());
            }
            ExecBlock(matched->body);
            if (!matched->name.empty()) {
                if (BindsGlobally(matched->name)) {
                    globals_->Erase(matched->name);
                } else {
                    scope_->locals->Erase(matched->name);
                }
            }
        }
        if (!raised) {
            ExecBlock(stmt.orelse);
        }
    } catch (const script::CapabilityError&) {
        throw;
    } catch (...) {
        if (stmt.finalbody.empty()) {
            throw;
        }
        pending = std::current_exception();
    }
    ExecBlock(stmt.finalbody);
    if (pending) {
        std::rethrow_exception(pending);
    }
}

void TreeWalker::ExecFunctionDef(const std::shared_ptr<script::FunctionDefStmt>& def) {
    std::vector<Value> decorators;
    for (const auto& decorator : def->decorators) {
        decorators.push_back(Eval(*decorator));
    }
    std::vector<Value> defaults;
    for (const auto& param : def->params) {
        if (param.default_value) {
            defaults.push_back(Eval(*param.default_value));
        }
    }
    Value function(std::make_shared<InterpretedFunction>(def, std::move(defaults), ClosureScope(), globals_));
    for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) {
        function = script::CallValue(rt_, *it, std::vector<Value>{function});
    }
    Store(def->name, std::move(function));
}

void TreeWalker::ExecClassDef(const script::ClassDefStmt& def) {
    std::vector<Value> decorators;
    for (const auto& decorator : def.decorators) {
        decorators.push_back(Eval(*decorator));
    }
    std::vector<Value> bases;
    for (const auto& base : def.bases) {
        bases.push_back(Eval(*base));
    }
    auto cls = script::NewUserClass(def.name, bases);

    auto body_scope = std::make_shared<Scope>();
    body_scope->is_class = true;
    body_scope->enclosing = ClosureScope();
    TreeWalker body(rt_, globals_, body_scope);
    body.ExecBlock(def.body);
    for (const auto& name : body_scope->locals->Names()) {
        cls->attrs.Set(name, *body_scope->locals->Find(name));
    }

    Value result(cls);
    for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) {
        if (script::IsNativeDecorator(*it)) {
            const std::string name = it->As<script::BuiltinFunction>()->Name();
            utils::Log(utils::LogLevel::kDebug, "interpreted",
                       "class " + def.name + ": native decorator @" + name + " left unapplied");
            cls->unapplied_decorators.push_back(name);
            continue;
        }
        result = script::CallValue(rt_, *it, std::vector<Value>{result});
    }
    Store(def.name, std::move(result));
}

void TreeWalker::ExecAugAssign(const script::AugAssignStmt& stmt) {
    switch (stmt.target->kind) {
        case script::ExprKind::kName: {
            const std::string& name = static_cast<const script::NameExpr&>(*stmt.target).id;
            const Value current = Load(name);
            Store(name, script::InPlaceOperation(stmt.op, current, Eval(*stmt.value), rt_));
            return;
        }
        case script::ExprKind::kAttribute: {
            const auto& attribute = static_cast<const script::AttributeExpr&>(*stmt.target);
            const Value object = Eval(*attribute.object);
            const Value current = GetAttr(object, attribute.attr);
            script::SetAttribute(rt_, object, attribute.attr,
                                 script::InPlaceOperation(stmt.op, current, Eval(*stmt.value), rt_));
            return;
        }
        case script::ExprKind::kSubscript: {
            const auto& subscript = static_cast<const script::SubscriptExpr&>(*stmt.target);
            const Value object = Eval(*subscript.object);
            const Value index = Eval(*subscript.index);
            const Value current = script::GetItem(rt_, object, index);
            script::SetItem(rt_, object, index, script::InPlaceOperation(stmt.op, current, Eval(*stmt.value), rt_));
            return;
        }
        default:
            script::ThrowError("RuntimeError", "illegal expression for augmented assignment");
    }
}

void TreeWalker::ExecDelete(const script::Expr& target) {
    switch (target.kind) {
        case script::ExprKind::kName: {
            const std::string& name = static_cast<const script::NameExpr&>(target).id;
            const bool erased = BindsGlobally(name) ? globals_->Erase(name) : scope_->locals->Erase(name);
            if (!erased) {
                script::ThrowError("NameError", "name '" + name + "' is not defined");
            }
            return;
        }
        case script::ExprKind::kAttribute: {
            const auto& attribute = static_cast<const script::AttributeExpr&>(target);
            CheckDunderAccess(attribute.attr);
            script::DeleteAttribute(Eval(*attribute.object), attribute.attr);
            return;
        }
        case script::ExprKind::kSubscript: {
            const auto& subscript = static_cast<const script::SubscriptExpr&>(target);
            const Value object = Eval(*subscript.object);
            script::DelItem(rt_, object, Eval(*subscript.index));
            return;
        }
        case script::ExprKind::kTuple:
        case script::ExprKind::kList:
            for (const auto& element : static_cast<const script::SequenceExpr&>(target).elements) {
                ExecDelete(*element);
            }
            return;
        default:
            script::ThrowError("RuntimeError", std::string("cannot delete ") + script::KindName(target.kind));
    }
}

// ---------------------------------------------------------------------------
// Expressions

Value TreeWalker::GetAttr(const Value& object, const std::string& name) {
    CheckDunderAccess(name);
    return script::GetAttribute(rt_, object, name);
}

Value TreeWalker::Eval(const script::Expr& expr) {
    switch (expr.kind) {
        case script::ExprKind::kConstant:
            return static_cast<const script::ConstantExpr&>(expr).value;
        case script::ExprKind::kName:
            return Load(static_cast<const script::NameExpr&>(expr).id);
        case script::ExprKind::kAttribute: {
            const auto& attribute = static_cast<const script::AttributeExpr&>(expr);
            return GetAttr(Eval(*attribute.object), attribute.attr);
        }
        case script::ExprKind::kSubscript: {
            const auto& subscript = static_cast<const script::SubscriptExpr&>(expr);
            const Value object = Eval(*subscript.object);
            return script::GetItem(rt_, object, Eval(*subscript.index));
        }
        case script::ExprKind::kCall:
            return EvalCall(static_cast<const script::CallExpr&>(expr));
        case script::ExprKind::kBinOp: {
            const auto& binop = static_cast<const script::BinOpExpr&>(expr);
            const Value left = Eval(*binop.left);
            return script::BinaryOperation(binop.op, left, Eval(*binop.right));
        }
        case script::ExprKind::kUnaryOp: {
            const auto& unary = static_cast<const script::UnaryOpExpr&>(expr);
            return script::UnaryOperation(unary.op, Eval(*unary.operand));
        }
        case script::ExprKind::kBoolOp: {
            const auto& boolop = static_cast<const script::BoolOpExpr&>(expr);
            Value result;
            for (const auto& operand : boolop.values) {
                result = Eval(*operand);
                const bool truthy = script::Truthy(result);
                if ((boolop.op == script::BoolOpKind::kAnd) != truthy) {
                    return result;
                }
            }
            return result;
        }
        case script::ExprKind::kCompare:
            return EvalCompare(static_cast<const script::CompareExpr&>(expr));
        case script::ExprKind::kIfExp: {
            const auto& ifexp = static_cast<const script::IfExpExpr&>(expr);
            return script::Truthy(Eval(*ifexp.test)) ? Eval(*ifexp.body) : Eval(*ifexp.orelse);
        }
        case script::ExprKind::kList:
        case script::ExprKind::kTuple: {
            const auto& sequence = static_cast<const script::SequenceExpr&>(expr);
            std::vector<Value> items;
            items.reserve(sequence.elements.size());
            for (const auto& element : sequence.elements) {
                items.push_back(Eval(*element));
            }
            return expr.kind == script::ExprKind::kList ? script::MakeList(std::move(items))
                                                        : script::MakeTuple(std::move(items));
        }
        case script::ExprKind::kDict: {
            const auto& dict = static_cast<const script::DictExpr&>(expr);
            auto object = std::make_shared<script::DictObject>();
            for (std::size_t i = 0; i < dict.keys.size(); ++i) {
                const Value key = Eval(*dict.keys[i]);
                object->Set(key, Eval(*dict.values[i]));
            }
            return Value(object);
        }
        case script::ExprKind::kListComp:
            return EvalListComp(static_cast<const script::ListCompExpr&>(expr));
        case script::ExprKind::kFString:
            return EvalFString(static_cast<const script::FStringExpr&>(expr));
    }
    script::ThrowError("RuntimeError", std::string("unsupported expression ") + script::KindName(expr.kind));
}

Value TreeWalker::EvalCall(const script::CallExpr& call) {
    const Value callee = Eval(*call.func);
    script::CallArgs args;
    args.positional.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.positional.push_back(Eval(*arg));
    }
    for (const auto& keyword : call.keywords) {
        args.keywords.emplace_back(keyword.name, Eval(*keyword.value));
    }
    const int line = rt_.line();
    Value result = script::CallValue(rt_, callee, std::move(args));
    rt_.SetLine(line);
    return result;
}

Value TreeWalker::EvalCompare(const script::CompareExpr& compare) {
    Value left = Eval(*compare.left);
    for (std::size_t i = 0; i < compare.ops.size(); ++i) {
        Value right = Eval(*compare.comparators[i]);
        if (!script::Compare(compare.ops[i], left, right, rt_)) {
            return Value(false);
        }
        left = std::move(right);
    }
    return Value(true);
}

Value TreeWalker::EvalListComp(const script::ListCompExpr& comp) {
    const Value iterable = Eval(*comp.iter);
    auto comp_scope = std::make_shared<Scope>();
    comp_scope->enclosing = ClosureScope();
    TreeWalker inner(rt_, globals_, comp_scope);
    std::vector<Value> items;
    script::ForEach(rt_, iterable, [&](const Value& item) {
        inner.Assign(*comp.target, item);
        for (const auto& condition : comp.conditions) {
            if (!script::Truthy(inner.Eval(*condition))) {
                return true;
            }
        }
        items.push_back(inner.Eval(*comp.element));
        return true;
    });
    return script::MakeList(std::move(items));
}

Value TreeWalker::EvalFString(const script::FStringExpr& fstring) {
    std::string out;
    for (const auto& part : fstring.parts) {
        out += part.literal;
        if (!part.expr) {
            continue;
        }
        out += script::FormatField(rt_, Eval(*part.expr), part.conversion, part.format_spec);
    }
    return Value(out);
}

std::optional<script::Value> WalkModule(script::Runtime& rt,
                                        const std::shared_ptr<script::Namespace>& globals,
                                        const script::Module& module,
                                        int echo_through_line) {
    TreeWalker walker(rt, globals, nullptr);
    const script::ExprStmt* echo = nullptr;
    for (const auto& stmt : module.body) {
        if (stmt->line <= echo_through_line) {
            echo = stmt->kind == script::StmtKind::kExpr ? static_cast<const script::ExprStmt*>(stmt.get()) : nullptr;
        }
    }
    std::optional<script::Value> result;
    for (const auto& stmt : module.body) {
        if (stmt.get() == echo) {
            rt.SetLine(stmt->line);
            result = walker.Eval(*echo->value);
        } else {
            walker.Exec(stmt);
        }
    }
    return result;
}

}  // namespace codeact::sandbox
