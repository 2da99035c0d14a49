#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

#include "script/ast.hpp"
#include "script/runtime.hpp"

namespace codeact::sandbox {

// Local bindings of a function call or class body. Module-level code runs
// without a scope and binds directly into the session globals.
struct Scope {
    std::shared_ptr<script::Namespace> locals = std::make_shared<script::Namespace>();
    // Nearest enclosing function scope, for closures.
    std::shared_ptr<Scope> enclosing;
    std::unordered_set<std::string> declared_globals;
    bool is_class = false;
};

// Evaluates the AST node by node. Runs no native decoration pass: native
// decorators are recorded on the class and left unapplied, and class
// annotations are not collected.
class TreeWalker {
public:
    TreeWalker(script::Runtime& rt, std::shared_ptr<script::Namespace> globals, std::shared_ptr<Scope> scope);

    void ExecBlock(const script::Block& block);
    void Exec(const script::StmtPtr& stmt);
    script::Value Eval(const script::Expr& expr);

private:
    void ExecIf(const script::IfStmt& stmt);
    void ExecWhile(const script::WhileStmt& stmt);
    void ExecFor(const script::ForStmt& stmt);
    void ExecTry(const script::TryStmt& stmt);
    void ExecFunctionDef(const std::shared_ptr<script::FunctionDefStmt>& def);
    void ExecClassDef(const script::ClassDefStmt& def);
    void ExecAugAssign(const script::AugAssignStmt& stmt);
    void ExecDelete(const script::Expr& target);

    script::Value EvalCall(const script::CallExpr& call);
    script::Value EvalCompare(const script::CompareExpr& compare);
    script::Value EvalListComp(const script::ListCompExpr& comp);
    script::Value EvalFString(const script::FStringExpr& fstring);
    script::Value GetAttr(const script::Value& object, const std::string& name);

    script::Value Load(const std::string& name);
    void Store(const std::string& name, script::Value value);
    void Assign(const script::Expr& target, script::Value value);
    bool BindsGlobally(const std::string& name) const;
    // Scope that closures created here capture.
    std::shared_ptr<Scope> ClosureScope() const;

    script::Runtime& rt_;
    std::shared_ptr<script::Namespace> globals_;
    std::shared_ptr<Scope> scope_;
};

// Executes a parsed module at the top level of `globals`. Returns the value
// of the last top-level statement starting at or before `echo_through_line`
// when that statement is an expression.
std::optional<script::Value> WalkModule(script::Runtime& rt,
                                        const std::shared_ptr<script::Namespace>& globals,
                                        const script::Module& module,
                                        int echo_through_line = 0);

}  // namespace codeact::sandbox
