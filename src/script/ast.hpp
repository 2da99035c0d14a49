#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "script/value.hpp"

namespace codeact::script {

enum class ExprKind {
    kConstant,
    kName,
    kAttribute,
    // Attribute access routed through the runtime guard; only produced by
    // the restricting transformer.
    kSubscript,
    kCall,
    kBinOp,
    kUnaryOp,
    kBoolOp,
    kCompare,
    kIfExp,
    kList,
    kTuple,
    kDict,
    kListComp,
    kFString
};

enum class StmtKind {
    kExpr,
    kAssign,
    kAugAssign,
    kAnnAssign,
    kIf,
    kWhile,
    kFor,
    kBreak,
    kContinue,
    kPass,
    kReturn,
    kFunctionDef,
    kClassDef,
    kImport,
    kImportFrom,
    kTry,
    kRaise,
    kGlobal,
    kDelete,
    kAssert,
    kMatch
};

enum class PatternKind {
    kValue,
    kCapture,
    kWildcard,
    kSequence,
    kClass
};

enum class BinaryOp { kAdd, kSub, kMul, kDiv, kFloorDiv, kMod, kPow };
enum class UnaryOp { kNeg, kPos, kNot };
enum class BoolOpKind { kAnd, kOr };
enum class CompareOp { kEq, kNotEq, kLt, kLtE, kGt, kGtE, kIn, kNotIn, kIs, kIsNot };

struct Expr {
    explicit Expr(ExprKind kind, int line) : kind(kind), line(line) {}
    virtual ~Expr() = default;

    ExprKind kind;
    int line;
};
using ExprPtr = std::shared_ptr<Expr>;

struct ConstantExpr : Expr {
    ConstantExpr(Value value, int line) : Expr(ExprKind::kConstant, line), value(std::move(value)) {}
    Value value;
};

struct NameExpr : Expr {
    NameExpr(std::string id, int line) : Expr(ExprKind::kName, line), id(std::move(id)) {}
    std::string id;
};

struct AttributeExpr : Expr {
    AttributeExpr(ExprPtr object, std::string attr, int line)
        : Expr(ExprKind::kAttribute, line), object(std::move(object)), attr(std::move(attr)) {}
    ExprPtr object;
    std::string attr;
};

struct SubscriptExpr : Expr {
    SubscriptExpr(ExprPtr object, ExprPtr index, int line)
        : Expr(ExprKind::kSubscript, line), object(std::move(object)), index(std::move(index)) {}
    ExprPtr object;
    ExprPtr index;
};

struct Keyword {
    std::string name;
    ExprPtr value;
};

struct CallExpr : Expr {
    explicit CallExpr(ExprPtr func, int line) : Expr(ExprKind::kCall, line), func(std::move(func)) {}
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

struct BinOpExpr : Expr {
    BinOpExpr(BinaryOp op, ExprPtr left, ExprPtr right, int line)
        : Expr(ExprKind::kBinOp, line), op(op), left(std::move(left)), right(std::move(right)) {}
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryOpExpr : Expr {
    UnaryOpExpr(UnaryOp op, ExprPtr operand, int line)
        : Expr(ExprKind::kUnaryOp, line), op(op), operand(std::move(operand)) {}
    UnaryOp op;
    ExprPtr operand;
};

struct BoolOpExpr : Expr {
    BoolOpExpr(BoolOpKind op, int line) : Expr(ExprKind::kBoolOp, line), op(op) {}
    BoolOpKind op;
    std::vector<ExprPtr> values;
};

struct CompareExpr : Expr {
    CompareExpr(ExprPtr left, int line) : Expr(ExprKind::kCompare, line), left(std::move(left)) {}
    ExprPtr left;
    std::vector<CompareOp> ops;
    std::vector<ExprPtr> comparators;
};

struct IfExpExpr : Expr {
    IfExpExpr(ExprPtr test, ExprPtr body, ExprPtr orelse, int line)
        : Expr(ExprKind::kIfExp, line), test(std::move(test)), body(std::move(body)), orelse(std::move(orelse)) {}
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

// List or tuple display.
struct SequenceExpr : Expr {
    SequenceExpr(ExprKind kind, int line) : Expr(kind, line) {}
    std::vector<ExprPtr> elements;
};

struct DictExpr : Expr {
    explicit DictExpr(int line) : Expr(ExprKind::kDict, line) {}
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct ListCompExpr : Expr {
    explicit ListCompExpr(int line) : Expr(ExprKind::kListComp, line) {}
    ExprPtr element;
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> conditions;
};

struct FStringPart {
    std::string literal;
    ExprPtr expr;
    char conversion = 0;
    std::string format_spec;
};

struct FStringExpr : Expr {
    explicit FStringExpr(int line) : Expr(ExprKind::kFString, line) {}
    std::vector<FStringPart> parts;
};

struct Stmt {
    Stmt(StmtKind kind, int line) : kind(kind), line(line) {}
    virtual ~Stmt() = default;

    StmtKind kind;
    int line;
};
using StmtPtr = std::shared_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct ExprStmt : Stmt {
    ExprStmt(ExprPtr value, int line) : Stmt(StmtKind::kExpr, line), value(std::move(value)) {}
    ExprPtr value;
};

struct AssignStmt : Stmt {
    explicit AssignStmt(int line) : Stmt(StmtKind::kAssign, line) {}
    std::vector<ExprPtr> targets;
    ExprPtr value;
};

struct AugAssignStmt : Stmt {
    AugAssignStmt(ExprPtr target, BinaryOp op, ExprPtr value, int line)
        : Stmt(StmtKind::kAugAssign, line), target(std::move(target)), op(op), value(std::move(value)) {}
    ExprPtr target;
    BinaryOp op;
    ExprPtr value;
};

struct AnnAssignStmt : Stmt {
    explicit AnnAssignStmt(int line) : Stmt(StmtKind::kAnnAssign, line) {}
    ExprPtr target;
    ExprPtr annotation;
    ExprPtr value;
};

struct IfStmt : Stmt {
    explicit IfStmt(int line) : Stmt(StmtKind::kIf, line) {}
    ExprPtr test;
    Block body;
    Block orelse;
};

struct WhileStmt : Stmt {
    explicit WhileStmt(int line) : Stmt(StmtKind::kWhile, line) {}
    ExprPtr test;
    Block body;
};

struct ForStmt : Stmt {
    explicit ForStmt(int line) : Stmt(StmtKind::kFor, line) {}
    ExprPtr target;
    ExprPtr iter;
    Block body;
};

// break, continue and pass.
struct SimpleStmt : Stmt {
    SimpleStmt(StmtKind kind, int line) : Stmt(kind, line) {}
};

struct ReturnStmt : Stmt {
    ReturnStmt(ExprPtr value, int line) : Stmt(StmtKind::kReturn, line), value(std::move(value)) {}
    ExprPtr value;
};

struct Parameter {
    std::string name;
    ExprPtr default_value;
};

struct FunctionDefStmt : Stmt {
    explicit FunctionDefStmt(int line) : Stmt(StmtKind::kFunctionDef, line) {}
    std::string name;
    std::vector<Parameter> params;
    Block body;
    std::vector<ExprPtr> decorators;
};

struct ClassDefStmt : Stmt {
    explicit ClassDefStmt(int line) : Stmt(StmtKind::kClassDef, line) {}
    std::string name;
    std::vector<ExprPtr> bases;
    Block body;
    std::vector<ExprPtr> decorators;
};

struct Alias {
    std::string name;
    std::string asname;
};

struct ImportStmt : Stmt {
    explicit ImportStmt(int line) : Stmt(StmtKind::kImport, line) {}
    std::vector<Alias> names;
};

struct ImportFromStmt : Stmt {
    explicit ImportFromStmt(int line) : Stmt(StmtKind::kImportFrom, line) {}
    std::string module;
    // A single "*" entry for star imports.
    std::vector<Alias> names;
};

struct ExceptHandler {
    ExprPtr type;
    std::string name;
    Block body;
    int line = 0;
};

struct TryStmt : Stmt {
    explicit TryStmt(int line) : Stmt(StmtKind::kTry, line) {}
    Block body;
    std::vector<ExceptHandler> handlers;
    Block orelse;
    Block finalbody;
};

struct RaiseStmt : Stmt {
    RaiseStmt(ExprPtr exception, int line) : Stmt(StmtKind::kRaise, line), exception(std::move(exception)) {}
    ExprPtr exception;
};

struct GlobalStmt : Stmt {
    explicit GlobalStmt(int line) : Stmt(StmtKind::kGlobal, line) {}
    std::vector<std::string> names;
};

struct DeleteStmt : Stmt {
    explicit DeleteStmt(int line) : Stmt(StmtKind::kDelete, line) {}
    std::vector<ExprPtr> targets;
};

struct AssertStmt : Stmt {
    explicit AssertStmt(int line) : Stmt(StmtKind::kAssert, line) {}
    ExprPtr test;
    ExprPtr message;
};

struct Pattern;
using PatternPtr = std::shared_ptr<Pattern>;

struct Pattern {
    Pattern(PatternKind kind, int line) : kind(kind), line(line) {}

    PatternKind kind;
    int line;
    // kValue
    ExprPtr value;
    // kCapture
    std::string name;
    // kSequence elements or kClass positional sub-patterns
    std::vector<PatternPtr> elements;
    // kClass
    ExprPtr cls;
    std::vector<std::pair<std::string, PatternPtr>> keywords;
};

struct MatchCase {
    PatternPtr pattern;
    ExprPtr guard;
    Block body;
};

struct MatchStmt : Stmt {
    explicit MatchStmt(int line) : Stmt(StmtKind::kMatch, line) {}
    ExprPtr subject;
    std::vector<MatchCase> cases;
};

struct Module {
    Block body;
};

const char* KindName(ExprKind kind);
const char* KindName(StmtKind kind);
const char* OperatorSymbol(BinaryOp op);

}  // namespace codeact::script
