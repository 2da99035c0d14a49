#include "script/ast.hpp"

namespace codeact::script {

const char* KindName(ExprKind kind) {
    switch (kind) {
        case ExprKind::kConstant: return "Constant";
        case ExprKind::kName: return "Name";
        case ExprKind::kAttribute: return "Attribute";
        case ExprKind::kSubscript: return "Subscript";
        case ExprKind::kCall: return "Call";
        case ExprKind::kBinOp: return "BinOp";
        case ExprKind::kUnaryOp: return "UnaryOp";
        case ExprKind::kBoolOp: return "BoolOp";
        case ExprKind::kCompare: return "Compare";
        case ExprKind::kIfExp: return "IfExp";
        case ExprKind::kList: return "List";
        case ExprKind::kTuple: return "Tuple";
        case ExprKind::kDict: return "Dict";
        case ExprKind::kListComp: return "ListComp";
        case ExprKind::kFString: return "JoinedStr";
    }
    return "Expr";
}

const char* KindName(StmtKind kind) {
    switch (kind) {
        case StmtKind::kExpr: return "Expr";
        case StmtKind::kAssign: return "Assign";
        case StmtKind::kAugAssign: return "AugAssign";
        case StmtKind::kAnnAssign: return "AnnAssign";
        case StmtKind::kIf: return "If";
        case StmtKind::kWhile: return "While";
        case StmtKind::kFor: return "For";
        case StmtKind::kBreak: return "Break";
        case StmtKind::kContinue: return "Continue";
        case StmtKind::kPass: return "Pass";
        case StmtKind::kReturn: return "Return";
        case StmtKind::kFunctionDef: return "FunctionDef";
        case StmtKind::kClassDef: return "ClassDef";
        case StmtKind::kImport: return "Import";
        case StmtKind::kImportFrom: return "ImportFrom";
        case StmtKind::kTry: return "Try";
        case StmtKind::kRaise: return "Raise";
        case StmtKind::kGlobal: return "Global";
        case StmtKind::kDelete: return "Delete";
        case StmtKind::kAssert: return "Assert";
        case StmtKind::kMatch: return "Match";
    }
    return "Stmt";
}

const char* OperatorSymbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::kAdd: return "+";
        case BinaryOp::kSub: return "-";
        case BinaryOp::kMul: return "*";
        case BinaryOp::kDiv: return "/";
        case BinaryOp::kFloorDiv: return "//";
        case BinaryOp::kMod: return "%";
        case BinaryOp::kPow: return "**";
    }
    return "?";
}

}  // namespace codeact::script
