#include "sandbox/restricting_transformer.hpp"

#include <unordered_set>

#include "script/errors.hpp"

namespace py = pybind11;

namespace codeact::sandbox {
namespace {

bool IsMagicName(const std::string& name) {
    return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

std::string KindOf(py::handle node) {
    return py::str(py::type::handle_of(node).attr("__name__"));
}

// Kinds accepted as they are; only their children are checked.
const std::unordered_set<std::string>& PlainKinds() {
    static const std::unordered_set<std::string> kinds = {
        "Module", "Expr", "Assign", "If", "While", "For", "Break", "Continue", "Pass", "Return",
        "Raise", "Delete", "Assert", "Import",
        "Constant", "Subscript", "Slice", "Call", "BinOp", "UnaryOp", "BoolOp", "Compare", "IfExp",
        "NamedExpr", "Lambda", "List", "Tuple", "Set", "Dict", "Starred", "ListComp", "SetComp",
        "DictComp", "GeneratorExp", "comprehension", "JoinedStr", "FormattedValue", "arguments",
        "Load", "Store", "Del", "And", "Or", "Add", "Sub", "Mult", "Div", "FloorDiv", "Mod", "Pow",
        "LShift", "RShift", "BitOr", "BitXor", "BitAnd", "UAdd", "USub", "Not", "Invert",
        "Eq", "NotEq", "Lt", "LtE", "Gt", "GtE", "Is", "IsNot", "In", "NotIn"
    };
    return kinds;
}

}  // namespace

py::object RestrictingTransformer::Compile(const std::string& source, const std::string& filename) {
    ast_ = py::module_::import("ast");
    py::object tree = ast_.attr("parse")(source, filename, "exec");
    Transform(tree);
    return py::module_::import("builtins").attr("compile")(tree, filename, "exec", py::arg("dont_inherit") = true);
}

void RestrictingTransformer::Transform(py::handle tree) {
    if (!ast_) {
        ast_ = py::module_::import("ast");
    }
    errors_.clear();
    line_ = 0;
    class_depth_ = 0;
    Visit(tree);
    if (!errors_.empty()) {
        throw script::SyntaxRejection(std::move(errors_));
    }
    Rewrite(tree);
    ast_.attr("fix_missing_locations")(tree);
}

void RestrictingTransformer::Reject(const std::string& message) {
    errors_.push_back("Line " + std::to_string(line_) + ": " + message);
}

void RestrictingTransformer::CheckName(const std::string& name) {
    if (!name.empty() && name[0] == '_' && name != "_") {
        Reject("\"" + name + "\" is an invalid variable name because it starts with \"_\"");
    }
}

void RestrictingTransformer::CheckOptionalName(py::handle name) {
    if (!name.is_none()) {
        CheckName(name.cast<std::string>());
    }
}

void RestrictingTransformer::CheckAttributeName(const std::string& name) {
    if (!name.empty() && name[0] == '_') {
        Reject("\"" + name + "\" is an invalid attribute name because it starts with \"_\".");
    }
}

void RestrictingTransformer::Visit(py::handle node) {
    const int enclosing_line = line_;
    if (py::hasattr(node, "lineno")) {
        line_ = node.attr("lineno").cast<int>();
    }
    const std::string kind = KindOf(node);
    if (!VisitNode(kind, node)) {
        const char* what = py::isinstance(node, ast_.attr("stmt"))   ? "statements"
                           : py::isinstance(node, ast_.attr("expr")) ? "expressions"
                                                                     : "nodes";
        Reject(kind + " " + what + " are not allowed.");
    }
    line_ = enclosing_line;
}

void RestrictingTransformer::VisitChildren(py::handle node) {
    const py::object children = ast_.attr("iter_child_nodes")(node);
    for (py::handle child : children) {
        Visit(child);
    }
}

bool RestrictingTransformer::VisitNode(const std::string& kind, py::handle node) {
    if (PlainKinds().count(kind) > 0) {
        VisitChildren(node);
        return true;
    }
    if (kind == "Name") {
        CheckName(node.attr("id").cast<std::string>());
        return true;
    }
    if (kind == "Attribute") {
        CheckAttributeName(node.attr("attr").cast<std::string>());
        VisitChildren(node);
        return true;
    }
    if (kind == "arg") {
        CheckName(node.attr("arg").cast<std::string>());
        VisitChildren(node);
        return true;
    }
    if (kind == "keyword") {
        CheckOptionalName(node.attr("arg"));
        VisitChildren(node);
        return true;
    }
    if (kind == "alias") {
        VisitAlias(node);
        return true;
    }
    if (kind == "ImportFrom") {
        if (node.attr("level").cast<int>() != 0) {
            Reject("Relative imports are not allowed.");
        }
        const py::object module = node.attr("module");
        if (!module.is_none()) {
            const std::string name = module.cast<std::string>();
            std::size_t start = 0;
            while (true) {
                const auto dot = name.find('.', start);
                CheckName(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
                if (dot == std::string::npos) {
                    break;
                }
                start = dot + 1;
            }
        }
        VisitChildren(node);
        return true;
    }
    if (kind == "AugAssign") {
        const std::string target = KindOf(node.attr("target"));
        if (target == "Attribute") {
            Reject("Augmented assignment of attributes is not allowed.");
        } else if (target == "Subscript") {
            Reject("Augmented assignment of object items and slices is not allowed.");
        } else {
            Visit(node.attr("target"));
        }
        Visit(node.attr("value"));
        return true;
    }
    if (kind == "Try") {
        CheckFinallyBody(node.attr("finalbody"), false);
        VisitChildren(node);
        return true;
    }
    if (kind == "ExceptHandler") {
        CheckOptionalName(node.attr("name"));
        VisitChildren(node);
        return true;
    }
    if (kind == "Global" || kind == "Nonlocal") {
        for (py::handle name : node.attr("names")) {
            CheckName(name.cast<std::string>());
        }
        return true;
    }
    if (kind == "FunctionDef") {
        VisitFunctionDef(node);
        return true;
    }
    if (kind == "ClassDef") {
        VisitClassDef(node);
        return true;
    }
    return false;
}

void RestrictingTransformer::VisitFunctionDef(py::handle node) {
    const std::string name = node.attr("name").cast<std::string>();
    if (!(class_depth_ > 0 && IsMagicName(name))) {
        CheckName(name);
    }
    const int enclosing_classes = class_depth_;
    class_depth_ = 0;
    VisitChildren(node);
    class_depth_ = enclosing_classes;
}

void RestrictingTransformer::VisitClassDef(py::handle node) {
    CheckName(node.attr("name").cast<std::string>());
    ++class_depth_;
    VisitChildren(node);
    --class_depth_;
}

void RestrictingTransformer::VisitAlias(py::handle node) {
    const std::string name = node.attr("name").cast<std::string>();
    if (name == "*") {
        Reject("\"*\" imports are not allowed.");
        return;
    }
    std::size_t start = 0;
    while (true) {
        const auto dot = name.find('.', start);
        CheckName(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    CheckOptionalName(node.attr("asname"));
}

// A jump out of a finally block discards the exception in flight, including
// a refused import.
void RestrictingTransformer::CheckFinallyBody(py::handle body, bool in_loop) {
    for (py::handle stmt : body) {
        const std::string kind = KindOf(stmt);
        if (kind == "FunctionDef" || kind == "ClassDef") {
            continue;
        }
        const bool jump = kind == "Return" || ((kind == "Break" || kind == "Continue") && !in_loop);
        if (jump) {
            std::string keyword = kind;
            keyword[0] = static_cast<char>(keyword[0] - 'A' + 'a');
            errors_.push_back("Line " + std::to_string(stmt.attr("lineno").cast<int>()) + ": '" + keyword +
                              "' inside a finally block is not allowed.");
            continue;
        }
        const bool loop = kind == "For" || kind == "While";
        for (const char* field : {"body", "orelse", "finalbody"}) {
            if (py::hasattr(stmt, field)) {
                CheckFinallyBody(stmt.attr(field), in_loop || (loop && std::string(field) == "body"));
            }
        }
        for (const char* clauses : {"handlers", "cases"}) {
            if (py::hasattr(stmt, clauses)) {
                for (py::handle clause : stmt.attr(clauses)) {
                    CheckFinallyBody(clause.attr("body"), in_loop);
                }
            }
        }
    }
}

py::object RestrictingTransformer::Rewrite(py::handle node) {
    const py::object ast_node = ast_.attr("AST");
    for (py::handle field : node.attr("_fields")) {
        const std::string name = py::str(field);
        if (!py::hasattr(node, name.c_str())) {
            continue;
        }
        const py::object value = node.attr(name.c_str());
        if (py::isinstance<py::list>(value)) {
            py::list items = py::reinterpret_borrow<py::list>(value);
            for (std::size_t i = 0; i < items.size(); ++i) {
                const py::object item = items[i];
                if (py::isinstance(item, ast_node)) {
                    items[i] = Rewrite(item);
                }
            }
        } else if (py::isinstance(value, ast_node)) {
            node.attr(name.c_str()) = Rewrite(value);
        }
    }

    const std::string kind = KindOf(node);
    if (kind == "Attribute") {
        const auto guard = [this](const char* name, py::list args, py::handle at) {
            const py::object call = ast_.attr("Call")(
                py::arg("func") = ast_.attr("Name")(py::arg("id") = name, py::arg("ctx") = ast_.attr("Load")()),
                py::arg("args") = args, py::arg("keywords") = py::list());
            return ast_.attr("copy_location")(call, at);
        };
        py::list args;
        args.append(node.attr("value"));
        if (KindOf(node.attr("ctx")) == "Load") {
            args.append(ast_.attr("Constant")(node.attr("attr")));
            return guard("_getattr_", args, node);
        }
        node.attr("value") = guard("_write_", args, node.attr("value"));
    } else if (kind == "ExceptHandler" && node.attr("type").is_none()) {
        // A bare except would also catch a refused import.
        node.attr("type") = ast_.attr("copy_location")(
            ast_.attr("Name")(py::arg("id") = "Exception", py::arg("ctx") = ast_.attr("Load")()), node);
    }
    return py::reinterpret_borrow<py::object>(node);
}

bool PermissiveRestrictingTransformer::VisitNode(const std::string& kind, py::handle node) {
    static const std::unordered_set<std::string> widened = {
        "AnnAssign", "Match", "match_case", "MatchValue", "MatchSingleton", "MatchSequence", "MatchOr"
    };
    if (widened.count(kind) > 0) {
        VisitChildren(node);
        return true;
    }
    if (kind == "MatchAs" || kind == "MatchStar") {
        CheckOptionalName(node.attr("name"));
        VisitChildren(node);
        return true;
    }
    if (kind == "MatchMapping") {
        CheckOptionalName(node.attr("rest"));
        VisitChildren(node);
        return true;
    }
    if (kind == "MatchClass") {
        for (py::handle attr : node.attr("kwd_attrs")) {
            CheckAttributeName(attr.cast<std::string>());
        }
        VisitChildren(node);
        return true;
    }
    return RestrictingTransformer::VisitNode(kind, node);
}

}  // namespace codeact::sandbox
