#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <pybind11/pybind11.h>

#include "sandbox/python_bridge.hpp"
#include "sandbox/restricting_transformer.hpp"
#include "script/errors.hpp"

namespace py = pybind11;

using codeact::sandbox::EnsureInterpreter;
using codeact::sandbox::PermissiveRestrictingTransformer;
using codeact::sandbox::RestrictingTransformer;
using codeact::script::SyntaxRejection;

namespace {

std::vector<std::string> RejectionsOf(const std::string& source, bool permissive = false) {
    EnsureInterpreter();
    py::gil_scoped_acquire gil;
    try {
        if (permissive) {
            PermissiveRestrictingTransformer().Compile(source, "<test>");
        } else {
            RestrictingTransformer().Compile(source, "<test>");
        }
    } catch (const SyntaxRejection& e) {
        return e.errors();
    }
    return {};
}

// Source text of `source` after the rewrite.
std::string Rewritten(const std::string& source) {
    EnsureInterpreter();
    py::gil_scoped_acquire gil;
    const py::module_ ast = py::module_::import("ast");
    const py::object tree = ast.attr("parse")(source);
    RestrictingTransformer().Transform(tree);
    return ast.attr("unparse")(tree).cast<std::string>();
}

}  // namespace

TEST(RestrictingTransformer, AcceptsOrdinaryPrograms) {
    EXPECT_TRUE(RejectionsOf("import math\nx = [i * 2 for i in range(3)]\nprint(math.sqrt(x[1]))\n").empty());
    EXPECT_TRUE(RejectionsOf("class A:\n    def __init__(self, v):\n        self.v = v\n").empty());
    EXPECT_TRUE(RejectionsOf("def f(*args, **kw):\n    return lambda y: y + len(args)\n").empty());
}

TEST(RestrictingTransformer, RejectsAnnotatedAssignment) {
    const auto errors = RejectionsOf("x: int = 1\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Line 1: AnnAssign statements are not allowed.");
}

TEST(RestrictingTransformer, RejectsMatch) {
    const auto errors = RejectionsOf("y = 2\nmatch y:\n    case 2:\n        pass\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Line 2: Match statements are not allowed.");
}

TEST(RestrictingTransformer, RejectsUnderscoreNames) {
    const auto errors = RejectionsOf("_secret = 1\nobj = None\nobj.__class__\n");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Line 1: \"_secret\" is an invalid variable name because it starts with \"_\"");
    EXPECT_EQ(errors[1], "Line 3: \"__class__\" is an invalid attribute name because it starts with \"_\".");
}

TEST(RestrictingTransformer, AllowsSingleUnderscoreAndDunderMethods) {
    EXPECT_TRUE(RejectionsOf("for _ in range(2):\n    pass\n").empty());
    EXPECT_FALSE(RejectionsOf("def __init__(x):\n    pass\n").empty());
}

TEST(RestrictingTransformer, RejectsAugmentedAssignmentOfAttributesAndItems) {
    const auto errors = RejectionsOf("a = [1]\na[0] += 1\nb = a\nb.x += 1\n");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Line 2: Augmented assignment of object items and slices is not allowed.");
    EXPECT_EQ(errors[1], "Line 4: Augmented assignment of attributes is not allowed.");
}

TEST(RestrictingTransformer, RejectsStarImports) {
    const auto errors = RejectionsOf("from math import *\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Line 1: \"*\" imports are not allowed.");
}

TEST(RestrictingTransformer, CollectsEveryRejection) {
    const auto errors = RejectionsOf("x: int = 1\n_y = 2\nz: str = 'a'\n");
    EXPECT_EQ(errors.size(), 3u);
}

TEST(RestrictingTransformer, GuardsAttributeAccess) {
    EXPECT_EQ(Rewritten("value = text.upper()\n"), "value = _getattr_(text, 'upper')()");
    EXPECT_EQ(Rewritten("point.x = 1\n"), "_write_(point).x = 1");
}

TEST(RestrictingTransformer, NarrowsBareExcept) {
    EXPECT_EQ(Rewritten("try:\n    pass\nexcept:\n    pass\n"), "try:\n    pass\nexcept Exception:\n    pass");
}

TEST(RestrictingTransformer, RejectsJumpsOutOfFinally) {
    const auto errors = RejectionsOf(
        "def f():\n    try:\n        import os\n    finally:\n        return 1\n"
        "for i in range(2):\n    try:\n        pass\n    finally:\n        continue\n");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Line 5: 'return' inside a finally block is not allowed.");
    EXPECT_EQ(errors[1], "Line 10: 'continue' inside a finally block is not allowed.");
}

TEST(RestrictingTransformer, AllowsLoopsInsideFinally) {
    EXPECT_TRUE(RejectionsOf("try:\n    pass\nfinally:\n    for i in range(2):\n        break\n").empty());
}

TEST(RestrictingTransformer, RejectsRelativeImports) {
    const auto errors = RejectionsOf("from . import sibling\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Line 1: Relative imports are not allowed.");
}

TEST(RestrictingTransformer, ParseFailuresStayPythonErrors) {
    EnsureInterpreter();
    py::gil_scoped_acquire gil;
    try {
        RestrictingTransformer().Compile("x = (\n", "<test>");
        FAIL() << "expected a SyntaxError";
    } catch (const py::error_already_set& e) {
        EXPECT_TRUE(e.matches(PyExc_SyntaxError));
    }
}

TEST(PermissiveRestrictingTransformer, AcceptsAnnotationsAndMatch) {
    EXPECT_TRUE(RejectionsOf("x: int = 1\nname: str\n", true).empty());
    EXPECT_TRUE(RejectionsOf("p = 1\nmatch p:\n    case 1 if p > 0:\n        pass\n    case other:\n        pass\n", true)
                    .empty());
}

TEST(PermissiveRestrictingTransformer, StillChecksNamesInsideWidenedNodes) {
    const auto errors = RejectionsOf("_hidden: int = 1\nmatch 1:\n    case _leak:\n        pass\n", true);
    EXPECT_EQ(errors.size(), 2u);
}
