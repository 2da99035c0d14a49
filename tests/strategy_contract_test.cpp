#include <gtest/gtest.h>

#include <string>

#include "config/config_schema.hpp"
#include "sandbox/code_session.hpp"

using codeact::sandbox::CodeSession;

namespace {

codeact::config::Config ConfigFor(const std::string& backend) {
    codeact::config::Config config;
    config.sandbox.backend = backend;
    config.surface.width = 32;
    config.surface.height = 32;
    return config;
}

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

const char* kDataclassProgram =
    "from dataclasses import dataclass\n"
    "\n"
    "@dataclass\n"
    "class Point:\n"
    "    x: int\n"
    "    y: int\n"
    "\n"
    "p = Point(1, 2)\n"
    "print(p.x + p.y)\n";

}  // namespace

class StrategyContract : public ::testing::TestWithParam<std::string> {
protected:
    CodeSession session_{ConfigFor(GetParam())};
};

TEST_P(StrategyContract, DeniedImportIsReportedIdentically) {
    const auto result = session_.Execute("import os\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "CapabilityError: Import of 'os' is not allowed."));
    EXPECT_TRUE(Contains(result.stderr_text, "'math'"));
}

TEST_P(StrategyContract, DeniedImportNamesFullDottedPath) {
    const auto result = session_.Execute("from os.path import join\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "Import of 'os.path' is not allowed."));
}

TEST_P(StrategyContract, GuestCannotCatchCapabilityError) {
    const auto result = session_.Execute(
        "try:\n"
        "    import subprocess\n"
        "except Exception:\n"
        "    print('caught')\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(Contains(result.stdout_text, "caught"));
}

TEST_P(StrategyContract, FinallyJumpDoesNotDiscardCapabilityError) {
    const auto result = session_.Execute(
        "for i in range(1):\n"
        "    try:\n"
        "        import os\n"
        "    finally:\n"
        "        break\n"
        "print('after')\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(Contains(result.stdout_text, "after"));
}

TEST_P(StrategyContract, ImportHelperGoesThroughPolicy) {
    const auto allowed = session_.Execute("m = __import__('math')\nprint(m.floor(2.5))\n");
    const auto denied = session_.Execute("__import__('socket')\n");
    EXPECT_EQ(denied.exit_code, 1);
    if (GetParam() == "restricted") {
        // The name itself is refused before anything runs.
        EXPECT_EQ(allowed.exit_code, 1);
        EXPECT_TRUE(Contains(allowed.stderr_text, "Compilation Error:"));
        EXPECT_TRUE(Contains(allowed.stderr_text, "\"__import__\" is an invalid variable name"));
        EXPECT_TRUE(Contains(denied.stderr_text, "Compilation Error:"));
    } else {
        EXPECT_EQ(allowed.exit_code, 0) << allowed.stderr_text;
        EXPECT_EQ(allowed.stdout_text, "2\n");
        EXPECT_TRUE(Contains(denied.stderr_text, "CapabilityError"));
    }
}

TEST_P(StrategyContract, StandardModulesNeedNoProvisioning) {
    const auto result = session_.Execute(
        "import math\n"
        "import json\n"
        "print(math.sqrt(16))\n"
        "print(json.dumps({'a': [1, 2]}))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "4.0\n{\"a\": [1, 2]}\n");
}

TEST_P(StrategyContract, BindingsPersistAcrossCalls) {
    ASSERT_EQ(session_.Execute("x = 1\n").exit_code, 0);
    const auto result = session_.Execute("print(x)\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "1\n");
}

TEST_P(StrategyContract, ResetContextDropsBindings) {
    ASSERT_EQ(session_.Execute("x = 1\n").exit_code, 0);
    session_.ResetContext();
    const auto result = session_.Execute("print(x)\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "NameError"));
}

TEST_P(StrategyContract, FaultKeepsEarlierBindingsOnly) {
    const auto result = session_.Execute("a = 1\nb = 1 / 0\nc = 3\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "Traceback (most recent call last):"));
    EXPECT_TRUE(Contains(result.stderr_text, "ZeroDivisionError"));
    auto& context = session_.context();
    EXPECT_TRUE(context.Contains("a"));
    EXPECT_FALSE(context.Contains("b"));
    EXPECT_FALSE(context.Contains("c"));
}

TEST_P(StrategyContract, OutputBeforeFaultIsKept) {
    const auto result = session_.Execute("print('first')\nraise ValueError('boom')\nprint('second')\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stdout_text, "first\n");
    EXPECT_TRUE(Contains(result.stderr_text, "ValueError: boom"));
}

TEST_P(StrategyContract, GuestExceptionsAreCatchable) {
    const auto result = session_.Execute(
        "try:\n"
        "    {}['missing']\n"
        "except KeyError as e:\n"
        "    print('handled')\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "handled\n");
}

TEST_P(StrategyContract, SyntaxErrorIsAFault) {
    const auto result = session_.Execute("x = (1 +\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "SyntaxError"));
}

TEST_P(StrategyContract, FunctionsAndClosuresWork) {
    const auto result = session_.Execute(
        "def counter():\n"
        "    count = 0\n"
        "    def bump():\n"
        "        return count + 1\n"
        "    return bump\n"
        "total = 0\n"
        "for i in range(3):\n"
        "    total += counter()()\n"
        "print(total)\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "3\n");
}

TEST_P(StrategyContract, RunawayRecursionIsAFault) {
    const auto result = session_.Execute("def f(n):\n    return f(n + 1)\nf(0)\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "RecursionError"));
}

TEST_P(StrategyContract, StringsAreIndexedByCodePoint) {
    const auto result = session_.Execute(
        "s = 'h\xC3\xA9llo'\n"
        "print(len('\xC3\xA9'))\n"
        "print(s[1])\n"
        "print(s.find('l'))\n"
        "print(s.rjust(7, '*'))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "1\n\xC3\xA9\n2\n**h\xC3\xA9llo\n");
}

TEST_P(StrategyContract, HexEscapesAreDecoded) {
    const auto result = session_.Execute("print('\\x41\\x42' == 'AB')\nprint(len('\\xff'))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "True\n1\n");
}

TEST_P(StrategyContract, PercentFormatRejectsNonIntegers) {
    const auto hex = session_.Execute("print('%x' % 2.5)\n");
    EXPECT_EQ(hex.exit_code, 1);
    EXPECT_TRUE(Contains(hex.stderr_text, "TypeError: %x format: an integer is required, not float"));
    const auto nan = session_.Execute("print('%d' % float('nan'))\n");
    EXPECT_EQ(nan.exit_code, 1);
    EXPECT_TRUE(Contains(nan.stderr_text, "ValueError: cannot convert float NaN to integer"));
}

TEST_P(StrategyContract, DeeplyNestedExpressionsAreSyntaxErrors) {
    const auto nested = [](int depth) {
        return "x = " + std::string(depth, '(') + "1" + std::string(depth, ')') + "\n";
    };
    const auto shallow = session_.Execute(nested(50) + "print(x)\n");
    EXPECT_EQ(shallow.exit_code, 0) << shallow.stderr_text;
    EXPECT_EQ(shallow.stdout_text, "1\n");
    const auto deep = session_.Execute(nested(500));
    EXPECT_EQ(deep.exit_code, 1);
    EXPECT_TRUE(Contains(deep.stderr_text, "SyntaxError: too many nested parentheses"));
}

TEST_P(StrategyContract, DeeplyNestedContainersAreReleased) {
    const auto built = session_.Execute("a = []\nfor i in range(200000):\n    a = [a]\nb = [1]\nb.append(b)\n");
    EXPECT_EQ(built.exit_code, 0) << built.stderr_text;
    session_.ResetContext();
    const auto after = session_.Execute("print('alive')\n");
    EXPECT_EQ(after.exit_code, 0) << after.stderr_text;
    EXPECT_EQ(after.stdout_text, "alive\n");
}

INSTANTIATE_TEST_SUITE_P(Backends, StrategyContract, ::testing::Values("interpreted", "restricted"));

TEST(CompiledRestrictedSandbox, SynthesizesDataclassInit) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute(kDataclassProgram);
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "3\n");
}

TEST(CompiledRestrictedSandbox, DataclassReprAndEquality) {
    CodeSession session(ConfigFor("restricted"));
    ASSERT_EQ(session.Execute(kDataclassProgram).exit_code, 0);
    const auto result = session.Execute("print(repr(p))\nprint(p == Point(1, 2))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "Point(x=1, y=2)\nTrue\n");
}

TEST(CompiledRestrictedSandbox, MatchStatements) {
    CodeSession session(ConfigFor("restricted"));
    ASSERT_EQ(session.Execute(kDataclassProgram).exit_code, 0);
    const auto result = session.Execute(
        "def describe(value):\n"
        "    match value:\n"
        "        case Point(0, y):\n"
        "            return f'on axis at {y}'\n"
        "        case [first, second]:\n"
        "            return f'pair {first} {second}'\n"
        "        case 'hi':\n"
        "            return 'greeting'\n"
        "        case _:\n"
        "            return 'other'\n"
        "print(describe(Point(0, 5)))\n"
        "print(describe([1, 2]))\n"
        "print(describe('hi'))\n"
        "print(describe(3.5))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "on axis at 5\npair 1 2\ngreeting\nother\n");
}

TEST(CompiledRestrictedSandbox, CollectsClassAnnotations) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute(
        "class Config:\n"
        "    name: str\n"
        "    retries: int = 3\n"
        "print(Config.retries)\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "3\n");
}

TEST(CompiledRestrictedSandbox, StrictTransformerRejectsAnnotations) {
    auto config = ConfigFor("restricted");
    config.sandbox.allow_annotations = false;
    CodeSession session(config);
    const auto result = session.Execute("x: int = 1\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "Compilation Error:"));
    EXPECT_TRUE(Contains(result.stderr_text, "Line 1: AnnAssign statements are not allowed."));
}

TEST(CompiledRestrictedSandbox, BlocksPrivateAttributeAccess) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute("x = 1\nprint(x.__class__)\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "Compilation Error:"));
}

TEST(CompiledRestrictedSandbox, SetattrCannotPatchModules) {
    CodeSession session(ConfigFor("restricted"));
    const auto patched = session.Execute("import math\nsetattr(math, 'pi', 3)\n");
    EXPECT_EQ(patched.exit_code, 1);
    EXPECT_TRUE(Contains(patched.stderr_text, "TypeError: cannot modify attributes of 'module' objects"));
    const auto assigned = session.Execute("import math\nmath.pi = 3\n");
    EXPECT_EQ(assigned.exit_code, 1);
    EXPECT_TRUE(Contains(assigned.stderr_text, "TypeError"));
    const auto deleted = session.Execute("import math\ndelattr(math, 'pi')\n");
    EXPECT_EQ(deleted.exit_code, 1);
    const auto intact = session.Execute("import math\nprint(math.pi)\n");
    EXPECT_EQ(intact.stdout_text, "3.141592653589793\n");
}

TEST(CompiledRestrictedSandbox, SetattrWorksOnGuestObjects) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute(
        "class Box:\n"
        "    pass\n"
        "b = Box()\n"
        "setattr(b, 'size', 3)\n"
        "print(getattr(b, 'size'), hasattr(b, 'size'), getattr(b, 'missing', 'none'))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "3 True none\n");
}

TEST(CompiledRestrictedSandbox, GetattrRefusesPrivateNames) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute("print(getattr(1, '__class__'))\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "AttributeError"));
    EXPECT_EQ(session.Execute("print(hasattr(1, '__class__'))\n").stdout_text, "False\n");
}

TEST(CompiledRestrictedSandbox, ModulesReachedThroughAttributesFollowPolicy) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute("import dataclasses\nprint(dataclasses.sys)\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "module 'sys' is not reachable from guest code"));
}

TEST(CompiledRestrictedSandbox, SwallowedCapabilityErrorStillFaults) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute(
        "try:\n"
        "    import os\n"
        "except:\n"
        "    print('caught')\n"
        "print('after')\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(Contains(result.stdout_text, "caught"));
    EXPECT_TRUE(Contains(result.stderr_text, "CapabilityError: Import of 'os' is not allowed."));
}

TEST(CompiledRestrictedSandbox, FinallyJumpsAreRejected) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute(
        "def f():\n"
        "    try:\n"
        "        import os\n"
        "    finally:\n"
        "        return 0\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "Line 5: 'return' inside a finally block is not allowed."));
}

TEST(CompiledRestrictedSandbox, TracebacksNameTheGuestSource) {
    CodeSession session(ConfigFor("restricted"));
    const auto result = session.Execute("x = 1\ny = x / 0\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "File \"<user_code>\", line 2"));
    EXPECT_TRUE(Contains(result.stderr_text, "ZeroDivisionError: division by zero"));
}

TEST(InterpretedSandbox, EchoesFinalExpression) {
    CodeSession session(ConfigFor("interpreted"));
    const auto result = session.Execute("x = 5\nx + 1\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "6\n");
    EXPECT_EQ(session.Execute("print('hi')\n").stdout_text, "hi\n");
    EXPECT_EQ(session.Execute("'done'\n").stdout_text, "\"done\"\n");
}

TEST(InterpretedSandbox, PercentIntegerOverflowIsAnError) {
    CodeSession session(ConfigFor("interpreted"));
    const auto result = session.Execute("print('%d' % 1e300)\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "OverflowError"));
}

TEST(InterpretedSandbox, LeavesNativeDecoratorsUnapplied) {
    CodeSession session(ConfigFor("interpreted"));
    const auto result = session.Execute(kDataclassProgram);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "TypeError"));
    EXPECT_TRUE(Contains(result.stderr_text, "__init__"));
    EXPECT_TRUE(Contains(result.stderr_text, "@dataclass"));
}

TEST(InterpretedSandbox, MatchIsNotImplemented) {
    CodeSession session(ConfigFor("interpreted"));
    const auto result = session.Execute("v = 1\nmatch v:\n    case 1:\n        print('one')\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(Contains(result.stderr_text, "NotImplementedError"));
}

TEST(InterpretedSandbox, CallsGuestDecorators) {
    CodeSession session(ConfigFor("interpreted"));
    const auto result = session.Execute(
        "def twice(fn):\n"
        "    def wrapper(v):\n"
        "        return fn(fn(v))\n"
        "    return wrapper\n"
        "@twice\n"
        "def inc(v):\n"
        "    return v + 1\n"
        "print(inc(1))\n");
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "3\n");
}

TEST(CodeSession, TracksEpisodeState) {
    CodeSession session(ConfigFor("interpreted"));
    const std::string first = session.state().episode_id;
    EXPECT_EQ(first.size(), 36u);
    EXPECT_EQ(first[14], '4');
    EXPECT_EQ(session.state().step_count, 0);

    session.Execute("x = 1\n");
    session.Execute("1 / 0\n");
    EXPECT_EQ(session.state().step_count, 2);
    EXPECT_EQ(session.state().last_exit_code, 1);

    session.ResetContext();
    EXPECT_EQ(session.state().step_count, 0);
    EXPECT_EQ(session.state().last_exit_code, 0);
    EXPECT_NE(session.state().episode_id, first);
}

TEST(CodeSession, RejectsUnknownBackend) {
    EXPECT_THROW(CodeSession session(ConfigFor("jit")), std::invalid_argument);
}
