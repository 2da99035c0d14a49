#include <gtest/gtest.h>

#include <memory>

#include "policy/capability_policy.hpp"
#include "sandbox/compiled_restricted_sandbox.hpp"
#include "sandbox/execution_environment.hpp"
#include "sandbox/interpreted_sandbox.hpp"
#include "sandbox/session_context.hpp"
#include "script/module_registry.hpp"

using namespace codeact;

TEST(SessionContext, CreatedLazily) {
    sandbox::SessionContext context;
    EXPECT_FALSE(context.created());
    EXPECT_EQ(context.size(), 0u);
    context.Get().Set("x", script::Value(static_cast<std::int64_t>(1)));
    EXPECT_TRUE(context.created());
    EXPECT_EQ(context.size(), 1u);
}

TEST(SessionContext, ResetIsIdempotent) {
    sandbox::SessionContext context;
    EXPECT_NO_THROW(context.Reset());
    context.Get().Set("x", script::Value(true));
    context.Reset();
    context.Reset();
    EXPECT_FALSE(context.Get().Contains("x"));
}

TEST(SessionContext, ResetDetachesOldHandle) {
    sandbox::SessionContext context;
    auto before = context.Handle();
    before->Set("x", script::Value(true));
    context.Reset();
    EXPECT_NE(context.Handle(), before);
    EXPECT_TRUE(before->Contains("x"));
    EXPECT_FALSE(context.Get().Contains("x"));
}

TEST(SessionContext, ResetReleasesReferenceCycles) {
    sandbox::SessionContext context;
    auto list = std::make_shared<script::ListObject>();
    const std::weak_ptr<script::ListObject> watch = list;
    list->items.push_back(script::Value(list));
    context.Get().Set("a", script::Value(list));
    list.reset();
    ASSERT_FALSE(watch.expired());
    context.Reset();
    EXPECT_TRUE(watch.expired());
}

TEST(SessionContext, DeepNestingIsReleasedWithoutRecursion) {
    sandbox::SessionContext context;
    script::Value nested = script::MakeList({});
    for (int i = 0; i < 200000; ++i) {
        nested = script::MakeList({nested});
    }
    context.Get().Set("a", std::move(nested));
    EXPECT_NO_THROW(context.Reset());
    EXPECT_FALSE(context.Contains("a"));
}

class SharedContext : public ::testing::Test {
protected:
    SharedContext() : registry_(policy::CapabilityPolicy::WithDefaults({})) {
        script::RegisterStandardModules(registry_);
    }

    script::ModuleRegistry registry_;
    script::Namespace helpers_;
    sandbox::SessionContext context_;
};

TEST_F(SharedContext, BindingsAreNotRevalidated) {
    const sandbox::ExecutionEnvironment env{registry_, helpers_};
    sandbox::CompiledRestrictedSandbox compiled;
    ASSERT_EQ(compiled.Execute("import math\n", context_, env).exit_code, 0);
    const auto result = compiled.Execute("print(math.floor(3.7))\n", context_, env);
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "3\n");
}

TEST_F(SharedContext, ResetClearsPythonBindings) {
    const sandbox::ExecutionEnvironment env{registry_, helpers_};
    sandbox::CompiledRestrictedSandbox compiled;
    ASSERT_EQ(compiled.Execute("base = 7\n", context_, env).exit_code, 0);
    EXPECT_TRUE(context_.Contains("base"));
    context_.Reset();
    EXPECT_FALSE(context_.Contains("base"));
    const auto result = compiled.Execute("print(base)\n", context_, env);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("NameError"), std::string::npos);
}

TEST_F(SharedContext, StrategiesKeepSeparateBindings) {
    const sandbox::ExecutionEnvironment env{registry_, helpers_};
    sandbox::InterpretedSandbox interpreted;
    sandbox::CompiledRestrictedSandbox compiled;
    ASSERT_EQ(interpreted.Execute("walked = 1\n", context_, env).exit_code, 0);
    ASSERT_EQ(compiled.Execute("compiled = 2\n", context_, env).exit_code, 0);
    EXPECT_TRUE(context_.Contains("walked"));
    EXPECT_TRUE(context_.Contains("compiled"));
    EXPECT_EQ(compiled.Execute("print(walked)\n", context_, env).exit_code, 1);
}

TEST_F(SharedContext, HelpersAreVisibleWithoutBeingBound) {
    helpers_.Set("answer", script::Value(static_cast<std::int64_t>(42)));
    const sandbox::ExecutionEnvironment env{registry_, helpers_};
    sandbox::InterpretedSandbox interpreted;
    const auto result = interpreted.Execute("print(answer)\n", context_, env);
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "42\n");
    EXPECT_FALSE(context_.Get().Contains("answer"));
}
