#include <gtest/gtest.h>

#include <algorithm>

#include "policy/capability_policy.hpp"
#include "policy/provisioning.hpp"
#include "script/errors.hpp"

using codeact::policy::Capability;
using codeact::policy::CapabilityPolicy;

TEST(CapabilityPolicy, StandardModulesAreAlwaysResolvable) {
    const auto policy = CapabilityPolicy::WithDefaults({});
    EXPECT_EQ(policy.Authorize("math"), Capability::kStdlibOnly);
    EXPECT_EQ(policy.Authorize("json"), Capability::kStdlibOnly);
    EXPECT_EQ(policy.Authorize("dataclasses"), Capability::kStdlibOnly);
}

TEST(CapabilityPolicy, OnlyTopLevelComponentIsConsulted) {
    const auto policy = CapabilityPolicy::WithDefaults({"canvas"});
    EXPECT_EQ(policy.Authorize("canvas.widgets.deep"), Capability::kAuthorized);
    EXPECT_EQ(policy.Authorize("os.path"), Capability::kDenied);
}

TEST(CapabilityPolicy, ExtendedNamesAreTrimmedToTopLevel) {
    const auto policy = CapabilityPolicy::WithDefaults({"numpy.linalg"});
    EXPECT_EQ(policy.extended().count("numpy"), 1u);
    EXPECT_EQ(policy.Authorize("numpy"), Capability::kAuthorized);
}

TEST(CapabilityPolicy, RequireNamesDeniedImportAndAllowedSet) {
    const auto policy = CapabilityPolicy::WithDefaults({"plot"});
    try {
        policy.Require("os.path");
        FAIL() << "expected CapabilityError";
    } catch (const codeact::script::CapabilityError& e) {
        EXPECT_EQ(e.name(), "os.path");
        const std::string message = e.what();
        EXPECT_NE(message.find("Import of 'os.path' is not allowed"), std::string::npos);
        EXPECT_NE(message.find("'plot'"), std::string::npos);
        EXPECT_NE(message.find("'math'"), std::string::npos);
    }
    EXPECT_NO_THROW(policy.Require("plot"));
}

TEST(CapabilityPolicy, AllowedModulesAreSorted) {
    const auto policy = CapabilityPolicy::WithDefaults({"zlib", "canvas"});
    const auto allowed = policy.AllowedModules();
    EXPECT_TRUE(std::is_sorted(allowed.begin(), allowed.end()));
    EXPECT_NE(std::find(allowed.begin(), allowed.end(), "zlib"), allowed.end());
}

TEST(Provisioning, ParseImportListSkipsBlankEntries) {
    const auto names = codeact::policy::ParseImportList(" canvas, ,plot ,json,");
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "canvas");
    EXPECT_EQ(names[1], "plot");
    EXPECT_EQ(names[2], "json");
}

TEST(Provisioning, SplitsInstallCandidatesFromBundledModules) {
    const auto plan = codeact::policy::ResolveImports({"canvas", "numpy.linalg", "numpy", "json", ""});
    ASSERT_EQ(plan.install.size(), 1u);
    EXPECT_EQ(plan.install[0], "numpy");
    EXPECT_NE(std::find(plan.authorized.begin(), plan.authorized.end(), "numpy.linalg"), plan.authorized.end());
    EXPECT_NE(std::find(plan.authorized.begin(), plan.authorized.end(), "canvas"), plan.authorized.end());
}

TEST(Provisioning, CorrectsKnownTypos) {
    const auto plan = codeact::policy::ResolveImports({"dataclass", "dataclass"});
    ASSERT_EQ(plan.corrections.count("dataclass"), 1u);
    EXPECT_EQ(plan.corrections.at("dataclass"), "dataclasses");
    ASSERT_EQ(plan.authorized.size(), 1u);
    EXPECT_EQ(plan.authorized[0], "dataclasses");
    EXPECT_TRUE(plan.install.empty());
}

TEST(Provisioning, BuildPolicyAuthorizesPlannedNames) {
    const auto policy = codeact::policy::BuildPolicy(codeact::policy::ResolveImports({"canvas"}));
    EXPECT_EQ(policy.Authorize("canvas"), Capability::kAuthorized);
    EXPECT_EQ(policy.Authorize("plot"), Capability::kDenied);
}
