#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "config/config_loader.hpp"

using codeact::config::LoadConfig;

namespace {

const char* kOverrides[] = {
    "CODEACT_BACKEND", "ADDITIONAL_IMPORTS", "CODEACT_ALLOW_ANNOTATIONS", "CODEACT_RENDER_WAIT_MS",
    "CODEACT_CAPTURE_MODE", "DISPLAY", "CODEACT_LOG_LEVEL"
};

}  // namespace

class ConfigLoader : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kOverrides) {
            ::unsetenv(name);
        }
        path_ = std::filesystem::temp_directory_path() /
                ("codeact_config_test_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        for (const char* name : kOverrides) {
            ::unsetenv(name);
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void WriteConfig(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path path_;
};

TEST_F(ConfigLoader, MissingFileYieldsDefaults) {
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.sandbox.backend, "restricted");
    EXPECT_TRUE(config.sandbox.allow_annotations);
    EXPECT_TRUE(config.sandbox.additional_imports.empty());
    EXPECT_EQ(config.capture.mode, "surface");
    EXPECT_EQ(config.capture.render_wait_ms, 500);
    ASSERT_EQ(config.capture.toolkits.size(), 2u);
    EXPECT_EQ(config.capture.toolkits[0], "canvas");
    EXPECT_EQ(config.surface.width, 640);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigLoader, ReadsFileValues) {
    WriteConfig(R"({
        "sandbox": {"backend": "interpreted", "additionalImports": ["canvas", "plot"], "maxCallDepth": 50},
        "capture": {"mode": "command", "display": ":1", "command": ["scrot", "{output}"], "timeoutS": 3,
                    "renderWaitMs": 0, "toolkits": ["plot"]},
        "surface": {"width": 100, "height": 80},
        "logging": {"level": "debug"}
    })");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.sandbox.backend, "interpreted");
    ASSERT_EQ(config.sandbox.additional_imports.size(), 2u);
    EXPECT_EQ(config.sandbox.additional_imports[1], "plot");
    EXPECT_EQ(config.sandbox.max_call_depth, 50);
    EXPECT_EQ(config.capture.mode, "command");
    EXPECT_EQ(config.capture.display, ":1");
    ASSERT_EQ(config.capture.command.size(), 2u);
    EXPECT_EQ(config.capture.command[0], "scrot");
    EXPECT_EQ(config.capture.timeout_s, 3);
    EXPECT_EQ(config.capture.render_wait_ms, 0);
    ASSERT_EQ(config.capture.toolkits.size(), 1u);
    EXPECT_EQ(config.surface.width, 100);
    EXPECT_EQ(config.surface.height, 80);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoader, IgnoresValuesOfWrongType) {
    WriteConfig(R"({"sandbox": {"backend": 3, "allowAnnotations": "no"}, "surface": {"width": "wide"}})");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.sandbox.backend, "restricted");
    EXPECT_TRUE(config.sandbox.allow_annotations);
    EXPECT_EQ(config.surface.width, 640);
}

TEST_F(ConfigLoader, MalformedFileKeepsDefaults) {
    WriteConfig("{\"sandbox\": {\"backend\": \"interpreted\"");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.sandbox.backend, "restricted");
}

TEST_F(ConfigLoader, EnvironmentOverridesFile) {
    WriteConfig(R"({"sandbox": {"backend": "restricted", "additionalImports": ["plot"]}})");
    ::setenv("CODEACT_BACKEND", "interpreted", 1);
    ::setenv("ADDITIONAL_IMPORTS", "canvas, ,numpy", 1);
    ::setenv("CODEACT_ALLOW_ANNOTATIONS", "false", 1);
    ::setenv("CODEACT_RENDER_WAIT_MS", "250", 1);
    ::setenv("CODEACT_CAPTURE_MODE", "command", 1);
    ::setenv("DISPLAY", ":42", 1);
    ::setenv("CODEACT_LOG_LEVEL", "warn", 1);
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.sandbox.backend, "interpreted");
    ASSERT_EQ(config.sandbox.additional_imports.size(), 2u);
    EXPECT_EQ(config.sandbox.additional_imports[0], "canvas");
    EXPECT_EQ(config.sandbox.additional_imports[1], "numpy");
    EXPECT_FALSE(config.sandbox.allow_annotations);
    EXPECT_EQ(config.capture.render_wait_ms, 250);
    EXPECT_EQ(config.capture.mode, "command");
    EXPECT_EQ(config.capture.display, ":42");
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigLoader, InvalidNumericOverrideKeepsValue) {
    ::setenv("CODEACT_RENDER_WAIT_MS", "soon", 1);
    ::setenv("CODEACT_ALLOW_ANNOTATIONS", "maybe", 1);
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.capture.render_wait_ms, 500);
    EXPECT_TRUE(config.sandbox.allow_annotations);
}
