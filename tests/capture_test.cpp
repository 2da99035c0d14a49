#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "capture/artifact_slot.hpp"
#include "capture/capture_coordinator.hpp"
#include "capture/capture_primitive.hpp"
#include "config/config_schema.hpp"
#include "render/surface.hpp"
#include "sandbox/code_session.hpp"

using namespace codeact;

namespace {

config::Config CaptureConfig(const std::string& backend = "restricted") {
    config::Config config;
    config.sandbox.backend = backend;
    config.sandbox.additional_imports = {"canvas", "plot"};
    config.surface.width = 64;
    config.surface.height = 48;
    return config;
}

sandbox::ExecuteOptions Capturing() {
    sandbox::ExecuteOptions options;
    options.capture = true;
    options.render_wait = 0;
    return options;
}

// Counts pixels of `color` in a binary PPM.
int CountPixels(const std::string& ppm, render::Color color) {
    std::size_t offset = 0;
    for (int newlines = 0; newlines < 3 && offset < ppm.size(); ++offset) {
        newlines += ppm[offset] == '\n';
    }
    int count = 0;
    for (std::size_t i = offset; i + 2 < ppm.size(); i += 3) {
        if (static_cast<std::uint8_t>(ppm[i]) == color.r && static_cast<std::uint8_t>(ppm[i + 1]) == color.g &&
            static_cast<std::uint8_t>(ppm[i + 2]) == color.b) {
            ++count;
        }
    }
    return count;
}

const render::Color kRed{255, 0, 0};

const char* kRedRectangle =
    "import canvas\n"
    "c = canvas.Canvas(width=40, height=30)\n"
    "c.create_rectangle(0, 0, 20, 20, fill='red')\n";

}  // namespace

TEST(Surface, ParsesNamedAndHexColors) {
    ASSERT_TRUE(render::ParseColor("Red").has_value());
    EXPECT_EQ(*render::ParseColor("red"), kRed);
    EXPECT_EQ(*render::ParseColor("#00ff80"), (render::Color{0, 255, 128}));
    EXPECT_FALSE(render::ParseColor("#12345").has_value());
    EXPECT_FALSE(render::ParseColor("chartreuse-ish").has_value());
}

TEST(Surface, SnapshotCompositesOpenWindows) {
    render::MemorySurface surface(10, 10);
    render::Image content(4, 4, kRed);
    const int window = surface.OpenWindow(2, 2, content);
    EXPECT_EQ(surface.window_count(), 1u);
    EXPECT_EQ(surface.Snapshot().At(3, 3), kRed);
    surface.CloseWindow(window);
    EXPECT_FALSE(surface.Snapshot().Contains(kRed));
}

TEST(Surface, EncodesBinaryPpm) {
    render::Image image(2, 1, kRed);
    const std::string ppm = render::EncodePpm(image);
    EXPECT_EQ(ppm.substr(0, 11), "P6\n2 1\n255\n");
    EXPECT_EQ(ppm.size(), 11u + 6u);
    EXPECT_EQ(CountPixels(ppm, kRed), 2);
}

TEST(CaptureCoordinator, TrailerRunsInsideDeletedFunction) {
    render::MemorySurface surface(8, 8);
    render::ToolkitHost host(surface);
    capture::SurfaceCapture primitive(surface);
    capture::ArtifactSlot slot;
    capture::CaptureCoordinator coordinator(host, primitive, slot, {"canvas", "plot"});
    const std::string program = coordinator.AppendTrailer("x = 1", 0.25);
    EXPECT_EQ(program.rfind("x = 1\n", 0), 0u);
    EXPECT_NE(program.find("flush_toolkit('canvas')"), std::string::npos);
    EXPECT_NE(program.find("flush_toolkit('plot')"), std::string::npos);
    EXPECT_NE(program.find("time.sleep(0.25)"), std::string::npos);
    EXPECT_NE(program.find(std::string("del ") + capture::CaptureCoordinator::kTrailerFunction), std::string::npos);
}

TEST(CaptureCoordinator, RenderWaitKeepsFullPrecision) {
    render::MemorySurface surface(8, 8);
    render::ToolkitHost host(surface);
    capture::SurfaceCapture primitive(surface);
    capture::ArtifactSlot slot;
    capture::CaptureCoordinator coordinator(host, primitive, slot, {});
    EXPECT_NE(coordinator.AppendTrailer("", 1234567.5).find("time.sleep(1234567.5)"), std::string::npos);
    EXPECT_NE(coordinator.AppendTrailer("", 0.1).find("time.sleep(0.10000000000000001)"), std::string::npos);
}

TEST(CaptureCoordinator, RejectsInvalidRenderWait) {
    render::MemorySurface surface(8, 8);
    render::ToolkitHost host(surface);
    capture::SurfaceCapture primitive(surface);
    capture::ArtifactSlot slot;
    capture::CaptureCoordinator coordinator(host, primitive, slot, {"canvas"});
    EXPECT_THROW(coordinator.AppendTrailer("", -1.0), std::invalid_argument);
    EXPECT_THROW(coordinator.AppendTrailer("", std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(coordinator.AppendTrailer("", std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_NO_THROW(coordinator.AppendTrailer("", 0.0));
}

class CaptureSession : public ::testing::TestWithParam<std::string> {
protected:
    sandbox::CodeSession session_{CaptureConfig(GetParam())};
};

TEST_P(CaptureSession, ArtifactReflectsToolkitStateAtEndOfProgram) {
    const auto result = session_.Execute(kRedRectangle, Capturing());
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_TRUE(result.artifact_available);
    EXPECT_NE(result.stdout_text.find("[capture] captured"), std::string::npos);

    const auto artifact = session_.GetCapturedArtifact();
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->rfind("P6\n64 48\n255\n", 0), 0u);
    EXPECT_EQ(CountPixels(*artifact, kRed), 20 * 20);
}

TEST_P(CaptureSession, CaptureAfterExecutionSeesTornDownSurface) {
    ASSERT_EQ(session_.Execute(kRedRectangle, Capturing()).exit_code, 0);
    EXPECT_EQ(session_.surface().window_count(), 0u);
    capture::SurfaceCapture late(session_.surface());
    const auto outcome = late.Capture();
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(CountPixels(outcome.data, kRed), 0);
}

TEST_P(CaptureSession, TrailerLeavesNoBindings) {
    ASSERT_EQ(session_.Execute(kRedRectangle, Capturing()).exit_code, 0);
    auto& context = session_.context();
    EXPECT_TRUE(context.Contains("c"));
    EXPECT_FALSE(context.Contains(capture::CaptureCoordinator::kTrailerFunction));
    EXPECT_FALSE(context.Contains("outcome"));
}

TEST_P(CaptureSession, FlushFailureDoesNotAbortOtherToolkits) {
    const auto result = session_.Execute(
        std::string(kRedRectangle) +
            "import plot\n"
            "plot.figure(width=10, height=10)\n"
            "plot.rect(0, 0, 5, 5, color='not-a-color')\n",
        Capturing());
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_NE(result.stdout_text.find("[capture] flush of plot failed"), std::string::npos);
    EXPECT_NE(result.stdout_text.find("'not-a-color' is not a valid color value"), std::string::npos);
    const auto artifact = session_.GetCapturedArtifact();
    ASSERT_TRUE(artifact.has_value());
    EXPECT_GT(CountPixels(*artifact, kRed), 0);
}

TEST_P(CaptureSession, PlotDrawValidatesColors) {
    const auto result = session_.Execute(
        "import plot\n"
        "plot.figure()\n"
        "plot.rect(1, 1, 2, 2, color='nope')\n"
        "plot.draw()\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("ValueError: 'nope' is not a valid color value"), std::string::npos);
}

TEST_P(CaptureSession, ToolkitModulesNeedAuthorization) {
    auto config = CaptureConfig(GetParam());
    config.sandbox.additional_imports.clear();
    sandbox::CodeSession locked(config);
    const auto result = locked.Execute("import canvas\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("Import of 'canvas' is not allowed."), std::string::npos);
}

TEST_P(CaptureSession, InvalidRenderWaitFaultsTheRun) {
    auto options = Capturing();
    options.render_wait = -0.5;
    const auto result = session_.Execute("ran = True\n", options);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.artifact_available);
    EXPECT_FALSE(session_.context().Contains("ran"));
}

TEST_P(CaptureSession, CapturingRunClearsPreviousArtifact) {
    ASSERT_EQ(session_.Execute(kRedRectangle, Capturing()).exit_code, 0);
    ASSERT_TRUE(session_.GetCapturedArtifact().has_value());
    auto options = Capturing();
    options.render_wait = std::nan("");
    EXPECT_EQ(session_.Execute("pass\n", options).exit_code, 1);
    EXPECT_FALSE(session_.GetCapturedArtifact().has_value());
}

TEST_P(CaptureSession, NonCapturingRunKeepsArtifact) {
    ASSERT_EQ(session_.Execute(kRedRectangle, Capturing()).exit_code, 0);
    const auto result = session_.Execute("y = 2\n");
    EXPECT_FALSE(result.artifact_available);
    EXPECT_TRUE(session_.GetCapturedArtifact().has_value());
}

TEST_P(CaptureSession, ClearArtifactIsIdempotent) {
    EXPECT_NO_THROW(session_.ClearArtifact());
    ASSERT_EQ(session_.Execute(kRedRectangle, Capturing()).exit_code, 0);
    session_.ClearArtifact();
    EXPECT_NO_THROW(session_.ClearArtifact());
    EXPECT_FALSE(session_.GetCapturedArtifact().has_value());
}

TEST_P(CaptureSession, TeardownIsIdempotent) {
    ASSERT_EQ(session_.Execute(kRedRectangle, Capturing()).exit_code, 0);
    session_.Teardown();
    EXPECT_NO_THROW(session_.Teardown());
    EXPECT_FALSE(session_.GetCapturedArtifact().has_value());
    EXPECT_EQ(session_.Execute("print(c)\n").exit_code, 1);
}

TEST_P(CaptureSession, DestroyedCanvasRaises) {
    const auto result = session_.Execute(
        "import canvas\n"
        "c = canvas.Canvas()\n"
        "c.destroy()\n"
        "c.update()\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_text.find("RuntimeError"), std::string::npos);
}

TEST_P(CaptureSession, ResultRendersForTransport) {
    const auto result = session_.Execute(kRedRectangle, Capturing());
    const auto json = sandbox::ToJson(result, session_.GetCapturedArtifact());
    EXPECT_EQ(json["exit_code"], 0);
    EXPECT_EQ(json["artifact_available"], true);
    ASSERT_TRUE(json.contains("artifact"));
    EXPECT_EQ(json["artifact"].get<std::string>().rfind("UDYK", 0), 0u);

    const auto decoded = sandbox::FromJson(json);
    EXPECT_EQ(decoded.stdout_text, result.stdout_text);
    EXPECT_TRUE(decoded.artifact_available);
}

TEST(ExecutionResult, InvalidUtf8OutputStillRendersForTransport) {
    sandbox::ExecutionResult result;
    result.stdout_text = "caf\xC3";
    result.stderr_text = "\xFF\n";
    std::string line;
    ASSERT_NO_THROW(line = sandbox::DumpLine(sandbox::ToJson(result)));
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_NE(line.find("caf\xEF\xBF\xBD"), std::string::npos);
}

TEST_P(CaptureSession, FailedCaptureStillCountsAsAStep) {
    auto config = CaptureConfig(GetParam());
    config.capture.mode = "command";
    config.capture.command = {"codeact-no-such-screenshot-tool", "{output}"};
    sandbox::CodeSession session(config);
    const auto result = session.Execute(kRedRectangle, Capturing());
    EXPECT_EQ(result.exit_code, 0) << result.stderr_text;
    EXPECT_FALSE(result.artifact_available);
    EXPECT_NE(result.stdout_text.find("[capture] failed"), std::string::npos);
    EXPECT_EQ(session.state().step_count, 1);
    EXPECT_EQ(session.state().last_exit_code, 0);
}

INSTANTIATE_TEST_SUITE_P(Backends, CaptureSession, ::testing::Values("interpreted", "restricted"));

TEST(CommandCapture, MissingCommandIsACaptureFailure) {
    capture::CommandCaptureOptions options;
    options.command = {"codeact-no-such-screenshot-tool", "{output}"};
    capture::CommandCapture primitive(options);
    const auto outcome = primitive.Capture();
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.error.find("not found"), std::string::npos);
}

TEST(CommandCapture, FailingCommandReportsExitStatus) {
    capture::CommandCaptureOptions options;
    options.command = {"false"};
    capture::CommandCapture primitive(options);
    const auto outcome = primitive.Capture();
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.error.find("exited with status"), std::string::npos);
}

TEST(CommandCapture, EmptyOutputIsAFailure) {
    capture::CommandCaptureOptions options;
    options.command = {"true", "{output}"};
    capture::CommandCapture primitive(options);
    const auto outcome = primitive.Capture();
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.error.find("no image"), std::string::npos);
}

TEST(CommandCapture, ReadsWrittenFile) {
    capture::CommandCaptureOptions options;
    options.command = {"sh", "-c", "printf image > \"$0\"", "{output}"};
    capture::CommandCapture primitive(options);
    const auto outcome = primitive.Capture();
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.data, "image");
}
