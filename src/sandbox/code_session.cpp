#include "sandbox/code_session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "policy/provisioning.hpp"
#include "render/canvas_toolkit.hpp"
#include "render/plot_toolkit.hpp"
#include "utils/logging.hpp"

namespace codeact::sandbox {
namespace {

policy::CapabilityPolicy PolicyFor(const config::Config& config) {
    const auto plan = policy::ResolveImports(config.sandbox.additional_imports);
    for (const auto& correction : plan.corrections) {
        utils::Log(utils::LogLevel::kInfo, "sandbox",
                   "import \"" + correction.first + "\" corrected to \"" + correction.second + "\"");
    }
    for (const auto& name : plan.install) {
        utils::Log(utils::LogLevel::kDebug, "sandbox", "extended module requires provisioning: " + name);
    }
    return policy::BuildPolicy(plan);
}

std::unique_ptr<capture::CapturePrimitive> PrimitiveFor(const config::Config& config, const render::Surface& surface) {
    if (config.capture.mode == "command") {
        capture::CommandCaptureOptions options;
        options.command = config.capture.command;
        options.display = config.capture.display;
        options.timeout = std::chrono::seconds(config.capture.timeout_s);
        return std::make_unique<capture::CommandCapture>(std::move(options));
    }
    if (config.capture.mode != "surface") {
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "unknown capture mode \"" + config.capture.mode + "\", using surface");
    }
    return std::make_unique<capture::SurfaceCapture>(surface);
}

// Random version 4 UUID in its canonical text form.
std::string NewEpisodeId() {
    std::random_device device;
    std::mt19937_64 engine((static_cast<std::uint64_t>(device()) << 32) | device());
    std::uint64_t high = engine();
    std::uint64_t low = engine();
    high = (high & ~0xF000ULL) | 0x4000ULL;
    low = (low & ~(0xC000ULL << 48)) | (0x8000ULL << 48);
    std::ostringstream text;
    text << std::hex << std::setfill('0') << std::setw(8) << (high >> 32) << '-' << std::setw(4)
         << ((high >> 16) & 0xFFFF) << '-' << std::setw(4) << (high & 0xFFFF) << '-' << std::setw(4) << (low >> 48)
         << '-' << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return text.str();
}

ExecutionStrategy StrategyFor(const config::SandboxConfig& sandbox) {
    if (sandbox.backend == InterpretedSandbox::kName) {
        return InterpretedSandbox{};
    }
    if (sandbox.backend != CompiledRestrictedSandbox::kName) {
        throw std::invalid_argument("unknown sandbox backend: " + sandbox.backend);
    }
    return CompiledRestrictedSandbox(sandbox.allow_annotations);
}

}  // namespace

CodeSession::CodeSession(const config::Config& config)
    : config_(config),
      registry_(PolicyFor(config)),
      surface_(std::make_unique<render::MemorySurface>(config.surface.width, config.surface.height)),
      host_(*surface_),
      primitive_(PrimitiveFor(config, *surface_)),
      coordinator_(host_, *primitive_, slot_, config.capture.toolkits),
      strategy_(StrategyFor(config.sandbox)) {
    state_.episode_id = NewEpisodeId();
    script::RegisterStandardModules(registry_);
    render::InstallCanvasToolkit(host_, registry_);
    render::InstallPlotToolkit(host_, registry_);
    coordinator_.InstallHelpers(helpers_);
    utils::Log(utils::LogLevel::kDebug, "sandbox",
               std::string("session ready: backend=") + strategy_name() + " capture=" + primitive_->name());
}

CodeSession::~CodeSession() {
    Teardown();
}

const char* CodeSession::strategy_name() const {
    return std::visit([](const auto& strategy) { return std::decay_t<decltype(strategy)>::kName; }, strategy_);
}

ExecuteOptions CodeSession::DefaultOptions(bool capture) const {
    ExecuteOptions options;
    options.capture = capture;
    options.render_wait = config_.capture.render_wait_ms / 1000.0;
    return options;
}

ExecutionResult CodeSession::Execute(const std::string& program, const ExecuteOptions& options) {
    std::string source = program;
    if (options.capture) {
        slot_.Clear();
        try {
            source = coordinator_.AppendTrailer(program, options.render_wait);
        } catch (const std::invalid_argument& ex) {
            utils::Log(utils::LogLevel::kWarn, "capture", ex.what());
            ExecutionResult result;
            result.stderr_text = std::string("ValueError: ") + ex.what() + "\n";
            result.exit_code = 1;
            return result;
        }
    }

    ExecutionEnvironment env{registry_, helpers_, config_.sandbox.max_call_depth};
    env.program_lines = static_cast<int>(std::count(program.begin(), program.end(), '\n')) + 1;
    ExecutionResult result;
    {
        render::ToolkitHost::ExecutionScope scope(host_);
        result = std::visit([&](auto& strategy) { return strategy.Execute(source, context_, env); }, strategy_);
    }
    result.artifact_available = options.capture && slot_.has_value();
    ++state_.step_count;
    state_.last_exit_code = result.exit_code;
    if (options.capture && !result.artifact_available) {
        utils::Log(utils::LogLevel::kWarn, "capture",
                   "capture was requested but no artifact was captured; nothing may have been rendered");
    }
    utils::Log(utils::LogLevel::kDebug, "sandbox",
               std::string(strategy_name()) + " execution finished with exit code " + std::to_string(result.exit_code));
    return result;
}

std::optional<std::string> CodeSession::GetCapturedArtifact() const {
    return slot_.Get();
}

void CodeSession::ClearArtifact() {
    slot_.Clear();
}

void CodeSession::ResetContext() {
    context_.Reset();
    registry_.ClearCache();
    state_ = CodeState{NewEpisodeId()};
    utils::Log(utils::LogLevel::kDebug, "sandbox", "episode " + state_.episode_id + " started");
}

void CodeSession::Teardown() {
    host_.TeardownAll();
    ClearArtifact();
    ResetContext();
}

}  // namespace codeact::sandbox
