#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "capture/artifact_slot.hpp"
#include "capture/capture_coordinator.hpp"
#include "capture/capture_primitive.hpp"
#include "config/config_schema.hpp"
#include "render/surface.hpp"
#include "render/toolkit_host.hpp"
#include "sandbox/compiled_restricted_sandbox.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/interpreted_sandbox.hpp"
#include "sandbox/session_context.hpp"
#include "script/module_registry.hpp"

namespace codeact::sandbox {

using ExecutionStrategy = std::variant<InterpretedSandbox, CompiledRestrictedSandbox>;

// Episode bookkeeping. A new episode starts with every context reset.
struct CodeState {
    std::string episode_id;
    int step_count = 0;
    int last_exit_code = 0;
};

// One sandboxed session: capability policy, persistent bindings, rendering
// surface and the last captured artifact. Not reentrant; callers serialize.
class CodeSession {
public:
    explicit CodeSession(const config::Config& config);
    ~CodeSession();

    CodeSession(const CodeSession&) = delete;
    CodeSession& operator=(const CodeSession&) = delete;

    // Never throws for guest faults; they come back as a nonzero exit code.
    ExecutionResult Execute(const std::string& program, const ExecuteOptions& options = {});

    std::optional<std::string> GetCapturedArtifact() const;
    void ClearArtifact();
    void ResetContext();
    // Clears the artifact and the context. Idempotent.
    void Teardown();

    const CodeState& state() const { return state_; }
    const char* strategy_name() const;
    const policy::CapabilityPolicy& policy() const { return registry_.policy(); }
    SessionContext& context() { return context_; }
    render::Surface& surface() { return *surface_; }
    // Options with the configured render wait.
    ExecuteOptions DefaultOptions(bool capture) const;

private:
    config::Config config_;
    script::ModuleRegistry registry_;
    std::unique_ptr<render::Surface> surface_;
    render::ToolkitHost host_;
    std::unique_ptr<capture::CapturePrimitive> primitive_;
    capture::ArtifactSlot slot_;
    capture::CaptureCoordinator coordinator_;
    script::Namespace helpers_;
    SessionContext context_;
    ExecutionStrategy strategy_;
    CodeState state_;
};

}  // namespace codeact::sandbox
