#pragma once

#include <string>
#include <vector>

#include "capture/artifact_slot.hpp"
#include "capture/capture_primitive.hpp"
#include "render/toolkit_host.hpp"
#include "script/value.hpp"

namespace codeact::capture {

// Captures the artifact inside the execution that drew it: the program is
// extended with a trailer that flushes the toolkits, waits for rendering
// and calls the capture helper before toolkit windows are torn down.
class CaptureCoordinator {
public:
    // Name of the guest function holding the trailer; deleted after it ran.
    static constexpr const char* kTrailerFunction = "codeact_capture_trailer";

    CaptureCoordinator(render::ToolkitHost& host, CapturePrimitive& primitive, ArtifactSlot& slot,
                       std::vector<std::string> toolkits);

    // Throws std::invalid_argument for a negative or non-finite wait.
    std::string AppendTrailer(const std::string& program, double render_wait) const;

    // Binds flush_toolkit(name) and capture_artifact() into `helpers`.
    void InstallHelpers(script::Namespace& helpers);

    const std::vector<std::string>& toolkits() const { return toolkits_; }

private:
    render::ToolkitHost& host_;
    CapturePrimitive& primitive_;
    ArtifactSlot& slot_;
    std::vector<std::string> toolkits_;
};

}  // namespace codeact::capture
