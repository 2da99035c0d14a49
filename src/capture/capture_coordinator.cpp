#include "capture/capture_coordinator.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "script/native.hpp"
#include "utils/logging.hpp"

namespace codeact::capture {

CaptureCoordinator::CaptureCoordinator(render::ToolkitHost& host, CapturePrimitive& primitive, ArtifactSlot& slot,
                                       std::vector<std::string> toolkits)
    : host_(host), primitive_(primitive), slot_(slot), toolkits_(std::move(toolkits)) {}

std::string CaptureCoordinator::AppendTrailer(const std::string& program, double render_wait) const {
    if (!std::isfinite(render_wait) || render_wait < 0) {
        throw std::invalid_argument("render wait must be a non-negative number of seconds");
    }
    std::ostringstream wait;
    wait << std::setprecision(17) << render_wait;

    std::ostringstream trailer;
    trailer << program;
    if (!program.empty() && program.back() != '\n') {
        trailer << "\n";
    }
    trailer << "\n"
            << "def " << kTrailerFunction << "():\n";
    for (const auto& toolkit : toolkits_) {
        trailer << "    try:\n"
                << "        flush_toolkit('" << toolkit << "')\n"
                << "    except Exception as flush_error:\n"
                << "        print(f\"[capture] flush of " << toolkit << " failed: {flush_error}\")\n";
    }
    trailer << "    import time\n"
            << "    time.sleep(" << wait.str() << ")\n"
            << "    try:\n"
            << "        outcome = capture_artifact()\n"
            << "    except Exception as capture_error:\n"
            << "        print(f\"[capture] exception: {capture_error}\")\n"
            << "        return\n"
            << "    for line in outcome['debug']:\n"
            << "        print(f\"[capture] {line}\")\n"
            << "    if outcome['success']:\n"
            << "        size = outcome['size']\n"
            << "        print(f\"[capture] captured {size} bytes\")\n"
            << "    else:\n"
            << "        reason = outcome['error']\n"
            << "        print(f\"[capture] failed: {reason}\")\n"
            << kTrailerFunction << "()\n"
            << "del " << kTrailerFunction << "\n";
    return trailer.str();
}

void CaptureCoordinator::InstallHelpers(script::Namespace& helpers) {
    helpers.Set("flush_toolkit", script::NativeFunction("flush_toolkit", [this](script::Runtime&, script::CallArgs& args) {
        script::CheckArity(args, "flush_toolkit", 1, 1);
        host_.Flush(script::StrArgument(args.positional[0], "toolkit name"));
        return script::Value();
    }));
    helpers.Set("capture_artifact", script::NativeFunction("capture_artifact", [this](script::Runtime&, script::CallArgs& args) {
        script::CheckArity(args, "capture_artifact", 0, 0);
        CaptureOutcome outcome = primitive_.Capture();
        auto result = std::make_shared<script::DictObject>();
        result->Set(script::Value("success"), script::Value(outcome.success));
        std::vector<script::Value> debug;
        for (auto& line : outcome.debug) {
            debug.emplace_back(std::move(line));
        }
        result->Set(script::Value("debug"), script::MakeList(std::move(debug)));
        if (outcome.success) {
            result->Set(script::Value("size"), script::Value(static_cast<std::int64_t>(outcome.data.size())));
            utils::Log(utils::LogLevel::kDebug, "capture",
                       primitive_.name() + " capture stored " + std::to_string(outcome.data.size()) + " bytes");
            slot_.Store(std::move(outcome.data));
        } else {
            result->Set(script::Value("error"), script::Value(outcome.error));
        }
        return script::Value(result);
    }));
}

}  // namespace codeact::capture
