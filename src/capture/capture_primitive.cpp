#include "capture/capture_primitive.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace codeact::capture {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

std::string Substitute(std::string text, const std::string& key, const std::string& value) {
    for (auto pos = text.find(key); pos != std::string::npos; pos = text.find(key, pos + value.size())) {
        text.replace(pos, key.size(), value);
    }
    return text;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// Polls until the child exits or `deadline` passes.
bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds interval) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(interval);
    }
    return false;
}

// Removes the listed files when the capture attempt ends.
struct TempFiles {
    std::vector<std::filesystem::path> paths;

    ~TempFiles() {
        std::error_code ec;
        for (const auto& path : paths) {
            std::filesystem::remove(path, ec);
        }
    }
};

}  // namespace

CaptureOutcome SurfaceCapture::Capture() {
    CaptureOutcome outcome;
    const render::Image frame = surface_.Snapshot();
    outcome.debug.push_back("surface " + std::to_string(frame.width()) + "x" + std::to_string(frame.height()) +
                            " with " + std::to_string(surface_.window_count()) + " open windows");
    if (frame.width() == 0 || frame.height() == 0) {
        outcome.error = "surface has no pixels";
        return outcome;
    }
    outcome.data = render::EncodePpm(frame);
    outcome.success = true;
    return outcome;
}

CaptureOutcome CommandCapture::Capture() {
    CaptureOutcome outcome;
    try {
        outcome.data = Run(outcome.debug);
        outcome.success = true;
    } catch (const CaptureFailure& failure) {
        outcome.error = failure.what();
        utils::Log(utils::LogLevel::kWarn, "capture", outcome.error);
    }
    return outcome;
}

std::string CommandCapture::Run(std::vector<std::string>& debug) const {
    if (options_.command.empty()) {
        throw CaptureFailure("no capture command configured");
    }
    const auto stamp = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto output_path = std::filesystem::temp_directory_path() / ("codeact_capture_" + stamp + options_.extension);
    const auto stderr_path = std::filesystem::temp_directory_path() / ("codeact_capture_" + stamp + ".err");
    TempFiles cleanup{{output_path, stderr_path}};

    std::vector<std::string> args;
    for (const auto& part : options_.command) {
        args.push_back(Substitute(Substitute(part, "{display}", options_.display), "{output}", output_path.string()));
    }
    const std::string program = args.front();
    args.erase(args.begin());
    debug.push_back("running " + program + " on display " + options_.display);

    std::string executable = program;
    if (program.find('/') == std::string::npos) {
        executable = bp::search_path(program).string();
    }
    if (executable.empty()) {
        throw CaptureFailure("capture command not found: " + program);
    }

    bp::environment env = boost::this_process::environment();
    env["DISPLAY"] = options_.display;

    int status = 0;
    try {
        bp::child child_process(bp::exe = executable, bp::args = args, env, bp::std_out > bp::null,
                                bp::std_err > stderr_path.string());
        const pid_t pid = child_process.id();
        // The child is reaped here, so the handle must not wait on it again.
        child_process.detach();
        if (!WaitUntil(pid, status, std::chrono::steady_clock::now() + options_.timeout,
                       std::chrono::milliseconds(50))) {
            ::kill(pid, SIGTERM);
            if (!WaitUntil(pid, status, std::chrono::steady_clock::now() + std::chrono::seconds(2),
                           std::chrono::milliseconds(100))) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
            throw CaptureFailure("capture command timed out after " + std::to_string(options_.timeout.count()) + "s");
        }
    } catch (const bp::process_error& ex) {
        throw CaptureFailure(std::string("capture command failed to start: ") + ex.what());
    }

    const std::string errors = ReadFile(stderr_path);
    if (!errors.empty()) {
        debug.push_back("stderr: " + errors);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        throw CaptureFailure("capture command exited with status " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        throw CaptureFailure("capture command killed by signal " + std::to_string(WTERMSIG(status)));
    }
    std::string data = ReadFile(output_path);
    if (data.empty()) {
        throw CaptureFailure("capture command produced no image");
    }
    return data;
}

}  // namespace codeact::capture
