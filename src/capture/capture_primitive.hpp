#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "render/surface.hpp"

namespace codeact::capture {

// The capture pipeline failed. Reported by the capture helper; never a
// fault of the execution.
class CaptureFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CaptureOutcome {
    bool success = false;
    std::string data;
    std::string error;
    std::vector<std::string> debug;
};

// Produces an image of what the session currently shows.
class CapturePrimitive {
public:
    virtual ~CapturePrimitive() = default;

    virtual std::string name() const = 0;
    virtual CaptureOutcome Capture() = 0;
};

// Snapshot of the in-process rendering surface, encoded as binary PPM.
class SurfaceCapture : public CapturePrimitive {
public:
    explicit SurfaceCapture(const render::Surface& surface) : surface_(surface) {}

    std::string name() const override { return "surface"; }
    CaptureOutcome Capture() override;

private:
    const render::Surface& surface_;
};

struct CommandCaptureOptions {
    // "{display}" and "{output}" are substituted.
    std::vector<std::string> command = {"import", "-window", "root", "-display", "{display}", "{output}"};
    std::string display = ":99";
    std::chrono::seconds timeout{10};
    std::string extension = ".png";
};

// Runs an external screenshot command and reads the file it wrote.
class CommandCapture : public CapturePrimitive {
public:
    explicit CommandCapture(CommandCaptureOptions options) : options_(std::move(options)) {}

    std::string name() const override { return "command"; }
    CaptureOutcome Capture() override;

    const CommandCaptureOptions& options() const { return options_; }

private:
    // Image bytes; throws CaptureFailure.
    std::string Run(std::vector<std::string>& debug) const;

    CommandCaptureOptions options_;
};

}  // namespace codeact::capture
