#pragma once

#include <memory>
#include <string>
#include <vector>

#include "render/surface.hpp"

namespace codeact::render {

// A windowing toolkit guest code can import. Its windows live on the
// session surface only while the execution that opened them runs.
class Toolkit {
public:
    virtual ~Toolkit() = default;

    virtual std::string name() const = 0;
    // Pushes buffered drawing to the surface. Raises guest errors for
    // drawing that cannot be rendered.
    virtual void Flush() = 0;
    // Closes every window the toolkit opened.
    virtual void Teardown() = 0;
};

// Per-session registry of toolkits and the surface they draw on. Passed
// explicitly into the toolkit modules.
class ToolkitHost {
public:
    explicit ToolkitHost(Surface& surface) : surface_(surface) {}

    ToolkitHost(const ToolkitHost&) = delete;
    ToolkitHost& operator=(const ToolkitHost&) = delete;

    Surface& surface() { return surface_; }

    void Attach(std::shared_ptr<Toolkit> toolkit);
    Toolkit* Find(const std::string& name) const;
    std::vector<std::string> Names() const;
    // Raises a guest ValueError for unknown names.
    void Flush(const std::string& name);
    void TeardownAll();

    // Tears down every toolkit window when the execution ends.
    class ExecutionScope {
    public:
        explicit ExecutionScope(ToolkitHost& host) : host_(host) {}
        ~ExecutionScope() { host_.TeardownAll(); }

        ExecutionScope(const ExecutionScope&) = delete;
        ExecutionScope& operator=(const ExecutionScope&) = delete;

    private:
        ToolkitHost& host_;
    };

private:
    Surface& surface_;
    std::vector<std::shared_ptr<Toolkit>> toolkits_;
};

}  // namespace codeact::render
