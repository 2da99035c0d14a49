#pragma once

#include <memory>
#include <string>
#include <vector>

#include "render/toolkit_host.hpp"
#include "script/module_registry.hpp"

namespace codeact::render {

struct CanvasState;

// The `canvas` module: Canvas windows whose drawing is buffered until
// update() or a toolkit flush.
class CanvasToolkit : public Toolkit {
public:
    explicit CanvasToolkit(Surface& surface) : surface_(surface) {}

    std::string name() const override { return "canvas"; }
    void Flush() override;
    void Teardown() override;

    std::shared_ptr<CanvasState> Open(int width, int height, Color background, int x, int y);
    void Render(CanvasState& canvas);
    void Destroy(CanvasState& canvas);
    std::size_t open_canvases() const { return canvases_.size(); }

private:
    Surface& surface_;
    std::vector<std::shared_ptr<CanvasState>> canvases_;
};

// Attaches a canvas toolkit to `host` and registers its module.
void InstallCanvasToolkit(ToolkitHost& host, script::ModuleRegistry& registry);

}  // namespace codeact::render
