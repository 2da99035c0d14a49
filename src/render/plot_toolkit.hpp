#pragma once

#include <memory>
#include <string>
#include <vector>

#include "render/toolkit_host.hpp"
#include "script/module_registry.hpp"

namespace codeact::render {

struct Figure;

// The `plot` module: a current figure collecting rectangles, rendered by
// draw() or a toolkit flush. Colors are only checked when drawing.
class PlotToolkit : public Toolkit {
public:
    explicit PlotToolkit(Surface& surface) : surface_(surface) {}

    std::string name() const override { return "plot"; }
    void Flush() override;
    void Teardown() override;

    void NewFigure(int width, int height, std::string facecolor);
    void AddRect(double x, double y, double w, double h, std::string color);
    void Draw();
    void Close();
    std::size_t figure_count() const { return figures_.size(); }

private:
    Figure& Current();
    void DrawFigure(Figure& figure);

    Surface& surface_;
    std::vector<std::shared_ptr<Figure>> figures_;
};

// Attaches a plot toolkit to `host` and registers its module.
void InstallPlotToolkit(ToolkitHost& host, script::ModuleRegistry& registry);

}  // namespace codeact::render
