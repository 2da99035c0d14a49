#include "render/plot_toolkit.hpp"

#include "script/errors.hpp"
#include "script/native.hpp"

namespace codeact::render {

struct Figure {
    struct Rect {
        double x = 0;
        double y = 0;
        double w = 0;
        double h = 0;
        std::string color;
    };

    int width = 400;
    int height = 300;
    std::string facecolor = "white";
    std::vector<Rect> rects;
    // Zero until first drawn.
    int window = 0;
};

namespace {

Color ResolveColor(const std::string& text) {
    const auto color = ParseColor(text);
    if (!color) {
        script::ThrowError("ValueError", "'" + text + "' is not a valid color value");
    }
    return *color;
}

}  // namespace

Figure& PlotToolkit::Current() {
    if (figures_.empty()) {
        figures_.push_back(std::make_shared<Figure>());
    }
    return *figures_.back();
}

void PlotToolkit::NewFigure(int width, int height, std::string facecolor) {
    if (width <= 0 || height <= 0) {
        script::ThrowError("ValueError", "figure size must be positive");
    }
    auto figure = std::make_shared<Figure>();
    figure->width = width;
    figure->height = height;
    figure->facecolor = std::move(facecolor);
    figures_.push_back(std::move(figure));
}

void PlotToolkit::AddRect(double x, double y, double w, double h, std::string color) {
    Current().rects.push_back(Figure::Rect{x, y, w, h, std::move(color)});
}

void PlotToolkit::DrawFigure(Figure& figure) {
    // Resolve every color before touching the surface.
    const Color face = ResolveColor(figure.facecolor);
    std::vector<Color> colors;
    colors.reserve(figure.rects.size());
    for (const auto& rect : figure.rects) {
        colors.push_back(ResolveColor(rect.color));
    }
    Image image(figure.width, figure.height, face);
    for (std::size_t i = 0; i < figure.rects.size(); ++i) {
        const auto& rect = figure.rects[i];
        image.FillRect(static_cast<int>(rect.x), static_cast<int>(rect.y), static_cast<int>(rect.x + rect.w),
                       static_cast<int>(rect.y + rect.h), colors[i]);
    }
    if (figure.window == 0) {
        figure.window = surface_.OpenWindow(0, 0, image);
    } else {
        surface_.Present(figure.window, image);
    }
}

void PlotToolkit::Draw() {
    DrawFigure(Current());
}

void PlotToolkit::Close() {
    if (figures_.empty()) {
        return;
    }
    if (figures_.back()->window != 0) {
        surface_.CloseWindow(figures_.back()->window);
    }
    figures_.pop_back();
}

void PlotToolkit::Flush() {
    for (const auto& figure : figures_) {
        DrawFigure(*figure);
    }
}

void PlotToolkit::Teardown() {
    for (const auto& figure : figures_) {
        if (figure->window != 0) {
            surface_.CloseWindow(figure->window);
        }
    }
    figures_.clear();
}

void InstallPlotToolkit(ToolkitHost& host, script::ModuleRegistry& registry) {
    auto toolkit = std::make_shared<PlotToolkit>(host.surface());
    host.Attach(toolkit);
    registry.Register("plot", [toolkit](script::Runtime&) {
        using script::CallArgs;
        using script::Value;
        auto module = std::make_shared<script::ModuleObject>("plot");
        module->members.Set("figure", script::NativeFunction("figure", [toolkit](script::Runtime&, CallArgs& args) {
            script::CheckArity(args, "figure", 0, 0);
            script::CheckKeywords(args, "figure", {"width", "height", "facecolor"});
            const Value* width = args.Keyword("width");
            const Value* height = args.Keyword("height");
            const Value* facecolor = args.Keyword("facecolor");
            toolkit->NewFigure(width == nullptr ? 400 : static_cast<int>(script::IntArgument(*width, "width")),
                               height == nullptr ? 300 : static_cast<int>(script::IntArgument(*height, "height")),
                               facecolor == nullptr ? "white" : script::StrArgument(*facecolor, "facecolor"));
            return Value();
        }));
        module->members.Set("rect", script::NativeFunction("rect", [toolkit](script::Runtime&, CallArgs& args) {
            script::CheckArity(args, "rect", 4, 4);
            script::CheckKeywords(args, "rect", {"color"});
            const Value* color = args.Keyword("color");
            toolkit->AddRect(script::NumberArgument(args.positional[0], "x"),
                             script::NumberArgument(args.positional[1], "y"),
                             script::NumberArgument(args.positional[2], "width"),
                             script::NumberArgument(args.positional[3], "height"),
                             color == nullptr ? "blue" : script::StrArgument(*color, "color"));
            return Value();
        }));
        module->members.Set("draw", script::NativeFunction("draw", [toolkit](script::Runtime&, CallArgs& args) {
            script::CheckArity(args, "draw", 0, 0);
            toolkit->Draw();
            return Value();
        }));
        module->members.Set("close", script::NativeFunction("close", [toolkit](script::Runtime&, CallArgs& args) {
            script::CheckArity(args, "close", 0, 0);
            toolkit->Close();
            return Value();
        }));
        return module;
    });
}

}  // namespace codeact::render
