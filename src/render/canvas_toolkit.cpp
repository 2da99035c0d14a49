#include "render/canvas_toolkit.hpp"

#include <algorithm>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/native.hpp"

namespace codeact::render {

struct DrawOp {
    enum class Kind { kRectangle, kRectangleOutline, kLine };

    Kind kind = Kind::kLine;
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;
    Color color;
};

struct CanvasState : script::NativeState {
    int window = 0;
    int x = 0;
    int y = 0;
    bool destroyed = false;
    Image image;
    std::vector<DrawOp> pending;
    std::int64_t next_item = 1;
};

void CanvasToolkit::Render(CanvasState& canvas) {
    for (const auto& op : canvas.pending) {
        switch (op.kind) {
            case DrawOp::Kind::kRectangle:
                canvas.image.FillRect(op.x0, op.y0, op.x1, op.y1, op.color);
                break;
            case DrawOp::Kind::kRectangleOutline:
                canvas.image.DrawLine(op.x0, op.y0, op.x1, op.y0, op.color);
                canvas.image.DrawLine(op.x1, op.y0, op.x1, op.y1, op.color);
                canvas.image.DrawLine(op.x1, op.y1, op.x0, op.y1, op.color);
                canvas.image.DrawLine(op.x0, op.y1, op.x0, op.y0, op.color);
                break;
            case DrawOp::Kind::kLine:
                canvas.image.DrawLine(op.x0, op.y0, op.x1, op.y1, op.color);
                break;
        }
    }
    canvas.pending.clear();
    surface_.Present(canvas.window, canvas.image);
}

std::shared_ptr<CanvasState> CanvasToolkit::Open(int width, int height, Color background, int x, int y) {
    auto canvas = std::make_shared<CanvasState>();
    canvas->x = x;
    canvas->y = y;
    canvas->image = Image(width, height, background);
    canvas->window = surface_.OpenWindow(x, y, canvas->image);
    canvases_.push_back(canvas);
    return canvas;
}

void CanvasToolkit::Destroy(CanvasState& canvas) {
    if (canvas.destroyed) {
        return;
    }
    surface_.CloseWindow(canvas.window);
    canvas.destroyed = true;
    canvas.pending.clear();
    canvases_.erase(std::remove_if(canvases_.begin(), canvases_.end(),
                                   [&](const std::shared_ptr<CanvasState>& open) { return open.get() == &canvas; }),
                    canvases_.end());
}

void CanvasToolkit::Flush() {
    for (const auto& canvas : canvases_) {
        Render(*canvas);
    }
}

void CanvasToolkit::Teardown() {
    for (const auto& canvas : canvases_) {
        surface_.CloseWindow(canvas->window);
        canvas->destroyed = true;
        canvas->pending.clear();
    }
    canvases_.clear();
}

namespace {

using script::CallArgs;
using script::Runtime;
using script::Value;

Color ColorArgument(const Value* value, const std::string& fallback) {
    const std::string text = value == nullptr ? fallback : script::StrArgument(*value, "color");
    const auto color = ParseColor(text);
    if (!color) {
        script::ThrowError("ValueError", "unknown color name \"" + text + "\"");
    }
    return *color;
}

int Coordinate(const Value& value) {
    return static_cast<int>(script::NumberArgument(value, "coordinate"));
}

std::shared_ptr<CanvasState> Receiver(const CallArgs& args, const std::string& method) {
    std::shared_ptr<CanvasState> state;
    if (!args.positional.empty()) {
        if (auto instance = args.positional[0].As<script::InstanceObject>()) {
            state = std::dynamic_pointer_cast<CanvasState>(instance->native);
        }
    }
    if (!state) {
        script::ThrowError("TypeError", "Canvas." + method + "() requires a Canvas instance");
    }
    if (state->destroyed) {
        script::ThrowError("RuntimeError",
                           "can't invoke \"" + method + "\" command: application has been destroyed");
    }
    return state;
}

Value AddItem(CanvasState& canvas, DrawOp op) {
    canvas.pending.push_back(op);
    return Value(canvas.next_item++);
}

std::shared_ptr<script::ModuleObject> MakeCanvasModule(const std::shared_ptr<CanvasToolkit>& toolkit) {
    auto module = std::make_shared<script::ModuleObject>("canvas");
    auto cls = std::make_shared<script::ClassObject>("Canvas", script::Builtins::Instance().Class("object"));
    cls->builtin = true;
    std::weak_ptr<script::ClassObject> weak_cls = cls;
    cls->constructor = [toolkit, weak_cls](Runtime&, CallArgs& args) -> Value {
        script::CheckArity(args, "Canvas", 0, 2);
        script::CheckKeywords(args, "Canvas", {"width", "height", "bg", "x", "y"});
        const Value* width = script::Argument(args, 0, "width");
        const Value* height = script::Argument(args, 1, "height");
        const Value* x = args.Keyword("x");
        const Value* y = args.Keyword("y");
        const int w = width == nullptr ? 200 : static_cast<int>(script::IntArgument(*width, "width"));
        const int h = height == nullptr ? 200 : static_cast<int>(script::IntArgument(*height, "height"));
        if (w <= 0 || h <= 0) {
            script::ThrowError("ValueError", "canvas size must be positive");
        }
        const Color background = ColorArgument(args.Keyword("bg"), "white");
        auto instance = std::make_shared<script::InstanceObject>(weak_cls.lock());
        instance->native = toolkit->Open(w, h, background, x == nullptr ? 0 : Coordinate(*x),
                                         y == nullptr ? 0 : Coordinate(*y));
        return Value(instance);
    };

    cls->attrs.Set("create_rectangle", script::NativeFunction("create_rectangle", [](Runtime&, CallArgs& args) {
        auto canvas = Receiver(args, "create_rectangle");
        script::CheckArity(args, "create_rectangle", 5, 5);
        script::CheckKeywords(args, "create_rectangle", {"fill", "outline"});
        DrawOp op;
        op.x0 = Coordinate(args.positional[1]);
        op.y0 = Coordinate(args.positional[2]);
        op.x1 = Coordinate(args.positional[3]);
        op.y1 = Coordinate(args.positional[4]);
        if (const Value* fill = args.Keyword("fill")) {
            op.kind = DrawOp::Kind::kRectangle;
            op.color = ColorArgument(fill, "black");
        } else {
            op.kind = DrawOp::Kind::kRectangleOutline;
            op.color = ColorArgument(args.Keyword("outline"), "black");
        }
        return AddItem(*canvas, op);
    }));
    cls->attrs.Set("create_line", script::NativeFunction("create_line", [](Runtime&, CallArgs& args) {
        auto canvas = Receiver(args, "create_line");
        script::CheckArity(args, "create_line", 5, 5);
        script::CheckKeywords(args, "create_line", {"fill"});
        DrawOp op;
        op.kind = DrawOp::Kind::kLine;
        op.x0 = Coordinate(args.positional[1]);
        op.y0 = Coordinate(args.positional[2]);
        op.x1 = Coordinate(args.positional[3]);
        op.y1 = Coordinate(args.positional[4]);
        op.color = ColorArgument(args.Keyword("fill"), "black");
        return AddItem(*canvas, op);
    }));
    cls->attrs.Set("update", script::NativeFunction("update", [toolkit](Runtime&, CallArgs& args) {
        auto canvas = Receiver(args, "update");
        script::CheckArity(args, "update", 1, 1);
        toolkit->Render(*canvas);
        return Value();
    }));
    cls->attrs.Set("destroy", script::NativeFunction("destroy", [toolkit](Runtime&, CallArgs& args) {
        script::CheckArity(args, "destroy", 1, 1);
        std::shared_ptr<CanvasState> canvas;
        if (auto instance = args.positional[0].As<script::InstanceObject>()) {
            canvas = std::dynamic_pointer_cast<CanvasState>(instance->native);
        }
        if (canvas) {
            toolkit->Destroy(*canvas);
        }
        return Value();
    }));
    module->members.Set("Canvas", Value(cls));
    return module;
}

}  // namespace

void InstallCanvasToolkit(ToolkitHost& host, script::ModuleRegistry& registry) {
    auto toolkit = std::make_shared<CanvasToolkit>(host.surface());
    host.Attach(toolkit);
    registry.Register("canvas", [toolkit](Runtime&) { return MakeCanvasModule(toolkit); });
}

}  // namespace codeact::render
