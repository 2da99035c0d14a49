#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codeact::render {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const Color& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Named color (white, black, red, green, blue, yellow, cyan, magenta, gray,
// orange) or "#rrggbb". Empty when the text is neither.
std::optional<Color> ParseColor(const std::string& text);

class Image {
public:
    Image() = default;
    Image(int width, int height, Color fill);

    int width() const { return width_; }
    int height() const { return height_; }
    Color At(int x, int y) const;
    // Out-of-bounds pixels are ignored.
    void Set(int x, int y, Color color);
    void FillRect(int x0, int y0, int x1, int y1, Color color);
    void DrawLine(int x0, int y0, int x1, int y1, Color color);
    // Copies `source` with its top-left corner at (x, y), clipped.
    void Blit(const Image& source, int x, int y);
    bool Contains(Color color) const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Color> pixels_;
};

// Binary PPM (P6).
std::string EncodePpm(const Image& image);

// Display the toolkits draw on. Windows are composited over the root
// background in the order they were opened.
class Surface {
public:
    virtual ~Surface() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual int OpenWindow(int x, int y, const Image& content) = 0;
    // Replaces what an open window shows. Unknown ids are ignored.
    virtual void Present(int window, const Image& content) = 0;
    virtual void CloseWindow(int window) = 0;
    virtual std::size_t window_count() const = 0;
    virtual Image Snapshot() const = 0;
};

// In-process surface, used for headless sessions and tests.
class MemorySurface : public Surface {
public:
    MemorySurface(int width, int height, Color background = Color{});

    int width() const override { return root_.width(); }
    int height() const override { return root_.height(); }
    int OpenWindow(int x, int y, const Image& content) override;
    void Present(int window, const Image& content) override;
    void CloseWindow(int window) override;
    std::size_t window_count() const override { return windows_.size(); }
    Image Snapshot() const override;

private:
    struct Window {
        int x = 0;
        int y = 0;
        Image content;
    };

    Image root_;
    int next_id_ = 1;
    std::map<int, Window> windows_;
};

}  // namespace codeact::render
