#include "render/surface.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_map>
#include <utility>

namespace codeact::render {

std::optional<Color> ParseColor(const std::string& text) {
    static const std::unordered_map<std::string, Color> kNamed = {
        {"white", {255, 255, 255}},
        {"black", {0, 0, 0}},
        {"red", {255, 0, 0}},
        {"green", {0, 128, 0}},
        {"blue", {0, 0, 255}},
        {"yellow", {255, 255, 0}},
        {"cyan", {0, 255, 255}},
        {"magenta", {255, 0, 255}},
        {"gray", {128, 128, 128}},
        {"orange", {255, 165, 0}}
    };
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    auto it = kNamed.find(lowered);
    if (it != kNamed.end()) {
        return it->second;
    }
    if (lowered.size() != 7 || lowered[0] != '#') {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < lowered.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(lowered[i]))) {
            return std::nullopt;
        }
    }
    const auto channel = [&](std::size_t offset) {
        return static_cast<std::uint8_t>(std::strtoul(lowered.substr(offset, 2).c_str(), nullptr, 16));
    };
    return Color{channel(1), channel(3), channel(5)};
}

Image::Image(int width, int height, Color fill)
    : width_(std::max(width, 0)), height_(std::max(height, 0)),
      pixels_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), fill) {}

Color Image::At(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return Color{};
    }
    return pixels_[static_cast<std::size_t>(y) * width_ + x];
}

void Image::Set(int x, int y, Color color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return;
    }
    pixels_[static_cast<std::size_t>(y) * width_ + x] = color;
}

void Image::FillRect(int x0, int y0, int x1, int y1, Color color) {
    if (x0 > x1) {
        std::swap(x0, x1);
    }
    if (y0 > y1) {
        std::swap(y0, y1);
    }
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, width_);
    y1 = std::min(y1, height_);
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            pixels_[static_cast<std::size_t>(y) * width_ + x] = color;
        }
    }
}

void Image::DrawLine(int x0, int y0, int x1, int y1, Color color) {
    const int dx = std::abs(x1 - x0);
    const int dy = -std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int error = dx + dy;
    while (true) {
        Set(x0, y0, color);
        if (x0 == x1 && y0 == y1) {
            break;
        }
        const int doubled = 2 * error;
        if (doubled >= dy) {
            error += dy;
            x0 += sx;
        }
        if (doubled <= dx) {
            error += dx;
            y0 += sy;
        }
    }
}

void Image::Blit(const Image& source, int x, int y) {
    for (int row = 0; row < source.height(); ++row) {
        for (int col = 0; col < source.width(); ++col) {
            Set(x + col, y + row, source.At(col, row));
        }
    }
}

bool Image::Contains(Color color) const {
    return std::find(pixels_.begin(), pixels_.end(), color) != pixels_.end();
}

std::string EncodePpm(const Image& image) {
    std::string out = "P6\n" + std::to_string(image.width()) + " " + std::to_string(image.height()) + "\n255\n";
    out.reserve(out.size() + static_cast<std::size_t>(image.width()) * image.height() * 3);
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            const Color color = image.At(x, y);
            out.push_back(static_cast<char>(color.r));
            out.push_back(static_cast<char>(color.g));
            out.push_back(static_cast<char>(color.b));
        }
    }
    return out;
}

MemorySurface::MemorySurface(int width, int height, Color background) : root_(width, height, background) {}

int MemorySurface::OpenWindow(int x, int y, const Image& content) {
    const int id = next_id_++;
    windows_[id] = Window{x, y, content};
    return id;
}

void MemorySurface::Present(int window, const Image& content) {
    auto it = windows_.find(window);
    if (it != windows_.end()) {
        it->second.content = content;
    }
}

void MemorySurface::CloseWindow(int window) {
    windows_.erase(window);
}

Image MemorySurface::Snapshot() const {
    Image frame = root_;
    for (const auto& entry : windows_) {
        frame.Blit(entry.second.content, entry.second.x, entry.second.y);
    }
    return frame;
}

}  // namespace codeact::render
