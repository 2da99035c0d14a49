#pragma once

#include <optional>
#include <string>

namespace codeact::capture {

// Holds the last captured artifact of a session.
class ArtifactSlot {
public:
    void Store(std::string data) { data_ = std::move(data); }
    const std::optional<std::string>& Get() const { return data_; }
    // Safe to call when empty.
    void Clear() { data_.reset(); }
    bool has_value() const { return data_.has_value(); }

private:
    std::optional<std::string> data_;
};

}  // namespace codeact::capture
