#include "render/toolkit_host.hpp"

#include "script/errors.hpp"
#include "utils/logging.hpp"

namespace codeact::render {

void ToolkitHost::Attach(std::shared_ptr<Toolkit> toolkit) {
    for (auto& existing : toolkits_) {
        if (existing->name() == toolkit->name()) {
            existing = std::move(toolkit);
            return;
        }
    }
    toolkits_.push_back(std::move(toolkit));
}

Toolkit* ToolkitHost::Find(const std::string& name) const {
    for (const auto& toolkit : toolkits_) {
        if (toolkit->name() == name) {
            return toolkit.get();
        }
    }
    return nullptr;
}

std::vector<std::string> ToolkitHost::Names() const {
    std::vector<std::string> names;
    for (const auto& toolkit : toolkits_) {
        names.push_back(toolkit->name());
    }
    return names;
}

void ToolkitHost::Flush(const std::string& name) {
    Toolkit* toolkit = Find(name);
    if (toolkit == nullptr) {
        script::ThrowError("ValueError", "unknown toolkit '" + name + "'");
    }
    toolkit->Flush();
}

void ToolkitHost::TeardownAll() {
    for (const auto& toolkit : toolkits_) {
        toolkit->Teardown();
    }
    if (surface_.window_count() > 0) {
        utils::Log(utils::LogLevel::kWarn, "render",
                   std::to_string(surface_.window_count()) + " windows left open after teardown");
    }
}

}  // namespace codeact::render
