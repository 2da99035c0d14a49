#include "policy/capability_policy.hpp"

#include "script/errors.hpp"

namespace codeact::policy {

const char* ToString(Capability capability) {
    switch (capability) {
        case Capability::kAuthorized: return "Authorized";
        case Capability::kStdlibOnly: return "StdlibOnly";
        case Capability::kDenied: return "Denied";
    }
    return "Unknown";
}

const std::set<std::string>& DefaultStandardModules() {
    static const std::set<std::string> modules = {
        "dataclasses",
        "json",
        "math",
        "random",
        "time",
        "typing"
    };
    return modules;
}

std::string TopLevelName(const std::string& name) {
    return name.substr(0, name.find('.'));
}

CapabilityPolicy::CapabilityPolicy(std::set<std::string> standard, std::set<std::string> extended)
    : standard_(std::move(standard)) {
    for (const auto& name : extended) {
        const auto top = TopLevelName(name);
        if (!top.empty() && standard_.count(top) == 0) {
            extended_.insert(top);
        }
    }
}

CapabilityPolicy CapabilityPolicy::WithDefaults(const std::vector<std::string>& extended) {
    return CapabilityPolicy(DefaultStandardModules(), std::set<std::string>(extended.begin(), extended.end()));
}

Capability CapabilityPolicy::Authorize(const std::string& name) const {
    const auto top = TopLevelName(name);
    if (standard_.count(top) > 0) {
        return Capability::kStdlibOnly;
    }
    if (extended_.count(top) > 0) {
        return Capability::kAuthorized;
    }
    return Capability::kDenied;
}

void CapabilityPolicy::Require(const std::string& name) const {
    if (Authorize(name) != Capability::kDenied) {
        return;
    }
    std::string allowed = "[";
    bool first = true;
    for (const auto& module : AllowedModules()) {
        if (!first) {
            allowed += ", ";
        }
        first = false;
        allowed += "'" + module + "'";
    }
    allowed += "]";
    throw script::CapabilityError(name, "Import of '" + name + "' is not allowed. Allowed modules: " + allowed);
}

std::vector<std::string> CapabilityPolicy::AllowedModules() const {
    std::set<std::string> all = standard_;
    all.insert(extended_.begin(), extended_.end());
    return std::vector<std::string>(all.begin(), all.end());
}

}  // namespace codeact::policy
