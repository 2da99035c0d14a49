#include "policy/provisioning.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeact::policy {
namespace {

// Names shipped with the runtime itself; never provisioned.
const std::set<std::string>& BundledModules() {
    static const std::set<std::string> modules = {
        "dataclasses", "dataclass",
        "typing", "types",
        "collections", "functools", "itertools", "operator", "copy", "json", "csv",
        "os", "sys", "pathlib", "io", "time", "datetime",
        "math", "cmath", "decimal", "fractions", "random", "statistics",
        "string", "re", "textwrap",
        "heapq", "bisect", "enum",
        "base64", "abc", "contextlib", "logging", "traceback",
        "canvas", "plot"
    };
    return modules;
}

const std::map<std::string, std::string>& TypoCorrections() {
    static const std::map<std::string, std::string> corrections = {
        {"dataclass", "dataclasses"}
    };
    return corrections;
}

void AppendUnique(std::vector<std::string>& items, const std::string& value) {
    if (std::find(items.begin(), items.end(), value) == items.end()) {
        items.push_back(value);
    }
}

}  // namespace

std::vector<std::string> ParseImportList(const std::string& value) {
    std::vector<std::string> names;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            names.push_back(item);
        }
    }
    return names;
}

ProvisioningPlan ResolveImports(const std::vector<std::string>& requested) {
    ProvisioningPlan plan;
    for (const auto& raw : requested) {
        const auto name = utils::Trim(raw);
        if (name.empty()) {
            continue;
        }
        const auto top = TopLevelName(name);
        if (BundledModules().count(top) > 0) {
            const auto typo = TypoCorrections().find(top);
            if (typo != TypoCorrections().end()) {
                plan.corrections[name] = typo->second;
                AppendUnique(plan.authorized, typo->second);
                utils::Log(utils::LogLevel::kDebug, "policy", "corrected '" + name + "' to '" + typo->second + "'");
                continue;
            }
            AppendUnique(plan.authorized, name);
            continue;
        }
        AppendUnique(plan.install, top);
        AppendUnique(plan.authorized, name);
    }
    if (!plan.install.empty()) {
        utils::Log(utils::LogLevel::kInfo, "policy", "packages to provision: " + utils::Join(plan.install, ", "));
    }
    return plan;
}

CapabilityPolicy BuildPolicy(const ProvisioningPlan& plan) {
    return CapabilityPolicy::WithDefaults(plan.authorized);
}

}  // namespace codeact::policy
