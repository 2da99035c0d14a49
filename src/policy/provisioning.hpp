#pragma once

#include <map>
#include <string>
#include <vector>

#include "policy/capability_policy.hpp"

namespace codeact::policy {

struct ProvisioningPlan {
    // Names to authorize, in request order. Submodule paths are kept.
    std::vector<std::string> authorized;
    // Unique top-level names a deployment has to install.
    std::vector<std::string> install;
    // Misspelled request -> corrected name.
    std::map<std::string, std::string> corrections;
};

// Splits a requested import list into names that only need authorizing and
// packages that need installing. Nothing is installed here.
ProvisioningPlan ResolveImports(const std::vector<std::string>& requested);

// Parses a comma separated list such as "canvas,plot, json".
std::vector<std::string> ParseImportList(const std::string& value);

CapabilityPolicy BuildPolicy(const ProvisioningPlan& plan);

}  // namespace codeact::policy
