#pragma once

#include <set>
#include <string>
#include <vector>

namespace codeact::policy {

enum class Capability {
    kAuthorized,
    kStdlibOnly,
    kDenied
};

const char* ToString(Capability capability);

// Whitelist of importable top-level names. Immutable once built.
class CapabilityPolicy {
public:
    CapabilityPolicy(std::set<std::string> standard, std::set<std::string> extended);

    // Policy with the default standard modules and the given extended names.
    static CapabilityPolicy WithDefaults(const std::vector<std::string>& extended);

    // Only the component before the first '.' is consulted.
    Capability Authorize(const std::string& name) const;
    // Throws script::CapabilityError for denied names.
    void Require(const std::string& name) const;

    // Sorted union of standard and extended names.
    std::vector<std::string> AllowedModules() const;
    const std::set<std::string>& standard() const { return standard_; }
    const std::set<std::string>& extended() const { return extended_; }

private:
    std::set<std::string> standard_;
    std::set<std::string> extended_;
};

const std::set<std::string>& DefaultStandardModules();
std::string TopLevelName(const std::string& name);

}  // namespace codeact::policy
