#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "policy/capability_policy.hpp"
#include "script/value.hpp"

namespace codeact::script {

using ModuleFactory = std::function<std::shared_ptr<ModuleObject>(Runtime&)>;

// The single import resolver shared by both execution strategies. Every
// import is authorized against the capability policy before a module is
// built; built modules are cached until ClearCache().
class ModuleRegistry {
public:
    explicit ModuleRegistry(policy::CapabilityPolicy policy);

    void Register(const std::string& name, ModuleFactory factory);
    bool Has(const std::string& name) const;
    std::vector<std::string> Names() const;

    Value Import(Runtime& rt, const std::string& name);
    void ClearCache();

    const policy::CapabilityPolicy& policy() const { return policy_; }

private:
    policy::CapabilityPolicy policy_;
    std::map<std::string, ModuleFactory> factories_;
    std::map<std::string, std::shared_ptr<ModuleObject>> cache_;
};

// math, time, random, json, dataclasses and typing.
void RegisterStandardModules(ModuleRegistry& registry);

}  // namespace codeact::script
