#include "script/module_registry.hpp"

#include "script/errors.hpp"
#include "utils/logging.hpp"

namespace codeact::script {

ModuleRegistry::ModuleRegistry(policy::CapabilityPolicy policy) : policy_(std::move(policy)) {}

void ModuleRegistry::Register(const std::string& name, ModuleFactory factory) {
    factories_[name] = std::move(factory);
    cache_.erase(name);
}

bool ModuleRegistry::Has(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> ModuleRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& entry : factories_) {
        names.push_back(entry.first);
    }
    return names;
}

Value ModuleRegistry::Import(Runtime& rt, const std::string& name) {
    policy_.Require(name);
    const auto cached = cache_.find(name);
    if (cached != cache_.end()) {
        return Value(cached->second);
    }
    const auto factory = factories_.find(name);
    if (factory == factories_.end()) {
        utils::Log(utils::LogLevel::kDebug, "sandbox", "authorized module without implementation: " + name);
        ThrowError("ModuleNotFoundError", "No module named '" + name + "'");
    }
    auto module = factory->second(rt);
    cache_[name] = module;
    return Value(module);
}

void ModuleRegistry::ClearCache() {
    cache_.clear();
}

}  // namespace codeact::script
