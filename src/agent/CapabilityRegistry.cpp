#include "agent/CapabilityRegistry.hpp"
#include "TextUtils.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scout {

namespace {

// Same normalization the plan validator applies to planner output.
std::string normalize(const std::string& intent) {
    return to_lower(trim(intent));
}

} // namespace

CapabilityRegistry::CapabilityRegistry(std::string default_intent)
    : default_intent_(normalize(default_intent)) {
    if (default_intent_.empty()) {
        throw std::invalid_argument("CapabilityRegistry: default intent must not be empty");
    }
}

void CapabilityRegistry::register_handler(const std::string& name,
                                          std::shared_ptr<ICapabilityHandler> handler,
                                          std::string description) {
    std::string intent = normalize(name);
    if (intent.empty()) {
        throw std::invalid_argument("CapabilityRegistry: intent name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("CapabilityRegistry: null handler for intent '" + intent + "'");
    }
    if (entries_.count(intent)) {
        throw std::invalid_argument("CapabilityRegistry: intent '" + intent + "' registered twice");
    }
    spdlog::info("🛰️ Capability Integrated: {}", intent);
    entries_.emplace(intent, Entry{std::move(handler), std::move(description)});
}

std::shared_ptr<ICapabilityHandler> CapabilityRegistry::resolve(const std::string& intent) const {
    auto it = entries_.find(normalize(intent));
    if (it == entries_.end()) throw IntentNotFound(intent);
    return it->second.handler;
}

bool CapabilityRegistry::has(const std::string& intent) const {
    return entries_.count(normalize(intent)) > 0;
}

std::vector<std::string> CapabilityRegistry::intents() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) names.push_back(name);
    return names;
}

std::string CapabilityRegistry::describe() const {
    std::string out;
    for (const auto& [name, entry] : entries_) {
        out += "- " + name + ": " + (entry.description.empty() ? "(no description)" : entry.description) + "\n";
    }
    return out;
}

} // namespace scout
