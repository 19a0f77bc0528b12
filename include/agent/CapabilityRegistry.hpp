#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "agent/CapabilityHandler.hpp"
#include "agent/Errors.hpp"

namespace scout {

/**
 * Intent name -> handler. Built once at startup, then shared read-only
 * (shared_ptr<const CapabilityRegistry>) by every orchestrator.
 * Names are trimmed and lowercased on registration and lookup.
 */
class CapabilityRegistry {
public:
    explicit CapabilityRegistry(std::string default_intent);

    void register_handler(const std::string& intent,
                          std::shared_ptr<ICapabilityHandler> handler,
                          std::string description = "");

    // Throws IntentNotFound for unregistered names.
    std::shared_ptr<ICapabilityHandler> resolve(const std::string& intent) const;
    bool has(const std::string& intent) const;

    const std::string& default_intent() const { return default_intent_; }
    std::vector<std::string> intents() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // "- <intent>: <description>" per entry, sorted by intent.
    std::string describe() const;

private:
    struct Entry {
        std::shared_ptr<ICapabilityHandler> handler;
        std::string description;
    };

    std::string default_intent_;
    std::map<std::string, Entry> entries_;
};

} // namespace scout
