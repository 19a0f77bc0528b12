#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace scout {

class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string primary_model;

public:
    KeyManager(const std::vector<std::string>& keys, std::string model)
        : primary_model(std::move(model)) {
        for (const auto& k : keys) {
            if (!k.empty()) key_pool.push_back({k, true, 0});
        }
        if (key_pool.empty()) {
            spdlog::warn("⚠️ Key pool is empty; LLM-backed planning and answering will fail.");
        } else {
            spdlog::info("🛰️ Key Vault Synchronized: {} key(s), model {}", key_pool.size(), primary_model);
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Skips decommissioned keys.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        auto idx = active_index();
        return idx == key_pool.size() ? "" : key_pool[idx].key;
    }

    std::string get_current_model() const {
        return primary_model;
    }

    // Charges the key get_current_key() hands out, then moves past it.
    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        auto idx = active_index();
        if (idx == key_pool.size()) return;

        auto& current = key_pool[idx];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} Decommissioned", idx);
        }
        current_index = (idx + 1) % key_pool.size();
    }

private:
    // First active key at or after current_index; key_pool.size() when none.
    size_t active_index() const {
        for (size_t i = 0; i < key_pool.size(); ++i) {
            size_t idx = (current_index + i) % key_pool.size();
            if (key_pool[idx].is_active) return idx;
        }
        return key_pool.size();
    }
};

} // namespace scout
