#pragma once
#include <chrono>
#include <string>
#include <memory>
#include "KeyManager.hpp"

namespace scout {

// Reasoning backend seen by the planner and the capability handlers.
class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;
    // Throws std::runtime_error when the backend is unreachable.
    virtual std::string generate_text(const std::string& prompt) = 0;
};

class LlmService : public ITextGenerator {
public:
    // `request_timeout` bounds each HTTP attempt; zero waits indefinitely.
    LlmService(std::shared_ptr<KeyManager> key_manager, std::string api_base,
               std::chrono::milliseconds request_timeout = std::chrono::milliseconds(30000));

    std::string generate_text(const std::string& prompt) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::string base_url_;
    std::chrono::milliseconds request_timeout_;
    std::string get_endpoint_url(const std::string& action) const;
};

} // namespace scout
