#pragma once
#include <string>
#include "agent/CancellationToken.hpp"

namespace scout {

// One implementation per intent. Handlers never touch orchestrator state:
// they read the context snapshot and return an answer. "No matching record"
// is an answer; only infrastructure failures may throw.
// `stop` is cancelled once the caller has given up on this call; long-running
// handlers should check it between backend round trips.
class ICapabilityHandler {
public:
    virtual ~ICapabilityHandler() = default;
    virtual std::string answer(const std::string& subquery, const std::string& context,
                               const CancellationToken& stop) = 0;
};

} // namespace scout
