#pragma once
#include <atomic>
#include <memory>

namespace scout {

// Copyable handle over a shared flag. Any copy may cancel; every copy observes it.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace scout
