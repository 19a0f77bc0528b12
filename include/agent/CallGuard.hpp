#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include "agent/CancellationToken.hpp"
#include "agent/Errors.hpp"

namespace scout {

/**
 * Runs `fn` on a worker thread and waits up to `timeout` for it.
 * Throws CallTimeout when the deadline passes; `abandoned` is cancelled, the
 * worker is detached and its result discarded, so `fn` must own everything it
 * touches and should poll `abandoned` to stop early.
 * Exceptions thrown by `fn` are rethrown here. A zero timeout calls inline.
 */
template <typename Fn>
auto call_with_timeout(Fn fn, std::chrono::milliseconds timeout, const std::string& what,
                       CancellationToken abandoned = CancellationToken()) -> decltype(fn()) {
    using Result = decltype(fn());
    if (timeout.count() <= 0) return fn();

    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> result = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (result.wait_for(timeout) == std::future_status::timeout) {
        abandoned.cancel();
        throw CallTimeout(what + " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    return result.get();
}

} // namespace scout
