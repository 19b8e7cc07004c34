#pragma once

#include "core/error.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <string_view>
#include <thread>

namespace querydesk {

/**
 * @brief Run work on a detached worker and wait at most `timeout` for it.
 *
 * On timeout the caller gets a TIMEOUT error and the worker keeps running
 * until the blocking call it is stuck in returns; anything the work touches
 * must therefore be owned by the closure (shared_ptr captures).
 */
template<typename T>
[[nodiscard]] Result<T> run_with_deadline(std::function<Result<T>()> work,
                                          std::chrono::milliseconds timeout,
                                          std::string_view what = "operation") {
    auto task = std::make_shared<std::packaged_task<Result<T>()>>(std::move(work));
    auto future = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        return Result<T>::error(ErrorCategory::TIMEOUT,
            std::format("{} timed out after {} ms", what, timeout.count()));
    }
    try {
        return future.get();
    } catch (const std::exception& e) {
        return Result<T>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("{} failed: {}", what, e.what()));
    }
}

} // namespace querydesk
