#pragma once

/// @file timeout.hpp
/// @brief Run a blocking call on a worker thread and stop waiting after a deadline.

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace starlight::core
{
    /// @brief Invoke @p fn on a detached worker thread, waiting at most @p timeout.
    ///
    /// On expiry the call is abandoned: the worker keeps running to completion
    /// in the background and its result is discarded. Everything @p fn captures
    /// must therefore be owned by the closure (copies or shared_ptr), never
    /// references into the caller's frame.
    ///
    /// @return The result of @p fn, or std::nullopt if the deadline passed first.
    ///         An exception thrown by @p fn is rethrown in the caller.
    template <typename Fn>
    [[nodiscard]] std::optional<std::invoke_result_t<Fn>>
        call_with_timeout(Fn fn, std::chrono::milliseconds timeout)
    {
        using Result = std::invoke_result_t<Fn>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> future = task->get_future();

        std::thread([task]() { (*task)(); }).detach();

        if (future.wait_for(timeout) != std::future_status::ready)
        {
            return std::nullopt;
        }

        return future.get();
    }

} // namespace starlight::core
