#pragma once
/**
 * @file timed_call.hpp
 * @brief Run a callback on a helper thread and give up waiting after a timeout.
 *
 * Used for shutdown-style callbacks (service shutdown, component detach) that must not
 * be allowed to hang the caller. A callback that exceeds its timeout keeps running on a
 * detached thread; the caller is told so and must treat whatever the callback touches
 * as still in use.
 */
#include <chrono>
#include <functional>
#include <string>

namespace conduit::utils
{

/// Result of run_with_timeout().
struct TimedCallOutcome
{
    bool success;              ///< Callback returned normally within the timeout.
    bool timed_out;            ///< Callback was still running at the deadline (thread detached).
    std::string exception_msg; ///< what() of the exception the callback threw, if any.
};

/**
 * @brief Invokes @p func on a helper thread and waits at most @p timeout for it.
 * @details Completion is polled every 10 ms. An empty @p func counts as success.
 *          A zero or negative @p timeout waits for completion.
 */
CONDUIT_RUNTIME_EXPORT TimedCallOutcome run_with_timeout(std::function<void()> func,
                                                         std::chrono::milliseconds timeout);

} // namespace conduit::utils
