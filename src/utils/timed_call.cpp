#include "cdt_base.hpp"

#include <atomic>
#include <exception>
#include <thread>

namespace conduit::utils
{

namespace
{
// Shared with the helper thread so a detached thread never touches the caller's stack.
struct TimedCallState
{
    std::function<void()> func;
    std::atomic<bool> completed{false};
    std::exception_ptr ex_ptr{nullptr};
};
} // namespace

TimedCallOutcome run_with_timeout(std::function<void()> func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    auto state = std::make_shared<TimedCallState>();
    state->func = std::move(func);
    std::thread thread(
        [state]()
        {
            try
            {
                state->func();
            }
            catch (...)
            {
                state->ex_ptr = std::current_exception();
            }
            state->completed.store(true, std::memory_order_release);
        });

    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (bounded && std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }

    thread.join();

    if (state->ex_ptr)
    {
        try
        {
            std::rethrow_exception(state->ex_ptr);
        }
        catch (const std::exception &e)
        {
            return {false, false, e.what()};
        }
        catch (...)
        {
            return {false, false, "unknown exception"};
        }
    }
    return {true, false, {}};
}

} // namespace conduit::utils
