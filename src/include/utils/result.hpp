/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Used where a failure is part of the normal contract of an operation (dependency
 * resolution, module loading, chain execution) and must be handled at the call site:
 * - Distinguishes between success (T) and expected failures (E)
 * - No implicit conversion to bool
 * - [[nodiscard]] factories prevent ignoring errors
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace conduit::utils
{

/**
 * @class Result
 * @brief Value-or-error holder, in the spirit of C++23's std::expected<T, E>.
 *
 * @tparam T Success value type
 * @tparam E Error type: an enum, or a small struct carrying an error code and context
 *
 * Usage:
 * @code
 * auto plan = conduit::runtime::Resolve(descriptors);
 * if (plan.is_ok()) {
 *     for (const auto &id : plan.content().start_order) { ... }
 * } else {
 *     LOGGER_ERROR("resolution failed: {}", plan.error().message);
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    /**
     * @brief Create a successful Result containing a value
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data.template emplace<0>(std::move(value));
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error value
     * @param code Optional detailed error code (e.g. errno), default 0
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data.template emplace<1>(ErrorData{std::move(err), code});
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(std::in_place_index<1>, ErrorData{E{}, 0}) {}

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<0>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<1>(m_data).error_value;
    }

    /**
     * @brief Get the detailed error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<1>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_value;
        int error_code;
    };

    // Index 0: T (success), index 1: ErrorData (failure). Indexed access keeps T == E legal.
    std::variant<T, ErrorData> m_data;
};

} // namespace conduit::utils
