#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <functional>

namespace pzarr {
/// @brief A unit of work. Results must be JSON, since units run by a
/// process pool send them back to the controller over a pipe.
using Task = std::function<nlohmann::json()>;

/**
 * @brief The state and outcome of one submitted unit of work.
 * @details A handle moves from Pending to Running to Finished, or from
 * Pending to Cancelled. A Finished handle holds either a result or the
 * exception the unit raised.
 * @note Handles are owned and updated by the controller thread only.
 */
class WorkHandle
{
  public:
    enum class State
    {
        Pending,
        Running,
        Finished,
        Cancelled,
    };

    WorkHandle();

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] State state() const noexcept { return state_; }

    /// @brief True if the unit finished, successfully or not, or was
    /// cancelled.
    [[nodiscard]] bool done() const noexcept;
    [[nodiscard]] bool cancelled() const noexcept;
    [[nodiscard]] bool failed() const noexcept;

    /**
     * @brief Prevent the unit from starting.
     * @return True if the unit is now cancelled, false if it had already
     * started, in which case it runs to completion.
     */
    bool cancel() noexcept;

    /**
     * @brief Get the unit's result.
     * @throw The unit's exception if it failed.
     * @throw std::runtime_error if the unit was cancelled or is not done.
     */
    const nlohmann::json& result() const;

    /// @brief The unit's exception, or null if it has none.
    [[nodiscard]] std::exception_ptr error() const noexcept { return error_; }

  private:
    uint64_t id_;
    State state_;
    nlohmann::json result_;
    std::exception_ptr error_;

    void set_running_() noexcept;
    void set_result_(nlohmann::json&& result) noexcept;
    void set_error_(std::exception_ptr error) noexcept;

    friend class SynchronousExecutor;
    friend class ProcessPoolExecutor;
};
} // namespace pzarr
