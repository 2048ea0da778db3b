#pragma once

#include "executor.hh"
#include "progress.display.hh"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace pzarr {
class WorkManager;

/**
 * @brief Results of a WorkManager's units, in completion order.
 * @details Lazy and single-pass. Cancelled units are skipped.
 */
class CompletedResults
{
  public:
    /**
     * @brief Get the result of the next unit to complete.
     * @return The result, or nullopt once no units are outstanding.
     * @throw The unit's exception if it failed. The remaining units are
     * cancelled first.
     */
    std::optional<nlohmann::json> next();

  private:
    explicit CompletedResults(WorkManager& manager);

    WorkManager& manager_;
    std::vector<WorkHandlePtr> ready_;

    friend class WorkManager;
};

/**
 * @brief Runs units of work in worker processes, or synchronously, and
 * shows the progress they report through ProgressState.
 * @details Construction resets ProgressState and starts a thread that
 * samples it into a ProgressDisplay. close() waits for every outstanding
 * unit. Destroying a manager that was not closed cancels outstanding units
 * without waiting for them.
 */
class WorkManager final
{
  public:
    /**
     * @param worker_count Number of worker processes. Zero or less runs each
     * unit synchronously inside submit().
     * @param progress_config How to show progress.
     */
    explicit WorkManager(int worker_count,
                         const ProgressConfig& progress_config = {});
    ~WorkManager() noexcept;

    WorkManager(const WorkManager&) = delete;
    WorkManager& operator=(const WorkManager&) = delete;

    /// @throw std::runtime_error if the manager has been closed.
    WorkHandlePtr submit(Task&& task);

    /**
     * @brief Wait until at least one outstanding unit completes, or until
     * @p timeout elapses.
     * @return The units that completed, which are no longer outstanding.
     * Empty on timeout.
     * @throw The exception of a failed unit. All other outstanding units are
     * cancelled before it is thrown.
     */
    std::vector<WorkHandlePtr> wait_for_completed(
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    CompletedResults results_as_completed();

    [[nodiscard]] size_t n_outstanding() const noexcept
    {
        return outstanding_.size();
    }

    /**
     * @brief Wait for all outstanding units, then stop showing progress and
     * release the workers.
     * @throw The exception of the first unit to fail.
     */
    void close();

  private:
    std::unique_ptr<Executor> executor_;
    std::vector<WorkHandlePtr> outstanding_;

    ProgressConfig progress_config_;
    ProgressDisplay display_;

    std::thread poller_;
    std::mutex poller_mutex_;
    std::condition_variable poller_cv_;
    bool completed_;

    bool torn_down_;

    void cancel_outstanding_() noexcept;
    void poll_progress_();
    void update_progress_();
    void teardown_() noexcept;
};
} // namespace pzarr
