#pragma once

#include "executor.hh"

#include <sys/types.h>

#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace pzarr {
/**
 * @brief Runs each unit in its own forked worker process, with at most a
 * fixed number of workers alive at once.
 * @details The unit's result, or the type and message of the exception it
 * raised, is sent back to the controller as JSON over a pipe. A worker that
 * exits without sending either, e.g., because it was killed by the OOM
 * killer, fails its unit with a WorkerDiedError.
 * Queued units are started only from the controller thread, inside submit()
 * and wait().
 */
class ProcessPoolExecutor final : public Executor
{
  public:
    explicit ProcessPoolExecutor(unsigned int n_workers);
    ~ProcessPoolExecutor() noexcept override;

    WorkHandlePtr submit(Task&& task) override;
    std::vector<WorkHandlePtr> wait(
      const std::vector<WorkHandlePtr>& handles,
      std::optional<std::chrono::milliseconds> timeout) override;
    void shutdown(bool wait) noexcept override;

  private:
    struct Job
    {
        Task task;
        WorkHandlePtr handle;
    };

    struct Worker
    {
        pid_t pid;
        int fd; // read end of the result pipe
        std::string output;
        WorkHandlePtr handle;
    };

    unsigned int max_workers_;
    std::queue<Job> jobs_;
    std::vector<Worker> workers_;
    bool is_accepting_jobs_;

    std::optional<Job> pop_from_job_queue_() noexcept;
    void start_queued_jobs_();
    void spawn_(Job&& job);

    /**
     * @brief Wait up to @p timeout for output from the running workers,
     * reaping any that have exited.
     */
    void poll_(std::optional<std::chrono::milliseconds> timeout);
    void reap_(Worker& worker);
};
} // namespace pzarr
