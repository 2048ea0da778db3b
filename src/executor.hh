#pragma once

#include "work.handle.hh"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace pzarr {
/// @brief Raised for a unit whose worker process terminated without
/// reporting a result or an exception.
class WorkerDiedError : public std::runtime_error
{
  public:
    WorkerDiedError()
      : std::runtime_error(
          "Worker process died: you may have run out of memory")
    {
    }
};

using WorkHandlePtr = std::shared_ptr<WorkHandle>;

/**
 * @brief Somewhere to run units of work.
 */
class Executor
{
  public:
    virtual ~Executor() = default;

    /**
     * @brief Schedule @p task.
     * @return A handle to the scheduled unit.
     * @throw std::runtime_error if the executor has been shut down.
     */
    virtual WorkHandlePtr submit(Task&& task) = 0;

    /**
     * @brief Block until at least one of @p handles is done, or @p timeout
     * elapses.
     * @return The handles among @p handles that are done. Empty on timeout.
     */
    virtual std::vector<WorkHandlePtr> wait(
      const std::vector<WorkHandlePtr>& handles,
      std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Stop accepting work.
     * @param wait If true, block until all scheduled units are done.
     * Otherwise, cancel units that have not started and return without
     * waiting for running units to finish.
     */
    virtual void shutdown(bool wait) noexcept = 0;
};

/**
 * @brief Runs each unit in the calling thread, inside submit().
 * @details Every handle it returns is already done. Exceptions raised by a
 * unit are kept as they are. Meant for tests and small inputs.
 */
class SynchronousExecutor final : public Executor
{
  public:
    WorkHandlePtr submit(Task&& task) override;
    std::vector<WorkHandlePtr> wait(
      const std::vector<WorkHandlePtr>& handles,
      std::optional<std::chrono::milliseconds> timeout) override;
    void shutdown(bool wait) noexcept override;

  private:
    bool is_accepting_jobs_{ true };
};

/**
 * @brief Make the executor for @p worker_count workers: a process pool if
 * @p worker_count is positive, a SynchronousExecutor otherwise.
 */
std::unique_ptr<Executor>
make_executor(int worker_count);
} // namespace pzarr
