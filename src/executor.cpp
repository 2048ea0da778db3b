#include "executor.hh"
#include "macros.hh"
#include "process.pool.hh"

pzarr::WorkHandlePtr
pzarr::SynchronousExecutor::submit(Task&& task)
{
    EXPECT(is_accepting_jobs_, "Executor has been shut down");

    auto handle = std::make_shared<WorkHandle>();
    handle->set_running_();

    try {
        handle->set_result_(task());
    } catch (...) {
        handle->set_error_(std::current_exception());
    }

    return handle;
}

std::vector<pzarr::WorkHandlePtr>
pzarr::SynchronousExecutor::wait(
  const std::vector<WorkHandlePtr>& handles,
  std::optional<std::chrono::milliseconds>)
{
    std::vector<WorkHandlePtr> done;
    for (const auto& handle : handles) {
        if (handle->done()) {
            done.push_back(handle);
        }
    }

    return done;
}

void
pzarr::SynchronousExecutor::shutdown(bool) noexcept
{
    is_accepting_jobs_ = false;
}

std::unique_ptr<pzarr::Executor>
pzarr::make_executor(int worker_count)
{
    if (worker_count <= 0) {
        LOG_DEBUG("Running units synchronously");
        return std::make_unique<SynchronousExecutor>();
    }

    LOG_DEBUG("Running units in up to ", worker_count, " worker processes");
    return std::make_unique<ProcessPoolExecutor>(
      static_cast<unsigned int>(worker_count));
}
