#include "work.manager.hh"
#include "macros.hh"
#include "progress.state.hh"

#include <algorithm>
#include <exception>

pzarr::CompletedResults::CompletedResults(WorkManager& manager)
  : manager_{ manager }
{
}

std::optional<nlohmann::json>
pzarr::CompletedResults::next()
{
    while (true) {
        while (!ready_.empty()) {
            auto handle = ready_.front();
            ready_.erase(ready_.begin());

            if (!handle->cancelled()) {
                return handle->result();
            }
        }

        if (manager_.n_outstanding() == 0) {
            return std::nullopt;
        }

        ready_ = manager_.wait_for_completed();
    }
}

pzarr::WorkManager::WorkManager(int worker_count,
                                const ProgressConfig& progress_config)
  : executor_{ make_executor(worker_count) }
  , progress_config_{ progress_config }
  , display_{ progress_config }
  , completed_{ false }
  , torn_down_{ false }
{
    // must happen before the first worker is forked
    ProgressState::set(0);

    poller_ = std::thread([this] { poll_progress_(); });
}

pzarr::WorkManager::~WorkManager() noexcept
{
    if (torn_down_) {
        return;
    }

    if (std::uncaught_exceptions() == 0) {
        LOG_WARNING("Work manager destroyed without being closed. Cancelling ",
                    outstanding_.size(),
                    " outstanding units.");
    }

    cancel_outstanding_();
    teardown_();
}

pzarr::WorkHandlePtr
pzarr::WorkManager::submit(Task&& task)
{
    EXPECT(!torn_down_, "Work manager has been closed");

    auto handle = executor_->submit(std::move(task));
    outstanding_.push_back(handle);

    return handle;
}

std::vector<pzarr::WorkHandlePtr>
pzarr::WorkManager::wait_for_completed(
  std::optional<std::chrono::milliseconds> timeout)
{
    if (outstanding_.empty()) {
        return {};
    }

    auto done = executor_->wait(outstanding_, timeout);
    std::erase_if(outstanding_, [](const WorkHandlePtr& handle) {
        return handle->done();
    });

    const auto failed =
      std::find_if(done.begin(), done.end(), [](const WorkHandlePtr& handle) {
          return handle->failed();
      });
    if (failed != done.end()) {
        LOG_DEBUG("Unit ",
                  (*failed)->id(),
                  " failed. Cancelling ",
                  outstanding_.size(),
                  " outstanding units.");
        cancel_outstanding_();
        std::rethrow_exception((*failed)->error());
    }

    return done;
}

pzarr::CompletedResults
pzarr::WorkManager::results_as_completed()
{
    return CompletedResults(*this);
}

void
pzarr::WorkManager::close()
{
    if (torn_down_) {
        return;
    }

    try {
        while (!outstanding_.empty()) {
            wait_for_completed();
        }
    } catch (...) {
        teardown_();
        throw;
    }

    teardown_();
}

void
pzarr::WorkManager::cancel_outstanding_() noexcept
{
    for (auto& handle : outstanding_) {
        handle->cancel();
    }
    outstanding_.clear();
}

void
pzarr::WorkManager::poll_progress_()
{
    while (true) {
        {
            std::unique_lock lock(poller_mutex_);
            if (poller_cv_.wait_for(lock,
                                    progress_config_.poll_interval,
                                    [this] { return completed_; })) {
                break;
            }
        }

        try {
            update_progress_();
        } catch (const std::exception& exc) {
            LOG_ERROR("Failed to update progress: ", exc.what());
        }
    }

    LOG_DEBUG("Exit progress thread");
}

void
pzarr::WorkManager::update_progress_()
{
    const auto current = ProgressState::read();
    if (current > display_.n()) {
        display_.update(current - display_.n());
    }
}

void
pzarr::WorkManager::teardown_() noexcept
{
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    {
        std::scoped_lock lock(poller_mutex_);
        completed_ = true;
    }
    poller_cv_.notify_all();

    if (poller_.joinable()) {
        poller_.join();
    }

    try {
        update_progress_();
        display_.close();
    } catch (const std::exception& exc) {
        LOG_ERROR("Failed to close progress display: ", exc.what());
    }

    executor_->shutdown(false);
}
