#include "work.handle.hh"
#include "macros.hh"

#include <atomic>

namespace {
std::atomic<uint64_t> next_handle_id{ 0 };
} // namespace

pzarr::WorkHandle::WorkHandle()
  : id_{ next_handle_id++ }
  , state_{ State::Pending }
{
}

bool
pzarr::WorkHandle::done() const noexcept
{
    return state_ == State::Finished || state_ == State::Cancelled;
}

bool
pzarr::WorkHandle::cancelled() const noexcept
{
    return state_ == State::Cancelled;
}

bool
pzarr::WorkHandle::failed() const noexcept
{
    return state_ == State::Finished && error_ != nullptr;
}

bool
pzarr::WorkHandle::cancel() noexcept
{
    if (state_ == State::Pending) {
        state_ = State::Cancelled;
    }

    return state_ == State::Cancelled;
}

const nlohmann::json&
pzarr::WorkHandle::result() const
{
    EXPECT(state_ != State::Cancelled, "Unit ", id_, " was cancelled");
    EXPECT(state_ == State::Finished, "Unit ", id_, " has not finished");

    if (error_) {
        std::rethrow_exception(error_);
    }

    return result_;
}

void
pzarr::WorkHandle::set_running_() noexcept
{
    state_ = State::Running;
}

void
pzarr::WorkHandle::set_result_(nlohmann::json&& result) noexcept
{
    result_ = std::move(result);
    state_ = State::Finished;
}

void
pzarr::WorkHandle::set_error_(std::exception_ptr error) noexcept
{
    error_ = error;
    state_ = State::Finished;
}
