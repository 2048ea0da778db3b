#include "process.pool.hh"
#include "macros.hh"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>

namespace {
using json = nlohmann::json;

bool
write_all(int fd, const std::string& payload) noexcept
{
    size_t written = 0;
    while (written < payload.size()) {
        const auto n =
          ::write(fd, payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }

    return true;
}

json
make_error(const char* type, const char* what)
{
    return json{ { "type", type }, { "what", what } };
}

/// Run @p task in a freshly forked worker, send its outcome to @p fd, and
/// exit without unwinding into the controller's code.
[[noreturn]] void
run_in_worker(const pzarr::Task& task, int fd)
{
    json message;
    try {
        message["result"] = task();
    } catch (const std::invalid_argument& exc) {
        message["error"] = make_error("invalid_argument", exc.what());
    } catch (const std::out_of_range& exc) {
        message["error"] = make_error("out_of_range", exc.what());
    } catch (const std::overflow_error& exc) {
        message["error"] = make_error("overflow_error", exc.what());
    } catch (const std::exception& exc) {
        message["error"] = make_error("runtime_error", exc.what());
    } catch (...) {
        message["error"] = make_error("runtime_error", "Unknown exception");
    }

    std::string payload;
    try {
        payload =
          message.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& exc) {
        payload = json{ { "error",
                          make_error("runtime_error", exc.what()) } }
                    .dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::cout.flush();
    std::cerr.flush();

    const bool ok = write_all(fd, payload);
    ::close(fd);
    ::_exit(ok ? 0 : 1);
}

std::exception_ptr
remote_exception(const json& error)
{
    const auto type = error.at("type").get<std::string>();
    const auto what = error.at("what").get<std::string>();

    if (type == "invalid_argument") {
        return std::make_exception_ptr(std::invalid_argument(what));
    }
    if (type == "out_of_range") {
        return std::make_exception_ptr(std::out_of_range(what));
    }
    if (type == "overflow_error") {
        return std::make_exception_ptr(std::overflow_error(what));
    }

    return std::make_exception_ptr(std::runtime_error(what));
}
} // namespace

pzarr::ProcessPoolExecutor::ProcessPoolExecutor(unsigned int n_workers)
  : max_workers_{ std::max(n_workers, 1u) }
  , is_accepting_jobs_{ true }
{
}

pzarr::ProcessPoolExecutor::~ProcessPoolExecutor() noexcept
{
    shutdown(false);
}

pzarr::WorkHandlePtr
pzarr::ProcessPoolExecutor::submit(Task&& task)
{
    EXPECT(is_accepting_jobs_, "Executor has been shut down");

    auto handle = std::make_shared<WorkHandle>();
    jobs_.push({ std::move(task), handle });
    start_queued_jobs_();

    return handle;
}

std::vector<pzarr::WorkHandlePtr>
pzarr::ProcessPoolExecutor::wait(
  const std::vector<WorkHandlePtr>& handles,
  std::optional<std::chrono::milliseconds> timeout)
{
    using Clock = std::chrono::steady_clock;

    auto collect_done = [&handles] {
        std::vector<WorkHandlePtr> done;
        for (const auto& handle : handles) {
            if (handle->done()) {
                done.push_back(handle);
            }
        }
        return done;
    };

    if (handles.empty()) {
        return {};
    }

    std::optional<Clock::time_point> deadline;
    if (timeout) {
        deadline = Clock::now() + *timeout;
    }

    while (true) {
        if (auto done = collect_done(); !done.empty()) {
            return done;
        }

        start_queued_jobs_();
        if (workers_.empty()) {
            // nothing left that could finish one of these handles
            return collect_done();
        }

        std::optional<std::chrono::milliseconds> remaining;
        if (deadline) {
            const auto now = Clock::now();
            if (now >= *deadline) {
                return collect_done();
            }
            remaining =
              std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
        }

        poll_(remaining);
    }
}

void
pzarr::ProcessPoolExecutor::shutdown(bool wait) noexcept
{
    is_accepting_jobs_ = false;

    if (wait) {
        try {
            while (!jobs_.empty() || !workers_.empty()) {
                start_queued_jobs_();
                poll_(std::nullopt);
            }
        } catch (const std::exception& exc) {
            LOG_ERROR("Failed to wait for workers: ", exc.what());
        }
    }

    while (auto job = pop_from_job_queue_()) {
        job->handle->cancel();
    }

    if (workers_.empty()) {
        return;
    }

    // running workers finish in the background; drain and reap them there
    std::vector<std::pair<pid_t, int>> orphans;
    for (const auto& worker : workers_) {
        orphans.emplace_back(worker.pid, worker.fd);
    }
    workers_.clear();

    try {
        std::thread([orphans] {
            for (const auto& [pid, fd] : orphans) {
                char buf[4096];
                ssize_t n;
                do {
                    n = ::read(fd, buf, sizeof(buf));
                } while (n > 0 || (n < 0 && errno == EINTR));
                ::close(fd);

                while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
                }
            }
        }).detach();
    } catch (const std::system_error& exc) {
        LOG_WARNING("Failed to start worker reaper: ", exc.what());
        for (const auto& [pid, fd] : orphans) {
            ::close(fd);
        }
    }
}

std::optional<pzarr::ProcessPoolExecutor::Job>
pzarr::ProcessPoolExecutor::pop_from_job_queue_() noexcept
{
    if (jobs_.empty()) {
        return std::nullopt;
    }

    auto job = std::move(jobs_.front());
    jobs_.pop();
    return job;
}

void
pzarr::ProcessPoolExecutor::start_queued_jobs_()
{
    while (workers_.size() < max_workers_) {
        auto job = pop_from_job_queue_();
        if (!job.has_value()) {
            break;
        }

        if (job->handle->cancelled()) {
            continue;
        }

        spawn_(std::move(*job));
    }
}

void
pzarr::ProcessPoolExecutor::spawn_(Job&& job)
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const std::string err = LOG_ERROR("Failed to create result pipe: ",
                                          std::strerror(errno));
        job.handle->set_error_(
          std::make_exception_ptr(std::runtime_error(err)));
        return;
    }

    // anything still buffered would otherwise be written twice
    std::cout.flush();
    std::cerr.flush();

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string err = LOG_ERROR("Failed to start worker process: ",
                                          std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        job.handle->set_error_(
          std::make_exception_ptr(std::runtime_error(err)));
        return;
    }

    if (pid == 0) {
        ::close(fds[0]);
        run_in_worker(job.task, fds[1]);
    }

    ::close(fds[1]);
    job.handle->set_running_();
    LOG_DEBUG("Started unit ", job.handle->id(), " in worker process ", pid);

    workers_.push_back({ pid, fds[0], {}, std::move(job.handle) });
}

void
pzarr::ProcessPoolExecutor::poll_(
  std::optional<std::chrono::milliseconds> timeout)
{
    if (workers_.empty()) {
        return;
    }

    std::vector<pollfd> fds;
    fds.reserve(workers_.size());
    for (const auto& worker : workers_) {
        fds.push_back({ worker.fd, POLLIN, 0 });
    }

    const int timeout_ms =
      timeout ? static_cast<int>(std::min<long long>(timeout->count(), INT_MAX))
              : -1;

    const int rc = ::poll(fds.data(), fds.size(), timeout_ms);
    if (rc < 0) {
        EXPECT(errno == EINTR, "Failed to poll workers: ", std::strerror(errno));
        return;
    }

    for (auto i = 0; i < fds.size(); ++i) {
        if (fds[i].revents == 0) {
            continue;
        }

        auto& worker = workers_[i];
        char buf[4096];
        const auto n = ::read(worker.fd, buf, sizeof(buf));
        if (n > 0) {
            worker.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            // end of output: the worker has exited or is about to
            reap_(worker);
        }
    }

    std::erase_if(workers_, [](const Worker& worker) { return worker.fd < 0; });
}

void
pzarr::ProcessPoolExecutor::reap_(Worker& worker)
{
    ::close(worker.fd);
    worker.fd = -1;

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(worker.pid, &status, 0);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        LOG_ERROR("Failed to wait for worker process ",
                  worker.pid,
                  ": ",
                  std::strerror(errno));
        worker.handle->set_error_(std::make_exception_ptr(WorkerDiedError()));
        return;
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        try {
            auto message = json::parse(worker.output);
            if (message.contains("result")) {
                worker.handle->set_result_(std::move(message["result"]));
                return;
            }
            if (message.contains("error")) {
                worker.handle->set_error_(remote_exception(message["error"]));
                return;
            }
        } catch (const json::exception& exc) {
            LOG_ERROR("Malformed output from worker process ",
                      worker.pid,
                      ": ",
                      exc.what());
        }
    }

    if (WIFSIGNALED(status)) {
        LOG_ERROR("Worker process ",
                  worker.pid,
                  " was killed by signal ",
                  WTERMSIG(status));
    } else {
        LOG_ERROR("Worker process ",
                  worker.pid,
                  " exited with status ",
                  WEXITSTATUS(status),
                  " without reporting an outcome");
    }

    worker.handle->set_error_(std::make_exception_ptr(WorkerDiedError()));
}
