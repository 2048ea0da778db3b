#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace pzarr {
struct ProgressConfig
{
    uint64_t total{ 0 };  // 0 if unknown
    std::string units;    // e.g. "B"
    std::string title;
    bool show{ false };
    std::chrono::milliseconds poll_interval{ 10 };
};

/**
 * @brief A single-line text progress bar.
 * @details Counts are shown with SI prefixes. Redraws are throttled; the
 * final state is always drawn on close(). A display created with
 * `show == false` tracks the count but never draws.
 */
class ProgressDisplay
{
  public:
    explicit ProgressDisplay(const ProgressConfig& config,
                             std::ostream& out = std::cerr);
    ~ProgressDisplay() noexcept;

    void update(uint64_t increment);
    [[nodiscard]] uint64_t n() const noexcept { return n_; }

    /// @brief Draw the final state and end the line. Idempotent.
    void close();

  private:
    using Clock = std::chrono::steady_clock;

    ProgressConfig config_;
    std::ostream& out_;

    uint64_t n_;
    Clock::time_point start_time_;
    Clock::time_point last_draw_;
    std::chrono::milliseconds min_draw_interval_;
    bool closed_;

    void draw_();
};
} // namespace pzarr
