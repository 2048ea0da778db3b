#include "progress.display.hh"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace {
std::string
format_si(double value)
{
    const char* prefixes[] = { "", "k", "M", "G", "T", "P", "E" };

    size_t i = 0;
    while (value >= 999.5 && i < std::size(prefixes) - 1) {
        value /= 1000.0;
        ++i;
    }

    char buf[32];
    if (i == 0) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f%s", value, prefixes[i]);
    }
    return buf;
}

std::string
format_elapsed(std::chrono::steady_clock::duration elapsed)
{
    const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();

    char buf[32];
    std::snprintf(buf,
                  sizeof(buf),
                  "%02lld:%02lld",
                  static_cast<long long>(secs / 60),
                  static_cast<long long>(secs % 60));
    return buf;
}
} // namespace

pzarr::ProgressDisplay::ProgressDisplay(const ProgressConfig& config,
                                        std::ostream& out)
  : config_{ config }
  , out_{ out }
  , n_{ 0 }
  , start_time_{ Clock::now() }
  , last_draw_{}
  , min_draw_interval_{ 100 }
  , closed_{ false }
{
}

pzarr::ProgressDisplay::~ProgressDisplay() noexcept
{
    close();
}

void
pzarr::ProgressDisplay::update(uint64_t increment)
{
    n_ += increment;

    if (!config_.show || closed_) {
        return;
    }

    const auto now = Clock::now();
    if (now - last_draw_ >= min_draw_interval_) {
        draw_();
        last_draw_ = now;
    }
}

void
pzarr::ProgressDisplay::close()
{
    if (closed_) {
        return;
    }
    closed_ = true;

    if (config_.show) {
        draw_();
        out_ << std::endl;
    }
}

void
pzarr::ProgressDisplay::draw_()
{
    constexpr int bar_width = 25;

    const auto elapsed = Clock::now() - start_time_;
    const double secs = std::chrono::duration<double>(elapsed).count();
    const double rate = secs > 0 ? static_cast<double>(n_) / secs : 0.0;

    std::ostringstream ss;
    ss << '\r' << std::setw(8) << config_.title << ": ";

    if (config_.total > 0) {
        const double fraction =
          std::min(1.0, static_cast<double>(n_) / config_.total);
        const int filled = static_cast<int>(fraction * bar_width);

        ss << std::setw(3) << static_cast<int>(fraction * 100) << "%|"
           << std::string(filled, '#') << std::string(bar_width - filled, ' ')
           << "| " << format_si(static_cast<double>(n_)) << '/'
           << format_si(static_cast<double>(config_.total));
    } else {
        ss << format_si(static_cast<double>(n_));
    }

    ss << config_.units << " [" << format_elapsed(elapsed) << ", "
       << format_si(rate) << config_.units << "/s]";

    out_ << ss.str() << std::flush;
}
