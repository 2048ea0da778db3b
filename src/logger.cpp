#include "logger.hh"

#include <chrono>
#include <ctime>
#include <iomanip>

PzarrLogLevel Logger::current_level_ = PzarrLogLevel_Info;
std::mutex Logger::log_mutex_{};

void
Logger::set_log_level(PzarrLogLevel level)
{
    current_level_ = level;
}

PzarrLogLevel
Logger::get_log_level()
{
    return current_level_;
}

std::string
Logger::get_timestamp_()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
              1000;

    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count();

    return ss.str();
}
