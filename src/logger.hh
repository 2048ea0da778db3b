#pragma once

#include "pzarr.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(PzarrLogLevel level);
    static PzarrLogLevel get_log_level();

    template<typename... Args>
    static std::string log(PzarrLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::ostringstream body;
        format_arg_(body, std::forward<Args>(args)...);

        // the message is returned even when suppressed, since EXPECT uses it
        // as the text of the exception it throws
        if (current_level_ == PzarrLogLevel_None || level < current_level_) {
            return body.str();
        }

        std::scoped_lock lock(log_mutex_);

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case PzarrLogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case PzarrLogLevel_Info:
                prefix = "[INFO] ";
                break;
            case PzarrLogLevel_Warning:
                prefix = "[WARNING] ";
                stream = &std::cerr;
                break;
            default:
                prefix = "[ERROR] ";
                stream = &std::cerr;
                break;
        }

        fs::path filepath(file);
        std::string filename = filepath.filename().string();

        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix << filename << ":" << line
           << " " << func << ": " << body.str();

        std::string message = ss.str();
        *stream << message << std::endl;

        return body.str();
    }

  private:
    static PzarrLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream&) {} // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static std::string get_timestamp_();
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(PzarrLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(PzarrLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(                                                               \
      PzarrLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(PzarrLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
