#pragma once

#include "h5stream.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>

class Logger
{
  public:
    static void set_log_level(H5StreamLogLevel level);
    static H5StreamLogLevel get_log_level();

    template<typename... Args>
    static std::string log(H5StreamLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::scoped_lock lock(log_mutex_);

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case H5StreamLogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case H5StreamLogLevel_Info:
                prefix = "[INFO] ";
                break;
            case H5StreamLogLevel_Warning:
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
           << " " << func << ": ";

        format_arg_(ss, std::forward<Args>(args)...);

        std::string message = ss.str();

        // the message is still returned when suppressed so that callers can
        // use it in exceptions
        if (current_level_ != H5StreamLogLevel_None &&
            level >= current_level_) {
            *stream << message << std::endl;
        }

        return message;
    }

  private:
    static H5StreamLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream& ss) {}; // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static std::string get_timestamp_();
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(H5StreamLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(H5StreamLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(                                                               \
      H5StreamLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(H5StreamLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
