#pragma once

#include "cf2zarr.types.h"

#include <filesystem>
#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(Cf2ZarrLogLevel level);
    static Cf2ZarrLogLevel get_log_level();

    template<typename... Args>
    static std::string log(Cf2ZarrLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        std::string message = ss.str();

        if (current_level_ == Cf2ZarrLogLevel_None || level < current_level_) {
            return message; // suppressed, but still handed back to the caller
        }

        const std::string filename =
          std::filesystem::path(file).filename().string();

        std::scoped_lock lock(log_mutex_);
        write_(level, filename, line, func, message);

        return message;
    }

  private:
    static Cf2ZarrLogLevel current_level_;
    static std::mutex log_mutex_;

    static void write_(Cf2ZarrLogLevel level,
                       const std::string& filename,
                       int line,
                       const char* func,
                       const std::string& message);
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(Cf2ZarrLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(Cf2ZarrLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(                                                               \
      Cf2ZarrLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(Cf2ZarrLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
