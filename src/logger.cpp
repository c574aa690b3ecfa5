#include "logger.hh"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

Cf2ZarrLogLevel Logger::current_level_ = Cf2ZarrLogLevel_Info;
std::mutex Logger::log_mutex_{};

void
Logger::set_log_level(Cf2ZarrLogLevel level)
{
    current_level_ = level;
}

Cf2ZarrLogLevel
Logger::get_log_level()
{
    return current_level_;
}

void
Logger::write_(Cf2ZarrLogLevel level,
               const std::string& filename,
               int line,
               const char* func,
               const std::string& message)
{
    std::string prefix;
    std::ostream* stream = &std::cout;

    switch (level) {
        case Cf2ZarrLogLevel_Debug:
            prefix = "[DEBUG] ";
            break;
        case Cf2ZarrLogLevel_Info:
            prefix = "[INFO] ";
            break;
        case Cf2ZarrLogLevel_Warning:
            prefix = "[WARNING] ";
            stream = &std::cerr;
            break;
        default:
            prefix = "[ERROR] ";
            stream = &std::cerr;
            break;
    }

    // Get current time
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                    1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    *stream << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << " " << prefix
            << filename << ":" << line << " " << func << ": " << message
            << std::endl;
}
