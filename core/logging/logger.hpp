#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace warden {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Process-wide diagnostic logger.
// Records are written to std::cerr unless a different stream is installed;
// the worker's own output never goes through here.
class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Redirect records (tests capture into a stringstream). nullptr restores std::cerr.
    static void set_stream(std::ostream *stream);

private:
    static Level threshold_;
    static std::ostream *stream_;
    static std::mutex mutex_;
};

// Helpers for config parsing
Level string_to_level(const std::string &level_str);
bool is_valid_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace warden

// Stream-style macros: LOG_INFO("[Tag] pid=" << pid)
#define LOG_INTERNAL(lvl, msg)                                               \
    do {                                                                     \
        if ((lvl) >= warden::logging::Logger::level()) {                     \
            std::stringstream ss;                                            \
            ss << msg;                                                       \
            warden::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        }                                                                    \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(warden::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(warden::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(warden::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(warden::logging::Level::LVL_ERROR, msg)
