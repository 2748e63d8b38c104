#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace gridpaint {

/**
 * Thread-safe stderr logger for DEBUG builds.
 *
 * Messages below the minimum level are dropped. The minimum starts at
 * GRIDPAINT_LOG_LEVEL (debug, info, warn or error) and defaults to debug.
 * Release builds compile the macros away.
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    static void set_min_level(Level level) { min_level() = level; }
    static Level get_min_level() { return min_level(); }

    static void log(Level level, std::string_view file, int line,
                    const std::string &message) {
#ifdef DEBUG
        if (level < min_level())
            return;

        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) %
                        1000;

        const auto slash = file.find_last_of("/\\");
        if (slash != std::string_view::npos)
            file.remove_prefix(slash + 1);

        fmt::print(stderr, "[{}][{:%H:%M:%S}.{:03}][{}:{}] {}\n",
                   level_to_string(level),
                   fmt::localtime(std::chrono::system_clock::to_time_t(now)),
                   ms.count(), file, line, message);
#else
        (void)level;
        (void)file;
        (void)line;
        (void)message;
#endif
    }

    /**
     * @brief Parse a level name, falling back to @p fallback.
     */
    static Level parse_level(std::string_view name, Level fallback) {
        if (name == "debug")
            return DEBUG_LEVEL;
        if (name == "info")
            return INFO_LEVEL;
        if (name == "warn")
            return WARN_LEVEL;
        if (name == "error")
            return ERROR_LEVEL;
        return fallback;
    }

  private:
    static std::atomic<Level> &min_level() {
        static std::atomic<Level> level{[] {
            const char *env = std::getenv("GRIDPAINT_LOG_LEVEL");
            return env ? parse_level(env, DEBUG_LEVEL) : DEBUG_LEVEL;
        }()};
        return level;
    }

    static const char *level_to_string(Level level) {
        switch (level) {
        case DEBUG_LEVEL:
            return "DEBUG";
        case INFO_LEVEL:
            return "INFO ";
        case WARN_LEVEL:
            return "WARN ";
        case ERROR_LEVEL:
            return "ERROR";
        }
        return "?????";
    }
};

} // namespace gridpaint

// Logging macros - compile to nothing in release builds
#ifdef DEBUG
#define LOG_DEBUG(msg)                                                         \
    gridpaint::Logger::log(gridpaint::Logger::DEBUG_LEVEL, __FILE__, __LINE__, \
                           msg)
#define LOG_INFO(msg)                                                          \
    gridpaint::Logger::log(gridpaint::Logger::INFO_LEVEL, __FILE__, __LINE__,  \
                           msg)
#define LOG_WARN(msg)                                                          \
    gridpaint::Logger::log(gridpaint::Logger::WARN_LEVEL, __FILE__, __LINE__,  \
                           msg)
#define LOG_ERROR(msg)                                                         \
    gridpaint::Logger::log(gridpaint::Logger::ERROR_LEVEL, __FILE__, __LINE__, \
                           msg)
#else
#define LOG_DEBUG(msg) ((void)0)
#define LOG_INFO(msg) ((void)0)
#define LOG_WARN(msg) ((void)0)
#define LOG_ERROR(msg) ((void)0)
#endif
