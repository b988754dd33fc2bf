#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace geoedit {

/**
 * Thread-safe logging system for DEBUG builds only
 * Zero overhead in release builds (NDEBUG defined)
 *
 * Lines are tagged with the emitting thread: its registered name (the
 * mutation context registers its own) or the thread id.
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    static void log(Level level, const std::string &file, int line,
                    const std::string &message) {
#ifdef DEBUG
        if (level < min_level_storage().load())
            return;

        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        // Extract filename from full path
        std::string filename = file;
        size_t last_slash = filename.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            filename = filename.substr(last_slash + 1);
        }

        std::cerr << "[" << level_to_string(level) << "]["
                  << std::put_time(std::localtime(&time_t), "%H:%M:%S") << "."
                  << std::setfill('0') << std::setw(3) << ms.count() << "]["
                  << thread_tag() << "][" << filename << ":" << line << "] "
                  << message << std::endl;
#else
        (void)level;
        (void)file;
        (void)line;
        (void)message;
#endif
    }

    /**
     * @brief Drop messages below `level`.
     */
    static void set_min_level(Level level) { min_level_storage().store(level); }
    static Level min_level() { return min_level_storage().load(); }

    /**
     * @brief Name shown instead of the thread id for the calling thread.
     */
    static void set_thread_name(const std::string &name) {
        thread_name_storage() = name;
    }

    /**
     * @brief Parse "debug", "info", "warn" or "error".
     */
    static std::optional<Level> level_from_string(const std::string &name) {
        if (name == "debug")
            return DEBUG_LEVEL;
        if (name == "info")
            return INFO_LEVEL;
        if (name == "warn")
            return WARN_LEVEL;
        if (name == "error")
            return ERROR_LEVEL;
        return std::nullopt;
    }

  private:
    static std::atomic<Level> &min_level_storage() {
        static std::atomic<Level> level{DEBUG_LEVEL};
        return level;
    }

    static std::string &thread_name_storage() {
        thread_local std::string name;
        return name;
    }

    static std::string thread_tag() {
        const std::string &name = thread_name_storage();
        if (!name.empty())
            return name;
        std::ostringstream id;
        id << std::this_thread::get_id();
        return id.str();
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
        default:
            return "UNKNOWN";
        }
    }
};

} // namespace geoedit

// Logging macros - compile to nothing in release builds
#ifdef DEBUG
#define LOG_DEBUG(msg)                                                         \
    geoedit::Logger::log(geoedit::Logger::DEBUG_LEVEL, __FILE__, __LINE__, msg)
#define LOG_INFO(msg)                                                          \
    geoedit::Logger::log(geoedit::Logger::INFO_LEVEL, __FILE__, __LINE__, msg)
#define LOG_WARN(msg)                                                          \
    geoedit::Logger::log(geoedit::Logger::WARN_LEVEL, __FILE__, __LINE__, msg)
#define LOG_ERROR(msg)                                                         \
    geoedit::Logger::log(geoedit::Logger::ERROR_LEVEL, __FILE__, __LINE__, msg)
#else
#define LOG_DEBUG(msg)                                                         \
    do {                                                                       \
    } while (0)
#define LOG_INFO(msg)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_WARN(msg)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_ERROR(msg)                                                         \
    do {                                                                       \
    } while (0)
#endif
