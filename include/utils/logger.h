#pragma once

// <windows.h> defines ERROR, which collides with Logger::Level::ERROR
#ifdef ERROR
#undef ERROR
#endif

#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace fiscus {
namespace utils {

/**
 * @brief Process-wide logging facade over spdlog
 *
 * One named logger ("fiscus") with an optional console sink and an optional
 * file sink. Messages logged before init() are dropped.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    struct Options {
        std::string log_file = "fiscus.log";    // empty -> no file sink
        Level level = Level::INFO;
        bool console = true;
        bool truncate_file = false;
    };

    static void init(const std::string& log_file = "fiscus.log", Level level = Level::INFO);
    /// Re-initializing replaces the previous logger
    static void init(const Options& options);
    static void shutdown();
    static bool isInitialized() { return logger_ != nullptr; }
    static std::shared_ptr<spdlog::logger> get();

    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);
    static void flush();

    /// False when uninitialized; lets callers skip building expensive messages
    static bool shouldLog(Level level);

    /// Unknown names map to INFO
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);
    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    template<typename FormatString, typename... Args>
    static void dispatch(Level level, FormatString&& fmt, Args&&... args);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace fiscus

#include "utils/logger_impl.h"

#define FISCUS_TRACE(...) ::fiscus::utils::Logger::trace(__VA_ARGS__)
#define FISCUS_DEBUG(...) ::fiscus::utils::Logger::debug(__VA_ARGS__)
#define FISCUS_INFO(...) ::fiscus::utils::Logger::info(__VA_ARGS__)
#define FISCUS_WARN(...) ::fiscus::utils::Logger::warn(__VA_ARGS__)
#define FISCUS_ERROR(...) ::fiscus::utils::Logger::error(__VA_ARGS__)
#define FISCUS_CRITICAL(...) ::fiscus::utils::Logger::critical(__VA_ARGS__)
