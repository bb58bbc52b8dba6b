#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

// Windows defines ERROR as a macro; undef it
#ifdef ERROR
#undef ERROR
#endif

namespace fiscus {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v";
}

void Logger::init(const std::string& log_file, Level level) {
    Options opts;
    opts.log_file = log_file;
    opts.level = level;
    init(opts);
}

void Logger::init(const Options& options) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (!options.log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                options.log_file, options.truncate_file));
        }

        // Re-init replaces the previous logger
        if (logger_) {
            logger_->flush();
            spdlog::drop("fiscus");
        }
        logger_ = std::make_shared<spdlog::logger>("fiscus", sinks.begin(), sinks.end());
        logger_->set_level(detail::toSpdlogLevel(options.level));
        logger_->set_pattern(kDefaultPattern);
        logger_->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger_);

        logger_->info("Logger initialized (level={}, file={})",
                      levelToString(options.level),
                      options.log_file.empty() ? "<none>" : options.log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        logger_.reset();
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        init(); // Auto-initialize with defaults
    }
    return logger_;
}

void Logger::setLevel(Level level) {
    if (auto l = get()) {
        l->set_level(detail::toSpdlogLevel(level));
    }
}

void Logger::setPattern(const std::string& pattern) {
    if (auto l = get()) {
        l->set_pattern(pattern);
    }
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

bool Logger::shouldLog(Level level) {
    return logger_ && logger_->should_log(detail::toSpdlogLevel(level));
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "info") return Level::INFO;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical" || s == "crit") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace fiscus
