#include "Logger.hpp"

#include <algorithm>
#include <cctype>

namespace Scribe {

namespace {

constexpr const char* kConsolePattern = "[%H:%M:%S] [%^%l%$] [%t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
constexpr std::size_t kMaxLogFileBytes = 1024 * 1024 * 5;
constexpr std::size_t kMaxLogFiles = 3;

// stdout carries the CLI's JSON result, so console logging goes to stderr.
std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(kConsolePattern);
    return std::make_shared<spdlog::logger>(name, sink);
}

} // namespace

Logger::Logger()
    : logger_(makeConsoleLogger("scribe")) {
    logger_->set_level(spdlog::level::info);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern(kConsolePattern);

        std::shared_ptr<spdlog::logger> logger;
        if (logFilePath.empty()) {
            logger = std::make_shared<spdlog::logger>("scribe", consoleSink);
        } else {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, kMaxLogFileBytes, kMaxLogFiles);
            fileSink->set_pattern(kFilePattern);
            logger = std::make_shared<spdlog::logger>("scribe",
                spdlog::sinks_init_list{consoleSink, fileSink});
        }

        spdlog::drop("scribe");
        spdlog::register_logger(logger);
        logger_ = logger;
        setLevel(level);

        SCRIBE_INFO("Logger initialized with file: {}",
                    logFilePath.empty() ? std::string("<none>") : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        logger_ = makeConsoleLogger("scribe_fallback");
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    // Warnings and errors reach the file even when the process dies mid-run.
    logger_->flush_on(spdlog::level::warn);
}

Logger::Level Logger::level() const {
    return static_cast<Level>(logger_->level());
}

void Logger::flush() {
    logger_->flush();
}

Logger::Level Logger::levelFromName(const std::string& name, Level fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "critical") return Level::Critical;
    if (lower == "off") return Level::Off;
    return fallback;
}

} // namespace Scribe
