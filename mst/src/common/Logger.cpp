#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace MST {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::setLevel(spdlog::level::level_enum level) {
    MST_PRIVATE_CALL(ensureLoggerInitialized)();
    logger_->set_level(level);
}

bool Logger::isEnabled(spdlog::level::level_enum level) {
    MST_PRIVATE_CALL(ensureLoggerInitialized)();
    return logger_->should_log(level);
}

void Logger::log(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc) {
    MST_PRIVATE_CALL(ensureLoggerInitialized)();
    logger_->log(level, MST_PRIVATE_CALL(extractCleanFunctionName)(loc) + "() - " + message);
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

namespace MST_LOGGER_PRIVATE_NS {

namespace {

constexpr const char *LOGGER_NAME = "MST";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

spdlog::level::level_enum levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return spdlog::level::debug;
    }

    std::string levelStr(envLevel);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // spdlog::level::from_str maps unknown names to off; keep debug as the fallback instead
    if (levelStr == "warning") {
        return spdlog::level::warn;
    }
    if (levelStr == "error") {
        return spdlog::level::err;
    }
    auto level = spdlog::level::from_str(levelStr);
    if (level == spdlog::level::off && levelStr != "off") {
        return spdlog::level::debug;
    }
    return level;
}

std::shared_ptr<spdlog::logger> createConsoleLogger() {
    // A previous instance may survive in the spdlog registry (e.g. across test fixtures)
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
    logger->set_pattern(CONSOLE_PATTERN);
    return logger;
}

}  // namespace

void ensureLoggerInitialized() {
    if (!Logger::logger_) {
        Logger::logger_ = createConsoleLogger();
        Logger::logger_->set_level(levelFromEnvironment());
    }
}

std::string extractCleanFunctionName(const std::source_location &loc) {
    const std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    // Qualified name starts after the last top-level space (return type separator)
    size_t nameStart = 0;
    int templateDepth = 0;
    for (size_t i = 0; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            templateDepth++;
        } else if (c == '>') {
            templateDepth--;
        } else if (c == ' ' && templateDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string result;
    templateDepth = 0;
    for (size_t i = nameStart; i < parenPos; ++i) {
        char c = fullName[i];
        if (c == '<') {
            templateDepth++;
        } else if (c == '>') {
            templateDepth--;
        } else if (templateDepth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }

    return result.empty() ? "UnknownFunction" : result;
}

void doInitializeLogger(const std::string &logDir, bool logToFile) {
    if (Logger::logger_) {
        return;
    }

    if (!logToFile || logDir.empty()) {
        Logger::logger_ = createConsoleLogger();
    } else {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(consoleSink);

        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "mst.log";
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);

        spdlog::drop(LOGGER_NAME);
        Logger::logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(Logger::logger_);
    }

    Logger::logger_->set_level(levelFromEnvironment());
}

}  // namespace MST_LOGGER_PRIVATE_NS

}  // namespace MST
