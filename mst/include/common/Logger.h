#pragma once

#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

#define MST_LOGGER_PRIVATE_NS __detail
#define MST_PRIVATE_CALL(func) MST_LOGGER_PRIVATE_NS::func

namespace MST {

namespace MST_LOGGER_PRIVATE_NS {
void doInitializeLogger(const std::string &logDir, bool logToFile);
std::string extractCleanFunctionName(const std::source_location &loc);
void ensureLoggerInitialized();
}  // namespace MST_LOGGER_PRIVATE_NS

/**
 * @brief Process-wide logging facade over spdlog
 *
 * The "MST" logger is created lazily on first use with a colored console
 * sink. Its level comes from SPDLOG_LEVEL (debug when unset or unrecognized)
 * and can be changed later with setLevel(). Every record is prefixed with the
 * calling function, e.g. "TransitionExecutor::execute() - ...".
 */
class Logger {
public:
    /**
     * @brief Initialize with an optional file sink
     * @param logDir Directory receiving mst.log (created if missing)
     * @param logToFile Whether to add the file sink next to the console sink
     *
     * Has no effect once the logger exists, including after any LOG_* call.
     */
    static void initialize(const std::string &logDir = "", bool logToFile = false) {
        MST_PRIVATE_CALL(doInitializeLogger)(logDir, logToFile);
    }

    static void setLevel(spdlog::level::level_enum level);

    // Lets the LOG_* macros skip formatting for filtered records
    static bool isEnabled(spdlog::level::level_enum level);

    static void log(spdlog::level::level_enum level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::shared_ptr<spdlog::logger> logger_;

    friend void MST_LOGGER_PRIVATE_NS::ensureLoggerInitialized();
    friend void MST_LOGGER_PRIVATE_NS::doInitializeLogger(const std::string &logDir, bool logToFile);
};

}  // namespace MST

#define MST_LOG_AT(level, ...)                                                                      \
    do {                                                                                            \
        if (MST::Logger::isEnabled(level)) {                                                        \
            MST::Logger::log(level, fmt::format(__VA_ARGS__), std::source_location::current());      \
        }                                                                                           \
    } while (0)

#define LOG_TRACE(...) MST_LOG_AT(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) MST_LOG_AT(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) MST_LOG_AT(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) MST_LOG_AT(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) MST_LOG_AT(spdlog::level::err, __VA_ARGS__)
