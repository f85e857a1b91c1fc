/**
 * @file Logging.hpp
 * @brief Diagnostic sink for catrec (spdlog)
 *
 * Messages go to the logger named "catrec". Until init_logging() or
 * set_logger() is called, the spdlog default logger is used. Fields are
 * appended to the message as space separated key=value pairs.
 */

#ifndef CATREC_LOGGING_HPP
#define CATREC_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace catrec {

struct Settings;

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

/// Create the stderr "catrec" logger with the level and pattern from settings.
void init_logging(const Settings& settings);

/// Route catrec diagnostics to @p logger (nullptr restores the spdlog default).
void set_logger(std::shared_ptr<spdlog::logger> logger);

std::shared_ptr<spdlog::logger> logger();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::warn, message, fields);
}

} // namespace catrec

#define CATREC_LOG_INFO(message, ...) ::catrec::LogInfo((message), ##__VA_ARGS__)
#define CATREC_LOG_WARN(message, ...) ::catrec::LogWarn((message), ##__VA_ARGS__)

#endif // CATREC_LOGGING_HPP
