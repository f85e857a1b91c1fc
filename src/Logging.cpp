/**
 * @file Logging.cpp
 * @brief spdlog-backed diagnostic sink
 */

#include "catrec/Logging.hpp"
#include "catrec/Settings.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <sstream>

namespace catrec {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::string SerializeFields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // anonymous namespace

LogField StringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

void init_logging(const Settings& settings) {
    auto created = spdlog::get("catrec");
    if (!created) {
        created = spdlog::stderr_color_mt("catrec");
    }
    created->set_pattern(settings.log_pattern);
    created->set_level(spdlog::level::from_str(settings.log_level));
    created->flush_on(spdlog::level::warn);
    set_logger(std::move(created));
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) return g_logger;
    return spdlog::default_logger();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    auto sink = logger();
    auto serialized_fields = SerializeFields(fields);
    if (!serialized_fields.empty()) {
        sink->log(level, "{} {}", message, serialized_fields);
        return;
    }
    sink->log(level, "{}", message);
}

} // namespace catrec
