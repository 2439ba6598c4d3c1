/**
 * Structured logging for timdb.
 *
 * All messages go to a single spdlog logger named "timdb" that writes to
 * stderr. Messages carry key=value fields after the text so they can be
 * grepped out of the CLI's output.
 */

#ifndef TIMDB_LOG_H
#define TIMDB_LOG_H

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <string>

namespace timdb {
namespace log {

struct Field {
	std::string key;
	std::string value;
};

Field string_field(const std::string &key, const std::string &value);
Field int_field(const std::string &key, int64_t value);
Field bool_field(const std::string &key, bool value);

/**
 * Get the timdb logger, creating it on first use.
 * Level comes from TIM_LOG_LEVEL (default "warn"), pattern from TIM_LOG_PATTERN.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Change the logger level by name ("trace", "debug", "info", "warn", "error",
 * "critical", "off").
 * @return false if the name is not a known level
 */
bool set_level(const std::string &level);
std::string get_level();

void write(spdlog::level::level_enum level, const std::string &message, std::initializer_list<Field> fields = {});

inline void debug(const std::string &message, std::initializer_list<Field> fields = {}) {
	write(spdlog::level::debug, message, fields);
}

inline void info(const std::string &message, std::initializer_list<Field> fields = {}) {
	write(spdlog::level::info, message, fields);
}

inline void warn(const std::string &message, std::initializer_list<Field> fields = {}) {
	write(spdlog::level::warn, message, fields);
}

inline void error(const std::string &message, std::initializer_list<Field> fields = {}) {
	write(spdlog::level::err, message, fields);
}

} // namespace log
} // namespace timdb

#define TIMDB_LOG_DEBUG(message, ...) ::timdb::log::debug((message), ##__VA_ARGS__)
#define TIMDB_LOG_INFO(message, ...) ::timdb::log::info((message), ##__VA_ARGS__)
#define TIMDB_LOG_WARN(message, ...) ::timdb::log::warn((message), ##__VA_ARGS__)
#define TIMDB_LOG_ERROR(message, ...) ::timdb::log::error((message), ##__VA_ARGS__)

#endif // TIMDB_LOG_H
