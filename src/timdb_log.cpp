#include "timdb_log.h"

#include <cstdlib>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>

namespace timdb {
namespace log {

namespace {

// The library shares the process with the CLI, so stay quiet unless asked.
const char *DEFAULT_LEVEL = "warn";
const char *DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";

std::string resolve_level() {
	if (const char *level = std::getenv("TIM_LOG_LEVEL")) {
		return level;
	}
	return DEFAULT_LEVEL;
}

std::string resolve_pattern() {
	if (const char *pattern = std::getenv("TIM_LOG_PATTERN")) {
		return pattern;
	}
	return DEFAULT_PATTERN;
}

std::string serialize_fields(std::initializer_list<Field> fields) {
	std::ostringstream out;
	bool first = true;
	for (const auto &field : fields) {
		if (!first) {
			out << ' ';
		}
		first = false;
		out << field.key << '=' << field.value;
	}
	return out.str();
}

} // namespace

Field string_field(const std::string &key, const std::string &value) {
	return {key, value};
}

Field int_field(const std::string &key, int64_t value) {
	return {key, std::to_string(value)};
}

Field bool_field(const std::string &key, bool value) {
	return {key, value ? "true" : "false"};
}

std::shared_ptr<spdlog::logger> logger() {
	// Not registered with spdlog's global registry; the host application owns that.
	static std::shared_ptr<spdlog::logger> instance = [] {
		auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
		auto created = std::make_shared<spdlog::logger>("timdb", sink);
		created->set_pattern(resolve_pattern());
		auto level = spdlog::level::from_str(resolve_level());
		// from_str maps unknown names to "off"
		if (level == spdlog::level::off && resolve_level() != "off") {
			level = spdlog::level::from_str(DEFAULT_LEVEL);
		}
		created->set_level(level);
		created->flush_on(spdlog::level::warn);
		return created;
	}();
	return instance;
}

bool set_level(const std::string &level) {
	auto parsed = spdlog::level::from_str(level);
	if (parsed == spdlog::level::off && level != "off") {
		return false;
	}
	logger()->set_level(parsed);
	return true;
}

std::string get_level() {
	auto name = spdlog::level::to_string_view(logger()->level());
	return std::string(name.data(), name.size());
}

void write(spdlog::level::level_enum level, const std::string &message, std::initializer_list<Field> fields) {
	auto log = logger();
	if (!log->should_log(level)) {
		return;
	}

	auto serialized_fields = serialize_fields(fields);
	if (serialized_fields.empty()) {
		log->log(level, "{}", message);
		return;
	}
	log->log(level, "{} {}", message, serialized_fields);
}

} // namespace log
} // namespace timdb
