#pragma once
#include <string>

namespace respkv {

	enum class LogLevel {
		Error = 0,
		Warn = 1,
		Info = 2,
		Debug = 3,
	};

	void set_log_level(LogLevel level);
	LogLevel log_level();

	// "error" | "warn" | "info" | "debug"; anything else maps to Info
	LogLevel parse_log_level(const std::string& level);

	// Timestamped line on stderr; dropped if above the current level.
	void log(LogLevel level, const std::string& message);

} // namespace respkv
