#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace respkv {

	struct ServerConfig {
		std::string bind = "127.0.0.1";
		std::uint16_t port = 6379;
		std::string log_level = "info";
		// every directive seen in the file, known or not
		std::unordered_map<std::string, std::string> raw;
	};

	// Read "key value" lines ('#' starts a comment) on top of the defaults.
	// A missing file yields the defaults; an unusable port throws
	// std::invalid_argument.
	ServerConfig load_config(const std::string& path);

	// Apply a single directive to cfg. Unknown keys are only recorded in raw.
	void apply_directive(ServerConfig& cfg, const std::string& key, const std::string& value);

} // namespace respkv
