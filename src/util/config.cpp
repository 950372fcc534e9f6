#include <respkv/util/config.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace respkv {

    namespace {

        std::string trim(const std::string& s) {
            auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            if (first == s.end()) return "";
            auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
            return std::string(first, last);
        }

        std::uint16_t parse_port(const std::string& value) {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument("invalid port '" + value + "'");
            unsigned long p = 0;
            try { p = std::stoul(value); }
            catch (const std::out_of_range&) { throw std::invalid_argument("invalid port '" + value + "'"); }
            if (p > 65535) throw std::invalid_argument("port out of range '" + value + "'");
            return static_cast<std::uint16_t>(p);
        }

    } // namespace

    void apply_directive(ServerConfig& cfg, const std::string& key, const std::string& value) {
        cfg.raw[key] = value;
        if (key == "port") {
            cfg.port = parse_port(value);
        }
        else if (key == "bind") {
            cfg.bind = value;
        }
        else if (key == "loglevel") {
            cfg.log_level = value;
        }
    }

    ServerConfig load_config(const std::string& path) {
        ServerConfig cfg;
        if (path.empty()) return cfg;

        std::ifstream in(path);
        if (!in.is_open()) return cfg;

        std::string line;
        while (std::getline(in, line)) {
            auto cleaned = trim(line.substr(0, line.find('#')));
            if (cleaned.empty()) continue;

            std::istringstream iss(cleaned);
            std::string key;
            if (!(iss >> key)) continue;

            std::string value;
            std::getline(iss, value);
            value = trim(value);
            if (value.empty()) continue;

            apply_directive(cfg, key, value);
        }
        return cfg;
    }

} // namespace respkv
