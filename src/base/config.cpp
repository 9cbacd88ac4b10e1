#include "minidisc/base/config.h"
#include "minidisc/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace minidisc {

namespace {

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, std::map<std::string, std::map<std::string, std::string>>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section] = {};
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    std::map<std::string, std::map<std::string, std::string>> sections;
    parse_ini_file(path, sections);

    try {
        apply_sections(sections);
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file " + path + ": " + e.what());
        return false;
    }

    Logger::instance().info("Config loaded successfully from: " + path);
    return true;
}

void Config::apply_sections(const std::map<std::string, std::map<std::string, std::string>>& sections) {
    auto section = [&sections](const std::string& name) -> const std::map<std::string, std::string>* {
        auto it = sections.find(name);
        return it == sections.end() ? nullptr : &it->second;
    };

    if (auto* s = section("log")) {
        if (s->count("level")) config_.log.level = s->at("level");
        if (s->count("output")) config_.log.output = s->at("output");
        if (s->count("file_path")) config_.log.file_path = s->at("file_path");
    }

    if (auto* s = section("registry")) {
        if (s->count("discovery_port")) {
            config_.registry.discovery_port = static_cast<uint16_t>(std::stoi(s->at("discovery_port")));
            config_.discovery.discovery_port = config_.registry.discovery_port;
        }
        if (s->count("retry_backoff_ms")) config_.registry.retry_backoff_ms = std::stoul(s->at("retry_backoff_ms"));
        if (s->count("leader_probe_interval_ms")) config_.registry.leader_probe_interval_ms = std::stoul(s->at("leader_probe_interval_ms"));
        if (s->count("leader_probe_timeout_ms")) config_.registry.leader_probe_timeout_ms = std::stoul(s->at("leader_probe_timeout_ms"));
        if (s->count("registration_timeout_ms")) config_.registry.registration_timeout_ms = std::stoul(s->at("registration_timeout_ms"));
        if (s->count("delegate_fetch_timeout_ms")) config_.registry.delegate_fetch_timeout_ms = std::stoul(s->at("delegate_fetch_timeout_ms"));
        if (s->count("drain_timeout_ms")) config_.registry.drain_timeout_ms = std::stoul(s->at("drain_timeout_ms"));
        if (s->count("worker_threads")) config_.registry.worker_threads = std::stoul(s->at("worker_threads"));
    }

    if (auto* s = section("discovery")) {
        if (s->count("fetch_timeout_ms")) config_.discovery.fetch_timeout_ms = std::stoul(s->at("fetch_timeout_ms"));
    }

    if (auto* s = section("address_source")) {
        if (s->count("type")) config_.address_source.type = s->at("type");
        if (s->count("tailscale_socket")) config_.address_source.tailscale_socket = s->at("tailscale_socket");
        if (s->count("status_timeout_ms")) config_.address_source.status_timeout_ms = std::stoul(s->at("status_timeout_ms"));
        if (s->count("local_address")) config_.address_source.local_address = s->at("local_address");
        if (s->count("peer_addresses")) config_.address_source.peer_addresses = split_list(s->at("peer_addresses"));
    }
}

bool Config::load_from_env() {
    if (const char* val = std::getenv("MINIDISC_LOG_LEVEL")) {
        config_.log.level = val;
    }
    if (const char* val = std::getenv("MINIDISC_LOG_FILE")) {
        config_.log.file_path = val;
        config_.log.output = "file";
    }

    try {
        if (const char* val = std::getenv("MINIDISC_DISCOVERY_PORT")) {
            config_.registry.discovery_port = static_cast<uint16_t>(std::stoi(val));
            config_.discovery.discovery_port = config_.registry.discovery_port;
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid MINIDISC_DISCOVERY_PORT: " + std::string(e.what()));
        return false;
    }

    if (const char* val = std::getenv("MINIDISC_ADDRESS_SOURCE")) {
        config_.address_source.type = val;
    }
    if (const char* val = std::getenv("MINIDISC_TAILSCALE_SOCKET")) {
        config_.address_source.tailscale_socket = val;
    }
    if (const char* val = std::getenv("MINIDISC_LOCAL_ADDRESS")) {
        config_.address_source.local_address = val;
    }
    if (const char* val = std::getenv("MINIDISC_PEERS")) {
        config_.address_source.peer_addresses = split_list(val);
    }
    return true;
}

std::string& Config::register_options(CLI::App& app) {
    app.add_option("-c,--config", cmdline_config_file_, "Path to configuration file");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Registry / discovery options
    app.add_option("--discovery-port", config_.registry.discovery_port, "Well-known discovery port");
    app.add_option("--fetch-timeout", config_.discovery.fetch_timeout_ms, "Per-peer fetch timeout (ms)");

    // Address source options
    app.add_option("--address-source", config_.address_source.type, "Address source (tailscale, static)");
    app.add_option("--tailscale-socket", config_.address_source.tailscale_socket, "tailscaled unix socket path");
    app.add_option("--local-address", config_.address_source.local_address, "Local address (static source)");
    app.add_option("--peer", config_.address_source.peer_addresses, "Peer address (static source, repeatable)");

    return cmdline_config_file_;
}

bool Config::finalize_command_line() {
    if (!cmdline_config_file_.empty() && !load_from_file(cmdline_config_file_)) {
        return false;
    }
    config_.discovery.discovery_port = config_.registry.discovery_port;
    return true;
}

void Config::apply_log_config() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.log.level));

    if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else if (config_.log.output == "stdout") {
        logger.set_output(LogOutput::Stdout);
    } else {
        logger.set_output(LogOutput::Stderr);
    }
}

bool Config::validate() const {
    if (config_.registry.discovery_port == 0 || config_.discovery.discovery_port == 0) {
        Logger::instance().error("discovery_port must be set");
        return false;
    }
    if (config_.registry.leader_probe_interval_ms == 0 ||
        config_.registry.leader_probe_timeout_ms == 0 ||
        config_.registry.registration_timeout_ms == 0 ||
        config_.discovery.fetch_timeout_ms == 0) {
        Logger::instance().error("registry and discovery timeouts must be non-zero");
        return false;
    }
    if (config_.address_source.type != "tailscale" && config_.address_source.type != "static") {
        Logger::instance().error("Unknown address source: " + config_.address_source.type);
        return false;
    }
    if (config_.address_source.type == "static" && config_.address_source.local_address.empty()) {
        Logger::instance().error("static address source requires local_address");
        return false;
    }
    return true;
}

void Config::print() const {
    auto& logger = Logger::instance();
    logger.debug("=== Configuration ===");
    logger.debug("Log Level: " + config_.log.level);
    logger.debug("Discovery Port: " + std::to_string(config_.registry.discovery_port));
    logger.debug("Fetch Timeout: " + std::to_string(config_.discovery.fetch_timeout_ms) + " ms");
    logger.debug("Address Source: " + config_.address_source.type);
    if (!config_file_.empty()) {
        logger.debug("Config File: " + config_file_);
    }
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
    cmdline_config_file_.clear();
}

} // namespace minidisc
