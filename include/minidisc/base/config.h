#ifndef MINIDISC_BASE_CONFIG_H
#define MINIDISC_BASE_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace minidisc {

// Well-known port every leader registry listens on.
constexpr uint16_t kDefaultDiscoveryPort = 28004;

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stderr";  // stdout, stderr, file
    std::string file_path = "";
};

// Registry (leader/delegate) configuration
struct RegistryConfig {
    uint16_t discovery_port = kDefaultDiscoveryPort;
    uint32_t retry_backoff_ms = 10000;      // wait after a failed delegate registration
    uint32_t leader_probe_interval_ms = 5000;
    uint32_t leader_probe_timeout_ms = 1000;
    uint32_t registration_timeout_ms = 2000;
    uint32_t delegate_fetch_timeout_ms = 2000;
    uint32_t drain_timeout_ms = 5000;
    uint32_t worker_threads = 4;
};

// Discovery client configuration
struct DiscoveryConfig {
    uint16_t discovery_port = kDefaultDiscoveryPort;
    uint32_t fetch_timeout_ms = 2000;
};

// Where the set of online hosts comes from
struct AddressSourceConfig {
    std::string type = "tailscale";  // tailscale, static
    std::string tailscale_socket = "/var/run/tailscale/tailscaled.sock";
    uint32_t status_timeout_ms = 500;
    std::string local_address;            // static only
    std::vector<std::string> peer_addresses;  // static only
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    RegistryConfig registry;
    DiscoveryConfig discovery;
    AddressSourceConfig address_source;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI-style file
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Register command line options that override config values.
    // Returns a reference to the storage of the -c/--config path.
    std::string& register_options(CLI::App& app);

    // Post-parse fixups: loads the config file named on the command line
    // and keeps the registry/discovery ports in sync.
    bool finalize_command_line();

    // Apply the log section to Logger::instance()
    void apply_log_config() const;

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check that timeouts and ports are usable
    bool validate() const;

    // Log the effective configuration at debug level
    void print() const;

    // Restore defaults (tests)
    void reset();

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void apply_sections(const std::map<std::string, std::map<std::string, std::string>>& sections);

    GlobalConfig config_;
    std::string config_file_;
    std::string cmdline_config_file_;
};

} // namespace minidisc

#endif // MINIDISC_BASE_CONFIG_H
