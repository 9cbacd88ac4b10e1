#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include "CLI/CLI.hpp"
#include "minidisc/base/config.h"
#include "minidisc/base/error_code.h"
#include "minidisc/base/logger.h"
#include "minidisc/discovery/address_source.h"
#include "minidisc/discovery/discovery_client.h"
#include "minidisc/registry/registry.h"

using namespace minidisc;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

// Usage errors exit with 2, runtime failures with 1.
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int cmd_list() {
    const auto& config = Config::instance().get();
    DiscoveryClient client(make_address_source(config.address_source), config.discovery,
                           std::make_shared<GlobalLogSink>());

    std::vector<Service> services = client.list_services();
    if (services.empty()) {
        std::cerr << "No advertised services found" << std::endl;
        return 0;
    }

    size_t name_width = 0;
    size_t addr_width = 0;
    for (const auto& s : services) {
        name_width = std::max(name_width, s.name.size());
        addr_width = std::max(addr_width, s.addr_port.to_string().size());
    }
    for (const auto& s : services) {
        fmt::print("* {:<{}}   {:<{}}   {}\n", s.name, name_width, s.addr_port.to_string(), addr_width,
                   format_labels(s.labels));
    }
    return 0;
}

int cmd_find(const std::vector<std::string>& params) {
    const std::string& name = params.front();
    Labels labels;
    for (auto it = std::next(params.begin()); it != params.end(); ++it) {
        size_t eq = it->find('=');
        if (eq == std::string::npos) {
            std::cerr << "Cannot parse label '" << *it << "'" << std::endl;
            return kExitUsage;
        }
        labels[it->substr(0, eq)] = it->substr(eq + 1);
    }

    const auto& config = Config::instance().get();
    DiscoveryClient client(make_address_source(config.address_source), config.discovery,
                           std::make_shared<GlobalLogSink>());
    try {
        std::cout << client.find_service(name, labels).to_string() << std::endl;
    } catch (const MinidiscError& e) {
        if (e.code() != ErrorCode::NoMatch) {
            throw;
        }
        std::cerr << e.what() << std::endl;
        return kExitFailure;
    }
    return 0;
}

int cmd_advertise(const std::string& path) {
    std::string data;
    if (path == "-") {
        data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Can't read '" << path << "'" << std::endl;
            return kExitUsage;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        data = buffer.str();
    }

    std::vector<Service> services;
    try {
        services = decode_services(data);
    } catch (const MinidiscError& e) {
        std::cerr << "Error parsing service file: " << e.what() << std::endl;
        return kExitUsage;
    }

    const auto& config = Config::instance().get();
    auto registry = Registry::start(config.registry, make_address_source(config.address_source),
                                    std::make_shared<GlobalLogSink>());

    for (const auto& s : services) {
        // Other private-network hosts are advertised on their behalf;
        // anything else is taken to be a port on this host.
        if (s.addr_port.address != registry->local_address() && is_member_address(s.addr_port.address)) {
            registry->advertise_remote_service(s.addr_port, s.name, s.labels);
        } else {
            registry->advertise_service(s.addr_port.port, s.name, s.labels);
        }
    }

    Logger::instance().info("Advertising services. Stop by sending SIGINT...");
    while (g_running && registry->state() != RegistryState::Stopped) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (registry->state() == RegistryState::Stopped) {
        registry->wait();
    }
    registry->stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    CLI::App app{"md - miniature service discovery for private networks"};
    app.require_subcommand(1);
    Config::instance().register_options(app);

    auto* list_cmd = app.add_subcommand("list", "Print a list of advertised services on the network");

    std::vector<std::string> find_params;
    auto* find_cmd = app.add_subcommand("find", "Find a service, given name and labels");
    find_cmd->add_option("params", find_params, "<name> [key=val] ...")->required();

    std::string advertise_path;
    auto* advertise_cmd = app.add_subcommand("advertise", "Read services from JSON and advertise them");
    advertise_cmd->add_option("file", advertise_path, "JSON file, or - for stdin")->required();

    auto* help_cmd = app.add_subcommand("help", "This page");

    // Environment first; command line flags override it
    Config::instance().load_from_env();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? 0 : kExitUsage;
    }

    if (help_cmd->parsed()) {
        std::cerr << app.help() << std::endl;
        return 0;
    }

    if (!Config::instance().finalize_command_line() || !Config::instance().validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        return kExitUsage;
    }
    Config::instance().apply_log_config();
    Config::instance().print();

    try {
        if (list_cmd->parsed()) {
            return cmd_list();
        }
        if (find_cmd->parsed()) {
            return cmd_find(find_params);
        }
        if (advertise_cmd->parsed()) {
            return cmd_advertise(advertise_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return kExitFailure;
    }

    return 0;
}
