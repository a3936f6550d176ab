/**
 * rosgate
 * Command-line front end for the RouterOS connection manager
 */

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/connection_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "protocol/resources.hpp"
#include "storage/config_store.hpp"
#include "transports/transport_factory.hpp"

// Command line argument parsing
#include <getopt.h>

namespace rosgate {

/**
 * Global manager instance for signal handling
 */
std::unique_ptr<core::ConnectionManager> g_manager;

/**
 * Signal handler for graceful shutdown
 */
void signal_handler(int signum) {
    auto logger = core::get_logger("main");
    logger->info("Received signal, disconnecting...",
                core::LogContext().add("signal", signum));

    if (g_manager) {
        g_manager->disconnect();
    }

    exit(130);
}

/**
 * Setup signal handlers
 */
void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);

    // Broken sockets are reported through write errors
    signal(SIGPIPE, SIG_IGN);
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "rosgate - RouterOS connection manager\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] [COMMAND [ARGS...]]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: rosgate.json)\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -H, --host HOST          Router address\n";
    std::cout << "  -u, --user NAME          Router user\n";
    std::cout << "  -p, --password PASS      Router password\n";
    std::cout << "  -P, --port N             API port (default: 8728, or 8729 with --secure)\n";
    std::cout << "  -S, --secure             Use the TLS variants of every method\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Commands:\n";
    std::cout << "  connect                        Connect and print the chosen method (default)\n";
    std::cout << "  status                         Connect and print the connection status\n";
    std::cout << "  resource                       Print /system/resource\n";
    std::cout << "  interfaces                     List interfaces with traffic counters\n";
    std::cout << "  active                         List active hotspot sessions\n";
    std::cout << "  users                          List hotspot users\n";
    std::cout << "  add-user NAME PASSWORD [PROFILE]\n";
    std::cout << "                                 Create a hotspot user\n";
    std::cout << "  remove-user ID                 Delete a hotspot user\n";
    std::cout << "  kick ID                        Disconnect an active hotspot session\n\n";
    std::cout << "Without --host the saved connection is used.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -H 192.168.88.1 -u admin -p secret connect\n";
    std::cout << "  " << program_name << " interfaces\n";
    std::cout << "  " << program_name << " add-user guest1 pass123 1h\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "rosgate v0.1.0" << std::endl;
    std::cout << "Methods: RouterOS API, WebSocket API, HTTP REST API" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = "rosgate.json";
    bool config_given = false;
    int verbosity = 0;
    std::string log_file;
    std::string host;
    std::string user;
    std::string password;
    int port = 0;
    bool secure = false;
    bool help = false;
    bool version = false;
    std::string command = "connect";
    std::vector<std::string> command_args;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",   required_argument, 0, 'c'},
        {"verbose",  no_argument,       0, 'v'},
        {"log-file", required_argument, 0, 'l'},
        {"host",     required_argument, 0, 'H'},
        {"user",     required_argument, 0, 'u'},
        {"password", required_argument, 0, 'p'},
        {"port",     required_argument, 0, 'P'},
        {"secure",   no_argument,       0, 'S'},
        {"help",     no_argument,       0, 'h'},
        {"version",  no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:H:u:p:P:Sh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                args.config_given = true;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'H':
                args.host = optarg;
                break;
            case 'u':
                args.user = optarg;
                break;
            case 'p':
                args.password = optarg;
                break;
            case 'P':
                args.port = std::stoi(optarg);
                break;
            case 'S':
                args.secure = true;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 9) { // --version
                    args.version = true;
                }
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    if (optind < argc) {
        args.command = argv[optind++];
    }
    while (optind < argc) {
        args.command_args.push_back(argv[optind++]);
    }

    return args;
}

/**
 * Load the configuration file; a missing default file yields defaults
 */
std::unique_ptr<core::GatewayConfig> load_config(const Arguments& args) {
    std::ifstream config_stream(args.config_file);
    if (!config_stream.is_open() && !args.config_given) {
        return core::GatewayConfig::create_default();
    }
    return core::GatewayConfig::from_file(args.config_file);
}

/**
 * Number of positional arguments each command takes
 */
bool check_command_args(const Arguments& args) {
    const std::string& cmd = args.command;
    size_t n = args.command_args.size();

    if (cmd == "connect" || cmd == "status" || cmd == "resource" || cmd == "interfaces" || cmd == "active" || cmd == "users") {
        return n == 0;
    }
    if (cmd == "add-user") {
        return n == 2 || n == 3;
    }
    if (cmd == "remove-user" || cmd == "kick") {
        return n == 1;
    }
    return false;
}

void print_error(const core::RouterOsError& e) {
    nlohmann::json j{
        {"error", e.what()},
        {"code", core::to_string(e.code())},
        {"remediation", core::remediation_step(e.code())}};
    std::cout << j.dump(2) << std::endl;
}

/**
 * Run one command against the connected router
 */
nlohmann::json run_command(core::ConnectionManager& manager, const Arguments& args) {
    const std::string& cmd = args.command;

    if (cmd == "status") {
        return manager.get_status().to_json();
    }
    if (cmd == "resource") {
        return manager.system_resource().get().to_json();
    }
    if (cmd == "interfaces") {
        return protocol::records_to_json(manager.interfaces().get());
    }
    if (cmd == "active") {
        return protocol::records_to_json(manager.hotspot_active().get());
    }
    if (cmd == "users") {
        return protocol::records_to_json(manager.hotspot_users().get());
    }
    if (cmd == "add-user") {
        std::string profile = args.command_args.size() > 2 ? args.command_args[2] : "default";
        std::string id = manager.add_hotspot_user(args.command_args[0], args.command_args[1], profile).get();
        return nlohmann::json{{"created", args.command_args[0]}, {"id", id}};
    }
    if (cmd == "remove-user") {
        manager.remove_hotspot_user(args.command_args[0]).get();
        return nlohmann::json{{"removed", args.command_args[0]}};
    }
    if (cmd == "kick") {
        manager.disconnect_active_user(args.command_args[0]).get();
        return nlohmann::json{{"disconnected", args.command_args[0]}};
    }
    throw std::invalid_argument("Unknown command: " + cmd);
}

} // namespace rosgate

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace rosgate;

    try {
        // Parse command line arguments
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        if (!check_command_args(args)) {
            std::cerr << "Invalid command: " << args.command << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        // Load configuration
        std::unique_ptr<core::GatewayConfig> config;
        try {
            config = load_config(args);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration " << args.config_file << ": " << e.what() << std::endl;
            return 1;
        }

        // Setup logging
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        } else if (!config->logging.log_level.empty()) {
            log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        }

        std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
        core::setup_logging(log_level, log_file, log_file.empty());
        auto logger = core::get_logger("main");

        // Validate configuration
        if (!config->validate()) {
            logger->error("Configuration validation failed");
            return 1;
        }

        std::shared_ptr<storage::ConfigStore> store;
        try {
            store = storage::make_config_store(config->storage.backend, config->storage.path);
        } catch (const std::exception& e) {
            logger->error("Failed to open connection store",
                         core::LogContext().add("backend", config->storage.backend)
                                          .add("path", config->storage.path)
                                          .add("error", e.what()));
            return 1;
        }

        setup_signal_handlers();

        auto options = config->session_options();
        g_manager = std::make_unique<core::ConnectionManager>(
            std::make_shared<transports::DefaultTransportFactory>(options.command_timeout),
            options,
            config->method_priority());
        g_manager->set_config_store(store);

        // Pick the router: command line, then config file, then the saved connection
        core::ConnectResult result;
        if (!args.host.empty()) {
            result = g_manager->connect(args.host, args.user, args.password,
                                        static_cast<uint16_t>(args.port), args.secure);
        } else if (config->router) {
            result = g_manager->connect(*config->router);
        } else {
            result = g_manager->reconnect();
        }

        if (!result.success) {
            std::cout << result.to_json().dump(2) << std::endl;
            g_manager.reset();
            return 2;
        }

        if (args.command == "connect") {
            std::cout << result.to_json().dump(2) << std::endl;
            g_manager->disconnect();
            return 0;
        }

        int status = 0;
        try {
            std::cout << run_command(*g_manager, args).dump(2) << std::endl;
        } catch (const core::RouterOsError& e) {
            logger->error("Command failed",
                         core::LogContext().add("command", args.command).add("error", e.what()));
            print_error(e);
            status = 3;
        }

        logger->debug("Dispatcher statistics",
                      core::LogContext().add("submitted", g_manager->get_statistics().submitted));

        g_manager->disconnect();
        g_manager.reset();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
