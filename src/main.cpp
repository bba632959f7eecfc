/**
 * humibridge
 * Serves the Smart Humigadget call-in surface as newline-delimited JSON on stdin/stdout
 */

#include <iostream>
#include <csignal>
#include <unistd.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <sys/stat.h>

#include "ble/ble_backend.hpp"
#include "core/config.hpp"
#include "core/host_system.hpp"
#include "core/logger.hpp"
#include "services/call_dispatcher.hpp"
#include "services/gadget_service.hpp"
#include "services/request_runner.hpp"

// Command line argument parsing
#include <getopt.h>

namespace humibridge {

const char* DEFAULT_CONFIG_FILE = "bridge_config.json";

std::atomic<bool> g_stop_requested{false};

/**
 * Signal handler for graceful shutdown. Closing stdin ends the request loop.
 */
void signal_handler(int) {
    g_stop_requested.store(true);
    close(STDIN_FILENO);
}

void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "humibridge - Smart Humigadget BLE bridge\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Requests are read from stdin, one JSON object per line:\n";
    std::cout << "  {\"id\": 1, \"method\": \"connectGadget\", \"params\": {\"mac_address\": \"aa:bb:cc:dd:ee:ff\"}}\n";
    std::cout << "Responses and events are written to stdout, logs to stderr.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: bridge_config.json)\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Also log to FILE\n";
    std::cout << "  -i, --interface N        Bluetooth adapter index (0 means hci0)\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "                          # Run with default config\n";
    std::cout << "  " << program_name << " -c custom_config.json    # Use custom configuration\n";
    std::cout << "  " << program_name << " -vv -i 1                 # Debug logging on hci1\n";
    std::cout << std::endl;
}

void print_version() {
    std::cout << "humibridge v0.1.0" << std::endl;
    std::cout << "Built for Linux/Raspberry Pi OS" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = DEFAULT_CONFIG_FILE;
    bool config_given = false;
    int verbosity = 0;
    std::string log_file;
    int interface = -1;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"verbose",   no_argument,       0, 'v'},
        {"log-file",  required_argument, 0, 'l'},
        {"interface", required_argument, 0, 'i'},
        {"help",      no_argument,       0, 'h'},
        {"version",   no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:i:h", long_options, &option_index)) != -1) {
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
            case 'i':
                args.interface = std::stoi(optarg);
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 5) { // --version
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

    return args;
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

std::unique_ptr<core::BridgeConfig> load_config(const Arguments& args) {
    if (!args.config_given && !file_exists(args.config_file)) {
        return core::BridgeConfig::create_default();
    }
    return core::BridgeConfig::from_file(args.config_file);
}

/**
 * Serialises everything written to stdout
 */
class ResponseWriter {
public:
    void write(const nlohmann::json& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << message.dump() << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace humibridge

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace humibridge;

    try {
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Load configuration
        std::unique_ptr<core::BridgeConfig> config;
        try {
            config = load_config(args);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration " << args.config_file << ": " << e.what() << std::endl;
            return 1;
        }

        // Apply command-line overrides
        if (args.interface >= 0) {
            config->ble.adapter_index = args.interface;
        }
        if (!args.log_file.empty()) {
            config->logging.log_file = args.log_file;
        }

        // Setup logging, stdout is reserved for responses
        core::LoggingOptions logging;
        logging.level = core::LoggerManager::string_to_level(config->logging.log_level);
        if (args.verbosity == 1) {
            logging.level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            logging.level = core::LogLevel::DEBUG;
        }
        logging.log_file = config->logging.log_file;
        logging.console_target = core::ConsoleTarget::STDERR_ONLY;
        core::setup_logging(logging);
        auto logger = core::get_logger("main");

        // Validate configuration
        auto problem = config->validate();
        if (!problem.empty()) {
            logger->error("Configuration validation failed", core::LogContext().add("error", problem));
            return 1;
        }

        setup_signal_handlers();

        logger->info("Starting humibridge",
                     core::LogContext().add("config_file", args.config_file)
                                       .add("adapter_index", config->ble.adapter_index));

        auto backend = ble::create_simpleble_backend(*config);
        if (!backend) {
            logger->error("Failed to initialize BLE backend",
                          core::LogContext().add("adapter_index", config->ble.adapter_index));
            return 1;
        }
        core::SystemHostClock host_clock;
        services::GadgetService service(*backend, host_clock, *config);
        services::CallDispatcher dispatcher(service);
        ResponseWriter writer;

        service.set_notification_observer([&writer](const gadget::NotificationEvent& event) {
            writer.write(services::CallDispatcher::notification_event(event));
        });
        service.set_connection_observer([&writer](const gadget::ConnectionEvent& event) {
            writer.write(services::CallDispatcher::connection_event(event));
        });

        // One thread per call so that cancelFetch can reach a running fetchLoggedData
        services::RequestRunner runner;
        std::string line;
        while (!g_stop_requested.load() && !dispatcher.shutdown_requested() && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            runner.submit([&dispatcher, &writer, line]() {
                writer.write(dispatcher.handle_line(line));
                if (dispatcher.shutdown_requested()) {
                    close(STDIN_FILENO);
                }
            });
        }

        logger->info("Request loop finished, shutting down");
        service.shutdown_service();
        runner.join_all();

        service.set_notification_observer(nullptr);
        service.set_connection_observer(nullptr);
        logger->info("humibridge stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
