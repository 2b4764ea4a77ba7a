#include "smtp_server.hpp"
#include "http_server.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "storage/mail_store.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int /* signal */) {
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/mailcatch/mailcatch.conf";

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "mailcatch v1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration
    auto& config = mailcatch::Config::instance();
    bool config_loaded = config.load(config_file);

    // Initialize logger
    const auto& log = config.log();
    mailcatch::Logger::instance().init(log.level, log.log_to_console, log.file,
                                       log.max_file_size, log.max_files);

    LOG_INFO("mailcatch starting...");
    if (!config_loaded) {
        LOG_WARNING_FMT("Could not load config file: {}, using defaults", config_file);
    }

    if (config.http().access_key.empty()) {
        LOG_FATAL("No access key configured ([http] access_key)");
        return 1;
    }

    // Open the mail store
    auto store = std::make_shared<mailcatch::MailStore>(config.storage().path);
    if (!store->initialize()) {
        LOG_FATAL_FMT("Failed to open mail store: {}", store->last_error());
        return 1;
    }

    mailcatch::smtp::SMTPServer smtp_server(config.smtp(), store);
    mailcatch::http::HTTPServer http_server(config.http(), store);

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Start servers
    try {
        smtp_server.start();
        http_server.start();
        LOG_INFO("mailcatch started successfully");

        // Wait for shutdown signal
        while (g_running && smtp_server.is_running() && http_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } catch (const std::exception& e) {
        LOG_FATAL_FMT("Server error: {}", e.what());
        return 1;
    }

    LOG_INFO("Shutting down...");
    http_server.stop();
    smtp_server.stop();

    LOG_INFO("mailcatch shutdown complete");
    return 0;
}
