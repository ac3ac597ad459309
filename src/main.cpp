#include "sentinel/config.hpp"
#include "sentinel/control_surface.hpp"
#include "sentinel/errors.hpp"
#include "sentinel/http_server.hpp"
#include "sentinel/logging.hpp"
#include "sentinel/market_session.hpp"
#include "sentinel/paper.hpp"
#include "sentinel/scheduler.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

namespace {

std::atomic<int> g_signal{0};

void signal_handler(int signal) {
    g_signal = signal;
}

struct Options {
    std::string config = "config.json";
    std::string candidates = "qualified_stocks.json";
    std::string audit_log = "sentinel_audit.jsonl";
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " --config <path> [--candidates <path>] [--audit-log <path>]\n";
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << arg << "\n";
            return std::nullopt;
        }
        if (arg == "--config") {
            options.config = argv[++i];
        } else if (arg == "--candidates") {
            options.candidates = argv[++i];
        } else if (arg == "--audit-log") {
            options.audit_log = argv[++i];
        } else {
            std::cerr << "unknown option " << arg << "\n";
            return std::nullopt;
        }
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    spdlog::info("Starting Sentinel autonomous control core");
    spdlog::info("=========================================");

    std::shared_ptr<const sentinel::Config> config;
    try {
        config = std::make_shared<const sentinel::Config>(sentinel::load_config(options->config));
        sentinel::configure_logging(config->logging);
        auto credentials = sentinel::resolve_credentials(*config);
        spdlog::info("Loaded {} with credentials for {} accounts", options->config, credentials.size());
    } catch (const sentinel::ConfigError& e) {
        spdlog::critical("Startup failed: {}", e.what());
        return 1;
    }

    try {
        sentinel::SystemClock clock;
        sentinel::ConnectivityTracker tracker;
        sentinel::EmergencyStopChannel channel;

        auto prices = std::make_shared<sentinel::PriceBook>();
        sentinel::Collaborators collaborators;
        collaborators.broker = std::make_shared<sentinel::PaperBroker>(prices, *config);
        collaborators.candidates = std::make_shared<sentinel::FileCandidateSource>(options->candidates, prices);
        collaborators.persistence = std::make_shared<sentinel::JsonlPersistence>(options->audit_log);
        collaborators.notifications = std::make_shared<sentinel::LogNotifier>();
        collaborators.strategy = std::make_shared<sentinel::ThresholdStrategy>(config->strategy);
        collaborators.calendar = std::make_shared<sentinel::StaticCalendar>(config->market_session);

        sentinel::ControlSurface surface(config, tracker, clock, channel);
        sentinel::ModeScheduler scheduler(config, collaborators, clock, tracker, surface, channel);

        std::unique_ptr<sentinel::HttpServer> http;
        if (config->monitoring.enable_http_endpoint) {
            http = std::make_unique<sentinel::HttpServer>(surface);
            if (!http->start(config->monitoring.http_host, config->monitoring.http_port)) {
                spdlog::error("Failed to start HTTP server");
                return 1;
            }
            spdlog::info("Health check: http://localhost:{}/health", config->monitoring.http_port);
        }

        std::atomic<bool> finished{false};
        bool scheduler_failed = false;
        std::thread loop([&] {
            try {
                scheduler.run();
            } catch (const std::exception& e) {
                spdlog::critical("Scheduler terminated: {}", e.what());
                scheduler_failed = true;
            }
            finished = true;
        });

        while (!finished) {
            if (int signal = g_signal.exchange(0)) {
                spdlog::info("Received signal {}, shutting down...", signal);
                surface.trigger_emergency_stop("signal " + std::to_string(signal), sentinel::StopOrigin::Signal);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        loop.join();

        if (http) {
            http->stop();
        }
        return scheduler_failed ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
