// speakerlinkMain.cpp - speakerlinkd: connection supervision and grouping for a set of networked speakers.
#include "ConsoleCommands.hpp"
#include "SpeakerLinkOptions.hpp"
#include "client/ClientFactory.hpp"
#include "client/SimulatedNetwork.hpp"
#include "device/DeviceHandle.hpp"
#include "group/GroupCoordinator.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace SpeakerLink;

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

// Signal handler for graceful shutdown
static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

static void run_console(GroupCoordinator& coordinator,
                        std::shared_ptr<SimulatedNetwork> network,
                        std::shared_ptr<Logger> logger) {
    ConsoleCommands console(coordinator, std::move(network), std::cout, logger);
    std::cout << "speakerlinkd interactive mode (help for commands)" << std::endl;
    std::string line;
    while (!shutdown_requested.load(std::memory_order_relaxed)) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (!console.execute(line)) break;
    }
}

static void wait_for_signal() {
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);
    while (!shutdown_requested.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("speakerlinkd");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    std::vector<std::shared_ptr<DeviceHandle>> handles;
    auto& coordinator = GroupCoordinator::instance();

    try {

        // --- Stage 2: Parse CLI/JSON options ---

        // Options auto-register via static objects; parse command line and JSON config once.
        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }

        LinkSettings settings;
        try {
            settings = link_opts::current_settings();
        } catch (const std::invalid_argument& e) {
            logger->error(std::string("Invalid configuration: ") + e.what());
            return 2;
        }

        stdout_sink->set_level(settings.log_level);
        if (settings.log_file) {
            auto file_sink = std::make_shared<FileSink>(*settings.log_file);
            file_sink->set_level(settings.log_level);
            logger->add_sink(file_sink);
        }
        if (settings.speakers.empty()) {
            logger->error("No speakers configured (use --speaker id=host[:port] or a config file)");
            return 2;
        }

        // --- Stage 3: Bring up devices ---
        logger->info("speakerlinkd starting with " + std::to_string(settings.speakers.size()) + " speaker(s)");

        ClientFactory::set_default_client_type(settings.client);
        coordinator.configure(settings.grouping, logger);

        for (const auto& cfg : settings.speakers) {
            auto client = ClientFactory::create_client({cfg.id, cfg.host, cfg.port}, cfg.name, logger);
            auto handle = std::make_shared<DeviceHandle>(cfg, std::move(client), settings.reconnect, settings.health, logger);
            try {
                handle->connect();
            } catch (const std::system_error& e) {
                // Keep the speaker; the monitor thread reconnects it in the background.
                logger->warning("Speaker " + cfg.id + " not reachable at startup: " + e.what());
                handle->supervisor().request_reconnect();
            }
            coordinator.register_device(cfg.id, handle);
            handle->start_monitoring();
            handles.push_back(std::move(handle));
        }

        // --- Stage 4: Serve until asked to stop ---
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        if (settings.interactive) {
            auto network = settings.client == ClientType::Simulated ? SimulatedNetwork::shared() : nullptr;
            run_console(coordinator, std::move(network), logger);
        } else {
            wait_for_signal();
        }

    } catch (const std::exception& e) {
        logger->error("Exception in speakerlinkd main loop: " + std::string(e.what()));
        coordinator.shutdown();
        for (auto& handle : handles) handle->shutdown();
        return 1;
    }

    // --- Stage 5: Orderly shutdown ---
    logger->info("Shutting down speakers...");
    coordinator.shutdown();
    for (auto& handle : handles) {
        coordinator.unregister_device(handle->id());
        handle->shutdown();
    }
    logger->info("speakerlinkd shut down successfully");

    return 0;
}
