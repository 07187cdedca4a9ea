#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "fleet_sim/clock.hpp"
#include "fleet_sim/configuration.hpp"
#include "fleet_sim/event_sink.hpp"
#include "fleet_sim/file_replayer.hpp"
#include "fleet_sim/fleet_coordinator.hpp"
#include "fleet_sim/http_transport.hpp"
#include "fleet_sim/logging.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

void run_fleet(const fleet_sim::Configuration& configuration) {
    using namespace fleet_sim;

    SystemClock clock;
    LoggingEventSink event_sink;
    const HttpEndpoint endpoint = configuration.endpoint;
    FleetCoordinator coordinator{
        configuration.fleet,
        [endpoint](const std::string&) -> MessageTransportPtr { return std::make_unique<HttpTransport>(endpoint); },
        event_sink,
        clock};
    coordinator.start();

    while (!should_terminate.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    coordinator.shutdown();
}

void run_replay(const fleet_sim::Configuration& configuration) {
    using namespace fleet_sim;

    LoggingEventSink event_sink;
    HttpTransport transport{configuration.endpoint};
    FileReplayer replayer{configuration.replay.file, configuration.replay.interval, transport, event_sink};
    static_cast<void>(replayer.run(should_terminate));
}
}  // namespace

int main() {
    using namespace fleet_sim;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        if (configuration.mode == RunMode::Replay) {
            run_replay(configuration);
        } else {
            run_fleet(configuration);
        }
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
