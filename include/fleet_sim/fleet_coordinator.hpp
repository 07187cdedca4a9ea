// === Fleet Coordinator =======================================================
//
// Spawns N independent device workers from one configuration template and
// owns their lifetime. Workers share nothing mutable: each gets its own
// transport from the factory and its own buffer, timers, and threads.

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "fleet_sim/clock.hpp"
#include "fleet_sim/device_worker.hpp"
#include "fleet_sim/event_sink.hpp"
#include "fleet_sim/transport.hpp"

namespace fleet_sim {

/**
 * @brief Template applied uniformly to every device in the fleet.
 */
struct FleetConfig final {
    std::size_t device_count{3};           /**< Number of simulated devices. */
    DeviceConfig device{};                 /**< Per-device intervals, capacity, policy. */
    Duration startup_stagger{Duration{20}}; /**< Delay between consecutive device starts. */
};

/** @brief Creates the transport owned by the device named @p device_id. */
using TransportFactory = std::function<MessageTransportPtr(const std::string& device_id)>;

/** @brief Runs a fleet of device workers concurrently. */
class FleetCoordinator final {
  public:
    FleetCoordinator(FleetConfig config,
                     TransportFactory transport_factory,
                     EventSink& event_sink,
                     const Clock& clock,
                     SourceFactory source_factory = make_random_source);
    ~FleetCoordinator();

    FleetCoordinator(const FleetCoordinator&) = delete;
    FleetCoordinator& operator=(const FleetCoordinator&) = delete;

    /**
     * @brief Create and start every worker, staggering the starts.
     * @throws std::logic_error when called twice.
     */
    void start();
    /** @brief Signal every worker to stop and wait until all have quiesced. Idempotent. */
    void shutdown();

    [[nodiscard]] const FleetConfig& config() const noexcept;
    [[nodiscard]] const std::vector<DeviceWorkerPtr>& workers() const noexcept;
    /** @brief Workers currently in the Running state. */
    [[nodiscard]] std::size_t running_count() const;
    /** @brief Workers that stopped because of a generation fault. */
    [[nodiscard]] std::size_t terminated_count() const noexcept;
    /** @brief Sum of every worker's counters. */
    [[nodiscard]] WorkerStats aggregate_stats() const;

  private:
    void handle_worker_terminated(const std::string& device_id, const std::string& reason);

    FleetConfig config_;
    TransportFactory transport_factory_;
    SourceFactory source_factory_;
    EventSink& event_sink_;
    const Clock& clock_;
    std::vector<DeviceWorkerPtr> list_workers_;
    bool flag_started_{false};
    bool flag_shut_down_{false};
    std::atomic<std::size_t> terminated_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Random UUID used as a device identifier. */
[[nodiscard]] std::string make_device_id();

}  // namespace fleet_sim
