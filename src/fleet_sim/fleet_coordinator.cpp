#include "fleet_sim/fleet_coordinator.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include "fleet_sim/logging.hpp"

namespace fleet_sim {

namespace {
constexpr std::uint64_t k_device_seed_stride{1'000}; /**< Seed spacing so seeded devices never share a sequence. */
}  // namespace

std::string make_device_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

FleetCoordinator::FleetCoordinator(FleetConfig config,
                                   TransportFactory transport_factory,
                                   EventSink& event_sink,
                                   const Clock& clock,
                                   SourceFactory source_factory)
    : config_(std::move(config)),
      transport_factory_(std::move(transport_factory)),
      source_factory_(std::move(source_factory)),
      event_sink_(event_sink),
      clock_(clock),
      logger_(get_logger()) {
    if (!transport_factory_ || !source_factory_) {
        throw std::invalid_argument("FleetCoordinator requires transport and source factories");
    }
}

FleetCoordinator::~FleetCoordinator() {
    shutdown();
}

void FleetCoordinator::start() {
    if (flag_started_) {
        throw std::logic_error("Fleet already started");
    }
    flag_started_ = true;
    logger_->info("Starting fleet of {} devices (capacity {}, priority {})",
                  config_.device_count,
                  config_.device.buffer_capacity,
                  config_.device.priority_policy.to_string());

    list_workers_.reserve(config_.device_count);
    for (std::size_t index = 0; index < config_.device_count; ++index) {
        DeviceIdentity identity{make_device_id(), config_.device.firmware_version};
        DeviceConfig device_config = config_.device;
        if (device_config.random_seed.has_value()) {
            *device_config.random_seed += index * k_device_seed_stride;
        }

        MessageGeneratorList generators = make_device_generators(identity, device_config, source_factory_);
        MessageTransportPtr transport = transport_factory_(identity.device_id);
        auto worker = std::make_unique<DeviceWorker>(
            std::move(identity),
            device_config.write_interval,
            device_config.buffer_capacity,
            std::move(generators),
            std::move(transport),
            event_sink_,
            clock_,
            [this](const std::string& device_id, const std::string& reason) {
                handle_worker_terminated(device_id, reason);
            },
            device_config.outbox_capacity
        );
        worker->start();
        list_workers_.push_back(std::move(worker));

        if (index + 1 < config_.device_count && config_.startup_stagger > Duration::zero()) {
            std::this_thread::sleep_for(config_.startup_stagger);
        }
    }
}

void FleetCoordinator::shutdown() {
    if (!flag_started_ || flag_shut_down_) {
        return;
    }
    flag_shut_down_ = true;
    logger_->info("Shutting down fleet");
    for (const DeviceWorkerPtr& worker : list_workers_) {
        worker->stop();
    }
    const WorkerStats totals = aggregate_stats();
    logger_->info(
        R"({{"component":"fleet","event":"shutdown","generated":{},"retained":{},"dropped":{},"sent":{},"send_failed":{},"discarded":{}}})",
        totals.generated,
        totals.retained,
        totals.dropped,
        totals.sent,
        totals.send_failed,
        totals.discarded
    );
}

const FleetConfig& FleetCoordinator::config() const noexcept {
    return config_;
}

const std::vector<DeviceWorkerPtr>& FleetCoordinator::workers() const noexcept {
    return list_workers_;
}

std::size_t FleetCoordinator::running_count() const {
    return static_cast<std::size_t>(std::count_if(list_workers_.begin(), list_workers_.end(), [](const DeviceWorkerPtr& worker) {
        return worker->state() == WorkerState::Running;
    }));
}

std::size_t FleetCoordinator::terminated_count() const noexcept {
    return terminated_count_.load();
}

WorkerStats FleetCoordinator::aggregate_stats() const {
    WorkerStats totals{};
    for (const DeviceWorkerPtr& worker : list_workers_) {
        totals += worker->stats();
    }
    return totals;
}

void FleetCoordinator::handle_worker_terminated(const std::string& device_id, const std::string& reason) {
    ++terminated_count_;
    logger_->warn(
        R"({{"component":"fleet","event":"worker_terminated","device":"{}","reason":"{}"}})",
        device_id,
        reason
    );
}

}  // namespace fleet_sim
