// === Device Worker ===========================================================
//
// Drives one simulated device: its message generators, its priority buffer,
// and the periodic flush that hands retained messages to the transport. A
// running worker owns two threads. The scheduler thread multiplexes every
// generator timer and the flush timer; the sender thread drains retained
// batches into the transport so that network latency never delays a tick.
//
// The hand-off between the two is bounded: when the sender falls behind, the
// oldest flushed batch is discarded and reported. `stop()` abandons batches the
// sender has not started, so shutdown never waits out a network backlog.
//
// `poll()` and `deliver_pending()` expose the same steps synchronously so the
// worker can be driven deterministically from a ManualClock.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <spdlog/logger.h>

#include "fleet_sim/clock.hpp"
#include "fleet_sim/dispatch_queue.hpp"
#include "fleet_sim/event_sink.hpp"
#include "fleet_sim/message_generator.hpp"
#include "fleet_sim/priority_buffer.hpp"
#include "fleet_sim/priority_policy.hpp"
#include "fleet_sim/transport.hpp"

namespace fleet_sim {

/** @brief Lifecycle of a worker; Stopped is terminal. */
enum class WorkerState {
    Idle,
    Running,
    Stopped
};

[[nodiscard]] std::string_view to_string(WorkerState state) noexcept;

/** @brief Flushed batches a device keeps waiting for its sender by default. */
inline constexpr std::size_t k_default_outbox_capacity{4};

/**
 * @brief Per-device knobs, applied uniformly across a fleet.
 */
struct DeviceConfig final {
    std::string firmware_version{"1.0-sim"};       /**< Firmware tag stamped on every message. */
    Duration log_interval{Duration{500}};          /**< Cadence of Log messages. */
    Duration sensor_interval{Duration{500}};       /**< Cadence of SensorData messages. */
    Duration write_interval{Duration{500}};        /**< Flush cadence. */
    std::size_t buffer_capacity{3};                /**< Messages allowed out per flush. */
    std::size_t outbox_capacity{k_default_outbox_capacity}; /**< Flushed batches allowed to wait for the sender. */
    PriorityPolicy priority_policy{};              /**< Ordering applied on overflow. */
    std::optional<std::uint64_t> random_seed{};    /**< Fixed seed for payload sources; random when unset. */
};

/** @brief Counters accumulated over the lifetime of a worker. */
struct WorkerStats final {
    std::uint64_t generated{};
    std::uint64_t flushes{};
    std::uint64_t retained{};
    std::uint64_t dropped{};
    std::uint64_t sent{};
    std::uint64_t send_failed{};
    std::uint64_t discarded{}; /**< Retained messages never sent: outbox overflow or shutdown. */

    WorkerStats& operator+=(const WorkerStats& other) noexcept;
};

/** @brief Produces the payload source for one generator of a device. */
using SourceFactory = std::function<MessageSourcePtr(MessageKind kind, std::uint64_t seed)>;

/**
 * @brief Build one generator per message kind using the intervals and policy in @p config.
 *
 * Each generator's source is seeded independently from the configured seed,
 * or from std::random_device when none is set.
 */
[[nodiscard]] MessageGeneratorList make_device_generators(const DeviceIdentity& identity,
                                                          const DeviceConfig& config,
                                                          const SourceFactory& source_factory = make_random_source);

/** @brief Invoked once when a worker stops because of a generation fault. */
using TerminationCallback = std::function<void(const std::string& device_id, const std::string& reason)>;

/** @brief One simulated device: generators, buffer, flush timer, and sender. */
class DeviceWorker final {
  public:
    /** @brief Build a worker with one random generator per message kind. */
    DeviceWorker(DeviceIdentity identity,
                 const DeviceConfig& config,
                 MessageTransportPtr transport,
                 EventSink& event_sink,
                 const Clock& clock,
                 TerminationCallback on_terminated = {});

    /** @brief Build a worker around caller-supplied generators. */
    DeviceWorker(DeviceIdentity identity,
                 Duration write_interval,
                 std::size_t buffer_capacity,
                 MessageGeneratorList generators,
                 MessageTransportPtr transport,
                 EventSink& event_sink,
                 const Clock& clock,
                 TerminationCallback on_terminated = {},
                 std::size_t outbox_capacity = k_default_outbox_capacity);

    ~DeviceWorker();

    DeviceWorker(const DeviceWorker&) = delete;
    DeviceWorker& operator=(const DeviceWorker&) = delete;

    [[nodiscard]] const std::string& device_id() const noexcept;
    [[nodiscard]] WorkerState state() const noexcept;
    [[nodiscard]] WorkerStats stats() const;
    [[nodiscard]] std::size_t pending_count() const;

    /**
     * @brief Transition Idle -> Running and launch the scheduler and sender threads.
     * @throws std::logic_error if the worker is not Idle.
     */
    void start();
    /**
     * @brief Stop both threads. Idempotent.
     *
     * The message in flight completes; every flushed message not yet handed
     * to the transport is reported as dropped with reason "shutdown".
     */
    void stop();

    /**
     * @brief Process every timer due at @p now: flush first, then generators.
     *
     * Timers are anchored on the first call. Returns the earliest upcoming
     * deadline. Any exception raised while flushing or generating is a
     * generation fault: it stops the worker and poll returns @p now.
     */
    TimePoint poll(TimePoint now);
    /** @brief Synchronously send every batch queued for transmission. */
    void deliver_pending();

  private:
    void arm_timers(TimePoint now);
    void flush_buffer();
    void deliver_batch(const MessageList& batch);
    void discard(const MessageList& messages, std::string_view reason);
    void abandon_outbox();
    void handle_generation_fault(const std::string& reason);
    [[nodiscard]] TimePoint next_deadline() const;
    void scheduler_loop();
    void sender_loop();

    DeviceIdentity identity_;
    std::size_t buffer_capacity_;
    IntervalTimer flush_timer_;
    MessageGeneratorList list_generators_;
    MessageTransportPtr transport_;
    EventSink& event_sink_;
    const Clock& clock_;
    TerminationCallback on_terminated_;

    PriorityBuffer buffer_;
    DispatchQueue outbox_;
    bool flag_armed_{false};
    std::atomic<bool> flag_abandon_sends_{false};

    std::atomic<WorkerState> state_{WorkerState::Idle};
    std::mutex mutex_wake_;
    std::condition_variable cv_wake_;
    bool flag_stop_requested_{false};
    std::thread scheduler_thread_;
    std::thread sender_thread_;

    mutable std::mutex mutex_stats_;
    WorkerStats stats_{};
    std::shared_ptr<spdlog::logger> logger_;
};

using DeviceWorkerPtr = std::unique_ptr<DeviceWorker>;

}  // namespace fleet_sim
