#include "fleet_sim/device_worker.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "fleet_sim/logging.hpp"

namespace fleet_sim {

namespace {

Duration interval_for(const DeviceConfig& config, MessageKind kind) {
    switch (kind) {
        case MessageKind::Log:
            return config.log_interval;
        case MessageKind::SensorData:
            return config.sensor_interval;
    }
    throw std::invalid_argument("Unsupported message kind");
}

}  // namespace

MessageGeneratorList make_device_generators(const DeviceIdentity& identity,
                                            const DeviceConfig& config,
                                            const SourceFactory& source_factory) {
    const std::uint64_t base_seed = config.random_seed.has_value() ? *config.random_seed : std::random_device{}();
    MessageGeneratorList generators;
    generators.reserve(k_all_message_kinds.size());
    std::uint64_t seed_offset = 0;
    for (const MessageKind kind : k_all_message_kinds) {
        generators.emplace_back(
            identity,
            interval_for(config, kind),
            source_factory(kind, base_seed + seed_offset),
            config.priority_policy
        );
        ++seed_offset;
    }
    return generators;
}

std::string_view to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Idle:
            return "idle";
        case WorkerState::Running:
            return "running";
        case WorkerState::Stopped:
            return "stopped";
    }
    return "unknown";
}

WorkerStats& WorkerStats::operator+=(const WorkerStats& other) noexcept {
    generated += other.generated;
    flushes += other.flushes;
    retained += other.retained;
    dropped += other.dropped;
    sent += other.sent;
    send_failed += other.send_failed;
    discarded += other.discarded;
    return *this;
}

DeviceWorker::DeviceWorker(DeviceIdentity identity,
                           const DeviceConfig& config,
                           MessageTransportPtr transport,
                           EventSink& event_sink,
                           const Clock& clock,
                           TerminationCallback on_terminated)
    : DeviceWorker(identity,
                   config.write_interval,
                   config.buffer_capacity,
                   make_device_generators(identity, config),
                   std::move(transport),
                   event_sink,
                   clock,
                   std::move(on_terminated),
                   config.outbox_capacity) {}

DeviceWorker::DeviceWorker(DeviceIdentity identity,
                           Duration write_interval,
                           std::size_t buffer_capacity,
                           MessageGeneratorList generators,
                           MessageTransportPtr transport,
                           EventSink& event_sink,
                           const Clock& clock,
                           TerminationCallback on_terminated,
                           std::size_t outbox_capacity)
    : identity_(std::move(identity)),
      buffer_capacity_(buffer_capacity),
      flush_timer_(write_interval),
      list_generators_(std::move(generators)),
      transport_(std::move(transport)),
      event_sink_(event_sink),
      clock_(clock),
      on_terminated_(std::move(on_terminated)),
      outbox_(outbox_capacity),
      logger_(get_logger()) {
    if (transport_ == nullptr) {
        throw std::invalid_argument("DeviceWorker requires a transport");
    }
    logger_->debug("Created device {} (firmware {}, capacity {}, write interval {} ms)",
                   identity_.device_id,
                   identity_.firmware_version,
                   buffer_capacity_,
                   write_interval.count());
}

DeviceWorker::~DeviceWorker() {
    stop();
}

const std::string& DeviceWorker::device_id() const noexcept {
    return identity_.device_id;
}

WorkerState DeviceWorker::state() const noexcept {
    return state_.load();
}

WorkerStats DeviceWorker::stats() const {
    std::scoped_lock lock(mutex_stats_);
    return stats_;
}

std::size_t DeviceWorker::pending_count() const {
    return buffer_.pending_count();
}

void DeviceWorker::start() {
    WorkerState expected = WorkerState::Idle;
    if (!state_.compare_exchange_strong(expected, WorkerState::Running)) {
        throw std::logic_error(fmt::format("Device {} cannot start from state {}", identity_.device_id, to_string(expected)));
    }
    logger_->info("Starting device {}", identity_.device_id);
    scheduler_thread_ = std::thread(&DeviceWorker::scheduler_loop, this);
    sender_thread_ = std::thread(&DeviceWorker::sender_loop, this);
}

void DeviceWorker::stop() {
    {
        std::scoped_lock lock(mutex_wake_);
        flag_stop_requested_ = true;
    }
    cv_wake_.notify_all();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    abandon_outbox();
    if (sender_thread_.joinable()) {
        sender_thread_.join();
    }
    if (state_.exchange(WorkerState::Stopped) == WorkerState::Running) {
        logger_->info("Stopped device {}", identity_.device_id);
    }
}

TimePoint DeviceWorker::poll(TimePoint now) {
    if (state_.load() == WorkerState::Stopped) {
        return now;
    }
    if (!flag_armed_) {
        arm_timers(now);
    }

    try {
        if (flush_timer_.fire_if_due(now)) {
            flush_buffer();
        }

        const WallTimePoint wall_now = clock_.wall_now();
        for (MessageGenerator& generator : list_generators_) {
            std::optional<Message> optional_message = generator.poll(now, wall_now);
            if (!optional_message.has_value()) {
                continue;
            }
            buffer_.accumulate(std::move(*optional_message));
            std::scoped_lock lock(mutex_stats_);
            ++stats_.generated;
        }
    } catch (const std::exception& exc) {
        handle_generation_fault(exc.what());
        return now;
    }
    return next_deadline();
}

void DeviceWorker::deliver_pending() {
    while (std::optional<MessageList> optional_batch = outbox_.try_consume()) {
        deliver_batch(*optional_batch);
    }
}

void DeviceWorker::arm_timers(TimePoint now) {
    for (MessageGenerator& generator : list_generators_) {
        generator.start(now);
    }
    flush_timer_.arm(now + flush_timer_.interval());
    flag_armed_ = true;
}

/**
 * @brief Resolve overflow over everything accumulated since the last flush.
 */
void DeviceWorker::flush_buffer() {
    FlushResult result = buffer_.flush(buffer_capacity_);
    {
        std::scoped_lock lock(mutex_stats_);
        ++stats_.flushes;
        stats_.retained += result.retained.size();
        stats_.dropped += result.dropped.size();
    }

    logger_->debug(
        R"({{"component":"device","device":"{}","event":"flush","retained":{},"dropped":{}}})",
        identity_.device_id,
        result.retained.size(),
        result.dropped.size()
    );

    for (const Message& message : result.dropped) {
        event_sink_.message_dropped(identity_.device_id, message.kind(), k_reason_buffer_overflow);
    }
    if (result.retained.empty()) {
        return;
    }
    const PublishResult published = outbox_.publish(std::move(result.retained));
    discard(published.discarded, published.accepted ? k_reason_outbox_overflow : k_reason_shutdown);
}

void DeviceWorker::deliver_batch(const MessageList& batch) {
    for (auto iterator_message = batch.begin(); iterator_message != batch.end(); ++iterator_message) {
        if (flag_abandon_sends_.load()) {
            discard(MessageList(iterator_message, batch.end()), k_reason_shutdown);
            return;
        }
        const Message& message = *iterator_message;
        std::optional<TransportError> optional_error;
        try {
            optional_error = transport_->send(message);
        } catch (const std::exception& exc) {
            optional_error = TransportError{TransportErrorKind::Connection, 0, exc.what()};
        }

        if (!optional_error.has_value()) {
            std::scoped_lock lock(mutex_stats_);
            ++stats_.sent;
            continue;
        }
        {
            std::scoped_lock lock(mutex_stats_);
            ++stats_.send_failed;
        }
        event_sink_.message_send_failed(identity_.device_id, message.kind(), optional_error->describe());
    }
}

/**
 * @brief Report retained messages that will never reach the transport.
 */
void DeviceWorker::discard(const MessageList& messages, std::string_view reason) {
    if (messages.empty()) {
        return;
    }
    {
        std::scoped_lock lock(mutex_stats_);
        stats_.discarded += messages.size();
    }
    logger_->warn(
        R"({{"component":"device","device":"{}","event":"discard","reason":"{}","count":{}}})",
        identity_.device_id,
        reason,
        messages.size()
    );
    for (const Message& message : messages) {
        event_sink_.message_dropped(identity_.device_id, message.kind(), reason);
    }
}

/**
 * @brief Close the outbox and tell the sender to stop after its current message.
 */
void DeviceWorker::abandon_outbox() {
    flag_abandon_sends_.store(true);
    discard(outbox_.close(), k_reason_shutdown);
}

void DeviceWorker::handle_generation_fault(const std::string& reason) {
    if (state_.exchange(WorkerState::Stopped) == WorkerState::Stopped) {
        return;
    }
    logger_->critical(
        R"({{"component":"device","device":"{}","event":"generation_fault","error":"{}"}})",
        identity_.device_id,
        reason
    );
    try {
        abandon_outbox();
    } catch (const std::exception& exc) {
        logger_->error("Device {} failed to report abandoned messages: {}", identity_.device_id, exc.what());
    }
    if (on_terminated_) {
        on_terminated_(identity_.device_id, reason);
    }
}

TimePoint DeviceWorker::next_deadline() const {
    TimePoint deadline = flush_timer_.deadline();
    for (const MessageGenerator& generator : list_generators_) {
        deadline = std::min(deadline, generator.timer().deadline());
    }
    return deadline;
}

/**
 * @brief Cooperative loop sleeping until the earliest timer or a stop request.
 */
void DeviceWorker::scheduler_loop() {
    try {
        while (true) {
            const TimePoint now = clock_.now();
            const TimePoint deadline = poll(now);
            if (state_.load() != WorkerState::Running) {
                break;
            }
            std::unique_lock lock(mutex_wake_);
            const SteadyClock::duration wait_duration = deadline > now ? deadline - now : SteadyClock::duration::zero();
            if (cv_wake_.wait_for(lock, wait_duration, [this]() { return flag_stop_requested_; })) {
                break;
            }
        }
    } catch (const std::exception& exc) {
        handle_generation_fault(exc.what());
    }
}

void DeviceWorker::sender_loop() {
    while (std::optional<MessageList> optional_batch = outbox_.wait_consume()) {
        try {
            deliver_batch(*optional_batch);
        } catch (const std::exception& exc) {
            logger_->error(
                R"({{"component":"device","device":"{}","event":"sender_error","error":"{}"}})",
                identity_.device_id,
                exc.what()
            );
        }
    }
}

}  // namespace fleet_sim
