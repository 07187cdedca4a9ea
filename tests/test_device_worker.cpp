#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "fleet_sim/clock.hpp"
#include "fleet_sim/device_worker.hpp"
#include "logging_test_fixture.hpp"
#include "recording_fakes.hpp"

using namespace fleet_sim;
using namespace std::chrono_literals;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    fleet_sim::test::ensure_logger_initialized();
    return true;
}();

/** @brief Sensor source whose readings count up from zero so tests can tell them apart. */
class CountingSensorSource final : public MessageSource {
  public:
    [[nodiscard]] MessageKind kind() const noexcept override {
        return MessageKind::SensorData;
    }

    [[nodiscard]] MessagePayload next_payload() override {
        return test::temperature(static_cast<float>(next_value_++));
    }

  private:
    int next_value_{0};
};

MessageGenerator log_generator(const DeviceIdentity& identity, Duration interval, const PriorityPolicy& policy) {
    return MessageGenerator{identity, interval,
                            std::make_unique<test::ScriptedSource>(MessageKind::Log, std::vector<MessagePayload>{test::info_log()}),
                            policy};
}

MessageGenerator sensor_generator(const DeviceIdentity& identity, Duration interval, const PriorityPolicy& policy) {
    return MessageGenerator{identity, interval, std::make_unique<CountingSensorSource>(), policy};
}

/** @brief Poll @p worker every @p step until @p elapsed has passed, sending each flushed batch right away. */
void drive(DeviceWorker& worker, ManualClock& clock, Duration elapsed, Duration step) {
    worker.poll(clock.now());
    for (Duration covered{0}; covered < elapsed; covered += step) {
        clock.advance(step);
        worker.poll(clock.now());
        worker.deliver_pending();
    }
}

/** @brief Config for a device writing faster than a slow transport can keep up with. */
DeviceConfig busy_device() {
    DeviceConfig config{};
    config.log_interval = Duration{5};
    config.sensor_interval = Duration{5};
    config.write_interval = Duration{10};
    config.buffer_capacity = 3;
    config.outbox_capacity = 3;
    config.random_seed = 7;
    return config;
}
}  // namespace

TEST_CASE("Capacity one keeps the log and drops the sensor reading every cycle") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    const PriorityPolicy policy{};
    MessageGeneratorList generators;
    generators.push_back(log_generator(identity, Duration{100}, policy));
    generators.push_back(sensor_generator(identity, Duration{100}, policy));

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    DeviceWorker worker{identity, Duration{100}, 1, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock};

    drive(worker, clock, Duration{500}, Duration{100});

    const MessageList sent = transport_log->messages();
    REQUIRE(sent.size() == 5);
    for (const Message& message : sent) {
        REQUIRE(message.kind() == MessageKind::Log);
    }
    const std::vector<test::DropEvent> drops = sink.drops();
    REQUIRE(drops.size() == 5);
    for (const test::DropEvent& drop : drops) {
        REQUIRE(drop.device_id == "device-a");
        REQUIRE(drop.kind == MessageKind::SensorData);
        REQUIRE(drop.reason == k_reason_buffer_overflow);
    }

    const WorkerStats stats = worker.stats();
    REQUIRE(stats.flushes == 5);
    REQUIRE(stats.retained == 5);
    REQUIRE(stats.dropped == 5);
    REQUIRE(stats.sent == 5);
    REQUIRE(worker.pending_count() == 2);
}

TEST_CASE("Reversed policy keeps the sensor reading and drops the log") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    const PriorityPolicy policy = PriorityPolicy::parse("sensor_data>log");
    MessageGeneratorList generators;
    generators.push_back(log_generator(identity, Duration{100}, policy));
    generators.push_back(sensor_generator(identity, Duration{100}, policy));

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    DeviceWorker worker{identity, Duration{100}, 1, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock};

    drive(worker, clock, Duration{300}, Duration{100});

    const MessageList sent = transport_log->messages();
    REQUIRE(sent.size() == 3);
    for (const Message& message : sent) {
        REQUIRE(message.kind() == MessageKind::SensorData);
    }
    for (const test::DropEvent& drop : sink.drops()) {
        REQUIRE(drop.kind == MessageKind::Log);
    }
}

TEST_CASE("Overflow keeps the log and the earliest sensor reading") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    const PriorityPolicy policy{};
    MessageGeneratorList generators;
    generators.push_back(log_generator(identity, Duration{300}, policy));
    generators.push_back(sensor_generator(identity, Duration{100}, policy));

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    DeviceWorker worker{identity, Duration{300}, 2, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock};

    drive(worker, clock, Duration{300}, Duration{100});

    const MessageList sent = transport_log->messages();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0].kind() == MessageKind::Log);
    REQUIRE(sent[1].kind() == MessageKind::SensorData);
    REQUIRE(sent[1].sensor_readings()->front().value == 0.0F);

    const std::vector<test::DropEvent> drops = sink.drops();
    REQUIRE(drops.size() == 2);
    REQUIRE(drops[0].kind == MessageKind::SensorData);
    REQUIRE(drops[1].kind == MessageKind::SensorData);
}

TEST_CASE("No drops occur when capacity covers a full cycle") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    const PriorityPolicy policy{};
    MessageGeneratorList generators;
    generators.push_back(log_generator(identity, Duration{100}, policy));
    generators.push_back(sensor_generator(identity, Duration{100}, policy));

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    DeviceWorker worker{identity, Duration{100}, 2, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock};

    drive(worker, clock, Duration{1'000}, Duration{100});

    REQUIRE(sink.drops().empty());
    REQUIRE(transport_log->size() == 20);
    REQUIRE(worker.stats().dropped == 0);
}

TEST_CASE("Transport failures are reported per message and do not affect later flushes") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    const PriorityPolicy policy{};
    MessageGeneratorList generators;
    generators.push_back(log_generator(identity, Duration{100}, policy));
    generators.push_back(sensor_generator(identity, Duration{100}, policy));

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    DeviceWorker worker{identity, Duration{100}, 2, std::move(generators),
                        std::make_unique<test::RecordingTransport>(
                            transport_log,
                            [](const Message& message) { return message.kind() == MessageKind::SensorData; }),
                        sink, clock};

    drive(worker, clock, Duration{300}, Duration{100});

    REQUIRE(transport_log->size() == 6);
    const std::vector<test::SendFailureEvent> failures = sink.send_failures();
    REQUIRE(failures.size() == 3);
    for (const test::SendFailureEvent& failure : failures) {
        REQUIRE(failure.kind == MessageKind::SensorData);
        REQUIRE(failure.cause.find("500") != std::string::npos);
    }
    const WorkerStats stats = worker.stats();
    REQUIRE(stats.sent == 3);
    REQUIRE(stats.send_failed == 3);
    REQUIRE(stats.flushes == 3);
}

TEST_CASE("Generation fault stops the worker and notifies once") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    MessageGeneratorList generators;
    generators.push_back(MessageGenerator{identity, Duration{100}, std::make_unique<test::FaultySource>(MessageKind::SensorData),
                                          PriorityPolicy{}});

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    std::vector<std::string> terminated_ids;
    DeviceWorker worker{identity, Duration{100}, 3, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock,
                        [&terminated_ids](const std::string& device_id, const std::string&) {
                            terminated_ids.push_back(device_id);
                        }};

    worker.poll(clock.now());
    REQUIRE(worker.state() == WorkerState::Stopped);
    clock.advance(Duration{100});
    worker.poll(clock.now());

    REQUIRE(terminated_ids == std::vector<std::string>{"device-a"});
    REQUIRE(transport_log->size() == 0);
}

TEST_CASE("A source throwing std::runtime_error is handled as a generation fault") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    const PriorityPolicy policy{};
    MessageGeneratorList generators;
    generators.push_back(log_generator(identity, Duration{100}, policy));
    generators.push_back(MessageGenerator{identity, Duration{100}, std::make_unique<test::ThrowingSource>(MessageKind::SensorData),
                                          policy});

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    ManualClock clock;
    std::vector<std::string> list_reasons;
    DeviceWorker worker{identity, Duration{100}, 3, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock,
                        [&list_reasons](const std::string&, const std::string& reason) { list_reasons.push_back(reason); }};

    REQUIRE_NOTHROW(worker.poll(clock.now()));
    REQUIRE(worker.state() == WorkerState::Stopped);
    REQUIRE(list_reasons == std::vector<std::string>{"i2c read failed"});
    REQUIRE(transport_log->size() == 0);
}

TEST_CASE("A running worker survives a source throwing std::runtime_error on its scheduler thread") {
    const DeviceIdentity identity{"device-a", "1.0-sim"};
    MessageGeneratorList generators;
    generators.push_back(MessageGenerator{identity, Duration{10}, std::make_unique<test::ThrowingSource>(MessageKind::Log),
                                          PriorityPolicy{}});

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    SystemClock clock;
    std::atomic<int> terminations{0};
    DeviceWorker worker{identity, Duration{20}, 3, std::move(generators),
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock,
                        [&terminations](const std::string&, const std::string&) { ++terminations; }};

    worker.start();
    std::this_thread::sleep_for(100ms);

    REQUIRE(worker.state() == WorkerState::Stopped);
    REQUIRE(terminations.load() == 1);
    worker.stop();
    REQUIRE(terminations.load() == 1);
}

TEST_CASE("Stopping behind a slow transport abandons queued batches instead of draining them") {
    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    SystemClock clock;
    DeviceWorker worker{DeviceIdentity{"device-a", "1.0-sim"}, busy_device(),
                        std::make_unique<test::SlowTransport>(transport_log, Duration{50}), sink, clock};

    worker.start();
    std::this_thread::sleep_for(300ms);

    const auto stop_started = SteadyClock::now();
    worker.stop();
    const auto stop_took = SteadyClock::now() - stop_started;

    REQUIRE(stop_took < 500ms);
    REQUIRE(sink.drops_with_reason(k_reason_outbox_overflow) > 0);
    REQUIRE(sink.drops_with_reason(k_reason_shutdown) > 0);

    const WorkerStats stats = worker.stats();
    REQUIRE(stats.retained == stats.sent + stats.send_failed + stats.discarded);
    REQUIRE(stats.sent == transport_log->size());
    REQUIRE(sink.drops().size() == stats.dropped + stats.discarded);
}

TEST_CASE("Generation keeps its cadence while the transport is blocked") {
    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    SystemClock clock;
    DeviceWorker worker{DeviceIdentity{"device-a", "1.0-sim"}, busy_device(),
                        std::make_unique<test::SlowTransport>(transport_log, Duration{50}), sink, clock};

    worker.start();
    std::this_thread::sleep_for(300ms);
    const WorkerStats while_running = worker.stats();
    worker.stop();

    // Two generators at 5 ms give about 120 messages in 300 ms; the sender manages about 6.
    REQUIRE(while_running.generated >= 60);
    REQUIRE(while_running.flushes >= 15);
    REQUIRE(while_running.sent < 10);
}

TEST_CASE("Devices never see each other's messages") {
    const PriorityPolicy policy{};
    test::RecordingEventSink sink;
    ManualClock clock;

    const DeviceIdentity identity_a{"device-a", "1.0-sim"};
    const DeviceIdentity identity_b{"device-b", "1.0-sim"};
    MessageGeneratorList generators_a;
    generators_a.push_back(log_generator(identity_a, Duration{100}, policy));
    generators_a.push_back(sensor_generator(identity_a, Duration{100}, policy));
    MessageGeneratorList generators_b;
    generators_b.push_back(log_generator(identity_b, Duration{100}, policy));
    generators_b.push_back(sensor_generator(identity_b, Duration{50}, policy));

    auto log_a = std::make_shared<test::TransportLog>();
    auto log_b = std::make_shared<test::TransportLog>();
    DeviceWorker worker_a{identity_a, Duration{100}, 1, std::move(generators_a),
                          std::make_unique<test::RecordingTransport>(log_a), sink, clock};
    DeviceWorker worker_b{identity_b, Duration{100}, 1, std::move(generators_b),
                          std::make_unique<test::RecordingTransport>(log_b), sink, clock};

    worker_a.poll(clock.now());
    worker_b.poll(clock.now());
    for (int step = 0; step < 8; ++step) {
        clock.advance(Duration{50});
        worker_a.poll(clock.now());
        worker_b.poll(clock.now());
    }
    worker_a.deliver_pending();
    worker_b.deliver_pending();

    for (const Message& message : log_a->messages()) {
        REQUIRE(message.device_id() == "device-a");
    }
    for (const Message& message : log_b->messages()) {
        REQUIRE(message.device_id() == "device-b");
    }
    REQUIRE(worker_a.stats().dropped == 4);
    REQUIRE(worker_b.stats().dropped == 8);
}

TEST_CASE("DeviceWorker requires a transport") {
    test::RecordingEventSink sink;
    ManualClock clock;
    REQUIRE_THROWS_AS((DeviceWorker{DeviceIdentity{"device-a", "1.0-sim"}, DeviceConfig{}, nullptr, sink, clock}),
                      std::invalid_argument);
}

TEST_CASE("Running worker generates and sends on its own threads") {
    DeviceConfig config{};
    config.log_interval = Duration{10};
    config.sensor_interval = Duration{10};
    config.write_interval = Duration{20};
    config.buffer_capacity = 10;
    config.random_seed = 42;

    auto transport_log = std::make_shared<test::TransportLog>();
    test::RecordingEventSink sink;
    SystemClock clock;
    DeviceWorker worker{DeviceIdentity{"device-a", "1.0-sim"}, config,
                        std::make_unique<test::RecordingTransport>(transport_log), sink, clock};

    REQUIRE(worker.state() == WorkerState::Idle);
    worker.start();
    REQUIRE(worker.state() == WorkerState::Running);
    REQUIRE_THROWS_AS(worker.start(), std::logic_error);

    std::this_thread::sleep_for(200ms);
    worker.stop();
    worker.stop();

    REQUIRE(worker.state() == WorkerState::Stopped);
    REQUIRE(worker.stats().generated > 0);
    REQUIRE(transport_log->size() > 0);
    REQUIRE(transport_log->size() == worker.stats().sent);
}
