// === Message Generator =======================================================
//
// Declares the payload sources that invent simulated log/sensor content, the
// `IntervalTimer` used for every periodic activity on a device, and the
// `MessageGenerator` that combines both into a lazy, unending stream of
// messages of a single kind. Generators never block on their consumer: the
// owning worker polls them and pushes whatever they emit into its buffer.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "fleet_sim/message.hpp"
#include "fleet_sim/priority_policy.hpp"
#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Raised when a generator cannot produce a well-formed message. */
class GenerationError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Identity stamped onto every message a device emits. */
struct DeviceIdentity final {
    std::string device_id{};        /**< Opaque, stable identifier of the device. */
    std::string firmware_version{}; /**< Simulated firmware build tag. */
};

/** @brief Produces kind-specific payload bodies for a generator. */
class MessageSource {
  public:
    virtual ~MessageSource() = default;

    [[nodiscard]] virtual MessageKind kind() const noexcept = 0;
    /** @brief Produce the next payload. May throw GenerationError. */
    [[nodiscard]] virtual MessagePayload next_payload() = 0;
};

using MessageSourcePtr = std::unique_ptr<MessageSource>;

/** @brief Log source that randomly alternates between Error and Info events. */
class RandomLogSource final : public MessageSource {
  public:
    explicit RandomLogSource(std::uint64_t seed);

    [[nodiscard]] MessageKind kind() const noexcept override;
    [[nodiscard]] MessagePayload next_payload() override;

  private:
    std::mt19937_64 rng_;
};

/** @brief Sensor source sampling a single temperature channel. */
class RandomSensorSource final : public MessageSource {
  public:
    explicit RandomSensorSource(std::uint64_t seed);

    [[nodiscard]] MessageKind kind() const noexcept override;
    [[nodiscard]] MessagePayload next_payload() override;

  private:
    std::mt19937_64 rng_;
};

/** @brief Construct the default random source for @p kind. */
[[nodiscard]] MessageSourcePtr make_random_source(MessageKind kind, std::uint64_t seed);

/**
 * @brief Fixed-cadence deadline tracker.
 *
 * A timer that falls behind fires once and re-anchors one interval after the
 * late tick, so an overdue timer never bursts to catch up.
 */
class IntervalTimer final {
  public:
    /** @throws std::invalid_argument when @p interval is not positive. */
    explicit IntervalTimer(Duration interval);

    /** @brief Schedule the first tick at @p first_tick. */
    void arm(TimePoint first_tick) noexcept;
    /** @brief Consume one tick if @p now has reached the deadline. */
    [[nodiscard]] bool fire_if_due(TimePoint now) noexcept;

    [[nodiscard]] TimePoint deadline() const noexcept;
    [[nodiscard]] Duration interval() const noexcept;

  private:
    Duration interval_;
    TimePoint deadline_{};
};

/** @brief Lazy, unending sequence of messages of one kind, one per tick. */
class MessageGenerator final {
  public:
    MessageGenerator(DeviceIdentity identity, Duration interval, MessageSourcePtr source, PriorityPolicy policy);

    [[nodiscard]] MessageKind kind() const noexcept;
    [[nodiscard]] const IntervalTimer& timer() const noexcept;

    /** @brief Anchor the first tick at @p now. */
    void start(TimePoint now) noexcept;
    /** @brief Emit one message if a tick is due at @p now. */
    [[nodiscard]] std::optional<Message> poll(TimePoint now, WallTimePoint wall_now);
    /**
     * @brief Produce the next element of the sequence, stamped with @p wall_now.
     * @throws GenerationError when the source yields a malformed payload.
     */
    [[nodiscard]] Message next(WallTimePoint wall_now);

  private:
    DeviceIdentity identity_;
    IntervalTimer timer_;
    MessageSourcePtr source_;
    PriorityPolicy policy_;
};

using MessageGeneratorList = std::vector<MessageGenerator>;

}  // namespace fleet_sim
