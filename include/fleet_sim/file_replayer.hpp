// === File Replayer ===========================================================
//
// Alternate message source for deterministic runs: re-sends messages recorded
// one JSON object per line (NDJSON) through the same transport the devices
// use, at a fixed interval and without any buffering or prioritization.

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>

#include <spdlog/logger.h>

#include "fleet_sim/event_sink.hpp"
#include "fleet_sim/transport.hpp"
#include "fleet_sim/types.hpp"

namespace fleet_sim {

/** @brief Outcome counters of one replay run. */
struct ReplayStats final {
    std::uint64_t sent{};
    std::uint64_t failed{};
    std::uint64_t skipped{}; /**< Lines that did not decode as a message. */
};

/** @brief Streams an NDJSON file into a transport. */
class FileReplayer final {
  public:
    FileReplayer(std::filesystem::path path, Duration interval, MessageTransport& transport, EventSink& event_sink);

    /**
     * @brief Send every line of the file, pausing @p interval between lines.
     *
     * Returns early once @p stop_requested becomes true.
     * @throws std::runtime_error when the file cannot be opened.
     */
    ReplayStats run(const std::atomic<bool>& stop_requested);

  private:
    /** @brief Sleep for the configured interval; false if interrupted by a stop request. */
    bool wait_interval(const std::atomic<bool>& stop_requested) const;

    std::filesystem::path path_replay_file_;
    Duration interval_;
    MessageTransport& transport_;
    EventSink& event_sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace fleet_sim
