#include "fleet_sim/file_replayer.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "fleet_sim/logging.hpp"
#include "fleet_sim/message_codec.hpp"

namespace fleet_sim {

namespace {
constexpr Duration k_stop_poll_slice{Duration{100}}; /**< Longest uninterrupted sleep between stop checks. */

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char character) { return std::isspace(character) != 0; });
}
}  // namespace

FileReplayer::FileReplayer(std::filesystem::path path, Duration interval, MessageTransport& transport, EventSink& event_sink)
    : path_replay_file_(std::move(path)),
      interval_(interval),
      transport_(transport),
      event_sink_(event_sink),
      logger_(get_logger()) {}

ReplayStats FileReplayer::run(const std::atomic<bool>& stop_requested) {
    std::ifstream input{path_replay_file_};
    if (!input) {
        throw std::runtime_error("Unable to open replay file " + path_replay_file_.string());
    }
    logger_->info("Replaying messages from {} every {} ms", path_replay_file_.string(), interval_.count());

    ReplayStats stats{};
    std::string line;
    std::size_t line_number = 0;
    bool first_message = true;
    while (!stop_requested.load() && std::getline(input, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }

        std::optional<Message> optional_message;
        try {
            optional_message = decode_message(line);
        } catch (const MessageFormatError& exc) {
            logger_->warn("Skipping line {} of {}: {}", line_number, path_replay_file_.string(), exc.what());
            ++stats.skipped;
            continue;
        }

        if (!first_message && !wait_interval(stop_requested)) {
            break;
        }
        first_message = false;

        const std::optional<TransportError> optional_error = transport_.send(*optional_message);
        if (optional_error.has_value()) {
            ++stats.failed;
            event_sink_.message_send_failed(optional_message->device_id(), optional_message->kind(), optional_error->describe());
        } else {
            ++stats.sent;
        }
    }

    logger_->info(
        R"({{"component":"replay","event":"finished","sent":{},"failed":{},"skipped":{}}})",
        stats.sent,
        stats.failed,
        stats.skipped
    );
    return stats;
}

bool FileReplayer::wait_interval(const std::atomic<bool>& stop_requested) const {
    Duration remaining = interval_;
    while (remaining > Duration::zero()) {
        if (stop_requested.load()) {
            return false;
        }
        const Duration slice = std::min(remaining, k_stop_poll_slice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !stop_requested.load();
}

}  // namespace fleet_sim
