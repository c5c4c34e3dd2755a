/**
 * \file daemon/SpeakerLinkOptions.hpp
 * \brief Option types and accessors for the speakerlinkd process.
 */
#pragma once

#include "client/ClientFactory.hpp"
#include "device/DeviceHandle.hpp"
#include "group/GroupCoordinator.hpp"
#include "resilience/ResilienceSettings.hpp"
#include "logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SpeakerLink {

/** \brief Aggregated speaker list, timing and runtime configuration. */
struct LinkSettings {
    std::vector<DeviceConfig> speakers;       ///< Config file entries, then --speaker flags.
    ReconnectPolicy reconnect;                ///< Backoff between reconnect attempts.
    HealthCheckTiming health;                 ///< Periodic check and staleness thresholds.
    GroupTiming grouping;                     ///< Settle and post-commit delays.
    LogLevel log_level{LogLevel::Info};       ///< Minimum level of the console sink.
    std::optional<std::string> log_file;      ///< Optional file sink (relative to the config dir).
    bool interactive{false};                  ///< Read console commands instead of waiting for a signal.
    ClientType client{ClientType::Simulated}; ///< Client backend.
};

/** \brief Helper API for accessing speakerlinkd CLI and config options. */
namespace link_opts {
    /** \brief Parse "id=host[:port]"; std::nullopt if malformed. */
    std::optional<DeviceConfig> parse_speaker_spec(const std::string& spec);

    /**
     * \brief Settings captured by the last \c shared_opts::Options::load_and_parse.
     * \throws std::invalid_argument on inconsistent values or malformed speaker entries.
     */
    LinkSettings current_settings();

    void register_options();
}

} // namespace SpeakerLink
