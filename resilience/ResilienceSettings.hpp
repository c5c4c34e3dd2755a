/**
 * \file resilience/ResilienceSettings.hpp
 * \brief Backoff and health-check timing for \c ConnectionSupervisor.
 */
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace SpeakerLink {

/**
 * \brief Exponential reconnect backoff.
 *
 * Wait after failed attempt n (n >= 1) is base * 2^min(n, cap_exponent),
 * never more than \c max_interval. Defaults give 20 s, 40 s, ... 640 s.
 */
struct ReconnectPolicy {
    std::chrono::milliseconds base{std::chrono::seconds(10)};
    unsigned cap_exponent{6};
    std::chrono::milliseconds max_interval{std::chrono::seconds(640)};

    std::chrono::milliseconds delay_for(unsigned attempt) const {
        const unsigned exponent = std::min({attempt, cap_exponent, 30u});
        const auto delay = base * (std::int64_t{1} << exponent);
        return std::min(delay, max_interval);
    }
};

/** \brief When the periodic probe runs and when it may be skipped. */
struct HealthCheckTiming {
    std::chrono::milliseconds check_interval{std::chrono::minutes(60)};
    /// Probe only if nothing was heard from the speaker for longer than this.
    std::chrono::milliseconds stale_after{std::chrono::minutes(61)};
};

} // namespace SpeakerLink
