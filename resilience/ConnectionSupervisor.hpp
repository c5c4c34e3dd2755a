/**
 * \file resilience/ConnectionSupervisor.hpp
 * \brief Health polling and exponential-backoff reconnection for one speaker.
 */
#pragma once

#include "ConnectionState.hpp"
#include "ResilienceSettings.hpp"
#include "device/DeviceError.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace SpeakerLink {

class IDeviceClient;

/**
 * \brief Connection state machine of a single device.
 *
 * Transitions:
 * - Connected -> CheckingConnection when the periodic check finds the speaker silent.
 * - CheckingConnection -> Connected when the probe answers.
 * - CheckingConnection -> Disconnected -> Reconnecting when the probe loses the connection.
 * - any -> Disconnected -> Reconnecting when a command reports a connection-class error.
 * - Reconnecting -> Connected when a reconnect attempt succeeds.
 *
 * All client session calls (connect, disconnect, update, probe) go through one
 * gate mutex. The monitor thread owns the periodic check and the reconnect loop;
 * both waits are interrupted by \c stop().
 */
class ConnectionSupervisor {
public:
    struct Hooks {
        /// Called after every state change, outside internal locks. Exceptions from any hook are logged.
        std::function<void(ConnectionState from, ConnectionState to)> on_transition;
        /// Connection lost; called once per loss episode.
        std::function<void()> on_lost;
        /// Connection restored after a loss episode.
        std::function<void()> on_restored;
        /// A reconnect attempt failed; the next one follows after \p delay.
        std::function<void(unsigned attempt, std::chrono::milliseconds delay)> on_retry_scheduled;
    };

    ConnectionSupervisor(std::shared_ptr<IDeviceClient> client,
                         ReconnectPolicy policy,
                         HealthCheckTiming timing,
                         std::shared_ptr<Logger> logger,
                         Hooks hooks);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * \brief Open the session and load the attribute snapshot.
     * \throws std::system_error (DeviceErrc::connection_failure) if the speaker cannot be reached.
     */
    void connect();
    /** \brief Close the session; errors are logged, state becomes Disconnected. */
    void disconnect();

    /** \brief Launch the monitor thread (periodic checks and reconnect loop). */
    void start();
    /** \brief Cancel pending waits and join the monitor thread. Idempotent. */
    void stop();

    /**
     * \brief Periodic timer entry point.
     * \return true if a probe was issued.
     */
    bool periodic_check(std::chrono::steady_clock::time_point now);

    /** \brief Probe the speaker now; on connection loss runs the reconnect loop on this thread. */
    void check_connection();

    /**
     * \brief Enter Reconnecting and loop until the speaker answers or \c stop() is called.
     * No-op if a reconnect loop is already running.
     */
    void connection_lost();

    /**
     * \brief Fast path for command failures on behalf of consumers.
     * Connection-class errors mark the device Disconnected and wake the monitor
     * thread to reconnect; other errors leave the state untouched.
     * \return true if the failure was treated as a lost connection.
     */
    bool report_failure(const std::error_code& ec, TimeoutPolicy policy);

    /** \brief Ask the monitor thread to run the reconnect loop. */
    void request_reconnect();

    ConnectionState state() const;
    bool is_connected() const { return state() == ConnectionState::Connected; }
    bool is_reconnecting() const { return reconnecting_.load(); }
    /** \brief Failed attempts in the current (or last) loss episode. */
    unsigned reconnect_attempts() const { return attempts_.load(); }

private:
    void monitor_loop();
    void reconnect_until_connected();
    bool try_reconnect_once();
    void transition(ConnectionState to);
    /// Invoke a consumer callback; exceptions are logged and do not reach the monitor thread.
    void run_hook(const char* name, const std::function<void()>& hook);
    /// Sleep for \p delay unless stopped first; returns false when stopped.
    bool wait_for(std::chrono::milliseconds delay);

    std::shared_ptr<IDeviceClient> client_;
    ReconnectPolicy policy_;
    HealthCheckTiming timing_;
    std::shared_ptr<Logger> logger_;
    Hooks hooks_;

    std::mutex gate_;

    mutable std::mutex state_mtx_;
    ConnectionState state_{ConnectionState::Disconnected};

    std::atomic<bool> checking_{false};
    std::atomic<bool> reconnecting_{false};
    std::atomic<unsigned> attempts_{0};

    std::mutex wait_mtx_;
    std::condition_variable wait_cv_;
    bool stopping_{false};
    bool loss_pending_{false};

    std::thread monitor_;
};

} // namespace SpeakerLink
