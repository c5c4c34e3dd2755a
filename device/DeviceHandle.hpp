/**
 * \file device/DeviceHandle.hpp
 * \brief One physical speaker: client ownership, connection supervision and update fan-out.
 */
#pragma once

#include "DeviceAttributes.hpp"
#include "DeviceError.hpp"
#include "IDeviceClient.hpp"
#include "SubscriberList.hpp"
#include "resilience/ConnectionSupervisor.hpp"
#include "logger.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace SpeakerLink {

/** \brief Static configuration of one speaker entry. */
struct DeviceConfig {
    DeviceId id;
    std::string host;
    int port{55001};
    std::string name;   ///< Display name until the speaker reports its own.
};

/**
 * \brief Owner of a speaker's client and connection state.
 *
 * Responsibilities:
 * - Mirror the client's attribute snapshot and fan push-event deltas out to subscribers.
 * - Route command failures into the \c ConnectionSupervisor according to a per-call \c TimeoutPolicy.
 * - Tell the group coordinator when topology-relevant attributes or connectivity change.
 */
class DeviceHandle {
public:
    using TopologyObserver = std::function<void(const DeviceId&)>;
    using StateObserver = std::function<void(ConnectionState from, ConnectionState to)>;

    DeviceHandle(DeviceConfig config,
                 std::shared_ptr<IDeviceClient> client,
                 ReconnectPolicy policy,
                 HealthCheckTiming timing,
                 std::shared_ptr<Logger> logger);
    ~DeviceHandle();

    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;

    const DeviceId& id() const { return config_.id; }
    const std::string& host() const { return config_.host; }
    int port() const { return config_.port; }
    SpeakerEndpoint endpoint() const { return {config_.id, config_.host, config_.port}; }
    /** \brief Log label "(name@host)". */
    std::string label() const;

    /**
     * \brief Connect and load the first attribute snapshot.
     * \throws std::system_error (DeviceErrc::connection_failure)
     */
    void connect();
    /** \brief Start periodic health checks and the reconnect worker. */
    void start_monitoring();
    /** \brief Stop monitoring, detach push events and disconnect the client. Idempotent. */
    void shutdown();

    bool is_connected() const { return supervisor_.is_connected(); }
    ConnectionState connection_state() const { return supervisor_.state(); }
    /** \brief Copy of the last mirrored attributes. */
    DeviceAttributes attributes() const;

    SubscriberList::SubscriptionId subscribe(SubscriberList::Callback cb) { return subscribers_.add(std::move(cb)); }
    bool unsubscribe(SubscriberList::SubscriptionId id) { return subscribers_.remove(id); }
    /** \brief Send a forced update to every subscriber. */
    void update_all_subscribers() { subscribers_.notify_forced(); }

    /** \brief Observer fired when this device's grouping attributes or connectivity change. */
    void set_topology_observer(TopologyObserver observer);
    /** \brief Observer fired on every connection state transition. */
    void set_state_observer(StateObserver observer);

    // Commands. Every call rethrows the client's error after classifying it.
    int get_volume(TimeoutPolicy policy = TimeoutPolicy::TriggerReconnect);
    void set_volume(int volume, TimeoutPolicy policy = TimeoutPolicy::TriggerReconnect);
    void set_mute(bool mute, TimeoutPolicy policy = TimeoutPolicy::TriggerReconnect);
    void play(TimeoutPolicy policy = TimeoutPolicy::Ignore);
    void pause(TimeoutPolicy policy = TimeoutPolicy::Ignore);
    void stop(TimeoutPolicy policy = TimeoutPolicy::Ignore);
    void next_track(TimeoutPolicy policy = TimeoutPolicy::Ignore);
    void previous_track(TimeoutPolicy policy = TimeoutPolicy::Ignore);
    /** \brief Whole-group replacement issued on this (master) speaker. */
    void group(const std::vector<SpeakerEndpoint>& before,
               const std::vector<SpeakerEndpoint>& after,
               TimeoutPolicy policy = TimeoutPolicy::Ignore);

    ConnectionSupervisor& supervisor() { return supervisor_; }

private:
    template <typename F>
    auto run_command(const char* what, TimeoutPolicy policy, F&& fn) -> decltype(fn());

    void on_push_event(const AttributeDelta& delta);
    void refresh_attributes();
    void notify_topology();
    ConnectionSupervisor::Hooks make_hooks();

    DeviceConfig config_;
    std::shared_ptr<IDeviceClient> client_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex attr_mtx_;
    DeviceAttributes attributes_;

    SubscriberList subscribers_;

    std::mutex observer_mtx_;
    TopologyObserver topology_observer_;
    StateObserver state_observer_;

    bool shut_down_{false};
    std::mutex shutdown_mtx_;

    // Declared last: its monitor thread calls back into the members above.
    ConnectionSupervisor supervisor_;
};

template <typename F>
auto DeviceHandle::run_command(const char* what, TimeoutPolicy policy, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::system_error& e) {
        if (!supervisor_.report_failure(e.code(), policy) && logger_) {
            logger_->error(std::string{"Error sending command '"} + what + "' to speaker: " + e.what());
        }
        throw;
    }
}

} // namespace SpeakerLink
