/**
 * \file client/SimulatedNetwork.hpp
 * \brief In-process model of a set of speakers and their grouping state.
 */
#pragma once

#include "device/DeviceAttributes.hpp"
#include "device/DeviceError.hpp"
#include "device/IDeviceClient.hpp"
#include "logger.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace SpeakerLink {

/**
 * \brief Shared medium of the \c simulated client backend.
 *
 * Each speaker is keyed by host address. Commands mutate the stored attributes
 * and push the changed fields to the handler attached for that host, the way a
 * real speaker emits property-change events. Grouping keeps master and slave
 * attributes consistent (\c is_master, \c is_slave, \c master_address,
 * \c group_name, \c number_of_members).
 *
 * Link loss is modelled per host with \c drop() / \c restore(); single
 * failures can be queued with \c inject_failure().
 */
class SimulatedNetwork {
public:
    explicit SimulatedNetwork(std::shared_ptr<Logger> logger = nullptr);

    /** \brief Process-wide network used by \c ClientFactory. */
    static std::shared_ptr<SimulatedNetwork> shared();

    /** \brief Add a speaker, or keep the existing one if \p host is known. */
    void add_speaker(const std::string& host, const std::string& name, int volume = 20);
    bool has_speaker(const std::string& host) const;

    /** \brief Make \p host unreachable; every call to it fails with connection_failure. */
    void drop(const std::string& host);
    void restore(const std::string& host);
    bool reachable(const std::string& host) const;

    /** \brief The next call addressed to \p host fails with \p error. */
    void inject_failure(const std::string& host, DeviceErrc error);

    /** \brief Current attributes of \p host without touching \c last_seen. */
    DeviceAttributes attributes(const std::string& host) const;

    /** \brief Number of \c group() calls the network has accepted for \p host. */
    std::uint64_t group_calls(const std::string& host) const;

    // Operations used by SimulatedSpeaker. All throw std::system_error.
    void ping(const std::string& host);
    DeviceAttributes fetch(const std::string& host);
    int volume(const std::string& host);
    void set_volume(const std::string& host, int volume);
    void set_mute(const std::string& host, bool mute);
    void set_playback(const std::string& host, const std::string& state);
    void group(const std::string& master_host,
               const std::vector<SpeakerEndpoint>& before,
               const std::vector<SpeakerEndpoint>& after);

    /**
     * \brief Route push events for \p host to \p handler; empty detaches.
     * Events already collected keep the old handler, so detaching is not
     * synchronous; handlers must guard the lifetime of what they capture.
     */
    void attach(const std::string& host, IDeviceClient::EventHandler handler);

private:
    struct Station {
        DeviceAttributes attributes;
        bool reachable{true};
        std::optional<DeviceErrc> injected;
        std::uint64_t group_calls{0};
        IDeviceClient::EventHandler handler;
    };

    using Event = std::pair<IDeviceClient::EventHandler, AttributeDelta>;

    /// Lookup plus reachability and injected-failure checks; refreshes last_seen.
    Station& reach_locked(const std::string& host);
    /// Store \p value and record it in \p changes if it differs from the current one.
    void set_field_locked(const std::string& host, const std::string& key,
                          const AttributeValue& value, std::map<std::string, AttributeDelta>& changes);
    std::vector<Event> collect_locked(const std::map<std::string, AttributeDelta>& changes) const;
    static void dispatch(const std::vector<Event>& events);

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mtx_;
    std::map<std::string, Station> stations_;
};

} // namespace SpeakerLink
