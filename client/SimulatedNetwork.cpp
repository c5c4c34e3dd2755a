/**
 * \file client/SimulatedNetwork.cpp
 * \brief Implementation of the simulated speaker network.
 */
#include "SimulatedNetwork.hpp"

#include <algorithm>
#include <type_traits>

namespace SpeakerLink {

namespace {

/// Write \p value into the field named \p key; returns false when nothing changed.
bool apply_field(DeviceAttributes& a, const std::string& key, const AttributeValue& value) {
    auto assign = [](auto& field, const AttributeValue& v) {
        using T = std::decay_t<decltype(field)>;
        const T& next = std::get<T>(v);
        if (field == next) return false;
        field = next;
        return true;
    };
    if (key == attr::kName)            return assign(a.name, value);
    if (key == attr::kIsMaster)        return assign(a.is_master, value);
    if (key == attr::kIsSlave)         return assign(a.is_slave, value);
    if (key == attr::kMasterAddress)   return assign(a.master_address, value);
    if (key == attr::kGroupName)       return assign(a.group_name, value);
    if (key == attr::kNumberOfMembers) return assign(a.number_of_members, value);
    if (key == attr::kVolume)          return assign(a.volume, value);
    if (key == attr::kMuted)           return assign(a.muted, value);
    if (key == attr::kPlaybackState)   return assign(a.playback_state, value);
    return false;
}

} // namespace

SimulatedNetwork::SimulatedNetwork(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

std::shared_ptr<SimulatedNetwork> SimulatedNetwork::shared() {
    static std::shared_ptr<SimulatedNetwork> network = std::make_shared<SimulatedNetwork>();
    return network;
}

void SimulatedNetwork::add_speaker(const std::string& host, const std::string& name, int volume) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stations_.count(host)) return;
    Station station;
    station.attributes.name = name;
    station.attributes.volume = volume;
    station.attributes.number_of_members = 1;
    stations_.emplace(host, std::move(station));
}

bool SimulatedNetwork::has_speaker(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stations_.count(host) != 0;
}

void SimulatedNetwork::drop(const std::string& host) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    if (it == stations_.end()) return;
    it->second.reachable = false;
    if (logger_) logger_->info("(Simulated) Link to " + host + " dropped");
}

void SimulatedNetwork::restore(const std::string& host) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    if (it == stations_.end()) return;
    it->second.reachable = true;
    if (logger_) logger_->info("(Simulated) Link to " + host + " restored");
}

bool SimulatedNetwork::reachable(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    return it != stations_.end() && it->second.reachable;
}

void SimulatedNetwork::inject_failure(const std::string& host, DeviceErrc error) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    if (it != stations_.end()) it->second.injected = error;
}

DeviceAttributes SimulatedNetwork::attributes(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    if (it == stations_.end()) throw_device_error(DeviceErrc::not_found, "no simulated speaker at " + host);
    return it->second.attributes;
}

std::uint64_t SimulatedNetwork::group_calls(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    return it == stations_.end() ? 0 : it->second.group_calls;
}

SimulatedNetwork::Station& SimulatedNetwork::reach_locked(const std::string& host) {
    auto it = stations_.find(host);
    if (it == stations_.end()) {
        throw_device_error(DeviceErrc::connection_failure, "no route to " + host);
    }
    Station& station = it->second;
    if (!station.reachable) {
        throw_device_error(DeviceErrc::connection_failure, host + " is unreachable");
    }
    if (station.injected) {
        const DeviceErrc error = *station.injected;
        station.injected.reset();
        throw_device_error(error, "injected failure on " + host);
    }
    station.attributes.last_seen = std::chrono::steady_clock::now();
    return station;
}

void SimulatedNetwork::set_field_locked(const std::string& host, const std::string& key,
                                        const AttributeValue& value,
                                        std::map<std::string, AttributeDelta>& changes) {
    auto& station = stations_.at(host);
    if (apply_field(station.attributes, key, value)) {
        changes[host][key] = value;
    }
}

std::vector<SimulatedNetwork::Event>
SimulatedNetwork::collect_locked(const std::map<std::string, AttributeDelta>& changes) const {
    std::vector<Event> events;
    for (const auto& [host, delta] : changes) {
        auto it = stations_.find(host);
        if (it != stations_.end() && it->second.handler) {
            events.emplace_back(it->second.handler, delta);
        }
    }
    return events;
}

void SimulatedNetwork::dispatch(const std::vector<Event>& events) {
    for (const auto& [handler, delta] : events) handler(delta);
}

void SimulatedNetwork::ping(const std::string& host) {
    std::lock_guard<std::mutex> lk(mtx_);
    reach_locked(host);
}

DeviceAttributes SimulatedNetwork::fetch(const std::string& host) {
    std::lock_guard<std::mutex> lk(mtx_);
    return reach_locked(host).attributes;
}

int SimulatedNetwork::volume(const std::string& host) {
    std::lock_guard<std::mutex> lk(mtx_);
    return reach_locked(host).attributes.volume;
}

void SimulatedNetwork::set_volume(const std::string& host, int volume) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        reach_locked(host);
        std::map<std::string, AttributeDelta> changes;
        set_field_locked(host, attr::kVolume, volume, changes);
        events = collect_locked(changes);
    }
    dispatch(events);
}

void SimulatedNetwork::set_mute(const std::string& host, bool mute) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        reach_locked(host);
        std::map<std::string, AttributeDelta> changes;
        set_field_locked(host, attr::kMuted, mute, changes);
        events = collect_locked(changes);
    }
    dispatch(events);
}

void SimulatedNetwork::set_playback(const std::string& host, const std::string& state) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        reach_locked(host);
        std::map<std::string, AttributeDelta> changes;
        set_field_locked(host, attr::kPlaybackState, state, changes);
        events = collect_locked(changes);
    }
    dispatch(events);
}

void SimulatedNetwork::group(const std::string& master_host,
                             const std::vector<SpeakerEndpoint>& before,
                             const std::vector<SpeakerEndpoint>& after) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Station& master = reach_locked(master_host);

        for (const auto& slave : after) {
            if (slave.host == master_host) {
                throw_device_error(DeviceErrc::other, "a speaker can not follow itself");
            }
            auto it = stations_.find(slave.host);
            if (it == stations_.end()) {
                throw_device_error(DeviceErrc::not_found, "no simulated speaker at " + slave.host);
            }
            if (!it->second.reachable) {
                throw_device_error(DeviceErrc::other, "slave " + slave.host + " did not answer");
            }
        }
        ++master.group_calls;

        const std::string group_name = after.empty() ? std::string{} : master.attributes.name;
        const int members = static_cast<int>(after.size()) + 1;
        auto in_after = [&after](const std::string& host) {
            return std::any_of(after.begin(), after.end(),
                               [&host](const SpeakerEndpoint& e) { return e.host == host; });
        };

        std::map<std::string, AttributeDelta> changes;

        // The speaker itself knows its followers, so stale entries in `before` do not matter.
        for (auto& [host, station] : stations_) {
            if (station.attributes.is_slave && station.attributes.master_address == master_host && !in_after(host)) {
                set_field_locked(host, attr::kIsSlave, false, changes);
                set_field_locked(host, attr::kMasterAddress, std::string{}, changes);
                set_field_locked(host, attr::kGroupName, std::string{}, changes);
                set_field_locked(host, attr::kNumberOfMembers, 1, changes);
            }
        }

        set_field_locked(master_host, attr::kIsSlave, false, changes);
        set_field_locked(master_host, attr::kIsMaster, !after.empty(), changes);
        set_field_locked(master_host, attr::kGroupName, group_name, changes);
        set_field_locked(master_host, attr::kNumberOfMembers, after.empty() ? 1 : members, changes);

        for (const auto& slave : after) {
            set_field_locked(slave.host, attr::kIsMaster, false, changes);
            set_field_locked(slave.host, attr::kIsSlave, true, changes);
            set_field_locked(slave.host, attr::kMasterAddress, master_host, changes);
            set_field_locked(slave.host, attr::kGroupName, group_name, changes);
            set_field_locked(slave.host, attr::kNumberOfMembers, members, changes);
        }

        if (logger_) {
            logger_->debug("(Simulated) " + master_host + " regrouped: " + std::to_string(before.size()) +
                           " -> " + std::to_string(after.size()) + " slaves");
        }
        events = collect_locked(changes);
    }
    dispatch(events);
}

void SimulatedNetwork::attach(const std::string& host, IDeviceClient::EventHandler handler) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = stations_.find(host);
    if (it != stations_.end()) it->second.handler = std::move(handler);
}

} // namespace SpeakerLink
