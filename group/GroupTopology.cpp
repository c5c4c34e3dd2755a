/**
 * \file group/GroupTopology.cpp
 * \brief Implementation of the topology derivation functions.
 */
#include "GroupTopology.hpp"

#include <algorithm>

namespace SpeakerLink {

namespace {

const DeviceView* find_connected(const std::vector<DeviceView>& devices, const DeviceId& id) {
    for (const auto& d : devices) {
        if (d.id == id && d.connected) return &d;
    }
    return nullptr;
}

const DeviceView* find_connected_by_address(const std::vector<DeviceView>& devices, const std::string& address) {
    for (const auto& d : devices) {
        if (d.address == address && d.connected) return &d;
    }
    return nullptr;
}

std::vector<DeviceId> slaves_of(const std::string& master_address,
                                const std::vector<DeviceView>& devices,
                                const std::vector<DeviceId>& order_hint) {
    std::vector<DeviceId> slaves;
    for (const auto& d : devices) {
        if (!d.connected || !d.attributes.is_slave) continue;
        if (d.attributes.master_address == master_address) slaves.push_back(d.id);
    }
    auto rank = [&order_hint](const DeviceId& id) {
        auto it = std::find(order_hint.begin(), order_hint.end(), id);
        return static_cast<std::size_t>(it - order_hint.begin());
    };
    std::stable_sort(slaves.begin(), slaves.end(),
                     [&rank](const DeviceId& a, const DeviceId& b) { return rank(a) < rank(b); });
    return slaves;
}

} // namespace

std::optional<std::vector<DeviceId>> resolve_group_members(const DeviceId& id,
                                                           const std::vector<DeviceView>& devices,
                                                           const std::vector<DeviceId>& order_hint) {
    const DeviceView* self = find_connected(devices, id);
    if (!self) return std::nullopt;

    if (self->attributes.is_master) {
        std::vector<DeviceId> members{self->id};
        for (auto& slave : slaves_of(self->address, devices, order_hint)) {
            if (slave != self->id) members.push_back(std::move(slave));
        }
        return members;
    }

    if (self->attributes.is_slave) {
        std::vector<DeviceId> members;
        const auto& master_address = self->attributes.master_address;
        if (const DeviceView* master = find_connected_by_address(devices, master_address)) {
            members.push_back(master->id);
        }
        for (auto& slave : slaves_of(master_address, devices, order_hint)) {
            members.push_back(std::move(slave));
        }
        return members;
    }

    return std::nullopt;
}

DeviceId playback_source(const DeviceId& id, const std::vector<DeviceView>& devices) {
    auto members = resolve_group_members(id, devices);
    if (!members || members->empty()) return id;
    const DeviceView* leader = find_connected(devices, members->front());
    // Without a known master the slaves have nobody to mirror.
    if (!leader || !leader->attributes.is_master) return id;
    return leader->id;
}

} // namespace SpeakerLink
