/**
 * \file group/GroupTopology.hpp
 * \brief Pure derivation of group membership from device attributes.
 */
#pragma once

#include "device/DeviceAttributes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SpeakerLink {

/** \brief What the topology functions need to know about one device. */
struct DeviceView {
    DeviceId id;
    std::string address;          ///< Compared against slaves' \c master_address.
    DeviceAttributes attributes;
    bool connected{false};
};

/**
 * \brief Members of the group \p id participates in, master first.
 *
 * Only connected devices take part. Slaves follow the order of \p order_hint
 * (typically the last committed slave list) and then the order of \p devices.
 * A slave whose master is not among \p devices gets the list of its fellow
 * slaves without a leader.
 *
 * \return std::nullopt if \p id is unknown, offline or ungrouped.
 */
std::optional<std::vector<DeviceId>> resolve_group_members(const DeviceId& id,
                                                           const std::vector<DeviceView>& devices,
                                                           const std::vector<DeviceId>& order_hint = {});

/**
 * \brief Device whose playback state \p id mirrors: the group's master, or \p id itself.
 */
DeviceId playback_source(const DeviceId& id,
                         const std::vector<DeviceView>& devices);

} // namespace SpeakerLink
