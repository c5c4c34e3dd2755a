/**
 * \file device/DeviceAttributes.hpp
 * \brief Attribute snapshot and push-event delta types exchanged with device clients.
 */
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace SpeakerLink {

/** \brief Stable speaker identity (serial or configured address). */
using DeviceId = std::string;

/** \brief Attribute names used in push-event deltas. */
namespace attr {
    inline constexpr const char* kName            = "name";
    inline constexpr const char* kIsMaster        = "is_master";
    inline constexpr const char* kIsSlave         = "is_slave";
    inline constexpr const char* kMasterAddress   = "master_address";
    inline constexpr const char* kGroupName       = "group_name";
    inline constexpr const char* kNumberOfMembers = "number_of_members";
    inline constexpr const char* kVolume          = "volume";
    inline constexpr const char* kMuted           = "muted";
    inline constexpr const char* kPlaybackState   = "playback_state";
}

using AttributeValue = std::variant<bool, int, std::string>;

/** \brief Partial set of changed attributes carried by one push event. */
using AttributeDelta = std::map<std::string, AttributeValue>;

/** \brief Last known state reported by a speaker. */
struct DeviceAttributes {
    std::string name;
    bool is_master{false};
    bool is_slave{false};
    std::string master_address;   ///< Address of the master when \c is_slave.
    std::string group_name;
    int number_of_members{0};     ///< Group size as reported by a master (itself included).
    int volume{0};
    bool muted{false};
    std::string playback_state{"stop"};
    std::optional<std::chrono::steady_clock::time_point> last_seen; ///< Unset until first contact.

    bool is_grouped() const { return is_master || is_slave; }
};

/** \brief Network endpoint of a speaker as handed to grouping calls. */
struct SpeakerEndpoint {
    DeviceId id;
    std::string host;
    int port{0};

    bool operator==(const SpeakerEndpoint&) const = default;
};

/** \brief True if \p delta touches any attribute that changes group topology. */
inline bool touches_grouping(const AttributeDelta& delta) {
    for (const char* key : {attr::kIsMaster, attr::kIsSlave, attr::kMasterAddress,
                            attr::kGroupName, attr::kNumberOfMembers}) {
        if (delta.count(key)) return true;
    }
    return false;
}

} // namespace SpeakerLink
