/**
 * \file device/IDeviceClient.hpp
 * \brief Transport-level interface to one physical speaker.
 */
#pragma once

#include "DeviceAttributes.hpp"

#include <functional>
#include <vector>

namespace SpeakerLink {

/**
 * \brief Per-speaker client supplied by a transport backend.
 *
 * Every call may throw \c std::system_error; backends tag failures with
 * \c DeviceErrc (or generic socket errno values) so handles can classify them.
 * Push events may be delivered on any thread.
 */
class IDeviceClient {
public:
    using EventHandler = std::function<void(const AttributeDelta&)>;

    virtual ~IDeviceClient() = default;

    /** \brief Open the session to the speaker. */
    virtual void connect() = 0;
    /** \brief Close the session; safe to call when already closed. */
    virtual void disconnect() = 0;
    /** \brief Refresh the full attribute snapshot from the speaker. */
    virtual void update() = 0;
    virtual bool is_connected() const = 0;
    /** \brief Copy of the latest attribute snapshot. */
    virtual DeviceAttributes snapshot() const = 0;

    /** \brief Cheap read used as liveness probe. */
    virtual int get_volume() = 0;
    virtual void set_volume(int volume) = 0;
    virtual void set_mute(bool mute) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual void next_track() = 0;
    virtual void previous_track() = 0;

    /**
     * \brief Replace this speaker's group in one call.
     * \param before Slaves currently following this speaker.
     * \param after Slaves that should follow it afterwards; empty dissolves the group.
     */
    virtual void group(const std::vector<SpeakerEndpoint>& before,
                       const std::vector<SpeakerEndpoint>& after) = 0;

    /** \brief Install the push-event sink; pass an empty function to detach. */
    virtual void set_event_handler(EventHandler handler) = 0;
};

} // namespace SpeakerLink
