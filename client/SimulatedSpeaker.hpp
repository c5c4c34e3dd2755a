/**
 * \file client/SimulatedSpeaker.hpp
 * \brief \c IDeviceClient backed by a \c SimulatedNetwork.
 */
#pragma once

#include "SimulatedNetwork.hpp"
#include "device/IDeviceClient.hpp"
#include "logger.hpp"

#include <memory>
#include <mutex>

namespace SpeakerLink {

/**
 * \brief Client session to one simulated speaker.
 *
 * Keeps its own attribute cache like a wire client would: \c update() reloads
 * it, push events and successful calls refresh it. A call that hits a dropped
 * link closes the session and throws \c DeviceErrc::connection_failure.
 *
 * Must be owned by a \c std::shared_ptr: the network holds only a weak
 * reference. Once \c set_event_handler returns, the previous handler is not
 * running on another thread and will not be called again.
 */
class SimulatedSpeaker : public IDeviceClient, public std::enable_shared_from_this<SimulatedSpeaker> {
public:
    SimulatedSpeaker(std::shared_ptr<SimulatedNetwork> network,
                     SpeakerEndpoint endpoint,
                     std::shared_ptr<Logger> logger = nullptr);
    ~SimulatedSpeaker() override;

    void connect() override;
    void disconnect() override;
    void update() override;
    bool is_connected() const override;
    DeviceAttributes snapshot() const override;

    int get_volume() override;
    void set_volume(int volume) override;
    void set_mute(bool mute) override;
    void play() override;
    void pause() override;
    void stop() override;
    void next_track() override;
    void previous_track() override;

    void group(const std::vector<SpeakerEndpoint>& before,
               const std::vector<SpeakerEndpoint>& after) override;

    void set_event_handler(EventHandler handler) override;

private:
    template <typename F>
    auto call(F&& fn) -> decltype(fn());

    void deliver(const AttributeDelta& delta);

    std::shared_ptr<SimulatedNetwork> network_;
    SpeakerEndpoint endpoint_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mtx_;
    bool connected_{false};
    DeviceAttributes cache_;

    // Held while the handler runs; recursive so a handler may issue commands to this speaker.
    std::recursive_mutex handler_mtx_;
    EventHandler handler_;
};

} // namespace SpeakerLink
