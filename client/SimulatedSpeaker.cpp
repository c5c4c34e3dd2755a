/**
 * \file client/SimulatedSpeaker.cpp
 * \brief Implementation of the simulated speaker client.
 */
#include "SimulatedSpeaker.hpp"
#include "device/DeviceError.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <type_traits>

namespace SpeakerLink {

SimulatedSpeaker::SimulatedSpeaker(std::shared_ptr<SimulatedNetwork> network,
                                   SpeakerEndpoint endpoint,
                                   std::shared_ptr<Logger> logger)
    : network_(std::move(network))
    , endpoint_(std::move(endpoint))
    , logger_(std::move(logger))
{
    if (!network_) {
        throw std::invalid_argument("SimulatedSpeaker: network cannot be null");
    }
}

SimulatedSpeaker::~SimulatedSpeaker() {
    network_->attach(endpoint_.host, {});
}

template <typename F>
auto SimulatedSpeaker::call(F&& fn) -> decltype(fn()) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!connected_) {
            throw_device_error(DeviceErrc::connection_failure, "no session to " + endpoint_.host);
        }
    }
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            std::lock_guard<std::mutex> lk(mtx_);
            cache_.last_seen = std::chrono::steady_clock::now();
        } else {
            auto result = fn();
            std::lock_guard<std::mutex> lk(mtx_);
            cache_.last_seen = std::chrono::steady_clock::now();
            return result;
        }
    } catch (const std::system_error& e) {
        if (e.code() == DeviceErrc::connection_failure) {
            std::lock_guard<std::mutex> lk(mtx_);
            connected_ = false;
        }
        throw;
    }
}

void SimulatedSpeaker::connect() {
    network_->ping(endpoint_.host);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        connected_ = true;
        cache_.last_seen = std::chrono::steady_clock::now();
    }
    std::weak_ptr<SimulatedSpeaker> self = weak_from_this();
    network_->attach(endpoint_.host, [self](const AttributeDelta& delta) {
        if (auto speaker = self.lock()) speaker->deliver(delta);
    });
    if (logger_) logger_->debug("(Simulated) Session to " + endpoint_.host + " opened");
}

void SimulatedSpeaker::disconnect() {
    network_->attach(endpoint_.host, {});
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = false;
}

void SimulatedSpeaker::update() {
    auto fresh = call([this] { return network_->fetch(endpoint_.host); });
    std::lock_guard<std::mutex> lk(mtx_);
    cache_ = std::move(fresh);
    cache_.last_seen = std::chrono::steady_clock::now();
}

bool SimulatedSpeaker::is_connected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connected_;
}

DeviceAttributes SimulatedSpeaker::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cache_;
}

int SimulatedSpeaker::get_volume() {
    const int volume = call([this] { return network_->volume(endpoint_.host); });
    std::lock_guard<std::mutex> lk(mtx_);
    cache_.volume = volume;
    return volume;
}

void SimulatedSpeaker::set_volume(int volume) {
    call([this, volume] { network_->set_volume(endpoint_.host, volume); });
}

void SimulatedSpeaker::set_mute(bool mute) {
    call([this, mute] { network_->set_mute(endpoint_.host, mute); });
}

void SimulatedSpeaker::play() {
    call([this] { network_->set_playback(endpoint_.host, "play"); });
}

void SimulatedSpeaker::pause() {
    call([this] { network_->set_playback(endpoint_.host, "pause"); });
}

void SimulatedSpeaker::stop() {
    call([this] { network_->set_playback(endpoint_.host, "stop"); });
}

void SimulatedSpeaker::next_track() {
    call([this] { network_->ping(endpoint_.host); });
}

void SimulatedSpeaker::previous_track() {
    call([this] { network_->ping(endpoint_.host); });
}

void SimulatedSpeaker::group(const std::vector<SpeakerEndpoint>& before,
                             const std::vector<SpeakerEndpoint>& after) {
    call([&] { network_->group(endpoint_.host, before, after); });
}

void SimulatedSpeaker::set_event_handler(EventHandler handler) {
    std::lock_guard<std::recursive_mutex> lk(handler_mtx_);
    handler_ = std::move(handler);
}

void SimulatedSpeaker::deliver(const AttributeDelta& delta) {
    const auto current = network_->attributes(endpoint_.host);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!connected_) return;
        cache_ = current;
        cache_.last_seen = std::chrono::steady_clock::now();
    }
    std::lock_guard<std::recursive_mutex> lk(handler_mtx_);
    // Run a copy: the handler may replace itself.
    const EventHandler handler = handler_;
    if (handler) handler(delta);
}

} // namespace SpeakerLink
