/**
 * \file device/DeviceHandle.cpp
 * \brief Implementation of \c DeviceHandle.
 */
#include "DeviceHandle.hpp"

#include <stdexcept>

namespace SpeakerLink {

DeviceHandle::DeviceHandle(DeviceConfig config,
                           std::shared_ptr<IDeviceClient> client,
                           ReconnectPolicy policy,
                           HealthCheckTiming timing,
                           std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , client_(std::move(client))
    , logger_(logger ? logger->child("(" + config_.name + "@" + config_.host + ")") : nullptr)
    , subscribers_(logger_)
    , supervisor_(client_, policy, timing, logger_, make_hooks())
{
    if (config_.id.empty()) {
        throw std::invalid_argument("DeviceHandle: device id cannot be empty");
    }
    attributes_.name = config_.name;
    client_->set_event_handler([this](const AttributeDelta& delta) { on_push_event(delta); });
}

DeviceHandle::~DeviceHandle() {
    shutdown();
}

std::string DeviceHandle::label() const {
    return "(" + attributes().name + "@" + config_.host + ")";
}

void DeviceHandle::connect() {
    supervisor_.connect();
    refresh_attributes();
    notify_topology();
}

void DeviceHandle::start_monitoring() {
    supervisor_.start();
}

void DeviceHandle::shutdown() {
    {
        std::lock_guard<std::mutex> lk(shutdown_mtx_);
        if (shut_down_) return;
        shut_down_ = true;
    }
    supervisor_.stop();
    client_->set_event_handler({});
    supervisor_.disconnect();
    set_topology_observer({});
    set_state_observer({});
}

DeviceAttributes DeviceHandle::attributes() const {
    std::lock_guard<std::mutex> lk(attr_mtx_);
    return attributes_;
}

void DeviceHandle::set_topology_observer(TopologyObserver observer) {
    std::lock_guard<std::mutex> lk(observer_mtx_);
    topology_observer_ = std::move(observer);
}

void DeviceHandle::set_state_observer(StateObserver observer) {
    std::lock_guard<std::mutex> lk(observer_mtx_);
    state_observer_ = std::move(observer);
}

int DeviceHandle::get_volume(TimeoutPolicy policy) {
    return run_command("get_volume", policy, [this] { return client_->get_volume(); });
}

void DeviceHandle::set_volume(int volume, TimeoutPolicy policy) {
    if (volume < 0 || volume > 100) {
        throw std::out_of_range("volume must be within 0..100");
    }
    run_command("set_volume", policy, [this, volume] { client_->set_volume(volume); });
}

void DeviceHandle::set_mute(bool mute, TimeoutPolicy policy) {
    run_command("set_mute", policy, [this, mute] { client_->set_mute(mute); });
}

void DeviceHandle::play(TimeoutPolicy policy) {
    run_command("play", policy, [this] { client_->play(); });
}

void DeviceHandle::pause(TimeoutPolicy policy) {
    run_command("pause", policy, [this] { client_->pause(); });
}

void DeviceHandle::stop(TimeoutPolicy policy) {
    run_command("stop", policy, [this] { client_->stop(); });
}

void DeviceHandle::next_track(TimeoutPolicy policy) {
    run_command("next_track", policy, [this] { client_->next_track(); });
}

void DeviceHandle::previous_track(TimeoutPolicy policy) {
    run_command("previous_track", policy, [this] { client_->previous_track(); });
}

void DeviceHandle::group(const std::vector<SpeakerEndpoint>& before,
                         const std::vector<SpeakerEndpoint>& after,
                         TimeoutPolicy policy) {
    run_command("group", policy, [&] { client_->group(before, after); });
}

void DeviceHandle::on_push_event(const AttributeDelta& delta) {
    const std::string old_name = attributes().name;
    refresh_attributes();

    subscribers_.notify(delta);

    if (touches_grouping(delta)) {
        notify_topology();
    }

    if (delta.count(attr::kName) && logger_) {
        const std::string new_name = attributes().name;
        if (!new_name.empty() && new_name != old_name) {
            logger_->info("Speaker renamed to '" + new_name + "'");
        }
    }
}

void DeviceHandle::refresh_attributes() {
    auto fresh = client_->snapshot();
    std::lock_guard<std::mutex> lk(attr_mtx_);
    // Keep the configured name until the speaker reports one.
    if (fresh.name.empty()) fresh.name = attributes_.name;
    attributes_ = std::move(fresh);
}

void DeviceHandle::notify_topology() {
    TopologyObserver observer;
    {
        std::lock_guard<std::mutex> lk(observer_mtx_);
        observer = topology_observer_;
    }
    if (!observer) return;
    try {
        observer(config_.id);
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string{"Topology observer failed: "} + e.what());
    }
}

ConnectionSupervisor::Hooks DeviceHandle::make_hooks() {
    ConnectionSupervisor::Hooks hooks;
    hooks.on_transition = [this](ConnectionState from, ConnectionState to) {
        StateObserver observer;
        {
            std::lock_guard<std::mutex> lk(observer_mtx_);
            observer = state_observer_;
        }
        if (!observer) return;
        try {
            observer(from, to);
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string{"State observer failed: "} + e.what());
        }
    };
    hooks.on_lost = [this] {
        subscribers_.notify_forced();
        notify_topology();
    };
    hooks.on_restored = [this] {
        // The speaker may come back with a different state; refresh everyone even without a delta.
        refresh_attributes();
        subscribers_.notify_forced();
        notify_topology();
    };
    return hooks;
}

} // namespace SpeakerLink
