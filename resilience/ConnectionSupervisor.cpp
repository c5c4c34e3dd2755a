/**
 * \file resilience/ConnectionSupervisor.cpp
 * \brief Implementation of the per-device connection state machine.
 */
#include "ConnectionSupervisor.hpp"
#include "device/IDeviceClient.hpp"

#include <stdexcept>
#include <string>
#include <system_error>

namespace SpeakerLink {

namespace {

/// Clears an atomic flag when the scope ends.
class FlagReset {
public:
    explicit FlagReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~FlagReset() { flag_.store(false); }
    FlagReset(const FlagReset&) = delete;
    FlagReset& operator=(const FlagReset&) = delete;
private:
    std::atomic<bool>& flag_;
};

} // namespace

ConnectionSupervisor::ConnectionSupervisor(std::shared_ptr<IDeviceClient> client,
                                           ReconnectPolicy policy,
                                           HealthCheckTiming timing,
                                           std::shared_ptr<Logger> logger,
                                           Hooks hooks)
    : client_(std::move(client))
    , policy_(policy)
    , timing_(timing)
    , logger_(std::move(logger))
    , hooks_(std::move(hooks))
{
    if (!client_) {
        throw std::invalid_argument("ConnectionSupervisor: client cannot be null");
    }
}

ConnectionSupervisor::~ConnectionSupervisor() {
    stop();
}

void ConnectionSupervisor::connect() {
    {
        std::lock_guard<std::mutex> gate(gate_);
        try {
            client_->connect();
            client_->update();
        } catch (const std::system_error& e) {
            if (logger_) logger_->error(std::string{"Could not connect to speaker: "} + e.what());
            transition(ConnectionState::Disconnected);
            throw std::system_error(make_error_code(DeviceErrc::connection_failure), e.what());
        }
    }
    transition(ConnectionState::Connected);
}

void ConnectionSupervisor::disconnect() {
    {
        std::lock_guard<std::mutex> gate(gate_);
        try {
            client_->disconnect();
        } catch (const std::system_error& e) {
            if (logger_) logger_->debug(std::string{"Error while disconnecting from speaker: "} + e.what());
        }
    }
    transition(ConnectionState::Disconnected);
}

void ConnectionSupervisor::start() {
    if (monitor_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        stopping_ = false;
    }
    monitor_ = std::thread([this] { monitor_loop(); });
}

void ConnectionSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        stopping_ = true;
    }
    wait_cv_.notify_all();
    if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id()) {
        monitor_.join();
    }
}

void ConnectionSupervisor::monitor_loop() {
    auto next_check = std::chrono::steady_clock::now() + timing_.check_interval;
    for (;;) {
        bool lost = false;
        {
            std::unique_lock<std::mutex> lk(wait_mtx_);
            wait_cv_.wait_until(lk, next_check, [this] { return stopping_ || loss_pending_; });
            if (stopping_) break;
            lost = loss_pending_;
            loss_pending_ = false;
        }

        if (lost) {
            connection_lost();
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= next_check) {
            periodic_check(now);
            next_check = now + timing_.check_interval;
        }
    }
}

bool ConnectionSupervisor::periodic_check(std::chrono::steady_clock::time_point now) {
    if (logger_) logger_->debug("Checking if connection should be checked");
    if (checking_.load()) {
        if (logger_) logger_->debug("Connection check already running");
        return false;
    }
    if (reconnecting_.load()) {
        if (logger_) logger_->debug("Already trying to reconnect to speaker");
        return false;
    }
    if (state() == ConnectionState::Disconnected) {
        // Lost without a loss episode, e.g. the initial connect failed.
        request_reconnect();
        return false;
    }

    const auto attributes = client_->snapshot();
    if (!attributes.last_seen) {
        if (logger_) logger_->debug("Speaker has no attributes");
        return false;
    }
    if (now - *attributes.last_seen < timing_.stale_after) {
        if (logger_) logger_->debug("Speaker has been seen - no connection check needed");
        return false;
    }

    check_connection();
    return true;
}

void ConnectionSupervisor::check_connection() {
    if (checking_.exchange(true)) return;
    bool lost = false;
    {
        FlagReset reset(checking_);
        if (state() != ConnectionState::Connected) return;

        if (logger_) logger_->debug("Checking connection");
        transition(ConnectionState::CheckingConnection);

        try {
            std::lock_guard<std::mutex> gate(gate_);
            client_->get_volume();
        } catch (const std::system_error& e) {
            // The probe is always safe to repeat, so a timeout counts as a lost connection.
            if (is_connection_class(e.code(), TimeoutPolicy::TriggerReconnect)) {
                if (logger_) logger_->debug(std::string{"Probe failed: "} + e.what());
                lost = true;
            } else if (logger_) {
                logger_->warning(std::string{"Probe returned an error: "} + e.what());
            }
        } catch (const std::exception& e) {
            if (logger_) logger_->warning(std::string{"Probe returned an error: "} + e.what());
        }

        if (!lost) transition(ConnectionState::Connected);
    }

    if (lost) connection_lost();
}

void ConnectionSupervisor::connection_lost() {
    bool expected = false;
    if (!reconnecting_.compare_exchange_strong(expected, true)) return;

    {
        // A failure reported before this episode claimed the flag belongs to it.
        std::lock_guard<std::mutex> lk(wait_mtx_);
        loss_pending_ = false;
    }

    if (logger_) logger_->warning("Connection to speaker lost");
    attempts_.store(0);
    transition(ConnectionState::Disconnected);
    run_hook("on_lost", hooks_.on_lost);

    transition(ConnectionState::Reconnecting);
    reconnect_until_connected();
}

bool ConnectionSupervisor::report_failure(const std::error_code& ec, TimeoutPolicy policy) {
    if (!is_connection_class(ec, policy)) return false;
    if (logger_) logger_->debug("Command failed: " + ec.message());
    if (reconnecting_.load()) return true;
    transition(ConnectionState::Disconnected);
    request_reconnect();
    return true;
}

void ConnectionSupervisor::request_reconnect() {
    {
        std::lock_guard<std::mutex> lk(wait_mtx_);
        loss_pending_ = true;
    }
    wait_cv_.notify_all();
}

ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lk(state_mtx_);
    return state_;
}

void ConnectionSupervisor::reconnect_until_connected() {
    unsigned attempt = 0;
    for (;;) {
        if (logger_) logger_->debug("Trying to reconnect (attempt " + std::to_string(attempt + 1) + ")");
        if (try_reconnect_once()) {
            transition(ConnectionState::Connected);
            reconnecting_.store(false);
            if (logger_) logger_->warning("Connection to speaker restored");
            run_hook("on_restored", hooks_.on_restored);
            return;
        }

        attempts_.store(++attempt);
        const auto delay = policy_.delay_for(attempt);
        if (logger_) {
            logger_->debug("Reconnect failed; next attempt in " + std::to_string(delay.count()) + " ms");
        }
        if (hooks_.on_retry_scheduled) {
            run_hook("on_retry_scheduled", [&] { hooks_.on_retry_scheduled(attempt, delay); });
        }
        if (!wait_for(delay)) {
            if (logger_) logger_->info("Reconnect loop cancelled by shutdown");
            reconnecting_.store(false);
            return;
        }
    }
}

bool ConnectionSupervisor::try_reconnect_once() {
    std::lock_guard<std::mutex> gate(gate_);
    try {
        client_->disconnect();
    } catch (const std::system_error& e) {
        if (logger_) logger_->debug(std::string{"Error while disconnecting from speaker: "} + e.what());
    }
    try {
        client_->connect();
        client_->update();
    } catch (const std::system_error& e) {
        if (logger_) logger_->debug(std::string{"Reconnect attempt failed: "} + e.what());
        return false;
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string{"Reconnect attempt failed unexpectedly: "} + e.what());
        return false;
    }
    return client_->is_connected();
}

void ConnectionSupervisor::transition(ConnectionState to) {
    ConnectionState from;
    {
        std::lock_guard<std::mutex> lk(state_mtx_);
        from = state_;
        if (from == to) return;
        state_ = to;
    }
    if (logger_) logger_->debug("State " + to_string(from) + " -> " + to_string(to));
    if (hooks_.on_transition) {
        run_hook("on_transition", [&] { hooks_.on_transition(from, to); });
    }
}

void ConnectionSupervisor::run_hook(const char* name, const std::function<void()>& hook) {
    if (!hook) return;
    try {
        hook();
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string{"Hook "} + name + " failed: " + e.what());
    }
}

bool ConnectionSupervisor::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(wait_mtx_);
    return !wait_cv_.wait_for(lk, delay, [this] { return stopping_; });
}

} // namespace SpeakerLink
