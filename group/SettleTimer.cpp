/**
 * \file group/SettleTimer.cpp
 * \brief Worker loop for \c SettleTimer.
 */
#include "SettleTimer.hpp"

namespace SpeakerLink {

SettleTimer::~SettleTimer() {
    stop();
}

bool SettleTimer::arm(std::chrono::milliseconds delay, std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || armed_) return false;
        armed_ = true;
        deadline_ = std::chrono::steady_clock::now() + delay;
        callback_ = std::move(callback);
        if (!worker_.joinable()) {
            worker_ = std::thread([this] { run(); });
        }
    }
    cv_.notify_all();
    return true;
}

bool SettleTimer::armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

bool SettleTimer::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return stopping_; });
}

void SettleTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        armed_ = false;
        callback_ = nullptr;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void SettleTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] { return stopping_ || armed_; });
        if (stopping_) return;

        // Deadline is fixed once armed; re-arming while armed is refused.
        if (cv_.wait_until(lock, deadline_, [this] { return stopping_; })) return;

        auto callback = std::move(callback_);
        callback_ = nullptr;
        armed_ = false;
        lock.unlock();
        if (callback) callback();
        lock.lock();
    }
}

} // namespace SpeakerLink
