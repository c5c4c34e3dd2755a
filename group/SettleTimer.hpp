/**
 * \file group/SettleTimer.hpp
 * \brief One-shot debounce timer with a dedicated worker thread.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace SpeakerLink {

/**
 * \brief Runs a callback once after a delay on its own worker thread.
 *
 * The worker thread is started lazily and reused, so the callback may re-arm
 * the timer. \c stop() cancels an armed timer and interrupts \c sleep_for().
 */
class SettleTimer {
public:
    SettleTimer() = default;
    ~SettleTimer();

    SettleTimer(const SettleTimer&) = delete;
    SettleTimer& operator=(const SettleTimer&) = delete;

    /**
     * \brief Arm the timer unless it is already armed.
     * \return false if already armed (the pending deadline is kept) or stopped.
     */
    bool arm(std::chrono::milliseconds delay, std::function<void()> callback);

    bool armed() const;

    /**
     * \brief Sleep for \p delay; returns early with false once \c stop() is called.
     * Intended for use from inside the callback.
     */
    bool sleep_for(std::chrono::milliseconds delay);

    /** \brief Disarm, wake sleepers and join the worker. Idempotent. */
    void stop();

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_{false};
    bool stopping_{false};
    std::chrono::steady_clock::time_point deadline_{};
    std::function<void()> callback_;
    std::thread worker_;
};

} // namespace SpeakerLink
