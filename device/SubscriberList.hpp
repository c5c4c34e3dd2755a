/**
 * \file device/SubscriberList.hpp
 * \brief Thread-safe set of attribute-update callbacks with in-flight safe removal.
 */
#pragma once

#include "DeviceAttributes.hpp"
#include "logger.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace SpeakerLink {

/**
 * \brief Fan-out of attribute deltas to registered subscribers.
 *
 * Dispatch works on a snapshot taken under the lock and invokes callbacks
 * without holding it, so callbacks may subscribe or unsubscribe (themselves
 * included). A subscriber removed during a dispatch receives nothing further
 * from it; one added during a dispatch first hears from the next one. A
 * callback that throws is logged and the dispatch continues with the next one.
 */
class SubscriberList {
public:
    /// \p force_update is set when every subscriber must refresh regardless of \p delta.
    using Callback = std::function<void(const AttributeDelta& delta, bool force_update)>;
    using SubscriptionId = std::uint64_t;

    explicit SubscriberList(std::shared_ptr<Logger> logger = nullptr) : logger_(std::move(logger)) {}
    SubscriberList(const SubscriberList&) = delete;
    SubscriberList& operator=(const SubscriberList&) = delete;

    /** \brief Register \p cb; the returned id is never reused. */
    SubscriptionId add(Callback cb);
    /** \brief Remove a subscription; unknown ids are ignored. Returns whether one was removed. */
    bool remove(SubscriptionId id);

    /** \brief Deliver \p delta to every subscriber. */
    void notify(const AttributeDelta& delta);
    /** \brief Deliver an empty delta with \c force_update to every subscriber. */
    void notify_forced();

    std::size_t size() const;

private:
    struct Entry {
        SubscriptionId id;
        Callback cb;
        std::atomic<bool> active{true};
    };

    void dispatch(const AttributeDelta& delta, bool force_update);

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Entry>> entries_;
    SubscriptionId next_id_{1};
};

} // namespace SpeakerLink
