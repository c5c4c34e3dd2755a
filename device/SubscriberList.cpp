/**
 * \file device/SubscriberList.cpp
 * \brief Snapshot-based dispatch for \c SubscriberList.
 */
#include "SubscriberList.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace SpeakerLink {

SubscriberList::SubscriptionId SubscriberList::add(Callback cb) {
    auto entry = std::make_shared<Entry>();
    entry->cb = std::move(cb);
    std::lock_guard<std::mutex> lock(mutex_);
    entry->id = next_id_++;
    entries_.push_back(entry);
    return entry->id;
}

bool SubscriberList::remove(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const auto& e) { return e->id == id; });
    if (it == entries_.end()) return false;
    // A dispatch holding a snapshot checks this flag before invoking.
    (*it)->active.store(false, std::memory_order_release);
    entries_.erase(it);
    return true;
}

void SubscriberList::notify(const AttributeDelta& delta) {
    dispatch(delta, false);
}

void SubscriberList::notify_forced() {
    dispatch(AttributeDelta{}, true);
}

std::size_t SubscriberList::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SubscriberList::dispatch(const AttributeDelta& delta, bool force_update) {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = entries_;
    }
    for (const auto& entry : snapshot) {
        if (!entry->active.load(std::memory_order_acquire)) continue;
        if (!entry->cb) continue;
        try {
            entry->cb(delta, force_update);
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->error("Subscriber " + std::to_string(entry->id) + " failed: " + e.what());
            }
        }
    }
}

} // namespace SpeakerLink
