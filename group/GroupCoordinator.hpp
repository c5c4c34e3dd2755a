/**
 * \file group/GroupCoordinator.hpp
 * \brief Process-wide directory of speakers and debounced group mutation.
 */
#pragma once

#include "GroupTopology.hpp"
#include "PendingGroupOperation.hpp"
#include "SettleTimer.hpp"
#include "device/DeviceAttributes.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SpeakerLink {

class DeviceHandle;

/** \brief Debounce and settle delays of a grouping episode. */
struct GroupTiming {
    /// Collects further requests before the physical call is made.
    std::chrono::milliseconds settle{1000};
    /// Wait after the call for slaves to report their new role.
    std::chrono::milliseconds post_commit{1000};
};

/** \brief Read-only copy of the pending operation, for status displays and tests. */
struct PendingGroupStatus {
    DeviceId master_id;
    std::vector<DeviceId> to_add;
    std::vector<DeviceId> to_remove;
    bool timer_armed{false};
    bool in_progress{false};
};

/**
 * \brief Validates and batches grouping requests into whole-group replacement calls.
 *
 * Responsibilities:
 * - Directory of registered \c DeviceHandle objects (registration order is kept).
 * - Derive group membership from live attributes (\c resolve_group_members).
 * - Check topology rules, merge accepted requests into one \c PendingGroupOperation
 *   and issue a single \c DeviceHandle::group call when the settle timer fires.
 * - Tell topology listeners to re-derive their views.
 *
 * Request methods throw \c std::system_error with \c DeviceErrc::grouping_error
 * synchronously on rejection; the returned future reports the outcome of the
 * physical call once the episode has settled. Can be used as a singleton via
 * \c instance() or instantiated directly for testing.
 */
class GroupCoordinator {
public:
    using CommitFuture = std::shared_future<void>;
    using TopologyListener = std::function<void()>;
    using ListenerId = std::uint64_t;

    explicit GroupCoordinator(GroupTiming timing = {}, std::shared_ptr<Logger> logger = nullptr);
    ~GroupCoordinator();

    /** \brief Global instance used by the daemon. */
    static GroupCoordinator& instance();

    GroupCoordinator(const GroupCoordinator&) = delete;
    GroupCoordinator& operator=(const GroupCoordinator&) = delete;

    /** \brief Replace timing and logger; takes effect for the next episode. */
    void configure(GroupTiming timing, std::shared_ptr<Logger> logger);

    // =========================================================================
    // Directory
    // =========================================================================

    /** \brief Add or replace \p id in the directory and observe its topology changes. */
    void register_device(const DeviceId& id, std::shared_ptr<DeviceHandle> handle);
    /** \return false if \p id was not registered. */
    bool unregister_device(const DeviceId& id);
    std::shared_ptr<DeviceHandle> find_device(const DeviceId& id) const;
    std::vector<DeviceId> device_ids() const;

    // =========================================================================
    // Grouping
    // =========================================================================

    /**
     * \brief Queue \p member_ids to join the group led by \p master_id.
     * \throws std::system_error (DeviceErrc::grouping_error) on any rule violation
     *         or while an operation is in progress; nothing is queued in that case.
     */
    CommitFuture request_add_to_group(const DeviceId& master_id, const std::vector<DeviceId>& member_ids);

    /**
     * \brief Queue \p member_id to leave the group led by \p master_id.
     * \throws std::system_error (DeviceErrc::grouping_error)
     */
    CommitFuture request_remove_from_group(const DeviceId& master_id, const DeviceId& member_id);

    /**
     * \brief Dissolve the group if \p id is a master, otherwise take \p id out of its group.
     * \throws std::system_error (DeviceErrc::grouping_error) if \p id is not grouped.
     */
    CommitFuture request_ungroup(const DeviceId& id);

    /** \brief [master, slave...] for a grouped device, std::nullopt otherwise. */
    std::optional<std::vector<DeviceId>> resolve_group_members(const DeviceId& id) const;

    /** \brief Master of \p id's group, or \p id when ungrouped. */
    DeviceId playback_source(const DeviceId& id) const;

    bool grouping_in_progress() const;
    std::optional<PendingGroupStatus> pending_operation() const;

    // =========================================================================
    // Topology listeners
    // =========================================================================

    ListenerId add_topology_listener(TopologyListener listener);
    bool remove_topology_listener(ListenerId id);
    /** \brief Ask every listener to re-derive its view; a listener that throws is logged and skipped. */
    void notify_topology_changed();

    /** \brief Cancel timers and fail a pending operation that never started. */
    void shutdown();

private:
    /// Topology observer of every registered handle.
    void on_device_topology(const DeviceId& id);
    std::vector<DeviceView> snapshot_views() const;
    std::shared_ptr<DeviceHandle> find_by_address(const std::string& address) const;

    std::shared_ptr<DeviceHandle> validate_master_locked(const DeviceId& master_id) const;
    void check_no_conflict_locked(const DeviceId& master_id) const;
    void validate_removal_locked(const DeviceId& master_id,
                                 const std::shared_ptr<DeviceHandle>& master,
                                 const DeviceId& member_id) const;
    CommitFuture enqueue_locked(const DeviceId& master_id,
                                const std::vector<DeviceId>& to_add,
                                const std::vector<DeviceId>& to_remove);
    void commit();

    [[noreturn]] void reject(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    GroupTiming timing_;

    mutable std::shared_mutex directory_mtx_;
    std::vector<std::pair<DeviceId, std::shared_ptr<DeviceHandle>>> directory_;

    mutable std::mutex order_mtx_;
    std::unordered_map<DeviceId, std::vector<DeviceId>> slave_order_;

    mutable std::mutex pending_mtx_;
    std::unique_ptr<PendingGroupOperation> pending_;

    mutable std::mutex listeners_mtx_;
    std::vector<std::pair<ListenerId, TopologyListener>> listeners_;
    ListenerId next_listener_id_{1};

    SettleTimer timer_;
};

} // namespace SpeakerLink
