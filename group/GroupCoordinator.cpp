/**
 * \file group/GroupCoordinator.cpp
 * \brief Implementation of the group coordinator.
 */
#include "GroupCoordinator.hpp"
#include "device/DeviceError.hpp"
#include "device/DeviceHandle.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace SpeakerLink {

namespace {

std::string join_ids(const std::vector<DeviceId>& ids) {
    std::string out = "[";
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i) out += ", ";
        out += ids[i];
    }
    return out + "]";
}

bool contains(const std::vector<DeviceId>& ids, const DeviceId& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

GroupCoordinator& GroupCoordinator::instance() {
    static GroupCoordinator instance;
    return instance;
}

GroupCoordinator::GroupCoordinator(GroupTiming timing, std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
    , timing_(timing)
{
}

GroupCoordinator::~GroupCoordinator() {
    shutdown();
    std::unique_lock<std::shared_mutex> lock(directory_mtx_);
    for (auto& [id, handle] : directory_) {
        if (handle) handle->set_topology_observer({});
    }
    directory_.clear();
}

void GroupCoordinator::configure(GroupTiming timing, std::shared_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    timing_ = timing;
    logger_ = std::move(logger);
}

void GroupCoordinator::register_device(const DeviceId& id, std::shared_ptr<DeviceHandle> handle) {
    if (!handle) {
        throw std::invalid_argument("GroupCoordinator: cannot register a null device handle");
    }
    handle->set_topology_observer([this](const DeviceId& changed) { on_device_topology(changed); });
    {
        std::unique_lock<std::shared_mutex> lock(directory_mtx_);
        auto it = std::find_if(directory_.begin(), directory_.end(),
                               [&id](const auto& entry) { return entry.first == id; });
        if (it != directory_.end()) {
            if (logger_) logger_->warning("(Coordinator) Replacing speaker " + id);
            if (it->second && it->second != handle) it->second->set_topology_observer({});
            it->second = std::move(handle);
        } else {
            if (logger_) logger_->debug("(Coordinator) Adding speaker " + id);
            directory_.emplace_back(id, std::move(handle));
        }
    }
    // Views of existing speakers may change once a group member becomes known.
    notify_topology_changed();
}

bool GroupCoordinator::unregister_device(const DeviceId& id) {
    std::shared_ptr<DeviceHandle> removed;
    {
        std::unique_lock<std::shared_mutex> lock(directory_mtx_);
        auto it = std::find_if(directory_.begin(), directory_.end(),
                               [&id](const auto& entry) { return entry.first == id; });
        if (it == directory_.end()) {
            if (logger_) logger_->error("(Coordinator) Can not delete " + id + " because it was not registered");
            return false;
        }
        removed = std::move(it->second);
        directory_.erase(it);
    }
    if (removed) removed->set_topology_observer({});
    {
        std::lock_guard<std::mutex> lock(order_mtx_);
        slave_order_.erase(id);
    }
    if (logger_) logger_->debug("(Coordinator) Deleted speaker " + id);
    notify_topology_changed();
    return true;
}

std::shared_ptr<DeviceHandle> GroupCoordinator::find_device(const DeviceId& id) const {
    std::shared_lock<std::shared_mutex> lock(directory_mtx_);
    for (const auto& [key, handle] : directory_) {
        if (key == id) return handle;
    }
    return nullptr;
}

std::vector<DeviceId> GroupCoordinator::device_ids() const {
    std::shared_lock<std::shared_mutex> lock(directory_mtx_);
    std::vector<DeviceId> ids;
    ids.reserve(directory_.size());
    for (const auto& [key, handle] : directory_) ids.push_back(key);
    return ids;
}

std::shared_ptr<DeviceHandle> GroupCoordinator::find_by_address(const std::string& address) const {
    std::shared_lock<std::shared_mutex> lock(directory_mtx_);
    for (const auto& [key, handle] : directory_) {
        if (handle && handle->host() == address) return handle;
    }
    return nullptr;
}

std::vector<DeviceView> GroupCoordinator::snapshot_views() const {
    std::shared_lock<std::shared_mutex> lock(directory_mtx_);
    std::vector<DeviceView> views;
    views.reserve(directory_.size());
    for (const auto& [key, handle] : directory_) {
        if (!handle) continue;
        views.push_back(DeviceView{key, handle->host(), handle->attributes(), handle->is_connected()});
    }
    return views;
}

std::optional<std::vector<DeviceId>> GroupCoordinator::resolve_group_members(const DeviceId& id) const {
    const auto views = snapshot_views();

    // Order hint comes only from the last committed slave list of the group's current master.
    DeviceId master_id;
    for (const auto& view : views) {
        if (view.id != id) continue;
        if (view.attributes.is_master) {
            master_id = id;
        } else if (view.attributes.is_slave) {
            for (const auto& candidate : views) {
                if (candidate.address == view.attributes.master_address) {
                    master_id = candidate.id;
                    break;
                }
            }
        }
        break;
    }

    std::vector<DeviceId> hint;
    if (!master_id.empty()) {
        std::lock_guard<std::mutex> lock(order_mtx_);
        auto it = slave_order_.find(master_id);
        if (it != slave_order_.end()) hint = it->second;
    }
    return SpeakerLink::resolve_group_members(id, views, hint);
}

DeviceId GroupCoordinator::playback_source(const DeviceId& id) const {
    return SpeakerLink::playback_source(id, snapshot_views());
}

bool GroupCoordinator::grouping_in_progress() const {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    return pending_ && pending_->in_progress;
}

std::optional<PendingGroupStatus> GroupCoordinator::pending_operation() const {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    if (!pending_) return std::nullopt;
    return PendingGroupStatus{pending_->master_id, pending_->to_add, pending_->to_remove,
                              pending_->timer_armed, pending_->in_progress};
}

void GroupCoordinator::reject(const std::string& message) const {
    if (logger_) logger_->error("(Coordinator) " + message);
    throw_device_error(DeviceErrc::grouping_error, message);
}

void GroupCoordinator::check_no_conflict_locked(const DeviceId& master_id) const {
    if (!pending_) return;
    if (pending_->in_progress) {
        reject("Grouping operation is already in progress");
    }
    if (pending_->master_id != master_id) {
        reject("A grouping operation for " + pending_->master_id + " is already pending");
    }
}

std::shared_ptr<DeviceHandle> GroupCoordinator::validate_master_locked(const DeviceId& master_id) const {
    auto master = find_device(master_id);
    if (!master) reject(master_id + " is not a known speaker");
    if (!master->is_connected()) reject(master_id + " is not available (online) at the moment");

    const auto attrs = master->attributes();
    if (attrs.is_slave) reject(master_id + " is already slave in a group");

    if (attrs.is_master) {
        // A partially failed episode can leave slaves the master no longer counts, or the reverse.
        const auto members = resolve_group_members(master_id);
        const auto known = members ? static_cast<int>(members->size()) : 1;
        if (known != attrs.number_of_members) {
            reject("All speakers in the group of " + master_id + " are not available (" +
                   std::to_string(known) + " known, " + std::to_string(attrs.number_of_members) + " reported)");
        }
    }
    return master;
}

void GroupCoordinator::validate_removal_locked(const DeviceId& master_id,
                                               const std::shared_ptr<DeviceHandle>& master,
                                               const DeviceId& member_id) const {
    if (member_id == master_id) reject(master_id + " is the master; dissolve the group instead");

    auto member = find_device(member_id);
    if (!member) reject(member_id + " is not a known speaker");

    const auto attrs = member->attributes();
    if (!attrs.is_slave || attrs.master_address != master->host()) {
        reject(member_id + " is not a slave of " + master_id);
    }
    const auto members = resolve_group_members(master_id);
    if (!members || !contains(*members, member_id)) {
        reject(member_id + " is not a member of the group of " + master_id);
    }
}

GroupCoordinator::CommitFuture GroupCoordinator::request_add_to_group(const DeviceId& master_id,
                                                                      const std::vector<DeviceId>& member_ids) {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    check_no_conflict_locked(master_id);
    auto master = validate_master_locked(master_id);

    std::vector<DeviceId> accepted;
    for (const auto& id : member_ids) {
        // The master may appear in its own member list.
        if (id == master_id || contains(accepted, id)) continue;

        auto member = find_device(id);
        if (!member) reject(id + " is not a known speaker");
        if (!member->is_connected()) reject(id + " is not available (online) at the moment");

        const auto attrs = member->attributes();
        if (attrs.is_master) reject(id + " is already a master and can't be grouped");
        if (attrs.is_slave && attrs.master_address != master->host()) {
            reject(id + " is slave in another group");
        }
        accepted.push_back(id);
    }
    if (accepted.empty()) reject("No speakers to group with " + master_id);

    return enqueue_locked(master_id, accepted, {});
}

GroupCoordinator::CommitFuture GroupCoordinator::request_remove_from_group(const DeviceId& master_id,
                                                                           const DeviceId& member_id) {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    check_no_conflict_locked(master_id);
    auto master = validate_master_locked(master_id);
    if (!master->attributes().is_master) reject(master_id + " is not the master of a group");
    validate_removal_locked(master_id, master, member_id);
    return enqueue_locked(master_id, {}, {member_id});
}

GroupCoordinator::CommitFuture GroupCoordinator::request_ungroup(const DeviceId& id) {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    if (pending_ && pending_->in_progress) reject("Grouping operation is already in progress");

    auto device = find_device(id);
    if (!device) reject(id + " is not a known speaker");
    const auto attrs = device->attributes();

    if (attrs.is_master) {
        check_no_conflict_locked(id);
        validate_master_locked(id);
        auto members = resolve_group_members(id);
        std::vector<DeviceId> slaves;
        if (members) slaves.assign(members->begin() + 1, members->end());
        if (slaves.empty()) reject(id + " has no slaves to release");
        return enqueue_locked(id, {}, slaves);
    }

    if (attrs.is_slave) {
        auto master = find_by_address(attrs.master_address);
        if (!master) reject("Master of " + id + " (" + attrs.master_address + ") is not a known speaker");
        const DeviceId master_id = master->id();
        check_no_conflict_locked(master_id);
        validate_master_locked(master_id);
        validate_removal_locked(master_id, master, id);
        return enqueue_locked(master_id, {}, {id});
    }

    reject(id + " is not part of a group");
}

GroupCoordinator::CommitFuture GroupCoordinator::enqueue_locked(const DeviceId& master_id,
                                                                const std::vector<DeviceId>& to_add,
                                                                const std::vector<DeviceId>& to_remove) {
    if (!pending_) {
        pending_ = std::make_unique<PendingGroupOperation>(master_id);
    }
    for (const auto& id : to_add) pending_->add_member(id);
    for (const auto& id : to_remove) pending_->remove_member(id);

    if (logger_) {
        logger_->debug("(Coordinator) Pending for " + master_id + ": add " + join_ids(pending_->to_add) +
                       ", remove " + join_ids(pending_->to_remove));
    }

    if (!pending_->timer_armed) {
        pending_->timer_armed = timer_.arm(timing_.settle, [this] { commit(); });
        if (!pending_->timer_armed) {
            // Timer refuses to arm only after shutdown.
            pending_.reset();
            reject("Group coordinator is shut down");
        }
    }
    return pending_->result;
}

void GroupCoordinator::commit() {
    DeviceId master_id;
    std::vector<DeviceId> to_add;
    std::vector<DeviceId> to_remove;
    GroupTiming timing;
    {
        std::lock_guard<std::mutex> lock(pending_mtx_);
        if (!pending_) return;
        pending_->timer_armed = false;
        pending_->in_progress = true;
        master_id = pending_->master_id;
        to_add = pending_->to_add;
        to_remove = pending_->to_remove;
        timing = timing_;
    }

    std::exception_ptr failure;
    try {
        auto master = find_device(master_id);
        if (!master) throw_device_error(DeviceErrc::not_found, master_id + " is no longer registered");

        std::vector<DeviceId> before;
        if (auto members = resolve_group_members(master_id); members && !members->empty() && members->front() == master_id) {
            before.assign(members->begin() + 1, members->end());
        }

        PendingGroupOperation plan(master_id);
        plan.to_add = to_add;
        plan.to_remove = to_remove;
        const auto after = plan.slaves_after(before);

        auto endpoints = [this](const std::vector<DeviceId>& ids) {
            std::vector<SpeakerEndpoint> out;
            for (const auto& id : ids) {
                if (auto handle = find_device(id)) {
                    out.push_back(handle->endpoint());
                } else if (logger_) {
                    logger_->warning("(Coordinator) " + id + " disappeared before grouping; skipped");
                }
            }
            return out;
        };

        if (logger_) {
            logger_->info("(Coordinator) Grouping " + master_id + ": " + join_ids(before) + " -> " + join_ids(after));
        }
        master->group(endpoints(before), endpoints(after));

        {
            std::lock_guard<std::mutex> lock(order_mtx_);
            if (after.empty()) slave_order_.erase(master_id);
            else slave_order_[master_id] = after;
        }
        if (logger_) logger_->info("(Coordinator) Grouping of " + master_id + " sent");
    } catch (const std::exception& e) {
        if (logger_) logger_->error("(Coordinator) Error while grouping " + master_id + ": " + e.what());
        failure = std::current_exception();
    }

    // Slaves report their new role to the master asynchronously; give them time to do so.
    timer_.sleep_for(timing.post_commit);

    std::unique_ptr<PendingGroupOperation> finished;
    {
        std::lock_guard<std::mutex> lock(pending_mtx_);
        finished = std::move(pending_);
    }

    if (finished) {
        if (failure) finished->done.set_exception(failure);
        else finished->done.set_value();
    }

    notify_topology_changed();
}

GroupCoordinator::ListenerId GroupCoordinator::add_topology_listener(TopologyListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    const ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool GroupCoordinator::remove_topology_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void GroupCoordinator::notify_topology_changed() {
    std::vector<TopologyListener> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mtx_);
        for (const auto& [id, listener] : listeners_) targets.push_back(listener);
    }
    for (const auto& listener : targets) {
        if (!listener) continue;
        try {
            listener();
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string{"(Coordinator) Topology listener failed: "} + e.what());
        }
    }
}

void GroupCoordinator::on_device_topology(const DeviceId& id) {
    // A group dissolved outside the coordinator leaves its committed order behind.
    auto handle = find_device(id);
    if (handle && handle->is_connected() && !handle->attributes().is_master) {
        bool committing = false;
        {
            std::lock_guard<std::mutex> lock(pending_mtx_);
            committing = pending_ && pending_->in_progress && pending_->master_id == id;
        }
        if (!committing) {
            std::lock_guard<std::mutex> lock(order_mtx_);
            if (slave_order_.erase(id) && logger_) {
                logger_->debug("(Coordinator) " + id + " is no longer a master; dropped its slave order");
            }
        }
    }
    notify_topology_changed();
}

void GroupCoordinator::shutdown() {
    timer_.stop();
    std::unique_ptr<PendingGroupOperation> abandoned;
    {
        std::lock_guard<std::mutex> lock(pending_mtx_);
        // A commit that already ran completes its own promise.
        if (pending_ && !pending_->in_progress) abandoned = std::move(pending_);
    }
    if (abandoned) {
        if (logger_) logger_->info("(Coordinator) Pending grouping of " + abandoned->master_id + " cancelled");
        abandoned->done.set_exception(std::make_exception_ptr(
            std::system_error(make_error_code(DeviceErrc::grouping_error), "grouping cancelled by shutdown")));
    }
}

} // namespace SpeakerLink
