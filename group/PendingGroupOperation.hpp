/**
 * \file group/PendingGroupOperation.hpp
 * \brief Accumulated join/leave requests for one master awaiting the settle timer.
 */
#pragma once

#include "device/DeviceAttributes.hpp"

#include <algorithm>
#include <future>
#include <vector>

namespace SpeakerLink {

/**
 * \brief At most one exists at a time, owned by \c GroupCoordinator.
 *
 * \c to_add and \c to_remove keep request order and never share an id.
 */
struct PendingGroupOperation {
    DeviceId master_id;
    std::vector<DeviceId> to_add;
    std::vector<DeviceId> to_remove;
    bool timer_armed{false};
    bool in_progress{false};

    std::promise<void> done;
    std::shared_future<void> result{done.get_future().share()};

    explicit PendingGroupOperation(DeviceId master) : master_id(std::move(master)) {}

    void add_member(const DeviceId& id) {
        erase(to_remove, id);
        if (std::find(to_add.begin(), to_add.end(), id) == to_add.end()) to_add.push_back(id);
    }

    void remove_member(const DeviceId& id) {
        erase(to_add, id);
        if (std::find(to_remove.begin(), to_remove.end(), id) == to_remove.end()) to_remove.push_back(id);
    }

    /** \brief (before - to_remove) followed by the new entries of to_add. */
    std::vector<DeviceId> slaves_after(const std::vector<DeviceId>& before) const {
        std::vector<DeviceId> after;
        for (const auto& id : before) {
            if (std::find(to_remove.begin(), to_remove.end(), id) == to_remove.end()) after.push_back(id);
        }
        for (const auto& id : to_add) {
            if (std::find(after.begin(), after.end(), id) == after.end()) after.push_back(id);
        }
        return after;
    }

private:
    static void erase(std::vector<DeviceId>& ids, const DeviceId& id) {
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    }
};

} // namespace SpeakerLink
