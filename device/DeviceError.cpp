/**
 * \file device/DeviceError.cpp
 * \brief \c std::error_category for \c DeviceErrc.
 */
#include "DeviceError.hpp"

namespace SpeakerLink {

namespace {

class DeviceCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "speaker-link.device"; }

    std::string message(int ev) const override {
        switch (static_cast<DeviceErrc>(ev)) {
            case DeviceErrc::connection_failure: return "connection to speaker failed";
            case DeviceErrc::call_timeout:       return "speaker call timed out";
            case DeviceErrc::grouping_error:     return "grouping rejected";
            case DeviceErrc::not_found:          return "unknown speaker";
            case DeviceErrc::other:              return "speaker command failed";
        }
        return "unknown speaker error";
    }
};

} // namespace

const std::error_category& device_category() noexcept {
    static const DeviceCategory category;
    return category;
}

std::error_code make_error_code(DeviceErrc e) noexcept {
    return {static_cast<int>(e), device_category()};
}

bool is_connection_class(const std::error_code& ec, TimeoutPolicy policy) noexcept {
    if (ec == DeviceErrc::connection_failure) return true;
    if (ec == DeviceErrc::call_timeout) return policy == TimeoutPolicy::TriggerReconnect;

    // Socket-level errors from clients that report raw errno values.
    if (ec == std::errc::connection_refused || ec == std::errc::connection_reset ||
        ec == std::errc::connection_aborted || ec == std::errc::not_connected ||
        ec == std::errc::broken_pipe || ec == std::errc::host_unreachable ||
        ec == std::errc::network_unreachable || ec == std::errc::network_down) {
        return true;
    }
    return ec == std::errc::timed_out && policy == TimeoutPolicy::TriggerReconnect;
}

void throw_device_error(DeviceErrc e, const std::string& what) {
    throw std::system_error(make_error_code(e), what);
}

} // namespace SpeakerLink
