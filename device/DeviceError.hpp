/**
 * \file device/DeviceError.hpp
 * \brief Error taxonomy shared by device clients, handles and the group coordinator.
 */
#pragma once

#include <string>
#include <system_error>

namespace SpeakerLink {

/** \brief Failure classes reported through \c std::system_error. */
enum class DeviceErrc {
    connection_failure = 1, ///< Network or session lost; starts the resilience engine.
    call_timeout,           ///< Speaker did not answer in time; reconnect is caller-selectable.
    grouping_error,         ///< Topology rule violated or a grouping operation is in progress.
    not_found,              ///< Unknown device id.
    other                   ///< Anything else; logged and surfaced, no state change.
};

/** \brief Whether a command timeout should be treated as a lost connection. */
enum class TimeoutPolicy { Ignore, TriggerReconnect };

const std::error_category& device_category() noexcept;

std::error_code make_error_code(DeviceErrc e) noexcept;

/** \brief True if \p ec should hand the device over to the resilience engine. */
bool is_connection_class(const std::error_code& ec, TimeoutPolicy policy) noexcept;

/** \brief Throw a \c std::system_error tagged with \p e. */
[[noreturn]] void throw_device_error(DeviceErrc e, const std::string& what);

} // namespace SpeakerLink

namespace std {
template <>
struct is_error_code_enum<SpeakerLink::DeviceErrc> : true_type {};
}
