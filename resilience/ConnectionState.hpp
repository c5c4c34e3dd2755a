/**
 * \file resilience/ConnectionState.hpp
 * \brief Per-device connection state driven by the resilience engine.
 */
#pragma once

#include <string>

namespace SpeakerLink {

enum class ConnectionState {
    Connected,
    CheckingConnection,
    Disconnected,
    Reconnecting
};

inline std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected:          return "Connected";
        case ConnectionState::CheckingConnection: return "CheckingConnection";
        case ConnectionState::Disconnected:       return "Disconnected";
        case ConnectionState::Reconnecting:       return "Reconnecting";
    }
    return "Unknown";
}

} // namespace SpeakerLink
