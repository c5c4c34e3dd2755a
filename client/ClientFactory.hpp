/**
 * \file client/ClientFactory.hpp
 * \brief Factory helpers for creating speaker clients of the selected backend.
 * \details Centralizes backend resolution and construction.
 */
#pragma once

#include "device/DeviceAttributes.hpp"
#include "logger.hpp"

#include <memory>
#include <optional>
#include <string>

namespace SpeakerLink {

class IDeviceClient;

/** \brief Supported client backend types for factory resolution. */
enum class ClientType
{
    Simulated
};

/** \brief Map a backend name ("simulated", "sim") to its type; case-insensitive. */
std::optional<ClientType> parse_client_type(const std::string& name);

/** \brief Static factory for creating \c IDeviceClient implementations.
 *  \details Ensures consistent backend selection and optional logger propagation.
 */
class ClientFactory {
public:
    /** \brief Set default backend type used by \c create_client. */
    static void set_default_client_type(ClientType type) noexcept;
    /** \brief Retrieve current default backend type. */
    static ClientType get_default_client_type() noexcept;

    /**
     * \brief Create a client for \p endpoint with optional logger injection.
     * \param name Display name announced by simulated speakers.
     */
    static std::shared_ptr<IDeviceClient> create_client(const SpeakerEndpoint& endpoint,
                                                        const std::string& name,
                                                        std::shared_ptr<Logger> logger);

private:
    // Static-only: prevent instantiation
    ClientFactory() = delete;

    static inline ClientType default_type_ = ClientType::Simulated;
};

} // namespace SpeakerLink
