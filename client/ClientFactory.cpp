/**
 * \file client/ClientFactory.cpp
 * \brief Backend resolution and construction logic for speaker clients.
 */
#include "ClientFactory.hpp"
#include "SimulatedNetwork.hpp"
#include "SimulatedSpeaker.hpp"

#include <cctype>
#include <stdexcept>

namespace SpeakerLink {

std::optional<ClientType> parse_client_type(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "simulated" || lower == "sim") return ClientType::Simulated;
    return std::nullopt;
}

void ClientFactory::set_default_client_type(ClientType type) noexcept { default_type_ = type; }
ClientType ClientFactory::get_default_client_type() noexcept { return default_type_; }

std::shared_ptr<IDeviceClient> ClientFactory::create_client(const SpeakerEndpoint& endpoint,
                                                            const std::string& name,
                                                            std::shared_ptr<Logger> logger) {
    switch (default_type_) {
        case ClientType::Simulated: {
            auto network = SimulatedNetwork::shared();
            // Configured speakers exist on the simulated network from the start.
            network->add_speaker(endpoint.host, name.empty() ? endpoint.id : name);
            return std::make_shared<SimulatedSpeaker>(std::move(network), endpoint, std::move(logger));
        }
        default:
            throw std::invalid_argument("Unsupported client type for ClientFactory");
    }
}

} // namespace SpeakerLink
