#pragma once
/** @file  FakeSpeakerNetwork.hpp
 *  @brief Speakers on a SimulatedNetwork wired into a private GroupCoordinator, with fast timings.
 */

#include "client/SimulatedNetwork.hpp"
#include "client/SimulatedSpeaker.hpp"
#include "device/DeviceHandle.hpp"
#include "group/GroupCoordinator.hpp"
#include "logger.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace SpeakerLink {
  namespace test {

    /**
     * @class FakeSpeakerNetwork
     * @brief Builds connected DeviceHandles whose grouping attributes propagate like real speakers.
     *
     * Hosts are derived from ids ("S1" -> "10.0.0.S1") so master addresses are easy to read in failures.
     */
    class FakeSpeakerNetwork {
    public:
      explicit FakeSpeakerNetwork(GroupTiming timing = {std::chrono::milliseconds(30), std::chrono::milliseconds(5)})
          : logger(std::make_shared<Logger>("test"))
          , sink(std::make_shared<VectorSink>())
          , network(std::make_shared<SimulatedNetwork>(logger))
          , coordinator(timing, logger) {
        sink->set_level(LogLevel::Debug);
        logger->add_sink(sink);
      }

      ~FakeSpeakerNetwork() {
        coordinator.shutdown();
        for (auto& [id, handle] : handles) {
          coordinator.unregister_device(id);
          handle->shutdown();
        }
      }

      static std::string host_of(const std::string& id) { return "10.0.0." + id; }

      /// Add, connect and register a speaker.
      std::shared_ptr<DeviceHandle> add(const std::string& id, bool connect = true) {
        network->add_speaker(host_of(id), id);
        DeviceConfig cfg{id, host_of(id), 55001, id};
        auto client = std::make_shared<SimulatedSpeaker>(network, SpeakerEndpoint{id, cfg.host, cfg.port}, logger);
        ReconnectPolicy policy{std::chrono::milliseconds(5), 2, std::chrono::milliseconds(20)};
        auto handle = std::make_shared<DeviceHandle>(cfg, client, policy, HealthCheckTiming{}, logger);
        if (connect) handle->connect();
        coordinator.register_device(id, handle);
        handles[id] = handle;
        return handle;
      }

      std::shared_ptr<DeviceHandle> handle(const std::string& id) { return handles.at(id); }
      DeviceAttributes attributes(const std::string& id) const { return network->attributes(host_of(id)); }
      std::uint64_t group_calls(const std::string& master) const { return network->group_calls(host_of(master)); }

      /// Group \p master with \p slaves directly on the network, bypassing the coordinator.
      void preset_group(const std::string& master, const std::vector<std::string>& slaves) {
        std::vector<SpeakerEndpoint> after;
        for (const auto& id : slaves) after.push_back({id, host_of(id), 55001});
        handles.at(master)->group({}, after);
      }

      std::shared_ptr<Logger> logger;
      std::shared_ptr<VectorSink> sink;
      std::shared_ptr<SimulatedNetwork> network;
      GroupCoordinator coordinator;
      std::map<std::string, std::shared_ptr<DeviceHandle>> handles;
    };

    /// Poll \p pred until it holds or \p timeout passes.
    template <typename Pred>
    bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
      }
      return pred();
    }

  } // namespace test
} // namespace SpeakerLink
