#pragma once
/** @file  FakeDeviceClient.hpp
 *  @brief IDeviceClient with scripted failures and call counters for handle and supervisor tests.
 */

#include "device/DeviceError.hpp"
#include "device/IDeviceClient.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace SpeakerLink {
  namespace test {

    /**
     * @class FakeDeviceClient
     * @brief Thread-safe fake; supervisor threads call into it while the test thread scripts it.
     */
    class FakeDeviceClient : public IDeviceClient {
    public:
      // --- scripting ---

      /// Number of upcoming connect() calls that fail with connection_failure.
      void fail_connects(int count) {
        std::lock_guard<std::mutex> lk(mtx_);
        connect_failures_ = count;
      }
      /// Every connect() fails until cleared.
      void set_unreachable(bool unreachable) {
        std::lock_guard<std::mutex> lk(mtx_);
        unreachable_ = unreachable;
      }
      /// Error thrown by get_volume() (the probe) until cleared.
      void set_probe_error(std::optional<DeviceErrc> error) {
        std::lock_guard<std::mutex> lk(mtx_);
        probe_error_ = error;
      }
      /// Error thrown by every other command until cleared.
      void set_command_error(std::optional<DeviceErrc> error) {
        std::lock_guard<std::mutex> lk(mtx_);
        command_error_ = error;
      }
      void set_attributes(const DeviceAttributes& attributes) {
        std::lock_guard<std::mutex> lk(mtx_);
        attributes_ = attributes;
      }
      /// Pretend the speaker was last heard from at \p when.
      void set_last_seen(std::optional<std::chrono::steady_clock::time_point> when) {
        std::lock_guard<std::mutex> lk(mtx_);
        attributes_.last_seen = when;
      }
      /// Deliver a push event as the transport would.
      void emit(const AttributeDelta& delta, const DeviceAttributes& updated) {
        EventHandler handler;
        {
          std::lock_guard<std::mutex> lk(mtx_);
          attributes_ = updated;
          handler = handler_;
        }
        if (handler) handler(delta);
      }

      // --- observation ---

      std::atomic<int> connect_calls{0};
      std::atomic<int> disconnect_calls{0};
      std::atomic<int> probe_calls{0};
      std::atomic<int> group_calls{0};
      std::atomic<int> volume_sets{0};

      std::vector<SpeakerEndpoint> last_before() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return last_before_;
      }
      std::vector<SpeakerEndpoint> last_after() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return last_after_;
      }
      bool has_event_handler() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return static_cast<bool>(handler_);
      }

      // --- IDeviceClient ---

      void connect() override {
        ++connect_calls;
        std::lock_guard<std::mutex> lk(mtx_);
        if (unreachable_ || connect_failures_ > 0) {
          if (connect_failures_ > 0) --connect_failures_;
          throw_device_error(DeviceErrc::connection_failure, "fake: unreachable");
        }
        connected_ = true;
        attributes_.last_seen = std::chrono::steady_clock::now();
      }

      void disconnect() override {
        ++disconnect_calls;
        std::lock_guard<std::mutex> lk(mtx_);
        connected_ = false;
      }

      void update() override {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!connected_) throw_device_error(DeviceErrc::connection_failure, "fake: not connected");
      }

      bool is_connected() const override {
        std::lock_guard<std::mutex> lk(mtx_);
        return connected_;
      }

      DeviceAttributes snapshot() const override {
        std::lock_guard<std::mutex> lk(mtx_);
        return attributes_;
      }

      int get_volume() override {
        ++probe_calls;
        std::lock_guard<std::mutex> lk(mtx_);
        if (probe_error_) throw_device_error(*probe_error_, "fake: probe failed");
        return attributes_.volume;
      }

      void set_volume(int volume) override {
        ++volume_sets;
        std::lock_guard<std::mutex> lk(mtx_);
        fail_command_locked();
        attributes_.volume = volume;
      }

      void set_mute(bool mute) override {
        std::lock_guard<std::mutex> lk(mtx_);
        fail_command_locked();
        attributes_.muted = mute;
      }

      void play() override { command("play"); }
      void pause() override { command("pause"); }
      void stop() override { command("stop"); }
      void next_track() override { command(nullptr); }
      void previous_track() override { command(nullptr); }

      void group(const std::vector<SpeakerEndpoint>& before,
                 const std::vector<SpeakerEndpoint>& after) override {
        ++group_calls;
        std::lock_guard<std::mutex> lk(mtx_);
        fail_command_locked();
        last_before_ = before;
        last_after_ = after;
      }

      void set_event_handler(EventHandler handler) override {
        std::lock_guard<std::mutex> lk(mtx_);
        handler_ = std::move(handler);
      }

    private:
      void fail_command_locked() {
        if (command_error_) throw_device_error(*command_error_, "fake: command failed");
      }

      void command(const char* playback_state) {
        std::lock_guard<std::mutex> lk(mtx_);
        fail_command_locked();
        if (playback_state) attributes_.playback_state = playback_state;
      }

      mutable std::mutex mtx_;
      bool connected_ = false;
      bool unreachable_ = false;
      int connect_failures_ = 0;
      std::optional<DeviceErrc> probe_error_;
      std::optional<DeviceErrc> command_error_;
      DeviceAttributes attributes_;
      EventHandler handler_;
      std::vector<SpeakerEndpoint> last_before_;
      std::vector<SpeakerEndpoint> last_after_;
    };

  } // namespace test
} // namespace SpeakerLink
