// speaker-link headers
#include "daemon/ConsoleCommands.hpp"
#include "daemon/SpeakerLinkOptions.hpp"
#include "options/Options.hpp"

// Fakes
#include "FakeSpeakerNetwork.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace SpeakerLink::test {

  using ::testing::HasSubstr;
  using namespace std::chrono_literals;

  // ---------------------------------------------------------------------------
  // Options
  // ---------------------------------------------------------------------------

  namespace {

    shared_opts::Options::ParseResult parse(std::vector<std::string> args, std::string& err) {
      args.insert(args.begin(), "speakerlinkd");
      std::vector<char*> argv;
      for (auto& a : args) argv.push_back(a.data());
      return shared_opts::Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), err);
    }

    std::filesystem::path write_config(const std::string& name, const std::string& text) {
      const auto path = std::filesystem::temp_directory_path() / name;
      std::ofstream(path) << text;
      return path;
    }

  } // namespace

  TEST(SpeakerSpecTest, ParsesIdHostAndOptionalPort) {
    auto plain = link_opts::parse_speaker_spec("kitchen=192.168.1.20");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->id, "kitchen");
    EXPECT_EQ(plain->host, "192.168.1.20");
    EXPECT_EQ(plain->port, 55001);
    EXPECT_EQ(plain->name, "kitchen");

    auto with_port = link_opts::parse_speaker_spec("den=10.0.0.6:1234");
    ASSERT_TRUE(with_port.has_value());
    EXPECT_EQ(with_port->host, "10.0.0.6");
    EXPECT_EQ(with_port->port, 1234);
  }

  TEST(SpeakerSpecTest, RejectsMalformedEntries) {
    for (const char* bad : {"", "kitchen", "=10.0.0.1", "kitchen=", "kitchen=:80", "kitchen=host:", "kitchen=host:0",
                            "kitchen=host:99999", "kitchen=host:8o"}) {
      EXPECT_FALSE(link_opts::parse_speaker_spec(bad).has_value()) << bad;
    }
  }

  TEST(LinkOptionsTest, DefaultsMatchTheDocumentedSchedule) {
    std::string err;
    ASSERT_EQ(parse({}, err), shared_opts::Options::ParseResult::Ok) << err;
    const auto s = link_opts::current_settings();
    EXPECT_TRUE(s.speakers.empty());
    EXPECT_EQ(s.health.check_interval, 3600s);
    EXPECT_EQ(s.health.stale_after, 3660s);
    EXPECT_EQ(s.reconnect.base, 10s);
    EXPECT_EQ(s.reconnect.cap_exponent, 6u);
    EXPECT_EQ(s.reconnect.max_interval, 640s);
    EXPECT_EQ(s.grouping.settle, 1000ms);
    EXPECT_EQ(s.grouping.post_commit, 1000ms);
    EXPECT_EQ(s.log_level, LogLevel::Info);
    EXPECT_FALSE(s.log_file.has_value());
    EXPECT_FALSE(s.interactive);
    EXPECT_EQ(s.client, ClientType::Simulated);
  }

  TEST(LinkOptionsTest, ConfigFileSeedsValuesAndCommandLineOverrides) {
    const auto path = write_config("speakerlink_options_test.json", R"({
      "speakers": [
        { "id": "kitchen", "host": "10.0.0.5", "name": "Kitchen" },
        { "id": "den", "host": "10.0.0.7", "port": 80 }
      ],
      "link": {
        "reconnect_base_s": 5,
        "reconnect_max_s": 160,
        "group_settle_ms": 200,
        "log_level": "debug",
        "log_file": "speaker.log",
        "interactive": true
      }
    })");

    std::string err;
    ASSERT_EQ(parse({"-c", path.string(), "--speaker", "den=10.0.0.6:1234", "--speaker", "porch=10.0.0.8",
                     "--reconnect-max", "320"}, err),
              shared_opts::Options::ParseResult::Ok) << err;
    const auto s = link_opts::current_settings();

    ASSERT_EQ(s.speakers.size(), 3u);
    EXPECT_EQ(s.speakers[0].id, "kitchen");
    EXPECT_EQ(s.speakers[0].name, "Kitchen");
    EXPECT_EQ(s.speakers[0].port, 55001);
    EXPECT_EQ(s.speakers[1].id, "den");
    EXPECT_EQ(s.speakers[1].host, "10.0.0.6");
    EXPECT_EQ(s.speakers[1].port, 1234);
    EXPECT_EQ(s.speakers[2].id, "porch");

    EXPECT_EQ(s.reconnect.base, 5s);
    EXPECT_EQ(s.reconnect.max_interval, 320s);
    EXPECT_EQ(s.grouping.settle, 200ms);
    EXPECT_EQ(s.log_level, LogLevel::Debug);
    ASSERT_TRUE(s.log_file.has_value());
    EXPECT_EQ(std::filesystem::path(*s.log_file).filename().string(), "speaker.log");
    EXPECT_TRUE(std::filesystem::path(*s.log_file).is_absolute());
    EXPECT_TRUE(s.interactive);

    std::filesystem::remove(path);
  }

  TEST(LinkOptionsTest, MalformedConfigFileIsReported) {
    const auto path = write_config("speakerlink_bad_config.json", "{ \"link\": ");
    std::string err;
    EXPECT_EQ(parse({"-c", path.string()}, err), shared_opts::Options::ParseResult::Error);
    EXPECT_THAT(err, HasSubstr("malformed"));
    std::filesystem::remove(path);

    EXPECT_EQ(parse({"-c", "/nonexistent/speakerlink.json"}, err), shared_opts::Options::ParseResult::Error);
  }

  TEST(LinkOptionsTest, InvalidValuesAreRejected) {
    std::string err;
    EXPECT_EQ(parse({"--speaker", "kitchen"}, err), shared_opts::Options::ParseResult::Error);
    EXPECT_EQ(parse({"--reconnect-cap-exponent", "31"}, err), shared_opts::Options::ParseResult::Error);

    ASSERT_EQ(parse({"--log-level", "chatty"}, err), shared_opts::Options::ParseResult::Ok) << err;
    EXPECT_THROW(link_opts::current_settings(), std::invalid_argument);

    ASSERT_EQ(parse({"--reconnect-base", "60", "--reconnect-max", "30"}, err), shared_opts::Options::ParseResult::Ok) << err;
    EXPECT_THROW(link_opts::current_settings(), std::invalid_argument);

    const auto path = write_config("speakerlink_missing_host.json", R"({ "speakers": [ { "id": "kitchen" } ] })");
    ASSERT_EQ(parse({"-c", path.string()}, err), shared_opts::Options::ParseResult::Ok) << err;
    EXPECT_THROW(link_opts::current_settings(), std::invalid_argument);
    std::filesystem::remove(path);
  }

  // ---------------------------------------------------------------------------
  // Console commands
  // ---------------------------------------------------------------------------

  class ConsoleCommandsTest : public ::testing::Test {
  protected:
    void SetUp() override {
      for (const char* id : {"S1", "S2", "S3"}) net.add(id);
    }

    std::string run(const std::string& line) {
      out.str("");
      EXPECT_TRUE(console.execute(line));
      return out.str();
    }

    FakeSpeakerNetwork net;
    std::ostringstream out;
    ConsoleCommands console{net.coordinator, net.network, out, net.logger};
  };

  TEST_F(ConsoleCommandsTest, StatusListsEverySpeaker) {
    const auto text = run("status");
    EXPECT_THAT(text, HasSubstr("S1"));
    EXPECT_THAT(text, HasSubstr("S2"));
    EXPECT_THAT(text, HasSubstr("S3"));
    EXPECT_THAT(text, HasSubstr("Connected"));
  }

  TEST_F(ConsoleCommandsTest, JoinThenMembersShowsTheGroup) {
    EXPECT_THAT(run("join S1 S3 S2"), HasSubstr("queued"));
    ASSERT_TRUE(eventually([&] { return !net.coordinator.pending_operation().has_value(); }));
    EXPECT_EQ(run("members S2"), "S1 S3 S2\n");

    EXPECT_THAT(run("leave S1 S3"), HasSubstr("queued"));
    ASSERT_TRUE(eventually([&] { return !net.coordinator.pending_operation().has_value(); }));
    EXPECT_EQ(run("members S1"), "S1 S2\n");
    EXPECT_EQ(run("members S3"), "S3 is not grouped\n");
  }

  TEST_F(ConsoleCommandsTest, RejectedGroupingIsPrintedAsError) {
    EXPECT_THAT(run("ungroup S1"), HasSubstr("error:"));
    EXPECT_THAT(run("join S1 S9"), HasSubstr("error:"));
  }

  TEST_F(ConsoleCommandsTest, VolumeReadsAndWrites) {
    EXPECT_THAT(run("volume S1 35"), HasSubstr("set to 35"));
    EXPECT_EQ(net.attributes("S1").volume, 35);
    EXPECT_EQ(run("volume S1"), "S1 volume 35\n");
    EXPECT_THAT(run("volume S1 200"), HasSubstr("error:"));
    EXPECT_THAT(run("volume S1 loud"), HasSubstr("usage:"));
  }

  TEST_F(ConsoleCommandsTest, DropDisconnectsAndRestoreAllowsReconnect) {
    net.handle("S2")->start_monitoring();
    EXPECT_THAT(run("drop S2"), HasSubstr("dropped"));
    EXPECT_FALSE(net.handle("S2")->is_connected());

    EXPECT_THAT(run("restore S2"), HasSubstr("restored"));
    EXPECT_TRUE(eventually([&] { return net.handle("S2")->is_connected(); }));
  }

  TEST_F(ConsoleCommandsTest, UsageAndUnknownCommands) {
    EXPECT_THAT(run("join S1"), HasSubstr("usage:"));
    EXPECT_THAT(run("members"), HasSubstr("usage:"));
    EXPECT_THAT(run("dance"), HasSubstr("unknown command"));
    EXPECT_EQ(run(""), "");
    EXPECT_THAT(run("help"), HasSubstr("ungroup <id>"));
    EXPECT_FALSE(console.execute("quit"));
  }

} // namespace SpeakerLink::test
