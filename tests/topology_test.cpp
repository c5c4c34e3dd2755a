// speaker-link headers
#include "group/GroupTopology.hpp"
#include "group/PendingGroupOperation.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace SpeakerLink::test {

  using ::testing::ElementsAre;

  namespace {

    DeviceView speaker(const std::string& id, bool connected = true) {
      DeviceView v;
      v.id = id;
      v.address = "10.0.0." + id;
      v.connected = connected;
      v.attributes.number_of_members = 1;
      return v;
    }

    DeviceView master(const std::string& id, int members) {
      auto v = speaker(id);
      v.attributes.is_master = true;
      v.attributes.number_of_members = members;
      return v;
    }

    DeviceView slave(const std::string& id, const std::string& master_id, bool connected = true) {
      auto v = speaker(id, connected);
      v.attributes.is_slave = true;
      v.attributes.master_address = "10.0.0." + master_id;
      return v;
    }

  } // namespace

  TEST(GroupTopologyTest, MasterListsItselfThenItsSlaves) {
    std::vector<DeviceView> devices{master("S1", 3), slave("S2", "S1"), slave("S3", "S1"), speaker("S4")};
    auto members = resolve_group_members("S1", devices);
    ASSERT_TRUE(members.has_value());
    EXPECT_THAT(*members, ElementsAre("S1", "S2", "S3"));
  }

  TEST(GroupTopologyTest, SlaveResolvesTheSameGroup) {
    std::vector<DeviceView> devices{master("S1", 3), slave("S2", "S1"), slave("S3", "S1")};
    EXPECT_EQ(resolve_group_members("S3", devices), resolve_group_members("S1", devices));
  }

  TEST(GroupTopologyTest, UngroupedUnknownAndOfflineDevicesHaveNoGroup) {
    std::vector<DeviceView> devices{speaker("S1"), speaker("S2", false), master("S3", 1)};
    EXPECT_FALSE(resolve_group_members("S1", devices).has_value());
    EXPECT_FALSE(resolve_group_members("S2", devices).has_value());
    EXPECT_FALSE(resolve_group_members("S9", devices).has_value());
    EXPECT_THAT(*resolve_group_members("S3", devices), ElementsAre("S3"));
  }

  TEST(GroupTopologyTest, OfflineSlavesAreLeftOut) {
    std::vector<DeviceView> devices{master("S1", 3), slave("S2", "S1", false), slave("S3", "S1")};
    EXPECT_THAT(*resolve_group_members("S1", devices), ElementsAre("S1", "S3"));
  }

  TEST(GroupTopologyTest, SlaveWithoutKnownMasterListsItsPeers) {
    std::vector<DeviceView> devices{slave("S2", "S1"), slave("S3", "S1"), speaker("S4")};
    EXPECT_THAT(*resolve_group_members("S2", devices), ElementsAre("S2", "S3"));
  }

  TEST(GroupTopologyTest, OrderHintFixesSlaveOrder) {
    std::vector<DeviceView> devices{master("S1", 4), slave("S2", "S1"), slave("S3", "S1"), slave("S4", "S1")};
    auto members = resolve_group_members("S1", devices, {"S4", "S2"});
    EXPECT_THAT(*members, ElementsAre("S1", "S4", "S2", "S3"));
  }

  TEST(GroupTopologyTest, ResolutionIsRepeatable) {
    std::vector<DeviceView> devices{master("S1", 3), slave("S3", "S1"), slave("S2", "S1")};
    const auto first = resolve_group_members("S2", devices);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(resolve_group_members("S2", devices), first);
  }

  TEST(GroupTopologyTest, PlaybackSourceIsMasterOrSelf) {
    std::vector<DeviceView> devices{master("S1", 2), slave("S2", "S1"), speaker("S3"), slave("S5", "S4")};
    EXPECT_EQ(playback_source("S1", devices), "S1");
    EXPECT_EQ(playback_source("S2", devices), "S1");
    EXPECT_EQ(playback_source("S3", devices), "S3");
    EXPECT_EQ(playback_source("S5", devices), "S5");
  }

  // ---------------------------------------------------------------------------
  // PendingGroupOperation
  // ---------------------------------------------------------------------------

  TEST(PendingGroupOperationTest, AddAndRemoveStayDisjoint) {
    PendingGroupOperation op("S1");
    op.add_member("S2");
    op.add_member("S3");
    op.remove_member("S2");
    op.add_member("S3");
    EXPECT_THAT(op.to_add, ElementsAre("S3"));
    EXPECT_THAT(op.to_remove, ElementsAre("S2"));

    op.add_member("S2");
    EXPECT_THAT(op.to_add, ElementsAre("S3", "S2"));
    EXPECT_TRUE(op.to_remove.empty());
  }

  TEST(PendingGroupOperationTest, SlavesAfterKeepsExistingOrderThenAppends) {
    PendingGroupOperation op("S1");
    op.remove_member("S2");
    op.add_member("S5");
    op.add_member("S3");
    EXPECT_THAT(op.slaves_after({"S2", "S3", "S4"}), ElementsAre("S3", "S4", "S5"));
  }

} // namespace SpeakerLink::test
