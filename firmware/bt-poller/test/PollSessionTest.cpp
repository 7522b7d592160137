#include "PollSession.hpp"

#include <gtest/gtest.h>

#include "TestUtil.hpp"

namespace tpms {
namespace {

using test::kID1;
using test::kID2;
using test::kID3;
using test::kID4;

class PollSessionTest : public ::testing::Test {
 protected:
  PollSessionTest() {
    opts_.mapping = PositionMap::Defaults();
  }

  std::unique_ptr<PollSession> MakeSession() {
    return std::unique_ptr<PollSession>(
        new PollSession(opts_, [this]() { num_complete_++; }));
  }

  PollSession::Options opts_;
  int num_complete_ = 0;
};

TEST_F(PollSessionTest, StoresMappedReadings) {
  auto s = MakeSession();
  EXPECT_EQ(PollSession::Effect::kUpdated,
            s->HandleNotification(Str(test::DataPacket(kID2, 38, 30))));
  const auto &values = s->result().values;
  ASSERT_EQ(2u, values.size());
  EXPECT_EQ(30, values.at("tire2_pressure"));
  EXPECT_EQ(38, values.at("tire2_temperature"));
  EXPECT_EQ(1, s->data_count());
  EXPECT_TRUE(s->result().status.ok());
}

TEST_F(PollSessionTest, DropsRejectedPackets) {
  auto s = MakeSession();
  const std::vector<uint8_t> short_pkt = {0x00, 0x0E, 0xB3};
  auto head_unit = test::DataPacket(kID1, 40, 32);
  head_unit[0] = kTagStatus;
  EXPECT_EQ(PollSession::Effect::kNone,
            s->HandleNotification(Str(short_pkt)));
  EXPECT_EQ(PollSession::Effect::kNone,
            s->HandleNotification(Str(head_unit)));
  EXPECT_TRUE(s->result().values.empty());
  EXPECT_EQ(0, s->data_count());
}

TEST_F(PollSessionTest, IgnoresUnmappedSensors) {
  auto s = MakeSession();
  const std::vector<uint8_t> other = {0x01, 0x02, 0x03, 0x04};
  EXPECT_EQ(PollSession::Effect::kNone,
            s->HandleNotification(Str(test::DataPacket(other, 1, 2))));
  EXPECT_TRUE(s->result().values.empty());
  EXPECT_TRUE(s->discovered().empty());
  EXPECT_EQ(0, s->data_count());
}

TEST_F(PollSessionTest, ConfigOnlyCounts) {
  auto s = MakeSession();
  EXPECT_EQ(PollSession::Effect::kNone,
            s->HandleNotification(Str(test::ConfigPacket(kID1))));
  EXPECT_TRUE(s->result().values.empty());
  EXPECT_EQ(1, s->config_count());
  EXPECT_EQ(0, s->data_count());
}

TEST_F(PollSessionTest, Idempotent) {
  auto s = MakeSession();
  const auto pkt = test::DataPacket(kID1, 40, 32);
  s->HandleNotification(Str(pkt));
  const auto once = s->result().values;
  s->HandleNotification(Str(pkt));
  EXPECT_EQ(once, s->result().values);
}

TEST_F(PollSessionTest, LastWriteWins) {
  auto s = MakeSession();
  s->HandleNotification(Str(test::DataPacket(kID1, 40, 32)));
  s->HandleNotification(Str(test::DataPacket(kID1, 41, 33)));
  EXPECT_EQ(33, s->result().values.at("tire1_pressure"));
  EXPECT_EQ(41, s->result().values.at("tire1_temperature"));
}

TEST_F(PollSessionTest, CompletesOnce) {
  auto s = MakeSession();
  s->HandleNotification(Str(test::DataPacket(kID1, 40, 32)));
  s->HandleNotification(Str(test::DataPacket(kID2, 41, 33)));
  s->HandleNotification(Str(test::DataPacket(kID3, 42, 34)));
  EXPECT_EQ(0, num_complete_);
  EXPECT_FALSE(s->complete());
  s->HandleNotification(Str(test::DataPacket(kID4, 43, 35)));
  EXPECT_EQ(1, num_complete_);
  EXPECT_TRUE(s->complete());
  EXPECT_FALSE(s->config_complete());
  s->HandleNotification(Str(test::DataPacket(kID1, 50, 60)));
  EXPECT_EQ(1, num_complete_);
  EXPECT_EQ(60, s->result().values.at("tire1_pressure"));
  EXPECT_EQ(8u, s->result().values.size());
}

TEST_F(PollSessionTest, NothingExpectedIsComplete) {
  opts_.expected_data = 0;
  auto s = MakeSession();
  EXPECT_TRUE(s->complete());
  EXPECT_EQ(1, num_complete_);
  s->HandleNotification(Str(test::DataPacket(kID1, 40, 32)));
  EXPECT_EQ(1, num_complete_);
  EXPECT_EQ(2u, s->result().values.size());
}

TEST_F(PollSessionTest, LearningWithNothingExpected) {
  opts_.expected_data = 0;
  opts_.learning = true;
  auto s = MakeSession();
  EXPECT_FALSE(s->complete());
  EXPECT_EQ(0, num_complete_);
}

TEST_F(PollSessionTest, ConfigDoesNotComplete) {
  auto s = MakeSession();
  for (const auto &id : {kID1, kID2, kID3, kID4}) {
    s->HandleNotification(Str(test::ConfigPacket(id)));
  }
  EXPECT_TRUE(s->config_complete());
  EXPECT_FALSE(s->complete());
  EXPECT_EQ(0, num_complete_);
}

TEST_F(PollSessionTest, LearningRecordsUnknownSensors) {
  opts_.learning = true;
  opts_.mapping = PositionMap();
  auto s = MakeSession();
  EXPECT_EQ(PollSession::Effect::kDiscovered,
            s->HandleNotification(Str(test::DataPacket(kID3, 1, 2))));
  EXPECT_EQ(PollSession::Effect::kNone,
            s->HandleNotification(Str(test::DataPacket(kID3, 1, 2))));
  EXPECT_EQ(PollSession::Effect::kDiscovered,
            s->HandleNotification(Str(test::DataPacket(kID1, 1, 2))));
  ASSERT_EQ(2u, s->discovered().size());
  EXPECT_EQ("0E-FF-47-02", s->discovered()[0]);
  EXPECT_EQ("0E-B3-0B-02", s->discovered()[1]);
  EXPECT_TRUE(s->result().values.empty());
}

TEST_F(PollSessionTest, LearningNeverCompletes) {
  opts_.learning = true;
  opts_.expected_data = 1;
  auto s = MakeSession();
  for (int i = 0; i < 5; i++) {
    s->HandleNotification(Str(test::DataPacket(kID1, 40, 32)));
  }
  EXPECT_EQ(5, s->data_count());
  EXPECT_FALSE(s->complete());
  EXPECT_EQ(0, num_complete_);
}

TEST_F(PollSessionTest, LearningIsCapped) {
  opts_.learning = true;
  opts_.mapping = PositionMap();
  opts_.max_discovered = 3;
  auto s = MakeSession();
  for (uint8_t i = 0; i < 10; i++) {
    const std::vector<uint8_t> id = {0x0E, 0x00, 0x00, i};
    s->HandleNotification(Str(test::DataPacket(id, 1, 2)));
  }
  EXPECT_EQ(3u, s->discovered().size());
}

TEST_F(PollSessionTest, TwoSensorScenario) {
  opts_.mapping = PositionMap();
  ASSERT_TRUE(opts_.mapping.Add(1, SensorID::Parse("0E-B3-0B-02").ValueOrDie())
                  .ok());
  ASSERT_TRUE(opts_.mapping.Add(2, SensorID::Parse("0E-88-46-02").ValueOrDie())
                  .ok());
  opts_.expected_data = 2;
  auto s = MakeSession();
  s->HandleNotification(Str(test::DataPacket(kID1, 40, 32)));
  EXPECT_EQ(0, num_complete_);
  s->HandleNotification(Str(test::DataPacket(kID2, 38, 30)));
  EXPECT_EQ(1, num_complete_);
  const std::map<std::string, int> expected = {
      {"tire1_temperature", 40},
      {"tire1_pressure", 32},
      {"tire2_temperature", 38},
      {"tire2_pressure", 30},
  };
  EXPECT_EQ(expected, s->result().values);
}

TEST(PollResultTest, ToJSON) {
  PollResult r;
  EXPECT_EQ("{}", r.ToJSON());
  r.values["tire1_pressure"] = 32;
  r.values["signal_strength"] = -70;
  EXPECT_EQ("{\"signal_strength\": -70, \"tire1_pressure\": 32}", r.ToJSON());
}

}  // namespace
}  // namespace tpms
