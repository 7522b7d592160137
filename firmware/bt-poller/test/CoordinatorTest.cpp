#include "Coordinator.hpp"

#include <cstdio>
#include <memory>

#include <gtest/gtest.h>

#include "TestUtil.hpp"

namespace tpms {
namespace {

using test::kID1;
using test::kID2;
using test::kID3;
using test::kID4;

const char *kTwoDevices = R"({"devices": [
  {"id": "trailer", "addr": "aa:bb:cc:dd:ee:01", "family": "tirelinc"},
  {"id": "camper", "addr": "aa:bb:cc:dd:ee:02", "family": "tirelinc"}
]})";

const char *kOneDevice = R"({"devices": [
  {"id": "trailer", "addr": "aa:bb:cc:dd:ee:01", "family": "tirelinc"}
]})";

class CoordinatorTest : public ::testing::Test {
 protected:
  CoordinatorTest() : client_(&sched_), poller_(&client_, &sched_) {}

  void Init(const char *json, const std::string &path = "") {
    auto cs = DeviceConfig::Parse(json);
    ASSERT_TRUE(cs.ok()) << cs.status().ToString();
    coord_.reset(new Coordinator(cs.ValueOrDie(), path, &poller_, &sched_));
  }

  // Lets the poll in progress run to completion with a full set of data.
  void CompletePoll(uint8_t pressure = 32) {
    ASSERT_TRUE(poller_.busy());
    sched_.Advance(500);
    for (const auto &id : {kID1, kID2, kID3, kID4}) {
      EXPECT_TRUE(client_.Notify(test::DataPacket(id, 40, pressure)));
    }
    sched_.Advance(0);
  }

  std::string DataJSON(const char *id) {
    auto ds = coord_->GetDataJSON(id);
    EXPECT_TRUE(ds.ok()) << ds.status().ToString();
    return (ds.ok() ? ds.ValueOrDie() : std::string());
  }

  test::ManualScheduler sched_;
  test::FakeClient client_;
  Poller poller_;
  std::unique_ptr<Coordinator> coord_;
};

static bool Contains(const std::string &s, const std::string &what) {
  return (s.find(what) != std::string::npos);
}

TEST_F(CoordinatorTest, PollsOneAtATime) {
  Init(kTwoDevices);
  coord_->Start();
  EXPECT_EQ(1, client_.num_connects);
  EXPECT_TRUE(poller_.busy());
  CompletePoll();
  // The second device follows right away.
  EXPECT_EQ(2, client_.num_connects);
  EXPECT_TRUE(poller_.busy());
  CompletePoll();
  EXPECT_EQ(2, client_.num_connects);
  EXPECT_FALSE(poller_.busy());
  EXPECT_TRUE(coord_->IsAvailable("trailer").ValueOrDie());
  EXPECT_TRUE(coord_->IsAvailable("camper").ValueOrDie());
}

TEST_F(CoordinatorTest, StationaryInterval) {
  Init(kOneDevice);
  EXPECT_EQ(900000, coord_->GetIntervalMs("trailer").ValueOrDie());
  coord_->Start();
  CompletePoll();
  sched_.Advance(Coordinator::kStationaryIntervalMs - 1);
  EXPECT_EQ(1, client_.num_connects);
  sched_.Advance(1);
  EXPECT_EQ(2, client_.num_connects);
}

TEST_F(CoordinatorTest, SetMovingPollsNow) {
  const std::string path = ::testing::TempDir() + "coordinator_test.json";
  remove(path.c_str());
  Init(kOneDevice, path);
  coord_->Start();
  CompletePoll();
  EXPECT_EQ(1, client_.num_connects);
  ASSERT_TRUE(coord_->SetMoving("trailer", true).ok());
  EXPECT_EQ(2, client_.num_connects);
  EXPECT_EQ(15000, coord_->GetIntervalMs("trailer").ValueOrDie());
  CompletePoll();
  sched_.Advance(Coordinator::kMovingIntervalMs - 1);
  EXPECT_EQ(2, client_.num_connects);
  sched_.Advance(1);
  EXPECT_EQ(3, client_.num_connects);

  auto ls = DeviceConfig::Load(path);
  ASSERT_TRUE(ls.ok()) << ls.status().ToString();
  EXPECT_TRUE(ls.ValueOrDie().devices[0].moving);
  remove(path.c_str());
}

TEST_F(CoordinatorTest, KeepsLastGoodData) {
  Init(kOneDevice);
  coord_->Start();
  CompletePoll(32);
  EXPECT_TRUE(Contains(DataJSON("trailer"), "\"tire1_pressure\": 32"));

  // Reached, but nothing arrived.
  coord_->UpdateRSSI(coord_->config().devices[0].addr, -75);
  ASSERT_TRUE(coord_->RequestPoll("trailer", false).ok());
  sched_.Advance(5500);
  EXPECT_FALSE(poller_.busy());
  const std::string data = DataJSON("trailer");
  EXPECT_TRUE(Contains(data, "\"tire1_pressure\": 32")) << data;
  EXPECT_TRUE(Contains(data, "\"signal_strength\": -75")) << data;
  EXPECT_TRUE(Contains(data, "\"available\": true")) << data;

  // Fresh readings replace the old ones.
  ASSERT_TRUE(coord_->RequestPoll("trailer", false).ok());
  CompletePoll(35);
  EXPECT_TRUE(Contains(DataJSON("trailer"), "\"tire4_pressure\": 35"));
}

TEST_F(CoordinatorTest, Unavailable) {
  Init(kOneDevice);
  client_.connect_status = Status(STATUS_UNAVAILABLE, "out of range");
  coord_->Start();
  sched_.Advance(2000);
  EXPECT_FALSE(poller_.busy());
  EXPECT_FALSE(coord_->IsAvailable("trailer").ValueOrDie());
  EXPECT_TRUE(Contains(DataJSON("trailer"), "\"available\": false"));

  client_.connect_status = Status::OK();
  ASSERT_TRUE(coord_->RequestPoll("trailer", false).ok());
  CompletePoll();
  EXPECT_TRUE(coord_->IsAvailable("trailer").ValueOrDie());
}

TEST_F(CoordinatorTest, NeverPolled) {
  Init(kOneDevice);
  const std::string data = DataJSON("trailer");
  EXPECT_TRUE(Contains(data, "\"id\": \"trailer\"")) << data;
  EXPECT_TRUE(Contains(data, "\"available\": false")) << data;
  EXPECT_TRUE(Contains(data, "\"moving\": false")) << data;
  EXPECT_TRUE(Contains(data, "\"last_poll\": -1")) << data;
  EXPECT_TRUE(Contains(data, "\"data\": {}")) << data;
}

TEST_F(CoordinatorTest, Learning) {
  Init(kOneDevice);
  ASSERT_TRUE(coord_->RequestPoll("trailer", true).ok());
  sched_.Advance(500);
  const std::vector<uint8_t> new_id = {0x12, 0x34, 0x56, 0x78};
  EXPECT_TRUE(client_.Notify(test::DataPacket(new_id, 40, 30)));
  EXPECT_TRUE(client_.Notify(test::DataPacket(kID1, 40, 30)));
  sched_.Advance(5000);
  EXPECT_FALSE(poller_.busy());
  const std::vector<std::string> expected = {"12-34-56-78"};
  EXPECT_EQ(expected, coord_->GetLearned("trailer").ValueOrDie());
}

TEST_F(CoordinatorTest, QueuedRequestsMerge) {
  Init(kTwoDevices);
  coord_->Start();
  ASSERT_TRUE(coord_->RequestPoll("camper", false).ok());
  ASSERT_TRUE(coord_->RequestPoll("camper", true).ok());
  CompletePoll();
  EXPECT_EQ(2, client_.num_connects);
  // Learning polls run to the deadline.
  sched_.Advance(500);
  for (const auto &id : {kID1, kID2, kID3, kID4}) {
    EXPECT_TRUE(client_.Notify(test::DataPacket(id, 40, 32)));
  }
  sched_.Advance(0);
  EXPECT_TRUE(poller_.busy());
  sched_.Advance(5000);
  EXPECT_FALSE(poller_.busy());
  EXPECT_EQ(2, client_.num_connects);
}

TEST_F(CoordinatorTest, SensorsAndRotation) {
  Init(kOneDevice);
  EXPECT_EQ(4u, coord_->GetPatterns("trailer").ValueOrDie().size());
  PositionMap m;
  ASSERT_TRUE(m.Add(1, SensorID::Parse("0E-B3-0B-02").ValueOrDie()).ok());
  ASSERT_TRUE(m.Add(2, SensorID::Parse("0E-88-46-02").ValueOrDie()).ok());
  ASSERT_TRUE(coord_->AssignSensors("trailer", m).ok());
  EXPECT_EQ(std::vector<std::string>({"swap"}),
            coord_->GetPatterns("trailer").ValueOrDie());
  EXPECT_EQ(STATUS_NOT_FOUND,
            coord_->Rotate("trailer", "x_pattern").error_code());
  ASSERT_TRUE(coord_->Rotate("trailer", "swap").ok());
  const PositionMap &sensors = coord_->config().devices[0].sensors;
  EXPECT_EQ("0E-88-46-02", sensors.Get(1).ValueOrDie().ToString());
  EXPECT_EQ("0E-B3-0B-02", sensors.Get(2).ValueOrDie().ToString());
}

TEST_F(CoordinatorTest, UnknownDevice) {
  Init(kOneDevice);
  EXPECT_EQ(STATUS_NOT_FOUND, coord_->RequestPoll("boat", false).error_code());
  EXPECT_EQ(STATUS_NOT_FOUND, coord_->SetMoving("boat", true).error_code());
  EXPECT_EQ(STATUS_NOT_FOUND,
            coord_->GetDataJSON("boat").status().error_code());
  EXPECT_EQ(STATUS_NOT_FOUND, coord_->Rotate("boat", "swap").error_code());
  EXPECT_EQ(0, client_.num_connects);
}

TEST_F(CoordinatorTest, List) {
  Init(kTwoDevices);
  const std::string list = coord_->ListJSON();
  EXPECT_TRUE(Contains(list, "\"id\": \"trailer\"")) << list;
  EXPECT_TRUE(Contains(list, "\"addr\": \"aa:bb:cc:dd:ee:02\"")) << list;
  EXPECT_TRUE(Contains(list, "\"family\": \"tirelinc\"")) << list;
}

}  // namespace
}  // namespace tpms
