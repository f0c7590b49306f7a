#include "olt-client/query/QueryOrchestrator.hpp"
#include "test_utils/FakeOltDevice.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <thread>

using namespace oltclient;
using namespace oltclient::query;
using namespace oltclient::session;
using namespace oltclient::test;

class QueryOrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    FakeUnit alice;
    alice.index = 1;
    alice.description = "alice";
    alice.mac = "00:11:22:33:44:01";

    FakeUnit bob;
    bob.index = 2;
    bob.description = "bob";
    bob.online = false;
    bob.mac = "00:11:22:33:44:02";

    FakeUnit roger;
    roger.index = 3;
    roger.description = "rogersaade";

    FakeUnit charlie;
    charlie.index = 1;
    charlie.description = "Charlie";
    charlie.mac = "00:11:22:33:44:03";

    device_.add_unit("0/1", alice);
    device_.add_unit("0/1", bob);
    device_.add_unit("0/1", roger);
    device_.add_unit("0/2", charlie);
  }

  TransportFactory factory() {
    return [this](const DeviceConfig &) {
      auto transport = std::make_unique<ScriptedTransport>(device_);
      transport->set_refuse_connect(refuse_connect_);
      transport->set_split_interface_prompt(split_prompt_);
      return transport;
    };
  }

  /// Commands sent after the login sequence
  std::vector<std::string> query_commands() const {
    auto history = device_.get_command_history();
    auto it = std::find(history.begin(), history.end(), "terminal length 0");
    if (it == history.end())
      return history;
    return std::vector<std::string>(it + 1, history.end());
  }

  FakeOltDevice device_;
  bool refuse_connect_{false};
  bool split_prompt_{false};
  DeviceConfig config_ = fast_device_config();
  SessionPool pool_{factory()};
  ResultCache cache_;
};

TEST_F(QueryOrchestratorTest, FindsUnitWithDetails) {
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("RogerSaade");

  ASSERT_EQ(result.outcome, QueryOutcome::Found);
  ASSERT_TRUE(result.unit.has_value());
  EXPECT_FALSE(result.from_cache);

  const auto &unit = *result.unit;
  EXPECT_EQ(unit.status.unit_id, "EPON0/1:3");
  EXPECT_EQ(unit.status.state, UnitState::Online);
  EXPECT_EQ(unit.status.mac_address, "74:a0:63:7e:d6:a8");
  EXPECT_EQ(unit.status.distance_meters, 1436u);
  EXPECT_EQ(unit.status.rtt, 972u);
  EXPECT_EQ(unit.status.alive_time, "42 02:24:43");
  EXPECT_EQ(unit.description, "rogersaade");
  EXPECT_EQ(unit.epon_port, "0/1");
  EXPECT_EQ(unit.device, "OLT1");

  ASSERT_TRUE(unit.optical.has_value());
  EXPECT_EQ(unit.optical->temperature, "37.00 °C");
  EXPECT_EQ(unit.optical->receive_power, "0.04 mW (-14.55 dBm)");
  ASSERT_TRUE(unit.link.has_value());
  EXPECT_EQ(unit.link->status, LinkStatus::Up);
  ASSERT_TRUE(unit.capability.has_value());
  EXPECT_EQ(unit.capability->ge_ports, "1");
  EXPECT_EQ(unit.capability->protection_type, "Not support");

  std::vector<std::string> expected{"configure terminal",
                                    "interface epon 0/1",
                                    "show onu status",
                                    "show onu 1 description",
                                    "show onu 2 description",
                                    "show onu 3 description",
                                    "exit",
                                    "configure terminal",
                                    "interface epon 0/1",
                                    "show onu 3 ctc opm_diag",
                                    "show onu 3 ctc eth 1 linkstate",
                                    "show onu 3 ctc capability",
                                    "exit"};
  EXPECT_EQ(query_commands(), expected);
}

TEST_F(QueryOrchestratorTest, SearchesPortsInOrderAndStopsAtMatch) {
  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("charlie");

  ASSERT_TRUE(result.found());
  EXPECT_EQ(result.unit->epon_port, "0/2");
  EXPECT_EQ(result.unit->status.unit_id, "EPON0/2:1");
  EXPECT_EQ(result.unit->description, "Charlie");

  auto commands = query_commands();
  auto first = std::find(commands.begin(), commands.end(), "interface epon 0/1");
  auto second =
      std::find(commands.begin(), commands.end(), "interface epon 0/2");
  ASSERT_NE(first, commands.end());
  ASSERT_NE(second, commands.end());
  EXPECT_LT(first, second);
  EXPECT_EQ(device_.count_command("interface epon 0/3"), 0u);
}

TEST_F(QueryOrchestratorTest, FirstMatchWins) {
  FakeUnit twin;
  twin.index = 7;
  twin.description = "twin";
  device_.add_unit("0/2", twin);
  twin.index = 9;
  device_.add_unit("0/3", twin);

  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("twin");

  ASSERT_TRUE(result.found());
  EXPECT_EQ(result.unit->status.unit_id, "EPON0/2:7");
}

TEST_F(QueryOrchestratorTest, AbsentUnitIsNotFound) {
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("nobody");

  EXPECT_EQ(result.outcome, QueryOutcome::NotFound);
  EXPECT_FALSE(result.unit.has_value());
  EXPECT_TRUE(result.error_message.empty());
  for (const auto &port : {"0/1", "0/2", "0/3", "0/4"}) {
    EXPECT_EQ(device_.count_command(std::string("interface epon ") + port), 1u);
  }
  // Session stays pooled after a clean miss
  EXPECT_TRUE(pool_.has_session("OLT1"));
}

TEST_F(QueryOrchestratorTest, DetailsCanBeSkipped) {
  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("rogersaade");

  ASSERT_TRUE(result.found());
  EXPECT_FALSE(result.unit->optical.has_value());
  EXPECT_FALSE(result.unit->link.has_value());
  EXPECT_EQ(device_.count_command("show onu 3 ctc opm_diag"), 0u);
}

TEST_F(QueryOrchestratorTest, MissingDetailBlocksStayEmpty) {
  device_.set_optical_reply(3, "% CTC OAM timeout\r\n");
  device_.set_capability_reply(3, "% Not supported\r\n");

  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("rogersaade");

  ASSERT_TRUE(result.found());
  EXPECT_FALSE(result.unit->optical.has_value());
  EXPECT_FALSE(result.unit->capability.has_value());
  EXPECT_TRUE(result.unit->link.has_value());
}

TEST_F(QueryOrchestratorTest, CachedResultSkipsDevice) {
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  ASSERT_TRUE(orchestrator.get_unit_info("ROGERSAADE").found());

  auto second = orchestrator.get_unit_info("rogersaade");
  ASSERT_TRUE(second.found());
  EXPECT_TRUE(second.from_cache);
  EXPECT_EQ(second.unit->status.unit_id, "EPON0/1:3");
  EXPECT_EQ(device_.count_command("show onu status"), 1u);
}

TEST_F(QueryOrchestratorTest, ExpiredCacheQueriesAgain) {
  ResultCache short_cache(std::chrono::milliseconds(20));
  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, short_cache);

  ASSERT_TRUE(orchestrator.get_unit_info("alice").found());
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  auto again = orchestrator.get_unit_info("alice");

  ASSERT_TRUE(again.found());
  EXPECT_FALSE(again.from_cache);
  EXPECT_EQ(device_.count_command("show onu status"), 2u);
  // Pooled session was reused for the second search
  EXPECT_EQ(device_.login_count(), 1u);
}

TEST_F(QueryOrchestratorTest, DisabledDeviceIsNotContacted) {
  config_.enabled = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("rogersaade");

  EXPECT_EQ(result.outcome, QueryOutcome::Disabled);
  EXPECT_EQ(device_.connection_count(), 0u);
}

TEST_F(QueryOrchestratorTest, MissingPrivilegedPromptThenRecovery) {
  device_.set_privileged_prompt(false);
  QueryOrchestrator orchestrator(config_, pool_, cache_);

  auto failed = orchestrator.get_unit_info("rogersaade");
  EXPECT_EQ(failed.outcome, QueryOutcome::DeviceUnreachable);
  EXPECT_NE(failed.error_message.find("AwaitPrivilegedPrompt"),
            std::string::npos);
  EXPECT_FALSE(pool_.has_session("OLT1"));

  device_.set_privileged_prompt(true);
  auto recovered = orchestrator.get_unit_info("rogersaade");
  ASSERT_TRUE(recovered.found());
  EXPECT_EQ(device_.connection_count(), 2u);
  EXPECT_EQ(device_.login_count(), 1u);
}

TEST_F(QueryOrchestratorTest, RefusedConnectionIsUnreachable) {
  refuse_connect_ = true;
  QueryOrchestrator orchestrator(config_, pool_, cache_);
  auto result = orchestrator.get_unit_info("rogersaade");

  EXPECT_EQ(result.outcome, QueryOutcome::DeviceUnreachable);
  EXPECT_FALSE(result.error_message.empty());
}

TEST_F(QueryOrchestratorTest, LinkLostMidSearchInvalidatesSession) {
  device_.set_drop_on_command("show onu 2 description");
  QueryOrchestrator orchestrator(config_, pool_, cache_);

  auto lost = orchestrator.get_unit_info("rogersaade");
  EXPECT_EQ(lost.outcome, QueryOutcome::DeviceUnreachable);
  EXPECT_FALSE(pool_.has_session("OLT1"));
  EXPECT_EQ(pool_.get_stats().invalidations, 1u);

  auto retry = orchestrator.get_unit_info("rogersaade");
  ASSERT_TRUE(retry.found());
  EXPECT_EQ(device_.login_count(), 2u);
}

TEST_F(QueryOrchestratorTest, UnenterablePortIsSkipped) {
  device_.set_ports({"0/2"});
  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);

  auto result = orchestrator.get_unit_info("charlie");
  ASSERT_TRUE(result.found());
  EXPECT_EQ(result.unit->epon_port, "0/2");
  EXPECT_EQ(device_.count_command("show onu status"), 1u);
}

TEST_F(QueryOrchestratorTest, FindsUnitWhenPromptArrivesInPieces) {
  split_prompt_ = true;
  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);

  auto result = orchestrator.get_unit_info("rogersaade");

  ASSERT_EQ(result.outcome, QueryOutcome::Found);
  EXPECT_EQ(result.unit->status.unit_id, "EPON0/1:3");
  EXPECT_EQ(device_.count_command("show onu status"), 1u);
  EXPECT_EQ(device_.count_command("show onu 3 description"), 1u);
}

TEST_F(QueryOrchestratorTest, AsyncQueriesFinishWhileOrchestratorLives) {
  config_.fetch_details = false;
  std::future<QueryResult> pending;
  {
    QueryOrchestrator orchestrator(config_, pool_, cache_);
    pending = orchestrator.get_unit_info_async("charlie");
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)),
              std::future_status::ready);
  }
  auto result = pending.get();
  ASSERT_TRUE(result.found());
  EXPECT_EQ(result.unit->epon_port, "0/2");
}

TEST_F(QueryOrchestratorTest, AsyncQuery) {
  config_.fetch_details = false;
  QueryOrchestrator orchestrator(config_, pool_, cache_);

  auto first = orchestrator.get_unit_info_async("alice");
  auto second = orchestrator.get_unit_info_async("charlie");

  auto a = first.get();
  auto c = second.get();
  ASSERT_TRUE(a.found());
  ASSERT_TRUE(c.found());
  EXPECT_EQ(a.unit->epon_port, "0/1");
  EXPECT_EQ(c.unit->epon_port, "0/2");
  EXPECT_EQ(device_.login_count(), 1u);
}
