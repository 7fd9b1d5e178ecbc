#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_doubles.hpp"
#include "toolmesh/discovery/toolset_discovery.hpp"
#include "toolmesh/utils/error.hpp"

using namespace toolmesh;
using namespace toolmesh::discovery;
using namespace toolmesh::testing_support;
using json = nlohmann::json;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

config::ServerDescriptor processServer(const std::string &name,
                                       const std::string &command) {
  return {name, json{{"transport", "process"},
                     {"command", command},
                     {"description", name}}};
}

config::ServerDescriptor networkServer(const std::string &name,
                                       const std::string &url) {
  return {name,
          json{{"transport", "network"}, {"url", url}, {"description", name}}};
}

const std::vector<std::string> kTemperatureTools = {
    "celsius_to_fahrenheit", "fahrenheit_to_celsius", "celsius_to_kelvin",
    "kelvin_to_celsius",     "fahrenheit_to_kelvin",  "kelvin_to_fahrenheit"};

} // namespace

class ToolsetDiscoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    connector_ = std::make_shared<NiceMock<MockToolsetConnector>>();
    config_.project_root = "/opt/toolmesh";
  }

  std::shared_ptr<NiceMock<MockToolsetConnection>>
  connectionWith(const std::vector<std::string> &names) {
    auto connection = std::make_shared<NiceMock<MockToolsetConnection>>();
    std::vector<types::ToolDescriptor> tools;
    for (const auto &name : names) {
      tools.push_back(tool(name));
    }
    ON_CALL(*connection, listTools()).WillByDefault(Return(tools));
    return connection;
  }

  std::shared_ptr<NiceMock<MockToolsetConnector>> connector_;
  config::SessionConfig config_;
};

TEST_F(ToolsetDiscoveryTest, EveryServerGetsExactlyOneStatus) {
  auto terminal = connectionWith({"run_command"});
  EXPECT_CALL(*connector_, open("terminal_server", _))
      .WillOnce(Return(terminal));
  EXPECT_CALL(*connector_, open("temperature_server", _))
      .WillOnce(Throw(TransportException("Connection refused")));

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll(
      {networkServer("temperature_server", "http://localhost:8001/mcp"),
       processServer("terminal_server", "python"),
       {"broken", json{{"transport", "network"}, {"description", "x"}}}});

  ASSERT_EQ(result.statuses.size(), 3u);
  EXPECT_EQ(result.statuses.at("terminal_server").state,
            ServerState::Connected);
  EXPECT_EQ(result.statuses.at("terminal_server").tool_count, 1u);
  EXPECT_TRUE(result.statuses.at("terminal_server").connected_at.has_value());

  EXPECT_EQ(result.statuses.at("temperature_server").state,
            ServerState::ConnectionError);
  EXPECT_EQ(result.statuses.at("temperature_server").error_message,
            "Connection refused");

  EXPECT_EQ(result.statuses.at("broken").state,
            ServerState::InvalidConfiguration);

  ASSERT_EQ(result.toolsets.size(), 1u);
  EXPECT_EQ(result.toolsets[0].server_name, "terminal_server");
  EXPECT_TRUE(result.toolsets[0].hasTool("run_command"));
}

TEST_F(ToolsetDiscoveryTest, InvalidDescriptorsAreNeverOpened) {
  EXPECT_CALL(*connector_, open(_, _)).Times(0);

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll(
      {{"no_url", json{{"transport", "network"}, {"description", "x"}}},
       {"no_command", json{{"transport", "process"}, {"description", "x"}}},
       {"odd", json{{"transport", "pigeon"}, {"description", "x"}}}});

  for (const auto &name : {"no_url", "no_command", "odd"}) {
    EXPECT_EQ(result.statuses.at(name).state,
              ServerState::InvalidConfiguration)
        << name;
    EXPECT_TRUE(result.statuses.at(name).error_message.has_value());
  }
  EXPECT_NE(result.statuses.at("no_url").error_message->find("url"),
            std::string::npos);
  EXPECT_TRUE(result.toolsets.empty());
}

TEST_F(ToolsetDiscoveryTest, BuilderFailureIsFailed) {
  EXPECT_CALL(*connector_, open(_, _)).Times(0);

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll(
      {{"bad_args", json{{"transport", "process"},
                         {"command", "python"},
                         {"args", "server.py"},
                         {"description", "x"}}}});

  EXPECT_EQ(result.statuses.at("bad_args").state, ServerState::Failed);
}

TEST_F(ToolsetDiscoveryTest, OpenReceivesBuiltParameters) {
  auto terminal = connectionWith({"run_command"});
  EXPECT_CALL(*connector_, open("terminal_server", _))
      .WillOnce([&terminal](const std::string &,
                            const transport::ConnectionParams &params) {
        const auto &process = std::get<transport::ProcessParams>(params);
        EXPECT_EQ(process.command, "python");
        EXPECT_EQ(process.args,
                  std::vector<std::string>{
                      "/opt/toolmesh/servers/stdio/terminal_server.py"});
        return terminal;
      });

  config::ServerDescriptor descriptor = processServer("terminal_server",
                                                      "python");
  descriptor.definition["args"] = json::array({"servers/stdio/terminal_server.py"});

  ToolsetDiscovery discovery(connector_, config_);
  discovery.discoverAll({descriptor});
}

TEST_F(ToolsetDiscoveryTest, EmptyCatalogIsNoToolsFoundAndClosed) {
  auto empty = connectionWith({});
  EXPECT_CALL(*empty, close()).Times(1);
  EXPECT_CALL(*connector_, open("empty_server", _)).WillOnce(Return(empty));

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll({processServer("empty_server", "x")});

  EXPECT_EQ(result.statuses.at("empty_server").state,
            ServerState::NoToolsFound);
  EXPECT_EQ(result.statuses.at("empty_server").tool_count, 0u);
  EXPECT_TRUE(result.toolsets.empty());
}

TEST_F(ToolsetDiscoveryTest, AllowListFiltersTools) {
  config_.allow_list = kTemperatureTools;
  config_.allow_list.push_back("run_command");

  auto temperature = connectionWith(
      {"celsius_to_fahrenheit", "fahrenheit_to_celsius", "celsius_to_kelvin",
       "kelvin_to_celsius", "fahrenheit_to_kelvin", "kelvin_to_fahrenheit",
       "rankine_to_celsius"});
  EXPECT_CALL(*connector_, open("temperature_server", _))
      .WillOnce(Return(temperature));

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll(
      {networkServer("temperature_server", "http://localhost:8001/mcp")});

  ASSERT_EQ(result.toolsets.size(), 1u);
  const auto &toolset = result.toolsets[0];
  EXPECT_EQ(toolset.tools.size(), 6u);
  EXPECT_TRUE(toolset.hasTool("celsius_to_fahrenheit"));
  EXPECT_FALSE(toolset.hasTool("rankine_to_celsius"));
  EXPECT_EQ(result.statuses.at("temperature_server").tool_count, 6u);
}

TEST_F(ToolsetDiscoveryTest, AllowListRemovingEverythingIsNoToolsFound) {
  config_.allow_list = {"run_command"};
  auto temperature = connectionWith({"celsius_to_fahrenheit"});
  EXPECT_CALL(*temperature, close()).Times(1);
  EXPECT_CALL(*connector_, open(_, _)).WillOnce(Return(temperature));

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll(
      {networkServer("temperature_server", "http://localhost:8001/mcp")});

  EXPECT_EQ(result.statuses.at("temperature_server").state,
            ServerState::NoToolsFound);
}

TEST_F(ToolsetDiscoveryTest, EmptyAllowListKeepsEverything) {
  ToolsetDiscovery discovery(connector_, config_);

  auto tools = discovery.applyAllowList({tool("a"), tool("b")});

  EXPECT_EQ(tools.size(), 2u);
}

TEST_F(ToolsetDiscoveryTest, ListFailureIsConnectionErrorAndClosed) {
  auto flaky = std::make_shared<NiceMock<MockToolsetConnection>>();
  EXPECT_CALL(*flaky, listTools())
      .WillOnce(Throw(TimeoutException("tools/list timed out")));
  EXPECT_CALL(*flaky, close()).Times(1);
  EXPECT_CALL(*connector_, open(_, _)).WillOnce(Return(flaky));

  ToolsetDiscovery discovery(connector_, config_);
  auto result = discovery.discoverAll({processServer("flaky", "x")});

  EXPECT_EQ(result.statuses.at("flaky").state, ServerState::ConnectionError);
  EXPECT_EQ(result.statuses.at("flaky").error_message, "tools/list timed out");
}

TEST_F(ToolsetDiscoveryTest, ToolsetsFollowDescriptorOrder) {
  EXPECT_CALL(*connector_, open("b", _))
      .WillOnce(Return(connectionWith({"tool_b"})));
  EXPECT_CALL(*connector_, open("a", _))
      .WillOnce(Return(connectionWith({"tool_a"})));

  ToolsetDiscovery discovery(connector_, config_);
  auto result =
      discovery.discoverAll({processServer("a", "x"), processServer("b", "y")});

  ASSERT_EQ(result.toolsets.size(), 2u);
  EXPECT_EQ(result.toolsets[0].server_name, "a");
  EXPECT_EQ(result.toolsets[1].server_name, "b");
}

TEST_F(ToolsetDiscoveryTest, NoServersYieldsEmptyResult) {
  ToolsetDiscovery discovery(connector_, config_);

  auto result = discovery.discoverAll({});

  EXPECT_TRUE(result.toolsets.empty());
  EXPECT_TRUE(result.statuses.empty());
}

TEST(ConnectionStatusTest, JsonRendering) {
  ConnectionStatus status;
  status.name = "temperature_server";
  status.state = ServerState::ConnectionError;
  status.error_message = "Connection refused";

  json j = toJson(status);

  EXPECT_EQ(j["name"], "temperature_server");
  EXPECT_EQ(j["status"], "connection_error");
  EXPECT_EQ(j["tool_count"], 0);
  EXPECT_EQ(j["error_message"], "Connection refused");
  EXPECT_TRUE(j["connection_time"].is_null());

  StatusMap statuses{{"temperature_server", status}};
  EXPECT_EQ(toJson(statuses)["temperature_server"]["status"],
            "connection_error");
}

TEST(ConnectionStatusTest, StateNames) {
  EXPECT_EQ(toString(ServerState::Connected), "connected");
  EXPECT_EQ(toString(ServerState::InvalidConfiguration),
            "invalid_configuration");
  EXPECT_EQ(toString(ServerState::NoToolsFound), "no_tools_found");
  EXPECT_EQ(toString(ServerState::Failed), "failed");
}
