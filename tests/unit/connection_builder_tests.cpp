#include <gtest/gtest.h>

#include "toolmesh/config/connection_builder.hpp"
#include "toolmesh/utils/error.hpp"

using namespace toolmesh;
using namespace toolmesh::config;
using json = nlohmann::json;

class ConnectionBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.project_root = "/opt/toolmesh";
    config_.connection_timeout = std::chrono::seconds(12);
  }

  ConfigurationException::Kind kindOfFailure(const json &descriptor) {
    ConnectionBuilder builder(config_);
    try {
      builder.build("s", descriptor);
    } catch (const ConfigurationException &e) {
      return e.kind();
    }
    ADD_FAILURE() << "build() did not throw";
    return ConfigurationException::Kind::InvalidDocument;
  }

  SessionConfig config_;
};

TEST_F(ConnectionBuilderTest, BuildsProcessParams) {
  ConnectionBuilder builder(config_);

  auto params = builder.build(
      "terminal_server",
      json{{"transport", "process"},
           {"command", "python"},
           {"args", {"servers/stdio/terminal_server.py", "--verbose"}},
           {"env", {{"WORKSPACE", "/tmp/ws"}, {"DEPTH", 3}}},
           {"description", "Shell"}});

  ASSERT_TRUE(std::holds_alternative<transport::ProcessParams>(params));
  const auto &process = std::get<transport::ProcessParams>(params);
  EXPECT_EQ(process.command, "python");
  ASSERT_EQ(process.args.size(), 2u);
  EXPECT_EQ(process.args[0], "/opt/toolmesh/servers/stdio/terminal_server.py");
  EXPECT_EQ(process.args[1], "--verbose");
  EXPECT_EQ(process.env.at("WORKSPACE"), "/tmp/ws");
  EXPECT_EQ(process.env.at("DEPTH"), "3");
  EXPECT_EQ(process.timeout, std::chrono::seconds(12));
  EXPECT_EQ(transport::kindOf(params), transport::TransportKind::Process);
}

TEST_F(ConnectionBuilderTest, BuildsNetworkParams) {
  ConnectionBuilder builder(config_);

  auto params = builder.build(
      "temperature_server",
      json{{"transport", "network"},
           {"url", "http://localhost:8001/mcp"},
           {"headers", {{"Authorization", "Bearer t"}}},
           {"description", "Temperatures"}});

  ASSERT_TRUE(std::holds_alternative<transport::NetworkParams>(params));
  const auto &network = std::get<transport::NetworkParams>(params);
  EXPECT_EQ(network.url, "http://localhost:8001/mcp");
  EXPECT_EQ(network.headers.at("Authorization"), "Bearer t");
  EXPECT_EQ(network.timeout, std::chrono::seconds(12));
}

TEST_F(ConnectionBuilderTest, ProcessWithoutArgsHasEmptyArgs) {
  ConnectionBuilder builder(config_);

  auto params = builder.build(
      "s", json{{"transport", "process"}, {"command", "node"}});

  EXPECT_TRUE(std::get<transport::ProcessParams>(params).args.empty());
}

TEST_F(ConnectionBuilderTest, ResolveArgument) {
  ConnectionBuilder builder(config_);

  EXPECT_EQ(builder.resolveArgument("servers/./a.py"),
            "/opt/toolmesh/servers/a.py");
  EXPECT_EQ(builder.resolveArgument("/abs/b.py"), "/abs/b.py");
  EXPECT_EQ(builder.resolveArgument("--port"), "--port");
  EXPECT_EQ(builder.resolveArgument("script.js"), "script.js");
}

TEST_F(ConnectionBuilderTest, ScriptExtensionIsConfigurable) {
  config_.script_extension = ".js";
  ConnectionBuilder builder(config_);

  EXPECT_EQ(builder.resolveArgument("server.js"), "/opt/toolmesh/server.js");
  EXPECT_EQ(builder.resolveArgument("server.py"), "server.py");
}

TEST_F(ConnectionBuilderTest, MissingUrl) {
  ConnectionBuilder builder(config_);
  try {
    builder.build("temperature_server", json{{"transport", "network"}});
    FAIL() << "Expected ConfigurationException";
  } catch (const ConfigurationException &e) {
    EXPECT_EQ(e.kind(), ConfigurationException::Kind::MissingField);
    EXPECT_EQ(e.field(), "url");
  }
}

TEST_F(ConnectionBuilderTest, MissingOrEmptyCommand) {
  EXPECT_EQ(kindOfFailure(json{{"transport", "process"}}),
            ConfigurationException::Kind::MissingField);
  EXPECT_EQ(kindOfFailure(json{{"transport", "process"}, {"command", ""}}),
            ConfigurationException::Kind::MissingField);
}

TEST_F(ConnectionBuilderTest, MalformedArgsOrEnv) {
  EXPECT_EQ(kindOfFailure(json{{"transport", "process"},
                               {"command", "python"},
                               {"args", "not-a-list"}}),
            ConfigurationException::Kind::InvalidTransport);
  EXPECT_EQ(kindOfFailure(json{{"transport", "process"},
                               {"command", "python"},
                               {"env", json::array()}}),
            ConfigurationException::Kind::InvalidTransport);
}

TEST_F(ConnectionBuilderTest, UnsupportedTransportCarriesValue) {
  ConnectionBuilder builder(config_);
  try {
    builder.build("s", json{{"transport", "carrier-pigeon"}});
    FAIL() << "Expected ConfigurationException";
  } catch (const ConfigurationException &e) {
    EXPECT_EQ(e.kind(), ConfigurationException::Kind::UnsupportedTransport);
    EXPECT_EQ(e.error().data["value"], "carrier-pigeon");
  }
}
