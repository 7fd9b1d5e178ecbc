#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <random>

#include "toolmesh/config/config_loader.hpp"
#include "toolmesh/utils/error.hpp"

using namespace toolmesh;
using namespace toolmesh::config;
using json = nlohmann::json;
namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    root_ = fs::temp_directory_path() /
            ("toolmesh_config_test_" + std::to_string(rd()));
    fs::create_directories(root_ / "config");
    unsetenv("TOOLMESH_CONFIG_PATH");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
    unsetenv("TOOLMESH_CONFIG_PATH");
  }

  fs::path write(const std::string &contents,
                 const fs::path &relative = "config/servers.json") {
    fs::path path = root_ / relative;
    std::ofstream out(path);
    out << contents;
    return path;
  }

  fs::path root_;
};

TEST_F(ConfigLoaderTest, DefaultPathIsUnderProjectRoot) {
  ConfigLoader loader(std::nullopt, root_);

  EXPECT_EQ(loader.path(), root_ / "config" / "servers.json");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesDefaultPath) {
  setenv("TOOLMESH_CONFIG_PATH", "/etc/toolmesh.json", 1);

  EXPECT_EQ(ConfigLoader::resolvePath(std::nullopt, root_),
            fs::path("/etc/toolmesh.json"));
  EXPECT_EQ(ConfigLoader::resolvePath(fs::path("/explicit.json"), root_),
            fs::path("/explicit.json"));
}

TEST_F(ConfigLoaderTest, LoadsServersInNameOrder) {
  write(R"({
    "mcpservers": {
      "temperature_server": {"transport": "network",
                             "url": "http://localhost:8001/mcp",
                             "description": "Temperatures"},
      "terminal_server": {"transport": "process", "command": "python",
                          "args": ["servers/stdio/terminal_server.py"],
                          "description": "Shell"}
    }
  })");
  ConfigLoader loader(std::nullopt, root_);

  auto descriptors = loader.serverDescriptors();

  ASSERT_EQ(descriptors.size(), 2u);
  EXPECT_EQ(descriptors[0].name, "temperature_server");
  EXPECT_EQ(descriptors[0].definition["url"], "http://localhost:8001/mcp");
  EXPECT_EQ(descriptors[1].name, "terminal_server");
  EXPECT_EQ(descriptors[1].definition["command"], "python");
}

TEST_F(ConfigLoaderTest, LegacyTypeKeyIsNormalised) {
  EXPECT_EQ(ConfigLoader::normaliseDescriptor(
                json{{"type", "stdio"}, {"command", "python"}}),
            (json{{"transport", "process"}, {"command", "python"}}));
  EXPECT_EQ(ConfigLoader::normaliseDescriptor(
                json{{"type", "http"}, {"url", "http://h"}}),
            (json{{"transport", "network"}, {"url", "http://h"}}));
  EXPECT_EQ(ConfigLoader::normaliseDescriptor(json{{"type", "websocket"}}),
            (json{{"transport", "websocket"}}));
}

TEST_F(ConfigLoaderTest, ExplicitTransportWinsOverLegacyType) {
  json descriptor = {{"transport", "process"}, {"type", "http"}};

  EXPECT_EQ(ConfigLoader::normaliseDescriptor(descriptor), descriptor);
}

TEST_F(ConfigLoaderTest, MissingServersSectionYieldsNoDescriptors) {
  write(R"({"session": {}})");
  ConfigLoader loader(std::nullopt, root_);

  EXPECT_TRUE(loader.serverDescriptors().empty());
}

TEST_F(ConfigLoaderTest, MissingFileIsInvalidDocument) {
  ConfigLoader loader(root_ / "absent.json", root_);

  try {
    loader.load();
    FAIL() << "Expected ConfigurationException";
  } catch (const ConfigurationException &e) {
    EXPECT_EQ(e.kind(), ConfigurationException::Kind::InvalidDocument);
    EXPECT_NE(std::string(e.what()).find("not found"), std::string::npos);
  }
}

TEST_F(ConfigLoaderTest, MalformedJsonIsInvalidDocument) {
  write("{\"mcpservers\": {");
  ConfigLoader loader(std::nullopt, root_);

  try {
    loader.load();
    FAIL() << "Expected ConfigurationException";
  } catch (const ConfigurationException &e) {
    EXPECT_EQ(e.kind(), ConfigurationException::Kind::InvalidDocument);
  }
}

TEST_F(ConfigLoaderTest, SchemaMismatchIsInvalidDocument) {
  write(R"({"mcpservers": [], "session": {"allowList": "all"}})");
  ConfigLoader loader(std::nullopt, root_);

  EXPECT_THROW(loader.load(), ConfigurationException);
}

TEST_F(ConfigLoaderTest, SessionSectionOverridesDefaults) {
  write(R"({
    "mcpservers": {},
    "session": {"allowList": ["celsius_to_fahrenheit"],
                "connectionTimeout": 5, "requestTimeout": 2.5,
                "shutdownGracePeriodMs": 0, "projectRoot": "sub",
                "agentName": "helper"}
  })");
  ConfigLoader loader(std::nullopt, root_);

  SessionConfig config = loader.sessionConfig();

  EXPECT_EQ(config.allow_list,
            std::vector<std::string>{"celsius_to_fahrenheit"});
  EXPECT_EQ(config.connection_timeout, std::chrono::seconds(5));
  EXPECT_EQ(config.request_timeout, std::chrono::milliseconds(2500));
  EXPECT_EQ(config.shutdown_grace_period, std::chrono::milliseconds(0));
  EXPECT_EQ(config.project_root, root_ / "sub");
  EXPECT_EQ(config.agent_name, "helper");
  EXPECT_EQ(config.script_extension, ".py");
}

TEST_F(ConfigLoaderTest, NoSessionSectionKeepsDefaults) {
  write(R"({"mcpservers": {}})");
  ConfigLoader loader(std::nullopt, root_);

  SessionConfig config = loader.sessionConfig();

  EXPECT_TRUE(config.allow_list.empty());
  EXPECT_EQ(config.connection_timeout, std::chrono::seconds(30));
  EXPECT_EQ(config.project_root, root_);
}

TEST_F(ConfigLoaderTest, ValueReadsDottedPath) {
  write(R"({"logLevel": "debug", "session": {"allowList": ["a", "b"]}})");
  ConfigLoader loader(std::nullopt, root_);

  EXPECT_EQ(loader.value("logLevel"), "debug");
  EXPECT_EQ(loader.value("session.allowList").size(), 2u);
  EXPECT_EQ(loader.value("session.missing", 7), 7);
}

TEST_F(ConfigLoaderTest, ValueFallsBackWhenDocumentIsBroken) {
  ConfigLoader loader(root_ / "absent.json", root_);

  EXPECT_EQ(loader.value("logLevel", "info"), "info");
}

TEST_F(ConfigLoaderTest, LoadIsCachedUntilReload) {
  write(R"({"logLevel": "info"})");
  ConfigLoader loader(std::nullopt, root_);
  EXPECT_EQ(loader.load()["logLevel"], "info");

  write(R"({"logLevel": "error"})");
  EXPECT_EQ(loader.load()["logLevel"], "info");
  EXPECT_EQ(loader.reload()["logLevel"], "error");
}

TEST_F(ConfigLoaderTest, LoadedDocumentSurvivesReload) {
  write(R"({"logLevel": "info"})");
  ConfigLoader loader(std::nullopt, root_);
  auto before = loader.load();

  write(R"({"logLevel": "debug"})");
  auto after = loader.reload();

  EXPECT_EQ(before["logLevel"], "info");
  EXPECT_EQ(after["logLevel"], "debug");
}
