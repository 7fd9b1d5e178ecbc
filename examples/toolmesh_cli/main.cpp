#include "toolmesh/config/config_loader.hpp"
#include "toolmesh/engine/execution_engine.hpp"
#include "toolmesh/session/session.hpp"
#include "toolmesh/utils/error.hpp"
#include "toolmesh/utils/logging.hpp"

#include <atomic>
#include <cctype>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

using namespace toolmesh;
using namespace toolmesh::engine;

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

void signal_handler(int) { g_running = false; }

namespace {

std::string toLower(std::string value) {
  for (auto &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

// Joins the text items of an MCP tool result
std::string resultText(const nlohmann::json &result) {
  if (!result.is_object() || !result.contains("content") ||
      !result["content"].is_array()) {
    return result.dump();
  }
  std::string text;
  for (const auto &item : result["content"]) {
    if (item.value("type", std::string()) == "text") {
      if (!text.empty()) {
        text += "\n";
      }
      text += item.value("text", std::string());
    }
  }
  return text.empty() ? result.dump() : text;
}

/**
 * @brief One turn of the direct engine: call, result, answer
 *
 * Each step happens when the consumer asks for the next event, so the
 * tool runs only once the invocation event has been observed.
 */
class DirectToolTurn : public EventSource {
public:
  DirectToolTurn(std::vector<discovery::Toolset> toolsets, std::string text)
      : toolsets_(std::move(toolsets)), text_(std::move(text)) {}

  std::optional<EngineEvent> next() override {
    switch (step_++) {
    case 0:
      return plan();
    case 1:
      return invoke();
    case 2:
      return answer();
    default:
      return std::nullopt;
    }
  }

private:
  EngineEvent plan() {
    std::istringstream input(text_);
    input >> tool_;
    std::string rest;
    std::getline(input, rest);
    rest = trim(rest);

    toolset_ = findToolset(tool_);
    if (!toolset_) {
      step_ = 2;
      answer_ = "Unknown tool '" + tool_ + "'. Available tools: " +
                availableTools();
      return {};
    }

    try {
      arguments_ = rest.empty() ? nlohmann::json::object()
                                : nlohmann::json::parse(rest);
    } catch (const nlohmann::json::parse_error &e) {
      step_ = 2;
      answer_ = std::string("Arguments must be a JSON object: ") + e.what();
      return {};
    }

    EngineEvent event;
    event.author = "direct";
    event.function_calls.push_back({tool_, arguments_});
    return event;
  }

  EngineEvent invoke() {
    nlohmann::json response;
    try {
      response = toolset_->connection->callTool(tool_, arguments_);
      answer_ = resultText(response);
    } catch (const ToolmeshException &e) {
      response = {{"error", e.error()}};
      answer_ = std::string("Tool '") + tool_ + "' failed: " + e.what();
    }

    EngineEvent event;
    event.author = "direct";
    event.function_responses.push_back({tool_, response});
    return event;
  }

  EngineEvent answer() {
    EngineEvent event;
    event.author = "direct";
    event.text_parts.push_back(answer_);
    event.is_final = true;
    return event;
  }

  const discovery::Toolset *findToolset(const std::string &tool) const {
    for (const auto &toolset : toolsets_) {
      if (toolset.hasTool(tool)) {
        return &toolset;
      }
    }
    return nullptr;
  }

  std::string availableTools() const {
    std::string names;
    for (const auto &toolset : toolsets_) {
      for (const auto &tool : toolset.tools) {
        names += (names.empty() ? "" : ", ") + tool.name;
      }
    }
    return names.empty() ? "(none)" : names;
  }

  std::vector<discovery::Toolset> toolsets_;
  std::string text_;
  int step_ = 0;
  std::string tool_;
  nlohmann::json arguments_;
  const discovery::Toolset *toolset_ = nullptr;
  std::string answer_;
};

/**
 * @brief Engine that treats the input as "<tool> <json arguments>"
 */
class DirectToolEngine : public ExecutionEngine {
public:
  explicit DirectToolEngine(std::vector<discovery::Toolset> toolsets)
      : toolsets_(std::move(toolsets)) {}

  std::unique_ptr<EventSource> run(const TurnRequest &request) override {
    return std::make_unique<DirectToolTurn>(toolsets_, request.text);
  }

private:
  std::vector<discovery::Toolset> toolsets_;
};

class DirectAgentFactory : public AgentFactory {
public:
  std::unique_ptr<ExecutionEngine>
  create(const AgentDefinition &definition) override {
    return std::make_unique<DirectToolEngine>(definition.toolsets);
  }
};

void printStatus(const Session &session) {
  auto status = session.statusSnapshot();
  std::cout << "\nSystem Status:\n"
            << "  - State: " << status["lifecycleState"].get<std::string>()
            << "\n"
            << "  - Agent ready: " << (status["ready"].get<bool>() ? "[OK]" : "[FAIL]")
            << "\n"
            << "  - Verbose debugging: "
            << (status["debugEnabled"].get<bool>() ? "ON" : "OFF") << "\n"
            << "  - User: " << status["userIdentifier"].get<std::string>()
            << "\n"
            << "  - Session: " << status["sessionIdentifier"].get<std::string>()
            << "\n\nServer Connection Status:\n";

  for (const auto &[name, server] : status["perServerStatus"].items()) {
    std::string state = server["status"].get<std::string>();
    std::cout << "  - " << name << ": "
              << (state == "connected" ? "[OK] " : "[FAIL] ") << state;
    if (server["error_message"].is_string()) {
      std::cout << " (" << server["error_message"].get<std::string>() << ")";
    }
    std::cout << "\n";
  }
  std::cout << std::endl;
}

void printHelp() {
  std::cout << "\nUsage:\n"
            << "  <tool> <json arguments>   e.g. celsius_to_fahrenheit "
               "{\"celsius\": 25}\n"
            << "  status                    show session and server status\n"
            << "  debug on|off              toggle verbose event display\n"
            << "  help                      show this message\n"
            << "  quit | exit | :q          leave\n"
            << std::endl;
}

void runTurn(Session &session, const std::string &input) {
  auto stream = session.processUserInput(input);
  while (auto event = stream->next()) {
    if (!session.debugEnabled()) {
      continue;
    }
    for (const auto &call : event->tool_calls) {
      std::cout << "  -> calling " << call << "\n";
    }
    for (const auto &response : event->tool_responses) {
      std::cout << "  <- " << response.name
                << (response.success ? " succeeded" : " failed") << "\n";
    }
  }

  if (stream->hasFinalResponse()) {
    if (stream->finalText()) {
      std::cout << "\nFinal Agent Response:\n" << *stream->finalText() << "\n\n";
    } else {
      std::cout << "Task completed successfully (no text response)\n\n";
    }
  } else {
    std::cout << "No final response received from agent\n\n";
  }

  if (session.debugEnabled()) {
    std::cout << "Total events processed: " << stream->eventsProcessed()
              << std::endl;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  logging::configureFromEnvironment();

  // No SA_RESTART so that a blocked read returns on Ctrl-C
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = signal_handler;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  std::optional<std::filesystem::path> config_path;
  if (argc > 1) {
    config_path = argv[1];
  }

  std::unique_ptr<Session> session;
  try {
    config::ConfigLoader loader(config_path);
    if (auto level = loader.value("logLevel"); level.is_string()) {
      logging::setLevel(logging::levelFromString(level.get<std::string>()));
    }

    Session::Options options;
    options.diagnostic_sink = [](const diagnostics::DiagnosticRecord &record) {
      std::cout << diagnostics::toHumanReadable(record) << "\n" << std::endl;
    };

    session = Session::create(loader, std::make_shared<DirectAgentFactory>(),
                              options);
    std::cout << "Connecting to tool servers..." << std::endl;
    session->establish();
  } catch (const ToolmeshException &e) {
    std::cerr << "Failed to establish session: " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid log level: " << e.what() << std::endl;
    return 1;
  }

  printStatus(*session);
  printHelp();

  std::string line;
  while (g_running) {
    std::cout << "You: " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\nInput stream ended. Goodbye!" << std::endl;
      break;
    }

    std::string input = trim(line);
    std::string command = toLower(input);
    if (input.empty()) {
      continue;
    }

    if (command == "quit" || command == "exit" || command == ":q") {
      std::cout << "Goodbye!" << std::endl;
      break;
    }
    if (command == "status") {
      printStatus(*session);
      continue;
    }
    if (command == "help") {
      printHelp();
      continue;
    }
    if (command.rfind("debug", 0) == 0) {
      std::string mode = trim(command.substr(5));
      if (mode == "on" || mode == "off") {
        session->setDebugEnabled(mode == "on");
        std::cout << "Verbose debugging " << (mode == "on" ? "enabled" : "disabled")
                  << std::endl;
      } else if (mode.empty()) {
        std::cout << "Verbose debugging is currently "
                  << (session->debugEnabled() ? "enabled" : "disabled")
                  << std::endl;
      } else {
        std::cout << "Usage: debug on/off" << std::endl;
      }
      continue;
    }

    try {
      runTurn(*session, input);
    } catch (const ToolmeshException &e) {
      std::cerr << "Error: " << e.what() << std::endl;
    }
  }

  if (!g_running) {
    std::cout << "\nSession interrupted by user. Goodbye!" << std::endl;
  }

  session->terminate();
  return 0;
}
