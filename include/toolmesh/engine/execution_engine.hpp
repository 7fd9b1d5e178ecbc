#ifndef TOOLMESH_ENGINE_EXECUTION_ENGINE_HPP_
#define TOOLMESH_ENGINE_EXECUTION_ENGINE_HPP_

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolmesh/discovery/toolset.hpp"

namespace toolmesh {
namespace engine {

/**
 * @brief A tool invocation requested by the engine
 */
struct FunctionCall {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
};

/**
 * @brief The result of a tool invocation, as returned to the engine
 */
struct FunctionResponse {
  std::string name;
  nlohmann::json response;
};

/**
 * @brief One raw event produced by the engine during a turn
 */
struct EngineEvent {
  std::string author;
  std::vector<FunctionCall> function_calls;
  std::vector<FunctionResponse> function_responses;
  std::vector<std::string> text_parts;
  bool is_final = false;
};

/**
 * @brief Live, single-pass source of a turn's events
 */
class EventSource {
public:
  virtual ~EventSource() = default;

  /**
   * @brief Block until the next event is available
   *
   * @return The event, or std::nullopt once the source is exhausted
   */
  virtual std::optional<EngineEvent> next() = 0;
};

/**
 * @brief One user turn
 */
struct TurnRequest {
  std::string user_id;
  std::string session_id;
  std::string text;
};

/**
 * @brief An agent instance bound to a set of toolsets
 */
class ExecutionEngine {
public:
  virtual ~ExecutionEngine() = default;

  /**
   * @brief Start processing a turn
   *
   * @return The turn's event source; never null
   */
  virtual std::unique_ptr<EventSource> run(const TurnRequest &request) = 0;
};

/**
 * @brief Everything needed to build an agent
 */
struct AgentDefinition {
  std::string name;
  std::string model;
  std::string instruction;
  std::vector<discovery::Toolset> toolsets;
};

/**
 * @brief Builds execution engines
 */
class AgentFactory {
public:
  virtual ~AgentFactory() = default;

  /**
   * @brief Build an agent; must cope with an empty toolset list
   *
   * @throws std::exception if the agent cannot be constructed
   */
  virtual std::unique_ptr<ExecutionEngine>
  create(const AgentDefinition &definition) = 0;
};

/**
 * @brief EventSource over events that are pushed by a producer
 *
 * next() blocks until an event is pushed or the source is closed.
 */
class BufferedEventSource : public EventSource {
public:
  BufferedEventSource() = default;

  /**
   * @brief Source that already holds all of its events and is closed
   */
  explicit BufferedEventSource(std::vector<EngineEvent> events);

  void push(EngineEvent event);

  /**
   * @brief No more events will be pushed
   */
  void close();

  std::optional<EngineEvent> next() override;

private:
  std::deque<EngineEvent> events_;
  bool closed_ = false;
  std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace engine
} // namespace toolmesh

#endif // TOOLMESH_ENGINE_EXECUTION_ENGINE_HPP_
