#ifndef TOOLMESH_ENGINE_EVENT_STREAM_HPP_
#define TOOLMESH_ENGINE_EVENT_STREAM_HPP_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolmesh/engine/execution_engine.hpp"
#include "toolmesh/utils/diagnostics.hpp"

namespace toolmesh {
namespace engine {

/**
 * @brief Outcome of one tool invocation as seen by the caller
 */
struct ToolResponseSummary {
  std::string name;
  bool success = true;
};

/**
 * @brief One classified event of a turn
 */
struct ResponseEvent {
  std::size_t sequence_number = 0; ///< 1-based, per turn
  bool is_final = false;
  std::vector<std::string> tool_calls;
  std::vector<ToolResponseSummary> tool_responses;
  std::optional<std::string> content; ///< First text fragment, if any
};

nlohmann::json toJson(const ResponseEvent &event);

/**
 * @brief Whether a tool result carries an error marker
 *
 * A result is an error when it has a non-null `error` member or
 * `isError == true`.
 */
bool isErrorResult(const nlohmann::json &response);

/**
 * @brief Classifies the live events of one turn
 *
 * The stream is single-pass. It ends after the first final event, or when
 * the source runs dry, whichever comes first. Source events that carry
 * nothing to report (no tool traffic, no text, not final) are consumed
 * without being yielded.
 */
class EventStream {
public:
  /**
   * @brief Construct a stream over a turn's event source
   *
   * @param source The engine's event source
   * @param debug_enabled When set, every yielded event is also rendered as a
   * diagnostic record and passed to the sink (or logged if there is none)
   * @param sink Receives diagnostic records
   * @param on_complete Called once, when the stream ends or is destroyed
   */
  EventStream(std::unique_ptr<EventSource> source, bool debug_enabled,
              diagnostics::DiagnosticSink sink = {},
              std::function<void()> on_complete = {});

  ~EventStream();

  EventStream(const EventStream &) = delete;
  EventStream &operator=(const EventStream &) = delete;

  /**
   * @brief Pull the next classified event
   *
   * @return The event, or std::nullopt once the stream has ended
   */
  std::optional<ResponseEvent> next();

  bool finished() const;

  /**
   * @brief Whether a final event was seen
   */
  bool hasFinalResponse() const;

  /**
   * @brief The answer text carried by the final event, if any
   */
  const std::optional<std::string> &finalText() const;

  /**
   * @brief Number of source events consumed so far
   */
  std::size_t eventsProcessed() const;

private:
  ResponseEvent classify(const EngineEvent &event);
  void emitDiagnostic(const ResponseEvent &event);
  void complete();

  std::unique_ptr<EventSource> source_;
  bool debug_enabled_;
  diagnostics::DiagnosticSink sink_;
  std::function<void()> on_complete_;

  bool finished_ = false;
  bool has_final_ = false;
  std::optional<std::string> final_text_;
  std::size_t events_processed_ = 0;
  std::size_t sequence_ = 0;
};

} // namespace engine
} // namespace toolmesh

#endif // TOOLMESH_ENGINE_EVENT_STREAM_HPP_
