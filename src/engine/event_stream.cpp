#include "toolmesh/engine/event_stream.hpp"
#include "toolmesh/utils/logging.hpp"

namespace toolmesh {
namespace engine {

nlohmann::json toJson(const ResponseEvent &event) {
  nlohmann::json j = {{"sequence_number", event.sequence_number},
                      {"is_final", event.is_final}};
  if (!event.tool_calls.empty()) {
    j["tool_calls"] = event.tool_calls;
  }
  if (!event.tool_responses.empty()) {
    nlohmann::json responses = nlohmann::json::array();
    for (const auto &response : event.tool_responses) {
      responses.push_back(
          {{"name", response.name}, {"success", response.success}});
    }
    j["tool_responses"] = std::move(responses);
  }
  if (event.content) {
    j["content"] = *event.content;
  }
  return j;
}

bool isErrorResult(const nlohmann::json &response) {
  if (!response.is_object()) {
    return false;
  }
  if (response.contains("error") && !response["error"].is_null()) {
    return true;
  }
  auto it = response.find("isError");
  return it != response.end() && it->is_boolean() && it->get<bool>();
}

EventStream::EventStream(std::unique_ptr<EventSource> source,
                         bool debug_enabled, diagnostics::DiagnosticSink sink,
                         std::function<void()> on_complete)
    : source_(std::move(source)), debug_enabled_(debug_enabled),
      sink_(std::move(sink)), on_complete_(std::move(on_complete)) {
  if (!source_) {
    complete();
  }
}

EventStream::~EventStream() { complete(); }

std::optional<ResponseEvent> EventStream::next() {
  while (!finished_) {
    std::optional<EngineEvent> raw;
    try {
      raw = source_->next();
    } catch (const std::exception &e) {
      TOOLMESH_LOG_ERROR("Event source failed: " + std::string(e.what()));
      complete();
      throw;
    }

    if (!raw) {
      TOOLMESH_LOG_DEBUG("Event source ended after " +
                         std::to_string(events_processed_) +
                         " event(s) without a final response");
      complete();
      return std::nullopt;
    }

    ++events_processed_;

    bool reportable = raw->is_final || !raw->function_calls.empty() ||
                      !raw->function_responses.empty() ||
                      !raw->text_parts.empty();
    if (!reportable) {
      continue;
    }

    ResponseEvent event = classify(*raw);

    if (event.is_final) {
      has_final_ = true;
      final_text_ = event.content;
    }

    if (debug_enabled_) {
      emitDiagnostic(event);
    }

    if (event.is_final) {
      complete();
    }
    return event;
  }

  return std::nullopt;
}

ResponseEvent EventStream::classify(const EngineEvent &raw) {
  ResponseEvent event;
  event.sequence_number = ++sequence_;
  event.is_final = raw.is_final;

  for (const auto &call : raw.function_calls) {
    event.tool_calls.push_back(call.name);
  }
  for (const auto &response : raw.function_responses) {
    event.tool_responses.push_back(
        {response.name, !isErrorResult(response.response)});
  }
  if (!raw.text_parts.empty()) {
    event.content = raw.text_parts.front();
  }

  return event;
}

void EventStream::emitDiagnostic(const ResponseEvent &event) {
  nlohmann::json metadata = {{"event_sequence", event.sequence_number},
                             {"is_final", event.is_final}};
  std::string message;
  if (event.is_final) {
    message = "Final response";
  } else if (!event.tool_calls.empty()) {
    message = "Tool invocation";
  } else if (!event.tool_responses.empty()) {
    message = "Tool result";
  } else {
    message = "Intermediate content";
  }

  auto record = diagnostics::makeSuccessRecord(toJson(event), message,
                                               std::move(metadata));
  if (sink_) {
    try {
      sink_(record);
    } catch (const std::exception &e) {
      TOOLMESH_LOG_WARNING("Diagnostic sink failed: " + std::string(e.what()));
    }
  } else {
    TOOLMESH_LOG_INFO(diagnostics::toHumanReadable(record));
  }
}

void EventStream::complete() {
  if (finished_ && !on_complete_) {
    return;
  }
  finished_ = true;
  if (on_complete_) {
    auto callback = std::move(on_complete_);
    on_complete_ = nullptr;
    callback();
  }
}

bool EventStream::finished() const { return finished_; }

bool EventStream::hasFinalResponse() const { return has_final_; }

const std::optional<std::string> &EventStream::finalText() const {
  return final_text_;
}

std::size_t EventStream::eventsProcessed() const { return events_processed_; }

} // namespace engine
} // namespace toolmesh
