#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "chatbridge/common.hpp"
#include "chatbridge/errors.hpp"
#include "chatbridge/llm_plugin.hpp"
#include "chatbridge/message.hpp"
#include "chatbridge/thread_state.hpp"

namespace chatbridge {

struct HandlerOptions {
  std::string system_prompt;
  // 0 keeps every message the store retained.
  std::size_t max_history{0};
};

// Translates one platform's webhook payloads into Messages and replies back into
// platform send-requests. The pipeline never looks at the platform outside a handler.
class MessageHandler {
 public:
  explicit MessageHandler(HandlerOptions options) : options_(std::move(options)) {}
  virtual ~MessageHandler() = default;

  virtual std::string type() const = 0;

  // Never throws: malformed or unexpectedly typed JSON becomes a ParseError.
  Result<Message, ParseError> parse_inbound(const std::string& raw) const {
    try {
      return parse_payload(raw);
    } catch (const json::exception& e) {
      return ParseError{std::string("unexpected payload shape: ") + e.what()};
    }
  }

  // One platform send-request per element; long replies become several parts.
  virtual std::vector<json> render_outbound(const Message& message) const = 0;

  virtual ModelRequest build_request(const ThreadState& thread) const {
    ModelRequest request;
    request.messages = build_chat_messages(thread);
    return request;
  }

  const HandlerOptions& options() const { return options_; }

 protected:
  virtual Result<Message, ParseError> parse_payload(const std::string& raw) const = 0;

  json build_chat_messages(const ThreadState& thread) const {
    json messages = json::array();
    if (!trim(options_.system_prompt).empty()) {
      messages.push_back({{"role", "system"}, {"content", options_.system_prompt}});
    }

    const auto& history = thread.messages();
    std::size_t start = 0;
    if (options_.max_history > 0 && history.size() > options_.max_history) {
      start = history.size() - options_.max_history;
    }
    for (std::size_t i = start; i < history.size(); ++i) {
      messages.push_back({{"role", role_name(history[i].role())}, {"content", history[i].text()}});
    }
    return messages;
  }

  HandlerOptions options_;
};

}  // namespace chatbridge
