#pragma once

#include <string>

#include "chatbridge/common.hpp"
#include "chatbridge/errors.hpp"

namespace chatbridge {

// Context window handed to a model backend: chat messages as {"role", "content"} objects.
struct ModelRequest {
  json messages{json::array()};
};

struct ModelReply {
  std::string text;
  std::string finish_reason{"stop"};
  json usage{json::object()};
};

class LLMPlugin {
 public:
  virtual ~LLMPlugin() = default;

  // Must not touch conversation state. Retries against the backend are the plugin's business.
  virtual Result<ModelReply, ModelError> respond(const ModelRequest& request) = 0;
};

// Answers with the last user message of the request.
class EchoPlugin : public LLMPlugin {
 public:
  Result<ModelReply, ModelError> respond(const ModelRequest& request) override {
    if (!request.messages.is_array()) {
      return ModelError{ModelErrorKind::kRejected, "request messages must be an array"};
    }
    for (auto it = request.messages.rbegin(); it != request.messages.rend(); ++it) {
      if (it->is_object() && it->value("role", "") == "user") {
        ModelReply reply;
        reply.text = it->value("content", "");
        return reply;
      }
    }
    return ModelError{ModelErrorKind::kRejected, "request has no user message"};
  }
};

}  // namespace chatbridge
