#pragma once

#include <algorithm>
#include <string>
#include <utility>

#include "chatbridge/common.hpp"
#include "chatbridge/http.hpp"
#include "chatbridge/llm_plugin.hpp"

namespace chatbridge {

struct OpenAIPluginConfig {
  std::string api_key;
  std::string api_base{"https://api.openai.com/v1"};
  std::string model{"gpt-4o-mini"};
  int max_tokens{1024};
  double temperature{0.7};
  double top_p{0.9};
  int timeout_seconds{60};
};

// OpenAI-compatible /chat/completions backend (OpenAI, OpenRouter, NIM, local servers).
class OpenAIPlugin : public LLMPlugin {
 public:
  explicit OpenAIPlugin(OpenAIPluginConfig config) : config_(std::move(config)) {
    if (config_.api_base.empty()) {
      config_.api_base = "https://api.openai.com/v1";
    }
    while (!config_.api_base.empty() && config_.api_base.back() == '/') {
      config_.api_base.pop_back();
    }
  }

  const OpenAIPluginConfig& config() const { return config_; }

  json build_payload(const ModelRequest& request) const {
    return json{{"model", config_.model},
                {"messages", request.messages},
                {"max_tokens", (std::max)(1, config_.max_tokens)},
                {"temperature", config_.temperature},
                {"top_p", config_.top_p}};
  }

  Result<ModelReply, ModelError> respond(const ModelRequest& request) override {
    const HttpHeaders headers = {
        {"Authorization", "Bearer " + config_.api_key},
        {"Content-Type", "application/json"},
    };

    thread_local HttpClient client;
    const HttpResponse resp = client.post(config_.api_base + "/chat/completions", build_payload(request).dump(),
                                          headers, static_cast<long>((std::max)(1, config_.timeout_seconds)) * 1000);

    if (resp.timed_out) {
      return ModelError{ModelErrorKind::kTimeout, "LLM request timed out: " + resp.error};
    }
    if (!resp.error.empty()) {
      return ModelError{ModelErrorKind::kTransport, "Error calling LLM: " + resp.error};
    }
    if (resp.status < 200 || resp.status >= 300) {
      return ModelError{ModelErrorKind::kRejected,
                        "LLM returned HTTP " + std::to_string(resp.status) + ": " +
                            excerpt(resp.body)};
    }
    return parse_completion(resp.body);
  }

  // First 300 bytes of a backend body, cut on a UTF-8 boundary.
  static std::string excerpt(const std::string& body) {
    const auto parts = chunk_text(body, 300);
    return parts.empty() ? std::string() : parts.front();
  }

  static Result<ModelReply, ModelError> parse_completion(const std::string& body) {
    try {
      const json data = json::parse(body);
      if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()) {
        return ModelError{ModelErrorKind::kMalformedResponse, "malformed LLM response: no choices"};
      }

      const json& choice = data["choices"][0];
      if (!choice.contains("message") || !choice["message"].is_object()) {
        return ModelError{ModelErrorKind::kMalformedResponse, "malformed LLM response: missing message"};
      }

      ModelReply out;
      if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        out.finish_reason = choice["finish_reason"].get<std::string>();
      }
      if (data.contains("usage") && data["usage"].is_object()) {
        out.usage = data["usage"];
      }

      const json& message = choice["message"];
      if (!message.contains("content") || !message["content"].is_string()) {
        return ModelError{ModelErrorKind::kMalformedResponse, "malformed LLM response: no text content"};
      }
      out.text = message["content"].get<std::string>();
      if (trim(out.text).empty()) {
        return ModelError{ModelErrorKind::kMalformedResponse, "LLM returned an empty reply"};
      }
      return out;
    } catch (const json::exception& e) {
      return ModelError{ModelErrorKind::kMalformedResponse, std::string("Error parsing LLM response: ") + e.what()};
    }
  }

 private:
  OpenAIPluginConfig config_;
};

}  // namespace chatbridge
