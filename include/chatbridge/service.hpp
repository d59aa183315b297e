#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "chatbridge/chat_store.hpp"
#include "chatbridge/common.hpp"
#include "chatbridge/errors.hpp"
#include "chatbridge/llm_plugin.hpp"
#include "chatbridge/message_handler.hpp"
#include "chatbridge/metrics.hpp"

namespace chatbridge {

struct TurnOptions {
  // Bound on the plugin call. Falls back to the service's turn timeout when unset.
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::stop_token stop{};
};

// One webhook route: parse, record, ask the model, record the reply, render.
//
// The service holds no lock of its own. Writes for one conversation are ordered by the
// store, so two turns of the same conversation may overlap in the handler and plugin
// stages while their store writes still land in arrival order.
class Service {
 public:
  using Outcome = Result<std::vector<json>, PipelineError>;

  Service(std::shared_ptr<ChatStore> store, std::shared_ptr<MessageHandler> handler,
          std::shared_ptr<LLMPlugin> plugin, std::string webhook_path,
          std::chrono::milliseconds turn_timeout = std::chrono::milliseconds::zero())
      : store_(std::move(store)),
        handler_(std::move(handler)),
        plugin_(std::move(plugin)),
        webhook_path_(std::move(webhook_path)),
        turn_timeout_(turn_timeout) {
    if (!store_ || !handler_ || !plugin_) {
      throw ConfigurationError("service " + webhook_path_ + " needs a store, a handler and a plugin");
    }
  }

  const std::string& webhook_path() const { return webhook_path_; }
  ChatStore& store() const { return *store_; }
  const MessageHandler& handler() const { return *handler_; }

  Outcome handle_inbound(const std::string& raw, const TurnOptions& options = {}) {
    metrics().inc("turns.total");

    auto parsed = handler_->parse_inbound(raw);
    if (!parsed) {
      metrics().inc("turns.invalid_payload");
      Logger::log(Logger::Level::kWarn, "[" + webhook_path_ + "] rejected payload: " + parsed.error().message);
      return PipelineError{PipelineErrorKind::kInvalidPayload, parsed.error().message};
    }
    const Message inbound = std::move(parsed.value());

    const ThreadState thread = store_->add(inbound);
    Logger::log(Logger::Level::kDebug, "[" + webhook_path_ + "] recorded message in " + thread.key().to_string() +
                                           " (" + std::to_string(thread.size()) + " retained)");

    const ModelRequest request = handler_->build_request(thread);
    auto reply = call_plugin(request, effective_deadline(options), options.stop);
    if (options.stop.stop_requested()) {
      metrics().inc("turns.cancelled");
      Logger::log(Logger::Level::kInfo, "[" + webhook_path_ + "] turn cancelled for " + thread.key().to_string());
      return PipelineError{PipelineErrorKind::kCancelled, "turn cancelled", std::nullopt};
    }
    if (!reply) {
      const ModelError& err = reply.error();
      metrics().inc("turns.model_error");
      Logger::log(Logger::Level::kWarn, "[" + webhook_path_ + "] model unavailable (" +
                                            model_error_kind_name(err.kind) + "): " + err.message);
      return PipelineError{PipelineErrorKind::kModelUnavailable, err.message, err.kind};
    }

    const Message answer = inbound.reply(TextPayload{reply.value().text});
    store_->add(answer);
    metrics().inc("turns.ok");
    return handler_->render_outbound(answer);
  }

 private:
  std::optional<std::chrono::steady_clock::time_point> effective_deadline(const TurnOptions& options) const {
    if (options.deadline) {
      return options.deadline;
    }
    if (turn_timeout_ > std::chrono::milliseconds::zero()) {
      return std::chrono::steady_clock::now() + turn_timeout_;
    }
    return std::nullopt;
  }

  // Runs the plugin on its own thread when the caller can give up on it. An abandoned call
  // keeps the plugin alive through its shared_ptr and its result is discarded.
  Result<ModelReply, ModelError> call_plugin(const ModelRequest& request,
                                            std::optional<std::chrono::steady_clock::time_point> deadline,
                                            const std::stop_token& stop) {
    if (!deadline && !stop.stop_possible()) {
      return invoke(*plugin_, request);
    }

    auto promise = std::make_shared<std::promise<Result<ModelReply, ModelError>>>();
    std::future<Result<ModelReply, ModelError>> future = promise->get_future();
    std::thread([plugin = plugin_, request, promise]() {
      promise->set_value(invoke(*plugin, request));
    }).detach();

    constexpr auto kPollInterval = std::chrono::milliseconds(20);
    while (true) {
      if (stop.stop_requested()) {
        return ModelError{ModelErrorKind::kTimeout, "turn cancelled while waiting for the model"};
      }
      auto wait = kPollInterval;
      if (deadline) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= *deadline) {
          return ModelError{ModelErrorKind::kTimeout, "model did not answer before the deadline"};
        }
        wait = (std::min)(wait, std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) +
                                    std::chrono::milliseconds(1));
      }
      if (future.wait_for(wait) == std::future_status::ready) {
        return future.get();
      }
    }
  }

  static Result<ModelReply, ModelError> invoke(LLMPlugin& plugin, const ModelRequest& request) {
    try {
      return plugin.respond(request);
    } catch (const std::exception& e) {
      return ModelError{ModelErrorKind::kTransport, std::string("plugin threw: ") + e.what()};
    }
  }

  std::shared_ptr<ChatStore> store_;
  std::shared_ptr<MessageHandler> handler_;
  std::shared_ptr<LLMPlugin> plugin_;
  std::string webhook_path_;
  std::chrono::milliseconds turn_timeout_;
};

}  // namespace chatbridge
