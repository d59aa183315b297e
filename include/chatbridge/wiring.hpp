#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "chatbridge/config.hpp"
#include "chatbridge/handlers.hpp"
#include "chatbridge/llm_plugin.hpp"
#include "chatbridge/memory_store.hpp"
#include "chatbridge/openai_plugin.hpp"
#include "chatbridge/service.hpp"
#include "chatbridge/services_runner.hpp"

namespace chatbridge {

inline std::shared_ptr<LLMPlugin> make_plugin(const PluginConfig& cfg) {
  if (cfg.type == "openai") {
    return std::make_shared<OpenAIPlugin>(cfg.openai);
  }
  if (cfg.type == "echo") {
    return std::make_shared<EchoPlugin>();
  }
  throw ConfigurationError("plugin " + cfg.name + ": unknown type " + cfg.type);
}

inline std::shared_ptr<ChatStore> make_store(const StoreConfig& cfg) {
  if (cfg.type == "memory") {
    return std::make_shared<MemoryStore>(cfg.memory);
  }
  throw ConfigurationError("store " + cfg.name + ": unknown type " + cfg.type);
}

inline std::shared_ptr<MessageHandler> make_handler(const HandlerConfig& cfg) {
  if (cfg.type == "simple") {
    return std::make_shared<SimpleHandler>(cfg.options);
  }
  if (cfg.type == "messenger") {
    return std::make_shared<MessengerHandler>(cfg.options);
  }
  if (cfg.type == "whatsapp") {
    return std::make_shared<WhatsAppHandler>(cfg.options);
  }
  throw ConfigurationError("handler " + cfg.name + ": unknown type " + cfg.type);
}

// Builds one instance per named component; services naming the same store share its threads.
inline std::vector<std::shared_ptr<Service>> make_services(const RootConfig& cfg) {
  std::unordered_map<std::string, std::shared_ptr<LLMPlugin>> plugins;
  std::unordered_map<std::string, std::shared_ptr<ChatStore>> stores;
  std::unordered_map<std::string, std::shared_ptr<MessageHandler>> handlers;
  for (const auto& p : cfg.plugins) {
    plugins.emplace(p.name, make_plugin(p));
  }
  for (const auto& s : cfg.stores) {
    stores.emplace(s.name, make_store(s));
  }
  for (const auto& h : cfg.handlers) {
    handlers.emplace(h.name, make_handler(h));
  }

  std::vector<std::shared_ptr<Service>> services;
  for (const auto& s : cfg.services) {
    const auto plugin = plugins.find(s.plugin);
    const auto store = stores.find(s.store);
    const auto handler = handlers.find(s.handler);
    if (plugin == plugins.end() || store == stores.end() || handler == handlers.end()) {
      throw ConfigurationError("service " + s.webhook_path + " references an undefined component");
    }
    services.push_back(std::make_shared<Service>(store->second, handler->second, plugin->second, s.webhook_path,
                                                 std::chrono::seconds(s.turn_timeout_seconds)));
    Logger::log(Logger::Level::kInfo, "Service " + s.webhook_path + " -> handler " + s.handler + ", store " +
                                          s.store + ", plugin " + s.plugin);
  }
  return services;
}

inline std::unique_ptr<ServicesRunner> make_services_runner(const RootConfig& cfg) {
  RunnerOptions options;
  options.host = cfg.host;
  options.port = static_cast<uint16_t>(cfg.port);
  options.workers = cfg.workers;
  return std::make_unique<ServicesRunner>(make_services(cfg), options);
}

}  // namespace chatbridge
