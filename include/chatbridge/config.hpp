#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "chatbridge/common.hpp"
#include "chatbridge/errors.hpp"
#include "chatbridge/memory_store.hpp"
#include "chatbridge/message_handler.hpp"
#include "chatbridge/openai_plugin.hpp"

namespace chatbridge {

struct PluginConfig {
  std::string name;
  std::string type;
  OpenAIPluginConfig openai{};
};

struct StoreConfig {
  std::string name;
  std::string type{"memory"};
  MemoryStoreConfig memory{};
};

struct HandlerConfig {
  std::string name;
  std::string type;
  HandlerOptions options{};
};

struct ServiceConfig {
  std::string webhook_path;
  std::string plugin;
  std::string store;
  std::string handler;
  int turn_timeout_seconds{0};
};

struct RootConfig {
  std::string host{"0.0.0.0"};
  int port{8080};
  std::size_t workers{4};
  std::vector<PluginConfig> plugins;
  std::vector<StoreConfig> stores;
  std::vector<HandlerConfig> handlers;
  std::vector<ServiceConfig> services;
};

inline const std::vector<std::string>& known_plugin_types() {
  static const std::vector<std::string> types = {"openai", "echo"};
  return types;
}

inline const std::vector<std::string>& known_handler_types() {
  static const std::vector<std::string> types = {"simple", "messenger", "whatsapp"};
  return types;
}

inline std::string resolve_env_ref(const std::string& value) {
  if (value.empty()) {
    return "";
  }

  // Supports "$ENV_NAME" and "${ENV_NAME}".
  if (value[0] != '$') {
    return value;
  }

  std::string env_name = value.substr(1);
  if (!env_name.empty() && env_name.front() == '{' && env_name.back() == '}') {
    env_name = env_name.substr(1, env_name.size() - 2);
  }
  if (env_name.empty()) {
    return value;
  }

  const char* v = std::getenv(env_name.c_str());
  return (v && *v) ? std::string(v) : "";
}

inline fs::path get_data_dir() {
  return expand_user_path("~/.chatbridge");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  return json{
      {"host", "0.0.0.0"},
      {"port", 8080},
      {"workers", 4},
      {"plugins",
       json::array({
           {{"name", "gpt"},
            {"type", "openai"},
            {"apiKey", "$OPENAI_API_KEY"},
            {"apiBase", "https://api.openai.com/v1"},
            {"model", "gpt-4o-mini"},
            {"maxTokens", 1024},
            {"temperature", 0.7},
            {"topP", 0.9},
            {"timeoutSeconds", 60}},
       })},
      {"stores", json::array({{{"name", "memory"},
                               {"type", "memory"},
                               {"maxConversations", 10000},
                               {"maxMessagesPerConversation", 40}}})},
      {"handlers", json::array({{{"name", "messenger"},
                                 {"type", "messenger"},
                                 {"systemPrompt", "You are a helpful assistant."},
                                 {"maxHistory", 0}}})},
      {"services", json::array({{{"webhookPath", "/messenger"},
                                 {"plugin", "gpt"},
                                 {"store", "memory"},
                                 {"handler", "messenger"},
                                 {"turnTimeoutSeconds", 30}}})},
  };
}

namespace detail {

inline std::string require_string(const json& obj, const char* key, const std::string& where) {
  if (!obj.contains(key) || !obj[key].is_string() || trim(obj[key].get<std::string>()).empty()) {
    throw ConfigurationError(where + ": \"" + key + "\" must be a non-empty string");
  }
  return trim(obj[key].get<std::string>());
}

inline long long integer_or(const json& obj, const char* key, long long fallback, const std::string& where) {
  if (!obj.contains(key)) {
    return fallback;
  }
  if (!obj[key].is_number_integer()) {
    throw ConfigurationError(where + ": \"" + key + "\" must be an integer");
  }
  return obj[key].get<long long>();
}

inline double number_or(const json& obj, const char* key, double fallback, const std::string& where) {
  if (!obj.contains(key)) {
    return fallback;
  }
  if (!obj[key].is_number()) {
    throw ConfigurationError(where + ": \"" + key + "\" must be a number");
  }
  return obj[key].get<double>();
}

inline const json& require_array(const json& root, const char* key) {
  if (!root.contains(key) || !root[key].is_array() || root[key].empty()) {
    throw ConfigurationError(std::string("at least one ") + key + " entry must be defined");
  }
  return root[key];
}

inline bool contains_name(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

template <typename T>
void require_unique_names(const std::vector<T>& items, const std::string& kind) {
  std::unordered_set<std::string> seen;
  for (const auto& item : items) {
    if (!seen.insert(item.name).second) {
      throw ConfigurationError("all " + kind + " names must be unique: " + item.name);
    }
  }
}

template <typename T>
bool has_name(const std::vector<T>& items, const std::string& name) {
  return std::any_of(items.begin(), items.end(), [&](const T& item) { return item.name == name; });
}

inline PluginConfig parse_plugin(const json& p) {
  if (!p.is_object()) {
    throw ConfigurationError("plugin entries must be objects");
  }
  PluginConfig out;
  out.name = require_string(p, "name", "plugin");
  const std::string where = "plugin " + out.name;
  out.type = to_lower(require_string(p, "type", where));
  if (!contains_name(known_plugin_types(), out.type)) {
    throw ConfigurationError(where + ": unknown type " + out.type);
  }

  if (out.type == "openai") {
    OpenAIPluginConfig& c = out.openai;
    c.api_key = resolve_env_ref(p.value("apiKey", std::string()));
    c.api_base = p.value("apiBase", c.api_base);
    c.model = p.value("model", c.model);
    c.max_tokens = static_cast<int>(integer_or(p, "maxTokens", c.max_tokens, where));
    c.temperature = number_or(p, "temperature", c.temperature, where);
    c.top_p = number_or(p, "topP", c.top_p, where);
    c.timeout_seconds = static_cast<int>(integer_or(p, "timeoutSeconds", c.timeout_seconds, where));
    if (trim(c.api_key).empty()) {
      throw ConfigurationError(where + ": apiKey is empty (or its environment variable is unset)");
    }
    if (c.max_tokens < 1 || c.timeout_seconds < 1) {
      throw ConfigurationError(where + ": maxTokens and timeoutSeconds must be positive");
    }
  }
  return out;
}

inline StoreConfig parse_store(const json& s) {
  if (!s.is_object()) {
    throw ConfigurationError("store entries must be objects");
  }
  StoreConfig out;
  out.name = require_string(s, "name", "store");
  const std::string where = "store " + out.name;
  out.type = to_lower(s.value("type", out.type));
  if (out.type != "memory") {
    throw ConfigurationError(where + ": unknown type " + out.type);
  }

  const long long conversations = integer_or(s, "maxConversations", 0, where);
  const long long per_thread = integer_or(s, "maxMessagesPerConversation", 0, where);
  if (conversations < 1) {
    throw ConfigurationError(where + ": maxConversations must be at least 1");
  }
  if (per_thread < 1) {
    throw ConfigurationError(where + ": maxMessagesPerConversation must be at least 1");
  }
  out.memory.max_conversations = static_cast<std::size_t>(conversations);
  out.memory.max_messages_per_conversation = static_cast<std::size_t>(per_thread);
  return out;
}

inline HandlerConfig parse_handler(const json& h) {
  if (!h.is_object()) {
    throw ConfigurationError("handler entries must be objects");
  }
  HandlerConfig out;
  out.name = require_string(h, "name", "handler");
  const std::string where = "handler " + out.name;
  out.type = to_lower(require_string(h, "type", where));
  if (!contains_name(known_handler_types(), out.type)) {
    throw ConfigurationError(where + ": unknown type " + out.type);
  }
  out.options.system_prompt = h.value("systemPrompt", std::string());
  const long long max_history = integer_or(h, "maxHistory", 0, where);
  if (max_history < 0) {
    throw ConfigurationError(where + ": maxHistory must not be negative");
  }
  out.options.max_history = static_cast<std::size_t>(max_history);
  return out;
}

inline ServiceConfig parse_service(const json& s) {
  if (!s.is_object()) {
    throw ConfigurationError("service entries must be objects");
  }
  ServiceConfig out;
  out.webhook_path = require_string(s, "webhookPath", "service");
  const std::string where = "service " + out.webhook_path;
  if (out.webhook_path.front() != '/') {
    throw ConfigurationError(where + ": webhookPath must start with '/'");
  }
  out.plugin = require_string(s, "plugin", where);
  out.store = require_string(s, "store", where);
  out.handler = require_string(s, "handler", where);
  out.turn_timeout_seconds = static_cast<int>(integer_or(s, "turnTimeoutSeconds", 0, where));
  if (out.turn_timeout_seconds < 0) {
    throw ConfigurationError(where + ": turnTimeoutSeconds must not be negative");
  }
  return out;
}

}  // namespace detail

// Parses and cross-checks a configuration document. Throws ConfigurationError.
inline RootConfig parse_root_config(const json& root) {
  if (!root.is_object()) {
    throw ConfigurationError("configuration must be a JSON object");
  }

  try {
    RootConfig cfg;
    cfg.host = root.value("host", cfg.host);
    const long long port = detail::integer_or(root, "port", cfg.port, "root");
    if (port < 0 || port > 65535) {
      throw ConfigurationError("port must be between 0 and 65535");
    }
    cfg.port = static_cast<int>(port);
    const long long workers = detail::integer_or(root, "workers", static_cast<long long>(cfg.workers), "root");
    if (workers < 1) {
      throw ConfigurationError("workers must be at least 1");
    }
    cfg.workers = static_cast<std::size_t>(workers);

    for (const auto& p : detail::require_array(root, "plugins")) {
      cfg.plugins.push_back(detail::parse_plugin(p));
    }
    for (const auto& s : detail::require_array(root, "stores")) {
      cfg.stores.push_back(detail::parse_store(s));
    }
    for (const auto& h : detail::require_array(root, "handlers")) {
      cfg.handlers.push_back(detail::parse_handler(h));
    }
    for (const auto& s : detail::require_array(root, "services")) {
      cfg.services.push_back(detail::parse_service(s));
    }

    detail::require_unique_names(cfg.plugins, "plugin");
    detail::require_unique_names(cfg.stores, "store");
    detail::require_unique_names(cfg.handlers, "handler");

    std::unordered_set<std::string> paths;
    for (const auto& s : cfg.services) {
      if (!detail::has_name(cfg.plugins, s.plugin)) {
        throw ConfigurationError(s.plugin + " must be the name of a plugin");
      }
      if (!detail::has_name(cfg.stores, s.store)) {
        throw ConfigurationError(s.store + " must be the name of a store");
      }
      if (!detail::has_name(cfg.handlers, s.handler)) {
        throw ConfigurationError(s.handler + " must be the name of a handler");
      }
      if (!paths.insert(s.webhook_path).second) {
        throw ConfigurationError("duplicate webhook path: " + s.webhook_path);
      }
    }
    return cfg;
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("invalid configuration value: ") + e.what());
  }
}

inline RootConfig load_config(const fs::path& path = get_config_path()) {
  const std::optional<std::string> raw = read_text_file(path);
  if (!raw) {
    throw ConfigurationError("cannot read configuration file: " + path.string());
  }
  json root;
  try {
    root = json::parse(*raw);
  } catch (const json::exception& e) {
    throw ConfigurationError("cannot parse " + path.string() + ": " + e.what());
  }
  return parse_root_config(root);
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2));
}

}  // namespace chatbridge
