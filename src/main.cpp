#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "chatbridge/config.hpp"
#include "chatbridge/metrics.hpp"
#include "chatbridge/wiring.hpp"

namespace {

using namespace chatbridge;

void print_usage() {
  std::cout << "chatbridge - webhook bridge between messaging platforms and language models\n\n"
            << "Usage:\n"
            << "  chatbridge init [--config PATH]\n"
            << "  chatbridge check [--config PATH] [--json]\n"
            << "  chatbridge serve [--config PATH] [--port PORT]\n"
            << "  chatbridge --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

fs::path config_path_from(const std::vector<std::string>& args) {
  const std::string raw = trim(get_flag_value(args, "--config"));
  return raw.empty() ? get_config_path() : expand_user_path(raw);
}

void configure_logging() {
  const char* json_env = std::getenv("CHATBRIDGE_LOG_JSON");
  if (json_env && *json_env && std::string(json_env) != "0") {
    Logger::set_json(true);
  }
  const char* level_env = std::getenv("CHATBRIDGE_LOG_LEVEL");
  if (level_env && *level_env) {
    Logger::set_min_level(Logger::parse_level(level_env));
  }
}

int run_init(const std::vector<std::string>& args) {
  const fs::path path = config_path_from(args);
  std::error_code ec;
  if (fs::exists(path, ec)) {
    std::cout << "Config already exists: " << path.string() << "\n";
    return 0;
  }
  if (!save_default_config(path)) {
    std::cerr << "Failed to write config: " << path.string() << "\n";
    return 1;
  }
  std::cout << "Created config: " << path.string() << "\n";
  std::cout << "Next: export OPENAI_API_KEY or edit the plugin entry, then run `chatbridge serve`.\n";
  return 0;
}

int run_check(const std::vector<std::string>& args) {
  const fs::path path = config_path_from(args);
  const RootConfig cfg = load_config(path);

  if (has_flag(args, "--json")) {
    json services = json::array();
    for (const auto& s : cfg.services) {
      services.push_back({{"webhookPath", s.webhook_path},
                          {"plugin", s.plugin},
                          {"store", s.store},
                          {"handler", s.handler},
                          {"turnTimeoutSeconds", s.turn_timeout_seconds}});
    }
    std::cout << json{{"config", path.string()},
                      {"host", cfg.host},
                      {"port", cfg.port},
                      {"workers", cfg.workers},
                      {"services", services}}
                     .dump(2)
              << "\n";
    return 0;
  }

  std::cout << "Config: " << path.string() << " [ok]\n";
  std::cout << "Listen: " << cfg.host << ":" << cfg.port << " (" << cfg.workers << " workers)\n";
  std::cout << "Plugins: " << cfg.plugins.size() << ", stores: " << cfg.stores.size()
            << ", handlers: " << cfg.handlers.size() << "\n";
  for (const auto& s : cfg.services) {
    std::cout << "  " << s.webhook_path << " -> " << s.handler << " / " << s.store << " / " << s.plugin << "\n";
  }
  return 0;
}

int run_serve(const std::vector<std::string>& args) {
  RootConfig cfg = load_config(config_path_from(args));
  const std::string port = trim(get_flag_value(args, "--port"));
  if (!port.empty()) {
    long long value = -1;
    try {
      value = std::stoll(port);
    } catch (const std::exception&) {
      std::cerr << "Invalid --port value: " << port << "\n";
      return 1;
    }
    if (value < 0 || value > 65535) {
      std::cerr << "--port must be between 0 and 65535\n";
      return 1;
    }
    cfg.port = static_cast<int>(value);
  }

  auto runner = make_services_runner(cfg);
  runner->start();
  std::cout << "chatbridge listening on " << cfg.host << ":" << runner->port() << ". Press Ctrl+C to stop.\n";

  boost::asio::io_context signals_io;
  boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      Logger::log(Logger::Level::kInfo, "Received signal " + std::to_string(signal_number) + ", shutting down");
    }
  });
  signals_io.run();

  runner->stop();
  Logger::log(Logger::Level::kInfo, "Final counters: " + metrics().to_json().dump());
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  configure_logging();

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];
  const std::vector<std::string> sub(args.begin() + 2, args.end());

  if (command == "--version" || command == "-v") {
    std::cout << "chatbridge v0.1.0\n";
    return 0;
  }

  try {
    if (command == "init") {
      return run_init(sub);
    }
    if (command == "check") {
      return run_check(sub);
    }
    if (command == "serve") {
      return run_serve(sub);
    }
  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  print_usage();
  return 1;
}
