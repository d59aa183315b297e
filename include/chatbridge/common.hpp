#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace chatbridge {

using json = nlohmann::json;
namespace fs = std::filesystem;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Splits text into parts of at most max_bytes, never cutting a UTF-8 sequence in two.
inline std::vector<std::string> chunk_text(const std::string& s, std::size_t max_bytes) {
  std::vector<std::string> out;
  if (max_bytes == 0 || s.empty()) {
    return out;
  }
  std::size_t pos = 0;
  while (pos < s.size()) {
    std::size_t cut = (std::min)(s.size(), pos + max_bytes);
    if (cut < s.size()) {
      std::size_t back = cut;
      while (back > pos && (static_cast<unsigned char>(s[back]) & 0xC0) == 0x80) {
        --back;
      }
      if (back > pos) {
        cut = back;
      }
    }
    out.push_back(s.substr(pos, cut - pos));
    pos = cut;
  }
  return out;
}

// "~/x" resolves against $HOME, falling back to the working directory.
inline fs::path expand_user_path(const std::string& p) {
  if (p.empty() || p[0] != '~') {
    return fs::path(p);
  }
  const char* home = std::getenv("HOME");
  const auto first = p.find_first_not_of('/', 1);
  const std::string rest = first == std::string::npos ? std::string() : p.substr(first);
  return fs::path(home && *home ? home : ".") / rest;
}

inline std::optional<std::string> read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
  }
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  out << content;
  return static_cast<bool>(out.flush());
}

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
inline std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
  return ss.str();
}

// Lowercase hex, used for generated conversation ids.
inline std::string random_id(std::size_t n = 16) {
  static constexpr char kHex[] = "0123456789abcdef";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::string out(n, '0');
  uint64_t bits = 0;
  for (std::size_t i = 0; i < n; ++i) {
    if (i % 16 == 0) {
      bits = rng();
    }
    out[i] = kHex[bits & 0xF];
    bits >>= 4;
  }
  return out;
}

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(level); }

  static Level parse_level(const std::string& name, Level fallback = Level::kInfo) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      return Level::kDebug;
    }
    if (n == "info") {
      return Level::kInfo;
    }
    if (n == "warn" || n == "warning") {
      return Level::kWarn;
    }
    if (n == "error") {
      return Level::kError;
    }
    return fallback;
  }

  static bool enabled(Level level) { return level_rank(level) >= level_rank(min_level().load()); }

  // One line per call on stderr; JSON lines when set_json(true).
  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    std::string line;
    if (json_mode().load()) {
      line = json{{"ts", now_iso8601()}, {"level", level_name(level)}, {"msg", msg}}.dump(
          -1, ' ', false, json::error_handler_t::replace);
    } else {
      line = now_iso8601() + " " + level_name(level) + " " + msg;
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << line << '\n';
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static std::atomic<Level>& min_level() {
    static std::atomic<Level> v{Level::kInfo};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "info";
      case Level::kWarn:
        return "warn";
      case Level::kError:
        return "error";
      case Level::kDebug:
      default:
        return "debug";
    }
  }
};

}  // namespace chatbridge
