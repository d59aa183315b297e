#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chatbridge/common.hpp"

namespace chatbridge {

class Metrics {
 public:
  void inc(const std::string& key, uint64_t delta = 1) {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[key] += delta;
  }

  uint64_t get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

  json to_json() const {
    std::lock_guard<std::mutex> lock(mu_);
    json j = json::object();
    for (const auto& kv : counters_) {
      j[kv.first] = kv.second;
    }
    j["updatedAt"] = now_iso8601();
    return j;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, uint64_t> counters_;
};

inline Metrics& metrics() {
  static Metrics m;
  return m;
}

}  // namespace chatbridge
