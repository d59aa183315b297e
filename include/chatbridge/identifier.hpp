#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "chatbridge/common.hpp"

namespace chatbridge {

// Opaque identity of a platform participant or conversation.
class Identifier {
 public:
  static Identifier random() { return Identifier(random_id(16)); }
  static Identifier from(std::string value) { return Identifier(std::move(value)); }
  static Identifier from(int64_t value) { return Identifier(std::to_string(value)); }

  const std::string& value() const { return value_; }

  bool operator==(const Identifier& other) const = default;
  std::strong_ordering operator<=>(const Identifier& other) const = default;

 private:
  explicit Identifier(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

}  // namespace chatbridge

template <>
struct std::hash<chatbridge::Identifier> {
  std::size_t operator()(const chatbridge::Identifier& id) const noexcept {
    return std::hash<std::string>{}(id.value());
  }
};
