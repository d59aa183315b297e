#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace chatbridge {

// Invalid capacities, duplicate names or routes, dangling references. Fatal at startup.
class ConfigurationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ParseError {
  std::string message;
};

enum class ModelErrorKind { kTimeout, kRejected, kMalformedResponse, kTransport };

inline const char* model_error_kind_name(ModelErrorKind kind) {
  switch (kind) {
    case ModelErrorKind::kTimeout:
      return "timeout";
    case ModelErrorKind::kRejected:
      return "rejected";
    case ModelErrorKind::kMalformedResponse:
      return "malformed_response";
    case ModelErrorKind::kTransport:
    default:
      return "transport";
  }
}

struct ModelError {
  ModelErrorKind kind{ModelErrorKind::kTransport};
  std::string message;
};

enum class PipelineErrorKind { kInvalidPayload, kModelUnavailable, kCancelled };

inline const char* pipeline_error_kind_name(PipelineErrorKind kind) {
  switch (kind) {
    case PipelineErrorKind::kInvalidPayload:
      return "invalid_payload";
    case PipelineErrorKind::kModelUnavailable:
      return "model_unavailable";
    case PipelineErrorKind::kCancelled:
    default:
      return "cancelled";
  }
}

struct PipelineError {
  PipelineErrorKind kind{PipelineErrorKind::kInvalidPayload};
  std::string message;
  std::optional<ModelErrorKind> model_error{};
};

// Reserved for durable store variants; the in-memory store never produces one.
struct StoreError {
  std::string message;
};

// Holds either a value or an error. Accessing the wrong side throws std::logic_error.
template <typename T, typename E>
class Result {
 public:
  Result(const T& value) : data_(std::in_place_index<0>, value) {}
  Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
  Result(const E& error) : data_(std::in_place_index<1>, error) {}
  Result(E&& error) : data_(std::in_place_index<1>, std::move(error)) {}

  bool ok() const { return data_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const {
    if (!ok()) {
      throw std::logic_error("Result holds an error, not a value");
    }
    return std::get<0>(data_);
  }

  T& value() {
    if (!ok()) {
      throw std::logic_error("Result holds an error, not a value");
    }
    return std::get<0>(data_);
  }

  const E& error() const {
    if (ok()) {
      throw std::logic_error("Result holds a value, not an error");
    }
    return std::get<1>(data_);
  }

 private:
  std::variant<T, E> data_;
};

}  // namespace chatbridge
