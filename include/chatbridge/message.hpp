#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <variant>

#include "chatbridge/identifier.hpp"

namespace chatbridge {

enum class Role { kUser, kAssistant, kSystem };

inline const char* role_name(Role role) {
  switch (role) {
    case Role::kUser:
      return "user";
    case Role::kAssistant:
      return "assistant";
    case Role::kSystem:
    default:
      return "system";
  }
}

struct TextPayload {
  std::string text;

  bool operator==(const TextPayload& other) const = default;
};

struct MediaPayload {
  std::string url;
  std::string mime_type;
  std::string caption;

  bool operator==(const MediaPayload& other) const = default;
};

using Payload = std::variant<TextPayload, MediaPayload>;

// Text a model sees for a payload. Media without a caption is described by its kind.
inline std::string payload_text(const Payload& payload) {
  if (const auto* text = std::get_if<TextPayload>(&payload)) {
    return text->text;
  }
  const auto& media = std::get<MediaPayload>(payload);
  if (!trim(media.caption).empty()) {
    return media.caption;
  }
  return "[media: " + (media.mime_type.empty() ? std::string("attachment") : media.mime_type) + "]";
}

// Unordered pair of participants. {a, b} and {b, a} produce the same key.
class ConversationKey {
 public:
  static ConversationKey of(const Identifier& a, const Identifier& b) {
    return b < a ? ConversationKey(b, a) : ConversationKey(a, b);
  }

  const Identifier& first() const { return first_; }
  const Identifier& second() const { return second_; }

  std::string to_string() const { return first_.value() + "|" + second_.value(); }

  bool operator==(const ConversationKey& other) const = default;

 private:
  ConversationKey(Identifier first, Identifier second) : first_(std::move(first)), second_(std::move(second)) {}

  Identifier first_;
  Identifier second_;
};

class Message {
 public:
  using Clock = std::chrono::system_clock;
  using Timestamp = Clock::time_point;

  Message(Timestamp timestamp, Payload payload, Identifier sender, Identifier recipient,
          Identifier conversation_id, Role role)
      : timestamp_(timestamp),
        payload_(std::move(payload)),
        sender_(std::move(sender)),
        recipient_(std::move(recipient)),
        conversation_id_(std::move(conversation_id)),
        role_(role) {}

  Timestamp timestamp() const { return timestamp_; }
  const Payload& payload() const { return payload_; }
  const Identifier& sender() const { return sender_; }
  const Identifier& recipient() const { return recipient_; }
  const Identifier& conversation_id() const { return conversation_id_; }
  Role role() const { return role_; }

  std::string text() const { return payload_text(payload_); }

  ConversationKey conversation_key() const { return ConversationKey::of(sender_, recipient_); }

  // Reply travelling the other direction in the same conversation, never timestamped before this message.
  Message reply(Payload payload, Role role = Role::kAssistant) const {
    const Timestamp now = Clock::now();
    return Message((std::max)(now, timestamp_), std::move(payload), recipient_, sender_, conversation_id_, role);
  }

  bool operator==(const Message& other) const = default;

 private:
  Timestamp timestamp_;
  Payload payload_;
  Identifier sender_;
  Identifier recipient_;
  Identifier conversation_id_;
  Role role_;
};

}  // namespace chatbridge

template <>
struct std::hash<chatbridge::ConversationKey> {
  std::size_t operator()(const chatbridge::ConversationKey& key) const noexcept {
    const std::size_t a = std::hash<chatbridge::Identifier>{}(key.first());
    const std::size_t b = std::hash<chatbridge::Identifier>{}(key.second());
    return a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2));
  }
};
