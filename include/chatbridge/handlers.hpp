#pragma once

#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chatbridge/common.hpp"
#include "chatbridge/message_handler.hpp"

namespace chatbridge {

namespace detail {

// Platforms send ids as either strings or numbers.
inline std::string json_to_string(const json& v) {
  if (v.is_string()) {
    return v.get<std::string>();
  }
  if (v.is_number_integer()) {
    return std::to_string(v.get<long long>());
  }
  if (v.is_number_unsigned()) {
    return std::to_string(v.get<unsigned long long>());
  }
  return "";
}

inline std::string field_string(const json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key)) {
    return "";
  }
  return trim(json_to_string(obj[key]));
}

// Epoch count in Duration units, or nullopt when negative or beyond what the clock can hold.
template <typename Duration>
std::optional<Message::Timestamp> timestamp_from_count(long long count) {
  using ClockDuration = Message::Timestamp::duration;
  constexpr auto kMax = std::chrono::duration_cast<Duration>(ClockDuration::max()).count();
  if (count < 0 || count > kMax) {
    return std::nullopt;
  }
  return Message::Timestamp(std::chrono::duration_cast<ClockDuration>(Duration(count)));
}

// Millisecond timestamps. Non-integers fall back to the arrival time.
inline std::optional<Message::Timestamp> timestamp_from_ms(const json& v) {
  if (v.is_number_unsigned()) {
    const auto u = v.get<unsigned long long>();
    if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
      return std::nullopt;
    }
    return timestamp_from_count<std::chrono::milliseconds>(static_cast<long long>(u));
  }
  if (v.is_number_integer()) {
    return timestamp_from_count<std::chrono::milliseconds>(v.get<long long>());
  }
  return Message::Clock::now();
}

inline std::optional<json> parse_object(const std::string& raw, std::string& error) {
  try {
    json data = json::parse(raw);
    if (!data.is_object()) {
      error = "payload is not a JSON object";
      return std::nullopt;
    }
    return data;
  } catch (const json::exception& e) {
    error = std::string("payload is not valid JSON: ") + e.what();
    return std::nullopt;
  }
}

}  // namespace detail

// Flat JSON: {"sender", "recipient", "text", "conversation"?, "timestamp"? (ms)}.
class SimpleHandler : public MessageHandler {
 public:
  explicit SimpleHandler(HandlerOptions options = {}) : MessageHandler(std::move(options)) {}

  std::string type() const override { return "simple"; }

  Result<Message, ParseError> parse_payload(const std::string& raw) const override {
    std::string error;
    const auto data = detail::parse_object(raw, error);
    if (!data) {
      return ParseError{error};
    }

    const std::string sender = detail::field_string(*data, "sender");
    const std::string recipient = detail::field_string(*data, "recipient");
    if (sender.empty() || recipient.empty()) {
      return ParseError{"sender and recipient are required"};
    }
    if (!data->contains("text") || !(*data)["text"].is_string() ||
        trim((*data)["text"].get<std::string>()).empty()) {
      return ParseError{"text is required"};
    }

    const std::string conversation = detail::field_string(*data, "conversation");
    const auto ts =
        data->contains("timestamp") ? detail::timestamp_from_ms((*data)["timestamp"]) : Message::Clock::now();
    if (!ts) {
      return ParseError{"timestamp out of range"};
    }

    return Message(*ts, TextPayload{(*data)["text"].get<std::string>()}, Identifier::from(sender),
                   Identifier::from(recipient),
                   conversation.empty() ? Identifier::random() : Identifier::from(conversation), Role::kUser);
  }

  std::vector<json> render_outbound(const Message& message) const override {
    return {json{{"sender", message.sender().value()},
                 {"recipient", message.recipient().value()},
                 {"conversation", message.conversation_id().value()},
                 {"text", message.text()}}};
  }
};

// Messenger Platform page webhook. The first non-echo message event of a delivery is used.
class MessengerHandler : public MessageHandler {
 public:
  static constexpr std::size_t kTextLimit = 2000;

  explicit MessengerHandler(HandlerOptions options = {}) : MessageHandler(std::move(options)) {}

  std::string type() const override { return "messenger"; }

  Result<Message, ParseError> parse_payload(const std::string& raw) const override {
    std::string error;
    const auto data = detail::parse_object(raw, error);
    if (!data) {
      return ParseError{error};
    }
    if (data->value("object", "") != "page") {
      return ParseError{"not a page webhook"};
    }
    if (!data->contains("entry") || !(*data)["entry"].is_array()) {
      return ParseError{"missing entry array"};
    }

    for (const auto& entry : (*data)["entry"]) {
      if (!entry.is_object() || !entry.contains("messaging") || !entry["messaging"].is_array()) {
        continue;
      }
      for (const auto& event : entry["messaging"]) {
        if (!event.is_object() || !event.contains("message") || !event["message"].is_object()) {
          continue;
        }
        const json& message = event["message"];
        if (message.value("is_echo", false)) {
          continue;
        }
        return to_message(event, message);
      }
    }
    return ParseError{"no inbound message event in payload"};
  }

  std::vector<json> render_outbound(const Message& message) const override {
    std::vector<json> out;
    for (const auto& part : chunk_text(message.text(), kTextLimit)) {
      out.push_back({{"messaging_type", "RESPONSE"},
                     {"recipient", {{"id", message.recipient().value()}}},
                     {"message", {{"text", part}}}});
    }
    return out;
  }

 private:
  static Result<Message, ParseError> to_message(const json& event, const json& message) {
    const std::string sender = event.contains("sender") ? detail::field_string(event["sender"], "id") : "";
    const std::string recipient =
        event.contains("recipient") ? detail::field_string(event["recipient"], "id") : "";
    if (sender.empty() || recipient.empty()) {
      return ParseError{"message event without sender or recipient id"};
    }

    const std::string mid = detail::field_string(message, "mid");
    const Identifier conversation = mid.empty() ? Identifier::random() : Identifier::from(mid);
    const auto stamp =
        event.contains("timestamp") ? detail::timestamp_from_ms(event["timestamp"]) : Message::Clock::now();
    if (!stamp) {
      return ParseError{"timestamp out of range"};
    }
    const Message::Timestamp ts = *stamp;

    if (message.contains("text") && message["text"].is_string() &&
        !trim(message["text"].get<std::string>()).empty()) {
      return Message(ts, TextPayload{message["text"].get<std::string>()}, Identifier::from(sender),
                     Identifier::from(recipient), conversation, Role::kUser);
    }

    if (message.contains("attachments") && message["attachments"].is_array()) {
      for (const auto& attachment : message["attachments"]) {
        if (!attachment.is_object() || !attachment.contains("payload") || !attachment["payload"].is_object()) {
          continue;
        }
        const std::string url = detail::field_string(attachment["payload"], "url");
        if (url.empty()) {
          continue;
        }
        MediaPayload media;
        media.url = url;
        media.mime_type = attachment.value("type", "file");
        return Message(ts, std::move(media), Identifier::from(sender), Identifier::from(recipient), conversation,
                       Role::kUser);
      }
    }
    return ParseError{"message event has neither text nor a supported attachment"};
  }
};

// WhatsApp Cloud API webhook. The first message of the first change carrying one is used.
class WhatsAppHandler : public MessageHandler {
 public:
  static constexpr std::size_t kTextLimit = 4096;

  explicit WhatsAppHandler(HandlerOptions options = {}) : MessageHandler(std::move(options)) {}

  std::string type() const override { return "whatsapp"; }

  Result<Message, ParseError> parse_payload(const std::string& raw) const override {
    std::string error;
    const auto data = detail::parse_object(raw, error);
    if (!data) {
      return ParseError{error};
    }
    if (data->value("object", "") != "whatsapp_business_account") {
      return ParseError{"not a whatsapp_business_account webhook"};
    }
    if (!data->contains("entry") || !(*data)["entry"].is_array()) {
      return ParseError{"missing entry array"};
    }

    for (const auto& entry : (*data)["entry"]) {
      if (!entry.is_object() || !entry.contains("changes") || !entry["changes"].is_array()) {
        continue;
      }
      for (const auto& change : entry["changes"]) {
        if (!change.is_object() || !change.contains("value") || !change["value"].is_object()) {
          continue;
        }
        const json& value = change["value"];
        if (!value.contains("messages") || !value["messages"].is_array() || value["messages"].empty()) {
          continue;
        }
        const std::string business =
            value.contains("metadata") ? detail::field_string(value["metadata"], "phone_number_id") : "";
        if (business.empty()) {
          return ParseError{"change without metadata.phone_number_id"};
        }
        return to_message(value["messages"][0], business);
      }
    }
    return ParseError{"no inbound message in payload"};
  }

  std::vector<json> render_outbound(const Message& message) const override {
    std::vector<json> out;
    for (const auto& part : chunk_text(message.text(), kTextLimit)) {
      out.push_back({{"messaging_product", "whatsapp"},
                     {"recipient_type", "individual"},
                     {"to", message.recipient().value()},
                     {"type", "text"},
                     {"text", {{"body", part}}}});
    }
    return out;
  }

 private:
  static Result<Message, ParseError> to_message(const json& message, const std::string& business) {
    const std::string from = detail::field_string(message, "from");
    if (from.empty()) {
      return ParseError{"message without sender"};
    }

    const std::string id = detail::field_string(message, "id");
    const Identifier conversation = id.empty() ? Identifier::random() : Identifier::from(id);

    // Cloud API timestamps are epoch seconds encoded as strings.
    Message::Timestamp ts = Message::Clock::now();
    const std::string seconds = detail::field_string(message, "timestamp");
    if (!seconds.empty()) {
      std::optional<Message::Timestamp> parsed;
      try {
        parsed = detail::timestamp_from_count<std::chrono::seconds>(std::stoll(seconds));
      } catch (const std::exception&) {
        return ParseError{"invalid message timestamp: " + seconds};
      }
      if (!parsed) {
        return ParseError{"timestamp out of range"};
      }
      ts = *parsed;
    }

    const std::string type = message.value("type", "");
    if (type == "text") {
      const std::string body =
          message.contains("text") && message["text"].is_object() ? message["text"].value("body", "") : "";
      if (trim(body).empty()) {
        return ParseError{"text message without body"};
      }
      return Message(ts, TextPayload{body}, Identifier::from(from), Identifier::from(business), conversation,
                     Role::kUser);
    }

    if (type == "image" || type == "audio" || type == "video" || type == "document") {
      if (!message.contains(type) || !message[type].is_object()) {
        return ParseError{type + " message without media object"};
      }
      const json& media_obj = message[type];
      MediaPayload media;
      media.url = detail::field_string(media_obj, "id");
      media.mime_type = media_obj.value("mime_type", type);
      media.caption = media_obj.value("caption", "");
      if (media.url.empty()) {
        return ParseError{type + " message without media id"};
      }
      return Message(ts, std::move(media), Identifier::from(from), Identifier::from(business), conversation,
                     Role::kUser);
    }

    return ParseError{"unsupported message type: " + (type.empty() ? std::string("<none>") : type)};
  }
};

}  // namespace chatbridge
