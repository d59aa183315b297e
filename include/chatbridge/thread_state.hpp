#pragma once

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "chatbridge/message.hpp"

namespace chatbridge {

// Immutable snapshot of one conversation, oldest message first. Copies share storage.
class ThreadState {
 public:
  ThreadState(ConversationKey key, std::vector<Message> messages)
      : key_(std::move(key)),
        messages_(std::make_shared<const std::vector<Message>>(std::move(messages))) {
    if (messages_->empty()) {
      throw std::invalid_argument("ThreadState requires at least one message");
    }
  }

  const ConversationKey& key() const { return key_; }
  const std::vector<Message>& messages() const { return *messages_; }
  std::size_t size() const { return messages_->size(); }
  const Message& tail() const { return messages_->back(); }

 private:
  ConversationKey key_;
  std::shared_ptr<const std::vector<Message>> messages_;
};

}  // namespace chatbridge
