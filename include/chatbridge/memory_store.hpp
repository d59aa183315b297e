#pragma once

#include <cstddef>
#include <deque>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chatbridge/chat_store.hpp"
#include "chatbridge/common.hpp"
#include "chatbridge/errors.hpp"
#include "chatbridge/metrics.hpp"

namespace chatbridge {

struct MemoryStoreConfig {
  std::size_t max_conversations{1};
  std::size_t max_messages_per_conversation{1};

  void validate() const {
    if (max_conversations < 1) {
      throw ConfigurationError("maxConversations must be at least 1");
    }
    if (max_messages_per_conversation < 1) {
      throw ConfigurationError("maxMessagesPerConversation must be at least 1");
    }
  }
};

// In-memory ChatStore bounded in both conversation count and thread length.
//
// When a new conversation would exceed max_conversations, the conversation whose latest
// add is oldest is evicted. The recency list is ordered by last add, and a conversation
// enters it at creation, so two conversations never tie: creation order breaks what
// last-activity alone would not. Threads longer than max_messages_per_conversation lose
// their oldest messages.
class MemoryStore : public ChatStore {
 public:
  explicit MemoryStore(MemoryStoreConfig config) : config_(config) { config_.validate(); }

  ThreadState add(const Message& message) override {
    const ConversationKey key = message.conversation_key();

    std::lock_guard<std::mutex> lock(mu_);
    auto it = threads_.find(key);
    if (it == threads_.end()) {
      if (threads_.size() >= config_.max_conversations) {
        evict_least_recently_active();
      }
      recency_.push_back(key);
      it = threads_.emplace(key, Thread{{}, std::prev(recency_.end())}).first;
    } else {
      recency_.splice(recency_.end(), recency_, it->second.recency_pos);
    }

    Thread& thread = it->second;
    thread.messages.push_back(message);
    while (thread.messages.size() > config_.max_messages_per_conversation) {
      thread.messages.pop_front();
    }
    return ThreadState(key, std::vector<Message>(thread.messages.begin(), thread.messages.end()));
  }

  std::optional<ThreadState> get(const ConversationKey& key) const override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = threads_.find(key);
    if (it == threads_.end()) {
      return std::nullopt;
    }
    const auto& messages = it->second.messages;
    return ThreadState(key, std::vector<Message>(messages.begin(), messages.end()));
  }

  std::size_t size() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return threads_.size();
  }

  const MemoryStoreConfig& config() const { return config_; }

 private:
  struct Thread {
    std::deque<Message> messages;
    std::list<ConversationKey>::iterator recency_pos;
  };

  // Caller holds mu_.
  void evict_least_recently_active() {
    if (recency_.empty()) {
      return;
    }
    const ConversationKey victim = recency_.front();
    recency_.pop_front();
    threads_.erase(victim);
    metrics().inc("store.evictions");
    Logger::log(Logger::Level::kDebug, "Evicted conversation " + victim.to_string());
  }

  MemoryStoreConfig config_;
  mutable std::mutex mu_;
  std::list<ConversationKey> recency_;
  std::unordered_map<ConversationKey, Thread> threads_;
};

}  // namespace chatbridge
