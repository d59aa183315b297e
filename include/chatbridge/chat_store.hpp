#pragma once

#include <cstddef>
#include <optional>

#include "chatbridge/message.hpp"
#include "chatbridge/thread_state.hpp"

namespace chatbridge {

// Ordered, capacity-bounded conversation storage. Implementations must be safe under
// concurrent calls and linearize adds that share a conversation key.
class ChatStore {
 public:
  virtual ~ChatStore() = default;

  // Appends the message to its conversation and returns the thread as it stands afterwards.
  virtual ThreadState add(const Message& message) = 0;

  virtual std::optional<ThreadState> get(const ConversationKey& key) const = 0;

  // Number of conversations currently retained.
  virtual std::size_t size() const = 0;
};

}  // namespace chatbridge
