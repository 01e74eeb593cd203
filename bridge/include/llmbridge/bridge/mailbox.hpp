#ifndef LLMBRIDGE_BRIDGE_MAILBOX_HPP
#define LLMBRIDGE_BRIDGE_MAILBOX_HPP

#include <llmbridge/engine/value.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <variant>

#include <uuid.h>

namespace llmbridge::bridge {

  struct Chunk {
    engine::Value value;
  };

  // Always the last message of a stream.
  struct Done {
    engine::Outcome outcome;
  };

  struct Message {
    uuids::uuid token;
    std::variant<Chunk, Done> body;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Message queue owned by one consumer, written by any number of workers.
  ///
  /// Receiving is selective: the consumer waits for the oldest message carrying
  /// a given correlation token, messages of other streams stay in place.
  ////////////////////////////////////////////////////////////////////////////////
  class Mailbox {
  public:
    // Mailbox of the calling thread.
    static std::shared_ptr<Mailbox> current();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Enqueues a message and wakes up the consumer.
    ///
    /// @return false if the token has been rejected; the message is discarded
    ////////////////////////////////////////////////////////////////////////////////
    bool send(Message&& msg);

    std::optional<Message> receive(const uuids::uuid& token, std::chrono::milliseconds timeout);

    std::optional<Message> try_receive(const uuids::uuid& token)
    {
      return receive(token, std::chrono::milliseconds{0});
    }

    // All future messages with this token are discarded on arrival,
    // until the final message of the stream arrives.
    void reject(const uuids::uuid& token);

    bool rejected(const uuids::uuid& token) const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Removes queued messages with the token.
    ///
    /// @param[in] token correlation token
    /// @param[in] limit maximal number of removed messages
    /// @return number of removed messages
    ////////////////////////////////////////////////////////////////////////////////
    int drain(const uuids::uuid& token, int limit);

    size_t size() const;

  private:
    std::optional<Message> _pop(const uuids::uuid& token);

    mutable std::mutex _lock;

    std::condition_variable _cv;

    std::deque<Message> _messages;

    std::unordered_set<uuids::uuid> _rejected;
  };

} // namespace llmbridge::bridge

#endif
