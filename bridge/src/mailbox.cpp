#include <llmbridge/bridge/mailbox.hpp>
#include <llmbridge/common/uuid.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace llmbridge::bridge {

  std::shared_ptr<Mailbox> Mailbox::current()
  {
    thread_local std::shared_ptr<Mailbox> mailbox = std::make_shared<Mailbox>();
    return mailbox;
  }

  bool Mailbox::send(Message&& msg)
  {
    {
      std::lock_guard<std::mutex> lock{_lock};

      auto it = _rejected.find(msg.token);
      if (it != _rejected.end()) {

        // Nothing else arrives after the final message.
        if (std::holds_alternative<Done>(msg.body)) {
          _rejected.erase(it);
        }
        return false;
      }

      _messages.push_back(std::move(msg));
    }
    _cv.notify_all();

    return true;
  }

  std::optional<Message> Mailbox::_pop(const uuids::uuid& token)
  {
    for (auto it = _messages.begin(); it != _messages.end(); ++it) {
      if (it->token == token) {
        Message msg = std::move(*it);
        _messages.erase(it);
        return msg;
      }
    }
    return std::nullopt;
  }

  std::optional<Message>
  Mailbox::receive(const uuids::uuid& token, std::chrono::milliseconds timeout)
  {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock{_lock};
    while (true) {

      auto msg = _pop(token);
      if (msg.has_value()) {
        return msg;
      }

      if (_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
        // Last chance for a message delivered together with the timeout.
        return _pop(token);
      }
    }
  }

  void Mailbox::reject(const uuids::uuid& token)
  {
    std::lock_guard<std::mutex> lock{_lock};
    _rejected.insert(token);
  }

  bool Mailbox::rejected(const uuids::uuid& token) const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _rejected.find(token) != _rejected.end();
  }

  int Mailbox::drain(const uuids::uuid& token, int limit)
  {
    std::lock_guard<std::mutex> lock{_lock};

    int removed = 0;
    for (auto it = _messages.begin(); it != _messages.end() && removed < limit;) {
      if (it->token != token) {
        ++it;
        continue;
      }

      if (std::holds_alternative<Done>(it->body)) {
        _rejected.erase(token);
      }
      it = _messages.erase(it);
      ++removed;
    }

    bool remaining = std::any_of(_messages.begin(), _messages.end(), [&](const Message& msg) {
      return msg.token == token;
    });
    if (remaining) {
      spdlog::warn("Reached the drain limit {} for stream {}", limit, common::UUID::str(token));
    }

    return removed;
  }

  size_t Mailbox::size() const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _messages.size();
  }

} // namespace llmbridge::bridge
