#ifndef LLMBRIDGE_TELEMETRY_EVENT_BUS_HPP
#define LLMBRIDGE_TELEMETRY_EVENT_BUS_HPP

#include <llmbridge/common/concurrent_table.hpp>
#include <llmbridge/telemetry/events.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace llmbridge::telemetry {

  struct EventBus {

    virtual ~EventBus() = default;

    // Fire-and-forget; never changes the outcome of the instrumented call.
    virtual void publish(const Event& event) = 0;
  };

  struct NullEventBus : EventBus {

    void publish(const Event&) override {}

    static NullEventBus& instance();
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief In-process event bus with named handlers attached to event names.
  ///
  /// Handlers run synchronously on the publishing thread and must not block.
  /// A throwing handler is logged and does not prevent other handlers from running.
  ////////////////////////////////////////////////////////////////////////////////
  class LocalEventBus : public EventBus {
  public:
    using handler_t = std::function<void(const Event&)>;

    LocalEventBus();

    static LocalEventBus& global();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Attaches a handler to a single event name.
    ///
    /// @param[in] handler_id unique handler name
    /// @param[in] event_name full event name, e.g., {"llmbridge", "call", "stop"}
    /// @param[in] handler callback
    /// @return false if a handler with such id already exists
    ////////////////////////////////////////////////////////////////////////////////
    bool attach(
        const std::string& handler_id, const std::vector<std::string>& event_name, handler_t handler
    );

    bool detach(const std::string& handler_id);

    size_t handlers(const std::vector<std::string>& event_name) const;

    void publish(const Event& event) override;

  private:
    struct Handler {
      std::string id;
      handler_t callback;
    };

    using handlers_t = common::ConcurrentTable<std::vector<Handler>>;
    using ids_t = common::ConcurrentTable<std::string>;

    // Event name -> attached handlers.
    handlers_t::table_t _handlers;

    // Handler id -> event name.
    ids_t::table_t _ids;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace llmbridge::telemetry

#endif
