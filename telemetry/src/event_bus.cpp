#include <llmbridge/telemetry/event_bus.hpp>

#include <llmbridge/common/util.hpp>

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace llmbridge::telemetry {

  std::string join_name(const std::vector<std::string>& name)
  {
    return fmt::format("{}", fmt::join(name, "."));
  }

  std::string Event::name_str() const
  {
    return join_name(name);
  }

  NullEventBus& NullEventBus::instance()
  {
    static NullEventBus bus;
    return bus;
  }

  LocalEventBus::LocalEventBus()
  {
    _logger = common::util::create_logger("EventBus");
  }

  LocalEventBus& LocalEventBus::global()
  {
    static LocalEventBus bus;
    return bus;
  }

  bool LocalEventBus::attach(
      const std::string& handler_id, const std::vector<std::string>& event_name, handler_t handler
  )
  {
    std::string name = join_name(event_name);

    // Hold the id entry until the handler is visible, detach takes the same order.
    ids_t::rw_acc_t id_acc;
    if (!_ids.insert(id_acc, handler_id)) {
      _logger->error("Handler {} is already attached", handler_id);
      return false;
    }
    id_acc->second = name;

    handlers_t::rw_acc_t acc;
    _handlers.insert(acc, name);
    acc->second.push_back(Handler{handler_id, std::move(handler)});

    SPDLOG_LOGGER_DEBUG(_logger, "Attached handler {} to {}", handler_id, name);
    return true;
  }

  bool LocalEventBus::detach(const std::string& handler_id)
  {
    ids_t::rw_acc_t id_acc;
    if (!_ids.find(id_acc, handler_id)) {
      return false;
    }

    handlers_t::rw_acc_t acc;
    if (_handlers.find(acc, id_acc->second)) {
      auto& handlers = acc->second;
      handlers.erase(
          std::remove_if(
              handlers.begin(), handlers.end(),
              [&](const Handler& handler) { return handler.id == handler_id; }
          ),
          handlers.end()
      );
      if (handlers.empty()) {
        _handlers.erase(acc);
      }
    }

    _ids.erase(id_acc);
    return true;
  }

  size_t LocalEventBus::handlers(const std::vector<std::string>& event_name) const
  {
    handlers_t::ro_acc_t acc;
    if (!_handlers.find(acc, join_name(event_name))) {
      return 0;
    }
    return acc->second.size();
  }

  void LocalEventBus::publish(const Event& event)
  {
    std::vector<Handler> handlers;
    {
      handlers_t::ro_acc_t acc;
      if (!_handlers.find(acc, event.name_str())) {
        return;
      }
      handlers = acc->second;
    }

    for (const auto& handler : handlers) {
      try {
        handler.callback(event);
      } catch (const std::exception& exc) {
        _logger->error(
            "Handler {} failed on event {}, reason: {}", handler.id, event.name_str(), exc.what()
        );
      } catch (...) {
        _logger->error("Handler {} failed on event {} with an unknown exception", handler.id, event.name_str());
      }
    }
  }

} // namespace llmbridge::telemetry
