#ifndef LLMBRIDGE_BRIDGE_WORKERS_HPP
#define LLMBRIDGE_BRIDGE_WORKERS_HPP

#include <llmbridge/bridge/config.hpp>
#include <llmbridge/common/util.hpp>

#include <functional>
#include <memory>
#include <utility>

#include <BS_thread_pool.hpp>

namespace llmbridge::bridge {

  // Background units executing stream workers. Destruction waits for all tasks.
  class WorkerPool {
  public:
    WorkerPool(const config::Workers& config) : _pool(config.threads)
    {
      _logger = common::util::create_logger("Workers");
      _logger->debug("Started worker pool with {} threads", config.threads);
    }

    template <typename F>
    void add_task(F&& func)
    {
      _pool.detach_task(std::forward<F>(func));
    }

    void wait()
    {
      _pool.wait();
    }

    size_t threads() const
    {
      return _pool.get_thread_count();
    }

  private:
    BS::thread_pool _pool;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace llmbridge::bridge

#endif
