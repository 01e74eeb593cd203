#include <llmbridge/common/util.hpp>

#include <cstdlib>

#include <execinfo.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace llmbridge::common::util {

  std::vector<std::string> stacktrace(int depth)
  {
    std::vector<void*> array(depth);
    int size = backtrace(array.data(), depth);
    char** trace = backtrace_symbols(array.data(), size);

    std::vector<std::string> frames;
    if (!trace) {
      return frames;
    }

    // Skip the frame of this function
    for (int i = 1; i < size; ++i)
      frames.emplace_back(trace[i]);
    free(trace);

    return frames;
  }

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  int64_t monotonic_time()
  {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch()
    )
        .count();
  }

  int64_t system_time()
  {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch()
    )
        .count();
  }

} // namespace llmbridge::common::util
