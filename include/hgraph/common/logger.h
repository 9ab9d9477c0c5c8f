#ifndef HGRAPH_COMMON_LOGGER_H_
#define HGRAPH_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace hgraph {
namespace common {

class Logger {
public:
    /// Installs a stderr colour logger as the default spdlog logger.
    static void Init(spdlog::level::level_enum level = spdlog::level::warn);
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace hgraph

// Macros for convenient logging
#define HGRAPH_TRACE(...) spdlog::trace(__VA_ARGS__)
#define HGRAPH_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define HGRAPH_INFO(...)  spdlog::info(__VA_ARGS__)
#define HGRAPH_WARN(...)  spdlog::warn(__VA_ARGS__)
#define HGRAPH_ERROR(...) spdlog::error(__VA_ARGS__)
#define HGRAPH_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // HGRAPH_COMMON_LOGGER_H_
