#include "hgraph/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace hgraph {
namespace common {

void Logger::Init(spdlog::level::level_enum level) {
    try {
        auto console = spdlog::get("hgraph");
        if (!console) {
            // stdout carries query results, diagnostics go to stderr
            console = spdlog::stderr_color_mt("hgraph");
        }
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_level(level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace common
} // namespace hgraph
