#include "logging.hpp"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include <memory>
#include <vector>

namespace logging {
void setup(const Settings& s)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (s.file) {
        auto max_size = 1048576 * 5; // 5 MB
        auto max_files = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(*s.file, max_size, max_files));
    }
    auto logger { std::make_shared<spdlog::logger>("vault", sinks.begin(), sinks.end()) };
    logger->set_level(s.level);
    spdlog::set_default_logger(logger);
    logSettlement = s.settlement;
}
}
