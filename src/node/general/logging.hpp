#pragma once
#include "spdlog/spdlog.h"
#include <atomic>
#include <optional>
#include <string>

namespace logging {
struct Settings {
    spdlog::level::level_enum level { spdlog::level::info };
    std::optional<std::string> file; // rotating log file
    bool settlement { false }; // per step settlement logging
};

// installs the default logger with a colored stdout sink and an optional
// rotating file sink
void setup(const Settings&);

inline std::atomic<bool> logSettlement { false };
}

template <typename... Args>
inline void log_settlement(spdlog::format_string_t<Args...> fmt, Args&&... args)
{
    if (logging::logSettlement)
        spdlog::info(fmt, std::forward<Args>(args)...);
}
