#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace citadel::log {

/// Parse "trace|debug|info|warn|error|critical|off". Throws ConfigError.
spdlog::level::level_enum parse_level(const std::string& level);

/// Install the default "citadel" logger: colored stderr, plus a rotating file
/// sink when `file` is non-empty.
void init(const std::string& level, const std::string& file = {});

} // namespace citadel::log
