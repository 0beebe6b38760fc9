#include "log/logging.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace keydr {

bool isLogLevelName(const std::string& level) {
    // from_str maps unknown names to "off"
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

void configureLogging(const std::string& level) {
    if (!isLogLevelName(level)) {
        throw std::runtime_error("Unknown log level: " + level);
    }
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace keydr
