#pragma once

#include <string>

namespace keydr {

/// Set the level of the default spdlog logger from a name such as
/// "debug" or "warn". Throws std::runtime_error for an unknown name.
void configureLogging(const std::string& level);

/// True when spdlog knows the level name.
bool isLogLevelName(const std::string& level);

} // namespace keydr
