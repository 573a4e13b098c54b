#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace txcopy {

/// Name under which default_logger() registers with spdlog.
constexpr const char* LOGGER_NAME = "txcopy";

/// The "txcopy" logger from the spdlog registry, created on first use as
/// a stderr color logger.  Levels are taken from SPDLOG_LEVEL
/// (e.g. SPDLOG_LEVEL=txcopy=debug).
std::shared_ptr<spdlog::logger> default_logger();

} // namespace txcopy
