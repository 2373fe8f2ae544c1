#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace runq::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
std::shared_ptr<core::ILogger> create_console_logger();

/// Set the level of the shared "runq" spdlog logger ("trace", "debug",
/// "info", "warn", "error", "off"). Unknown names leave it unchanged and
/// return false.
bool set_log_level(const std::string &level);

} // namespace runq::infra
