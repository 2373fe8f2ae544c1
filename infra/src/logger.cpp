#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace runq::infra {
namespace {

constexpr const char *kLoggerName = "runq";

std::shared_ptr<spdlog::logger> shared_logger() {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
  }
  return logger;
}

/// spdlog-backed ILogger; every core service logs through this.
class ConsoleLogger : public core::ILogger {
public:
  ConsoleLogger() : logger_(shared_logger()) {}

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::shared_ptr<core::ILogger> create_console_logger() {
  return std::make_shared<ConsoleLogger>();
}

bool set_log_level(const std::string &level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"; only accept that when asked for.
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }
  shared_logger()->set_level(parsed);
  return true;
}

} // namespace runq::infra
