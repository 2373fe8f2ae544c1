#pragma once

#include <string>

namespace runq::core {

/// Logger interface used by every core service.
/// trace_id is the run id, runner id or session name an event concerns.
/// The spdlog implementation lives in infra.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace runq::core
