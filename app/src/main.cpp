#include "core/coordinator.h"
#include "core/logger.h"
#include "infra/config.h"
#include "infra/coordinator_api.h"
#include "infra/http_server.h"
#include "infra/logger.h"

#include <pthread.h>
#include <signal.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

/// Block SIGINT/SIGTERM in every thread so sigwait() in main receives them.
/// Must run before any thread is spawned.
sigset_t block_shutdown_signals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  return signals;
}

} // namespace

int main() {
  const sigset_t shutdown_signals = block_shutdown_signals();

  auto logger = runq::infra::create_console_logger();

  auto loaded = runq::infra::DaemonConfig::from_environment();
  if (loaded.is_err()) {
    logger->error("startup", "runqd", "config_invalid", loaded.error().message);
    return EXIT_FAILURE;
  }
  const auto config = loaded.value();

  if (!runq::infra::set_log_level(config.log_level)) {
    logger->warn("startup", "runqd", "log_level_invalid",
                 "unknown RUNQ_LOG_LEVEL=" + config.log_level + ", keeping info");
  }

  runq::core::Coordinator coordinator(config.coordinator, logger);
  coordinator.start();

  runq::infra::CoordinatorApi api(coordinator, logger);
  runq::infra::HttpServer server(config.bind_host,
                                 static_cast<std::uint16_t>(config.port),
                                 api.handler(), logger);
  auto started = server.start();
  if (started.is_err()) {
    logger->error("startup", "runqd", "listen_failed", started.error().message);
    coordinator.shutdown();
    return EXIT_FAILURE;
  }

  const auto &cc = coordinator.config();
  logger->info(
      "startup", "runqd", "ready",
      "url=" + server.base_url() +
          " heartbeat_timeout_ms=" + std::to_string(cc.heartbeat.timeout.count()) +
          " claim_grace_ms=" + std::to_string(cc.recovery.claim_grace.count()) +
          " no_match_timeout_ms=" +
          std::to_string(cc.recovery.no_match_timeout.count()) +
          " max_poll_wait_ms=" + std::to_string(cc.poll.max_wait.count()));

  int received = 0;
  sigwait(&shutdown_signals, &received);
  logger->info("shutdown", "runqd", "signal_received",
               "signal=" + std::to_string(received));

  // Release blocked polls first so the server can join its connections.
  coordinator.shutdown();
  server.stop();
  return EXIT_SUCCESS;
}
