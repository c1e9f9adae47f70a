#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <signal.h>

#include "core/action_executor.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/runtime.hpp"
#include "ingest/jsonl_reader.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

void install_shutdown_handler(const int signal_number) {
  struct sigaction action{};
  action.sa_handler = handle_shutdown_signal;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: a blocked stdin read must return so shutdown is noticed.
  action.sa_flags = 0;
  sigaction(signal_number, &action, nullptr);
}

}  // namespace

std::string format_config_settings(const turnwise::core::RuntimeConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[runtime] loaded config from " << config_path << " | agents=";
  for (std::size_t i = 0; i < config.agent_ids.size(); ++i) {
    output << (i == 0 ? "" : ",") << config.agent_ids[i];
  }
  output << " | max_responders=" << config.coordinator.max_responders
         << " | gather_window_ms=" << config.coordinator.gather_min.count() << ".." << config.coordinator.gather_max.count()
         << " | min_seconds_between_responses=" << config.rate_limit.min_between_responses.count()
         << " | max_responses_per_session=" << config.rate_limit.max_responses_per_session
         << " | inbox_capacity=" << config.inbox.capacity
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  install_shutdown_handler(SIGINT);
  install_shutdown_handler(SIGTERM);

  const std::string config_path = argc > 1 ? argv[1] : "configs/turnwise.yaml";

  turnwise::core::RuntimeConfig config{};
  try {
    config = turnwise::core::load_runtime_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  turnwise::core::set_log_level(config.debug_logging ? turnwise::core::log_level::DEBUG
                                                     : turnwise::core::log_level::INFO);
  std::cerr << format_config_settings(config, config_path) << '\n';

  const auto executor = turnwise::core::make_echo_executor(std::cout);
  turnwise::core::Runtime runtime{config, *executor};
  runtime.start();

  const auto ingest = turnwise::ingest::ingest_stream(std::cin, runtime);
  turnwise::core::log(turnwise::core::log_level::INFO, "runtime", "ingested ", ingest.lines, " lines (",
                      ingest.malformed, " malformed, ", ingest.deliveries, " deliveries)");

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cerr << "[runtime] shutdown signal received; exiting cleanly\n";
  runtime.stop();

  return 0;
}
