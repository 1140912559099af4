// Repository: Rollups-advance-runner
// Component: Runner Configuration
// Purpose: Settings for the advance runner executable, read from the
//          environment and overridden by command-line flags.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_RUNNER_RUNNER_CONFIG_HPP_
#define ROLLUPS_RUNNER_RUNNER_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "rollups/runner/Types.hpp"

namespace rollups::runner {

struct RunnerConfig {
  // Compute session
  std::string server_manager_endpoint = "127.0.0.1:5001";
  std::string session_id = "default_rollups_id";
  int server_manager_deadline_ms = 300000;
  int pending_inputs_sleep_ms = 1000;
  int pending_inputs_max_retries = 600;

  // Event log
  std::string broker_endpoint = "127.0.0.1:6390";
  int broker_deadline_ms = 30000;
  int broker_consume_timeout_ms = 5000;
  DAppMetadata dapp;

  // Snapshots
  bool snapshot_enabled = true;
  std::string snapshot_dir;
  std::string snapshot_latest;  // Empty means <snapshot_dir>/latest
  std::string machine_dir;      // Used only when snapshots are disabled

  // 0 disables the metrics server.
  int metrics_port = 8080;
};

struct ConfigResult {
  RunnerConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Name → value, nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
EnvLookup ProcessEnv();

// Defaults, then environment, then flags. `valid` is false and `error` is set
// on an unknown flag, a malformed value or a missing required setting.
ConfigResult ParseArgs(int argc, const char* const argv[], const EnvLookup& env);

void PrintUsage(std::ostream& out, const char* program_name);

}  // namespace rollups::runner

#endif  // ROLLUPS_RUNNER_RUNNER_CONFIG_HPP_
