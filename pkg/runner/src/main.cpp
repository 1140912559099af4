// Repository: Rollups-advance-runner
// Component: Advance Runner Executable
// Purpose: Wires the gRPC collaborators, snapshot store and metrics server
//          around the Runner and maps its outcome to an exit code.
// Copyright (c) 2025 Rollups
//
// Exit codes:
//   0   stopped by SIGINT / SIGTERM
//   1   collaborator failure; restarting re-enters recovery
//   2   chain-integrity failure; restarting will not help
//   64  invalid configuration

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "broker/GrpcBrokerClient.hpp"
#include "rollups/runner/Runner.hpp"
#include "rollups/runner/RunnerConfig.hpp"
#include "rollups/runner/RunnerErrors.hpp"
#include "rollups/snapshot/DisabledSnapshotManager.hpp"
#include "rollups/snapshot/FsSnapshotManager.hpp"
#include "rollups/telemetry/MetricsHttpServer.hpp"
#include "rollups/telemetry/RunnerMetrics.hpp"
#include "rollups/util/Logger.hpp"
#include "server_manager/GrpcServerManagerClient.hpp"

namespace {

using rollups::util::Logger;

using rollups::runner::kExitConfig;
using rollups::runner::kExitOk;

constexpr int kSignalPollMs = 100;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

std::shared_ptr<rollups::snapshot::ISnapshotManager> MakeSnapshotManager(
    const rollups::runner::RunnerConfig& config) {
  if (config.snapshot_enabled) {
    return std::make_shared<rollups::snapshot::FsSnapshotManager>(config.snapshot_dir,
                                                                  config.snapshot_latest);
  }
  return std::make_shared<rollups::snapshot::DisabledSnapshotManager>(config.machine_dir);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace rollups;

  runner::ConfigResult parsed = runner::ParseArgs(argc, argv, runner::ProcessEnv());
  if (parsed.help) {
    runner::PrintUsage(std::cout, argv[0]);
    return kExitOk;
  }
  if (!parsed.valid) {
    std::cerr << "Error: " << parsed.error << "\n\n";
    runner::PrintUsage(std::cerr, argv[0]);
    return kExitConfig;
  }
  const runner::RunnerConfig& config = parsed.config;

  {
    std::ostringstream oss;
    oss << "[Main] STARTING chain_id=" << config.dapp.chain_id
        << " dapp_address=" << ToHex(config.dapp.dapp_address)
        << " broker=" << config.broker_endpoint
        << " server_manager=" << config.server_manager_endpoint
        << " session_id=" << config.session_id
        << " snapshots=" << (config.snapshot_enabled ? config.snapshot_dir : "disabled");
    Logger::Info(oss.str());
  }

  auto metrics = std::make_shared<telemetry::RunnerMetrics>(config.dapp);

  auto broker_client = std::make_shared<broker::GrpcBrokerClient>(
      config.broker_endpoint, config.dapp, config.broker_deadline_ms,
      config.broker_consume_timeout_ms);

  server_manager::GrpcServerManagerOptions sm_options;
  sm_options.session_id = config.session_id;
  sm_options.deadline_ms = config.server_manager_deadline_ms;
  sm_options.pending_inputs_sleep_ms = config.pending_inputs_sleep_ms;
  sm_options.pending_inputs_max_retries = config.pending_inputs_max_retries;
  auto session_client = std::make_shared<server_manager::GrpcServerManagerClient>(
      config.server_manager_endpoint, sm_options);

  runner::Runner runner(session_client, broker_client, MakeSnapshotManager(config), metrics);

  std::unique_ptr<telemetry::MetricsHttpServer> http;
  if (config.metrics_port != 0) {
    http = std::make_unique<telemetry::MetricsHttpServer>(
        static_cast<uint16_t>(config.metrics_port),
        [metrics] { return metrics->GeneratePrometheusText(); },
        [&runner] { return runner.state() != runner::Runner::State::kFailed; });
    try {
      http->Start();
    } catch (const std::runtime_error& e) {
      Logger::Error(std::string("[Main] METRICS_SERVER_FAILED error=\"") + e.what() + "\"");
      return kExitConfig;
    }
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::atomic<bool> runner_done{false};
  std::exception_ptr runner_error;
  std::thread worker([&] {
    try {
      runner.Run();
    } catch (const std::exception&) {
      runner_error = std::current_exception();
    }
    runner_done.store(true, std::memory_order_release);
  });

  bool stop_sent = false;
  while (!runner_done.load(std::memory_order_acquire)) {
    if (!stop_sent && g_termination_requested.load(std::memory_order_acquire)) {
      Logger::Info("[Main] TERMINATION_REQUESTED");
      runner.RequestStop();
      broker_client->Shutdown();
      stop_sent = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kSignalPollMs));
  }
  worker.join();

  if (http) http->Stop();

  const int code = rollups::runner::ExitCodeFor(runner_error);
  Logger::Info("[Main] EXIT code=" + std::to_string(code) + " state=" +
               runner::RunnerStateName(runner.state()));
  return code;
}
