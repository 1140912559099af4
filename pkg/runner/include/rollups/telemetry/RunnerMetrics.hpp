// Repository: Rollups-advance-runner
// Component: Runner Metrics
// Purpose: Passive counters for inputs, epochs and claims sent by the runner.
// Copyright (c) 2025 Rollups
//
// These metrics are passive observations only. They do NOT affect dispatch,
// recovery or error handling.

#ifndef ROLLUPS_TELEMETRY_RUNNER_METRICS_HPP_
#define ROLLUPS_TELEMETRY_RUNNER_METRICS_HPP_

#include <atomic>
#include <cstdint>
#include <string>

#include "rollups/runner/Types.hpp"

namespace rollups::telemetry {

inline constexpr char kMetricsPrefix[] = "rollups_advance_runner";

// Written by the runner thread, read by the metrics HTTP server thread.
class RunnerMetrics {
 public:
  struct Snapshot {
    uint64_t advance_inputs_sent = 0;
    uint64_t finish_epochs_sent = 0;
    uint64_t claims_sent = 0;
    int runner_state = 0;
  };

  explicit RunnerMetrics(DAppMetadata dapp = {});

  RunnerMetrics(const RunnerMetrics&) = delete;
  RunnerMetrics& operator=(const RunnerMetrics&) = delete;

  void IncrementAdvanceInputsSent() { advance_inputs_sent_.fetch_add(1, std::memory_order_relaxed); }
  void IncrementFinishEpochsSent() { finish_epochs_sent_.fetch_add(1, std::memory_order_relaxed); }
  void IncrementClaimsSent() { claims_sent_.fetch_add(1, std::memory_order_relaxed); }

  // Numeric value of runner::Runner::State.
  void SetRunnerState(int state) { runner_state_.store(state, std::memory_order_relaxed); }

  [[nodiscard]] Snapshot GetSnapshot() const;

  const DAppMetadata& dapp() const { return dapp_; }

  // Prometheus text exposition format.
  std::string GeneratePrometheusText() const;

 private:
  DAppMetadata dapp_;
  std::atomic<uint64_t> advance_inputs_sent_{0};
  std::atomic<uint64_t> finish_epochs_sent_{0};
  std::atomic<uint64_t> claims_sent_{0};
  std::atomic<int> runner_state_{0};
};

}  // namespace rollups::telemetry

#endif  // ROLLUPS_TELEMETRY_RUNNER_METRICS_HPP_
