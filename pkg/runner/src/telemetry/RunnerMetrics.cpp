// Repository: Rollups-advance-runner
// Component: Runner Metrics
// Purpose: Prometheus rendering of the runner counters.
// Copyright (c) 2025 Rollups

#include "rollups/telemetry/RunnerMetrics.hpp"

#include <sstream>
#include <utility>

namespace rollups::telemetry {

namespace {

void WriteMetric(std::ostringstream& oss,
                 const std::string& name,
                 const char* type,
                 const char* help,
                 const std::string& labels,
                 uint64_t value) {
  const std::string full = std::string(kMetricsPrefix) + "_" + name;
  oss << "# HELP " << full << " " << help << "\n";
  oss << "# TYPE " << full << " " << type << "\n";
  oss << full << "{" << labels << "} " << value << "\n";
}

}  // namespace

RunnerMetrics::RunnerMetrics(DAppMetadata dapp) : dapp_(std::move(dapp)) {}

RunnerMetrics::Snapshot RunnerMetrics::GetSnapshot() const {
  Snapshot s;
  s.advance_inputs_sent = advance_inputs_sent_.load(std::memory_order_relaxed);
  s.finish_epochs_sent = finish_epochs_sent_.load(std::memory_order_relaxed);
  s.claims_sent = claims_sent_.load(std::memory_order_relaxed);
  s.runner_state = runner_state_.load(std::memory_order_relaxed);
  return s;
}

std::string RunnerMetrics::GeneratePrometheusText() const {
  const Snapshot s = GetSnapshot();
  const std::string labels = "chain_id=\"" + std::to_string(dapp_.chain_id) +
                             "\",dapp_address=\"" + ToHex(dapp_.dapp_address) + "\"";

  std::ostringstream oss;
  WriteMetric(oss, "advance_inputs_sent", "counter",
              "Counts the number of <advance_input>s sent", labels,
              s.advance_inputs_sent);
  oss << "\n";
  WriteMetric(oss, "finish_epochs_sent", "counter",
              "Counts the number of <finish_epoch>s sent", labels,
              s.finish_epochs_sent);
  oss << "\n";
  WriteMetric(oss, "claims_sent", "counter",
              "Counts the number of claims sent", labels,
              s.claims_sent);
  oss << "\n";
  WriteMetric(oss, "runner_state", "gauge",
              "Runner state (0=uninitialized 1=recovering 2=steady 3=stopped 4=failed)",
              labels, static_cast<uint64_t>(s.runner_state));
  return oss.str();
}

}  // namespace rollups::telemetry
