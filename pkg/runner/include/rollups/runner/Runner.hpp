// Repository: Rollups-advance-runner
// Component: Runner
// Purpose: Recovers from the latest snapshot, then feeds every input event to
//          the compute session exactly once, finishing epochs and producing
//          claims.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_RUNNER_RUNNER_HPP_
#define ROLLUPS_RUNNER_RUNNER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rollups/broker/IBroker.hpp"
#include "rollups/runner/RunnerErrors.hpp"
#include "rollups/runner/Types.hpp"
#include "rollups/server_manager/IServerManager.hpp"
#include "rollups/snapshot/ISnapshotManager.hpp"
#include "rollups/telemetry/RunnerMetrics.hpp"

namespace rollups::runner {

// Runner reconciles three independently failing collaborators (event log,
// compute session, snapshot store) without transactions between them.
//
// Recovery never reads a stored stream cursor: the stream position is
// re-derived from the latest snapshot's epoch through the broker's
// finish-epoch lookup, so a snapshot and a log that diverged fail at startup.
//
// Steady state is strictly sequential. One event, including every side
// effect of its dispatch, completes before the next one is requested.
//
// Any collaborator failure is raised as RunnerError and ends the loop. There
// are no retries here; the supervisor restarts the process and recovery runs
// again.
class Runner {
 public:
  enum class State {
    kUninitialized = 0,
    kRecovering = 1,
    kSteady = 2,
    kStopped = 3,
    kFailed = 4,
  };

  Runner(std::shared_ptr<server_manager::IServerManager> server_manager,
         std::shared_ptr<broker::IBroker> broker,
         std::shared_ptr<snapshot::ISnapshotManager> snapshot_manager,
         std::shared_ptr<telemetry::RunnerMetrics> metrics = nullptr);

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;

  // Setup() then ProcessNext() until a stop is requested. Throws RunnerError
  // (ChainIntegrityError for parent-id mismatches) on the first failure.
  void Run();

  // Recovery: latest snapshot → previous finish-epoch event → session start.
  // Returns the id to resume consuming after.
  std::string Setup();

  // Consumes, verifies and dispatches one event. Returns the id of the
  // consumed event, or nullopt when the read was interrupted by a stop.
  std::optional<std::string> ProcessNext(const std::string& last_id);

  // Observed between events; safe from any thread.
  void RequestStop();
  bool StopRequested() const { return stop_requested_.load(std::memory_order_acquire); }

  [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }

  // Last consumed event id; empty before Setup() completes.
  std::string LastConsumedId() const;

 private:
  // Returns nullopt only when a stop was requested during the read.
  std::optional<Event> ConsumeNext(const std::string& last_id);

  void HandleAdvance(uint64_t active_epoch_index,
                     uint64_t inputs_sent_count,
                     const InputMetadata& input_metadata,
                     const std::vector<uint8_t>& input_payload);

  void HandleFinish(uint64_t epoch_index);

  void TransitionTo(State to);

  std::shared_ptr<server_manager::IServerManager> server_manager_;
  std::shared_ptr<broker::IBroker> broker_;
  std::shared_ptr<snapshot::ISnapshotManager> snapshot_manager_;
  std::shared_ptr<telemetry::RunnerMetrics> metrics_;

  std::atomic<State> state_{State::kUninitialized};
  std::atomic<bool> stop_requested_{false};

  mutable std::mutex last_id_mutex_;
  std::string last_id_;
};

const char* RunnerStateName(Runner::State state);

}  // namespace rollups::runner

#endif  // ROLLUPS_RUNNER_RUNNER_HPP_
