// Repository: Rollups-advance-runner
// Component: Runner
// Purpose: Recovery protocol and the sequential advance / finish-epoch loop.
// Copyright (c) 2025 Rollups

#include "rollups/runner/Runner.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "rollups/util/Logger.hpp"

namespace rollups::runner {

using broker::BrokerError;
using server_manager::ServerManagerError;
using snapshot::SnapshotError;
using util::Logger;

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Runs one collaborator call. Its typed error becomes a RunnerError naming the
// operation; anything else propagates untouched.
template <typename CollaboratorError, typename Fn>
auto Attributed(RunnerErrorKind kind, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const CollaboratorError& e) {
    throw RunnerError(kind, e.what(), std::current_exception());
  }
}

}  // namespace

const char* RunnerStateName(Runner::State state) {
  switch (state) {
    case Runner::State::kUninitialized: return "UNINITIALIZED";
    case Runner::State::kRecovering:    return "RECOVERING";
    case Runner::State::kSteady:        return "STEADY";
    case Runner::State::kStopped:       return "STOPPED";
    case Runner::State::kFailed:        return "FAILED";
  }
  return "UNKNOWN";
}

Runner::Runner(std::shared_ptr<server_manager::IServerManager> server_manager,
               std::shared_ptr<broker::IBroker> broker,
               std::shared_ptr<snapshot::ISnapshotManager> snapshot_manager,
               std::shared_ptr<telemetry::RunnerMetrics> metrics)
    : server_manager_(std::move(server_manager)),
      broker_(std::move(broker)),
      snapshot_manager_(std::move(snapshot_manager)),
      metrics_(std::move(metrics)) {
  if (!server_manager_ || !broker_ || !snapshot_manager_) {
    throw std::invalid_argument("Runner requires server-manager, broker and snapshot manager");
  }
}

void Runner::RequestStop() {
  stop_requested_.store(true, std::memory_order_release);
}

std::string Runner::LastConsumedId() const {
  std::lock_guard<std::mutex> lock(last_id_mutex_);
  return last_id_;
}

void Runner::TransitionTo(State to) {
  State from = state_.exchange(to, std::memory_order_acq_rel);
  if (metrics_) {
    metrics_->SetRunnerState(static_cast<int>(to));
  }
  if (from != to) {
    Logger::Debug(std::string("[Runner] STATE ") + RunnerStateName(from) + " -> " +
                  RunnerStateName(to));
  }
}

void Runner::Run() {
  try {
    std::string last_id = Setup();
    TransitionTo(State::kSteady);
    Logger::Info("[Runner] MAIN_LOOP_START last_id=" + last_id);

    while (!StopRequested()) {
      std::optional<std::string> consumed = ProcessNext(last_id);
      if (!consumed) break;
      last_id = std::move(*consumed);
      Logger::Info("[Runner] WAITING_NEXT_INPUT last_id=" + last_id);
    }

    TransitionTo(State::kStopped);
    Logger::Info("[Runner] STOPPED last_id=" + last_id);
  } catch (const RunnerError& e) {
    TransitionTo(State::kFailed);
    std::ostringstream oss;
    oss << "[Runner] FATAL source=" << ErrorSourceName(e.source())
        << " kind=" << RunnerErrorKindName(e.kind())
        << " retryable=" << (e.IsRetryable() ? "Y" : "N")
        << " error=\"" << e.what() << "\"";
    Logger::Error(oss.str());
    throw;
  } catch (const std::exception& e) {
    TransitionTo(State::kFailed);
    Logger::Error(std::string("[Runner] FATAL unexpected error=\"") + e.what() + "\"");
    throw;
  }
}

std::string Runner::Setup() {
  TransitionTo(State::kRecovering);
  Logger::Debug("[Runner] SETUP_BEGIN");

  const Snapshot snapshot = Attributed<SnapshotError>(
      RunnerErrorKind::kGetLatestSnapshot,
      [&] { return snapshot_manager_->GetLatest(); });
  Logger::Info("[Runner] LATEST_SNAPSHOT " + Describe(snapshot));

  // Re-derive the stream position from the snapshot epoch: the snapshot for
  // epoch N was written when the finish-epoch event of N - 1 was handled.
  std::string event_id = Attributed<BrokerError>(
      RunnerErrorKind::kFindFinishEpochInput,
      [&] { return broker_->FindPreviousFinishEpoch(snapshot.epoch); });
  Logger::Debug("[Runner] FOUND_FINISH_EPOCH_INPUT event_id=" + event_id);

  Attributed<ServerManagerError>(
      RunnerErrorKind::kCreateSession,
      [&] { server_manager_->StartSession(snapshot.path, snapshot.epoch); });
  Logger::Info("[Runner] SESSION_STARTED epoch=" + std::to_string(snapshot.epoch));

  {
    std::lock_guard<std::mutex> lock(last_id_mutex_);
    last_id_ = event_id;
  }
  return event_id;
}

std::optional<std::string> Runner::ProcessNext(const std::string& last_id) {
  std::optional<Event> event = ConsumeNext(last_id);
  if (!event) return std::nullopt;
  Logger::Info("[Runner] INPUT_CONSUMED " + Describe(*event));

  const EventPayload& payload = event->payload;
  std::visit(Overloaded{
                 [&](const AdvanceStateInput& input) {
                   HandleAdvance(payload.epoch_index, payload.inputs_sent_count,
                                 input.metadata, input.payload);
                 },
                 [&](const FinishEpoch&) { HandleFinish(payload.epoch_index); },
             },
             payload.data);

  {
    std::lock_guard<std::mutex> lock(last_id_mutex_);
    last_id_ = event->id;
  }
  return std::move(event->id);
}

std::optional<Event> Runner::ConsumeNext(const std::string& last_id) {
  Logger::Debug("[Runner] CONSUMING after=" + last_id);

  Event event;
  try {
    event = broker_->ConsumeInput(last_id);
  } catch (const BrokerError& e) {
    if (StopRequested()) {
      Logger::Info(std::string("[Runner] CONSUME_INTERRUPTED reason=stop_requested code=") +
                   broker::BrokerErrorCodeName(e.code()));
      return std::nullopt;
    }
    throw RunnerError(RunnerErrorKind::kConsumeInput, e.what(), std::current_exception());
  }

  if (event.payload.parent_id != last_id) {
    throw ChainIntegrityError(last_id, event.payload.parent_id);
  }
  return event;
}

void Runner::HandleAdvance(uint64_t active_epoch_index,
                           uint64_t inputs_sent_count,
                           const InputMetadata& input_metadata,
                           const std::vector<uint8_t>& input_payload) {
  if (inputs_sent_count == 0) {
    throw RunnerError(RunnerErrorKind::kAdvance,
                      "advance input with inputs_sent_count=0 in epoch " +
                          std::to_string(active_epoch_index));
  }
  const uint64_t current_input_index = inputs_sent_count - 1;

  Attributed<ServerManagerError>(RunnerErrorKind::kAdvance, [&] {
    server_manager_->AdvanceState(active_epoch_index, current_input_index,
                                  input_metadata, input_payload);
  });
  if (metrics_) metrics_->IncrementAdvanceInputsSent();

  std::ostringstream oss;
  oss << "[Runner] ADVANCE_SENT epoch_index=" << active_epoch_index
      << " input_index=" << current_input_index;
  Logger::Debug(oss.str());
}

void Runner::HandleFinish(uint64_t epoch_index) {
  Logger::Debug("[Runner] FINISH_BEGIN epoch_index=" + std::to_string(epoch_index));

  // The snapshot taken when closing epoch N is the one epoch N + 1 resumes
  // from.
  Snapshot snapshot = Attributed<SnapshotError>(
      RunnerErrorKind::kGetStorageDirectory,
      [&] { return snapshot_manager_->GetStorageDirectory(epoch_index + 1); });
  Logger::Debug("[Runner] STORAGE_DIRECTORY " + Describe(snapshot));

  Attributed<ServerManagerError>(RunnerErrorKind::kFinishEpoch, [&] {
    server_manager_->FinishEpoch(epoch_index, snapshot.path);
  });
  if (metrics_) metrics_->IncrementFinishEpochsSent();
  Logger::Debug("[Runner] EPOCH_FINISHED epoch_index=" + std::to_string(epoch_index));

  // Only after the session wrote to it.
  Attributed<SnapshotError>(RunnerErrorKind::kSetLatestSnapshot,
                            [&] { snapshot_manager_->SetLatest(snapshot); });
  Logger::Info("[Runner] LATEST_SNAPSHOT_SET " + Describe(snapshot));

  const bool claim_produced = Attributed<BrokerError>(
      RunnerErrorKind::kPeekClaim,
      [&] { return broker_->WasClaimProduced(epoch_index); });
  Logger::Debug(std::string("[Runner] CLAIM_PEEK epoch_index=") + std::to_string(epoch_index) +
                " produced=" + (claim_produced ? "Y" : "N"));

  if (claim_produced) {
    Logger::Info("[Runner] CLAIM_ALREADY_PRODUCED epoch_index=" + std::to_string(epoch_index));
    return;
  }

  const EpochClaim claim = Attributed<ServerManagerError>(
      RunnerErrorKind::kGetEpochClaim,
      [&] { return server_manager_->GetEpochClaim(epoch_index); });
  Logger::Debug("[Runner] EPOCH_CLAIM epoch_index=" + std::to_string(claim.epoch_index) +
                " epoch_hash=" + ToHex(claim.epoch_hash));

  Attributed<BrokerError>(RunnerErrorKind::kProduceClaim,
                          [&] { broker_->ProduceRollupsClaim(epoch_index, claim); });
  if (metrics_) metrics_->IncrementClaimsSent();
  Logger::Info("[Runner] CLAIM_PRODUCED epoch_index=" + std::to_string(epoch_index) +
               " epoch_hash=" + ToHex(claim.epoch_hash));
}

}  // namespace rollups::runner
