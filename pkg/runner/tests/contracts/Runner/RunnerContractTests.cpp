// Repository: Rollups-advance-runner
// Component: Runner Contract Tests
// Purpose: Chain contiguity, dispatch, epoch offset, claim idempotency and
//          error attribution of the runner loop.
// Copyright (c) 2025 Rollups

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "rollups/runner/Runner.hpp"
#include "rollups/runner/RunnerErrors.hpp"
#include "rollups/snapshot/InMemorySnapshotManager.hpp"
#include "rollups/telemetry/RunnerMetrics.hpp"
#include "rollups/util/Logger.hpp"
#include "../../fixtures/FakeBroker.h"
#include "../../fixtures/FakeServerManager.h"

namespace rollups::runner::testing {
namespace {

using broker::BrokerError;
using server_manager::ServerManagerError;
using snapshot::InMemorySnapshotManager;
using snapshot::SnapshotError;
using tests::fixtures::FakeBroker;
using tests::fixtures::FakeServerManager;

using SmOp = FakeServerManager::Operation;
using BrokerOp = FakeBroker::Operation;
using SnapOp = InMemorySnapshotManager::Operation;

// =============================================================================
// Test Fixture
// =============================================================================

class RunnerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    session_ = std::make_shared<FakeServerManager>();
    broker_ = std::make_shared<FakeBroker>();
    metrics_ = std::make_shared<telemetry::RunnerMetrics>();
  }

  // Builds the runner with the latest snapshot at `epoch`. Running out of
  // scripted events requests a stop, so Run() returns after the last one.
  void MakeRunner(uint64_t epoch) {
    snapshots_ = std::make_shared<InMemorySnapshotManager>(
        Snapshot{"/snapshots/" + std::to_string(epoch), epoch});
    runner_ = std::make_unique<Runner>(session_, broker_, snapshots_, metrics_);
    Runner* runner = runner_.get();
    broker_->SetOnExhausted([runner] { runner->RequestStop(); });
  }

  // Runs and returns the RunnerError raised, failing the test if none is.
  RunnerError RunExpectingError() {
    try {
      runner_->Run();
    } catch (const RunnerError& e) {
      return e;
    }
    ADD_FAILURE() << "Run() returned without RunnerError";
    return RunnerError(RunnerErrorKind::kConsumeInput, "none");
  }

  std::shared_ptr<FakeServerManager> session_;
  std::shared_ptr<FakeBroker> broker_;
  std::shared_ptr<InMemorySnapshotManager> snapshots_;
  std::shared_ptr<telemetry::RunnerMetrics> metrics_;
  std::unique_ptr<Runner> runner_;
};

// =============================================================================
// A. END-TO-END
// =============================================================================

// -----------------------------------------------------------------------------
// TEST-RUNNER-001: Snapshot epoch 3, stream F2 -> A(count=1) -> F3
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, EndToEndResumeAdvanceAndFinish) {
  const std::string f2 = broker_->AppendFinish(2);
  const std::string a = broker_->AppendAdvance(3, {0xde, 0xad});
  const std::string f3 = broker_->AppendFinish(3);
  MakeRunner(3);

  runner_->Run();

  EXPECT_EQ(runner_->state(), Runner::State::kStopped);
  EXPECT_EQ(runner_->LastConsumedId(), f3);
  EXPECT_EQ(broker_->ConsumedAfter(), (std::vector<std::string>{f2, a, f3}));

  const auto calls = session_->Calls();
  ASSERT_EQ(calls.size(), 4u);

  EXPECT_EQ(calls[0].op, SmOp::kStartSession);
  EXPECT_EQ(calls[0].epoch_index, 3u);
  EXPECT_EQ(calls[0].path, "/snapshots/3");

  EXPECT_EQ(calls[1].op, SmOp::kAdvanceState);
  EXPECT_EQ(calls[1].epoch_index, 3u);
  EXPECT_EQ(calls[1].input_index, 0u);
  EXPECT_EQ(calls[1].payload, (std::vector<uint8_t>{0xde, 0xad}));

  EXPECT_EQ(calls[2].op, SmOp::kFinishEpoch);
  EXPECT_EQ(calls[2].epoch_index, 3u);
  EXPECT_EQ(calls[2].path, "/snapshots/4");

  EXPECT_EQ(calls[3].op, SmOp::kGetEpochClaim);
  EXPECT_EQ(calls[3].epoch_index, 3u);

  ASSERT_EQ(snapshots_->Allocations().size(), 1u);
  EXPECT_EQ(snapshots_->Allocations()[0], (Snapshot{"/snapshots/4", 4}));
  EXPECT_EQ(snapshots_->Latest(), (Snapshot{"/snapshots/4", 4}));

  EXPECT_EQ(broker_->CallCount(BrokerOp::kWasClaimProduced), 1u);
  auto claims = broker_->Claims();
  ASSERT_EQ(claims.count(3), 1u);
  EXPECT_EQ(claims[3].epoch_index, 3u);
  EXPECT_EQ(claims[3].epoch_hash, FakeServerManager::ExpectedHash(3));
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-002: Several epochs from genesis, one claim per epoch
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, GenesisThroughSeveralEpochs) {
  broker_->AppendAdvance(0);
  broker_->AppendAdvance(0);
  broker_->AppendFinish(0);
  broker_->AppendAdvance(1);
  broker_->AppendFinish(1);
  broker_->AppendFinish(2);  // Empty epoch
  MakeRunner(0);

  runner_->Run();

  EXPECT_EQ(broker_->ConsumedAfter().front(), kInitialEventId);
  EXPECT_EQ(broker_->ProducedOrder(), (std::vector<uint64_t>{0, 1, 2}));
  EXPECT_EQ(snapshots_->Latest(), (Snapshot{"/snapshots/3", 3}));

  const auto history = snapshots_->LatestHistory();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].epoch, 1u);
  EXPECT_EQ(history[1].epoch, 2u);
  EXPECT_EQ(history[2].epoch, 3u);
}

// =============================================================================
// B. CHAIN CONTIGUITY
// =============================================================================

// -----------------------------------------------------------------------------
// TEST-RUNNER-010: Parent mismatch fails before any session call
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, ParentMismatchRaisesChainIntegrityError) {
  const std::string f2 = broker_->AppendFinish(2);

  Event stray;
  stray.id = "99-0";
  stray.payload.epoch_index = 3;
  stray.payload.inputs_sent_count = 1;
  stray.payload.parent_id = "42-0";
  stray.payload.data = AdvanceStateInput{};
  broker_->AppendRaw(stray);
  MakeRunner(3);

  try {
    runner_->Run();
    FAIL() << "expected ChainIntegrityError";
  } catch (const ChainIntegrityError& e) {
    EXPECT_EQ(e.expected(), f2);
    EXPECT_EQ(e.got(), "42-0");
    EXPECT_EQ(e.kind(), RunnerErrorKind::kParentIdMismatch);
    EXPECT_EQ(e.source(), ErrorSource::kChainIntegrity);
    EXPECT_FALSE(e.IsRetryable());
    EXPECT_EQ(std::string(e.what()),
              "parent id doesn't match: expected=" + f2 + " got=42-0");
  }

  EXPECT_EQ(runner_->state(), Runner::State::kFailed);
  // Only the session start from recovery.
  ASSERT_EQ(session_->Calls().size(), 1u);
  EXPECT_EQ(session_->Calls()[0].op, SmOp::kStartSession);
  EXPECT_EQ(runner_->LastConsumedId(), f2);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-011: Mismatch on a finish event leaves snapshots and claims alone
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, ParentMismatchOnFinishHasNoSideEffects) {
  broker_->AppendFinish(0);

  Event stray;
  stray.id = "7-0";
  stray.payload.epoch_index = 1;
  stray.payload.parent_id = kInitialEventId;
  stray.payload.data = FinishEpoch{};
  broker_->AppendRaw(stray);
  MakeRunner(1);

  EXPECT_THROW(runner_->Run(), ChainIntegrityError);
  EXPECT_TRUE(snapshots_->Allocations().empty());
  EXPECT_TRUE(snapshots_->LatestHistory().empty());
  EXPECT_EQ(broker_->CallCount(BrokerOp::kWasClaimProduced), 0u);
  EXPECT_TRUE(session_->CallsOf(SmOp::kFinishEpoch).empty());
}

// =============================================================================
// C. ADVANCE DISPATCH
// =============================================================================

// -----------------------------------------------------------------------------
// TEST-RUNNER-020: Index passed to the session is inputs_sent_count - 1
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, InputIndexIsSentCountMinusOne) {
  broker_->AppendAdvance(0);
  broker_->AppendAdvance(0);
  broker_->AppendAdvance(0);
  MakeRunner(0);

  runner_->Run();

  const auto advances = session_->CallsOf(SmOp::kAdvanceState);
  ASSERT_EQ(advances.size(), 3u);
  for (size_t i = 0; i < advances.size(); ++i) {
    EXPECT_EQ(advances[i].input_index, i);
    EXPECT_EQ(advances[i].epoch_index, 0u);
  }
  EXPECT_EQ(metrics_->GetSnapshot().advance_inputs_sent, 3u);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-021: inputs_sent_count of zero cannot be an advance input
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, ZeroSentCountIsRejected) {
  Event bad;
  bad.id = "1-0";
  bad.payload.epoch_index = 0;
  bad.payload.inputs_sent_count = 0;
  bad.payload.parent_id = kInitialEventId;
  bad.payload.data = AdvanceStateInput{};
  broker_->AppendRaw(bad);
  MakeRunner(0);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kAdvance);
  EXPECT_TRUE(session_->CallsOf(SmOp::kAdvanceState).empty());
}

// =============================================================================
// D. FINISH-EPOCH DISPATCH
// =============================================================================

// -----------------------------------------------------------------------------
// TEST-RUNNER-030: Closing epoch e allocates and persists the e + 1 snapshot
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, FinishAllocatesNextEpochSnapshot) {
  broker_->AppendFinish(4);
  broker_->AppendFinish(5);
  MakeRunner(5);

  runner_->Run();

  ASSERT_EQ(snapshots_->Allocations().size(), 1u);
  EXPECT_EQ(snapshots_->Allocations()[0].epoch, 6u);
  EXPECT_EQ(session_->CallsOf(SmOp::kFinishEpoch)[0].path,
            snapshots_->Allocations()[0].path);
  EXPECT_EQ(snapshots_->Latest(), snapshots_->Allocations()[0]);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-031: Latest is not replaced until the session finished the epoch
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, LatestPersistedOnlyAfterSessionFinish) {
  broker_->AppendFinish(0);
  MakeRunner(0);

  bool latest_was_old_during_finish = false;
  auto snapshots = snapshots_;
  session_->SetOnFinishEpoch([&latest_was_old_during_finish, snapshots](uint64_t,
                                                                        const std::string&) {
    latest_was_old_during_finish = snapshots->Latest()->epoch == 0;
  });

  runner_->Run();

  EXPECT_TRUE(latest_was_old_during_finish);
  EXPECT_EQ(snapshots_->Latest()->epoch, 1u);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-032: A failed session finish never persists the new snapshot
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, FinishFailureSkipsSetLatest) {
  broker_->AppendFinish(0);
  MakeRunner(0);
  session_->FailNext(SmOp::kFinishEpoch, ServerManagerError::Code::kCheckpointFailed);

  RunnerError e = RunExpectingError();

  EXPECT_EQ(e.kind(), RunnerErrorKind::kFinishEpoch);
  EXPECT_EQ(e.source(), ErrorSource::kSession);
  EXPECT_TRUE(snapshots_->LatestHistory().empty());
  EXPECT_EQ(broker_->CallCount(BrokerOp::kWasClaimProduced), 0u);
  EXPECT_EQ(metrics_->GetSnapshot().finish_epochs_sent, 0u);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-033: A claim already in the stream is not fetched or produced
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, ExistingClaimIsNotProducedAgain) {
  broker_->AppendFinish(0);
  broker_->PreloadClaim(0, EpochClaim{0, FakeServerManager::ExpectedHash(0)});
  MakeRunner(0);

  runner_->Run();

  EXPECT_TRUE(session_->CallsOf(SmOp::kGetEpochClaim).empty());
  EXPECT_EQ(broker_->CallCount(BrokerOp::kProduceRollupsClaim), 0u);
  EXPECT_EQ(metrics_->GetSnapshot().claims_sent, 0u);
  // The snapshot is still persisted.
  EXPECT_EQ(snapshots_->Latest()->epoch, 1u);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-034: Absent claim is produced exactly once
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, MissingClaimIsProducedOnce) {
  broker_->AppendFinish(0);
  MakeRunner(0);

  runner_->Run();

  EXPECT_EQ(session_->CallsOf(SmOp::kGetEpochClaim).size(), 1u);
  EXPECT_EQ(broker_->CallCount(BrokerOp::kProduceRollupsClaim), 1u);
  EXPECT_EQ(metrics_->GetSnapshot().claims_sent, 1u);
  EXPECT_EQ(metrics_->GetSnapshot().finish_epochs_sent, 1u);
}

// =============================================================================
// E. ERROR ATTRIBUTION
// =============================================================================

// -----------------------------------------------------------------------------
// TEST-RUNNER-040: Recovery failures name the failing step
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, GetLatestFailureIsSnapshotError) {
  MakeRunner(0);
  snapshots_->FailNext(SnapOp::kGetLatest, SnapshotError::Code::kStoreUnavailable);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kGetLatestSnapshot);
  EXPECT_EQ(e.source(), ErrorSource::kSnapshot);
  EXPECT_TRUE(e.IsRetryable());
  EXPECT_EQ(broker_->CallCount(BrokerOp::kFindPreviousFinishEpoch), 0u);
  EXPECT_TRUE(session_->Calls().empty());
}

TEST_F(RunnerContractTest, MissingFinishEventIsLogError) {
  broker_->AppendFinish(0);
  MakeRunner(5);  // No finish event for epoch 4

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kFindFinishEpochInput);
  EXPECT_EQ(e.source(), ErrorSource::kLog);
  EXPECT_TRUE(session_->Calls().empty());
}

TEST_F(RunnerContractTest, StartSessionFailureIsSessionError) {
  MakeRunner(0);
  session_->FailNext(SmOp::kStartSession, ServerManagerError::Code::kInvalidSnapshot);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kCreateSession);
  EXPECT_EQ(e.source(), ErrorSource::kSession);
  EXPECT_EQ(broker_->CallCount(BrokerOp::kConsumeInput), 0u);
  EXPECT_EQ(runner_->state(), Runner::State::kFailed);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-041: Steady-state failures name the failing step
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, ConsumeFailureIsLogError) {
  MakeRunner(0);
  broker_->FailNext(BrokerOp::kConsumeInput, BrokerError::Code::kLogUnavailable);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kConsumeInput);
  EXPECT_EQ(e.source(), ErrorSource::kLog);
  EXPECT_EQ(std::string(e.what()),
            "failed to consume input from broker: injected broker failure");
}

TEST_F(RunnerContractTest, AdvanceFailureIsSessionError) {
  broker_->AppendAdvance(0);
  broker_->AppendAdvance(0);
  MakeRunner(0);
  session_->FailNext(SmOp::kAdvanceState, ServerManagerError::Code::kRejectedInput);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kAdvance);
  // No further input was requested after the failure.
  EXPECT_EQ(broker_->CallCount(BrokerOp::kConsumeInput), 1u);
  EXPECT_EQ(metrics_->GetSnapshot().advance_inputs_sent, 0u);

  // The collaborator's exception is kept as the cause.
  ASSERT_TRUE(e.cause());
  try {
    std::rethrow_exception(e.cause());
  } catch (const ServerManagerError& cause) {
    EXPECT_EQ(cause.code(), ServerManagerError::Code::kRejectedInput);
  }
}

TEST_F(RunnerContractTest, StorageDirectoryFailureStopsBeforeSessionFinish) {
  broker_->AppendFinish(0);
  MakeRunner(0);
  snapshots_->FailNext(SnapOp::kGetStorageDirectory, SnapshotError::Code::kAllocationFailed);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kGetStorageDirectory);
  EXPECT_TRUE(session_->CallsOf(SmOp::kFinishEpoch).empty());
}

TEST_F(RunnerContractTest, SetLatestFailureStopsBeforeClaim) {
  broker_->AppendFinish(0);
  MakeRunner(0);
  snapshots_->FailNext(SnapOp::kSetLatest, SnapshotError::Code::kStoreUnavailable);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kSetLatestSnapshot);
  EXPECT_EQ(e.source(), ErrorSource::kSnapshot);
  EXPECT_EQ(broker_->CallCount(BrokerOp::kWasClaimProduced), 0u);
}

TEST_F(RunnerContractTest, ClaimPeekFailureIsLogError) {
  broker_->AppendFinish(0);
  MakeRunner(0);
  broker_->FailNext(BrokerOp::kWasClaimProduced, BrokerError::Code::kLogUnavailable);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kPeekClaim);
  EXPECT_TRUE(session_->CallsOf(SmOp::kGetEpochClaim).empty());
}

TEST_F(RunnerContractTest, GetEpochClaimFailureIsSessionError) {
  broker_->AppendFinish(0);
  MakeRunner(0);
  session_->FailNext(SmOp::kGetEpochClaim, ServerManagerError::Code::kClaimNotReady);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kGetEpochClaim);
  EXPECT_EQ(broker_->CallCount(BrokerOp::kProduceRollupsClaim), 0u);
}

TEST_F(RunnerContractTest, ProduceClaimFailureIsLogError) {
  broker_->AppendFinish(0);
  MakeRunner(0);
  broker_->FailNext(BrokerOp::kProduceRollupsClaim, BrokerError::Code::kLogUnavailable);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kProduceClaim);
  EXPECT_EQ(e.source(), ErrorSource::kLog);
  EXPECT_EQ(metrics_->GetSnapshot().claims_sent, 0u);
}

// =============================================================================
// F. STOP AND STATE
// =============================================================================

// -----------------------------------------------------------------------------
// TEST-RUNNER-050: An interrupted read after a stop request ends cleanly
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, InterruptedReadAfterStopIsCleanStop) {
  broker_->AppendAdvance(0);
  MakeRunner(0);

  EXPECT_NO_THROW(runner_->Run());
  EXPECT_EQ(runner_->state(), Runner::State::kStopped);
  EXPECT_EQ(metrics_->GetSnapshot().runner_state,
            static_cast<int>(Runner::State::kStopped));
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-051: The same interruption without a stop request is fatal
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, CancelledReadWithoutStopIsFatal) {
  MakeRunner(0);
  broker_->SetOnExhausted(nullptr);

  RunnerError e = RunExpectingError();
  EXPECT_EQ(e.kind(), RunnerErrorKind::kConsumeInput);
  EXPECT_EQ(metrics_->GetSnapshot().runner_state,
            static_cast<int>(Runner::State::kFailed));
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-052: Stop requested before Run() still recovers, then stops
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, StopBeforeRunSkipsLoop) {
  broker_->AppendAdvance(0);
  MakeRunner(0);
  runner_->RequestStop();

  runner_->Run();

  EXPECT_EQ(session_->CallsOf(SmOp::kStartSession).size(), 1u);
  EXPECT_EQ(broker_->CallCount(BrokerOp::kConsumeInput), 0u);
  EXPECT_EQ(runner_->state(), Runner::State::kStopped);
}

// -----------------------------------------------------------------------------
// TEST-RUNNER-053: A fatal error is logged once with its source and kind
// -----------------------------------------------------------------------------
TEST_F(RunnerContractTest, FatalErrorLoggedOnce) {
  std::vector<std::string> error_lines;
  util::Logger::SetErrorSink(
      [&error_lines](const std::string& line) { error_lines.push_back(line); });

  broker_->AppendAdvance(0);
  MakeRunner(0);
  session_->FailNext(SmOp::kAdvanceState, ServerManagerError::Code::kRejectedInput);
  RunExpectingError();

  util::Logger::SetErrorSink(nullptr);

  ASSERT_EQ(error_lines.size(), 1u);
  EXPECT_EQ(error_lines[0].rfind("[Runner] FATAL source=SessionError kind=Advance retryable=Y", 0),
            0u);
}

TEST_F(RunnerContractTest, RejectsMissingCollaborators) {
  auto snapshots = std::make_shared<InMemorySnapshotManager>();
  EXPECT_THROW(Runner(nullptr, broker_, snapshots), std::invalid_argument);
  EXPECT_THROW(Runner(session_, nullptr, snapshots), std::invalid_argument);
  EXPECT_THROW(Runner(session_, broker_, nullptr), std::invalid_argument);
}

TEST(RunnerStateNameTest, NamesEveryState) {
  EXPECT_STREQ(RunnerStateName(Runner::State::kUninitialized), "UNINITIALIZED");
  EXPECT_STREQ(RunnerStateName(Runner::State::kRecovering), "RECOVERING");
  EXPECT_STREQ(RunnerStateName(Runner::State::kSteady), "STEADY");
  EXPECT_STREQ(RunnerStateName(Runner::State::kStopped), "STOPPED");
  EXPECT_STREQ(RunnerStateName(Runner::State::kFailed), "FAILED");
}

}  // namespace
}  // namespace rollups::runner::testing
