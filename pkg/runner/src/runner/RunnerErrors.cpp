// Repository: Rollups-advance-runner
// Component: Runner Error Taxonomy
// Purpose: Error naming and attribution for the runner and its collaborators.
// Copyright (c) 2025 Rollups

#include "rollups/runner/RunnerErrors.hpp"

#include <utility>

#include "rollups/broker/IBroker.hpp"
#include "rollups/server_manager/IServerManager.hpp"
#include "rollups/snapshot/ISnapshotManager.hpp"
#include "rollups/util/Logger.hpp"

namespace rollups {

namespace snapshot {

const char* SnapshotErrorCodeName(SnapshotError::Code code) {
  switch (code) {
    case SnapshotError::Code::kStoreUnavailable: return "StoreUnavailable";
    case SnapshotError::Code::kNotFound:         return "NotFound";
    case SnapshotError::Code::kAllocationFailed: return "AllocationFailed";
  }
  return "Unknown";
}

}  // namespace snapshot

namespace broker {

const char* BrokerErrorCodeName(BrokerError::Code code) {
  switch (code) {
    case BrokerError::Code::kLogUnavailable: return "LogUnavailable";
    case BrokerError::Code::kNotFound:       return "NotFound";
    case BrokerError::Code::kDuplicateClaim: return "DuplicateClaim";
    case BrokerError::Code::kCancelled:      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace broker

namespace server_manager {

const char* ServerManagerErrorCodeName(ServerManagerError::Code code) {
  switch (code) {
    case ServerManagerError::Code::kSessionUnreachable: return "SessionUnreachable";
    case ServerManagerError::Code::kAlreadyActive:      return "AlreadyActive";
    case ServerManagerError::Code::kInvalidSnapshot:    return "InvalidSnapshot";
    case ServerManagerError::Code::kRejectedInput:      return "RejectedInput";
    case ServerManagerError::Code::kCheckpointFailed:   return "CheckpointFailed";
    case ServerManagerError::Code::kClaimNotReady:      return "ClaimNotReady";
  }
  return "Unknown";
}

}  // namespace server_manager

namespace runner {

const char* RunnerErrorKindName(RunnerErrorKind kind) {
  switch (kind) {
    case RunnerErrorKind::kCreateSession:        return "CreateSession";
    case RunnerErrorKind::kAdvance:              return "Advance";
    case RunnerErrorKind::kFinishEpoch:          return "FinishEpoch";
    case RunnerErrorKind::kGetEpochClaim:        return "GetEpochClaim";
    case RunnerErrorKind::kFindFinishEpochInput: return "FindFinishEpochInput";
    case RunnerErrorKind::kConsumeInput:         return "ConsumeInput";
    case RunnerErrorKind::kPeekClaim:            return "PeekClaim";
    case RunnerErrorKind::kProduceClaim:         return "ProduceClaim";
    case RunnerErrorKind::kGetStorageDirectory:  return "GetStorageDirectory";
    case RunnerErrorKind::kGetLatestSnapshot:    return "GetLatestSnapshot";
    case RunnerErrorKind::kSetLatestSnapshot:    return "SetLatestSnapshot";
    case RunnerErrorKind::kParentIdMismatch:     return "ParentIdMismatch";
  }
  return "Unknown";
}

const char* ErrorSourceName(ErrorSource source) {
  switch (source) {
    case ErrorSource::kSession:        return "SessionError";
    case ErrorSource::kLog:            return "LogError";
    case ErrorSource::kSnapshot:       return "SnapshotError";
    case ErrorSource::kChainIntegrity: return "ChainIntegrityError";
  }
  return "Unknown";
}

ErrorSource SourceOf(RunnerErrorKind kind) {
  switch (kind) {
    case RunnerErrorKind::kCreateSession:
    case RunnerErrorKind::kAdvance:
    case RunnerErrorKind::kFinishEpoch:
    case RunnerErrorKind::kGetEpochClaim:
      return ErrorSource::kSession;
    case RunnerErrorKind::kFindFinishEpochInput:
    case RunnerErrorKind::kConsumeInput:
    case RunnerErrorKind::kPeekClaim:
    case RunnerErrorKind::kProduceClaim:
      return ErrorSource::kLog;
    case RunnerErrorKind::kGetStorageDirectory:
    case RunnerErrorKind::kGetLatestSnapshot:
    case RunnerErrorKind::kSetLatestSnapshot:
      return ErrorSource::kSnapshot;
    case RunnerErrorKind::kParentIdMismatch:
      return ErrorSource::kChainIntegrity;
  }
  return ErrorSource::kChainIntegrity;
}

const char* DescribeOperation(RunnerErrorKind kind) {
  switch (kind) {
    case RunnerErrorKind::kCreateSession:        return "failed to create session in server-manager";
    case RunnerErrorKind::kAdvance:              return "failed to send advance-state input to server-manager";
    case RunnerErrorKind::kFinishEpoch:          return "failed to finish epoch in server-manager";
    case RunnerErrorKind::kGetEpochClaim:        return "failed to get epoch claim from server-manager";
    case RunnerErrorKind::kFindFinishEpochInput: return "failed to find finish epoch input event";
    case RunnerErrorKind::kConsumeInput:         return "failed to consume input from broker";
    case RunnerErrorKind::kPeekClaim:            return "failed to get whether claim was produced";
    case RunnerErrorKind::kProduceClaim:         return "failed to produce claim in broker";
    case RunnerErrorKind::kGetStorageDirectory:  return "failed to get storage directory";
    case RunnerErrorKind::kGetLatestSnapshot:    return "failed to get latest snapshot";
    case RunnerErrorKind::kSetLatestSnapshot:    return "failed to set latest snapshot";
    case RunnerErrorKind::kParentIdMismatch:     return "parent id doesn't match";
  }
  return "runner failure";
}

RunnerError::RunnerError(RunnerErrorKind kind,
                         const std::string& cause_message,
                         std::exception_ptr cause)
    : std::runtime_error(std::string(DescribeOperation(kind)) + ": " + cause_message),
      kind_(kind),
      cause_(std::move(cause)) {}

ChainIntegrityError::ChainIntegrityError(std::string expected, std::string got)
    : RunnerError(RunnerErrorKind::kParentIdMismatch,
                  "expected=" + expected + " got=" + got),
      expected_(std::move(expected)),
      got_(std::move(got)) {}

int ExitCodeFor(std::exception_ptr error) {
  if (!error) return kExitOk;
  try {
    std::rethrow_exception(error);
  } catch (const RunnerError& e) {
    return e.IsRetryable() ? kExitRetryable : kExitChainIntegrity;
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[Main] UNEXPECTED error=\"") + e.what() + "\"");
    return kExitRetryable;
  }
}

}  // namespace runner
}  // namespace rollups
