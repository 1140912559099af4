// Repository: Rollups-advance-runner
// Component: Runner Error Taxonomy
// Purpose: Fatal runner errors attributed to the failing collaborator call.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_RUNNER_RUNNER_ERRORS_HPP_
#define ROLLUPS_RUNNER_RUNNER_ERRORS_HPP_

#include <exception>
#include <stdexcept>
#include <string>

namespace rollups::runner {

// One kind per runner operation that can fail.
enum class RunnerErrorKind {
  kCreateSession,
  kAdvance,
  kFinishEpoch,
  kGetEpochClaim,
  kFindFinishEpochInput,
  kConsumeInput,
  kPeekClaim,
  kProduceClaim,
  kGetStorageDirectory,
  kGetLatestSnapshot,
  kSetLatestSnapshot,
  kParentIdMismatch,
};

// Which collaborator the failure came from.
enum class ErrorSource {
  kSession,         // Compute session (server-manager)
  kLog,             // Event log (broker)
  kSnapshot,        // Snapshot store
  kChainIntegrity,  // Parent-id mismatch detected by the runner itself
};

const char* RunnerErrorKindName(RunnerErrorKind kind);
const char* ErrorSourceName(ErrorSource source);
ErrorSource SourceOf(RunnerErrorKind kind);

// Human-readable description of the operation, e.g.
// "failed to send advance-state input to server-manager".
const char* DescribeOperation(RunnerErrorKind kind);

// RunnerError is the only exception type the runner loop raises for
// collaborator failures. The runner never retries: every RunnerError ends
// the loop and the supervisor restarts the process, which re-enters recovery.
//
// what() is "<operation>: <collaborator message>". The collaborator's
// exception is kept in cause() for callers that need its code.
class RunnerError : public std::runtime_error {
 public:
  RunnerError(RunnerErrorKind kind,
              const std::string& cause_message,
              std::exception_ptr cause = nullptr);

  RunnerErrorKind kind() const { return kind_; }
  ErrorSource source() const { return SourceOf(kind_); }
  const std::exception_ptr& cause() const { return cause_; }

  // False for chain-integrity failures: restarting reproduces the mismatch
  // when the log itself is corrupt.
  bool IsRetryable() const { return source() != ErrorSource::kChainIntegrity; }

 private:
  RunnerErrorKind kind_;
  std::exception_ptr cause_;
};

// Consumed event does not chain from the last consumed one.
// what() is "parent id doesn't match: expected=<id> got=<id>".
class ChainIntegrityError : public RunnerError {
 public:
  ChainIntegrityError(std::string expected, std::string got);

  const std::string& expected() const { return expected_; }
  const std::string& got() const { return got_; }

 private:
  std::string expected_;
  std::string got_;
};

// Process exit codes reported to the supervisor.
constexpr int kExitOk = 0;
constexpr int kExitRetryable = 1;
constexpr int kExitChainIntegrity = 2;
constexpr int kExitConfig = 64;

// Maps the error that ended the runner loop to a process exit code.
// Unexpected non-runner errors are logged and treated as retryable.
int ExitCodeFor(std::exception_ptr error);

}  // namespace rollups::runner

#endif  // ROLLUPS_RUNNER_RUNNER_ERRORS_HPP_
