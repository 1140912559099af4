// Repository: Rollups-advance-runner
// Component: IServerManager Interface
// Purpose: Compute-session lifecycle driven by the runner.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_SERVER_MANAGER_ISERVER_MANAGER_HPP_
#define ROLLUPS_SERVER_MANAGER_ISERVER_MANAGER_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "rollups/runner/Types.hpp"

namespace rollups::server_manager {

class ServerManagerError : public std::runtime_error {
 public:
  enum class Code {
    kSessionUnreachable,
    kAlreadyActive,
    kInvalidSnapshot,
    kRejectedInput,
    kCheckpointFailed,
    kClaimNotReady,
  };

  ServerManagerError(Code code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  Code code() const { return code_; }

 private:
  Code code_;
};

const char* ServerManagerErrorCodeName(ServerManagerError::Code code);

// IServerManager drives a single stateful compute session.
//
// The runner is the only writer: one session, one epoch active at a time,
// inputs applied strictly in order. None of these calls is retried by the
// runner; implementations report failures by throwing ServerManagerError.
class IServerManager {
 public:
  virtual ~IServerManager() = default;

  // Starts the session from the machine stored at `snapshot_path` with
  // `epoch` as the active epoch.
  virtual void StartSession(const std::string& snapshot_path, uint64_t epoch) = 0;

  virtual void AdvanceState(uint64_t epoch_index,
                            uint64_t input_index,
                            const InputMetadata& metadata,
                            const std::vector<uint8_t>& payload) = 0;

  // Closes `epoch_index` and writes the checkpoint to `snapshot_path`. An
  // empty path means the session keeps no checkpoint.
  virtual void FinishEpoch(uint64_t epoch_index, const std::string& snapshot_path) = 0;

  virtual EpochClaim GetEpochClaim(uint64_t epoch_index) = 0;
};

}  // namespace rollups::server_manager

#endif  // ROLLUPS_SERVER_MANAGER_ISERVER_MANAGER_HPP_
