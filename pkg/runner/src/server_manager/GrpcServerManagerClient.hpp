// Repository: Rollups-advance-runner
// Component: Server-manager gRPC client
// Purpose: IServerManager over the ServerManager service.
// Copyright (c) 2025 Rollups

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "rollups/server_manager.grpc.pb.h"

#include "rollups/server_manager/IServerManager.hpp"

namespace rollups::server_manager {

struct GrpcServerManagerOptions {
  std::string session_id = "default_rollups_id";
  int deadline_ms = 300000;
  // FinishEpoch waits for the session to drain queued inputs.
  int pending_inputs_sleep_ms = 1000;
  int pending_inputs_max_retries = 600;
};

// Status mapping:
//   UNAVAILABLE, DEADLINE_EXCEEDED   -> kSessionUnreachable (any call)
//   StartSession ALREADY_EXISTS      -> EndSession + one retry, then kAlreadyActive
//   StartSession INVALID_ARGUMENT,
//                NOT_FOUND           -> kInvalidSnapshot
//   AdvanceState (other)             -> kRejectedInput
//   FinishEpoch  (other)             -> kCheckpointFailed
//   GetEpochClaim unfinished/no hash -> kClaimNotReady
class GrpcServerManagerClient : public IServerManager {
 public:
  GrpcServerManagerClient(const std::string& target_address, GrpcServerManagerOptions options);

  // Uses an existing channel (in-process tests).
  GrpcServerManagerClient(std::shared_ptr<grpc::Channel> channel,
                          GrpcServerManagerOptions options);

  GrpcServerManagerClient(const GrpcServerManagerClient&) = delete;
  GrpcServerManagerClient& operator=(const GrpcServerManagerClient&) = delete;

  void StartSession(const std::string& snapshot_path, uint64_t epoch) override;
  void AdvanceState(uint64_t epoch_index,
                    uint64_t input_index,
                    const InputMetadata& metadata,
                    const std::vector<uint8_t>& payload) override;
  void FinishEpoch(uint64_t epoch_index, const std::string& snapshot_path) override;
  EpochClaim GetEpochClaim(uint64_t epoch_index) override;

  const GrpcServerManagerOptions& options() const { return options_; }

 private:
  grpc::Status CallStartSession(const std::string& snapshot_path, uint64_t epoch);
  void EndSession();
  rollups::server_manager::v1::GetEpochStatusResponse GetEpochStatus(uint64_t epoch_index);

  // Waits until the session has no pending inputs for the epoch. Returns the
  // processed input count.
  uint64_t WaitPendingInputs(uint64_t epoch_index);

  void SetDeadline(grpc::ClientContext* context) const;
  ServerManagerError ToError(const grpc::Status& status,
                             const std::string& rpc,
                             ServerManagerError::Code fallback) const;

  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<rollups::server_manager::v1::ServerManager::Stub> stub_;
  GrpcServerManagerOptions options_;
};

}  // namespace rollups::server_manager
