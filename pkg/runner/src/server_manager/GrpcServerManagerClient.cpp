// Repository: Rollups-advance-runner
// Component: Server-manager gRPC client implementation
// Copyright (c) 2025 Rollups

#include "server_manager/GrpcServerManagerClient.hpp"

#include <chrono>
#include <sstream>
#include <thread>
#include <utility>

#include "rollups/util/Logger.hpp"

namespace rollups::server_manager {

namespace proto = rollups::server_manager::v1;
using util::Logger;

GrpcServerManagerClient::GrpcServerManagerClient(const std::string& target_address,
                                                 GrpcServerManagerOptions options)
    : GrpcServerManagerClient(
          grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials()),
          std::move(options)) {}

GrpcServerManagerClient::GrpcServerManagerClient(std::shared_ptr<grpc::Channel> channel,
                                                 GrpcServerManagerOptions options)
    : grpc_channel_(std::move(channel)),
      stub_(proto::ServerManager::NewStub(grpc_channel_)),
      options_(std::move(options)) {}

void GrpcServerManagerClient::SetDeadline(grpc::ClientContext* context) const {
  context->set_deadline(std::chrono::system_clock::now() +
                        std::chrono::milliseconds(options_.deadline_ms));
}

ServerManagerError GrpcServerManagerClient::ToError(const grpc::Status& status,
                                                    const std::string& rpc,
                                                    ServerManagerError::Code fallback) const {
  std::ostringstream oss;
  oss << rpc << " failed: session_id=" << options_.session_id
      << " code=" << static_cast<int>(status.error_code())
      << " message=" << status.error_message();

  switch (status.error_code()) {
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return ServerManagerError(ServerManagerError::Code::kSessionUnreachable, oss.str());
    default:
      return ServerManagerError(fallback, oss.str());
  }
}

grpc::Status GrpcServerManagerClient::CallStartSession(const std::string& snapshot_path,
                                                       uint64_t epoch) {
  proto::StartSessionRequest request;
  request.set_session_id(options_.session_id);
  request.set_machine_directory(snapshot_path);
  request.set_active_epoch_index(epoch);

  proto::StartSessionResponse response;
  grpc::ClientContext context;
  SetDeadline(&context);
  return stub_->StartSession(&context, request, &response);
}

void GrpcServerManagerClient::StartSession(const std::string& snapshot_path, uint64_t epoch) {
  grpc::Status status = CallStartSession(snapshot_path, epoch);

  if (status.error_code() == grpc::StatusCode::ALREADY_EXISTS) {
    // Left over from a previous run of this runner.
    Logger::Warn("[GrpcServerManagerClient] SESSION_EXISTS session_id=" +
                 options_.session_id + " ending it");
    EndSession();
    status = CallStartSession(snapshot_path, epoch);
    if (status.error_code() == grpc::StatusCode::ALREADY_EXISTS) {
      throw ToError(status, "StartSession", ServerManagerError::Code::kAlreadyActive);
    }
  }

  if (!status.ok()) {
    ServerManagerError::Code fallback = ServerManagerError::Code::kSessionUnreachable;
    if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT ||
        status.error_code() == grpc::StatusCode::NOT_FOUND) {
      fallback = ServerManagerError::Code::kInvalidSnapshot;
    }
    throw ToError(status, "StartSession", fallback);
  }
}

void GrpcServerManagerClient::EndSession() {
  proto::EndSessionRequest request;
  request.set_session_id(options_.session_id);

  proto::EndSessionResponse response;
  grpc::ClientContext context;
  SetDeadline(&context);
  grpc::Status status = stub_->EndSession(&context, request, &response);
  if (!status.ok() && status.error_code() != grpc::StatusCode::NOT_FOUND) {
    throw ToError(status, "EndSession", ServerManagerError::Code::kAlreadyActive);
  }
}

void GrpcServerManagerClient::AdvanceState(uint64_t epoch_index,
                                           uint64_t input_index,
                                           const InputMetadata& metadata,
                                           const std::vector<uint8_t>& payload) {
  proto::AdvanceStateRequest request;
  request.set_session_id(options_.session_id);
  request.set_active_epoch_index(epoch_index);
  request.set_current_input_index(input_index);
  proto::InputMetadata* m = request.mutable_input_metadata();
  m->set_msg_sender(std::string(metadata.msg_sender.begin(), metadata.msg_sender.end()));
  m->set_block_number(metadata.block_number);
  m->set_timestamp(metadata.timestamp);
  m->set_epoch_index(metadata.epoch_index);
  m->set_input_index(metadata.input_index);
  request.set_input_payload(std::string(payload.begin(), payload.end()));

  proto::AdvanceStateResponse response;
  grpc::ClientContext context;
  SetDeadline(&context);
  grpc::Status status = stub_->AdvanceState(&context, request, &response);
  if (!status.ok()) {
    throw ToError(status, "AdvanceState", ServerManagerError::Code::kRejectedInput);
  }
}

proto::GetEpochStatusResponse GrpcServerManagerClient::GetEpochStatus(uint64_t epoch_index) {
  proto::GetEpochStatusRequest request;
  request.set_session_id(options_.session_id);
  request.set_epoch_index(epoch_index);

  proto::GetEpochStatusResponse response;
  grpc::ClientContext context;
  SetDeadline(&context);
  grpc::Status status = stub_->GetEpochStatus(&context, request, &response);
  if (!status.ok()) {
    throw ToError(status, "GetEpochStatus", ServerManagerError::Code::kCheckpointFailed);
  }
  return response;
}

uint64_t GrpcServerManagerClient::WaitPendingInputs(uint64_t epoch_index) {
  for (int attempt = 0;; ++attempt) {
    proto::GetEpochStatusResponse status = GetEpochStatus(epoch_index);
    if (status.pending_input_count() == 0) {
      return status.processed_input_count();
    }
    if (attempt >= options_.pending_inputs_max_retries) {
      std::ostringstream oss;
      oss << "epoch " << epoch_index << " still has " << status.pending_input_count()
          << " pending inputs after " << attempt << " retries";
      throw ServerManagerError(ServerManagerError::Code::kCheckpointFailed, oss.str());
    }

    std::ostringstream oss;
    oss << "[GrpcServerManagerClient] PENDING_INPUTS epoch=" << epoch_index
        << " pending=" << status.pending_input_count() << " attempt=" << attempt;
    Logger::Debug(oss.str());
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.pending_inputs_sleep_ms));
  }
}

void GrpcServerManagerClient::FinishEpoch(uint64_t epoch_index,
                                          const std::string& snapshot_path) {
  const uint64_t processed = WaitPendingInputs(epoch_index);

  proto::FinishEpochRequest request;
  request.set_session_id(options_.session_id);
  request.set_active_epoch_index(epoch_index);
  request.set_processed_input_count(processed);
  request.set_storage_directory(snapshot_path);

  proto::FinishEpochResponse response;
  grpc::ClientContext context;
  SetDeadline(&context);
  grpc::Status status = stub_->FinishEpoch(&context, request, &response);
  if (!status.ok()) {
    throw ToError(status, "FinishEpoch", ServerManagerError::Code::kCheckpointFailed);
  }

  std::ostringstream oss;
  oss << "[GrpcServerManagerClient] EPOCH_FINISHED epoch=" << epoch_index
      << " processed=" << processed << " storage=" << snapshot_path;
  Logger::Debug(oss.str());
}

EpochClaim GrpcServerManagerClient::GetEpochClaim(uint64_t epoch_index) {
  proto::GetEpochStatusResponse status;
  try {
    status = GetEpochStatus(epoch_index);
  } catch (const ServerManagerError& e) {
    if (e.code() == ServerManagerError::Code::kSessionUnreachable) throw;
    throw ServerManagerError(ServerManagerError::Code::kClaimNotReady, e.what());
  }

  if (status.state() != proto::FINISHED) {
    throw ServerManagerError(ServerManagerError::Code::kClaimNotReady,
                             "epoch " + std::to_string(epoch_index) + " is not finished");
  }
  if (status.claim_hash().empty()) {
    throw ServerManagerError(ServerManagerError::Code::kClaimNotReady,
                             "epoch " + std::to_string(epoch_index) + " has no claim hash");
  }

  EpochClaim claim;
  claim.epoch_index = epoch_index;
  claim.epoch_hash.assign(status.claim_hash().begin(), status.claim_hash().end());
  return claim;
}

}  // namespace rollups::server_manager
