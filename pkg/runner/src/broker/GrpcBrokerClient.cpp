// Repository: Rollups-advance-runner
// Component: Broker gRPC client implementation
// Copyright (c) 2025 Rollups

#include "broker/GrpcBrokerClient.hpp"

#include <chrono>
#include <sstream>
#include <utility>
#include <vector>

#include "rollups/util/Logger.hpp"

namespace rollups::broker {

namespace proto = rollups::broker::v1;
using util::Logger;

namespace {

std::vector<uint8_t> ToBytes(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::string FromBytes(const std::vector<uint8_t>& b) {
  return std::string(b.begin(), b.end());
}

}  // namespace

GrpcBrokerClient::GrpcBrokerClient(const std::string& target_address,
                                   DAppMetadata dapp,
                                   int deadline_ms,
                                   int consume_timeout_ms)
    : GrpcBrokerClient(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials()),
                       std::move(dapp), deadline_ms, consume_timeout_ms) {}

GrpcBrokerClient::GrpcBrokerClient(std::shared_ptr<grpc::Channel> channel,
                                   DAppMetadata dapp,
                                   int deadline_ms,
                                   int consume_timeout_ms)
    : grpc_channel_(std::move(channel)),
      stub_(proto::RollupsBroker::NewStub(grpc_channel_)),
      dapp_(std::move(dapp)),
      deadline_ms_(deadline_ms),
      consume_timeout_ms_(consume_timeout_ms) {}

void GrpcBrokerClient::Shutdown() {
  shutdown_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(active_mutex_);
  if (active_context_ != nullptr) {
    active_context_->TryCancel();
  }
}

void GrpcBrokerClient::SetDeadline(grpc::ClientContext* context,
                                   std::chrono::milliseconds timeout) const {
  context->set_deadline(std::chrono::system_clock::now() + timeout);
}

void GrpcBrokerClient::FillDApp(proto::DAppMetadata* out) const {
  out->set_chain_id(dapp_.chain_id);
  out->set_dapp_address(FromBytes(dapp_.dapp_address));
}

BrokerError GrpcBrokerClient::ToBrokerError(const grpc::Status& status,
                                            const std::string& rpc) const {
  std::ostringstream oss;
  oss << rpc << " failed: code=" << static_cast<int>(status.error_code())
      << " message=" << status.error_message();

  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return BrokerError(BrokerError::Code::kNotFound, oss.str());
    case grpc::StatusCode::ALREADY_EXISTS:
      return BrokerError(BrokerError::Code::kDuplicateClaim, oss.str());
    case grpc::StatusCode::CANCELLED:
      if (IsShutdown()) return BrokerError(BrokerError::Code::kCancelled, oss.str());
      break;
    default:
      break;
  }
  return BrokerError(BrokerError::Code::kLogUnavailable, oss.str());
}

Event GrpcBrokerClient::FromProto(const proto::InputEvent& event) {
  const proto::RollupsInput& p = event.payload();

  Event out;
  out.id = event.id();
  out.payload.epoch_index = p.epoch_index();
  out.payload.inputs_sent_count = p.inputs_sent_count();
  out.payload.parent_id = p.parent_id();

  switch (p.data_case()) {
    case proto::RollupsInput::kAdvanceStateInput: {
      const proto::AdvanceStateInput& in = p.advance_state_input();
      AdvanceStateInput advance;
      advance.metadata.msg_sender = ToBytes(in.metadata().msg_sender());
      advance.metadata.block_number = in.metadata().block_number();
      advance.metadata.timestamp = in.metadata().timestamp();
      advance.metadata.epoch_index = in.metadata().epoch_index();
      advance.metadata.input_index = in.metadata().input_index();
      advance.payload = ToBytes(in.payload());
      out.payload.data = std::move(advance);
      break;
    }
    case proto::RollupsInput::kFinishEpoch:
      out.payload.data = FinishEpoch{};
      break;
    case proto::RollupsInput::DATA_NOT_SET:
      throw BrokerError(BrokerError::Code::kLogUnavailable,
                        "event " + event.id() + " carries no input data");
  }
  return out;
}

std::string GrpcBrokerClient::FindPreviousFinishEpoch(uint64_t epoch) {
  if (epoch == 0) return kInitialEventId;

  proto::FindPreviousFinishEpochRequest request;
  FillDApp(request.mutable_dapp());
  request.set_epoch(epoch);

  proto::FindPreviousFinishEpochResponse response;
  grpc::ClientContext context;
  SetDeadline(&context, std::chrono::milliseconds(deadline_ms_));
  grpc::Status status = stub_->FindPreviousFinishEpoch(&context, request, &response);
  if (!status.ok()) {
    throw ToBrokerError(status, "FindPreviousFinishEpoch");
  }
  return response.event_id();
}

Event GrpcBrokerClient::ConsumeInput(const std::string& after_id) {
  proto::ConsumeInputRequest request;
  FillDApp(request.mutable_dapp());
  request.set_after_id(after_id);
  request.set_block_ms(static_cast<uint32_t>(consume_timeout_ms_));

  while (!IsShutdown()) {
    proto::ConsumeInputResponse response;
    grpc::ClientContext context;
    // The broker holds the call for block_ms; allow for that on top.
    // Summed in 64-bit milliseconds so two large int settings cannot wrap.
    SetDeadline(&context, std::chrono::milliseconds(consume_timeout_ms_) +
                              std::chrono::milliseconds(deadline_ms_));
    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      if (IsShutdown()) break;
      active_context_ = &context;
    }
    grpc::Status status = stub_->ConsumeInput(&context, request, &response);
    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      active_context_ = nullptr;
    }

    if (!status.ok()) {
      throw ToBrokerError(status, "ConsumeInput");
    }
    if (response.found()) {
      return FromProto(response.event());
    }
    Logger::Debug("[GrpcBrokerClient] CONSUME_TIMEOUT after_id=" + after_id);
  }
  throw BrokerError(BrokerError::Code::kCancelled, "ConsumeInput cancelled by shutdown");
}

bool GrpcBrokerClient::WasClaimProduced(uint64_t epoch) {
  proto::WasClaimProducedRequest request;
  FillDApp(request.mutable_dapp());
  request.set_epoch(epoch);

  proto::WasClaimProducedResponse response;
  grpc::ClientContext context;
  SetDeadline(&context, std::chrono::milliseconds(deadline_ms_));
  grpc::Status status = stub_->WasClaimProduced(&context, request, &response);
  if (!status.ok()) {
    throw ToBrokerError(status, "WasClaimProduced");
  }
  return response.produced();
}

void GrpcBrokerClient::ProduceRollupsClaim(uint64_t epoch, const EpochClaim& claim) {
  proto::ProduceRollupsClaimRequest request;
  FillDApp(request.mutable_dapp());
  request.mutable_claim()->set_epoch_index(epoch);
  request.mutable_claim()->set_epoch_hash(FromBytes(claim.epoch_hash));

  proto::ProduceRollupsClaimResponse response;
  grpc::ClientContext context;
  SetDeadline(&context, std::chrono::milliseconds(deadline_ms_));
  grpc::Status status = stub_->ProduceRollupsClaim(&context, request, &response);
  if (!status.ok()) {
    throw ToBrokerError(status, "ProduceRollupsClaim");
  }

  std::ostringstream oss;
  oss << "[GrpcBrokerClient] CLAIM_APPENDED epoch=" << epoch
      << " claim_id=" << response.claim_id();
  Logger::Debug(oss.str());
}

}  // namespace rollups::broker
