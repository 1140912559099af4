// Repository: Rollups-advance-runner
// Component: Broker gRPC client
// Purpose: IBroker over the RollupsBroker service.
// Copyright (c) 2025 Rollups

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>
#include "rollups/broker.grpc.pb.h"

#include "rollups/broker/IBroker.hpp"

namespace rollups::broker {

// Every request carries the DApp metadata the client was built with, so one
// broker can serve several rollups.
//
// ConsumeInput() long-polls: each call asks the broker to hold the request
// for at most consume_timeout_ms and simply re-issues it on an empty answer.
// Shutdown() cancels the in-flight poll from any thread; the blocked
// ConsumeInput() then throws BrokerError(kCancelled).
class GrpcBrokerClient : public IBroker {
 public:
  GrpcBrokerClient(const std::string& target_address,
                   DAppMetadata dapp,
                   int deadline_ms,
                   int consume_timeout_ms);

  // Uses an existing channel (in-process tests).
  GrpcBrokerClient(std::shared_ptr<grpc::Channel> channel,
                   DAppMetadata dapp,
                   int deadline_ms,
                   int consume_timeout_ms);

  GrpcBrokerClient(const GrpcBrokerClient&) = delete;
  GrpcBrokerClient& operator=(const GrpcBrokerClient&) = delete;

  std::string FindPreviousFinishEpoch(uint64_t epoch) override;
  Event ConsumeInput(const std::string& after_id) override;
  bool WasClaimProduced(uint64_t epoch) override;
  void ProduceRollupsClaim(uint64_t epoch, const EpochClaim& claim) override;

  void Shutdown();
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

 private:
  void SetDeadline(grpc::ClientContext* context, std::chrono::milliseconds timeout) const;
  void FillDApp(rollups::broker::v1::DAppMetadata* out) const;
  BrokerError ToBrokerError(const grpc::Status& status, const std::string& rpc) const;

  static Event FromProto(const rollups::broker::v1::InputEvent& event);

  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<rollups::broker::v1::RollupsBroker::Stub> stub_;
  DAppMetadata dapp_;
  int deadline_ms_;
  int consume_timeout_ms_;

  std::atomic<bool> shutdown_{false};

  // Context of the ConsumeInput call in flight, for Shutdown().
  std::mutex active_mutex_;
  grpc::ClientContext* active_context_ = nullptr;
};

}  // namespace rollups::broker
