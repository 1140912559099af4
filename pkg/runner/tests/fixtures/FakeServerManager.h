// Repository: Rollups-advance-runner
// Component: Fake Server Manager
// Purpose: Recording IServerManager for runner contract tests.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_TESTS_FIXTURES_FAKE_SERVER_MANAGER_H_
#define ROLLUPS_TESTS_FIXTURES_FAKE_SERVER_MANAGER_H_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "rollups/server_manager/IServerManager.hpp"

namespace rollups::tests::fixtures {

// Records every call in order. GetEpochClaim() answers a hash derived from the
// epoch (32 bytes, each (epoch + i) & 0xff) so tests can predict it.
class FakeServerManager : public server_manager::IServerManager {
 public:
  enum class Operation {
    kStartSession,
    kAdvanceState,
    kFinishEpoch,
    kGetEpochClaim,
  };

  struct Call {
    Operation op;
    uint64_t epoch_index = 0;
    uint64_t input_index = 0;  // AdvanceState only
    std::string path;          // StartSession / FinishEpoch only
    std::vector<uint8_t> payload;
  };

  static std::vector<uint8_t> ExpectedHash(uint64_t epoch) {
    std::vector<uint8_t> hash(32);
    for (size_t i = 0; i < hash.size(); ++i) {
      hash[i] = static_cast<uint8_t>((epoch + i) & 0xff);
    }
    return hash;
  }

  void FailNext(Operation op, server_manager::ServerManagerError::Code code) {
    std::lock_guard<std::mutex> lock(mutex_);
    armed_failures_[op] = code;
  }

  // Runs inside FinishEpoch() before it returns.
  void SetOnFinishEpoch(std::function<void(uint64_t, const std::string&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_finish_epoch_ = std::move(hook);
  }

  // --- IServerManager ---

  void StartSession(const std::string& snapshot_path, uint64_t epoch) override {
    Call call{Operation::kStartSession};
    call.epoch_index = epoch;
    call.path = snapshot_path;
    Record(std::move(call));
  }

  void AdvanceState(uint64_t epoch_index,
                    uint64_t input_index,
                    const InputMetadata& /*metadata*/,
                    const std::vector<uint8_t>& payload) override {
    Call call{Operation::kAdvanceState};
    call.epoch_index = epoch_index;
    call.input_index = input_index;
    call.payload = payload;
    Record(std::move(call));
  }

  void FinishEpoch(uint64_t epoch_index, const std::string& snapshot_path) override {
    Call call{Operation::kFinishEpoch};
    call.epoch_index = epoch_index;
    call.path = snapshot_path;
    Record(std::move(call));

    std::function<void(uint64_t, const std::string&)> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hook = on_finish_epoch_;
    }
    if (hook) hook(epoch_index, snapshot_path);
  }

  EpochClaim GetEpochClaim(uint64_t epoch_index) override {
    Call call{Operation::kGetEpochClaim};
    call.epoch_index = epoch_index;
    Record(std::move(call));
    return EpochClaim{epoch_index, ExpectedHash(epoch_index)};
  }

  // --- Inspection ---

  std::vector<Call> Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  std::vector<Call> CallsOf(Operation op) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Call> out;
    for (const Call& c : calls_) {
      if (c.op == op) out.push_back(c);
    }
    return out;
  }

 private:
  // A call that fails is still recorded.
  void Record(Call call) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Operation op = call.op;
    calls_.push_back(std::move(call));
    auto it = armed_failures_.find(op);
    if (it != armed_failures_.end()) {
      server_manager::ServerManagerError::Code code = it->second;
      armed_failures_.erase(it);
      throw server_manager::ServerManagerError(code, "injected session failure");
    }
  }

  mutable std::mutex mutex_;
  std::vector<Call> calls_;
  std::map<Operation, server_manager::ServerManagerError::Code> armed_failures_;
  std::function<void(uint64_t, const std::string&)> on_finish_epoch_;
};

}  // namespace rollups::tests::fixtures

#endif  // ROLLUPS_TESTS_FIXTURES_FAKE_SERVER_MANAGER_H_
