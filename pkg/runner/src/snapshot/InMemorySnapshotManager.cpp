// Repository: Rollups-advance-runner
// Component: In-Memory Snapshot Manager
// Purpose: Map-backed ISnapshotManager for tests and embedded runs.
// Copyright (c) 2025 Rollups

#include "rollups/snapshot/InMemorySnapshotManager.hpp"

#include <utility>

namespace rollups::snapshot {

namespace {

const char* OperationName(InMemorySnapshotManager::Operation op) {
  switch (op) {
    case InMemorySnapshotManager::Operation::kGetLatest:           return "get_latest";
    case InMemorySnapshotManager::Operation::kGetStorageDirectory: return "get_storage_directory";
    case InMemorySnapshotManager::Operation::kSetLatest:           return "set_latest";
  }
  return "unknown";
}

}  // namespace

InMemorySnapshotManager::InMemorySnapshotManager(std::optional<Snapshot> latest,
                                                 std::string root)
    : root_(std::move(root)), latest_(std::move(latest)) {}

void InMemorySnapshotManager::FailNext(Operation op, SnapshotError::Code code) {
  std::lock_guard<std::mutex> lock(mutex_);
  armed_failures_[op] = code;
}

// Requires mutex_ held.
void InMemorySnapshotManager::MaybeFail(Operation op) {
  auto it = armed_failures_.find(op);
  if (it == armed_failures_.end()) return;
  SnapshotError::Code code = it->second;
  armed_failures_.erase(it);
  throw SnapshotError(code, std::string("injected ") + SnapshotErrorCodeName(code) +
                                " on " + OperationName(op));
}

Snapshot InMemorySnapshotManager::GetLatest() {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail(Operation::kGetLatest);
  if (!latest_) {
    throw SnapshotError(SnapshotError::Code::kNotFound, "no latest snapshot");
  }
  return *latest_;
}

Snapshot InMemorySnapshotManager::GetStorageDirectory(uint64_t epoch) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail(Operation::kGetStorageDirectory);
  Snapshot snapshot{root_ + "/" + std::to_string(epoch), epoch};
  allocations_.push_back(snapshot);
  return snapshot;
}

void InMemorySnapshotManager::SetLatest(const Snapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail(Operation::kSetLatest);
  latest_ = snapshot;
  latest_history_.push_back(snapshot);
}

std::optional<Snapshot> InMemorySnapshotManager::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::vector<Snapshot> InMemorySnapshotManager::Allocations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return allocations_;
}

std::vector<Snapshot> InMemorySnapshotManager::LatestHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_history_;
}

}  // namespace rollups::snapshot
