// Repository: Rollups-advance-runner
// Component: In-Memory Snapshot Manager
// Purpose: Map-backed ISnapshotManager for tests and embedded runs.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_SNAPSHOT_IN_MEMORY_SNAPSHOT_MANAGER_HPP_
#define ROLLUPS_SNAPSHOT_IN_MEMORY_SNAPSHOT_MANAGER_HPP_

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rollups/snapshot/ISnapshotManager.hpp"

namespace rollups::snapshot {

// Keeps the latest pointer in memory. Storage locations are plain strings
// "<root>/<epoch>"; nothing is written anywhere.
//
// Records every allocation and every SetLatest() so tests can assert the
// epoch offset and the order of persistence. A failure can be armed per
// operation; it fires once on the next call.
class InMemorySnapshotManager : public ISnapshotManager {
 public:
  enum class Operation {
    kGetLatest,
    kGetStorageDirectory,
    kSetLatest,
  };

  explicit InMemorySnapshotManager(std::optional<Snapshot> latest = std::nullopt,
                                   std::string root = "/snapshots");

  Snapshot GetLatest() override;
  Snapshot GetStorageDirectory(uint64_t epoch) override;
  void SetLatest(const Snapshot& snapshot) override;

  void FailNext(Operation op, SnapshotError::Code code);

  std::optional<Snapshot> Latest() const;
  std::vector<Snapshot> Allocations() const;
  std::vector<Snapshot> LatestHistory() const;

 private:
  void MaybeFail(Operation op);

  mutable std::mutex mutex_;
  std::string root_;
  std::optional<Snapshot> latest_;
  std::vector<Snapshot> allocations_;
  std::vector<Snapshot> latest_history_;
  std::map<Operation, SnapshotError::Code> armed_failures_;
};

}  // namespace rollups::snapshot

#endif  // ROLLUPS_SNAPSHOT_IN_MEMORY_SNAPSHOT_MANAGER_HPP_
