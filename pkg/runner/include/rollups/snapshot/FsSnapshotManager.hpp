// Repository: Rollups-advance-runner
// Component: Filesystem Snapshot Manager
// Purpose: Durable ISnapshotManager backed by epoch directories and a
//          "latest" symlink.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_SNAPSHOT_FS_SNAPSHOT_MANAGER_HPP_
#define ROLLUPS_SNAPSHOT_FS_SNAPSHOT_MANAGER_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "rollups/snapshot/ISnapshotManager.hpp"

namespace rollups::snapshot {

// Layout:
//   <snapshot_dir>/<epoch>/   machine stored by the compute session
//   <latest_link>             symlink to the latest <epoch> directory
//
// GetStorageDirectory() returns a path that does not exist yet; the session
// creates it when it stores the machine. A directory left behind by a run
// that crashed before SetLatest() is removed on allocation, so finishing the
// same epoch again after a restart gets a clean location.
//
// SetLatest() swaps the symlink atomically (temporary link + rename) and then
// prunes every other epoch directory. Pruning failures are logged, not
// raised: the latest pointer is already durable at that point.
class FsSnapshotManager : public ISnapshotManager {
 public:
  static constexpr const char* kDefaultLatestName = "latest";

  // An empty latest_link means <snapshot_dir>/latest.
  explicit FsSnapshotManager(std::string snapshot_dir, std::string latest_link = "");

  FsSnapshotManager(const FsSnapshotManager&) = delete;
  FsSnapshotManager& operator=(const FsSnapshotManager&) = delete;

  Snapshot GetLatest() override;
  Snapshot GetStorageDirectory(uint64_t epoch) override;
  void SetLatest(const Snapshot& snapshot) override;

  const std::string& SnapshotDir() const { return snapshot_dir_; }
  const std::string& LatestLink() const { return latest_link_; }

  // Directory name → epoch. nullopt unless the name is all decimal digits.
  static std::optional<uint64_t> ParseEpoch(const std::string& name);

 private:
  // Target of the latest link, or empty when there is none.
  std::string ResolveLatestTarget() const;
  void PruneExcept(uint64_t keep_epoch);

  std::string snapshot_dir_;
  std::string latest_link_;
};

}  // namespace rollups::snapshot

#endif  // ROLLUPS_SNAPSHOT_FS_SNAPSHOT_MANAGER_HPP_
