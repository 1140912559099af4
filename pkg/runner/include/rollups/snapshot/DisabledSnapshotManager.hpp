// Repository: Rollups-advance-runner
// Component: Disabled Snapshot Manager
// Purpose: ISnapshotManager used when snapshots are turned off.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_SNAPSHOT_DISABLED_SNAPSHOT_MANAGER_HPP_
#define ROLLUPS_SNAPSHOT_DISABLED_SNAPSHOT_MANAGER_HPP_

#include <cstdint>
#include <string>

#include "rollups/snapshot/ISnapshotManager.hpp"

namespace rollups::snapshot {

// Always resumes from the initial machine at epoch 0 and hands out empty
// storage locations, so the session keeps no checkpoints. A restart replays
// the whole input stream.
class DisabledSnapshotManager : public ISnapshotManager {
 public:
  explicit DisabledSnapshotManager(std::string machine_dir);

  Snapshot GetLatest() override;
  Snapshot GetStorageDirectory(uint64_t epoch) override;
  void SetLatest(const Snapshot& snapshot) override;

 private:
  std::string machine_dir_;
};

}  // namespace rollups::snapshot

#endif  // ROLLUPS_SNAPSHOT_DISABLED_SNAPSHOT_MANAGER_HPP_
