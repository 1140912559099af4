// Repository: Rollups-advance-runner
// Component: Disabled Snapshot Manager
// Purpose: ISnapshotManager used when snapshots are turned off.
// Copyright (c) 2025 Rollups

#include "rollups/snapshot/DisabledSnapshotManager.hpp"

#include <utility>

#include "rollups/util/Logger.hpp"

namespace rollups::snapshot {

DisabledSnapshotManager::DisabledSnapshotManager(std::string machine_dir)
    : machine_dir_(std::move(machine_dir)) {}

Snapshot DisabledSnapshotManager::GetLatest() {
  return Snapshot{machine_dir_, 0};
}

Snapshot DisabledSnapshotManager::GetStorageDirectory(uint64_t epoch) {
  return Snapshot{"", epoch};
}

void DisabledSnapshotManager::SetLatest(const Snapshot& snapshot) {
  util::Logger::Debug("[DisabledSnapshotManager] SET_LATEST_IGNORED epoch=" +
                      std::to_string(snapshot.epoch));
}

}  // namespace rollups::snapshot
