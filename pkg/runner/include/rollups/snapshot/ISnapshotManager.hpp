// Repository: Rollups-advance-runner
// Component: ISnapshotManager Interface
// Purpose: Capability to read, allocate and persist compute-session snapshots.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_SNAPSHOT_ISNAPSHOT_MANAGER_HPP_
#define ROLLUPS_SNAPSHOT_ISNAPSHOT_MANAGER_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

#include "rollups/runner/Types.hpp"

namespace rollups::snapshot {

class SnapshotError : public std::runtime_error {
 public:
  enum class Code {
    kStoreUnavailable,
    kNotFound,          // No latest snapshot yet (first run)
    kAllocationFailed,
  };

  SnapshotError(Code code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  Code code() const { return code_; }

 private:
  Code code_;
};

const char* SnapshotErrorCodeName(SnapshotError::Code code);

// ISnapshotManager owns the "latest snapshot" pointer.
//
// The runner only handles Snapshot values: it reads the latest one once at
// startup and, at each epoch finish, allocates a location for the next epoch
// and publishes it as latest after the compute session wrote to it.
//
// Implementations report failures by throwing SnapshotError.
class ISnapshotManager {
 public:
  virtual ~ISnapshotManager() = default;

  // Snapshot the session should resume from.
  virtual Snapshot GetLatest() = 0;

  // Fresh, writable location tagged with `epoch`.
  virtual Snapshot GetStorageDirectory(uint64_t epoch) = 0;

  // Atomically replaces the latest pointer.
  virtual void SetLatest(const Snapshot& snapshot) = 0;
};

}  // namespace rollups::snapshot

#endif  // ROLLUPS_SNAPSHOT_ISNAPSHOT_MANAGER_HPP_
