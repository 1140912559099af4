// Repository: Rollups-advance-runner
// Component: Filesystem Snapshot Manager
// Purpose: Durable ISnapshotManager backed by epoch directories and a
//          "latest" symlink.
// Copyright (c) 2025 Rollups

#include "rollups/snapshot/FsSnapshotManager.hpp"

#include <cerrno>
#include <charconv>
#include <fcntl.h>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

#include "rollups/util/Logger.hpp"

namespace rollups::snapshot {

namespace fs = std::filesystem;
using util::Logger;

namespace {

std::string Reason(const std::error_code& ec) {
  return ec.message() + " (errno=" + std::to_string(ec.value()) + ")";
}

// Flushes the directory entry so the renamed link survives a crash.
void SyncDirectory(const fs::path& dir) {
  const std::string name = dir.empty() ? std::string(".") : dir.string();
  const int fd = ::open(name.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot open " + name + " for sync: " +
                            Reason(std::error_code(errno, std::generic_category())));
  }
  const int rc = ::fsync(fd);
  const int sync_errno = errno;
  ::close(fd);
  if (rc != 0) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot sync " + name + ": " +
                            Reason(std::error_code(sync_errno, std::generic_category())));
  }
}

}  // namespace

FsSnapshotManager::FsSnapshotManager(std::string snapshot_dir, std::string latest_link)
    : snapshot_dir_(std::move(snapshot_dir)), latest_link_(std::move(latest_link)) {
  if (latest_link_.empty()) {
    latest_link_ = (fs::path(snapshot_dir_) / kDefaultLatestName).string();
  }
}

std::optional<uint64_t> FsSnapshotManager::ParseEpoch(const std::string& name) {
  if (name.empty()) return std::nullopt;
  for (char c : name) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  uint64_t epoch = 0;
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), epoch);
  if (ec != std::errc() || ptr != name.data() + name.size()) return std::nullopt;
  return epoch;
}

std::string FsSnapshotManager::ResolveLatestTarget() const {
  std::error_code ec;
  const fs::file_status status = fs::symlink_status(latest_link_, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return "";
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot stat latest link " + latest_link_ + ": " + Reason(ec));
  }
  if (!fs::exists(status)) return "";
  if (!fs::is_symlink(status)) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "latest link " + latest_link_ + " is not a symlink");
  }

  fs::path target = fs::read_symlink(latest_link_, ec);
  if (ec) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot read latest link " + latest_link_ + ": " + Reason(ec));
  }
  if (target.is_relative()) {
    target = fs::path(latest_link_).parent_path() / target;
  }
  return target.lexically_normal().string();
}

Snapshot FsSnapshotManager::GetLatest() {
  const std::string target = ResolveLatestTarget();
  if (target.empty()) {
    throw SnapshotError(SnapshotError::Code::kNotFound,
                        "no latest snapshot at " + latest_link_);
  }

  const fs::path target_path(target);
  std::optional<uint64_t> epoch = ParseEpoch(target_path.filename().string());
  if (!epoch) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "latest snapshot " + target + " is not named after an epoch");
  }

  std::error_code ec;
  if (!fs::is_directory(target_path, ec)) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "latest snapshot directory " + target + " is missing");
  }
  return Snapshot{target, *epoch};
}

Snapshot FsSnapshotManager::GetStorageDirectory(uint64_t epoch) {
  std::error_code ec;
  fs::create_directories(snapshot_dir_, ec);
  if (ec) {
    throw SnapshotError(SnapshotError::Code::kAllocationFailed,
                        "cannot create snapshot dir " + snapshot_dir_ + ": " + Reason(ec));
  }

  const fs::path path =
      fs::absolute(fs::path(snapshot_dir_) / std::to_string(epoch), ec).lexically_normal();
  if (ec) {
    throw SnapshotError(SnapshotError::Code::kAllocationFailed,
                        "cannot resolve snapshot dir " + snapshot_dir_ + ": " + Reason(ec));
  }
  if (fs::exists(path, ec)) {
    // The link may be relative to a relative snapshot dir, so compare inodes.
    const std::string latest = ResolveLatestTarget();
    std::error_code same_ec;
    if (!latest.empty() && fs::equivalent(latest, path, same_ec)) {
      throw SnapshotError(SnapshotError::Code::kAllocationFailed,
                          "refusing to reuse latest snapshot " + path.string());
    }
    fs::remove_all(path, ec);
    if (ec) {
      throw SnapshotError(SnapshotError::Code::kAllocationFailed,
                          "cannot remove stale snapshot " + path.string() + ": " + Reason(ec));
    }
    Logger::Warn("[FsSnapshotManager] STALE_SNAPSHOT_REMOVED path=" + path.string());
  } else if (ec) {
    throw SnapshotError(SnapshotError::Code::kAllocationFailed,
                        "cannot stat " + path.string() + ": " + Reason(ec));
  }
  return Snapshot{path.string(), epoch};
}

void FsSnapshotManager::SetLatest(const Snapshot& snapshot) {
  std::error_code ec;
  if (!fs::is_directory(snapshot.path, ec)) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "snapshot directory " + snapshot.path + " was not written");
  }

  const fs::path target = fs::absolute(snapshot.path, ec).lexically_normal();
  if (ec) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot resolve " + snapshot.path + ": " + Reason(ec));
  }

  // Same directory as the link so the rename stays on one filesystem.
  const std::string tmp_link =
      latest_link_ + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  fs::remove(tmp_link, ec);
  if (ec) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot clear leftover link " + tmp_link + ": " + Reason(ec));
  }

  fs::create_directory_symlink(target, tmp_link, ec);
  if (ec) {
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot create link " + tmp_link + ": " + Reason(ec));
  }
  fs::rename(tmp_link, latest_link_, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(tmp_link, cleanup_ec);
    throw SnapshotError(SnapshotError::Code::kStoreUnavailable,
                        "cannot replace latest link " + latest_link_ + ": " + Reason(ec));
  }
  SyncDirectory(fs::path(latest_link_).parent_path());

  std::ostringstream oss;
  oss << "[FsSnapshotManager] LATEST_SET epoch=" << snapshot.epoch
      << " path=" << target.string();
  Logger::Info(oss.str());

  PruneExcept(snapshot.epoch);
}

void FsSnapshotManager::PruneExcept(uint64_t keep_epoch) {
  std::error_code ec;
  fs::directory_iterator it(snapshot_dir_, ec);
  if (ec) {
    Logger::Warn("[FsSnapshotManager] PRUNE_SKIPPED dir=" + snapshot_dir_ + " error=" + Reason(ec));
    return;
  }

  std::vector<fs::path> stale;
  for (const fs::directory_entry& entry : it) {
    std::optional<uint64_t> epoch = ParseEpoch(entry.path().filename().string());
    if (!epoch || *epoch == keep_epoch) continue;

    std::error_code entry_ec;
    const fs::file_status status = entry.symlink_status(entry_ec);
    if (entry_ec || !fs::is_directory(status)) continue;
    stale.push_back(entry.path());
  }

  for (const fs::path& path : stale) {
    std::error_code remove_ec;
    fs::remove_all(path, remove_ec);
    if (remove_ec) {
      Logger::Warn("[FsSnapshotManager] PRUNE_FAILED path=" + path.string() +
                   " error=" + Reason(remove_ec));
    } else {
      Logger::Debug("[FsSnapshotManager] PRUNED path=" + path.string());
    }
  }
}

}  // namespace rollups::snapshot
