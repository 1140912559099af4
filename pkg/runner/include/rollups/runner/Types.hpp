// Repository: Rollups-advance-runner
// Component: Runner Data Model
// Purpose: Input events, snapshots and claims exchanged between the runner and
//          its collaborators.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_RUNNER_TYPES_HPP_
#define ROLLUPS_RUNNER_TYPES_HPP_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rollups {

// Parent id of the very first event of an input stream.
inline constexpr char kInitialEventId[] = "0";

// Identifies which rollup application the streams belong to.
struct DAppMetadata {
  uint64_t chain_id = 0;
  std::vector<uint8_t> dapp_address;  // 20 bytes
};

// Opaque to the runner; forwarded verbatim to the compute session.
struct InputMetadata {
  std::vector<uint8_t> msg_sender;
  uint64_t block_number = 0;
  uint64_t timestamp = 0;
  uint64_t epoch_index = 0;
  uint64_t input_index = 0;
};

struct AdvanceStateInput {
  InputMetadata metadata;
  std::vector<uint8_t> payload;
};

// Marks the end of the current epoch.
struct FinishEpoch {};

// Closed set of input kinds. Dispatch with std::visit so that adding a kind
// fails to compile until every visitor handles it.
using EventData = std::variant<AdvanceStateInput, FinishEpoch>;

struct EventPayload {
  uint64_t epoch_index = 0;
  // Inputs sent so far across the whole stream, including this one.
  uint64_t inputs_sent_count = 0;
  std::string parent_id;
  EventData data;
};

struct Event {
  std::string id;
  EventPayload payload;
};

// Compute-session checkpoint: the state as of having just started `epoch`.
struct Snapshot {
  std::string path;
  uint64_t epoch = 0;

  bool operator==(const Snapshot& other) const {
    return path == other.path && epoch == other.epoch;
  }
  bool operator!=(const Snapshot& other) const { return !(*this == other); }
};

struct EpochClaim {
  uint64_t epoch_index = 0;
  std::vector<uint8_t> epoch_hash;
};

// "advance_state" or "finish_epoch".
const char* EventDataName(const EventData& data);

// Lowercase hex with 0x prefix.
std::string ToHex(const std::vector<uint8_t>& bytes);

// Parses an optional 0x-prefixed hex string. Returns false on odd length or
// non-hex characters.
bool FromHex(const std::string& hex, std::vector<uint8_t>* out);

// One-line description for logs: id, parent, epoch, count and kind.
std::string Describe(const Event& event);
std::string Describe(const Snapshot& snapshot);

}  // namespace rollups

#endif  // ROLLUPS_RUNNER_TYPES_HPP_
