// Repository: Rollups-advance-runner
// Component: Runner Data Model
// Purpose: Formatting helpers for events, snapshots and byte strings.
// Copyright (c) 2025 Rollups

#include "rollups/runner/Types.hpp"

#include <sstream>
#include <utility>

namespace rollups {

namespace {

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

const char* EventDataName(const EventData& data) {
  return std::holds_alternative<FinishEpoch>(data) ? "finish_epoch" : "advance_state";
}

std::string ToHex(const std::vector<uint8_t>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out = "0x";
  out.reserve(2 + bytes.size() * 2);
  for (uint8_t b : bytes) {
    out += kDigits[b >> 4];
    out += kDigits[b & 0x0f];
  }
  return out;
}

bool FromHex(const std::string& hex, std::vector<uint8_t>* out) {
  size_t start = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    start = 2;
  }
  if ((hex.size() - start) % 2 != 0) return false;

  std::vector<uint8_t> bytes;
  bytes.reserve((hex.size() - start) / 2);
  for (size_t i = start; i < hex.size(); i += 2) {
    int hi = HexDigitValue(hex[i]);
    int lo = HexDigitValue(hex[i + 1]);
    if (hi < 0 || lo < 0) return false;
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  *out = std::move(bytes);
  return true;
}

std::string Describe(const Event& event) {
  std::ostringstream oss;
  oss << "id=" << event.id
      << " parent_id=" << event.payload.parent_id
      << " epoch_index=" << event.payload.epoch_index
      << " inputs_sent_count=" << event.payload.inputs_sent_count
      << " kind=" << EventDataName(event.payload.data);
  if (const auto* input = std::get_if<AdvanceStateInput>(&event.payload.data)) {
    oss << " payload_bytes=" << input->payload.size();
  }
  return oss.str();
}

std::string Describe(const Snapshot& snapshot) {
  std::ostringstream oss;
  oss << "path=" << (snapshot.path.empty() ? "<none>" : snapshot.path)
      << " epoch=" << snapshot.epoch;
  return oss.str();
}

}  // namespace rollups
