// Repository: Rollups-advance-runner
// Component: IBroker Interface
// Purpose: Event-log capability: parent-linked input stream plus claims stream.
// Copyright (c) 2025 Rollups

#ifndef ROLLUPS_BROKER_IBROKER_HPP_
#define ROLLUPS_BROKER_IBROKER_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

#include "rollups/runner/Types.hpp"

namespace rollups::broker {

class BrokerError : public std::runtime_error {
 public:
  enum class Code {
    kLogUnavailable,
    kNotFound,
    kDuplicateClaim,
    kCancelled,  // Blocking read interrupted by shutdown
  };

  BrokerError(Code code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  Code code() const { return code_; }

 private:
  Code code_;
};

const char* BrokerErrorCodeName(BrokerError::Code code);

// IBroker is the runner's view of the event log.
//
// Inputs form a singly-linked chain: each event's parent_id is the id of the
// event before it (kInitialEventId for the first one). The runner never
// stores a stream cursor; it re-derives its position from the snapshot epoch
// through FindPreviousFinishEpoch.
//
// Implementations report failures by throwing BrokerError.
class IBroker {
 public:
  virtual ~IBroker() = default;

  // Id of the finish-epoch event that precedes resuming into `epoch`, that is
  // the event closing epoch - 1. kInitialEventId when epoch is 0.
  virtual std::string FindPreviousFinishEpoch(uint64_t epoch) = 0;

  // Next event after `after_id`. Blocks until one is appended.
  virtual Event ConsumeInput(const std::string& after_id) = 0;

  virtual bool WasClaimProduced(uint64_t epoch) = 0;

  virtual void ProduceRollupsClaim(uint64_t epoch, const EpochClaim& claim) = 0;
};

}  // namespace rollups::broker

#endif  // ROLLUPS_BROKER_IBROKER_HPP_
