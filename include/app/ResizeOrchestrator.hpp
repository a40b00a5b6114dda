#pragma once
#include "app/ICloudVolumeApi.hpp"
#include "model/Volume.hpp"
#include "util/Clock.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace autogrow::app {

struct PollPolicy {
  int attempts{1};
  std::chrono::seconds delay{0};
};

inline constexpr PollPolicy kModificationPoll{30, std::chrono::seconds(60)};
inline constexpr PollPolicy kDeviceSizePoll{12, std::chrono::seconds(5)};

enum class ResizeState {
  Checking,
  ShortCircuitDone,
  ModifyRequested,
  AlreadyModifying,
  Polling,
  Verifying,
  Success,
  Failed,
};

[[nodiscard]] const char* resize_state_name(ResizeState s);

// Request-poll-verify for one volume. Never issues a modify call when the
// volume already has the target size, or while a modification is in flight.
// Cloud errors end the attempt; the next sweep starts over from live state.
class ResizeOrchestrator {
public:
  ResizeOrchestrator(ICloudVolumeApi& api, util::IClock& clock, PollPolicy poll = kModificationPoll)
      : api_(api), clock_(clock), poll_(poll) {}

  [[nodiscard]] model::ResizeOutcome resize(const std::string& volume_id, long long target_gb);

  // States visited by the last resize() call, in order
  [[nodiscard]] const std::vector<ResizeState>& trace() const { return trace_; }

private:
  ResizeState check(const std::string& volume_id, long long target_gb, model::ResizeOutcome& out);
  ResizeState request(const std::string& volume_id, long long target_gb, model::ResizeOutcome& out);
  ResizeState poll(const std::string& volume_id, model::ResizeOutcome& out);
  ResizeState verify(const std::string& volume_id, long long target_gb, model::ResizeOutcome& out);

  ICloudVolumeApi& api_;
  util::IClock& clock_;
  PollPolicy poll_;
  std::vector<ResizeState> trace_;
};

} // namespace autogrow::app
