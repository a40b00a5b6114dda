#include "app/ResizeOrchestrator.hpp"
#include "util/Log.hpp"

namespace autogrow::app {

const char* resize_state_name(ResizeState s) {
  switch (s) {
    case ResizeState::Checking: return "checking";
    case ResizeState::ShortCircuitDone: return "short-circuit";
    case ResizeState::ModifyRequested: return "modify-requested";
    case ResizeState::AlreadyModifying: return "already-modifying";
    case ResizeState::Polling: return "polling";
    case ResizeState::Verifying: return "verifying";
    case ResizeState::Success: return "success";
    case ResizeState::Failed: return "failed";
  }
  return "unknown";
}

static ResizeState fail(model::ResizeOutcome& out, util::Errc code, std::string message) {
  out.success = false;
  out.error = util::Error{code, std::move(message)};
  util::log_error("Resize", "%s", out.error.message.c_str());
  return ResizeState::Failed;
}

model::ResizeOutcome ResizeOrchestrator::resize(const std::string& volume_id, long long target_gb) {
  model::ResizeOutcome out;
  trace_.clear();
  ResizeState state = ResizeState::Checking;
  while (true) {
    trace_.push_back(state);
    switch (state) {
      case ResizeState::Checking:
        state = check(volume_id, target_gb, out);
        break;
      case ResizeState::ShortCircuitDone:
        out.final_size_gb = target_gb;
        state = ResizeState::Success;
        break;
      case ResizeState::ModifyRequested:
        state = request(volume_id, target_gb, out);
        break;
      case ResizeState::AlreadyModifying:
        util::log_info("Resize", "Volume %s is already being modified. Waiting for completion...", volume_id.c_str());
        state = ResizeState::Polling;
        break;
      case ResizeState::Polling:
        state = poll(volume_id, out);
        break;
      case ResizeState::Verifying:
        state = verify(volume_id, target_gb, out);
        break;
      case ResizeState::Success:
        out.success = true;
        return out;
      case ResizeState::Failed:
        return out;
    }
  }
}

ResizeState ResizeOrchestrator::check(const std::string& volume_id, long long target_gb, model::ResizeOutcome& out) {
  auto desc = api_.describe_volume(volume_id);
  if (!desc) return fail(out, util::Errc::TransientPerVolume, "Error resizing volume " + volume_id + ": " + desc.message());

  util::log_info("Resize", "Volume %s current state: size=%lldGB, state=%s", volume_id.c_str(), desc->size_gb,
                 desc->state.c_str());
  if (desc->size_gb == target_gb && desc->state == "in-use") {
    util::log_info("Resize", "Volume %s is already at desired size %lldGB and in stable state", volume_id.c_str(),
                   target_gb);
    return ResizeState::ShortCircuitDone;
  }
  if (desc->size_gb != target_gb && desc->state != "modifying") {
    util::log_info("Resize", "Volume %s needs resize: current=%lldGB, target=%lldGB", volume_id.c_str(),
                   desc->size_gb, target_gb);
    return ResizeState::ModifyRequested;
  }
  return ResizeState::AlreadyModifying;
}

ResizeState ResizeOrchestrator::request(const std::string& volume_id, long long target_gb, model::ResizeOutcome& out) {
  auto st = api_.modify_volume(volume_id, target_gb);
  out.requested = true;
  if (!st) return fail(out, util::Errc::TransientPerVolume, "Failed to initiate volume resize for " + volume_id + ": " + st.message());
  util::log_info("Resize", "Volume modification request accepted for %s. Waiting for completion...", volume_id.c_str());
  return ResizeState::Polling;
}

ResizeState ResizeOrchestrator::poll(const std::string& volume_id, model::ResizeOutcome& out) {
  for (int attempt = 1; attempt <= poll_.attempts; ++attempt) {
    auto mod = api_.describe_modification(volume_id);
    if (!mod) {
      return fail(out, util::Errc::TransientPerVolume,
                  "Error checking volume modification status for " + volume_id + ": " + mod.message());
    }
    if (mod->state == "completed") {
      util::log_info("Resize", "Volume %s modification completed. Verifying final size...", volume_id.c_str());
      return ResizeState::Verifying;
    }
    if (mod->state == "failed") {
      return fail(out, util::Errc::TransientPerVolume,
                  "Volume " + volume_id + " modification failed: " + (mod->message.empty() ? "Unknown error" : mod->message));
    }
    util::log_info("Resize", "Volume %s modification %s (attempt %d/%d)", volume_id.c_str(), mod->state.c_str(),
                   attempt, poll_.attempts);
    if (attempt < poll_.attempts) clock_.sleep_for(poll_.delay);
  }
  return fail(out, util::Errc::PollTimeout,
              "Volume " + volume_id + " modification did not complete within " +
              std::to_string(poll_.attempts * poll_.delay.count()) + " seconds");
}

ResizeState ResizeOrchestrator::verify(const std::string& volume_id, long long target_gb, model::ResizeOutcome& out) {
  auto desc = api_.describe_volume(volume_id);
  if (!desc) return fail(out, util::Errc::TransientPerVolume, "Error verifying volume " + volume_id + ": " + desc.message());

  out.final_size_gb = desc->size_gb;
  if (desc->size_gb == target_gb) {
    util::log_info("Resize", "Volume %s successfully resized to %lldGB", volume_id.c_str(), target_gb);
    return ResizeState::Success;
  }
  if (desc->size_gb > target_gb) {
    util::log_info("Resize", "Volume %s is now at %lldGB, larger than the desired %lldGB. No action needed.",
                   volume_id.c_str(), desc->size_gb, target_gb);
    return ResizeState::Success;
  }
  return fail(out, util::Errc::TransientPerVolume,
              "Volume " + volume_id + " modification completed but size " + std::to_string(desc->size_gb) +
              "GB is below desired size " + std::to_string(target_gb) + "GB");
}

} // namespace autogrow::app
