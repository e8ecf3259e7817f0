#pragma once

#include <cstdint>
#include <string_view>

namespace analysis::model {

/*
  Lifecycle of one delivery attempt.

    Dequeued -> Running -> Succeeded
                        -> FailedTransient -> Requeued -> Dequeued
                                           -> FailedPermanent (retry bound hit)
                        -> FailedPermanent -> Reported
*/
enum class AttemptState : std::uint8_t {
  kDequeued        = 0,
  kRunning         = 1,
  kSucceeded       = 2,
  kFailedTransient = 3,
  kRequeued        = 4,
  kFailedPermanent = 5,
  kReported        = 6,
};

constexpr bool IsTerminal(AttemptState state) {
  return state == AttemptState::kSucceeded || state == AttemptState::kReported;
}

constexpr bool CanTransition(AttemptState from, AttemptState to) {
  switch (from) {
    case AttemptState::kDequeued:
      return to == AttemptState::kRunning;
    case AttemptState::kRunning:
      return to == AttemptState::kSucceeded || to == AttemptState::kFailedTransient || to == AttemptState::kFailedPermanent;
    case AttemptState::kFailedTransient:
      return to == AttemptState::kRequeued || to == AttemptState::kFailedPermanent;
    case AttemptState::kRequeued:
      return to == AttemptState::kDequeued;
    case AttemptState::kFailedPermanent:
      return to == AttemptState::kReported;
    case AttemptState::kSucceeded:
    case AttemptState::kReported:
    default:
      return false;
  }
}

constexpr std::string_view ToString(AttemptState state) {
  switch (state) {
    case AttemptState::kDequeued:
      return "dequeued";
    case AttemptState::kRunning:
      return "running";
    case AttemptState::kSucceeded:
      return "succeeded";
    case AttemptState::kFailedTransient:
      return "failed_transient";
    case AttemptState::kRequeued:
      return "requeued";
    case AttemptState::kFailedPermanent:
      return "failed_permanent";
    case AttemptState::kReported:
      return "reported";
    default:
      return "unknown";
  }
}

} // namespace analysis::model
