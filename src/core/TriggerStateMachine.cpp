/* @file TriggerStateMachine.cpp
 * @brief debounce (K consecutive ticks) and cooldown hard-mute
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include "core/TriggerStateMachine.hpp"

namespace pfd {
  namespace core {

    const char* toString(TriggerState s) {
      switch (s) {
      case TriggerState::Idle:
        return "IDLE";
      case TriggerState::Armed:
        return "ARMED";
      case TriggerState::Triggered:
        return "TRIGGERED";
      case TriggerState::Cooldown:
        return "COOLDOWN";
      default:
        return "UNKNOWN";
      }
    }

    TriggerStateMachine::TriggerStateMachine(unsigned minConsecutive, Clock::duration cooldown)
        : minConsecutive_(minConsecutive), cooldown_(cooldown) {
      if (minConsecutive_ == 0)
        throw std::invalid_argument("[TriggerStateMachine] minConsecutive must be >= 1");
      if (cooldown_ < Clock::duration::zero())
        throw std::invalid_argument("[TriggerStateMachine] cooldown must be non-negative");
    }

    void TriggerStateMachine::transitionTo(TriggerState next) { state_ = next; }

    void TriggerStateMachine::countTick(bool counts) { consecutive_ = counts ? consecutive_ + 1 : 0; }

    Decision TriggerStateMachine::step(const vision::Observation& obs, bool dndActive,
                                       Clock::time_point now) {
      const bool counts = obs.overlapping && dndActive;

      if (state_ == TriggerState::Cooldown) {
        if (now - cooldownStart_ < cooldown_) {
          countTick(counts); // consumed, never acted on
          return {};
        }
        transitionTo(TriggerState::Idle);
      }

      switch (state_) {
      case TriggerState::Triggered:
        // decision made, dispatch still outstanding: nothing new may fire
        countTick(counts);
        return {};

      case TriggerState::Idle:
        countTick(counts);
        if (consecutive_ < minConsecutive_)
          return {};
        transitionTo(TriggerState::Armed);
        [[fallthrough]];

      case TriggerState::Armed:
        if (!counts) {
          consecutive_ = 0;
          transitionTo(TriggerState::Idle);
          return {};
        }
        transitionTo(TriggerState::Triggered);
        return Decision{ true, obs.target };

      default:
        return {};
      }
    }

    void TriggerStateMachine::markDispatched(Clock::time_point now) {
      if (state_ != TriggerState::Triggered)
        return;
      consecutive_ = 0;
      cooldownStart_ = now;
      transitionTo(TriggerState::Cooldown);
    }

    TriggerStateMachine::Clock::duration
    TriggerStateMachine::cooldownRemaining(Clock::time_point now) const {
      if (state_ != TriggerState::Cooldown)
        return Clock::duration::zero();
      const auto left = cooldown_ - (now - cooldownStart_);
      return left > Clock::duration::zero() ? left : Clock::duration::zero();
    }

  } // namespace core
} // namespace pfd
