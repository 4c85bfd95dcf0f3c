#pragma once
/** @file  TriggerStateMachine.hpp
 *  @brief Debounce + cooldown FSM deciding when to spray.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>

#include "core/Geometry.hpp"
#include "vision/Detection.hpp"

namespace pfd {
  namespace core {

    enum class TriggerState : std::uint8_t { Idle, Armed, Triggered, Cooldown };

    const char* toString(TriggerState s);

    /// Per-tick output. `shouldTrigger` is true only on the ARMED→TRIGGERED edge.
    struct Decision {
      bool shouldTrigger{ false };
      std::optional<Point2D> target;
    };

    /**
 * @class TriggerStateMachine
 * @brief IDLE → ARMED → TRIGGERED → COOLDOWN → IDLE.
 *
 *  * A tick "counts" when the observation overlaps and DND is active; K
 *    counting ticks in a row arm the machine, which triggers on the same tick.
 *  * TRIGGERED waits for `markDispatched()`; COOLDOWN mutes every trigger until
 *    the cooldown has elapsed, whatever DND does meanwhile.
 *  * Single-threaded: owned and stepped by the Orchestrator only.
 */
    class TriggerStateMachine {
    public:
      using Clock = std::chrono::steady_clock;

      TriggerStateMachine(unsigned minConsecutive, Clock::duration cooldown);

      Decision step(const vision::Observation& obs, bool dndActive, Clock::time_point now);

      /// The sequence for the last trigger ran (successfully or not); start cooldown.
      void markDispatched(Clock::time_point now);

      TriggerState state() const { return state_; }
      unsigned consecutive() const { return consecutive_; }
      unsigned minConsecutive() const { return minConsecutive_; }

      /// Time left in COOLDOWN, zero in any other state.
      Clock::duration cooldownRemaining(Clock::time_point now) const;

    private:
      void transitionTo(TriggerState next);
      void countTick(bool counts);

      unsigned minConsecutive_;
      Clock::duration cooldown_;

      TriggerState state_{ TriggerState::Idle };
      unsigned consecutive_{ 0 };
      Clock::time_point cooldownStart_{};
    };

  } // namespace core
} // namespace pfd
