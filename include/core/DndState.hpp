#pragma once
/** @file  DndState.hpp
 *  @brief Thread-safe do-not-disturb flag shared by control plane & loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <mutex>
#include <optional>

namespace pfd {
  namespace core {

    /// Snapshot of the flag; both fields always come from the same write.
    struct DndStatus {
      bool active{ false };
      std::chrono::system_clock::time_point lastUpdated{};
    };

    /**
 * @class DndProvider
 * @brief Read side as the Orchestrator sees it.
 *
 *  * `read()` returns std::nullopt while the control plane is unreachable.
 */
    class DndProvider {
    public:
      virtual ~DndProvider() = default;
      virtual std::optional<DndStatus> read() = 0;
    };

    /** @class DndState
 *  @brief Lock-protected {flag, timestamp} cell, owned by main and passed by
 *         reference to the ControlPlane (writer) and the Orchestrator (reader).
 *
 *  * Every access is a single short critical section; there is no
 *    read-modify-write a reader could observe half done.
 */
    class DndState : public DndProvider {

    public:
      DndState() : status_{ false, std::chrono::system_clock::now() } {}
      ~DndState() override = default;

      /// Idempotent: refreshes the timestamp, the value only changes if it differs.
      void set(bool active);

      /// Thread-safe snapshot.
      DndStatus get() const;

      /// In-process cell: always reachable.
      std::optional<DndStatus> read() override { return get(); }

    private:
      mutable std::mutex mtx_;
      DndStatus status_;
    };

  } // namespace core
} // namespace pfd
