/* @file DndState.cpp
 * @brief do-not-disturb cell
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/DndState.hpp"

using namespace pfd::core;

void DndState::set(bool active) {
  const auto now = std::chrono::system_clock::now();
  std::lock_guard<std::mutex> lock(mtx_);
  status_ = DndStatus{ active, now };
}

DndStatus DndState::get() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return status_;
}
