#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO used to hand log events to the writer thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace pfd {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Bounded queue that overwrites its oldest entry when full.
 *
 *  * Storage is allocated once at construction; push/pop never allocate.
 *  * Not synchronised. The owner (Logger) guards it with its own mutex.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity > 0 ? capacity : 1) {}

      /// Enqueue \p value. Returns false if the oldest entry had to be dropped.
      bool push(T value) {
        bool kept = true;
        if (size_ == slots_.size()) {
          head_ = (head_ + 1) % slots_.size();
          --size_;
          kept = false;
        }
        slots_[(head_ + size_) % slots_.size()] = std::move(value);
        ++size_;
        return kept;
      }

      std::optional<T> pop() {
        if (size_ == 0)
          return std::nullopt;
        T value = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return value;
      }

      bool empty() const { return size_ == 0; }
      std::size_t size() const { return size_; }
      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
    };

  } // namespace core
} // namespace pfd
