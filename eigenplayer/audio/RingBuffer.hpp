#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <vector>

namespace EigenPlayer {

/**
 * @brief Lock-free single-producer/single-consumer ring buffer
 *
 * Holds exactly Capacity() elements. TryPush is only called from the
 * producer thread, TryPop and Clear only from the consumer thread.
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : m_slots(capacity + 1) {
    }

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * @brief Append one element
     * @return false if the buffer is full
     */
    bool TryPush(const T& value) {
        const size_t head = m_head.load(std::memory_order_relaxed);
        const size_t next = Advance(head);
        if (next == m_tail.load(std::memory_order_acquire)) {
            return false;
        }
        m_slots[head] = value;
        m_head.store(next, std::memory_order_release);
        return true;
    }

    /**
     * @brief Remove the oldest element
     * @return std::nullopt if the buffer is empty
     */
    std::optional<T> TryPop() {
        const size_t tail = m_tail.load(std::memory_order_relaxed);
        if (tail == m_head.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        T value = m_slots[tail];
        m_tail.store(Advance(tail), std::memory_order_release);
        return value;
    }

    /**
     * @brief Append as many elements as fit
     * @return Number of elements written
     */
    size_t PushBulk(const T* values, size_t count) {
        size_t written = 0;
        while (written < count && TryPush(values[written])) {
            ++written;
        }
        return written;
    }

    /**
     * @brief Drop everything currently queued
     */
    void Clear() {
        m_tail.store(m_head.load(std::memory_order_acquire), std::memory_order_release);
    }

    [[nodiscard]] size_t Size() const {
        const size_t head = m_head.load(std::memory_order_acquire);
        const size_t tail = m_tail.load(std::memory_order_acquire);
        return head >= tail ? head - tail : head + m_slots.size() - tail;
    }

    [[nodiscard]] size_t Capacity() const { return m_slots.size() - 1; }
    [[nodiscard]] bool IsEmpty() const { return Size() == 0; }
    [[nodiscard]] bool IsFull() const { return Size() == Capacity(); }

private:
    size_t Advance(size_t index) const {
        return index + 1 == m_slots.size() ? 0 : index + 1;
    }

    std::vector<T> m_slots;
    alignas(64) std::atomic<size_t> m_head{0};  // Written by producer
    alignas(64) std::atomic<size_t> m_tail{0};  // Written by consumer
};

} // namespace EigenPlayer
