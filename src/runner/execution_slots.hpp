/**
 * @file execution_slots.hpp
 * @brief Counting semaphore bounding concurrent sandbox processes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace code_sandbox {

/**
 * @brief Shared execution ceiling.
 *
 * Every sandbox launch holds a Slot for its whole lifetime; the Slot gives
 * the capacity back in its destructor, so every exit path releases it.
 */
class ExecutionSlots {
public:
    class Slot {
    public:
        Slot(Slot&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Slot& operator=(Slot&& other) noexcept;
        ~Slot();

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        friend class ExecutionSlots;
        explicit Slot(ExecutionSlots* owner) noexcept : owner_(owner) {}

        ExecutionSlots* owner_;
    };

    explicit ExecutionSlots(uint32_t capacity);

    ExecutionSlots(const ExecutionSlots&) = delete;
    ExecutionSlots& operator=(const ExecutionSlots&) = delete;

    /// Wait at most `wait` for a free slot; zero means a single attempt.
    [[nodiscard]] std::optional<Slot> try_acquire_for(std::chrono::milliseconds wait);

    /// Block until a slot frees; nullopt only when `stop` is requested first.
    [[nodiscard]] std::optional<Slot> acquire(std::stop_token stop);

    [[nodiscard]] uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint32_t in_use() const;
    [[nodiscard]] uint32_t peak() const;

private:
    void release() noexcept;
    Slot take_locked() noexcept;

    const uint32_t capacity_;
    uint32_t in_use_{0};
    uint32_t peak_{0};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace code_sandbox
