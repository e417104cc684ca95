/**
 * @file execution_slots.cpp
 * @brief ExecutionSlots implementation.
 * @author Dimitris Kafetzis
 */

#include "runner/execution_slots.hpp"

#include <algorithm>

namespace code_sandbox {

ExecutionSlots::Slot& ExecutionSlots::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        if (owner_) owner_->release();
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

ExecutionSlots::Slot::~Slot() {
    if (owner_) owner_->release();
}

ExecutionSlots::ExecutionSlots(uint32_t capacity)
    : capacity_(std::max<uint32_t>(capacity, 1)) {}

std::optional<ExecutionSlots::Slot> ExecutionSlots::try_acquire_for(std::chrono::milliseconds wait) {
    std::unique_lock lock(mutex_);
    auto available = [this] { return in_use_ < capacity_; };

    if (wait <= std::chrono::milliseconds::zero()) {
        if (!available()) return std::nullopt;
    } else if (!cv_.wait_for(lock, wait, available)) {
        return std::nullopt;
    }
    return take_locked();
}

std::optional<ExecutionSlots::Slot> ExecutionSlots::acquire(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait(lock, stop, [this] { return in_use_ < capacity_; })) {
        return std::nullopt;
    }
    return take_locked();
}

ExecutionSlots::Slot ExecutionSlots::take_locked() noexcept {
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return Slot(this);
}

void ExecutionSlots::release() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}

uint32_t ExecutionSlots::in_use() const {
    std::lock_guard lock(mutex_);
    return in_use_;
}

uint32_t ExecutionSlots::peak() const {
    std::lock_guard lock(mutex_);
    return peak_;
}

}  // namespace code_sandbox
