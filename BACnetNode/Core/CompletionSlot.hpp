#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace BACN::Core {

/**
 * @brief Single-shot completion channel between a callback thread and one waiter.
 *
 * The first Deliver() wins; every later one is dropped and reports false.
 * Shared via shared_ptr so a late transport callback can outlive the waiter.
 */
template <typename T>
class CompletionSlot {
public:
    CompletionSlot() = default;
    CompletionSlot(const CompletionSlot&) = delete;
    CompletionSlot& operator=(const CompletionSlot&) = delete;

    static std::shared_ptr<CompletionSlot> Make() { return std::make_shared<CompletionSlot>(); }

    /// @return true if this call completed the slot.
    bool Deliver(T value) {
        {
            std::lock_guard<std::mutex> guard(lock_);
            if (value_) {
                return false;
            }
            value_.emplace(std::move(value));
        }
        cv_.notify_all();
        return true;
    }

    [[nodiscard]] bool IsComplete() const {
        std::lock_guard<std::mutex> guard(lock_);
        return value_.has_value();
    }

    T Wait() {
        std::unique_lock<std::mutex> guard(lock_);
        cv_.wait(guard, [this] { return value_.has_value(); });
        return *value_;
    }

    /// @return the delivered value, or nullopt if nothing arrived before the deadline.
    std::optional<T> WaitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> guard(lock_);
        if (!cv_.wait_for(guard, timeout, [this] { return value_.has_value(); })) {
            return std::nullopt;
        }
        return value_;
    }

private:
    mutable std::mutex lock_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

} // namespace BACN::Core
