#include "Scheduler.hpp"

#include <future>
#include <memory>
#include <utility>

#include "../Logging/Logging.hpp"

namespace BACN::Core {

Scheduler::Scheduler(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread([this] { Run(); });
}

Scheduler::~Scheduler() {
    Shutdown();
}

void Scheduler::DispatchAsync(std::function<void()> work) {
    Enqueue(Clock::now(), std::move(work));
}

void Scheduler::DispatchAfter(std::chrono::milliseconds delay, std::function<void()> work) {
    Enqueue(Clock::now() + delay, std::move(work));
}

void Scheduler::DispatchSync(const std::function<void()>& work) {
    if (IsCurrentThread()) {
        // Re-entrant call would deadlock; run inline.
        work();
        return;
    }
    // Shared so a dropped item breaks the promise and releases the waiter.
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!Enqueue(Clock::now(), [&work, done] {
            work();
            done->set_value();
        })) {
        return;
    }
    future.wait();
}

void Scheduler::Drain() {
    if (IsCurrentThread()) {
        return;
    }
    Clock::time_point latest = Clock::now();
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (stopping_) {
            return;
        }
        // Copy out the latest due time; delayed items must also have run.
        auto copy = queue_;
        while (!copy.empty()) {
            if (copy.top().due > latest) {
                latest = copy.top().due;
            }
            copy.pop();
        }
    }
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!Enqueue(latest, [done] { done->set_value(); })) {
        return;
    }
    future.wait();
}

void Scheduler::Shutdown() {
    {
        // Destroying the pending items wakes DispatchSync() and Drain() waiters.
        decltype(queue_) dropped;
        std::lock_guard<std::mutex> guard(lock_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        dropped.swap(queue_);
    }
    cv_.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    if (IsCurrentThread()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool Scheduler::IsCurrentThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

bool Scheduler::Enqueue(Clock::time_point due, std::function<void()> work) {
    {
        std::lock_guard<std::mutex> guard(lock_);
        if (stopping_) {
            BACN_LOG_RL(Node, "scheduler/stopped", 1000, spdlog::level::warn,
                        "%s: dropping work item after shutdown", name_);
            return false;
        }
        queue_.push(Item{due, nextSeq_++, std::move(work)});
    }
    cv_.notify_all();
    return true;
}

void Scheduler::Run() {
    std::unique_lock<std::mutex> guard(lock_);
    while (true) {
        if (stopping_) {
            break;
        }
        if (queue_.empty()) {
            cv_.wait(guard);
            continue;
        }
        const auto due = queue_.top().due;
        if (due > Clock::now()) {
            cv_.wait_until(guard, due);
            continue;
        }
        auto work = std::move(const_cast<Item&>(queue_.top()).work);
        queue_.pop();
        guard.unlock();
        work();
        guard.lock();
    }
}

} // namespace BACN::Core
