#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace BACN::Core {

// Serial dispatch queue backed by one worker thread. Work items run in
// due-time order, FIFO among items due at the same instant.
class Scheduler {
public:
    explicit Scheduler(std::string name = "scheduler");
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void DispatchAsync(std::function<void()> work);
    void DispatchAfter(std::chrono::milliseconds delay, std::function<void()> work);

    // Runs work on the queue and waits for it. Returns without running it once
    // the scheduler is shut down.
    void DispatchSync(const std::function<void()>& work);

    // Blocks until every item queued before the call (including delayed ones) ran.
    void Drain();

    // Stops accepting work, drops pending items, joins the worker.
    void Shutdown();

    [[nodiscard]] bool IsCurrentThread() const;
    [[nodiscard]] const std::string& Name() const { return name_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Item {
        Clock::time_point due;
        uint64_t seq;
        std::function<void()> work;
    };

    struct Later {
        bool operator()(const Item& a, const Item& b) const {
            return a.due != b.due ? a.due > b.due : a.seq > b.seq;
        }
    };

    void Run();
    // false once Shutdown() started; the work item is dropped.
    bool Enqueue(Clock::time_point due, std::function<void()> work);

    std::string name_;
    mutable std::mutex lock_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Later> queue_;
    uint64_t nextSeq_{0};
    bool stopping_{false};
    std::thread worker_;
};

} // namespace BACN::Core
