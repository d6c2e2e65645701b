#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "Core/CompletionSlot.hpp"

using BACN::Core::CompletionSlot;
using namespace std::chrono_literals;

TEST(CompletionSlot, FirstDeliveryWins) {
    auto slot = CompletionSlot<std::string>::Make();

    EXPECT_FALSE(slot->IsComplete());
    EXPECT_TRUE(slot->Deliver("ack"));
    EXPECT_FALSE(slot->Deliver("timeout"));

    EXPECT_TRUE(slot->IsComplete());
    EXPECT_EQ(slot->Wait(), "ack");
}

TEST(CompletionSlot, WaitForReturnsNulloptWhenNothingArrives) {
    auto slot = CompletionSlot<int>::Make();
    EXPECT_FALSE(slot->WaitFor(10ms).has_value());
    EXPECT_FALSE(slot->IsComplete());
}

TEST(CompletionSlot, DeliveryFromAnotherThreadWakesWaiter) {
    auto slot = CompletionSlot<int>::Make();

    std::thread producer([slot] {
        std::this_thread::sleep_for(5ms);
        slot->Deliver(42);
    });

    auto value = slot->WaitFor(2s);
    producer.join();

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
}

TEST(CompletionSlot, LateDeliveryAfterWaiterLeftIsDropped) {
    auto slot = CompletionSlot<int>::Make();
    std::weak_ptr<CompletionSlot<int>> weak = slot;

    // Waiter gives up and fills the slot itself, as the request guard does.
    EXPECT_FALSE(slot->WaitFor(1ms).has_value());
    EXPECT_TRUE(slot->Deliver(-1));

    // A callback still holding the slot loses the race.
    auto held = weak.lock();
    ASSERT_NE(held, nullptr);
    EXPECT_FALSE(held->Deliver(7));
    EXPECT_EQ(slot->Wait(), -1);
}
