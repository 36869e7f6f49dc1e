#include <gtest/gtest.h>
#include "threadmanager.h"
#include "test_mocks.h"

#include <atomic>

using namespace meshchat;

TEST(ThreadManagerTest, FinishedThreadsAreJoinedBeforeNewOnes) {
    ThreadManager manager;
    std::atomic<int> runs(0);

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(manager.add_managed_thread([&runs]() { runs++; }, "short-task"));
        EXPECT_LE(manager.get_active_thread_count(), 2u);
        int expected = i + 1;
        ASSERT_TRUE(wait_for_condition([&]() { return runs.load() == expected; }, 1000));
    }
    EXPECT_TRUE(wait_for_condition([&]() {
        manager.cleanup_finished_threads();
        return manager.get_active_thread_count() == 0;
    }, 1000));
    ASSERT_TRUE(manager.add_managed_thread([]() {}, "last"));
    EXPECT_LE(manager.get_active_thread_count(), 1u);
    manager.join_all_active_threads();
    EXPECT_EQ(manager.get_active_thread_count(), 0u);
}

TEST(ThreadManagerTest, NoThreadsAfterShutdown) {
    ThreadManager manager;
    manager.shutdown_all_threads();
    bool ran = false;
    EXPECT_FALSE(manager.add_managed_thread([&ran]() { ran = true; }, "late"));
    manager.join_all_active_threads();
    EXPECT_FALSE(ran);
}
