#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace meshchat {

/**
 * ThreadManager owns the background threads of a component (poll loops,
 * retry timers) and coordinates their shutdown. Threads sleep through
 * interruptible_wait() so stop() never waits for a full poll interval.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Run `task` on a new tracked thread. Threads whose task has returned
     * are joined first, so long-running owners do not accumulate them.
     * @param task Thread body
     * @param name Label used in log lines
     * @return false if shutdown was requested, the task is not run
     */
    bool add_managed_thread(std::function<void()> task, const std::string& name);

    // Join threads whose task has already returned
    void cleanup_finished_threads();

    // Raise the shutdown flag and release every interruptible_wait()
    void shutdown_all_threads();

    // Blocks until every tracked thread has returned
    void join_all_active_threads();

    // Lower the shutdown flag before starting new threads
    void reset_shutdown();

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

    size_t get_active_thread_count() const;

protected:
    /**
     * Sleep for up to `timeout`
     * @return true if shutdown was requested, false on timeout or wake()
     */
    bool interruptible_wait(std::chrono::milliseconds timeout);

    /**
     * End the current interruptible_wait() early without shutting down
     */
    void wake();

private:
    struct ManagedThread {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::vector<ManagedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;

    std::atomic<bool> shutdown_requested_;
    std::condition_variable wait_cv_;
    std::mutex wait_mutex_;
    bool wake_pending_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace meshchat
