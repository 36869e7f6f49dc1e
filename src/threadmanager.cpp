#include "threadmanager.h"

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace meshchat {

ThreadManager::ThreadManager() : shutdown_requested_(false), wake_pending_(false) {
}

ThreadManager::~ThreadManager() {
    shutdown_all_threads();
    join_all_active_threads();
}

bool ThreadManager::add_managed_thread(std::function<void()> task, const std::string& name) {
    cleanup_finished_threads();

    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Refusing new thread during shutdown: " << name);
        return false;
    }

    ManagedThread managed;
    managed.name = name;
    managed.finished = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> finished = managed.finished;
    managed.thread = std::thread([task, finished]() {
        task();
        finished->store(true);
    });

    active_threads_.push_back(std::move(managed));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

void ThreadManager::cleanup_finished_threads() {
    std::vector<ManagedThread> finished_threads;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        for (auto it = active_threads_.begin(); it != active_threads_.end();) {
            if (it->finished->load()) {
                finished_threads.push_back(std::move(*it));
                it = active_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // The task has returned, so these joins do not block
    for (auto& managed : finished_threads) {
        if (managed.thread.joinable()) {
            managed.thread.join();
        }
    }
    if (!finished_threads.empty()) {
        LOG_THREAD_DEBUG("Reaped " << finished_threads.size() << " finished threads");
    }
}

void ThreadManager::shutdown_all_threads() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }
    LOG_THREAD_DEBUG("Shutting down background threads");
    wait_cv_.notify_all();
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> threads_to_join;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }
        LOG_THREAD_DEBUG("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    // Join without holding the mutex
    for (auto& managed : threads_to_join) {
        std::thread& t = managed.thread;
        if (t.joinable()) {
            if (t.get_id() == std::this_thread::get_id()) {
                LOG_THREAD_ERROR("Managed thread " << managed.name << " tried to join itself, detaching");
                t.detach();
                continue;
            }
            t.join();
        }
    }
}

void ThreadManager::reset_shutdown() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    shutdown_requested_.store(false);
    wake_pending_ = false;
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

bool ThreadManager::interruptible_wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, timeout, [this] {
        return shutdown_requested_.load() || wake_pending_;
    });
    wake_pending_ = false;
    return shutdown_requested_.load();
}

void ThreadManager::wake() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        wake_pending_ = true;
    }
    wait_cv_.notify_all();
}

} // namespace meshchat
