#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <atomic>
#include <string>

namespace netlaunch {

/**
 * ThreadManager keeps track of short-lived worker threads (one per pending
 * task) so the owner can wait for all of them at a well defined point.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Add a managed thread with a descriptive name
     * @param t Thread to be managed (moved)
     * @param name Descriptive name for logging purposes
     * @return false if shutdown was requested; the thread is then joined immediately
     */
    bool add_managed_thread(std::thread&& t, const std::string& name);

    /**
     * Join all active threads and wait for them to finish
     */
    void join_all_active_threads();

    /**
     * Flag shutdown; threads added afterwards are not tracked
     */
    void shutdown_all_threads();

    /**
     * Clear the shutdown flag so a new batch of threads can be tracked
     */
    void reset_shutdown();

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

    size_t get_active_thread_count() const;

private:
    std::vector<std::thread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace netlaunch
