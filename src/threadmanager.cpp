#include "threadmanager.h"
#include <system_error>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace netlaunch {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    join_all_active_threads();
}

bool ThreadManager::add_managed_thread(std::thread&& t, const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (!shutdown_requested_.load()) {
            active_threads_.emplace_back(std::move(t));
            LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
            return true;
        }
    }

    LOG_THREAD_WARN("Ignoring thread during shutdown: " << name);
    if (t.joinable()) {
        t.join();
    }
    return false;
}

void ThreadManager::join_all_active_threads() {
    std::vector<std::thread> threads_to_join;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }
        LOG_THREAD_DEBUG("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    // Join without holding the mutex so workers can still register
    for (auto& t : threads_to_join) {
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                LOG_THREAD_ERROR("Exception while joining thread: " << e.what());
            }
        }
    }

    LOG_THREAD_DEBUG("All managed threads have been joined");
}

void ThreadManager::shutdown_all_threads() {
    shutdown_requested_.store(true);
}

void ThreadManager::reset_shutdown() {
    shutdown_requested_.store(false);
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

} // namespace netlaunch
