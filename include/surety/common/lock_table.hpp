#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace surety {

    /// Lazily created named mutexes. Entries are never removed so references stay valid.
    class LockTable {
      public:
        LockTable() = default;

        LockTable(const LockTable &) = delete;
        LockTable &operator=(const LockTable &) = delete;

        inline std::timed_mutex &mutexFor(const std::string &key) {
            std::lock_guard<std::mutex> guard(table_mutex_);
            auto &slot = mutexes_[key];
            if (!slot)
                slot = std::make_unique<std::timed_mutex>();
            return *slot;
        }

        /// Returned lock does not own the mutex when the timeout elapsed
        inline std::unique_lock<std::timed_mutex> tryAcquire(const std::string &key,
                                                             std::chrono::milliseconds timeout) {
            std::unique_lock<std::timed_mutex> lock(mutexFor(key), std::defer_lock);
            (void)lock.try_lock_for(timeout);
            return lock;
        }

      private:
        std::mutex table_mutex_;
        std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> mutexes_;
    };

} // namespace surety
