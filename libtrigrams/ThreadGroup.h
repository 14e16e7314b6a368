#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

// Owns a set of threads and joins all of them before going away, also when
// spawning one of them failed or the owner is unwinding.
class ThreadGroup {
    std::vector<std::thread> threads;

   public:
    ThreadGroup() : threads() {}
    ThreadGroup(const ThreadGroup &other) = delete;
    ~ThreadGroup() { join_all(); }

    // Starts a new thread. Throws std::system_error if that's impossible,
    // threads started earlier keep running.
    template <typename F>
    void spawn(F &&fun) {
        threads.emplace_back(std::forward<F>(fun));
    }

    void join_all() {
        for (auto &t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    size_t size() const { return threads.size(); }
};
