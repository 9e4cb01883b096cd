#pragma once

#include <thread>
#include <vector>

namespace orthoproj {

// Joins every still-joinable thread when it goes out of scope, so an
// exception thrown while workers are being started never destroys a
// joinable std::thread.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() { join_all(); }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

    void join_all() {
        for (std::thread& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::vector<std::thread>& threads_;
};

} // namespace orthoproj
