#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Owns a set of threads and joins all of them on destruction.
 *
 * Threads are started with spawn(); join_all() may be called early to wait
 * for completion, after which the group is empty and may be reused.
 */
class ThreadGroup {
  public:
    ThreadGroup() = default;
    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;
    ~ThreadGroup() { join_all(); }

    template <typename Fn> void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

    void join_all() {
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

  private:
    std::vector<std::thread> threads_;
};

#endif // THREAD_UTILS_HPP
