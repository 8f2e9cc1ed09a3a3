#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>
#include <pthread.h>

namespace Common {

  /// Name the calling thread (truncated to the 15 chars pthread allows)
  inline auto setThreadName(const char* name) noexcept -> bool {
    char truncated_name[16];
    std::snprintf(truncated_name, sizeof(truncated_name), "%s", name);
    return pthread_setname_np(pthread_self(), truncated_name) == 0;
  }

  /// Fixed-size worker pool; tasks run in FIFO order of submission
  class ThreadPool {
  public:
    explicit ThreadPool(std::size_t worker_count) {
      if (worker_count == 0) {
        worker_count = 1;
      }
      workers_.reserve(worker_count);
      for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this, i] {
          char name[16];
          std::snprintf(name, sizeof(name), "lg-worker-%zu", i);
          setThreadName(name);

          while (true) {
            std::function<void()> task;

            {
              std::unique_lock<std::mutex> lock(queue_mutex_);
              condition_.wait(lock, [this] {
                return stop_.load(std::memory_order_acquire) || !tasks_.empty();
              });

              if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
                return;
              }

              task = std::move(tasks_.front());
              tasks_.pop_front();
            }

            task();
          }
        });
      }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    ~ThreadPool() {
      {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_.store(true, std::memory_order_release);
      }
      condition_.notify_all();

      for (auto& worker : workers_) {
        if (worker.joinable()) {
          worker.join();
        }
      }
    }

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) {
      using Result = std::invoke_result_t<F, Args...>;
      auto task = std::make_shared<std::packaged_task<Result()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
      );

      auto res = task->get_future();

      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_.load(std::memory_order_acquire)) {
          throw std::runtime_error("enqueue on stopped ThreadPool");
        }

        tasks_.emplace_back([task]() { (*task)(); });
      }

      condition_.notify_one();
      return res;
    }

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

  private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
  };

} // namespace Common
