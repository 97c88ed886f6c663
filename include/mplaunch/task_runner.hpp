#ifndef MPLAUNCH_TASK_RUNNER_HPP
#define MPLAUNCH_TASK_RUNNER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace mplaunch {

// Owns the background threads that run downloads off the UI loop.
class TaskRunner {
public:
  static TaskRunner &instance();

  // Runs a task in a managed jthread and returns a future for its result.
  template <typename F, typename... Args>
  auto async(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<return_type> res = task->get_future();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mutex_);
    pruneLocked();
    workers_.push_back({done, std::jthread([task, done]() {
                          (*task)();
                          done->store(true);
                        })});
    return res;
  }

  // Joins threads whose task has returned. async() does this on every call.
  void pruneFinished();

  size_t threadCount();

  // Joins every thread. Called on app shutdown.
  void shutdown();

  ~TaskRunner();

  TaskRunner(const TaskRunner &) = delete;
  TaskRunner &operator=(const TaskRunner &) = delete;

private:
  TaskRunner() = default;

  struct Worker {
    std::shared_ptr<std::atomic<bool>> done;
    std::jthread thread;
  };

  std::vector<Worker> workers_;
  std::mutex mutex_;

  void pruneLocked();
};

} // namespace mplaunch

#endif // MPLAUNCH_TASK_RUNNER_HPP
