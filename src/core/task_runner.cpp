#include "mplaunch/task_runner.hpp"
#include "mplaunch/logger.hpp"
#include <vector>

namespace mplaunch {

TaskRunner &TaskRunner::instance() {
  static TaskRunner instance;
  return instance;
}

void TaskRunner::pruneLocked() {
  // A finished worker joins immediately when its jthread is destroyed.
  std::erase_if(workers_, [](const Worker &w) { return w.done->load(); });
}

void TaskRunner::pruneFinished() {
  std::lock_guard<std::mutex> lock(mutex_);
  pruneLocked();
}

size_t TaskRunner::threadCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

void TaskRunner::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (workers_.empty())
    return;
  LOG_DEBUG("Waiting for " + std::to_string(workers_.size()) +
            " background task(s)...");
  workers_.clear(); // jthread joins on destruction
}

TaskRunner::~TaskRunner() { shutdown(); }

} // namespace mplaunch
