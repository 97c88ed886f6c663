#ifndef MPLAUNCH_STATE_HPP
#define MPLAUNCH_STATE_HPP

#include "mplaunch/progress_channel.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace mplaunch {

enum class AppState {
  IDLE,
  DOWNLOADING,
  FINISHED, // banner shown until the cooldown runs out
  ERROR
};

// What the presentation layer renders. Written by the UI loop only.
class State {
public:
  void set(AppState state);
  AppState get() const;

  std::string getStateString() const;

  void setStatus(const std::string &status);
  std::string getStatus() const;

  float getProgress() const { return progress_.load(); }
  double getSpeed() const { return speed_.load(); }

  // Folds one channel event into progress/speed.
  void apply(const ProgressEvent &event);
  void reset();

private:
  std::atomic<AppState> state_{AppState::IDLE};
  std::atomic<float> progress_{0.0f};
  std::atomic<double> speed_{0.0};

  mutable std::mutex mutex_;
  std::string status_;
};

} // namespace mplaunch

#endif // MPLAUNCH_STATE_HPP
