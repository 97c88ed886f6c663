#include "mplaunch/state.hpp"

namespace mplaunch {

void State::set(AppState state) { state_.store(state); }

AppState State::get() const { return state_.load(); }

std::string State::getStateString() const {
  switch (state_.load()) {
  case AppState::IDLE:
    return "Idle";
  case AppState::DOWNLOADING:
    return "Downloading";
  case AppState::FINISHED:
    return "Finished";
  case AppState::ERROR:
    return "Error";
  default:
    return "Unknown";
  }
}

void State::setStatus(const std::string &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_ = status;
}

std::string State::getStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void State::apply(const ProgressEvent &event) {
  switch (event.kind) {
  case ProgressEvent::Kind::PROGRESS:
    progress_.store(static_cast<float>(event.fraction));
    speed_.store(event.bytesPerSecond);
    break;
  case ProgressEvent::Kind::FINISHED:
    progress_.store(1.0f);
    speed_.store(0.0);
    break;
  case ProgressEvent::Kind::IDLE:
    break;
  }
}

void State::reset() {
  state_.store(AppState::IDLE);
  progress_.store(0.0f);
  speed_.store(0.0);
  setStatus("");
}

} // namespace mplaunch
