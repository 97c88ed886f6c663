#include "mplaunch/progress_channel.hpp"

namespace mplaunch {

std::pair<ProgressSender, ProgressReceiver>
ProgressChannel::create(size_t capacity) {
  auto state = std::make_shared<detail::ChannelState>(capacity);
  return {ProgressSender(state), ProgressReceiver(state)};
}

bool ProgressSender::trySend(const ProgressEvent &event) const {
  if (!state_)
    return false;
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->queue.size() >= state_->capacity) {
    state_->dropped++;
    return false;
  }
  state_->queue.push_back(event);
  return true;
}

std::optional<ProgressEvent> ProgressReceiver::tryReceive() const {
  if (!state_)
    return std::nullopt;
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->queue.empty())
    return std::nullopt;
  ProgressEvent event = state_->queue.front();
  state_->queue.pop_front();
  return event;
}

size_t ProgressReceiver::pending() const {
  if (!state_)
    return 0;
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->queue.size();
}

size_t ProgressReceiver::dropped() const {
  if (!state_)
    return 0;
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->dropped;
}

} // namespace mplaunch
