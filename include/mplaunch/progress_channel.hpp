#ifndef MPLAUNCH_PROGRESS_CHANNEL_HPP
#define MPLAUNCH_PROGRESS_CHANNEL_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace mplaunch {

struct ProgressEvent {
  enum class Kind { IDLE, PROGRESS, FINISHED };

  Kind kind = Kind::IDLE;
  double fraction = 0.0;       // [0, 1], PROGRESS only
  double bytesPerSecond = 0.0; // rolling-window rate, PROGRESS only

  static ProgressEvent progress(double fraction, double bytesPerSecond) {
    return {Kind::PROGRESS, fraction, bytesPerSecond};
  }
  static ProgressEvent finished() { return {Kind::FINISHED, 1.0, 0.0}; }
};

namespace detail {
struct ChannelState {
  explicit ChannelState(size_t cap) : capacity(cap) {}

  std::mutex mutex;
  std::deque<ProgressEvent> queue;
  size_t capacity;
  size_t dropped = 0;
};
} // namespace detail

// Producer end. Copies share the same queue.
class ProgressSender {
public:
  ProgressSender() = default;

  // Never blocks. A full queue drops this event; returns false in that case.
  bool trySend(const ProgressEvent &event) const;

  bool connected() const { return state_ != nullptr; }

private:
  friend class ProgressChannel;
  explicit ProgressSender(std::shared_ptr<detail::ChannelState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::ChannelState> state_;
};

// Consumer end, polled from the UI loop.
class ProgressReceiver {
public:
  ProgressReceiver() = default;

  std::optional<ProgressEvent> tryReceive() const;
  size_t pending() const;
  size_t dropped() const;

private:
  friend class ProgressChannel;
  explicit ProgressReceiver(std::shared_ptr<detail::ChannelState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::ChannelState> state_;
};

class ProgressChannel {
public:
  static constexpr size_t DEFAULT_CAPACITY = 100;

  static std::pair<ProgressSender, ProgressReceiver>
  create(size_t capacity = DEFAULT_CAPACITY);
};

} // namespace mplaunch

#endif // MPLAUNCH_PROGRESS_CHANNEL_HPP
