#include "command_queue.hpp"

namespace negotiation::command {

void CommandQueue::Push(QueuedCommand queued) {
  {
    std::lock_guard lock(mutex_);
    ++pending_[model::TargetNegotiationId(queued.command)];
    queue_.push_back(std::move(queued));
  }
  cv_.notify_one();
}

void CommandQueue::Enqueue(model::NegotiationCommand command) {
  Push(QueuedCommand{std::move(command), 0});
}

void CommandQueue::Requeue(QueuedCommand queued) {
  ++queued.attempts;
  Push(std::move(queued));
}

std::vector<QueuedCommand> CommandQueue::DequeueBatch(std::size_t max) {
  std::lock_guard lock(mutex_);

  std::vector<QueuedCommand> batch;
  while (!queue_.empty() && batch.size() < max) {
    auto queued = std::move(queue_.front());
    queue_.pop_front();

    auto it = pending_.find(model::TargetNegotiationId(queued.command));
    if (it != pending_.end() && --it->second == 0) pending_.erase(it);

    batch.push_back(std::move(queued));
  }
  return batch;
}

bool CommandQueue::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || woken_ || !queue_.empty(); });
  woken_ = false;

  return !shutdown_;
}

void CommandQueue::Wake() {
  {
    std::lock_guard lock(mutex_);
    woken_ = true;
  }
  cv_.notify_all();
}

void CommandQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t CommandQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool CommandQueue::HasPending(const std::string& negotiation_id) const {
  std::lock_guard lock(mutex_);
  return pending_.contains(negotiation_id);
}

} // namespace negotiation::command
