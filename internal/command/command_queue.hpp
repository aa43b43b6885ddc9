#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/negotiation_command.hpp"

namespace negotiation::command {

struct QueuedCommand {
  model::NegotiationCommand command;
  // times the command already lost a store race
  int attempts = 0;
};

/*
  Thread-safe FIFO of pending commands for one manager loop.

  Also serves as the loop's wakeup: producers of new work call Wake() and the
  loop sleeps in WaitFor() between iterations.
*/
class CommandQueue {
 public:
  void Enqueue(model::NegotiationCommand command);
  void Requeue(QueuedCommand queued);

  // non-blocking, submission order
  std::vector<QueuedCommand> DequeueBatch(std::size_t max);

  // Blocks until a command arrives, Wake() or Shutdown() is called, or the
  // timeout elapses. Returns false once shut down.
  bool WaitFor(std::chrono::milliseconds timeout);

  void Wake();
  void Shutdown();

  std::size_t Size() const;
  bool        HasPending(const std::string& negotiation_id) const;

 private:
  void Push(QueuedCommand queued);

  mutable std::mutex                           mutex_;
  std::condition_variable                      cv_;
  std::deque<QueuedCommand>                    queue_;
  std::unordered_map<std::string, std::size_t> pending_;
  bool                                         woken_    = false;
  bool                                         shutdown_ = false;
};

} // namespace negotiation::command
