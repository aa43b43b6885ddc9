#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/command/command_queue.hpp"
#include "internal/core/manager_types.hpp"
#include "internal/core/retry_policy.hpp"
#include "internal/db/api/negotiation_store.hpp"
#include "internal/dispatch/remote_message_dispatcher.hpp"
#include "internal/model/negotiation_command.hpp"
#include "internal/statemachine/transition.hpp"

namespace negotiation::core {

/*
  Negotiation engine shared by the consumer and the provider manager.

  The engine is the only writer of negotiation records of its role. A single
  background thread repeatedly

    1. drains the command queue
    2. leases each processable state of the role, runs the Process event,
       dispatches the resulting message and saves the next snapshot

  Synchronous inbound operations (subclasses) re-read, transition and save
  with compare-and-swap on state_count without taking a lease.

  Stop() is final; a stopped manager cannot be started again. RunOnce() may
  be called directly when no thread is running.
*/
class NegotiationManager {
 public:
  NegotiationManager(v1::NegotiationType role, std::shared_ptr<db::NegotiationStore> store,
                     std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher, ManagerOptions options);
  virtual ~NegotiationManager();

  NegotiationManager(const NegotiationManager&)            = delete;
  NegotiationManager& operator=(const NegotiationManager&) = delete;

  void Start();
  void Stop();
  bool IsRunning() const;

  void EnqueueCommand(model::NegotiationCommand command);
  bool HasPendingCommand(const std::string& negotiation_id) const;

  // Returns the number of commands and negotiations handled.
  std::size_t RunOnce();

  v1::NegotiationType Role() const {
    return role_;
  }

  const std::string& LeaseHolder() const {
    return lease_holder_;
  }

 protected:
  // Inserts a new record of this role.
  NegotiationResult Create(v1::ContractNegotiation negotiation);

  // Transition plus CAS save. NoOp returns `current` unchanged.
  NegotiationResult Apply(const v1::ContractNegotiation& current, const statemachine::Event& event);

  NegotiationResult ApplyToCorrelation(const std::string& correlation_id, const statemachine::Event& event);

  // Lookups restricted to records of this role.
  std::optional<v1::ContractNegotiation> FindOwned(const std::string& negotiation_id);
  std::optional<v1::ContractNegotiation> FindByCorrelation(const std::string& correlation_id);

  util::TimePoint Now() const;

  const ManagerOptions& Options() const {
    return options_;
  }

 private:
  void Run();

  std::size_t DrainCommands();
  void        ApplyCommand(command::QueuedCommand queued);

  std::size_t ProcessState(model::NegotiationState state);
  void        ProcessLeased(const v1::ContractNegotiation& negotiation);

  // CAS save; logs and counts the transition on success
  db::Result Persist(const v1::ContractNegotiation& previous, v1::ContractNegotiation& next, const std::string& lease_holder);
  void Release(const std::string& negotiation_id);

  v1::NegotiationType                                role_;
  std::string                                        role_name_;
  std::shared_ptr<db::NegotiationStore>              store_;
  std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher_;
  ManagerOptions                                     options_;
  std::string                                        lease_holder_;

  command::CommandQueue queue_;
  RetryTracker          retries_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace negotiation::core
