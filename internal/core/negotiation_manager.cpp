#include "negotiation_manager.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace negotiation::core {

namespace {

using observability::IntField;
using observability::StringField;

util::FailureReason ToFailureReason(db::ErrorCode code) {
  switch (code) {
    case db::ErrorCode::NotFound:
      return util::FailureReason::kNotFound;
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::LeaseConflict:
      return util::FailureReason::kConflict;
    case db::ErrorCode::InvalidArgument:
      return util::FailureReason::kBadRequest;
    default:
      return util::FailureReason::kTransient;
  }
}

std::string_view RoleName(v1::NegotiationType role) {
  return role == v1::NEGOTIATION_TYPE_CONSUMER ? "consumer" : "provider";
}

std::string_view StateNameOf(const v1::ContractNegotiation& negotiation) {
  return model::StateName(statemachine::StateOf(negotiation));
}

statemachine::Event ToEvent(const model::NegotiationCommand& command) {
  return std::visit(
      [](const auto& c) -> statemachine::Event {
        if constexpr (std::is_same_v<std::decay_t<decltype(c)>, model::CancelNegotiationCommand>) {
          return statemachine::CancelEvent{};
        } else {
          return statemachine::DeclineEvent{c.reason};
        }
      },
      command);
}

} // namespace

NegotiationManager::NegotiationManager(v1::NegotiationType role, std::shared_ptr<db::NegotiationStore> store,
                                       std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher, ManagerOptions options)
    : role_(role),
      role_name_(RoleName(role)),
      store_(std::move(store)),
      dispatcher_(std::move(dispatcher)),
      options_(std::move(options)),
      lease_holder_(role_name_ + "-" + options_.participant_id + "-" + util::GenerateId().substr(0, 8)),
      retries_(options_.max_retries, options_.retry_base_delay, options_.retry_max_delay) {
  if (!store_ || !dispatcher_) {
    throw std::invalid_argument("negotiation manager requires a store and a dispatcher");
  }
  if (!options_.clock) {
    options_.clock = util::Now;
  }
}

NegotiationManager::~NegotiationManager() {
  Stop();
}

void NegotiationManager::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&NegotiationManager::Run, this);
  NEGOTIATION_LOG_INFO("negotiation manager started", {StringField("role", role_name_), StringField("lease_holder", lease_holder_)});
}

void NegotiationManager::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.Shutdown();
  if (thread_.joinable()) {
    thread_.join();
  }
  NEGOTIATION_LOG_INFO("negotiation manager stopped", {StringField("role", role_name_)});
}

bool NegotiationManager::IsRunning() const {
  return running_;
}

void NegotiationManager::EnqueueCommand(model::NegotiationCommand command) {
  NEGOTIATION_LOG_DEBUG("command enqueued", {StringField("role", role_name_), StringField("command", model::CommandName(command)),
                                             StringField("negotiation_id", model::TargetNegotiationId(command))});
  queue_.Enqueue(std::move(command));
}

bool NegotiationManager::HasPendingCommand(const std::string& negotiation_id) const {
  return queue_.HasPending(negotiation_id);
}

util::TimePoint NegotiationManager::Now() const {
  return options_.clock();
}

void NegotiationManager::Run() {
  while (running_) {
    std::size_t handled = 0;
    try {
      handled = RunOnce();
    } catch (const std::exception& e) {
      NEGOTIATION_LOG_ERROR("negotiation manager iteration failed", {StringField("role", role_name_), StringField("error", e.what())});
    }

    // keep going without sleeping while there is work
    const auto wait = handled > 0 ? std::chrono::milliseconds(0) : options_.poll_interval;
    if (!queue_.WaitFor(wait)) {
      break;
    }
  }
}

std::size_t NegotiationManager::RunOnce() {
  std::size_t handled = DrainCommands();
  for (auto state : statemachine::ProcessableStates(role_)) {
    handled += ProcessState(state);
  }
  return handled;
}

// ---------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------

std::size_t NegotiationManager::DrainCommands() {
  auto batch = queue_.DequeueBatch(options_.command_batch_size);
  for (auto& queued : batch) {
    ApplyCommand(std::move(queued));
  }
  return batch.size();
}

void NegotiationManager::ApplyCommand(command::QueuedCommand queued) {
  const std::string id   = model::TargetNegotiationId(queued.command);
  const std::string name = model::CommandName(queued.command);

  auto current = store_->FindById(id);
  if (!current) {
    NEGOTIATION_LOG_WARN("dropping command for unknown negotiation", {StringField("command", name), StringField("negotiation_id", id)});
    return;
  }
  // the other role's manager owns this record
  if (current->type() != role_) {
    NEGOTIATION_LOG_WARN("dropping command for foreign negotiation",
                         {StringField("role", role_name_), StringField("command", name), StringField("negotiation_id", id)});
    return;
  }

  auto result = statemachine::Transition(*current, ToEvent(queued.command), Now());
  if (result.outcome == statemachine::Outcome::kRejected) {
    NEGOTIATION_LOG_WARN("dropping command rejected by state machine",
                         {StringField("command", name), StringField("negotiation_id", id), StringField("reason", result.reason)});
    return;
  }
  if (result.outcome == statemachine::Outcome::kNoOp) {
    return;
  }

  auto saved = Persist(*current, result.next, {});
  if (saved) {
    queue_.Wake();
    return;
  }

  const bool lost_race = saved.code == db::ErrorCode::Conflict || saved.code == db::ErrorCode::LeaseConflict;
  if (lost_race && queued.attempts + 1 < options_.command_max_attempts) {
    NEGOTIATION_LOG_DEBUG("requeueing command after concurrent write",
                          {StringField("command", name), StringField("negotiation_id", id), IntField("attempts", queued.attempts + 1)});
    queue_.Requeue(std::move(queued));
    return;
  }

  NEGOTIATION_LOG_ERROR("dropping command after failed save", {StringField("command", name), StringField("negotiation_id", id),
                                                               IntField("attempts", queued.attempts + 1), StringField("error", saved.message)});
}

// ---------------------------------------------------------------------
// Leasing loop
// ---------------------------------------------------------------------

std::size_t NegotiationManager::ProcessState(model::NegotiationState state) {
  auto leased = store_->LeaseNextByState(model::Code(state), role_, options_.batch_size, lease_holder_);
  if (leased.empty()) {
    return 0;
  }

  const auto                           now = Now();
  std::vector<v1::ContractNegotiation> due;
  due.reserve(leased.size());
  for (auto& negotiation : leased) {
    // a queued command decides first
    if (HasPendingCommand(negotiation.id()) || !retries_.IsDue(negotiation.id(), now)) {
      Release(negotiation.id());
      continue;
    }
    due.push_back(std::move(negotiation));
  }

  if (options_.workers <= 1 || due.size() <= 1) {
    for (const auto& negotiation : due) {
      ProcessLeased(negotiation);
    }
    return due.size();
  }

  // fan out across workers, the lease keeps one worker per negotiation
  const auto                                        worker_count = std::min(options_.workers, due.size());
  std::vector<std::vector<v1::ContractNegotiation>> groups(worker_count);
  for (std::size_t i = 0; i < due.size(); ++i) {
    groups[i % worker_count].push_back(std::move(due[i]));
  }

  std::vector<std::future<void>> workers;
  workers.reserve(worker_count);
  for (auto& group : groups) {
    workers.push_back(std::async(std::launch::async, [this, group = std::move(group)] {
      for (const auto& negotiation : group) {
        ProcessLeased(negotiation);
      }
    }));
  }
  for (auto& worker : workers) {
    worker.get();
  }
  return due.size();
}

void NegotiationManager::ProcessLeased(const v1::ContractNegotiation& negotiation) {
  const auto& id = negotiation.id();

  observability::SpanScope span("negotiation.process");
  span.SetAttribute("negotiation.id", id);
  span.SetAttribute("negotiation.role", role_name_);
  span.SetAttribute("negotiation.state", StateNameOf(negotiation));

  try {
    auto result = statemachine::Transition(negotiation, statemachine::ProcessEvent{options_.participant_id, options_.callback_address}, Now());
    if (!result.Applied()) {
      NEGOTIATION_LOG_WARN("leased negotiation not processable", {StringField("negotiation_id", id), StringField("reason", result.reason)});
      Release(id);
      return;
    }

    if (result.message) {
      const auto kind       = dispatch::MessageKind(*result.message);
      auto       dispatched = dispatcher_->Send(*result.message);
      observability::Metrics::Instance().RecordDispatch(kind, dispatch::ToString(dispatched.status));

      switch (dispatched.status) {
        case dispatch::DispatchStatus::kOk:
          retries_.Clear(id);
          if (result.next.correlation_id().empty() && !dispatched.counter_party_process_id.empty()) {
            result.next.set_correlation_id(dispatched.counter_party_process_id);
          }
          break;

        case dispatch::DispatchStatus::kTransient:
          if (!retries_.RecordFailure(id, Now())) {
            NEGOTIATION_LOG_WARN("dispatch failed, retry scheduled",
                                 {StringField("negotiation_id", id), StringField("kind", kind), IntField("attempts", retries_.Attempts(id)),
                                  StringField("error", dispatched.message)});
            Release(id);
            return;
          }
          NEGOTIATION_LOG_ERROR("dispatch retries exhausted",
                                {StringField("negotiation_id", id), StringField("kind", kind), StringField("error", dispatched.message)});
          result = statemachine::Transition(negotiation, statemachine::FailEvent{"dispatch retries exhausted: " + dispatched.message}, Now());
          break;

        case dispatch::DispatchStatus::kFatal:
          retries_.Clear(id);
          NEGOTIATION_LOG_ERROR("dispatch failed fatally",
                                {StringField("negotiation_id", id), StringField("kind", kind), StringField("error", dispatched.message)});
          result = statemachine::Transition(negotiation, statemachine::FailEvent{dispatched.message}, Now());
          break;
      }
    }

    if (auto saved = Persist(negotiation, result.next, lease_holder_); !saved) {
      NEGOTIATION_LOG_ERROR("failed to persist negotiation", {StringField("negotiation_id", id), StringField("to", StateNameOf(result.next)),
                                                              StringField("error", saved.message)});
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    NEGOTIATION_LOG_ERROR("processing negotiation failed", {StringField("negotiation_id", id), StringField("error", e.what())});
  }

  Release(id);
}

db::Result NegotiationManager::Persist(const v1::ContractNegotiation& previous, v1::ContractNegotiation& next, const std::string& lease_holder) {
  auto saved = store_->Save(next, lease_holder);
  if (!saved) {
    return saved;
  }

  // attempts belong to the state they were made in
  retries_.Clear(next.id());

  NEGOTIATION_LOG_INFO("negotiation transitioned",
                       {StringField("role", role_name_), StringField("negotiation_id", next.id()), StringField("from", StateNameOf(previous)),
                        StringField("to", StateNameOf(next)), IntField("state_count", static_cast<std::int64_t>(next.state_count()))});
  observability::Metrics::Instance().RecordTransition(role_name_, StateNameOf(next));
  return saved;
}

void NegotiationManager::Release(const std::string& negotiation_id) {
  auto released = store_->BreakLease(negotiation_id, lease_holder_);
  if (!released) {
    NEGOTIATION_LOG_WARN("failed to break lease", {StringField("negotiation_id", negotiation_id), StringField("error", released.message)});
  }
}

// ---------------------------------------------------------------------
// Synchronous operations
// ---------------------------------------------------------------------

NegotiationResult NegotiationManager::Create(v1::ContractNegotiation negotiation) {
  const auto now = util::ToUnixMillis(Now());
  negotiation.set_type(role_);
  negotiation.set_state_count(0);
  negotiation.set_state_timestamp(now);
  negotiation.set_created_at(now);

  auto saved = store_->Save(negotiation, {});
  if (!saved) {
    return NegotiationResult::Failure(ToFailureReason(saved.code), saved.message);
  }

  NEGOTIATION_LOG_INFO("negotiation created", {StringField("role", role_name_), StringField("negotiation_id", negotiation.id()),
                                               StringField("counter_party_id", negotiation.counter_party_id()),
                                               StringField("state", StateNameOf(negotiation))});
  observability::Metrics::Instance().RecordTransition(role_name_, StateNameOf(negotiation));
  queue_.Wake();
  return NegotiationResult::Success(std::move(negotiation));
}

NegotiationResult NegotiationManager::Apply(const v1::ContractNegotiation& current, const statemachine::Event& event) {
  auto result = statemachine::Transition(current, event, Now());
  switch (result.outcome) {
    case statemachine::Outcome::kRejected:
      return NegotiationResult::Failure(util::FailureReason::kConflict, result.reason);
    case statemachine::Outcome::kNoOp:
      return NegotiationResult::Success(current);
    case statemachine::Outcome::kApplied:
      break;
  }

  if (auto saved = Persist(current, result.next, {}); !saved) {
    return NegotiationResult::Failure(ToFailureReason(saved.code), saved.message);
  }

  queue_.Wake();
  return NegotiationResult::Success(std::move(result.next));
}

NegotiationResult NegotiationManager::ApplyToCorrelation(const std::string& correlation_id, const statemachine::Event& event) {
  auto current = FindByCorrelation(correlation_id);
  if (!current) {
    return NegotiationResult::Failure(util::FailureReason::kNotFound, "no " + role_name_ + " negotiation correlated with " + correlation_id);
  }
  return Apply(*current, event);
}

std::optional<v1::ContractNegotiation> NegotiationManager::FindOwned(const std::string& negotiation_id) {
  auto negotiation = store_->FindById(negotiation_id);
  if (!negotiation || negotiation->type() != role_) {
    return std::nullopt;
  }
  return negotiation;
}

std::optional<v1::ContractNegotiation> NegotiationManager::FindByCorrelation(const std::string& correlation_id) {
  auto negotiation = store_->FindForCorrelationId(correlation_id);
  if (!negotiation || negotiation->type() != role_) {
    return std::nullopt;
  }
  return negotiation;
}

} // namespace negotiation::core
