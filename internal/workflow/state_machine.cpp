#include "state_machine.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowlock::workflow {

TableStateMachine::TableStateMachine(std::string entity_type, std::initializer_list<std::string_view> states, Edges edges)
    : entity_type_(std::move(entity_type)) {
  for (auto state : states) {
    states_.emplace(state);
  }
  for (const auto& [from, targets] : edges) {
    auto& out = edges_[std::string(from)];
    for (auto to : targets) {
      out.emplace(to);
    }
  }
}

bool TableStateMachine::IsKnownState(std::string_view state) const {
  return states_.contains(std::string(state));
}

bool TableStateMachine::CanTransition(std::string_view from, std::string_view to) const {
  auto it = edges_.find(std::string(from));
  return it != edges_.end() && it->second.contains(std::string(to));
}

bool TableStateMachine::IsTerminal(std::string_view state) const {
  auto it = edges_.find(std::string(state));
  return it == edges_.end() || it->second.empty();
}

JobStateMachine::JobStateMachine()
    : TableStateMachine("job", {kAssigned, kInProgress, kStandby, kWorking, kMaintenance, kPartiallyCompleted, kCompleted, kAutoClosed},
                        {
                            {kAssigned, {kInProgress, kStandby, kAutoClosed}},
                            {kStandby, {kAssigned, kInProgress, kAutoClosed}},
                            {kInProgress, {kWorking, kMaintenance, kCompleted, kPartiallyCompleted, kAutoClosed}},
                            {kWorking, {kInProgress, kMaintenance, kCompleted, kPartiallyCompleted, kAutoClosed}},
                            {kMaintenance, {kInProgress, kWorking, kAutoClosed}},
                        }) {
}

void JobStateMachine::ApplyPreconditions(const db::model::ResourceRecord& before, db::model::ResourceRecord& after, bool enforce) const {
  if (after.state == before.state) return;

  if (after.state == kInProgress && after.started_at_ms == 0) {
    after.started_at_ms = util::NowUnixMillis();
  }

  if (after.state == kCompleted) {
    if (enforce && after.started_at_ms == 0) {
      throw util::InvalidTransitionError("job " + std::to_string(after.id) + " cannot complete before it has started");
    }
    if (after.completed_at_ms == 0) {
      after.completed_at_ms = util::NowUnixMillis();
    }
  }
}

TicketStateMachine::TicketStateMachine()
    : TableStateMachine("ticket", {kNew, kOpen, kOnHold, kResolved, kClosed, kCancelled},
                        {
                            {kNew, {kOpen, kCancelled}},
                            {kOpen, {kOnHold, kResolved, kCancelled}},
                            {kOnHold, {kOpen, kCancelled}},
                            {kResolved, {kClosed, kOpen}},
                        }) {
}

void TicketStateMachine::ApplyPreconditions(const db::model::ResourceRecord& before, db::model::ResourceRecord& after, bool enforce) const {
  if (after.state == before.state) return;

  if (enforce && after.state == kResolved && after.assignee.empty()) {
    throw util::InvalidTransitionError("ticket " + std::to_string(after.id) + " cannot be resolved without an assignee");
  }
}

} // namespace flowlock::workflow
