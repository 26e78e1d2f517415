#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/db/model/resource_record.hpp"

namespace flowlock::workflow {

/*
  Finite state machine for one entity type.

  CanTransition answers from the legal (from, to) table only.
  ApplyPreconditions runs for every state change: it stamps derived
  columns (start / completion time) and, when enforce is set, throws
  InvalidTransitionError for a change whose preconditions do not hold.
*/
class StateMachine {
 public:
  virtual ~StateMachine() = default;

  virtual std::string_view EntityType() const = 0;

  virtual bool IsKnownState(std::string_view state) const = 0;
  virtual bool CanTransition(std::string_view from, std::string_view to) const = 0;
  virtual bool IsTerminal(std::string_view state) const = 0;

  virtual void ApplyPreconditions(const db::model::ResourceRecord& before, db::model::ResourceRecord& after, bool enforce) const = 0;
};

/*
  StateMachine backed by a static adjacency table. States with no outgoing
  edges are terminal.
*/
class TableStateMachine : public StateMachine {
 public:
  using Edges = std::initializer_list<std::pair<std::string_view, std::initializer_list<std::string_view>>>;

  TableStateMachine(std::string entity_type, std::initializer_list<std::string_view> states, Edges edges);

  std::string_view EntityType() const override {
    return entity_type_;
  }

  bool IsKnownState(std::string_view state) const override;
  bool CanTransition(std::string_view from, std::string_view to) const override;
  bool IsTerminal(std::string_view state) const override;

  void ApplyPreconditions(const db::model::ResourceRecord&, db::model::ResourceRecord&, bool) const override {
  }

 private:
  std::string                                                      entity_type_;
  std::unordered_set<std::string>                                  states_;
  std::unordered_map<std::string, std::unordered_set<std::string>> edges_;
};

// Scheduled task / tour / checkpoint.
class JobStateMachine final : public TableStateMachine {
 public:
  static constexpr std::string_view kAssigned           = "ASSIGNED";
  static constexpr std::string_view kInProgress         = "INPROGRESS";
  static constexpr std::string_view kStandby            = "STANDBY";
  static constexpr std::string_view kWorking            = "WORKING";
  static constexpr std::string_view kMaintenance        = "MAINTENANCE";
  static constexpr std::string_view kPartiallyCompleted = "PARTIALLYCOMPLETED";
  static constexpr std::string_view kCompleted          = "COMPLETED";
  static constexpr std::string_view kAutoClosed         = "AUTOCLOSED";

  JobStateMachine();

  // INPROGRESS stamps started_at_ms; COMPLETED needs a start time and stamps completed_at_ms.
  void ApplyPreconditions(const db::model::ResourceRecord& before, db::model::ResourceRecord& after, bool enforce) const override;
};

class TicketStateMachine final : public TableStateMachine {
 public:
  static constexpr std::string_view kNew       = "NEW";
  static constexpr std::string_view kOpen      = "OPEN";
  static constexpr std::string_view kOnHold    = "ONHOLD";
  static constexpr std::string_view kResolved  = "RESOLVED";
  static constexpr std::string_view kClosed    = "CLOSED";
  static constexpr std::string_view kCancelled = "CANCELLED";

  TicketStateMachine();

  // RESOLVED needs an assignee.
  void ApplyPreconditions(const db::model::ResourceRecord& before, db::model::ResourceRecord& after, bool enforce) const override;
};

} // namespace flowlock::workflow
