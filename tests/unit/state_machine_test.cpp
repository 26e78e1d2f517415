#include "internal/workflow/state_machine.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using flowlock::db::model::ResourceRecord;
using flowlock::workflow::JobStateMachine;
using flowlock::workflow::TicketStateMachine;

void TestJobTable() {
  JobStateMachine machine;
  assert(machine.EntityType() == "job");

  assert(machine.CanTransition("ASSIGNED", "INPROGRESS"));
  assert(machine.CanTransition("ASSIGNED", "AUTOCLOSED"));
  assert(machine.CanTransition("INPROGRESS", "PARTIALLYCOMPLETED"));
  assert(machine.CanTransition("MAINTENANCE", "WORKING"));
  assert(!machine.CanTransition("ASSIGNED", "COMPLETED"));
  assert(!machine.CanTransition("ASSIGNED", "PARTIALLYCOMPLETED"));
  assert(!machine.CanTransition("COMPLETED", "INPROGRESS"));
  assert(!machine.CanTransition("UNKNOWN", "INPROGRESS"));

  assert(machine.IsTerminal("COMPLETED"));
  assert(machine.IsTerminal("PARTIALLYCOMPLETED"));
  assert(machine.IsTerminal("AUTOCLOSED"));
  assert(!machine.IsTerminal("STANDBY"));

  assert(machine.IsKnownState("WORKING"));
  assert(!machine.IsKnownState("working"));
}

void TestTicketTable() {
  TicketStateMachine machine;
  assert(machine.EntityType() == "ticket");

  assert(machine.CanTransition("NEW", "OPEN"));
  assert(machine.CanTransition("RESOLVED", "OPEN"));
  assert(!machine.CanTransition("NEW", "RESOLVED"));
  assert(!machine.CanTransition("CLOSED", "OPEN"));
  assert(machine.IsTerminal("CLOSED"));
  assert(machine.IsTerminal("CANCELLED"));
  assert(!machine.IsTerminal("ONHOLD"));
}

void TestJobPreconditionsStampTimes() {
  JobStateMachine machine;

  ResourceRecord before;
  before.id    = 1;
  before.state = "ASSIGNED";
  auto after   = before;
  after.state  = "INPROGRESS";
  machine.ApplyPreconditions(before, after, true);
  assert(after.started_at_ms != 0);

  before       = after;
  auto done    = before;
  done.state   = "COMPLETED";
  machine.ApplyPreconditions(before, done, true);
  assert(done.completed_at_ms != 0);

  // an explicit completion time is kept
  auto explicit_done            = before;
  explicit_done.state           = "COMPLETED";
  explicit_done.completed_at_ms = 1234;
  machine.ApplyPreconditions(before, explicit_done, true);
  assert(explicit_done.completed_at_ms == 1234);
}

void TestJobCompletionNeedsStart() {
  JobStateMachine machine;

  ResourceRecord before;
  before.id    = 2;
  before.state = "WORKING";
  auto after   = before;
  after.state  = "COMPLETED";

  bool threw = false;
  try {
    machine.ApplyPreconditions(before, after, true);
  } catch (const flowlock::util::InvalidTransitionError&) {
    threw = true;
  }
  assert(threw);

  // not enforced: still stamped
  machine.ApplyPreconditions(before, after, false);
  assert(after.completed_at_ms != 0);
}

void TestTicketResolutionNeedsAssignee() {
  TicketStateMachine machine;

  ResourceRecord before;
  before.id    = 3;
  before.state = "OPEN";
  auto after   = before;
  after.state  = "RESOLVED";

  bool threw = false;
  try {
    machine.ApplyPreconditions(before, after, true);
  } catch (const flowlock::util::InvalidTransitionError&) {
    threw = true;
  }
  assert(threw);

  after.assignee = "agent-1";
  machine.ApplyPreconditions(before, after, true);
}

} // namespace

int main() {
  TestJobTable();
  TestTicketTable();
  TestJobPreconditionsStampTimes();
  TestJobCompletionNeedsStart();
  TestTicketResolutionNeedsAssignee();

  std::cout << "flowlock_unit_state_machine: pass\n";
  return 0;
}
