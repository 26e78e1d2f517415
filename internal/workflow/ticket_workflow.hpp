#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>

#include "internal/fields/field_updater.hpp"
#include "internal/workflow/transition_service.hpp"

namespace flowlock::workflow {

/*
  Ticket workflow: help-desk tickets with an escalation level.

  Escalation is the hot path: many workers may escalate the same ticket at
  once, so it runs under the high-contention retry policy and every
  successful call moves the level by exactly one.
*/
class TicketWorkflow {
 public:
  static constexpr std::string_view kHistoryKey       = "ticket_history";
  static constexpr std::size_t      kMaxHistoryLength = 500;

  TicketWorkflow(TransitionService& tickets, fields::FieldUpdater& fields);

  ResourceRecord Escalate(int64_t ticket_id, const std::optional<std::string>& new_assignee, const std::string& actor,
                          TransitionOptions options = {});

  ResourceRecord Assign(int64_t ticket_id, const std::string& assignee, const std::string& actor, const TransitionOptions& options = {});

  google::protobuf::Struct AppendHistory(int64_t ticket_id, const google::protobuf::Value& entry, const std::string& actor);

  ResourceRecord Transition(int64_t ticket_id, const std::string& to_state, const std::string& actor, const TransitionOptions& options = {});

 private:
  TransitionService&    tickets_;
  fields::FieldUpdater& fields_;
};

} // namespace flowlock::workflow
