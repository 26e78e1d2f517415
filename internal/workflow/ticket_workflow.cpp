#include "ticket_workflow.hpp"

#include "internal/fields/structured_field.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowlock::workflow {

TicketWorkflow::TicketWorkflow(TransitionService& tickets, fields::FieldUpdater& fields) : tickets_(tickets), fields_(fields) {
}

ResourceRecord TicketWorkflow::Escalate(int64_t ticket_id, const std::optional<std::string>& new_assignee, const std::string& actor,
                                        TransitionOptions options) {
  options.policy = retry::Policies::kHighContention;

  const auto& machine = tickets_.machine();
  return tickets_.Mutate(
      ticket_id, "escalate", actor,
      [&](ResourceRecord& ticket) {
        if (new_assignee && new_assignee->empty()) {
          throw util::ValidationError("assignee must not be empty");
        }
        if (machine.IsTerminal(ticket.state)) {
          throw util::InvalidTransitionError("ticket " + std::to_string(ticket.id) + " is " + ticket.state + " and cannot be escalated");
        }

        const auto previous_assignee = ticket.assignee;
        ticket.level += 1;
        if (new_assignee) {
          ticket.assignee = *new_assignee;
        }

        google::protobuf::Value entry;
        auto&                   item = *entry.mutable_struct_value()->mutable_fields();
        item["level"].set_number_value(static_cast<double>(ticket.level));
        item["previous_assignee"].set_string_value(previous_assignee);
        item["assignee"].set_string_value(ticket.assignee);
        item["escalated_by"].set_string_value(actor);
        item["escalated_at_ms"].set_number_value(static_cast<double>(util::NowUnixMillis()));

        auto history = fields::ParseField(ticket.history);
        fields::AppendBounded(history, std::string(kHistoryKey), entry, kMaxHistoryLength);
        ticket.history = fields::SerializeField(history);
      },
      options);
}

ResourceRecord TicketWorkflow::Assign(int64_t ticket_id, const std::string& assignee, const std::string& actor, const TransitionOptions& options) {
  const auto& machine = tickets_.machine();
  return tickets_.Mutate(
      ticket_id, "assign", actor,
      [&](ResourceRecord& ticket) {
        if (assignee.empty()) {
          throw util::ValidationError("assignee must not be empty");
        }
        if (machine.IsTerminal(ticket.state)) {
          throw util::InvalidTransitionError("ticket " + std::to_string(ticket.id) + " is " + ticket.state + " and cannot be reassigned");
        }
        ticket.assignee = assignee;
      },
      options);
}

google::protobuf::Struct TicketWorkflow::AppendHistory(int64_t ticket_id, const google::protobuf::Value& entry, const std::string& actor) {
  fields::UpdateContext ctx;
  ctx.actor = actor;
  return fields_.AppendToArray(ticket_id, "history", std::string(kHistoryKey), entry, kMaxHistoryLength, ctx);
}

ResourceRecord TicketWorkflow::Transition(int64_t ticket_id, const std::string& to_state, const std::string& actor,
                                          const TransitionOptions& options) {
  TransitionRequest request;
  request.resource_id = ticket_id;
  request.to_state    = to_state;
  request.actor       = actor;
  return tickets_.Transition(request, options);
}

} // namespace flowlock::workflow
