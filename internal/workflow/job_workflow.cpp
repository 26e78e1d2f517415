#include "job_workflow.hpp"

#include <algorithm>

#include "internal/fields/structured_field.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowlock::workflow {

namespace {

void MarkAutoClosed(ResourceRecord& record) {
  auto info = fields::ParseField(record.other_info);
  (*info.mutable_fields())["autoclosed_by_server"].set_bool_value(true);
  record.other_info = fields::SerializeField(info);
}

} // namespace

JobWorkflow::JobWorkflow(TransitionService& jobs, fields::FieldUpdater& fields) : jobs_(jobs), fields_(fields) {
}

ResourceRecord JobWorkflow::Start(int64_t job_id, const std::string& actor, const TransitionOptions& options) {
  TransitionRequest request;
  request.resource_id = job_id;
  request.to_state    = std::string(JobStateMachine::kInProgress);
  request.actor       = actor;
  return jobs_.Transition(request, options);
}

ResourceRecord JobWorkflow::Complete(int64_t job_id, const std::string& actor, std::optional<uint64_t> completed_at_ms,
                                     const TransitionOptions& options) {
  return jobs_.Mutate(
      job_id, "complete", actor,
      [&](ResourceRecord& job) {
        job.state = std::string(JobStateMachine::kCompleted);
        if (completed_at_ms) {
          job.completed_at_ms = *completed_at_ms;
        }
      },
      options);
}

std::vector<ResourceRecord> JobWorkflow::AutoClose(int64_t tour_id, const std::string& actor, const TransitionOptions& options) {
  const auto& machine = jobs_.machine();

  return jobs_.MutateFamily(
      tour_id, "autoclose", actor,
      [&](ResourceRecord& tour, std::vector<ResourceRecord>& checkpoints) {
        if (machine.IsTerminal(tour.state)) {
          throw util::InvalidTransitionError("job " + std::to_string(tour.id) + " is already " + tour.state);
        }

        const auto completed = std::count_if(checkpoints.begin(), checkpoints.end(),
                                             [](const ResourceRecord& c) { return c.state == JobStateMachine::kCompleted; });

        for (auto& checkpoint : checkpoints) {
          if (checkpoint.state == JobStateMachine::kAssigned) {
            checkpoint.state = std::string(JobStateMachine::kAutoClosed);
            MarkAutoClosed(checkpoint);
          }
        }

        const bool partial = completed > 0 && static_cast<std::size_t>(completed) < checkpoints.size() &&
                             machine.CanTransition(tour.state, JobStateMachine::kPartiallyCompleted);
        tour.state = std::string(partial ? JobStateMachine::kPartiallyCompleted : JobStateMachine::kAutoClosed);
        MarkAutoClosed(tour);
      },
      options);
}

std::pair<ResourceRecord, ResourceRecord> JobWorkflow::SaveCheckpoint(int64_t checkpoint_id, int64_t tour_id, const google::protobuf::Struct& data,
                                                                      const std::optional<std::string>& state, const std::string& actor,
                                                                      const TransitionOptions& options) {
  return jobs_.UpdateCoupledParentChild(
      checkpoint_id,
      [&](ResourceRecord& checkpoint) {
        if (data.fields().empty() && !state) {
          throw util::ValidationError("checkpoint save carries neither data nor a state");
        }
        if (!data.fields().empty()) {
          fields::ValidateUpdates(data);
          auto info = fields::ParseField(checkpoint.other_info);
          fields::DeepMerge(info, data);
          checkpoint.other_info = fields::SerializeField(info);
        }
        if (state) {
          checkpoint.state = *state;
        }
      },
      tour_id, actor, options);
}

ResourceRecord JobWorkflow::Assign(int64_t job_id, const std::string& assignee, const std::string& actor, const TransitionOptions& options) {
  const auto& machine = jobs_.machine();
  return jobs_.Mutate(
      job_id, "assign", actor,
      [&](ResourceRecord& job) {
        if (assignee.empty()) {
          throw util::ValidationError("assignee must not be empty");
        }
        if (machine.IsTerminal(job.state)) {
          throw util::InvalidTransitionError("job " + std::to_string(job.id) + " is " + job.state + " and cannot be reassigned");
        }
        job.assignee = assignee;
      },
      options);
}

google::protobuf::Struct JobWorkflow::AppendHistory(int64_t job_id, const google::protobuf::Value& entry, const std::string& actor,
                                                    std::optional<std::size_t> max_length) {
  fields::UpdateContext ctx;
  ctx.actor = actor;
  return fields_.AppendToArray(job_id, "history", std::string(kHistoryKey), entry, max_length, ctx);
}

} // namespace flowlock::workflow
