#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/fields/field_updater.hpp"
#include "internal/workflow/transition_service.hpp"

namespace flowlock::workflow {

/*
  Job workflow: scheduled tasks (tours) and their checkpoints.

  A tour is a job row with children; each checkpoint is a job row whose
  parent_id is the tour. Operations touching both go through the coupled /
  family paths of TransitionService so tour and checkpoints never disagree.
*/
class JobWorkflow {
 public:
  static constexpr std::string_view kHistoryKey = "job_history";

  JobWorkflow(TransitionService& jobs, fields::FieldUpdater& fields);

  ResourceRecord Start(int64_t job_id, const std::string& actor, const TransitionOptions& options = {});

  // completed_at_ms defaults to now.
  ResourceRecord Complete(int64_t job_id, const std::string& actor, std::optional<uint64_t> completed_at_ms = std::nullopt,
                          const TransitionOptions& options = {});

  // Closes a tour that ran out of time. ASSIGNED checkpoints become
  // AUTOCLOSED; the tour becomes PARTIALLYCOMPLETED when some but not all
  // checkpoints completed, AUTOCLOSED otherwise. Returns tour first, then
  // the checkpoints that changed.
  std::vector<ResourceRecord> AutoClose(int64_t tour_id, const std::string& actor, const TransitionOptions& options = {});

  // Merges data into the checkpoint's other_info (and optionally moves its
  // state) while advancing the tour in the same transaction.
  std::pair<ResourceRecord, ResourceRecord> SaveCheckpoint(int64_t checkpoint_id, int64_t tour_id, const google::protobuf::Struct& data,
                                                           const std::optional<std::string>& state, const std::string& actor,
                                                           const TransitionOptions& options = {});

  ResourceRecord Assign(int64_t job_id, const std::string& assignee, const std::string& actor, const TransitionOptions& options = {});

  google::protobuf::Struct AppendHistory(int64_t job_id, const google::protobuf::Value& entry, const std::string& actor,
                                         std::optional<std::size_t> max_length = std::nullopt);

 private:
  TransitionService&    jobs_;
  fields::FieldUpdater& fields_;
};

} // namespace flowlock::workflow
