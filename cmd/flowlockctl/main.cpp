#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/fields/structured_field.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

using flowlock::db::model::ResourceRecord;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowlockctl [--config <config.yaml>] <command> ...\n"
            << "\n"
            << "  create <job|ticket> <id> <state> [parent_id] [assignee]\n"
            << "  get <job|ticket> <id>\n"
            << "  transition <job|ticket> <id> <to_state> [from_state]\n"
            << "  escalate <ticket_id> [new_assignee]\n"
            << "  merge-field <job|ticket> <id> <other_info|history> <json_object>\n"
            << "  append <job|ticket> <id> <other_info|history> <array_key> <json_value> [max_length]\n"
            << "  audit <id> [since_ms]\n"
            << "  lock-status <job|ticket> <id>\n";
}

static std::string Actor() {
  if (const char* actor = std::getenv("FLOWLOCK_ACTOR")) {
    return actor;
  }
  return "flowlockctl";
}

static void PrintRecord(const ResourceRecord& r) {
  std::cout << "id=" << r.id << " kind=" << r.kind << " state=" << r.state << " version=" << r.version << " parent_id=" << r.parent_id
            << " level=" << r.level << " assignee=" << r.assignee << " started_at_ms=" << r.started_at_ms
            << " completed_at_ms=" << r.completed_at_ms << " updated_at_ms=" << r.updated_at_ms << "\n"
            << "other_info=" << r.other_info << "\n"
            << "history=" << r.history << "\n";
}

template <typename Message>
static bool ParseJsonArg(const std::string& text, Message* out) {
  auto status = google::protobuf::util::JsonStringToMessage(text, out);
  if (!status.ok()) {
    std::cerr << "invalid json: " << status.message() << "\n";
    return false;
  }
  return true;
}

static int Run(flowlock::factory::Engine& engine, const std::vector<std::string>& args) {
  const auto& cmd   = args[0];
  const auto  actor = Actor();

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (args.size() < 4) return 1;

    ResourceRecord record;
    record.id    = std::stoll(args[2]);
    record.state = args[3];
    if (args.size() >= 5) record.parent_id = std::stoll(args[4]);
    if (args.size() >= 6) record.assignee = args[5];

    PrintRecord(engine.ServiceFor(args[1]).Create(record, actor));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (args.size() < 3) return 1;

    PrintRecord(engine.ServiceFor(args[1]).Get(std::stoll(args[2])));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "transition") {
    if (args.size() < 4) return 1;

    flowlock::workflow::TransitionRequest request;
    request.resource_id = std::stoll(args[2]);
    request.to_state    = args[3];
    request.actor       = actor;
    if (args.size() >= 5) request.from_state = args[4];

    PrintRecord(engine.ServiceFor(args[1]).Transition(request));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "escalate") {
    if (args.size() < 2) return 1;

    std::optional<std::string> assignee;
    if (args.size() >= 3) assignee = args[2];

    PrintRecord(engine.ticket_workflow->Escalate(std::stoll(args[1]), assignee, actor));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "merge-field") {
    if (args.size() < 5) return 1;

    google::protobuf::Struct updates;
    if (!ParseJsonArg(args[4], &updates)) return 1;

    flowlock::fields::UpdateContext ctx;
    ctx.actor = actor;

    auto merged = engine.FieldsFor(args[1]).MergeField(std::stoll(args[2]), args[3], updates, ctx);
    std::cout << flowlock::fields::SerializeField(merged) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "append") {
    if (args.size() < 6) return 1;

    google::protobuf::Value item;
    if (!ParseJsonArg(args[5], &item)) return 1;

    std::optional<std::size_t> max_length;
    if (args.size() >= 7) max_length = std::stoull(args[6]);

    flowlock::fields::UpdateContext ctx;
    ctx.actor = actor;

    auto updated = engine.FieldsFor(args[1]).AppendToArray(std::stoll(args[2]), args[3], args[4], item, max_length, ctx);
    std::cout << flowlock::fields::SerializeField(updated) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    if (args.size() < 2) return 1;

    uint64_t since_ms = 0;
    if (args.size() >= 3) since_ms = std::stoull(args[2]);

    auto cursor = engine.audit->Query(std::stoll(args[1]), since_ms);
    while (auto entry = cursor.Next()) {
      std::cout << entry->seq << " " << entry->timestamp_ms << " " << entry->entity_type << " " << entry->operation_type << " "
                << entry->outcome << " actor=" << entry->actor << " lock_wait_ms=" << entry->lock_wait_ms
                << " tx_duration_ms=" << entry->tx_duration_ms << " correlation_id=" << entry->correlation_id << "\n"
                << "  old=" << entry->old_value << "\n"
                << "  new=" << entry->new_value << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lock-status") {
    if (args.size() < 3) return 1;

    const auto key    = engine.mutex->ResourceKey(engine.ServiceFor(args[1]).EntityType(), std::stoll(args[2]));
    const auto holder = engine.mutex->Holder(key);
    std::cout << key << " " << (holder ? "held token=" + *holder : std::string("free")) << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = config_path.empty() ? flowlock::config::ConfigLoader::Defaults() : flowlock::config::ConfigLoader::LoadFromYaml(config_path);

    flowlock::observability::InitializeTracing(config);
    flowlock::observability::InitializeMetrics(config);
    flowlock::observability::InitializeLogging(config);

    auto engine = flowlock::factory::BuildEngine(config);
    int  rc     = Run(engine, args);
    if (rc == 1) Usage();

    flowlock::observability::ShutdownLogging();
    flowlock::observability::ShutdownMetrics();
    flowlock::observability::ShutdownTracing();
    return rc;
  } catch (const flowlock::util::WorkflowError& e) {
    std::cerr << flowlock::util::KindName(e.kind()) << ": " << flowlock::util::PublicMessage(e) << " (correlation_id=" << e.correlation_id()
              << ")\n";
    flowlock::observability::ShutdownLogging();
    flowlock::observability::ShutdownMetrics();
    flowlock::observability::ShutdownTracing();
    return 2;
  } catch (const std::exception& e) {
    FLOWLOCK_LOG_ERROR("Fatal error", {flowlock::observability::StringField("error", e.what())});
    flowlock::observability::ShutdownLogging();
    flowlock::observability::ShutdownMetrics();
    flowlock::observability::ShutdownTracing();
    return 3;
  }
}
