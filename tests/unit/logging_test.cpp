#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/config/config_loader.hpp"

namespace {

using flowlock::observability::BoolField;
using flowlock::observability::IntField;
using flowlock::observability::StringField;
using flowlock::observability::UIntField;

// Routes the default logger into out with a bare message pattern.
void Capture(std::ostringstream& out, spdlog::level::level_enum level) {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
}

void TestFieldsAreAppendedAsKeyValuePairs() {
  std::ostringstream out;
  Capture(out, spdlog::level::debug);

  FLOWLOCK_LOG_INFO("lock acquired", {StringField("key", "ticket:7"), IntField("attempt", -2), UIntField("rows", 3),
                                      BoolField("wal_mode", true)});
  assert(out.str() == "lock acquired key=ticket:7 attempt=-2 rows=3 wal_mode=true\n");

  out.str("");
  FLOWLOCK_LOG_WARN("no fields");
  assert(out.str() == "no fields\n");
}

void TestValuesWithSeparatorsAreQuoted() {
  std::ostringstream out;
  Capture(out, spdlog::level::debug);

  FLOWLOCK_LOG_ERROR("audit append failed",
                     {StringField("error", "constraint failed: seq=4"), StringField("actor", ""), StringField("quote", "say \"hi\"")});
  assert(out.str() == "audit append failed error=\"constraint failed: seq=4\" actor=\"\" quote=\"say \\\"hi\\\"\"\n");
}

void TestLevelFiltersBeforeFormatting() {
  std::ostringstream out;
  Capture(out, spdlog::level::warn);

  FLOWLOCK_LOG_DEBUG("retrying operation", {StringField("operation", "ticket.escalate")});
  FLOWLOCK_LOG_INFO("workflow mutation applied");
  assert(out.str().empty());

  FLOWLOCK_LOG_WARN("retry abandoned: deadline would pass");
  assert(out.str() == "retry abandoned: deadline would pass\n");
}

void TestLevelComesFromEnvironmentThenConfig() {
  auto config = flowlock::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("debug");

  unsetenv("FLOWLOCK_LOG_LEVEL");
  flowlock::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  setenv("FLOWLOCK_LOG_LEVEL", "error", 1);
  flowlock::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::err);
  unsetenv("FLOWLOCK_LOG_LEVEL");

  config.mutable_logging()->clear_level();
  flowlock::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);
}

} // namespace

int main() {
  TestFieldsAreAppendedAsKeyValuePairs();
  TestValuesWithSeparatorsAreQuoted();
  TestLevelFiltersBeforeFormatting();
  TestLevelComesFromEnvironmentThenConfig();

  std::cout << "flowlock_unit_logging: pass\n";
  return 0;
}
