#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using netmap::observability::BoolField;
using netmap::observability::DoubleField;
using netmap::observability::FormatFields;
using netmap::observability::IntField;
using netmap::observability::ScopedLogContext;
using netmap::observability::StringField;

void TestValuesAreQuotedWhenNeeded() {
  assert(FormatFields({StringField("ip", "10.0.0.1"), StringField("reason", "link addresses aliased"), BoolField("trusted", true)}) ==
         R"(ip=10.0.0.1 reason="link addresses aliased" trusted=true)");
  assert(FormatFields({StringField("label", "")}) == R"(label="")");
  assert(FormatFields({StringField("name", R"(eth"0)")}) == R"(name="eth\"0")");
  assert(FormatFields({StringField("cidr", "a=b")}) == R"(cidr="a=b")");
  assert(FormatFields({DoubleField("confidence", 0.75)}) == "confidence=0.75");
}

void TestContextScopesNest() {
  {
    ScopedLogContext batch({StringField("source", "r1")});
    assert(FormatFields({IntField("accepted", 3)}) == "source=r1 accepted=3");
    {
      ScopedLogContext retry({IntField("attempt", 2)});
      assert(FormatFields({}) == "source=r1 attempt=2");
    }
    assert(FormatFields({}) == "source=r1");

    // per thread: a worker logging at the same time sees none of it
    auto other = std::async(std::launch::async, [] { return FormatFields({}); });
    assert(other.get().empty());
  }
  assert(FormatFields({}).empty());
}

void TestLinesCarryTheContext() {
  std::ostringstream captured;
  auto               sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
  auto               logger = std::make_shared<spdlog::logger>("netmap_logging_test", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);

  {
    ScopedLogContext batch({StringField("source", "r1")});
    NETMAP_LOG_INFO("batch committed", {IntField("accepted", 1)});
  }
  NETMAP_LOG_DEBUG("idle");
  assert(captured.str() == "batch committed source=r1 accepted=1\nidle\n");
}

void TestUnknownLevelFallsBackToInfo() {
  ::unsetenv("NETMAP_LOG_LEVEL");

  netmap::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("chatty");
  netmap::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.mutable_logging()->set_level("debug");
  netmap::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  config.mutable_logging()->set_level("off");
  netmap::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::off);
}

} // namespace

int main() {
  TestValuesAreQuotedWhenNeeded();
  TestContextScopesNest();
  TestLinesCarryTheContext();
  TestUnknownLevelFallsBackToInfo();

  std::cout << "netmap_unit_logging: pass\n";
  return 0;
}
