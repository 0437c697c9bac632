#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/logging.hpp"

namespace {

using core::logging::LogLevel;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void TestParseLevel() {
  Assert(core::logging::ParseLevel("ERROR") == LogLevel::kError, "error level");
  Assert(core::logging::ParseLevel("warning") == LogLevel::kWarn, "warning alias");
  Assert(core::logging::ParseLevel("Debug") == LogLevel::kDebug, "debug level");
  Assert(core::logging::ParseLevel("bogus") == LogLevel::kInfo, "unknown falls back to info");
}

void TestLevelFilteringAndStream() {
  std::ostringstream sink;
  core::logging::SetLogStream(&sink);
  core::logging::SetLogLevel(LogLevel::kWarn);

  core::logging::LogInfo("hidden info");
  core::logging::LogWarn("visible warning");
  Assert(sink.str().find("hidden info") == std::string::npos, "info is filtered at warn");
  Assert(sink.str().find("[WARN] visible warning") != std::string::npos,
         "warn is written with its tag");

  core::logging::SetLogLevel(LogLevel::kDebug);
  Assert(core::logging::IsDebugEnabled(), "debug enabled");
  core::logging::LogDebug("trace");
  Assert(sink.str().find("[DEBUG] trace") != std::string::npos, "debug is written");

  core::logging::SetLogStream(nullptr);
  core::logging::LogError("dropped");
  Assert(sink.str().find("dropped") == std::string::npos, "null stream silences output");

  core::logging::SetLogStream(&std::cerr);
  core::logging::SetLogLevel(LogLevel::kWarn);
}

}  // namespace

int main() {
  try {
    TestParseLevel();
    TestLevelFilteringAndStream();
  } catch (const std::exception& ex) {
    std::cerr << "logging_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
