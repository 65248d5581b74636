// Fuzz testing for the Planwright plan pipeline using libFuzzer
// Arbitrary bytes go through load -> schema check -> parse -> graph -> render

#include "Planwright/core/logger.hpp"
#include "Planwright/plan/plan_graph.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace Planwright;

// libFuzzer entry point
// See: https://llvm.org/docs/LibFuzzer.html
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* Data, size_t Size) {
  static bool quiet = [] {
    core::Logger::instance().setLevel(core::LogLevel::Off);
    return true;
  }();
  (void)quiet;

  std::string input(reinterpret_cast<const char*>(Data), Size);

  plan::PlanGraph plans;
  auto built = plans.buildFromString(input, "fuzz");

  // Rejected input is a normal outcome
  if (built.isError()) {
    (void)built.error().format();
    return 0;
  }

  (void)plans.getReadyTasks(plan::ReadyTasksOptions{true});
  (void)plans.toOutline(plan::OutlineOptions{});
  (void)plans.toFlowchart(plan::FlowchartOptions{});
  (void)plans.toDot(plan::DotOptions{});

  return 0; // Non-zero return values are reserved for future use
}
