/**
 * @file test_plan_graph_workflow.cpp
 * @brief Integration tests: plan file -> validated graph -> queries and views
 */

#include "Planwright/core/logger.hpp"
#include "Planwright/plan/plan_graph.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace Planwright;
using namespace Planwright::plan;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

const std::string kFixtures = PLANWRIGHT_TEST_FIXTURES_DIR;

std::string fixture(const std::string& name) {
  return kFixtures + "/" + name;
}

class TestDirectory {
public:
  TestDirectory() {
    m_path = fs::temp_directory_path() / "planwright_test_workflow";
    fs::create_directories(m_path);
  }

  ~TestDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  std::string writeFile(const std::string& name, const std::string& content) {
    std::ofstream out(m_path / name);
    out << content;
    return (m_path / name).string();
  }

private:
  fs::path m_path;
};

const char* kSmallPlan = R"(<?xml version="1.0"?>
<plan version="1.0">
  <epic id="X1" status="pending">
    <description>Replacement</description>
    <story id="Y1" status="pending">
      <task id="Z1" status="pending"/>
    </story>
  </epic>
</plan>)";

} // namespace

TEST_CASE("Sample plan builds into the expected graph", "[integration][plan_graph]") {
  PlanGraph plans;
  auto built = plans.buildFromXml(fixture("sample_plan.xml"));
  INFO((built.isError() ? built.error().format() : std::string()));
  REQUIRE(built.isOk());

  const DependencyGraph& graph = plans.graph();
  CHECK(graph.nodeCount() == 12);
  CHECK(graph.countNodes(NodeKind::Epic) == 2);
  CHECK(graph.countNodes(NodeKind::Story) == 3);
  CHECK(graph.countNodes(NodeKind::Task) == 7);
  CHECK(graph.countEdges(EdgeType::ComponentOf) == 10);
  CHECK(graph.countEdges(EdgeType::DependsOn) == 6);

  CHECK(graph.hasEdge("task5", "task4", EdgeType::DependsOn));
  CHECK(graph.hasEdge("task7", "docs-review", EdgeType::DependsOn));
  CHECK_FALSE(graph.contains("docs-review"));

  const PlanNode* story1 = graph.findNode("story1");
  REQUIRE(story1 != nullptr);
  REQUIRE(kindOf(*story1) == NodeKind::Story);
  CHECK(std::get<StoryNode>(*story1).points == 5);
  CHECK(infoOf(*story1).description == "Implement base model classes");
  CHECK(infoOf(*story1).status == Status::Complete);

  const PlanNode* task6 = graph.findNode("task6");
  REQUIRE(task6 != nullptr);
  CHECK(infoOf(*task6).priority == 1);

  REQUIRE(plans.plan().has_value());
  CHECK(plans.plan()->version == "1.0");
  CHECK(plans.plan()->epics.size() == 2);
  CHECK(plans.droppedElements().empty());
}

TEST_CASE("Sample plan queries and views", "[integration][plan_graph]") {
  PlanGraph plans;
  REQUIRE(plans.buildFromXml(fixture("sample_plan.xml")).isOk());

  SECTION("Ready tasks") {
    CHECK(plans.getReadyTasks(ReadyTasksOptions{false}) ==
          std::vector<std::string>{"task2", "task6"});
    CHECK(plans.getReadyTasks(ReadyTasksOptions{true}) ==
          std::vector<std::string>{"task2", "task4", "task6"});
  }

  SECTION("Ready tasks from an option map") {
    auto ready = plans.getReadyTasks(OptionMap{{"include_in_progress", "yes"}});
    REQUIRE(ready.isOk());
    CHECK(ready.value() == std::vector<std::string>{"task2", "task4", "task6"});
  }

  SECTION("Outline") {
    const std::string outline = plans.toOutline(OutlineOptions{true});
    CHECK_THAT(outline, StartsWith("- epic1: Implement core model system (in_progress)\n"
                                   "  - story1: Implement base model classes (complete)\n"
                                   "    - task1: Create Task model (complete)\n"));
    CHECK_THAT(outline, ContainsSubstring("\n- epic2: Ship command line tool (pending)\n"));
    CHECK_THAT(outline, !ContainsSubstring("docs-review"));
  }

  SECTION("Flowchart") {
    auto chart = plans.toFlowchart(OptionMap{});
    REQUIRE(chart.isOk());
    CHECK_THAT(chart.value(), StartsWith("graph TD\n"));
    CHECK_THAT(chart.value(), ContainsSubstring(
                                  "    task2[Create Story model] -.-> task1[Create Task model]"));
    CHECK_THAT(chart.value(), ContainsSubstring("    task7[Publish release notes] -.-> docs-review"));
  }

  SECTION("DOT") {
    auto dot = plans.toDot(OptionMap{{"include_descriptions", "false"}});
    REQUIRE(dot.isOk());
    CHECK_THAT(dot.value(), StartsWith("digraph {\n"));
    CHECK_THAT(dot.value(), ContainsSubstring("    \"story1\" -> \"epic1\";"));
    CHECK_THAT(dot.value(), ContainsSubstring("    \"task3\" -> \"task2\" [style=dashed];"));
  }

  SECTION("Malformed option maps are rejected without touching the graph") {
    auto outline = plans.toOutline(OptionMap{{"include_status", "perhaps"}});
    REQUIRE(outline.isError());
    CHECK(outline.error().kind == PlanErrorKind::InvalidOptions);

    auto ready = plans.getReadyTasks(OptionMap{{"colour", "true"}});
    REQUIRE(ready.isError());
    CHECK(ready.error().kind == PlanErrorKind::InvalidOptions);

    CHECK(plans.graph().nodeCount() == 12);
  }
}

TEST_CASE("Partially invalid plan keeps the valid elements", "[integration][plan_graph]") {
  std::vector<std::string> warnings;
  core::Logger::instance().addLogCallback([&warnings](core::LogLevel level, const std::string& msg) {
    if (level == core::LogLevel::Warning) {
      warnings.push_back(msg);
    }
  });

  PlanGraph plans;
  auto built = plans.buildFromXml(fixture("partial_plan.xml"));
  core::Logger::instance().clearLogCallbacks();

  INFO((built.isError() ? built.error().format() : std::string()));
  REQUIRE(built.isOk());
  CHECK(plans.graph().nodeIds() == std::vector<std::string>{"E1", "S1", "T1"});
  CHECK(plans.plan()->version == "2.3");

  const auto& dropped = plans.droppedElements();
  REQUIRE(dropped.size() == 5);
  CHECK(dropped[0].id == "T2");
  CHECK(dropped[1].id.empty());
  CHECK(dropped[2].id == "T3");
  CHECK(dropped[3].id == "S2");
  CHECK(dropped[3].kind == NodeKind::Story);
  CHECK(dropped[4].id == "E2");
  CHECK_FALSE(plans.graph().contains("T4"));

  if (core::Logger::instance().getLevel() <= core::LogLevel::Warning) {
    CHECK(warnings.size() >= dropped.size());
  }
}

TEST_CASE("Rebuilding replaces the previous graph", "[integration][plan_graph]") {
  PlanGraph plans;
  REQUIRE(plans.buildFromXml(fixture("sample_plan.xml")).isOk());

  SECTION("Same file twice gives the same graph") {
    const auto ids = plans.graph().nodeIds();
    const auto edges = plans.graph().edges();
    REQUIRE(plans.buildFromXml(fixture("sample_plan.xml")).isOk());
    CHECK(plans.graph().nodeIds() == ids);
    CHECK(plans.graph().edges() == edges);
  }

  SECTION("A different plan drops the old nodes") {
    REQUIRE(plans.buildFromString(kSmallPlan, "small").isOk());
    CHECK(plans.graph().nodeIds() == std::vector<std::string>{"X1", "Y1", "Z1"});
    CHECK_FALSE(plans.graph().contains("epic1"));
    CHECK(plans.getReadyTasks(ReadyTasksOptions{}) == std::vector<std::string>{"Z1"});
  }
}

TEST_CASE("Failed builds keep the previous graph", "[integration][plan_graph]") {
  PlanGraph plans;
  REQUIRE(plans.buildFromXml(fixture("sample_plan.xml")).isOk());
  const auto ids = plans.graph().nodeIds();

  SECTION("Schema violation") {
    auto built = plans.buildFromXml(fixture("invalid_plan.xml"));
    REQUIRE(built.isError());
    CHECK(built.error().kind == PlanErrorKind::SchemaViolation);
  }

  SECTION("Malformed document") {
    auto built = plans.buildFromXml(fixture("malformed_plan.xml"));
    REQUIRE(built.isError());
    CHECK(built.error().kind == PlanErrorKind::MalformedDocument);
  }

  SECTION("Missing file") {
    auto built = plans.buildFromXml(fixture("no_such_plan.xml"));
    REQUIRE(built.isError());
    CHECK(built.error().kind == PlanErrorKind::IOFailure);
  }

  SECTION("Malformed text") {
    auto built = plans.buildFromString("<plan><epic", "broken");
    REQUIRE(built.isError());
    CHECK(built.error().kind == PlanErrorKind::MalformedDocument);
  }

  CHECK(plans.graph().nodeIds() == ids);
  REQUIRE(plans.plan().has_value());
  CHECK(plans.plan()->epics.size() == 2);
}

TEST_CASE("validateXml does not build", "[integration][plan_graph]") {
  PlanGraph plans;
  CHECK(plans.validateXml(fixture("sample_plan.xml")).isOk());
  CHECK(plans.graph().empty());
  CHECK_FALSE(plans.plan().has_value());

  TestDirectory dir;
  const std::string path = dir.writeFile("tiny.xml", kSmallPlan);
  CHECK(plans.validateXml(path).isOk());
  REQUIRE(plans.buildFromXml(path).isOk());
  CHECK(plans.graph().nodeCount() == 3);
}

TEST_CASE("Queries on a fresh engine are empty", "[integration][plan_graph]") {
  PlanGraph plans;
  CHECK(plans.getReadyTasks(ReadyTasksOptions{}).empty());
  CHECK(plans.toOutline(OutlineOptions{}).empty());
  CHECK(plans.toFlowchart(FlowchartOptions{}) == "graph TD");
  CHECK(plans.toDot(DotOptions{}) == "digraph {\n}");
}
