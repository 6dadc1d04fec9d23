#include "ciflow/config/workflow_loader.hpp"

#include "ciflow/graph/job_graph.hpp"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <variant>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace ciflow;
using namespace ciflow::test;

namespace {

constexpr const char* kPipeline = R"(
name: CI
on: [push]

env:
  REGISTRY: ghcr.io
  TAG: latest

jobs:
  lint:
    runs-on: ubuntu-latest
    steps:
      - uses: actions/checkout@v4
      - name: Lint
        run: make lint

  test:
    needs: lint
    timeout-minutes: 15
    strategy:
      matrix:
        os: [ubuntu, macos]
        python-version: ['3.11', '3.12']
    steps:
      - run: pytest
      - name: Upload logs
        if: '${{ failure() }}'
        run: ./upload.sh

  build:
    needs: [lint, test]
    working-directory: app
    steps:
      - run: make build

  notify:
    needs: [build]
    if: '${{ always() }}'
    steps:
      - run: ./notify.sh

  deploy:
    needs: build
    if: "needs.build.result == 'success' && env.TAG != ''"
    steps:
      - run: ./deploy.sh
)";

auto error_of(std::string_view yaml) -> ErrorDetail {
  auto result = WorkflowLoader::load_from_string(yaml);
  EXPECT_FALSE(result.has_value()) << yaml;
  return result ? ErrorDetail{} : result.error();
}

}  // namespace

TEST(WorkflowLoaderTest, LoadsPipelineInDeclarationOrder) {
  auto result = WorkflowLoader::load_from_string(kPipeline);
  ASSERT_TRUE(result.has_value()) << result.error().message;

  const auto& wf = *result;
  EXPECT_EQ(wf.name, "CI");
  EXPECT_EQ(wf.env, (EnvList{{"REGISTRY", "ghcr.io"}, {"TAG", "latest"}}));
  ASSERT_EQ(wf.jobs.size(), 5u);
  EXPECT_EQ(wf.jobs[0].id.str(), "lint");
  EXPECT_EQ(wf.jobs[1].id.str(), "test");
  EXPECT_EQ(wf.jobs[2].id.str(), "build");
  EXPECT_EQ(wf.jobs[3].id.str(), "notify");
  EXPECT_EQ(wf.jobs[4].id.str(), "deploy");
}

TEST(WorkflowLoaderTest, ReadsSteps) {
  auto wf = WorkflowLoader::load_from_string(kPipeline);
  ASSERT_TRUE(wf.has_value());

  const auto& lint = wf->jobs[0];
  EXPECT_EQ(lint.name, "lint");
  ASSERT_EQ(lint.steps.size(), 2u);
  EXPECT_EQ(lint.steps[0].uses, "actions/checkout@v4");
  EXPECT_TRUE(lint.steps[0].run.empty());
  EXPECT_EQ(lint.steps[1].name, "Lint");
  EXPECT_EQ(lint.steps[1].run, "make lint");

  const auto& test = wf->jobs[1];
  ASSERT_EQ(test.steps.size(), 2u);
  EXPECT_TRUE(test.steps[0].condition.empty());
  EXPECT_EQ(test.steps[1].condition, "failure()");
}

TEST(WorkflowLoaderTest, NeedsAcceptsScalarOrList) {
  auto wf = WorkflowLoader::load_from_string(kPipeline);
  ASSERT_TRUE(wf.has_value());

  EXPECT_TRUE(wf->jobs[0].needs.empty());
  EXPECT_EQ(wf->jobs[1].needs, (std::vector<JobId>{job_id("lint")}));
  EXPECT_EQ(wf->jobs[2].needs,
            (std::vector<JobId>{job_id("lint"), job_id("test")}));
  EXPECT_EQ(wf->jobs[4].needs, (std::vector<JobId>{job_id("build")}));
}

TEST(WorkflowLoaderTest, ReadsConditions) {
  auto wf = WorkflowLoader::load_from_string(kPipeline);
  ASSERT_TRUE(wf.has_value());

  EXPECT_TRUE(std::holds_alternative<DefaultCondition>(wf->jobs[2].condition));
  EXPECT_TRUE(std::holds_alternative<AlwaysCondition>(wf->jobs[3].condition));
  const auto* custom = std::get_if<CustomCondition>(&wf->jobs[4].condition);
  ASSERT_NE(custom, nullptr);
  EXPECT_EQ(custom->expression, "needs.build.result == 'success' && env.TAG != ''");
}

TEST(WorkflowLoaderTest, ReadsMatrixTimeoutAndWorkingDirectory) {
  auto wf = WorkflowLoader::load_from_string(kPipeline);
  ASSERT_TRUE(wf.has_value());

  const auto& test = wf->jobs[1];
  ASSERT_EQ(test.matrix.size(), 2u);
  EXPECT_EQ(test.matrix[0].name, "os");
  EXPECT_EQ(test.matrix[0].values, (std::vector<std::string>{"ubuntu", "macos"}));
  EXPECT_EQ(test.matrix[1].name, "python-version");
  EXPECT_EQ(test.matrix[1].values, (std::vector<std::string>{"3.11", "3.12"}));
  EXPECT_EQ(test.timeout, std::chrono::minutes(15));

  EXPECT_EQ(wf->jobs[0].timeout, std::chrono::seconds(0));
  EXPECT_EQ(wf->jobs[2].working_dir, "app");
}

TEST(WorkflowLoaderTest, LoadedPipelineBuildsGraph) {
  auto wf = WorkflowLoader::load_from_string(kPipeline);
  ASSERT_TRUE(wf.has_value());

  auto graph = JobGraph::build(*wf);
  ASSERT_TRUE(graph.has_value()) << graph.error().message;
  EXPECT_EQ(graph->template_count(), 5u);
  EXPECT_EQ(graph->size(), 8u);
  EXPECT_EQ(graph->workflow_name(), "CI");
  EXPECT_EQ(graph->instances_of(graph->find_job("test")).size(), 4u);
}

TEST(WorkflowLoaderTest, MatrixIncludeIsIgnored) {
  auto wf = WorkflowLoader::load_from_string(R"(
jobs:
  test:
    strategy:
      matrix:
        os: [linux]
        include:
          - os: windows
    steps:
      - run: true
)");
  ASSERT_TRUE(wf.has_value());
  ASSERT_EQ(wf->jobs[0].matrix.size(), 1u);
  EXPECT_EQ(wf->jobs[0].matrix[0].name, "os");
}

TEST(WorkflowLoaderTest, StructuralProblemsAreLeftToGraph) {
  auto wf = WorkflowLoader::load_from_string(R"(
jobs:
  a:
    needs: b
  b:
    needs: a
)");
  ASSERT_TRUE(wf.has_value());
  auto graph = JobGraph::build(*wf);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error().code, make_error_code(Error::CyclicDependency));
}

TEST(WorkflowLoaderTest, ParseRunCondition) {
  EXPECT_TRUE(std::holds_alternative<DefaultCondition>(parse_run_condition("")));
  EXPECT_TRUE(std::holds_alternative<DefaultCondition>(
      parse_run_condition("${{ success() }}")));
  EXPECT_TRUE(
      std::holds_alternative<AlwaysCondition>(parse_run_condition("always()")));
  EXPECT_TRUE(std::holds_alternative<AlwaysCondition>(
      parse_run_condition("  ${{always()}}  ")));
  EXPECT_EQ(parse_run_condition("${{ failure() }}"),
            RunCondition{CustomCondition{"failure()"}});
}

TEST(WorkflowLoaderTest, RejectsMalformedDocuments) {
  EXPECT_EQ(error_of("jobs: [unclosed").code, make_error_code(Error::ParseError));
  EXPECT_EQ(error_of("- just\n- a list\n").code,
            make_error_code(Error::ParseError));
  EXPECT_EQ(error_of("name: empty\n").code, make_error_code(Error::ParseError));
  EXPECT_EQ(error_of("jobs: {}\n").code, make_error_code(Error::ParseError));
  EXPECT_EQ(error_of("jobs:\n  a: 3\n").code, make_error_code(Error::ParseError));
}

TEST(WorkflowLoaderTest, RejectsBadJobFields) {
  auto axis = error_of(R"(
jobs:
  test:
    strategy:
      matrix:
        os: linux
)");
  EXPECT_EQ(axis.code, make_error_code(Error::InvalidMatrix));
  EXPECT_NE(axis.message.find("os"), std::string::npos);

  auto nested = error_of(R"(
jobs:
  test:
    strategy:
      matrix:
        os: [[linux]]
)");
  EXPECT_EQ(nested.code, make_error_code(Error::InvalidMatrix));

  auto timeout = error_of(R"(
jobs:
  test:
    timeout-minutes: -1
)");
  EXPECT_EQ(timeout.code, make_error_code(Error::InvalidArgument));
}

TEST(WorkflowLoaderTest, LoadFromFileRecordsSource) {
  std::string path = "/tmp/ciflow_workflow_loader_test.yaml";
  {
    std::ofstream out(path);
    out << kPipeline;
  }

  auto wf = WorkflowLoader::load_from_file(path);
  ASSERT_TRUE(wf.has_value()) << wf.error().message;
  EXPECT_EQ(wf->source_file, path);
  EXPECT_EQ(wf->jobs.size(), 5u);

  std::remove(path.c_str());
}

TEST(WorkflowLoaderTest, MissingFileIsFileNotFound) {
  auto wf = WorkflowLoader::load_from_file("/nonexistent/workflow.yaml");
  ASSERT_FALSE(wf.has_value());
  EXPECT_EQ(wf.error().code, make_error_code(Error::FileNotFound));
}
