#include "ciflow/report/report.hpp"

#include "ciflow/run/run_state.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace ciflow;
using namespace ciflow::test;

namespace {

auto instance(std::string_view id, JobStatus status,
              FailureCause cause = FailureCause::None) -> InstanceReport {
  InstanceReport r;
  r.id = instance_id(id);
  r.job = job_id(id);
  r.status = status;
  r.cause = cause;
  return r;
}

}  // namespace

class ReportTest : public ::testing::Test {
protected:
  // lint, test[py=3.11], test[py=3.12] -> build
  void SetUp() override {
    auto test = make_job("test", {"lint"});
    add_axis(test, "py", {"3.11", "3.12"});
    auto g = JobGraph::build(make_workflow(
        {make_job("lint"), std::move(test), make_job("build", {"test"})}, "ci"));
    ASSERT_TRUE(g.has_value());
    graph_ = std::make_shared<const JobGraph>(std::move(*g));
    state_ = std::make_unique<RunState>(run_id("run_report"), graph_);
  }

  auto succeed(NodeIndex idx) -> void {
    ASSERT_TRUE(state_->mark_ready(idx));
    ASSERT_TRUE(state_->mark_running(idx));
    state_->append_output(idx, "ok\n");
    ASSERT_TRUE(state_->mark_succeeded(idx, 0));
  }

  auto fail(NodeIndex idx, int code) -> void {
    ASSERT_TRUE(state_->mark_ready(idx));
    ASSERT_TRUE(state_->mark_running(idx));
    ASSERT_TRUE(state_->mark_failed(idx, FailureCause::ExitCode, code,
                                    "exited with code " + std::to_string(code)));
  }

  auto skip(NodeIndex idx) -> void {
    ASSERT_TRUE(state_->mark_blocked(idx));
    ASSERT_TRUE(state_->mark_skipped(idx));
  }

  std::shared_ptr<const JobGraph> graph_;
  std::unique_ptr<RunState> state_;
};

TEST(VerdictTest, SkippedNeverFailsRun) {
  std::vector<InstanceReport> all_ok{instance("a", JobStatus::Succeeded),
                                     instance("b", JobStatus::Skipped)};
  EXPECT_EQ(compute_verdict(all_ok), Verdict::Success);

  std::vector<InstanceReport> failed{instance("a", JobStatus::Succeeded),
                                     instance("b", JobStatus::Failed)};
  EXPECT_EQ(compute_verdict(failed), Verdict::Failure);

  std::vector<InstanceReport> cancelled{instance("a", JobStatus::Cancelled)};
  EXPECT_EQ(compute_verdict(cancelled), Verdict::Failure);

  EXPECT_EQ(compute_verdict({}), Verdict::Success);
}

TEST(VerdictTest, Names) {
  EXPECT_EQ(verdict_name(Verdict::Success), "success");
  EXPECT_EQ(parse_verdict("failure"), Verdict::Failure);
  EXPECT_FALSE(parse_verdict("maybe").has_value());
}

TEST_F(ReportTest, AggregatesFailedRun) {
  succeed(0);
  succeed(1);
  fail(2, 1);
  skip(3);

  auto report = aggregate(*state_, false);
  EXPECT_EQ(report.run_id.str(), "run_report");
  EXPECT_EQ(report.workflow, "ci");
  EXPECT_EQ(report.verdict, Verdict::Failure);
  EXPECT_FALSE(report.cancelled);
  ASSERT_EQ(report.instances.size(), 4u);
  EXPECT_EQ(report.culprits,
            (std::vector<InstanceId>{instance_id("test[py=3.12]")}));

  const auto* failed = report.find("test[py=3.12]");
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->job.str(), "test");
  EXPECT_EQ(failed->binding, (MatrixBinding{{"py", "3.12"}}));
  EXPECT_EQ(failed->cause, FailureCause::ExitCode);
  EXPECT_EQ(failed->exit_code, 1);
  EXPECT_TRUE(failed->duration().has_value());

  const auto* skipped = report.find("build");
  ASSERT_NE(skipped, nullptr);
  EXPECT_EQ(skipped->status, JobStatus::Skipped);
  EXPECT_FALSE(skipped->exit_code.has_value());
  EXPECT_FALSE(skipped->started_at.has_value());
  EXPECT_FALSE(skipped->duration().has_value());

  EXPECT_EQ(report.count(JobStatus::Succeeded), 2u);
  EXPECT_EQ(report.find("nope"), nullptr);
}

TEST_F(ReportTest, CulpritsKeepGraphOrder) {
  succeed(0);
  fail(1, 2);
  fail(2, 3);
  skip(3);

  auto report = aggregate(*state_, false);
  EXPECT_EQ(report.culprits,
            (std::vector<InstanceId>{instance_id("test[py=3.11]"),
                                     instance_id("test[py=3.12]")}));
}

TEST_F(ReportTest, CancelledRunListsCancelledInstances) {
  succeed(0);
  (void)state_->cancel_unstarted("cancelled by request");

  auto report = aggregate(*state_, true);
  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.verdict, Verdict::Failure);
  EXPECT_EQ(report.culprits.size(), 3u);
  EXPECT_EQ(report.find("build")->error, "cancelled by request");
}

TEST_F(ReportTest, SummaryNamesEveryInstanceAndCause) {
  succeed(0);
  succeed(1);
  fail(2, 1);
  skip(3);

  auto text = render_summary(aggregate(*state_, false));
  EXPECT_NE(text.find("run_report (ci): failure"), std::string::npos);
  EXPECT_NE(text.find("INSTANCE"), std::string::npos);
  for (const auto* id : {"lint", "test[py=3.11]", "test[py=3.12]", "build"}) {
    EXPECT_NE(text.find(id), std::string::npos) << id;
  }
  EXPECT_NE(text.find("exit_code: exited with code 1"), std::string::npos);
  EXPECT_NE(text.find("Caused by: test[py=3.12]"), std::string::npos);
}

TEST_F(ReportTest, SuccessfulSummaryHasNoCause) {
  succeed(0);
  succeed(1);
  succeed(2);
  succeed(3);

  auto text = render_summary(aggregate(*state_, false));
  EXPECT_NE(text.find(": success"), std::string::npos);
  EXPECT_EQ(text.find("Caused by"), std::string::npos);
}

TEST_F(ReportTest, JsonRoundTripKeepsFields) {
  succeed(0);
  succeed(1);
  fail(2, 9);
  skip(3);
  auto report = aggregate(*state_, false);

  auto text = report_to_json(report);
  auto parsed = report_from_json(text);
  ASSERT_TRUE(parsed.has_value());

  EXPECT_EQ(parsed->run_id, report.run_id);
  EXPECT_EQ(parsed->workflow, "ci");
  EXPECT_EQ(parsed->verdict, Verdict::Failure);
  EXPECT_EQ(parsed->culprits, report.culprits);
  ASSERT_EQ(parsed->instances.size(), 4u);

  const auto* failed = parsed->find("test[py=3.12]");
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->status, JobStatus::Failed);
  EXPECT_EQ(failed->cause, FailureCause::ExitCode);
  EXPECT_EQ(failed->exit_code, 9);
  EXPECT_EQ(failed->binding, (MatrixBinding{{"py", "3.12"}}));
  EXPECT_EQ(parsed->find("lint")->output, "ok\n");
  EXPECT_FALSE(parsed->find("build")->started_at.has_value());
}

TEST_F(ReportTest, JsonReplacesInvalidUtf8Output) {
  ASSERT_TRUE(state_->mark_ready(0));
  ASSERT_TRUE(state_->mark_running(0));
  state_->append_output(0, "bad \xff byte, cut \xc3");
  ASSERT_TRUE(state_->mark_succeeded(0, 0));
  auto report = aggregate(*state_, false);

  std::string text;
  ASSERT_NO_THROW(text = report_to_json(report));
  auto parsed = report_from_json(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->find("lint")->output,
            "bad \xef\xbf\xbd byte, cut \xef\xbf\xbd");
}

TEST_F(ReportTest, JsonShape) {
  succeed(0);
  skip(1);
  skip(2);
  skip(3);

  auto j = nlohmann::json::parse(report_to_json(aggregate(*state_, false)));
  EXPECT_EQ(j["verdict"], "success");
  EXPECT_EQ(j["instances"][0]["status"], "succeeded");
  EXPECT_EQ(j["instances"][0]["exit_code"], 0);
  EXPECT_TRUE(j["instances"][1]["exit_code"].is_null());
  EXPECT_TRUE(j["instances"][1]["started_at"].is_null());
  EXPECT_EQ(j["instances"][1]["binding"][0][0], "py");
  EXPECT_TRUE(j["culprits"].empty());
}

TEST(ReportJsonTest, MalformedJsonIsParseError) {
  auto r = report_from_json("{not json");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ParseError));

  auto missing = report_from_json(R"({"workflow": "ci"})");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::ParseError));
}
