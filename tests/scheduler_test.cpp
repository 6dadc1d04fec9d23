#include "ciflow/scheduler/scheduler.hpp"

#include "ciflow/core/event_loop.hpp"
#include "ciflow/report/report.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace ciflow;
using namespace ciflow::test;

namespace {

constexpr auto kRunTimeout = std::chrono::seconds(10);

using Transition = std::tuple<std::string, JobStatus, JobStatus>;

}  // namespace

class SchedulerTest : public ::testing::Test {
protected:
  void SetUp() override {
    loop_.start();
  }

  void TearDown() override {
    loop_.stop();
    scheduler_.reset();
  }

  auto start(const Workflow& wf, SchedulerOptions options = {}) -> void {
    auto g = JobGraph::build(wf);
    ASSERT_TRUE(g.has_value()) << g.error().message;
    graph_ = std::make_shared<const JobGraph>(std::move(*g));

    BlockingQueue<bool> begun;
    loop_.post([this, options, &begun] {
      scheduler_ = Scheduler::create(
          loop_, executor_, graph_, run_id("run_sched"), options,
          [this](const RunState& state) {
            reports_.push(aggregate(state, scheduler_->cancelled()));
          });
      scheduler_->set_listener(
          [this](NodeIndex idx, JobStatus from, JobStatus to) {
            std::lock_guard lock(mutex_);
            transitions_.emplace_back(graph_->node(idx).id.str(), from, to);
          });
      scheduler_->begin();
      begun.push(true);
    });
    begun.pop();
  }

  auto cancel(CancelReason reason = CancelReason::Requested) -> void {
    loop_.post([this, reason] { scheduler_->request_cancel(reason); });
  }

  auto wait_report() -> RunReport {
    auto report = reports_.try_pop_for(kRunTimeout);
    EXPECT_TRUE(report.has_value()) << "run did not finish";
    return report.value_or(RunReport{});
  }

  auto transitions_of(std::string_view id) -> std::vector<Transition> {
    std::lock_guard lock(mutex_);
    std::vector<Transition> out;
    for (const auto& t : transitions_) {
      if (std::get<0>(t) == id) {
        out.push_back(t);
      }
    }
    return out;
  }

  // Releases held units as they start until `total` have been released.
  auto release_as_started(std::size_t total) -> bool {
    std::vector<std::string> released;
    auto deadline = std::chrono::steady_clock::now() + kRunTimeout;
    while (released.size() < total) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      for (const auto& id : executor_.started()) {
        if (std::ranges::find(released, id) == released.end() &&
            executor_.release(id)) {
          released.push_back(id);
        }
      }
      sleep_ms(std::chrono::milliseconds(5));
    }
    return true;
  }

  static auto status_of(const RunReport& r, std::string_view id) -> JobStatus {
    const auto* inst = r.find(id);
    EXPECT_NE(inst, nullptr) << id;
    return inst ? inst->status : JobStatus::Pending;
  }

  ScriptedExecutor executor_;
  EventLoop loop_;
  std::shared_ptr<const JobGraph> graph_;
  std::shared_ptr<Scheduler> scheduler_;
  BlockingQueue<RunReport> reports_;

  std::mutex mutex_;
  std::vector<Transition> transitions_;
};

TEST_F(SchedulerTest, AllSucceed) {
  start(make_workflow({make_job("a"), make_job("b", {"a"}),
                       make_job("c", {"b"})}));

  auto report = wait_report();
  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(report.count(JobStatus::Succeeded), 3u);
  EXPECT_TRUE(report.culprits.empty());
  EXPECT_FALSE(report.cancelled);
  EXPECT_EQ(executor_.started(), (std::vector<std::string>{"a", "b", "c"}));

  EXPECT_EQ(transitions_of("b"),
            (std::vector<Transition>{
                {"b", JobStatus::Pending, JobStatus::Ready},
                {"b", JobStatus::Ready, JobStatus::Running},
                {"b", JobStatus::Running, JobStatus::Succeeded}}));
}

TEST_F(SchedulerTest, FailedDependencySkipsDefaultDependent) {
  executor_.script("b", Script{.exit_code = 1});
  start(make_workflow({make_job("a"), make_job("b"),
                       make_job("c", {"a", "b"})}));

  auto report = wait_report();
  EXPECT_EQ(report.verdict, Verdict::Failure);
  EXPECT_EQ(status_of(report, "a"), JobStatus::Succeeded);
  EXPECT_EQ(status_of(report, "b"), JobStatus::Failed);
  EXPECT_EQ(status_of(report, "c"), JobStatus::Skipped);
  EXPECT_EQ(report.culprits, (std::vector<InstanceId>{instance_id("b")}));

  const auto* b = report.find("b");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->cause, FailureCause::ExitCode);
  EXPECT_EQ(b->exit_code, 1);

  EXPECT_EQ(transitions_of("c"),
            (std::vector<Transition>{
                {"c", JobStatus::Pending, JobStatus::Blocked},
                {"c", JobStatus::Blocked, JobStatus::Skipped}}));
  auto started = executor_.started();
  EXPECT_EQ(std::ranges::find(started, "c"), started.end());
}

TEST_F(SchedulerTest, AlwaysDependentRunsAfterFailure) {
  executor_.script("b", Script{.exit_code = 1});
  start(make_workflow({make_job("a"), make_job("b"),
                       make_job("c", {"a", "b"}, AlwaysCondition{})}));

  auto report = wait_report();
  EXPECT_EQ(status_of(report, "c"), JobStatus::Succeeded);
  EXPECT_EQ(report.verdict, Verdict::Failure);
  EXPECT_EQ(report.culprits, (std::vector<InstanceId>{instance_id("b")}));
}

TEST_F(SchedulerTest, SkipPropagatesTransitively) {
  executor_.script("a", Script{.exit_code = 2});
  start(make_workflow({make_job("a"), make_job("b", {"a"}),
                       make_job("c", {"b"}),
                       make_job("report", {"c"}, AlwaysCondition{})}));

  auto report = wait_report();
  EXPECT_EQ(status_of(report, "a"), JobStatus::Failed);
  EXPECT_EQ(status_of(report, "b"), JobStatus::Skipped);
  EXPECT_EQ(status_of(report, "c"), JobStatus::Skipped);
  EXPECT_EQ(status_of(report, "report"), JobStatus::Succeeded);
  EXPECT_EQ(executor_.started(), (std::vector<std::string>{"a", "report"}));
}

TEST_F(SchedulerTest, AllSkippedRunIsSuccess) {
  start(make_workflow({make_job("a"),
                       make_job("cleanup", {"a"}, CustomCondition{"failure()"})}));

  auto report = wait_report();
  EXPECT_EQ(status_of(report, "cleanup"), JobStatus::Skipped);
  EXPECT_EQ(report.verdict, Verdict::Success);
}

TEST_F(SchedulerTest, OneFailedMatrixInstanceSkipsFanIn) {
  auto test = make_job("test");
  add_axis(test, "py", {"3.11", "3.12", "3.13"});
  executor_.script("test[py=3.12]", Script{.exit_code = 1});
  start(make_workflow({std::move(test), make_job("build", {"test"})}));

  auto report = wait_report();
  EXPECT_EQ(status_of(report, "test[py=3.11]"), JobStatus::Succeeded);
  EXPECT_EQ(status_of(report, "test[py=3.12]"), JobStatus::Failed);
  EXPECT_EQ(status_of(report, "test[py=3.13]"), JobStatus::Succeeded);
  EXPECT_EQ(status_of(report, "build"), JobStatus::Skipped);
}

TEST_F(SchedulerTest, CustomConditionInspectsResults) {
  executor_.script("lint", Script{.exit_code = 1});
  start(make_workflow(
      {make_job("lint"), make_job("unit"),
       make_job("notify", {"lint", "unit"},
                CustomCondition{"contains(needs.*.result, 'failure')"})}));

  auto report = wait_report();
  EXPECT_EQ(status_of(report, "notify"), JobStatus::Succeeded);
}

TEST_F(SchedulerTest, UnresolvedReferenceFailsInstance) {
  start(make_workflow(
      {make_job("a"),
       make_job("b", {"a"}, CustomCondition{"matrix.arch == 'arm'"}),
       make_job("c", {"b"})}));

  auto report = wait_report();
  const auto* b = report.find("b");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->status, JobStatus::Failed);
  EXPECT_EQ(b->cause, FailureCause::UnresolvedReference);
  EXPECT_FALSE(b->exit_code.has_value());
  EXPECT_NE(b->error.find("arch"), std::string::npos);
  EXPECT_EQ(status_of(report, "c"), JobStatus::Skipped);
  EXPECT_EQ(report.verdict, Verdict::Failure);

  EXPECT_EQ(transitions_of("b"),
            (std::vector<Transition>{
                {"b", JobStatus::Pending, JobStatus::Failed}}));
}

TEST_F(SchedulerTest, ExecutorThrowIsExecutorError) {
  executor_.script("a", Script{.throw_on_start = true});
  start(make_workflow({make_job("a"), make_job("b", {"a"}), make_job("c")}));

  auto report = wait_report();
  const auto* a = report.find("a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->status, JobStatus::Failed);
  EXPECT_EQ(a->cause, FailureCause::ExecutorError);
  EXPECT_EQ(status_of(report, "b"), JobStatus::Skipped);
  EXPECT_EQ(status_of(report, "c"), JobStatus::Succeeded);
}

TEST_F(SchedulerTest, ExecutorErrorResultIsExecutorError) {
  executor_.script("a", Script{.exit_code = -1, .error = "failed to fork"});
  executor_.script(
      "b", Script{.exit_code = -1,
                  .error = "step 1: unknown matrix key 'arch'",
                  .error_code = make_error_code(Error::UnresolvedReference)});
  start(make_workflow({make_job("a"), make_job("b")}));

  auto report = wait_report();
  EXPECT_EQ(report.find("a")->cause, FailureCause::ExecutorError);
  EXPECT_FALSE(report.find("a")->exit_code.has_value());
  EXPECT_EQ(report.find("b")->cause, FailureCause::UnresolvedReference);
}

TEST_F(SchedulerTest, TimedOutUnitFailsWithTimeout) {
  executor_.script("slow", Script{.exit_code = 137, .timed_out = true});
  start(make_workflow({make_job("slow")}));

  auto report = wait_report();
  const auto* slow = report.find("slow");
  ASSERT_NE(slow, nullptr);
  EXPECT_EQ(slow->status, JobStatus::Failed);
  EXPECT_EQ(slow->cause, FailureCause::Timeout);
}

TEST_F(SchedulerTest, ConcurrencyBoundIsRespected) {
  std::vector<JobTemplate> jobs;
  for (const auto* id : {"j1", "j2", "j3", "j4", "j5"}) {
    jobs.push_back(make_job(id));
    executor_.script(id, Script{.hold = true});
  }
  start(make_workflow(std::move(jobs)), SchedulerOptions{.max_concurrency = 2});

  ASSERT_TRUE(executor_.wait_started(2));
  sleep_ms(std::chrono::milliseconds(50));
  EXPECT_EQ(executor_.started().size(), 2u);

  ASSERT_TRUE(release_as_started(5));
  auto report = wait_report();
  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(executor_.max_running(), 2u);
  EXPECT_EQ(executor_.started(),
            (std::vector<std::string>{"j1", "j2", "j3", "j4", "j5"}));
}

TEST_F(SchedulerTest, ShallowerInstancesLaunchFirst) {
  start(make_workflow({make_job("x"), make_job("y", {"x"}), make_job("z")}),
        SchedulerOptions{.max_concurrency = 1});

  auto report = wait_report();
  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(executor_.started(), (std::vector<std::string>{"x", "z", "y"}));
}

TEST_F(SchedulerTest, CancelStopsRunningAndQueuedInstances) {
  executor_.script("a", Script{.hold = true});
  executor_.script("b", Script{.hold = true});
  start(make_workflow({make_job("a"), make_job("b"), make_job("c", {"a"}),
                       make_job("d", {"c"}, AlwaysCondition{})}));

  ASSERT_TRUE(executor_.wait_started(2));
  cancel();

  auto report = wait_report();
  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.verdict, Verdict::Failure);
  for (const auto* id : {"a", "b", "c", "d"}) {
    EXPECT_EQ(status_of(report, id), JobStatus::Cancelled) << id;
  }
  EXPECT_EQ(report.find("c")->error, "cancelled by request");
  EXPECT_EQ(report.culprits.size(), 4u);

  auto calls = executor_.cancel_calls();
  std::ranges::sort(calls);
  EXPECT_EQ(calls, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(executor_.started().size(), 2u);
}

TEST_F(SchedulerTest, GraceExpiryForceCancelsStuckUnits) {
  executor_.script("stuck", Script{.hold = true});
  executor_.set_ignore_cancel(true);
  start(make_workflow({make_job("stuck")}),
        SchedulerOptions{.cancel_grace = std::chrono::milliseconds(50)});

  ASSERT_TRUE(executor_.wait_started(1));
  cancel();

  auto report = wait_report();
  const auto* stuck = report.find("stuck");
  ASSERT_NE(stuck, nullptr);
  EXPECT_EQ(stuck->status, JobStatus::Cancelled);
  EXPECT_EQ(stuck->error, "did not stop after cancel");

  // The late completion is ignored.
  EXPECT_TRUE(executor_.release("stuck"));
  sleep_ms(std::chrono::milliseconds(20));
  EXPECT_FALSE(reports_.try_pop_for(std::chrono::milliseconds(20)).has_value());
}

TEST_F(SchedulerTest, RunTimeoutCancelsRun) {
  executor_.script("long", Script{.hold = true});
  start(make_workflow({make_job("long"), make_job("after", {"long"})}),
        SchedulerOptions{.run_timeout = std::chrono::milliseconds(50)});

  auto report = wait_report();
  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(status_of(report, "long"), JobStatus::Cancelled);
  EXPECT_EQ(status_of(report, "after"), JobStatus::Cancelled);
  EXPECT_EQ(report.find("after")->error, "run timed out");
}

TEST_F(SchedulerTest, CancelAfterFinishIsNoop) {
  start(make_workflow({make_job("a")}));
  auto report = wait_report();
  EXPECT_EQ(report.verdict, Verdict::Success);

  cancel();
  EXPECT_FALSE(reports_.try_pop_for(std::chrono::milliseconds(50)).has_value());
  EXPECT_TRUE(executor_.cancel_calls().empty());
}

TEST_F(SchedulerTest, EmptyWorkflowFinishesImmediately) {
  start(make_workflow({}));

  auto report = wait_report();
  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_TRUE(report.instances.empty());
}

TEST_F(SchedulerTest, RequestCarriesFrozenContext) {
  auto build = make_job("build", {"lint"});
  add_axis(build, "os", {"linux"});
  build.timeout = std::chrono::seconds(30);
  start(make_workflow({make_job("lint"), std::move(build)}),
        SchedulerOptions{.default_job_timeout = std::chrono::seconds(600)});

  auto report = wait_report();
  ASSERT_EQ(report.verdict, Verdict::Success);

  auto requests = executor_.requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].instance_id.str(), "lint");
  EXPECT_EQ(requests[0].timeout, std::chrono::seconds(600));
  EXPECT_EQ(requests[1].instance_id.str(), "build[os=linux]");
  EXPECT_EQ(requests[1].timeout, std::chrono::seconds(30));
  EXPECT_EQ(requests[1].run_id.str(), "run_sched");
  ASSERT_EQ(requests[1].context.outcomes.size(), 1u);
  EXPECT_EQ(requests[1].context.outcomes[0].status, JobStatus::Succeeded);
  EXPECT_EQ(requests[1].context.matrix,
            (MatrixBinding{{"os", "linux"}}));
  ASSERT_NE(requests[1].job, nullptr);
  EXPECT_EQ(requests[1].job->definition.id.str(), "build");
}
