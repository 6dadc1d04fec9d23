#include "ciflow/report/report.hpp"

#include "ciflow/run/run_state.hpp"
#include "ciflow/util/log.hpp"

#include <algorithm>
#include <format>

namespace ciflow {

namespace {

auto to_millis(Timestamp t) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

auto from_millis(std::int64_t ms) -> Timestamp {
  return Timestamp{std::chrono::milliseconds(ms)};
}

auto optional_time(Timestamp t) -> std::optional<Timestamp> {
  if (t == Timestamp{}) {
    return std::nullopt;
  }
  return t;
}

auto time_to_json(const std::optional<Timestamp>& t) -> nlohmann::json {
  return t ? nlohmann::json(to_millis(*t)) : nlohmann::json(nullptr);
}

auto time_from_json(const nlohmann::json& j, std::string_view key)
    -> std::optional<Timestamp> {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return from_millis(it->get<std::int64_t>());
}

auto format_duration(std::optional<std::chrono::milliseconds> d)
    -> std::string {
  if (!d) {
    return "-";
  }
  if (d->count() < 1000) {
    return std::format("{}ms", d->count());
  }
  return std::format("{:.1f}s", static_cast<double>(d->count()) / 1000.0);
}

}  // namespace

auto InstanceReport::duration() const
    -> std::optional<std::chrono::milliseconds> {
  if (!started_at || !finished_at) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(*finished_at -
                                                               *started_at);
}

auto RunReport::find(std::string_view instance_id) const
    -> const InstanceReport* {
  auto it = std::ranges::find_if(instances, [&](const InstanceReport& r) {
    return r.id.value() == instance_id;
  });
  return it != instances.end() ? &*it : nullptr;
}

auto RunReport::count(JobStatus status) const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      instances, [&](const InstanceReport& r) { return r.status == status; }));
}

auto compute_verdict(std::span<const InstanceReport> instances) -> Verdict {
  bool failed = std::ranges::any_of(instances, [](const InstanceReport& r) {
    return r.status == JobStatus::Failed || r.status == JobStatus::Cancelled;
  });
  return failed ? Verdict::Failure : Verdict::Success;
}

auto aggregate(const RunState& state, bool cancelled) -> RunReport {
  const auto& graph = state.graph();

  RunReport report;
  report.run_id = state.id();
  report.workflow = graph.workflow_name();
  report.cancelled = cancelled;
  report.started_at = state.started_at();
  report.finished_at = state.finished_at() == Timestamp{}
                           ? std::chrono::system_clock::now()
                           : state.finished_at();

  report.instances.reserve(state.size());
  for (const auto& rec : state.records()) {
    const auto& node = graph.node(rec.idx);
    InstanceReport r{.id = node.id,
                     .job = graph.job(node.job).definition.id,
                     .binding = node.binding,
                     .status = rec.status,
                     .cause = rec.cause,
                     .exit_code = rec.exit_code,
                     .started_at = optional_time(rec.started_at),
                     .finished_at = optional_time(rec.finished_at),
                     .error = rec.error_message,
                     .output = rec.output};
    if (r.status == JobStatus::Failed || r.status == JobStatus::Cancelled) {
      report.culprits.push_back(r.id);
    }
    report.instances.push_back(std::move(r));
  }

  report.verdict = compute_verdict(report.instances);
  if (!state.is_complete()) {
    log::warn("Run {}: report taken before all instances finished", state.id());
  }
  return report;
}

auto render_summary(const RunReport& report) -> std::string {
  std::size_t width = std::string_view("INSTANCE").size();
  for (const auto& r : report.instances) {
    width = std::max(width, r.id.size());
  }

  std::string out = std::format("Run {} ({}): {}{}\n", report.run_id,
                                report.workflow.empty() ? "unnamed"
                                                        : report.workflow,
                                verdict_name(report.verdict),
                                report.cancelled ? " (cancelled)" : "");
  out += std::format("{:<{}}  {:<10}  {:>5}  {:>8}  {}\n", "INSTANCE", width,
                     "STATUS", "EXIT", "TIME", "DETAIL");

  for (const auto& r : report.instances) {
    std::string exit = r.exit_code ? std::to_string(*r.exit_code) : "-";
    std::string detail;
    if (r.cause != FailureCause::None) {
      detail = failure_cause_name(r.cause);
      if (!r.error.empty()) {
        detail += ": " + r.error;
      }
    }
    out += std::format("{:<{}}  {:<10}  {:>5}  {:>8}  {}\n", r.id.value(),
                       width, job_status_name(r.status), exit,
                       format_duration(r.duration()), detail);
  }

  if (!report.culprits.empty()) {
    out += "Caused by:";
    for (const auto& c : report.culprits) {
      out += " ";
      out += c.value();
    }
    out += "\n";
  }
  return out;
}

auto to_json(nlohmann::json& j, const InstanceReport& r) -> void {
  j = nlohmann::json{
      {"id", r.id.str()},
      {"job", r.job.str()},
      {"binding", r.binding},
      {"status", job_status_name(r.status)},
      {"cause", failure_cause_name(r.cause)},
      {"exit_code",
       r.exit_code ? nlohmann::json(*r.exit_code) : nlohmann::json(nullptr)},
      {"started_at", time_to_json(r.started_at)},
      {"finished_at", time_to_json(r.finished_at)},
      {"error", r.error},
      {"output", r.output},
  };
}

auto from_json(const nlohmann::json& j, InstanceReport& r) -> void {
  r.id = InstanceId{j.at("id").get<std::string>()};
  r.job = JobId{j.at("job").get<std::string>()};
  r.binding = j.value("binding", MatrixBinding{});
  r.status = parse_job_status(j.at("status").get<std::string>())
                 .value_or(JobStatus::Pending);
  r.cause = parse_failure_cause(j.value("cause", std::string("none")));
  if (auto it = j.find("exit_code"); it != j.end() && !it->is_null()) {
    r.exit_code = it->get<int>();
  }
  r.started_at = time_from_json(j, "started_at");
  r.finished_at = time_from_json(j, "finished_at");
  r.error = j.value("error", std::string{});
  r.output = j.value("output", std::string{});
}

auto to_json(nlohmann::json& j, const RunReport& r) -> void {
  std::vector<std::string> culprits;
  culprits.reserve(r.culprits.size());
  for (const auto& c : r.culprits) {
    culprits.push_back(c.str());
  }

  j = nlohmann::json{
      {"run_id", r.run_id.str()},
      {"workflow", r.workflow},
      {"verdict", verdict_name(r.verdict)},
      {"cancelled", r.cancelled},
      {"started_at", to_millis(r.started_at)},
      {"finished_at", to_millis(r.finished_at)},
      {"culprits", culprits},
      {"instances", r.instances},
  };
}

auto from_json(const nlohmann::json& j, RunReport& r) -> void {
  r.run_id = RunId{j.at("run_id").get<std::string>()};
  r.workflow = j.value("workflow", std::string{});
  r.verdict = parse_verdict(j.at("verdict").get<std::string>())
                  .value_or(Verdict::Failure);
  r.cancelled = j.value("cancelled", false);
  r.started_at = from_millis(j.value("started_at", std::int64_t{0}));
  r.finished_at = from_millis(j.value("finished_at", std::int64_t{0}));
  r.culprits.clear();
  for (const auto& c : j.value("culprits", std::vector<std::string>{})) {
    r.culprits.emplace_back(c);
  }
  r.instances = j.value("instances", std::vector<InstanceReport>{});
}

auto report_to_json(const RunReport& report, int indent) -> std::string {
  // Step output is raw process bytes; invalid UTF-8 becomes U+FFFD.
  return nlohmann::json(report).dump(indent, ' ', false,
                                     nlohmann::json::error_handler_t::replace);
}

auto report_from_json(std::string_view text) -> Result<RunReport> {
  try {
    return nlohmann::json::parse(text).get<RunReport>();
  } catch (const nlohmann::json::exception& e) {
    log::warn("Failed to parse run report: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace ciflow
