#include "ciflow/workflow/matrix.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace ciflow;
using namespace ciflow::test;

namespace {

auto ids_of(const std::vector<ExpandedInstance>& instances)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& i : instances) {
    out.push_back(i.id.str());
  }
  return out;
}

}  // namespace

TEST(MatrixTest, NoAxesGivesSingleInstanceNamedAfterJob) {
  auto job = make_job("lint");

  auto expanded = expand_matrix(job);
  ASSERT_TRUE(expanded.has_value());
  ASSERT_EQ(expanded->size(), 1u);
  EXPECT_EQ((*expanded)[0].id.str(), "lint");
  EXPECT_TRUE((*expanded)[0].binding.empty());
}

TEST(MatrixTest, SingleAxisKeepsValueOrder) {
  auto job = make_job("test");
  add_axis(job, "python-version", {"3.10", "3.11", "3.12"});

  auto expanded = expand_matrix(job);
  ASSERT_TRUE(expanded.has_value());
  EXPECT_EQ(ids_of(*expanded),
            (std::vector<std::string>{"test[python-version=3.10]",
                                      "test[python-version=3.11]",
                                      "test[python-version=3.12]"}));
}

TEST(MatrixTest, FirstAxisVariesSlowest) {
  auto job = make_job("test");
  add_axis(job, "os", {"linux", "mac"});
  add_axis(job, "py", {"3.11", "3.12"});

  auto expanded = expand_matrix(job);
  ASSERT_TRUE(expanded.has_value());
  EXPECT_EQ(ids_of(*expanded),
            (std::vector<std::string>{"test[os=linux,py=3.11]",
                                      "test[os=linux,py=3.12]",
                                      "test[os=mac,py=3.11]",
                                      "test[os=mac,py=3.12]"}));

  const auto& binding = (*expanded)[2].binding;
  ASSERT_EQ(binding.size(), 2u);
  EXPECT_EQ(binding[0].first, "os");
  EXPECT_EQ(binding[0].second, "mac");
  EXPECT_EQ(binding[1].first, "py");
  EXPECT_EQ(binding[1].second, "3.11");
}

TEST(MatrixTest, ExpansionIsDeterministic) {
  auto job = make_job("build");
  add_axis(job, "arch", {"x86", "arm"});
  add_axis(job, "mode", {"debug", "release", "asan"});

  auto first = expand_matrix(job);
  auto second = expand_matrix(job);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->size(), 6u);
  EXPECT_EQ(ids_of(*first), ids_of(*second));
}

TEST(MatrixTest, EmptyAxisIsRejected) {
  auto job = make_job("test");
  add_axis(job, "os", {"linux"});
  job.matrix.push_back(MatrixAxis{.name = "py", .values = {}});

  auto expanded = expand_matrix(job);
  ASSERT_FALSE(expanded.has_value());
  EXPECT_EQ(expanded.error().code, make_error_code(Error::InvalidMatrix));
  EXPECT_NE(expanded.error().message.find("py"), std::string::npos);
}

TEST(MatrixTest, DuplicateAxisIsRejected) {
  auto job = make_job("test");
  add_axis(job, "os", {"linux"});
  add_axis(job, "os", {"mac"});

  auto expanded = expand_matrix(job);
  ASSERT_FALSE(expanded.has_value());
  EXPECT_EQ(expanded.error().code, make_error_code(Error::DuplicateAxis));
}

TEST(MatrixTest, UnnamedAxisIsRejected) {
  auto job = make_job("test");
  add_axis(job, "", {"a"});

  auto expanded = expand_matrix(job);
  ASSERT_FALSE(expanded.has_value());
  EXPECT_EQ(expanded.error().code, make_error_code(Error::InvalidMatrix));
}

TEST(MatrixTest, ProductAboveLimitIsRejected) {
  auto job = make_job("huge");
  add_axis(job, "a", {"0", "1", "2", "3", "4", "5", "6", "7"});
  add_axis(job, "b", {"0", "1", "2", "3", "4", "5", "6", "7"});
  add_axis(job, "c", {"0", "1", "2", "3", "4"});

  auto expanded = expand_matrix(job);
  ASSERT_FALSE(expanded.has_value());
  EXPECT_EQ(expanded.error().code, make_error_code(Error::InvalidMatrix));
}

TEST(MatrixTest, ProductAtLimitIsAccepted) {
  auto job = make_job("wide");
  add_axis(job, "a", {"0", "1", "2", "3", "4", "5", "6", "7"});
  add_axis(job, "b", {"0", "1", "2", "3", "4", "5", "6", "7"});
  add_axis(job, "c", {"0", "1", "2", "3"});

  auto expanded = expand_matrix(job);
  ASSERT_TRUE(expanded.has_value());
  EXPECT_EQ(expanded->size(), kMaxMatrixInstances);
}

TEST(MatrixTest, LookupBindingFindsAxis) {
  MatrixBinding binding{{"os", "linux"}, {"py", "3.12"}};

  EXPECT_EQ(lookup_binding(binding, "py"), "3.12");
  EXPECT_FALSE(lookup_binding(binding, "arch").has_value());
}

TEST(MatrixTest, FormatInstanceId) {
  EXPECT_EQ(format_instance_id(job_id("docs"), {}).str(), "docs");
  EXPECT_EQ(format_instance_id(job_id("t"), {{"a", "1"}, {"b", "x"}}).str(),
            "t[a=1,b=x]");
}
