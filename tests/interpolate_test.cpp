#include "ciflow/condition/interpolate.hpp"

#include <string>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace ciflow;
using namespace ciflow::test;

class InterpolateTest : public ::testing::Test {
protected:
  void SetUp() override {
    ctx_.needs = {job_id("build")};
    ctx_.outcomes = {{job_id("build"), instance_id("build"),
                      JobStatus::Failed, 3}};
    ctx_.matrix = {{"python-version", "3.12"}, {"os", "linux"}};
    ctx_.env = {{"IMAGE", "ci:latest"}};
    ctx_.step_failed = false;
  }

  EvalContext ctx_;
};

TEST_F(InterpolateTest, PlainTextIsUnchanged) {
  auto out = interpolate("echo hello", ctx_);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "echo hello");
}

TEST_F(InterpolateTest, ReplacesMatrixAndEnv) {
  auto out = interpolate(
      "python${{ matrix.python-version }} -m pytest --os=${{matrix.os}} "
      "--image ${{ env.IMAGE }}",
      ctx_);
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_EQ(*out, "python3.12 -m pytest --os=linux --image ci:latest");
}

TEST_F(InterpolateTest, ReplacesDependencyResults) {
  auto out = interpolate(
      "echo ${{ needs.build.result }} ${{ needs.build.exit_code }} "
      "${{ join(needs.*.result, '+') }}",
      ctx_);
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_EQ(*out, "echo failure 3 failure");
}

TEST_F(InterpolateTest, BracesInsideStringLiteral) {
  auto out = interpolate("x=${{ '}}' }}", ctx_);
  ASSERT_TRUE(out.has_value()) << out.error().message;
  EXPECT_EQ(*out, "x=}}");
}

TEST_F(InterpolateTest, UnterminatedExpressionIsCopied) {
  auto out = interpolate("echo ${{ matrix.os", ctx_);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "echo ${{ matrix.os");
}

TEST_F(InterpolateTest, ShellVariablesAreLeftAlone) {
  auto out = interpolate("echo ${HOME} $PATH", ctx_);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(*out, "echo ${HOME} $PATH");
}

TEST_F(InterpolateTest, UnresolvedReferenceIsAnError) {
  auto out = interpolate("echo ${{ matrix.arch }}", ctx_);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, make_error_code(Error::UnresolvedReference));
}

TEST_F(InterpolateTest, SyntaxErrorIsAnError) {
  auto out = interpolate("echo ${{ matrix.os == }}", ctx_);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error().code, make_error_code(Error::InvalidCondition));
}

TEST(FindClosingBracesTest, SkipsQuotedText) {
  std::string_view text = "${{ 'a}}b' }} tail";
  auto pos = find_closing_braces(text, 3);
  ASSERT_NE(pos, std::string_view::npos);
  EXPECT_EQ(text.substr(pos), "}} tail");
  EXPECT_EQ(find_closing_braces("${{ open", 3), std::string_view::npos);
}
