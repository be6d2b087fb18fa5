#include "sandbox/runner.hpp"

#include <gtest/gtest.h>

#include "sandbox/test_support.hpp"
#include "utils/errors.hpp"

namespace lrunbox::sandbox {
namespace {

using options::Json;
using options::OptionSet;

class RunnerTest : public ::testing::Test {
protected:
    Runner runner_ = Runner(Json{{"uid", 2}, {"fd", 2}, {"tmpfs", {{"/tmp", 0}}}});
};

TEST_F(RunnerTest, StartsEmpty) {
    EXPECT_TRUE(Runner().options().empty());
}

TEST_F(RunnerTest, AcceptsOptions) {
    EXPECT_EQ(Runner(Json{{"uid", 2}, {"gid", 3}}).options().json(), (Json{{"uid", 2}, {"gid", 3}}));
    EXPECT_EQ(runner_.options().at("tmpfs"), Json::parse(R"([["/tmp", 0]])"));
}

TEST_F(RunnerTest, RejectsNonMapping) {
    EXPECT_THROW(Runner(Json::array({1, 2})), utils::TypeMismatch);
    EXPECT_THROW(runner_.Where(Json(3)), utils::TypeMismatch);
    EXPECT_THROW(runner_.Where(Json()), utils::TypeMismatch);
}

TEST_F(RunnerTest, WhereChangesOptions) {
    EXPECT_EQ(runner_.Where(Json{{"uid", 3}}).options().at("uid"), 3);
}

TEST_F(RunnerTest, WhereAddsOptions) {
    EXPECT_EQ(runner_.Where(Json{{"fd", 3}}).options().at("fd"), Json::parse("[2, 3]"));
    EXPECT_EQ(runner_.Where(Json{{"fd", {4, 5}}}).options().at("fd"), Json::parse("[2, 4, 5]"));
    EXPECT_EQ(runner_.Where(Json{{"tmpfs", {{"/usr/bin", 1}}}}).options().at("tmpfs"),
              Json::parse(R"([["/tmp", 0], ["/usr/bin", 1]])"));
}

TEST_F(RunnerTest, WhereDeletesOptions) {
    EXPECT_FALSE(runner_.Where(Json{{"uid", nullptr}}).options().contains("uid"));
    EXPECT_FALSE(runner_.Where(Json{{"fd", nullptr}}).options().contains("fd"));
    EXPECT_TRUE(runner_.Where(Json{{"fd", nullptr}, {"uid", nullptr}, {"tmpfs", nullptr}}).options().empty());
}

TEST_F(RunnerTest, WhereDoesNotChangeOriginal) {
    const auto before = runner_.options();
    const auto& stored = runner_.options();
    const auto changed = runner_.Where(Json{{"uid", 5}, {"fd", nullptr}, {"tmpfs", {{"/a", 2}}}, {"gid", 6}});
    EXPECT_EQ(runner_.options(), before);
    EXPECT_EQ(&runner_.options(), &stored);
    EXPECT_NE(changed.options(), before);
}

TEST_F(RunnerTest, AccessorsAreWhere) {
    EXPECT_EQ(runner_.Uid(3).options(), runner_.Where(Json{{"uid", 3}}).options());
    EXPECT_EQ(runner_.MaxCpuTime(1).options().at("max_cpu_time"), 1);
    EXPECT_EQ(runner_.Fd(3).options().at("fd"), Json::parse("[2, 3]"));
    EXPECT_EQ(runner_.Env({{"A", "1"}}).options().at("env"), Json::parse(R"([["A", "1"]])"));
    EXPECT_FALSE(runner_.Uid(nullptr).options().contains("uid"));
    EXPECT_EQ(runner_.Stdout("/tmp/out").options().at("stdout"), "/tmp/out");
}

TEST_F(RunnerTest, AccessorsChain) {
    const auto runner = Runner().MaxCpuTime(1).Tmpfs({{"/tmp", 1048576}}).Chdir("/tmp");
    EXPECT_EQ(runner.options().json(),
              Json::parse(R"({"max_cpu_time": 1, "tmpfs": [["/tmp", 1048576]], "chdir": "/tmp"})"));
    EXPECT_EQ(runner.MaxCpuTime(nullptr).options().json(),
              Json::parse(R"({"tmpfs": [["/tmp", 1048576]], "chdir": "/tmp"})"));
}

TEST_F(RunnerTest, DerivedRunnersKeepExecutor) {
    const Runner runner(OptionSet(), testing::FakeExecutor());
    EXPECT_EQ(runner.Uid(1).executor().config().path, LRUNBOX_FAKE_LRUN);
}

TEST_F(RunnerTest, FromConfig) {
    config::Config config;
    config.lrun = testing::FakeLrunConfig();
    config.defaults = OptionSet::FromJson(Json{{"max_cpu_time", 2}});
    const auto runner = Runner::FromConfig(config);
    EXPECT_EQ(runner.options().at("max_cpu_time"), 2);
    EXPECT_EQ(runner.executor().config().path, LRUNBOX_FAKE_LRUN);
}

TEST_F(RunnerTest, Runs) {
    const Runner runner(runner_.options(), testing::FakeExecutor());
    EXPECT_EQ(runner.Run("echo a").output, std::string("a\n"));
}

TEST_F(RunnerTest, PassesOptions) {
    const Runner runner(runner_.options(), testing::FakeExecutor());
    const auto result = runner.Env({{"A", 42}}).Run(std::vector<std::string>{"sh", "-c", "echo $A"});
    EXPECT_EQ(result.output, std::string("42\n"));
}

TEST_F(RunnerTest, RedirectsThroughAccessors) {
    testing::ScratchFile output("runner_output");
    const Runner runner(OptionSet(), testing::FakeExecutor());
    const auto result = runner.Stdout(output.path()).Run("echo redirected");
    EXPECT_FALSE(result.output.has_value());
    EXPECT_EQ(output.Read(), "redirected\n");
}

}  // namespace
}  // namespace lrunbox::sandbox
