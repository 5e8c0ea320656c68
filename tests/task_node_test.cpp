// ============================================================================
// TaskNode Tests: lifecycle, barrier, termination
// ============================================================================

#include "cotree/cotree.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cotree;
using namespace std::chrono_literals;

namespace {

CommanderOptions Quiet() {
    CommanderOptions options;
    options.log_level = quill::LogLevel::None;
    options.load_env_log_levels = false;
    return options;
}

JobBody Returns(int value) {
    return [value](Job&, Args) -> Task<NodeResult> { co_return Ok(std::any(value)); };
}

// Sleeps far longer than any test runs, unless terminated.
JobBody SleepsUntilTerminated() {
    return [](Job& self, Args) -> Task<NodeResult> {
        co_await AsyncSleep(60s, self.GetToken());
        co_return Ok();
    };
}

void Record(TaskNode& node, Stage stage, std::vector<std::string>& log) {
    auto added = node.AddCallback(stage, [&log, name = node.Name(), stage](const CallbackContext&) {
        log.push_back(name + ":" + ToString(stage));
    });
    ASSERT_TRUE(added.IsOk());
}

}  // namespace

// ============================================================================
// Identity / initial state
// ============================================================================

TEST(TaskNodeTest, FreshNodeIsPending) {
    auto job = Job::Create("fresh", Returns(1));

    EXPECT_EQ(job->Status(), NodeStatus::Pending);
    EXPECT_EQ(job->Kind(), NodeKind::Job);
    EXPECT_EQ(job->Name(), "fresh");
    EXPECT_EQ(job->Parent(), nullptr);
    EXPECT_TRUE(job->Children().empty());
    EXPECT_FALSE(job->IsTerminal());
    EXPECT_FALSE(job->IsResolved());
    EXPECT_EQ(job->GetResult(), nullptr);
    EXPECT_EQ(job->GetError(), nullptr);
}

TEST(TaskNodeTest, IdsAreUnique) {
    auto a = Job::Create("a", Returns(1));
    auto b = Job::Create("b", Returns(1));
    EXPECT_NE(a->Id(), b->Id());
}

TEST(TaskNodeTest, StatusNames) {
    EXPECT_STREQ(ToString(NodeStatus::Pending), "Pending");
    EXPECT_STREQ(ToString(NodeStatus::Terminated), "Terminated");
    EXPECT_STREQ(ToString(NodeKind::Handler), "Handler");
}

TEST(TaskNodeTest, DataSlotIsFree) {
    auto job = Job::Create("data", Returns(1));
    job->Data() = std::string("attached");
    EXPECT_EQ(std::any_cast<std::string>(job->Data()), "attached");
}

// ============================================================================
// Callback stage validation
// ============================================================================

TEST(TaskNodeTest, StageMustMatchKind) {
    auto job = Job::Create("job", Returns(1));
    auto handler = Handler::Create("handler", [](Handler&, Args) -> Task<NodeResult> { co_return Ok(); });
    Commander commander(Quiet());
    auto noop = [](const CallbackContext&) {};

    EXPECT_TRUE(job->AddCallback(Stage::JobEnd, noop).IsOk());
    EXPECT_TRUE(job->AddCallback(Stage::Exception, noop).IsOk());
    EXPECT_EQ(job->AddCallback(Stage::HandlerEnd, noop).Error(), Errc::InvalidStage);
    EXPECT_EQ(job->AddCallback(Stage::CommanderEnd, noop).Error(), Errc::InvalidStage);

    EXPECT_TRUE(handler->AddCallback(Stage::HandlerStart, noop).IsOk());
    EXPECT_EQ(handler->AddCallback(Stage::JobStart, noop).Error(), Errc::InvalidStage);

    EXPECT_TRUE(commander.AddCallback(Stage::CommanderEnd, noop).IsOk());
    EXPECT_TRUE(commander.AddCallback(Stage::Terminate, noop).IsOk());
    EXPECT_EQ(commander.AddCallback(Stage::JobEnd, noop).Error(), Errc::InvalidStage);
    EXPECT_EQ(commander.AddCallback(Stage::Exception, noop).Error(), Errc::InvalidStage);
}

// ============================================================================
// Bottom-up barrier
// ============================================================================

TEST(TaskNodeTest, ParentEndsAfterItsChildren) {
    Commander commander(Quiet());
    std::vector<std::string> log;
    std::shared_ptr<Job> child;

    auto parent = Job::Create("parent", [&](Job& self, Args) -> Task<NodeResult> {
        child = Job::Create("child", [](Job& self, Args) -> Task<NodeResult> {
            co_await AsyncSleep(20ms, self.GetToken());
            co_return Ok(std::any(2));
        });
        Record(*child, Stage::JobEnd, log);
        EXPECT_TRUE(SubmitJob(self, child).IsOk());
        log.push_back("parent:body-returned");
        co_return Ok(std::any(1));
    });
    Record(*parent, Stage::JobStart, log);
    Record(*parent, Stage::JobEnd, log);

    ASSERT_TRUE(commander.Submit(parent).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(log, (std::vector<std::string>{"parent:at_job_start", "parent:body-returned", "child:at_job_end",
                                             "parent:at_job_end"}));
    EXPECT_EQ(parent->Status(), NodeStatus::Completed);
    EXPECT_EQ(*parent->ResultAs<int>(), 1);
    ASSERT_EQ(parent->Children().size(), 1u);
    EXPECT_EQ(child->Parent(), parent.get());
    EXPECT_LT(child->ResolutionSeq(), parent->ResolutionSeq());
    EXPECT_LT(parent->ResolutionSeq(), commander.ResolutionSeq());
}

TEST(TaskNodeTest, SiblingsResolveInCompletionOrder) {
    Commander commander(Quiet());
    std::shared_ptr<Job> slow;
    std::shared_ptr<Job> fast;

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        slow = SubmitJob(self, "slow", [](Job& j, Args) -> Task<NodeResult> {
                   co_await AsyncSleep(30ms, j.GetToken());
                   co_return Ok();
               }).Value();
        fast = SubmitJob(self, "fast", Returns(0)).Value();
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_LT(fast->ResolutionSeq(), slow->ResolutionSeq());
    EXPECT_LT(slow->ResolutionSeq(), root->ResolutionSeq());
}

// ============================================================================
// Termination
// ============================================================================

TEST(TaskNodeTest, TerminateFiresOncePerUnresolvedNode) {
    Commander commander(Quiet());
    int terminate_firings = 0;
    std::vector<std::shared_ptr<Job>> children;
    auto count = [&](const CallbackContext&) { ++terminate_firings; };

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        for (int i = 0; i < 3; ++i) {
            auto child = Job::Create("child" + std::to_string(i), SleepsUntilTerminated());
            EXPECT_TRUE(child->AddCallback(Stage::Terminate, count).IsOk());
            EXPECT_TRUE(SubmitJob(self, child).IsOk());
            children.push_back(child);
        }
        co_await AsyncSleep(60s, self.GetToken());
        co_return Ok();
    });
    ASSERT_TRUE(root->AddCallback(Stage::Terminate, count).IsOk());

    auto killer = Job::Create("killer", [&](Job& self, Args) -> Task<NodeResult> {
        co_await AsyncSleep(20ms, self.GetToken());
        root->Terminate();
        root->Terminate();
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Submit(killer).IsOk());

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(commander.Run().IsOk());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(terminate_firings, 4);
    EXPECT_EQ(root->Status(), NodeStatus::Terminated);
    for (auto& child : children) {
        EXPECT_EQ(child->Status(), NodeStatus::Terminated);
        EXPECT_TRUE(child->IsResolved());
        EXPECT_LT(child->ResolutionSeq(), root->ResolutionSeq());
    }
    EXPECT_EQ(killer->Status(), NodeStatus::Completed);
    EXPECT_EQ(commander.Status(), NodeStatus::Completed);
    EXPECT_LT(elapsed, 10s);
    EXPECT_EQ(commander.InFlight(), 0u);
}

TEST(TaskNodeTest, TerminateSkipsResolvedChildren) {
    Commander commander(Quiet());
    int terminate_firings = 0;
    auto count = [&](const CallbackContext&) { ++terminate_firings; };
    std::shared_ptr<Job> done_child;

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        done_child = Job::Create("done", Returns(1));
        EXPECT_TRUE(done_child->AddCallback(Stage::Terminate, count).IsOk());
        EXPECT_TRUE(SubmitJob(self, done_child).IsOk());
        co_await done_child->Wait();
        self.Terminate();
        co_return Ok();
    });
    ASSERT_TRUE(root->AddCallback(Stage::Terminate, count).IsOk());

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(terminate_firings, 1);
    EXPECT_EQ(done_child->Status(), NodeStatus::Completed);
    EXPECT_EQ(root->Status(), NodeStatus::Terminated);
}

TEST(TaskNodeTest, TerminateBeforeStartSkipsBody) {
    Commander commander(Quiet());
    bool body_ran = false;
    bool start_fired = false;

    auto job = Job::Create("never", [&](Job&, Args) -> Task<NodeResult> {
        body_ran = true;
        co_return Ok();
    });
    ASSERT_TRUE(job->AddCallback(Stage::JobStart, [&](const CallbackContext&) { start_fired = true; }).IsOk());

    ASSERT_TRUE(commander.Submit(job).IsOk());
    job->Terminate();
    EXPECT_EQ(job->Status(), NodeStatus::Terminated);
    EXPECT_TRUE(job->IsResolved());

    ASSERT_TRUE(commander.Run().IsOk());
    EXPECT_FALSE(body_ran);
    EXPECT_FALSE(start_fired);
}

TEST(TaskNodeTest, TerminatedNodeRejectsChildren) {
    Commander commander(Quiet());
    Result<std::shared_ptr<Job>, Error> late = Err(make_error_code(Errc::InvalidArgument));

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        self.Terminate();
        late = SubmitJob(self, "late", Returns(1));
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    ASSERT_TRUE(late.IsErr());
    EXPECT_EQ(late.Error(), Errc::ParentClosed);
}

TEST(TaskNodeTest, BodyOutcomeAfterTerminationIsDropped) {
    Commander commander(Quiet());
    bool end_fired = false;

    auto job = Job::Create("stubborn", [&](Job& self, Args) -> Task<NodeResult> {
        self.Terminate();
        co_return Ok(std::any(5));
    });
    ASSERT_TRUE(job->AddCallback(Stage::JobEnd, [&](const CallbackContext&) { end_fired = true; }).IsOk());

    ASSERT_TRUE(commander.Submit(job).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(job->Status(), NodeStatus::Terminated);
    EXPECT_EQ(job->GetResult(), nullptr);
    EXPECT_FALSE(end_fired);
}

// ============================================================================
// Join
// ============================================================================

TEST(TaskNodeTest, JoinDeliversOutcome) {
    Commander commander(Quiet());
    auto producer = Job::Create("producer", [](Job& self, Args) -> Task<NodeResult> {
        co_await AsyncSleep(10ms, self.GetToken());
        co_return Ok(std::any(std::string("payload")));
    });
    std::string received;

    auto consumer = Job::Create("consumer", [&](Job&, Args) -> Task<NodeResult> {
        auto outcome = co_await producer->Join();
        if (outcome.IsErr()) {
            co_return Err(outcome.Error());
        }
        received = std::any_cast<std::string>(outcome.Value());
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(producer).IsOk());
    ASSERT_TRUE(commander.Submit(consumer).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(received, "payload");
}

TEST(TaskNodeTest, JoinOnTerminatedNode) {
    Commander commander(Quiet());
    auto victim = Job::Create("victim", SleepsUntilTerminated());
    std::optional<Fault> seen;

    auto watcher = Job::Create("watcher", [&](Job&, Args) -> Task<NodeResult> {
        victim->Terminate();
        auto outcome = co_await victim->Join();
        if (outcome.IsErr()) {
            seen = outcome.Error();
        }
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(victim).IsOk());
    ASSERT_TRUE(commander.Submit(watcher).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->code, Errc::Terminated);
}
