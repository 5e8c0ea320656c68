// ============================================================================
// Handler Tests: plain invocation, tracked calls, reuse
// ============================================================================

#include "cotree/cotree.hpp"

#include <algorithm>
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

// Echoes its first argument, or 0.
Task<NodeResult> Echo(Handler&, Args args) {
    if (args.empty()) {
        co_return Ok(std::any(0));
    }
    co_return Ok(args.front());
}

Task<NodeResult> SlowEcho(Handler& self, Args args) {
    co_await AsyncSleep(10ms, self.GetToken());
    co_return Ok(args.empty() ? std::any(0) : args.front());
}

}  // namespace

// ============================================================================
// Plain invocation
// ============================================================================

TEST(HandlerTest, InvokeBypassesTheTree) {
    auto handler = Handler::Create("echo", Echo);
    int starts = 0;
    ASSERT_TRUE(handler->AddCallback(Stage::HandlerStart, [&](const CallbackContext&) { ++starts; }).IsOk());

    auto outcome = SyncWait(handler->Invoke({std::any(9)}));

    ASSERT_TRUE(outcome.IsOk());
    ASSERT_TRUE(outcome.Value().IsOk());
    EXPECT_EQ(std::any_cast<int>(outcome.Value().Value()), 9);
    EXPECT_EQ(handler->Status(), NodeStatus::Pending);
    EXPECT_EQ(handler->CallCount(), 0u);
    EXPECT_EQ(starts, 0);
}

// ============================================================================
// Tracked calls
// ============================================================================

TEST(HandlerTest, TrackedCallRunsLifecycle) {
    Commander commander(Quiet());
    auto handler = Handler::Create("echo", Echo);
    std::vector<std::string> log;

    ASSERT_TRUE(handler->AddCallback(Stage::HandlerStart, [&](const CallbackContext&) { log.push_back("start"); }).IsOk());
    ASSERT_TRUE(handler->AddCallback(Stage::HandlerEnd, [&](const CallbackContext&) { log.push_back("end"); }).IsOk());

    ASSERT_TRUE(CallHandler(commander, handler, {std::any(5)}).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(log, (std::vector<std::string>{"start", "end"}));
    EXPECT_EQ(handler->Status(), NodeStatus::Completed);
    EXPECT_EQ(*handler->ResultAs<int>(), 5);
    EXPECT_EQ(handler->CallCount(), 1u);
}

TEST(HandlerTest, SubmittedAsRootWithNoArgs) {
    Commander commander(Quiet());
    auto handler = Handler::Create("echo", Echo);

    ASSERT_TRUE(commander.Submit(handler).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_TRUE(handler->GetArgs().empty());
    EXPECT_EQ(*handler->ResultAs<int>(), 0);
}

TEST(HandlerTest, CallableConvenienceOverload) {
    Commander commander(Quiet());
    std::shared_ptr<Handler> created;

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        auto called = CallHandler(self, "inline", Echo, {std::any(3)});
        if (called.IsErr()) {
            co_return Err(MakeFault(called.Error()));
        }
        created = called.Value();
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    ASSERT_NE(created, nullptr);
    EXPECT_FALSE(created->IsReusable());
    EXPECT_EQ(created->Parent(), root.get());
    EXPECT_EQ(*created->ResultAs<int>(), 3);
}

// ============================================================================
// Reuse
// ============================================================================

TEST(HandlerTest, OneShotHandlerRejectsSecondCall) {
    Commander commander(Quiet());
    auto handler = Handler::Create("once", Echo);
    Result<std::shared_ptr<Handler>, Error> second = Ok(std::shared_ptr<Handler>());

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        EXPECT_TRUE(CallHandler(self, handler).IsOk());
        co_await handler->Wait();
        second = CallHandler(self, handler);
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    ASSERT_TRUE(second.IsErr());
    EXPECT_EQ(second.Error(), Errc::ReuseViolation);
    EXPECT_EQ(handler->CallCount(), 1u);
}

TEST(HandlerTest, ReusableHandlerRunsAgain) {
    Commander commander(Quiet());
    auto handler = Handler::Create("again", SlowEcho, {.reusable = true});
    std::vector<int> results;
    int ends = 0;

    ASSERT_TRUE(handler->AddCallback(Stage::HandlerEnd, [&](const CallbackContext&) { ++ends; }).IsOk());

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        for (int i = 1; i <= 3; ++i) {
            auto called = CallHandler(self, handler, {std::any(i)});
            if (called.IsErr()) {
                co_return Err(MakeFault(called.Error()));
            }
            co_await handler->Wait();
            results.push_back(*handler->ResultAs<int>());
        }
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(results, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(ends, 3);
    EXPECT_EQ(handler->CallCount(), 3u);
    EXPECT_EQ(handler->Cycle(), 2u);
    EXPECT_EQ(root->Children().size(), 1u);
    EXPECT_EQ(root->Status(), NodeStatus::Completed);
}

TEST(HandlerTest, CallWhileRunningIsBusy) {
    Commander commander(Quiet());
    auto handler = Handler::Create("busy", SlowEcho, {.reusable = true});
    Result<std::shared_ptr<Handler>, Error> second = Ok(std::shared_ptr<Handler>());

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        EXPECT_TRUE(CallHandler(self, handler).IsOk());
        co_await AsyncSleep(1ms, self.GetToken());
        second = CallHandler(self, handler);
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    ASSERT_TRUE(second.IsErr());
    EXPECT_EQ(second.Error(), Errc::NodeBusy);
    EXPECT_EQ(handler->CallCount(), 1u);
}

TEST(HandlerTest, RecallFromOwnEndCallbackIsQueued) {
    Commander commander(Quiet());
    auto handler = Handler::Create("loop", Echo, {.reusable = true});
    std::weak_ptr<Handler> weak = handler;
    std::vector<std::string> log;

    ASSERT_TRUE(handler
                    ->AddCallback(
                        Stage::HandlerEnd,
                        [&log, weak](const CallbackContext& ctx) {
                            auto self = weak.lock();
                            int n = *self->ResultAs<int>();
                            log.push_back("end" + std::to_string(n));
                            if (n < 3) {
                                auto again = CallHandler(*ctx.node->Parent(), self, {std::any(n + 1)});
                                EXPECT_TRUE(again.IsOk());
                            }
                        },
                        {}, {}, true)
                    .IsOk());

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        EXPECT_TRUE(CallHandler(self, handler, {std::any(1)}).IsOk());
        co_return Ok();
    });
    ASSERT_TRUE(root->AddCallback(Stage::JobEnd, [&](const CallbackContext&) { log.push_back("root"); }).IsOk());

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(log, (std::vector<std::string>{"end1", "end2", "end3", "root"}));
    EXPECT_EQ(handler->CallCount(), 3u);
    EXPECT_EQ(handler->Status(), NodeStatus::Completed);
}

TEST(HandlerTest, TerminatedCycleCanBeFollowedByANewOne) {
    Commander commander(Quiet());
    auto handler = Handler::Create("retry", SlowEcho, {.reusable = true});
    std::vector<NodeStatus> statuses;

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        EXPECT_TRUE(CallHandler(self, handler, {std::any(1)}).IsOk());
        co_await AsyncSleep(1ms, self.GetToken());
        handler->Terminate();
        co_await handler->Wait();
        statuses.push_back(handler->Status());

        EXPECT_TRUE(CallHandler(self, handler, {std::any(2)}).IsOk());
        co_await handler->Wait();
        statuses.push_back(handler->Status());
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(statuses, (std::vector<NodeStatus>{NodeStatus::Terminated, NodeStatus::Completed}));
    EXPECT_EQ(*handler->ResultAs<int>(), 2);
}

TEST(HandlerTest, RecallRightAfterTerminateWaitsForTheSuspendedBody) {
    Commander commander(Quiet());
    int running = 0;
    int max_running = 0;
    std::vector<int> finished;

    // Round 1 polls until terminated; round 2 gives up after three ticks.
    auto poller = Handler::Create(
        "poller",
        [&](Handler& self, Args args) -> Task<NodeResult> {
            const int round = std::any_cast<int>(args.front());
            max_running = std::max(max_running, ++running);
            int ticks = 0;
            while (!self.GetToken().IsTerminated() && (round == 1 || ticks < 3)) {
                co_await AsyncSleep(5ms, self.GetToken());
                ++ticks;
            }
            --running;
            finished.push_back(round);
            co_return Ok(std::any(round));
        },
        {.reusable = true});

    auto root = Job::Create("root", [&](Job& self, Args) -> Task<NodeResult> {
        EXPECT_TRUE(CallHandler(self, poller, {std::any(1)}).IsOk());
        co_await AsyncSleep(12ms, self.GetToken());

        poller->Terminate();
        EXPECT_TRUE(CallHandler(self, poller, {std::any(2)}).IsOk());
        // A second call while the first is still queued is refused.
        EXPECT_EQ(CallHandler(self, poller, {std::any(3)}).Error(), Errc::NodeBusy);

        co_await poller->Wait();
        EXPECT_EQ(poller->Status(), NodeStatus::Completed);
        co_return Ok();
    });

    ASSERT_TRUE(commander.Submit(root).IsOk());
    ASSERT_TRUE(commander.Run().IsOk());

    EXPECT_EQ(max_running, 1);
    EXPECT_EQ(finished, (std::vector<int>{1, 2}));
    ASSERT_NE(poller->ResultAs<int>(), nullptr);
    EXPECT_EQ(*poller->ResultAs<int>(), 2);
    EXPECT_EQ(poller->CallCount(), 2u);
    EXPECT_EQ(root->Status(), NodeStatus::Completed);
    EXPECT_EQ(commander.InFlight(), 0u);
}
