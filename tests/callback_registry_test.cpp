// ============================================================================
// CallbackRegistry Tests
// ============================================================================

#include "cotree/tree/callback_registry.hpp"

#include "cotree/tree/job.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cotree;

namespace {

std::shared_ptr<Job> MakeIdleJob() {
    return Job::Create("idle", [](Job&, Args) -> Task<NodeResult> { co_return Ok(); });
}

}  // namespace

// ============================================================================
// Registration
// ============================================================================

TEST(CallbackRegistryTest, EmptyFunctionRejected) {
    CallbackRegistry registry;
    auto result = registry.Register(Stage::JobEnd, CallbackBinding{});
    ASSERT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::InvalidArgument);
    EXPECT_EQ(registry.Count(Stage::JobEnd), 0u);
}

TEST(CallbackRegistryTest, CountsPerStage) {
    CallbackRegistry registry;
    auto noop = [](const CallbackContext&) {};
    EXPECT_TRUE(registry.Register(Stage::JobEnd, CallbackBinding{noop}).IsOk());
    EXPECT_TRUE(registry.Register(Stage::JobEnd, CallbackBinding{noop}).IsOk());
    EXPECT_TRUE(registry.Register(Stage::Terminate, CallbackBinding{noop}).IsOk());

    EXPECT_EQ(registry.Count(Stage::JobEnd), 2u);
    EXPECT_EQ(registry.Count(Stage::Terminate), 1u);
    EXPECT_EQ(registry.Count(Stage::JobStart), 0u);
}

TEST(CallbackRegistryTest, StageNames) {
    EXPECT_STREQ(ToString(Stage::JobStart), "at_job_start");
    EXPECT_STREQ(ToString(Stage::JobEnd), "at_job_end");
    EXPECT_STREQ(ToString(Stage::HandlerStart), "at_handler_start");
    EXPECT_STREQ(ToString(Stage::HandlerEnd), "at_handler_end");
    EXPECT_STREQ(ToString(Stage::Exception), "at_exception");
    EXPECT_STREQ(ToString(Stage::Terminate), "at_terminate");
    EXPECT_STREQ(ToString(Stage::CommanderEnd), "at_commander_end");
}

// ============================================================================
// Firing
// ============================================================================

TEST(CallbackRegistryTest, FiresInRegistrationOrder) {
    CallbackRegistry registry;
    auto node = MakeIdleJob();
    std::vector<int> order;

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(
            registry.Register(Stage::JobEnd, CallbackBinding{[&order, i](const CallbackContext&) { order.push_back(i); }})
                .IsOk());
    }
    registry.Fire(Stage::JobEnd, *node);

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(CallbackRegistryTest, OnlyTheFiredStageRuns) {
    CallbackRegistry registry;
    auto node = MakeIdleJob();
    int end_calls = 0;

    EXPECT_TRUE(registry.Register(Stage::JobEnd, CallbackBinding{[&](const CallbackContext&) { ++end_calls; }}).IsOk());
    registry.Fire(Stage::JobStart, *node);
    registry.Fire(Stage::Exception, *node);

    EXPECT_EQ(end_calls, 0);
}

TEST(CallbackRegistryTest, BoundArgumentsDelivered) {
    CallbackRegistry registry;
    auto node = MakeIdleJob();
    int seen_int = 0;
    std::string seen_tag;

    CallbackBinding binding{[&](const CallbackContext& ctx) {
                                seen_int = std::any_cast<int>(ctx.args.at(0));
                                seen_tag = std::any_cast<std::string>(ctx.kwargs.at("tag"));
                            },
                            {std::any(7)},
                            {{"tag", std::any(std::string("audit"))}}};
    EXPECT_TRUE(registry.Register(Stage::JobEnd, std::move(binding)).IsOk());
    registry.Fire(Stage::JobEnd, *node);

    EXPECT_EQ(seen_int, 7);
    EXPECT_EQ(seen_tag, "audit");
}

TEST(CallbackRegistryTest, NodeInjectedOnlyWhenRequested) {
    CallbackRegistry registry;
    auto node = MakeIdleJob();
    TaskNode* plain = node.get();
    TaskNode* injected = nullptr;

    EXPECT_TRUE(registry.Register(Stage::JobEnd, CallbackBinding{[&](const CallbackContext& ctx) { plain = ctx.node; }})
                    .IsOk());
    EXPECT_TRUE(registry
                    .Register(Stage::JobEnd,
                              CallbackBinding{[&](const CallbackContext& ctx) { injected = ctx.node; }, {}, {}, true})
                    .IsOk());
    registry.Fire(Stage::JobEnd, *node);

    EXPECT_EQ(plain, nullptr);
    EXPECT_EQ(injected, node.get());
}

TEST(CallbackRegistryTest, FaultVisibleToCallback) {
    CallbackRegistry registry;
    auto node = MakeIdleJob();
    std::string message;

    EXPECT_TRUE(registry
                    .Register(Stage::Exception,
                              CallbackBinding{[&](const CallbackContext& ctx) { message = ctx.fault->message; }})
                    .IsOk());
    Fault fault = MakeFault(Errc::ExecutionFault, "boom");
    registry.Fire(Stage::Exception, *node, &fault);

    EXPECT_EQ(message, "boom");
}

TEST(CallbackRegistryTest, BindingAddedDuringFireRunsNextTime) {
    CallbackRegistry registry;
    auto node = MakeIdleJob();
    int late_calls = 0;
    bool added = false;

    EXPECT_TRUE(registry
                    .Register(Stage::JobEnd, CallbackBinding{[&](const CallbackContext&) {
                                  if (!added) {
                                      added = true;
                                      EXPECT_TRUE(registry
                                                      .Register(Stage::JobEnd, CallbackBinding{[&](const CallbackContext&) {
                                                                    ++late_calls;
                                                                }})
                                                      .IsOk());
                                  }
                              }})
                    .IsOk());

    registry.Fire(Stage::JobEnd, *node);
    EXPECT_EQ(late_calls, 0);

    registry.Fire(Stage::JobEnd, *node);
    EXPECT_EQ(late_calls, 1);
}
