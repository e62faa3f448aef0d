#include <gtest/gtest.h>

#include <chrono>
#include <optional>

#include "dispatch/debounce_aggregator.hpp"
#include "test_support.hpp"

namespace heartcore::testing {
namespace {

using heartcore::agent::Action;
using heartcore::session::CyclePhase;

HarnessOptions DefaultOptions() {
    HarnessOptions options{};
    options.debounce.quiet_period = 2000ms;
    options.debounce.max_window = 15000ms;
    options.debounce.energy_cost = 0.05;
    return options;
}

TEST(DebounceAggregatorTest, SingleMessageFiresOnceAfterQuietPeriod) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "is anyone around?");

    h.scheduler.AdvanceBy(1999ms);
    EXPECT_TRUE(h.generator.batches.empty());
    EXPECT_EQ(h.Snapshot("group-1").phase, CyclePhase::kWaiting);

    h.scheduler.AdvanceBy(1ms);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), std::vector<std::string>{"is anyone around?"});

    h.scheduler.AdvanceBy(60s);
    EXPECT_EQ(h.generator.batches.size(), 1u);
    EXPECT_FALSE(h.Snapshot("group-1").locked);
}

TEST(DebounceAggregatorTest, RapidOwnerMessagesCoalesceInArrivalOrder) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "so");
    h.scheduler.AdvanceBy(300ms);
    h.Send("group-1", "alice", "about tomorrow");
    h.scheduler.AdvanceBy(300ms);
    h.Send("group-1", "alice", "are we still on?");
    const auto last_sent = h.scheduler.Now();

    h.scheduler.AdvanceBy(1999ms);
    EXPECT_TRUE(h.generator.batches.empty());

    h.scheduler.AdvanceBy(1ms);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), (std::vector<std::string>{"so", "about tomorrow", "are we still on?"}));
    EXPECT_EQ(h.scheduler.Now() - last_sent, 2000ms);
}

TEST(DebounceAggregatorTest, HardCeilingClosesWindowUnderContinuousChatter) {
    auto options = DefaultOptions();
    options.debounce.max_window = 5000ms;
    Harness h(options);

    for (int i = 0; i < 10; ++i) {
        h.Send("group-1", "alice", "m" + std::to_string(i));
        h.scheduler.AdvanceBy(1s);
    }

    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(0), (std::vector<std::string>{"m0", "m1", "m2", "m3", "m4"}));
    EXPECT_EQ(h.generator.Texts(1), (std::vector<std::string>{"m5", "m6", "m7", "m8", "m9"}));
}

TEST(DebounceAggregatorTest, SuccessfulCycleAppliesDeltaAndPublishesReply) {
    Harness h(DefaultOptions());
    h.generator.sentiment_delta = 0.2;
    h.Send("group-1", "alice", "good news!");
    h.scheduler.AdvanceBy(2s);

    const auto snapshot = h.Snapshot("group-1");
    EXPECT_NEAR(snapshot.energy, 0.75, 1e-9);
    EXPECT_NEAR(snapshot.mood, 0.2, 1e-9);
    EXPECT_EQ(snapshot.total_replies, 1);
    EXPECT_TRUE(snapshot.dirty);
    EXPECT_FALSE(snapshot.locked);
    EXPECT_EQ(snapshot.phase, CyclePhase::kIdle);

    ASSERT_EQ(h.replies.size(), 1u);
    EXPECT_EQ(h.replies[0].session_id, "group-1");
    EXPECT_EQ(h.replies[0].reply_to, "alice");
    EXPECT_EQ(h.replies[0].content, "reply 1");
    EXPECT_EQ(h.aggregator.CompletedCycles(), 1u);
}

TEST(DebounceAggregatorTest, GeneratorFailureStillReleasesLockAndChargesEnergy) {
    Harness h(DefaultOptions());
    h.generator.fail = true;
    h.generator.sentiment_delta = 0.5;
    h.Send("group-1", "alice", "hello?");
    h.scheduler.AdvanceBy(2s);

    const auto snapshot = h.Snapshot("group-1");
    EXPECT_FALSE(snapshot.locked);
    EXPECT_FALSE(snapshot.owner_sender_id.has_value());
    EXPECT_NEAR(snapshot.energy, 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(snapshot.mood, 0.0);
    EXPECT_EQ(snapshot.total_replies, 0);
    EXPECT_TRUE(h.replies.empty());
    EXPECT_EQ(h.aggregator.FailedCycles(), 1u);

    h.generator.fail = false;
    h.Send("group-1", "alice", "hello again");
    h.scheduler.AdvanceBy(2s);
    EXPECT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.replies.size(), 1u);
}

TEST(DebounceAggregatorTest, FailedCycleStillDrainsBackgroundPool) {
    Harness h(DefaultOptions());
    h.generator.fail = true;
    h.Send("group-1", "alice", "first");
    h.Send("group-1", "bob", "second");
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);

    h.generator.fail = false;
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(1), std::vector<std::string>{"second"});
}

TEST(DebounceAggregatorTest, WaitDecisionOpensAndExtendsWindow) {
    Harness h(DefaultOptions());
    h.classifier.action = Action::kWait;
    const auto first = h.Send("group-1", "alice", "so the thing is");
    EXPECT_EQ(first.admission, heartcore::session::Admission::kOpenedCycle);

    h.scheduler.AdvanceBy(1s);
    h.classifier.action = Action::kReply;
    const auto second = h.Send("group-1", "alice", "can you help?");
    EXPECT_EQ(second.admission, heartcore::session::Admission::kExtendedCycle);

    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), (std::vector<std::string>{"so the thing is", "can you help?"}));
}

TEST(DebounceAggregatorTest, GeneratorSeesStateAtClose) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "hi");
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.states.size(), 1u);
    EXPECT_DOUBLE_EQ(h.generator.states[0].energy, 0.8);
    EXPECT_EQ(h.generator.states[0].phase, CyclePhase::kClosing);
    EXPECT_TRUE(h.generator.states[0].locked);
}

TEST(DebounceOptionsTest, BuiltFromConfig) {
    heartcore::config::Config config{};
    config.debounce.quiet_period_s = 1.5;
    config.debounce.max_window_s = 10.0;
    config.energy.cost_per_cycle = 0.07;
    const auto options = heartcore::dispatch::MakeDebounceOptions(config);
    EXPECT_EQ(options.quiet_period, 1500ms);
    EXPECT_EQ(options.max_window, 10000ms);
    EXPECT_DOUBLE_EQ(options.energy_cost, 0.07);
}

TEST(DebounceAggregatorTest, ProactiveCycleSendsOpenerAndResetsMood) {
    Harness h(DefaultOptions());
    auto session = h.store.Get("group-1");
    h.store.ApplyCycleDelta(*session, heartcore::session::CycleDelta{.energy_cost = 0.0, .success = true, .mood_delta = 0.4});

    ASSERT_TRUE(h.aggregator.OpenProactive(session));
    auto snapshot = h.Snapshot("group-1");
    EXPECT_TRUE(snapshot.locked);
    EXPECT_EQ(snapshot.owner_sender_id, std::optional<std::string>(heartcore::session::kProactiveOwner));
    EXPECT_EQ(snapshot.phase, CyclePhase::kClosing);

    h.scheduler.RunDue();
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_TRUE(h.generator.batches[0].empty());
    EXPECT_NEAR(h.generator.states[0].mood, 0.4, 1e-9);
    ASSERT_EQ(h.replies.size(), 1u);
    EXPECT_TRUE(h.replies[0].reply_to.empty());
    EXPECT_EQ(h.replies[0].metadata.at("proactive"), "true");

    snapshot = h.Snapshot("group-1");
    EXPECT_FALSE(snapshot.locked);
    EXPECT_DOUBLE_EQ(snapshot.mood, 0.0);
    EXPECT_NEAR(snapshot.energy, 0.75, 1e-9);
    EXPECT_EQ(snapshot.total_replies, 2);
}

TEST(DebounceAggregatorTest, ProactiveCycleSkipsLockedSession) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "anyone here?");
    EXPECT_FALSE(h.aggregator.OpenProactive(h.store.Get("group-1")));
    EXPECT_EQ(h.Snapshot("group-1").owner_sender_id, std::optional<std::string>("alice"));

    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), std::vector<std::string>{"anyone here?"});
}

TEST(DebounceAggregatorTest, MessageDuringProactiveCycleIsAnsweredNext) {
    Harness h(DefaultOptions());
    h.generator.during_generate = [&](const std::string& session_id) {
        if (h.generator.batches.size() == 1) {
            EXPECT_EQ(h.Send(session_id, "bob", "oh hi").admission, heartcore::session::Admission::kDeferred);
        }
    };
    ASSERT_TRUE(h.aggregator.OpenProactive(h.store.Get("group-1")));
    h.scheduler.RunDue();

    auto snapshot = h.Snapshot("group-1");
    EXPECT_TRUE(snapshot.locked);
    EXPECT_EQ(snapshot.owner_sender_id, std::optional<std::string>("bob"));

    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(1), std::vector<std::string>{"oh hi"});
    EXPECT_EQ(h.replies[1].reply_to, "bob");
}

TEST(DebounceAggregatorThreadedTest, SlowGenerationDoesNotDelayOtherWindows) {
    HarnessOptions options{};
    options.debounce.quiet_period = 200ms;
    options.debounce.max_window = 500ms;
    ThreadedHarness h(1, 2, options);
    h.generator.delay_for = [](const std::string& session_id) {
        return session_id == "slow" ? std::chrono::milliseconds(2000) : std::chrono::milliseconds(0);
    };

    h.dispatcher.OnMessage(h.Msg("slow", "alice", "tell me a long story"));
    ASSERT_TRUE(WaitFor([&]() { return h.generator.Started("slow"); }));

    const auto sent = std::chrono::steady_clock::now();
    h.dispatcher.OnMessage(h.Msg("fast", "bob", "quick question"));
    ASSERT_TRUE(WaitFor([&]() { return h.generator.Finished("fast"); }, 1500ms));
    EXPECT_LT(std::chrono::steady_clock::now() - sent, 1000ms);
    EXPECT_FALSE(h.generator.Finished("slow"));
}

}  // namespace
}  // namespace heartcore::testing
