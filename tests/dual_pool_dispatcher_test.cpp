#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "dispatch/dual_pool_dispatcher.hpp"
#include "test_support.hpp"

namespace heartcore::testing {
namespace {

using heartcore::agent::Action;
using heartcore::session::Admission;

HarnessOptions DefaultOptions() {
    HarnessOptions options{};
    options.debounce.quiet_period = 2000ms;
    options.debounce.max_window = 15000ms;
    options.dispatcher.background_capacity = 20;
    options.dispatcher.ambient_capacity = 3;
    return options;
}

TEST(DualPoolDispatcherTest, OtherSenderIsDeferredToNextCycle) {
    Harness h(DefaultOptions());
    EXPECT_EQ(h.Send("group-1", "alice", "anyone free tonight?").admission, Admission::kOpenedCycle);
    h.scheduler.AdvanceBy(500ms);
    EXPECT_EQ(h.Send("group-1", "bob", "I am").admission, Admission::kDeferred);

    auto snapshot = h.Snapshot("group-1");
    EXPECT_EQ(snapshot.owner_sender_id, std::optional<std::string>("alice"));
    EXPECT_EQ(snapshot.background_size, 1u);

    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), std::vector<std::string>{"anyone free tonight?"});

    snapshot = h.Snapshot("group-1");
    EXPECT_TRUE(snapshot.locked);
    EXPECT_EQ(snapshot.owner_sender_id, std::optional<std::string>("bob"));
    EXPECT_EQ(snapshot.background_size, 0u);
    EXPECT_EQ(snapshot.accumulation_size, 1u);

    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(1), std::vector<std::string>{"I am"});
    EXPECT_FALSE(h.Snapshot("group-1").locked);
}

TEST(DualPoolDispatcherTest, PromotedOwnerCanExtendTheNewWindow) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "question one");
    h.Send("group-1", "bob", "bob one");
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);

    EXPECT_EQ(h.Send("group-1", "bob", "bob two").admission, Admission::kExtendedCycle);
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(1), (std::vector<std::string>{"bob one", "bob two"}));
}

TEST(DualPoolDispatcherTest, MultiPartyBurstLosesAndDuplicatesNothing) {
    auto options = DefaultOptions();
    options.dispatcher.background_capacity = 100;
    Harness h(options);
    const std::vector<std::string> senders{"alice", "bob", "carol", "dave"};
    std::vector<std::string> sent;
    for (int i = 0; i < 40; ++i) {
        const auto& sender = senders[static_cast<std::size_t>(i * 7 % 4)];
        const auto text = sender + "-" + std::to_string(i);
        sent.push_back(text);
        h.Send("group-1", sender, text);
        h.scheduler.AdvanceBy(250ms);
    }
    h.scheduler.AdvanceBy(10min);

    std::vector<std::string> seen;
    for (std::size_t i = 0; i < h.generator.batches.size(); ++i) {
        const auto texts = h.generator.Texts(i);
        seen.insert(seen.end(), texts.begin(), texts.end());
    }
    std::multiset<std::string> expected(sent.begin(), sent.end());
    std::multiset<std::string> actual(seen.begin(), seen.end());
    EXPECT_EQ(actual, expected);
    EXPECT_EQ(h.generator.max_in_flight, 1);
    EXPECT_FALSE(h.Snapshot("group-1").locked);
    EXPECT_EQ(h.dispatcher.DroppedCount(), 0u);
}

TEST(DualPoolDispatcherTest, BatchesAreInArrivalOrder) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "a1");
    h.scheduler.AdvanceBy(100ms);
    h.Send("group-1", "bob", "b1");
    h.scheduler.AdvanceBy(100ms);
    h.Send("group-1", "carol", "c1");
    h.scheduler.AdvanceBy(100ms);
    h.Send("group-1", "bob", "b2");
    h.scheduler.AdvanceBy(10s);

    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(0), std::vector<std::string>{"a1"});
    // Deferred traffic from everyone moves as one ordered batch.
    EXPECT_EQ(h.generator.Texts(1), (std::vector<std::string>{"b1", "c1", "b2"}));
    for (const auto& batch : h.generator.batches) {
        EXPECT_TRUE(std::is_sorted(batch.begin(), batch.end(), [](const auto& a, const auto& b) {
            return a.arrival_time < b.arrival_time;
        }));
    }
}

TEST(DualPoolDispatcherTest, SingleFlightWhileGenerating) {
    Harness h(DefaultOptions());
    std::vector<Admission> during;
    h.generator.during_generate = [&](const std::string& session_id) {
        if (during.empty()) {
            const auto snapshot = h.Snapshot(session_id);
            EXPECT_TRUE(snapshot.locked);
            EXPECT_TRUE(snapshot.owner_sender_id.has_value());
            during.push_back(*h.Send(session_id, "alice", "late addition").admission);
            during.push_back(*h.Send(session_id, "bob", "meanwhile").admission);
        }
    };
    h.Send("group-1", "alice", "first");
    h.scheduler.AdvanceBy(2s);

    // The owner's window already closed, so the late message waits too.
    EXPECT_EQ(during, (std::vector<Admission>{Admission::kDeferred, Admission::kDeferred}));
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.Snapshot("group-1").owner_sender_id, std::optional<std::string>("alice"));

    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(1), (std::vector<std::string>{"late addition", "meanwhile"}));
    EXPECT_EQ(h.generator.max_in_flight, 1);
}

TEST(DualPoolDispatcherTest, IgnoredMessagesGoToAmbientRingOnly) {
    Harness h(DefaultOptions());
    h.classifier.by_text = {
        {"lol", Action::kIgnore},
        {"haha", Action::kIgnore},
        {"xd", Action::kIgnore},
        {"nice", Action::kIgnore}};
    EXPECT_FALSE(h.Send("group-1", "bob", "lol").admission.has_value());
    h.Send("group-1", "carol", "haha");
    h.Send("group-1", "bob", "xd");
    h.Send("group-1", "dave", "nice");
    EXPECT_FALSE(h.Snapshot("group-1").locked);
    EXPECT_EQ(h.Snapshot("group-1").ambient_size, 3u);

    h.Send("group-1", "alice", "what's funny?");
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), std::vector<std::string>{"what's funny?"});
    ASSERT_EQ(h.generator.ambient.size(), 1u);
    std::vector<std::string> ambient;
    for (const auto& msg : h.generator.ambient[0]) {
        ambient.push_back(msg.text);
    }
    EXPECT_EQ(ambient, (std::vector<std::string>{"haha", "xd", "nice"}));
}

TEST(DualPoolDispatcherTest, BackgroundCapacityDropsOldest) {
    auto options = DefaultOptions();
    options.dispatcher.background_capacity = 2;
    Harness h(options);
    h.Send("group-1", "alice", "owner");
    for (int i = 0; i < 5; ++i) {
        h.scheduler.AdvanceBy(10ms);
        h.Send("group-1", "bob", "b" + std::to_string(i));
    }
    EXPECT_EQ(h.dispatcher.DroppedCount(), 3u);
    h.scheduler.AdvanceBy(10s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    EXPECT_EQ(h.generator.Texts(1), (std::vector<std::string>{"b3", "b4"}));
}

TEST(DualPoolDispatcherTest, SessionsRunIndependently) {
    Harness h(DefaultOptions());
    h.Send("group-1", "alice", "one");
    h.Send("group-2", "bob", "two");
    EXPECT_TRUE(h.Snapshot("group-1").locked);
    EXPECT_TRUE(h.Snapshot("group-2").locked);
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 2u);
    std::set<std::string> sessions(h.generator.sessions.begin(), h.generator.sessions.end());
    EXPECT_EQ(sessions, (std::set<std::string>{"group-1", "group-2"}));
}

TEST(DualPoolDispatcherTest, ExhaustedSessionStillAnswersWake) {
    Harness h(DefaultOptions());
    {
        auto session = h.store.Get("group-1");
        session->WithData([](heartcore::session::SessionData& data) { data.energy = 0.05; });
    }
    h.Send("group-1", "alice", "chatter");
    EXPECT_FALSE(h.Snapshot("group-1").locked);
    EXPECT_EQ(h.classifier.calls, 0);

    h.Send("group-1", "alice", "@bot help", true);
    h.scheduler.AdvanceBy(2s);
    ASSERT_EQ(h.generator.batches.size(), 1u);
    EXPECT_EQ(h.generator.Texts(0), std::vector<std::string>{"@bot help"});
    EXPECT_DOUBLE_EQ(h.Snapshot("group-1").energy, 0.0);
}

TEST(DispatcherOptionsTest, BuiltFromConfig) {
    heartcore::config::Config config{};
    config.attention.background_pool_capacity = 7;
    config.attention.ambient_context_capacity = 4;
    const auto options = heartcore::dispatch::MakeDispatcherOptions(config);
    EXPECT_EQ(options.background_capacity, 7u);
    EXPECT_EQ(options.ambient_capacity, 4u);
}

TEST(DualPoolDispatcherThreadedTest, ConcurrentSendersAreGeneratedExactlyOnce) {
    HarnessOptions options{};
    options.debounce.quiet_period = 5ms;
    options.debounce.max_window = 20ms;
    options.dispatcher.background_capacity = 100000;
    ThreadedHarness h(2, 4, options);

    const std::vector<std::string> sessions{"group-1", "group-2", "group-3"};
    const std::vector<std::string> senders{"alice", "bob", "carol"};
    constexpr int kThreads = 6;
    constexpr int kPerThread = 150;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                const auto& session_id = sessions[(t + i) % sessions.size()];
                const auto& sender_id = senders[(t * 7 + i) % senders.size()];
                h.dispatcher.OnMessage(h.Msg(session_id, sender_id, "t" + std::to_string(t) + "-m" + std::to_string(i)));
                if (i % 10 == 0) {
                    std::this_thread::sleep_for(1ms);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const std::size_t sent = kThreads * kPerThread;
    ASSERT_TRUE(WaitFor([&]() { return h.generator.SeenCount() >= sent; }, 10000ms));
    ASSERT_TRUE(WaitFor([&]() {
        return std::all_of(sessions.begin(), sessions.end(), [&](const auto& id) { return h.Idle(id); });
    }));

    const auto seen = h.generator.Seen();
    const std::set<std::string> unique(seen.begin(), seen.end());
    EXPECT_EQ(seen.size(), sent);
    EXPECT_EQ(unique.size(), sent);
    EXPECT_EQ(h.generator.Overlaps(), 0);
    EXPECT_EQ(h.dispatcher.DroppedCount(), 0u);
}

}  // namespace
}  // namespace heartcore::testing
