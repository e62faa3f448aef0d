#include <gtest/gtest.h>

#include "admission/admission_policy.hpp"
#include "test_support.hpp"

namespace heartcore::testing {
namespace {

using heartcore::agent::Action;
using heartcore::config::DecisionDefault;

class AdmissionPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.energy_floor = 0.1;
        options.wakeup_words = {"Heart", "hey bot"};
        options.failure_default = DecisionDefault::kIgnore;
    }

    std::shared_ptr<heartcore::session::SessionState> SessionWith(double energy, double mood = 0.0) {
        heartcore::session::PersistedState persisted{};
        persisted.session_id = "group-1";
        persisted.energy = energy;
        persisted.mood = mood;
        return std::make_shared<heartcore::session::SessionState>(persisted, heartcore::utils::Now(), false);
    }

    heartcore::bus::InboundMessage Msg(const std::string& text, bool wake = false) {
        heartcore::bus::InboundMessage msg{};
        msg.session_id = "group-1";
        msg.sender_id = "alice";
        msg.text = text;
        msg.wake_signal = wake;
        return msg;
    }

    FakeClassifier classifier;
    heartcore::admission::AdmissionOptions options;
};

TEST_F(AdmissionPolicyTest, ExhaustedSessionIgnoresWithoutClassifierCall) {
    heartcore::admission::AdmissionPolicy policy(classifier, options);
    auto session = SessionWith(0.05);
    const auto decision = policy.Decide(*session, Msg("what do you think?"));
    EXPECT_EQ(decision.action, Action::kIgnore);
    EXPECT_EQ(classifier.calls, 0);
}

TEST_F(AdmissionPolicyTest, ExhaustionAlsoBlocksWakeupWords) {
    heartcore::admission::AdmissionPolicy policy(classifier, options);
    auto session = SessionWith(0.05);
    EXPECT_EQ(policy.Decide(*session, Msg("heart, are you there")).action, Action::kIgnore);
    EXPECT_EQ(classifier.calls, 0);
}

TEST_F(AdmissionPolicyTest, WakeSignalBypassesEnergyFloor) {
    heartcore::admission::AdmissionPolicy policy(classifier, options);
    auto session = SessionWith(0.05);
    const auto decision = policy.Decide(*session, Msg("you there?", true));
    EXPECT_EQ(decision.action, Action::kReply);
    EXPECT_EQ(decision.necessity, 10);
    EXPECT_EQ(decision.relevance, 10);
    EXPECT_EQ(classifier.calls, 0);
}

TEST_F(AdmissionPolicyTest, WakeupWordPrefixRepliesCaseInsensitively) {
    heartcore::admission::AdmissionPolicy policy(classifier, options);
    auto session = SessionWith(0.8);
    const auto decision = policy.Decide(*session, Msg("  HEART what's the plan"));
    EXPECT_EQ(decision.action, Action::kReply);
    EXPECT_EQ(decision.necessity, 9);
    EXPECT_EQ(classifier.calls, 0);
}

TEST_F(AdmissionPolicyTest, WakeupWordElsewhereGoesToClassifier) {
    heartcore::admission::AdmissionPolicy policy(classifier, options);
    classifier.action = Action::kWait;
    auto session = SessionWith(0.8, 0.25);
    const auto decision = policy.Decide(*session, Msg("so about heart..."));
    EXPECT_EQ(decision.action, Action::kWait);
    EXPECT_EQ(classifier.calls, 1);
    EXPECT_DOUBLE_EQ(classifier.last_mood, 0.25);
    EXPECT_EQ(classifier.last_text, "so about heart...");
}

TEST_F(AdmissionPolicyTest, ClassifierFailureUsesConfiguredDefault) {
    classifier.fail = true;
    auto session = SessionWith(0.8);

    heartcore::admission::AdmissionPolicy closed(classifier, options);
    EXPECT_EQ(closed.Decide(*session, Msg("hm")).action, Action::kIgnore);

    options.failure_default = DecisionDefault::kReply;
    heartcore::admission::AdmissionPolicy open(classifier, options);
    EXPECT_EQ(open.Decide(*session, Msg("hm")).action, Action::kReply);

    options.failure_default = DecisionDefault::kWait;
    heartcore::admission::AdmissionPolicy waiting(classifier, options);
    EXPECT_EQ(waiting.Decide(*session, Msg("hm")).action, Action::kWait);
    EXPECT_EQ(classifier.calls, 3);
}

TEST_F(AdmissionPolicyTest, DecisionDoesNotMutateSession) {
    heartcore::admission::AdmissionPolicy policy(classifier, options);
    auto session = SessionWith(0.5, -0.3);
    policy.Decide(*session, Msg("anything"));
    policy.Decide(*session, Msg("ping", true));
    const auto snapshot = session->Snapshot();
    EXPECT_DOUBLE_EQ(snapshot.energy, 0.5);
    EXPECT_DOUBLE_EQ(snapshot.mood, -0.3);
    EXPECT_FALSE(snapshot.dirty);
    EXPECT_FALSE(snapshot.locked);
}

TEST(AdmissionOptionsTest, BuiltFromConfig) {
    heartcore::config::Config config{};
    config.energy.floor = 0.2;
    config.attention.wakeup_words = {"mai"};
    config.classifier.failure_default = DecisionDefault::kReply;
    const auto options = heartcore::admission::MakeAdmissionOptions(config);
    EXPECT_DOUBLE_EQ(options.energy_floor, 0.2);
    EXPECT_EQ(options.wakeup_words, std::vector<std::string>{"mai"});
    EXPECT_EQ(heartcore::admission::ToAction(options.failure_default), Action::kReply);
}

}  // namespace
}  // namespace heartcore::testing
