#include <gtest/gtest.h>

#include "strategy/decision.hpp"

#include <optional>
#include <random>

using core::Action;
using core::Mode;
using core::Side;
using core::TradeIntent;
using strategy::decide;
using strategy::DecisionParams;
using strategy::PositionState;
using strategy::Reading;

namespace {

const ind::Bands kBands{110.0, 100.0, 90.0};

Reading at(double close, std::optional<double> tq) {
    return Reading{close, tq, kBands};
}

TradeIntent open_intent(Side s, Mode m, double f) { return TradeIntent{Action::Open, s, m, f, 1}; }
TradeIntent close_intent(Side s, Mode m, int n) { return TradeIntent{Action::Close, s, m, 1.0, n}; }

}  // namespace

TEST(Decide, NothingWithoutBands) {
    PositionState st;
    st.reversion_short = 2;
    const auto d = decide(st, Reading{200.0, std::nullopt, std::nullopt}, DecisionParams{});
    EXPECT_TRUE(d.intents.empty());
    EXPECT_EQ(d.state, st);
}

TEST(Decide, StrongTrendAboveUpperIsBreakoutNotReversion) {
    const auto d = decide(PositionState{}, at(111.0, 5.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], open_intent(Side::Long, Mode::Breakout, 0.5));
    EXPECT_EQ(d.state.breakout_long, 1);
    EXPECT_EQ(d.state.reversion_short, 0);
}

TEST(Decide, WeakTrendAboveUpperIsReversionShort) {
    const auto d = decide(PositionState{}, at(111.0, 1.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], open_intent(Side::Short, Mode::Reversion, -0.5));
    EXPECT_EQ(d.state.reversion_short, 1);
}

TEST(Decide, WeakTrendBelowLowerIsReversionLong) {
    DecisionParams p;
    p.position_fraction = 0.25;
    const auto d = decide(PositionState{}, at(89.0, -1.0), p);
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], open_intent(Side::Long, Mode::Reversion, 0.25));
}

TEST(Decide, PyramidingStopsAtMaxOrders) {
    PositionState st;
    int opens = 0;
    for (int bar = 0; bar < 4; ++bar) {
        const auto d = decide(st, at(111.0, 1.0), DecisionParams{});
        for (const auto& t : d.intents) {
            EXPECT_EQ(t.action, Action::Open);
            ++opens;
        }
        st = d.state;
        EXPECT_LE(st.reversion_short, 3);
    }
    EXPECT_EQ(opens, 3);
    EXPECT_EQ(st.reversion_short, 3);
}

TEST(Decide, ReversionShortExitsBackInsideChannel) {
    PositionState st;
    st.reversion_short = 2;
    const auto d = decide(st, at(109.0, 1.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Short, Mode::Reversion, 2));
    EXPECT_EQ(d.state.reversion_short, 0);
}

TEST(Decide, BetweenFactorDelaysExit) {
    PositionState st;
    st.reversion_short = 1;
    DecisionParams p;
    p.between_factor = 0.01;  // exit only below 110 - 1.0999
    const auto hold = decide(st, at(109.5, 1.0), p);
    EXPECT_TRUE(hold.intents.empty());
    const auto out = decide(st, at(108.5, 1.0), p);
    ASSERT_EQ(out.intents.size(), 1u);
    EXPECT_EQ(out.intents[0].action, Action::Close);
}

TEST(Decide, ReversionLongExitsBackInsideChannel) {
    PositionState st;
    st.reversion_long = 2;
    const auto d = decide(st, at(91.0, 0.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Long, Mode::Reversion, 2));
    EXPECT_EQ(d.state.reversion_long, 0);
}

TEST(Decide, BetweenFactorDelaysLongExit) {
    PositionState st;
    st.reversion_long = 1;
    DecisionParams p;
    p.between_factor = 0.01;  // exit only above 90 + ~0.9
    const auto hold = decide(st, at(90.5, 0.0), p);
    EXPECT_TRUE(hold.intents.empty());
    EXPECT_EQ(hold.state.reversion_long, 1);
    const auto out = decide(st, at(91.5, 0.0), p);
    ASSERT_EQ(out.intents.size(), 1u);
    EXPECT_EQ(out.intents[0], close_intent(Side::Long, Mode::Reversion, 1));
}

TEST(Decide, MissingTqClosesReversionAndBlocksEntries) {
    PositionState st;
    st.reversion_short = 1;
    const auto d = decide(st, at(111.0, std::nullopt), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Short, Mode::Reversion, 1));
    EXPECT_TRUE(d.state.flat());

    EXPECT_TRUE(decide(PositionState{}, at(80.0, std::nullopt), DecisionParams{}).intents.empty());
}

TEST(Decide, MissingTqHoldsBreakout) {
    PositionState st;
    st.breakout_long = 2;
    const auto d = decide(st, at(100.0, std::nullopt), DecisionParams{});
    EXPECT_TRUE(d.intents.empty());
    EXPECT_EQ(d.state.breakout_long, 2);
}

TEST(Decide, BreakoutLongNeedsTqBackInside) {
    PositionState st;
    st.breakout_long = 2;
    EXPECT_TRUE(decide(st, at(105.0, 3.0), DecisionParams{}).intents.empty());

    const auto d = decide(st, at(105.0, 1.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Long, Mode::Breakout, 2));
    EXPECT_EQ(d.state.breakout_long, 0);
}

TEST(Decide, BreakoutShortExitSymmetric) {
    PositionState st;
    st.breakout_short = 1;
    EXPECT_TRUE(decide(st, at(95.0, -5.0), DecisionParams{}).intents.empty());
    const auto d = decide(st, at(95.0, 0.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Short, Mode::Breakout, 1));
}

TEST(Decide, ExtremeTqSwitchesReversionLongIntoBreakoutShort) {
    PositionState st;
    st.reversion_long = 1;
    const auto d = decide(st, at(85.0, -5.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 2u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Long, Mode::Reversion, 1));
    EXPECT_EQ(d.intents[1], open_intent(Side::Short, Mode::Breakout, -0.5));
    EXPECT_EQ(d.state.reversion_long, 0);
    EXPECT_EQ(d.state.breakout_short, 1);
}

TEST(Decide, BreakoutLongFlattensShortsFirst) {
    PositionState st;
    st.reversion_short = 2;
    st.breakout_short = 1;
    const auto d = decide(st, at(111.0, 5.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 3u);
    // extreme TQ already takes the reversion short out in the exit pass
    EXPECT_EQ(d.intents[0], close_intent(Side::Short, Mode::Reversion, 2));
    EXPECT_EQ(d.intents[1], close_intent(Side::Short, Mode::Breakout, 1));
    EXPECT_EQ(d.intents[2], open_intent(Side::Long, Mode::Breakout, 0.5));

    PositionState want;
    want.breakout_long = 1;
    EXPECT_EQ(d.state, want);
}

TEST(Decide, BreakoutLongClosesWholeShortPyramid) {
    PositionState st;
    st.breakout_short = 3;
    const auto d = decide(st, at(111.0, 5.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 2u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Short, Mode::Breakout, 3));
    EXPECT_EQ(d.intents[1], open_intent(Side::Long, Mode::Breakout, 0.5));
}

TEST(Decide, NoReentryOnTheBarOfAnExit) {
    PositionState st;
    st.reversion_short = 1;
    // TQ below the low threshold is extreme: out, and not straight back in
    const auto d = decide(st, at(111.0, -5.0), DecisionParams{});
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0], close_intent(Side::Short, Mode::Reversion, 1));
    EXPECT_TRUE(d.state.flat());

    const auto next = decide(d.state, at(111.0, -3.0), DecisionParams{});
    ASSERT_EQ(next.intents.size(), 1u);
    EXPECT_EQ(next.intents[0], open_intent(Side::Short, Mode::Reversion, -0.5));
}

TEST(Decide, ReversionHeldWhileBreakoutOpen) {
    PositionState st;
    st.breakout_long = 1;
    const auto d = decide(st, at(111.0, 1.0), DecisionParams{});
    EXPECT_TRUE(d.intents.empty());
    EXPECT_EQ(d.state, st);
}

TEST(Decide, ThresholdItselfOpensNothing) {
    const auto d = decide(PositionState{}, at(111.0, 2.5), DecisionParams{});
    EXPECT_TRUE(d.intents.empty());
}

TEST(Decide, DisabledSetupNeverOpensButStillExits) {
    DecisionParams p;
    p.enable_breakout_long = false;
    EXPECT_TRUE(decide(PositionState{}, at(111.0, 5.0), p).intents.empty());

    PositionState st;
    st.breakout_long = 1;
    const auto d = decide(st, at(100.0, 0.0), p);
    ASSERT_EQ(d.intents.size(), 1u);
    EXPECT_EQ(d.intents[0].action, Action::Close);
}

TEST(Decide, FourthQualifyingBarOnlyExitsPossible) {
    PositionState st;
    st.reversion_short = 3;
    const auto d = decide(st, at(112.0, 1.0), DecisionParams{});
    for (const auto& t : d.intents) EXPECT_NE(t.action, Action::Open);
    EXPECT_EQ(d.state.reversion_short, 3);
}

TEST(Decide, RandomWalkKeepsInvariants) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> px(80.0, 120.0);
    std::uniform_real_distribution<double> q(-8.0, 8.0);
    std::bernoulli_distribution missing(0.1);

    DecisionParams p;
    p.max_orders = 2;
    PositionState st;
    for (int i = 0; i < 5000; ++i) {
        const std::optional<double> tq = missing(rng) ? std::nullopt : std::optional<double>(q(rng));
        const auto d = decide(st, at(px(rng), tq), p);

        for (const auto& t : d.intents) {
            if (t.action == Action::Close) {
                EXPECT_GT(st.count(t.mode, t.side), 0);
                EXPECT_EQ(d.state.count(t.mode, t.side), 0);
            }
        }
        st = d.state;
        for (int n : {st.reversion_long, st.reversion_short, st.breakout_long, st.breakout_short}) {
            EXPECT_GE(n, 0);
            EXPECT_LE(n, p.max_orders);
        }
        EXPECT_FALSE(st.any_breakout() && st.any_reversion()) << "bar " << i;
        EXPECT_FALSE(st.breakout_long > 0 && st.breakout_short > 0) << "bar " << i;
    }
}
