#include <gtest/gtest.h>
#include "stats/pair_stats.hpp"

#include <cmath>

using namespace keydr;

namespace {

SymbolStat symbolWith(double error_ema, size_t samples = 0, double time_ms = 1000.0) {
    SymbolStat stat;
    stat.error_rate_ema = error_ema;
    stat.sample_count = samples;
    stat.total_count = samples;
    stat.filtered_time_ms = time_ms;
    return stat;
}

PairStat pairWith(double error_ema, size_t samples, double time_ms = 1000.0) {
    PairStat stat;
    stat.error_rate_ema = error_ema;
    stat.sample_count = samples;
    stat.filtered_time_ms = time_ms;
    return stat;
}

// Replace the error EMA of a stored pair without touching its streaks.
void setPairError(PairStatsStore& store, const PairKey& key, double error_ema) {
    PairStat stat = *store.find(key);
    stat.error_rate_ema = error_ema;
    store.insert(key, stat);
}

} // namespace

// ─── Pair Key Tests ────────────────────────────────────────────

TEST(PairStatsTest, PairKeyBasics) {
    PairKey th(U't', U'h');
    PairKey the(U't', U'h', U'e');
    EXPECT_EQ(th.order, 2);
    EXPECT_EQ(the.order, 3);
    EXPECT_EQ(the.head(), th);
    EXPECT_EQ(the.tail(), PairKey(U'h', U'e'));
    EXPECT_EQ(the.toString(), "the");
    EXPECT_NE(th, the);
    EXPECT_TRUE(th < the);
}

// ─── Update Tests ──────────────────────────────────────────────

TEST(PairStatsTest, UpdateSeedsThenSmooths) {
    PairStatsStore store(2);
    PairKey key(U'a', U'b');
    store.update(key, 120.0, true, false, 0);
    EXPECT_DOUBLE_EQ(store.find(key)->filtered_time_ms, 120.0);
    EXPECT_DOUBLE_EQ(store.smoothedErrorRate(key), 0.0);

    store.update(key, 220.0, false, true, 1);
    const PairStat* stat = store.find(key);
    EXPECT_DOUBLE_EQ(stat->filtered_time_ms, 130.0);
    EXPECT_NEAR(stat->error_rate_ema, 0.1, 1e-12);
    EXPECT_EQ(stat->error_count, 1u);
    EXPECT_EQ(stat->hesitation_count, 1u);
    EXPECT_EQ(stat->last_seen_session, 1u);
}

TEST(PairStatsTest, UnobservedPairIsNeutral) {
    PairStatsStore store(2);
    EXPECT_DOUBLE_EQ(store.smoothedErrorRate(PairKey(U'x', U'y')), kNeutralErrorRate);
    EXPECT_FALSE(store.isErrorConfirmed(PairKey(U'x', U'y')));
}

// ─── Error Anomaly Ratio Tests ─────────────────────────────────

TEST(PairStatsTest, ErrorRatioFlagsHardTransition) {
    SymbolStatsStore symbols;
    symbols.insert(U'a', symbolWith(0.04));
    symbols.insert(U'b', symbolWith(0.05));

    PairStatsStore store(2);
    PairKey key(U'a', U'b');
    store.insert(key, pairWith(0.22, 30));

    EXPECT_NEAR(store.expectedErrorRate(key, symbols), 0.088, 1e-12);
    EXPECT_NEAR(store.errorAnomalyRatio(key, symbols), 2.5, 1e-9);
}

TEST(PairStatsTest, ErrorRatioExplainedBySymbols) {
    SymbolStatsStore symbols;
    symbols.insert(U'a', symbolWith(0.25));
    symbols.insert(U'b', symbolWith(0.03));

    PairStatsStore store(2);
    PairKey key(U'a', U'b');
    store.insert(key, pairWith(0.28, 30));

    double ratio = store.errorAnomalyRatio(key, symbols);
    EXPECT_NEAR(ratio, 1.0275, 1e-3);
    EXPECT_LT(ratio, store.thresholds().error_ratio);
}

TEST(PairStatsTest, ExpectedRateIsFloored) {
    SymbolStatsStore symbols;
    symbols.insert(U'a', symbolWith(0.0));
    symbols.insert(U'b', symbolWith(0.0));

    PairStatsStore store(2);
    PairKey key(U'a', U'b');
    store.insert(key, pairWith(0.02, 30));
    EXPECT_DOUBLE_EQ(store.errorAnomalyRatio(key, symbols), 2.0);
}

TEST(PairStatsTest, TrigramExplainedByBigram) {
    SymbolStatsStore symbols;
    for (Symbol s : {U't', U'h', U'e'}) symbols.insert(s, symbolWith(0.02));

    PairStatsStore bigrams(2);
    bigrams.insert(PairKey(U't', U'h'), pairWith(0.3, 50));
    bigrams.insert(PairKey(U'h', U'e'), pairWith(0.01, 50));

    PairStatsStore trigrams(3);
    PairKey the(U't', U'h', U'e');
    trigrams.insert(the, pairWith(0.3, 50));

    // Without the bigram level the trigram looks anomalous
    EXPECT_GT(trigrams.errorAnomalyRatio(the, symbols), 5.0);
    EXPECT_NEAR(trigrams.errorAnomalyRatio(the, symbols, &bigrams), 1.0, 1e-12);
}

// ─── Speed Anomaly Tests ───────────────────────────────────────

TEST(PairStatsTest, SpeedUnknownUntilBaselineIsSampled) {
    SymbolStatsStore symbols;
    symbols.insert(U'a', symbolWith(0.0, 50, 100.0));
    symbols.insert(U'b', symbolWith(0.0, 9, 100.0));

    PairStatsStore store(2);
    PairKey key(U'a', U'b');
    store.insert(key, pairWith(0.0, 30, 180.0));
    EXPECT_FALSE(store.speedAnomalyPct(key, symbols).has_value());

    symbols.insert(U'b', symbolWith(0.0, 10, 100.0));
    auto pct = store.speedAnomalyPct(key, symbols);
    ASSERT_TRUE(pct.has_value());
    EXPECT_NEAR(*pct, 80.0, 1e-9);
}

TEST(PairStatsTest, SpeedUnknownForMissingSymbol) {
    SymbolStatsStore symbols;
    PairStatsStore store(2);
    PairKey key(U'a', U'b');
    store.insert(key, pairWith(0.0, 30, 180.0));
    EXPECT_FALSE(store.speedAnomalyPct(key, symbols).has_value());
}

// ─── Streak Tests ──────────────────────────────────────────────

class PairStreakTest : public ::testing::Test {
protected:
    SymbolStatsStore symbols;
    PairStatsStore store{2};
    PairKey key{U'a', U'b'};

    void SetUp() override {
        symbols.insert(U'a', symbolWith(0.04));
        symbols.insert(U'b', symbolWith(0.05));
        store.insert(key, pairWith(0.22, 25));
    }
};

TEST_F(PairStreakTest, ConfirmsAfterExactlyRequiredChecks) {
    store.updateAnomalyStreaks(key, symbols);
    store.updateAnomalyStreaks(key, symbols);
    EXPECT_FALSE(store.isErrorConfirmed(key));
    store.updateAnomalyStreaks(key, symbols);
    EXPECT_TRUE(store.isErrorConfirmed(key));
    EXPECT_EQ(store.find(key)->error_anomaly_streak, 3);
}

TEST_F(PairStreakTest, SingleFailureResetsStreak) {
    for (int i = 0; i < 3; i++) store.updateAnomalyStreaks(key, symbols);
    ASSERT_TRUE(store.isErrorConfirmed(key));

    setPairError(store, key, 0.05);
    store.updateAnomalyStreaks(key, symbols);
    EXPECT_EQ(store.find(key)->error_anomaly_streak, 0);
    EXPECT_FALSE(store.isErrorConfirmed(key));

    setPairError(store, key, 0.22);
    store.updateAnomalyStreaks(key, symbols);
    store.updateAnomalyStreaks(key, symbols);
    EXPECT_FALSE(store.isErrorConfirmed(key));
}

TEST_F(PairStreakTest, UnknownSpeedHoldsStreak) {
    PairStat stat = *store.find(key);
    stat.speed_anomaly_streak = 2;
    store.insert(key, stat);

    store.updateAnomalyStreaks(key, symbols);
    EXPECT_EQ(store.find(key)->speed_anomaly_streak, 2);

    // Baseline known, pair as fast as the symbol: fails and resets
    symbols.insert(U'b', symbolWith(0.05, 10, 1000.0));
    store.updateAnomalyStreaks(key, symbols);
    EXPECT_EQ(store.find(key)->speed_anomaly_streak, 0);
}

TEST_F(PairStreakTest, SampleGateBlocksConfirmation) {
    store.insert(key, pairWith(0.22, 19));
    for (int i = 0; i < 5; i++) store.updateAnomalyStreaks(key, symbols);
    EXPECT_EQ(store.find(key)->error_anomaly_streak, 5);
    EXPECT_FALSE(store.isErrorConfirmed(key));
}

TEST_F(PairStreakTest, StreakSaturates) {
    PairStat stat = *store.find(key);
    stat.error_anomaly_streak = 255;
    store.insert(key, stat);
    store.updateAnomalyStreaks(key, symbols);
    EXPECT_EQ(store.find(key)->error_anomaly_streak, 255);
}

// ─── Confirmed Anomaly Tests ───────────────────────────────────

class ConfirmedAnomalyTest : public ::testing::Test {
protected:
    SymbolStatsStore symbols;
    PairStatsStore store{2};

    void SetUp() override {
        for (Symbol s : {U'a', U'b', U'c', U'd'}) {
            symbols.insert(s, symbolWith(0.0, 10, 100.0));
        }
    }

    void addConfirmed(const PairKey& key, double error_ema, double time_ms) {
        PairStat stat = pairWith(error_ema, 20, time_ms);
        stat.error_anomaly_streak = 3;
        stat.speed_anomaly_streak = 3;
        store.insert(key, stat);
    }
};

TEST_F(ConfirmedAnomalyTest, OneEntryPerPairErrorWinsTies) {
    // error ratio 2.0 → 100%, speed 200ms vs 100ms → 100%
    addConfirmed(PairKey(U'a', U'b'), 0.02, 200.0);
    auto anomalies = store.confirmedAnomalies(symbols);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].kind, AnomalyKind::Error);
    EXPECT_DOUBLE_EQ(anomalies[0].anomaly_pct, 100.0);
}

TEST_F(ConfirmedAnomalyTest, StrongerAxisIsReported) {
    addConfirmed(PairKey(U'a', U'b'), 0.02, 400.0);
    auto anomalies = store.confirmedAnomalies(symbols);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].kind, AnomalyKind::Speed);
    EXPECT_DOUBLE_EQ(anomalies[0].anomaly_pct, 300.0);
}

TEST_F(ConfirmedAnomalyTest, SortedWorstFirst) {
    addConfirmed(PairKey(U'a', U'b'), 0.02, 100.0);
    addConfirmed(PairKey(U'c', U'd'), 0.04, 100.0);
    auto anomalies = store.confirmedAnomalies(symbols);
    ASSERT_EQ(anomalies.size(), 2u);
    EXPECT_EQ(anomalies[0].key, PairKey(U'c', U'd'));

    auto worst = store.worstConfirmedAnomaly(symbols);
    ASSERT_TRUE(worst.has_value());
    EXPECT_EQ(worst->key, PairKey(U'c', U'd'));
}

TEST_F(ConfirmedAnomalyTest, ConfirmedButNoLongerQualifyingIsSkipped) {
    addConfirmed(PairKey(U'a', U'b'), 0.01, 100.0);
    EXPECT_TRUE(store.isErrorConfirmed(PairKey(U'a', U'b')));
    EXPECT_TRUE(store.confirmedAnomalies(symbols).empty());
}

TEST_F(ConfirmedAnomalyTest, AllowedSetFilters) {
    addConfirmed(PairKey(U'a', U'b'), 0.02, 100.0);
    addConfirmed(PairKey(U'c', U'd'), 0.04, 100.0);
    std::unordered_set<Symbol> allowed = {U'a', U'b', U'c'};
    auto anomalies = store.confirmedAnomalies(symbols, nullptr, &allowed);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].key, PairKey(U'a', U'b'));
}

// ─── Pruning Tests ─────────────────────────────────────────────

TEST(PairStatsTest, PruneDropsStalestEntry) {
    SymbolStatsStore symbols;
    PairStatsStore store(3);

    PairKey fresh(U'a', U'b', U'c');
    PairKey middle(U'b', U'c', U'd');
    PairKey stale(U'c', U'd', U'e');
    PairStat stat = pairWith(0.1, 10);
    stat.last_seen_session = 9;
    store.insert(fresh, stat);
    stat.last_seen_session = 5;
    store.insert(middle, stat);
    stat.last_seen_session = 1;
    store.insert(stale, stat);

    EXPECT_EQ(store.prune(5, 10, symbols), 0u);
    EXPECT_EQ(store.prune(2, 10, symbols), 1u);
    EXPECT_EQ(store.count(), 2u);
    EXPECT_EQ(store.find(stale), nullptr);
    EXPECT_NE(store.find(fresh), nullptr);
}

TEST(PairStatsTest, PruneKeepsStrongSignalOverRecency) {
    SymbolStatsStore symbols;
    for (Symbol s : {U'a', U'b', U'c', U'd', U'e'}) symbols.insert(s, symbolWith(0.0));
    PairStatsStore store(3);

    PairKey anomalous(U'a', U'b', U'c');
    PairKey recent(U'c', U'd', U'e');
    PairStat stat = pairWith(0.05, 10);
    stat.last_seen_session = 0;
    store.insert(anomalous, stat);
    stat.error_rate_ema = 0.0;
    stat.last_seen_session = 10;
    store.insert(recent, stat);

    store.prune(1, 10, symbols);
    EXPECT_NE(store.find(anomalous), nullptr);
    EXPECT_EQ(store.find(recent), nullptr);
}

// ─── Marginal Gain ─────────────────────────────────────────────

TEST(PairStatsTest, MarginalGainCountsWellSampledPairs) {
    SymbolStatsStore symbols;
    for (Symbol s : {U'a', U'b', U'c'}) symbols.insert(s, symbolWith(0.0));
    PairStatsStore store(2);
    EXPECT_DOUBLE_EQ(store.marginalGain(symbols), 0.0);

    store.insert(PairKey(U'a', U'b'), pairWith(0.05, 20));
    store.insert(PairKey(U'b', U'c'), pairWith(0.0, 20));
    store.insert(PairKey(U'c', U'a'), pairWith(0.5, 5));
    EXPECT_DOUBLE_EQ(store.marginalGain(symbols), 0.5);
}
