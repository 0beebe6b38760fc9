#include <gtest/gtest.h>
#include "extraction/pair_extraction.hpp"

using namespace keydr;

namespace {

std::vector<KeyTime> typed(const std::u32string& text, double time_ms = 150.0) {
    std::vector<KeyTime> keys;
    for (Symbol s : text) keys.push_back(KeyTime{s, time_ms, true});
    return keys;
}

} // namespace

// ─── Window Tests ──────────────────────────────────────────────

TEST(ExtractionTest, BigramsAndTrigramsOfOneWord) {
    std::vector<KeyTime> keys = {
        {U't', 100.0, true}, {U'h', 150.0, true}, {U'e', 200.0, true},
    };
    PairEvents events = extractPairEvents(keys, 800.0);

    ASSERT_EQ(events.bigrams.size(), 2u);
    EXPECT_EQ(events.bigrams[0].key, PairKey(U't', U'h'));
    EXPECT_DOUBLE_EQ(events.bigrams[0].time_ms, 150.0);
    EXPECT_EQ(events.bigrams[1].key, PairKey(U'h', U'e'));
    EXPECT_DOUBLE_EQ(events.bigrams[1].time_ms, 200.0);

    ASSERT_EQ(events.trigrams.size(), 1u);
    EXPECT_EQ(events.trigrams[0].key, PairKey(U't', U'h', U'e'));
    EXPECT_DOUBLE_EQ(events.trigrams[0].time_ms, 350.0);
}

TEST(ExtractionTest, WordBoundariesSplitWindows) {
    PairEvents events = extractPairEvents(typed(U"ab cd"), 800.0);
    ASSERT_EQ(events.bigrams.size(), 2u);
    EXPECT_EQ(events.bigrams[0].key, PairKey(U'a', U'b'));
    EXPECT_EQ(events.bigrams[1].key, PairKey(U'c', U'd'));
    EXPECT_TRUE(events.trigrams.empty());

    std::u32string with_sentinels = U"ab";
    with_sentinels += symbols::kTab;
    with_sentinels += U"c";
    with_sentinels += symbols::kEnter;
    with_sentinels += U"d";
    events = extractPairEvents(typed(with_sentinels), 800.0);
    ASSERT_EQ(events.bigrams.size(), 1u);
    EXPECT_EQ(events.bigrams[0].key, PairKey(U'a', U'b'));
}

TEST(ExtractionTest, SingleSymbolWordsProduceNothing) {
    PairEvents events = extractPairEvents(typed(U"a b c"), 800.0);
    EXPECT_TRUE(events.bigrams.empty());
    EXPECT_TRUE(events.trigrams.empty());
    EXPECT_TRUE(extractPairEvents({}, 800.0).bigrams.empty());
}

TEST(ExtractionTest, CorrectionMarkersAreDropped) {
    std::vector<KeyTime> keys = {
        {U'a', 100.0, true},
        {symbols::kBackspace, 90.0, true},
        {U'b', 130.0, true},
    };
    PairEvents events = extractPairEvents(keys, 800.0);
    ASSERT_EQ(events.bigrams.size(), 1u);
    EXPECT_EQ(events.bigrams[0].key, PairKey(U'a', U'b'));
    EXPECT_DOUBLE_EQ(events.bigrams[0].time_ms, 130.0);
}

TEST(ExtractionTest, AnyIncorrectSymbolMarksWindow) {
    std::vector<KeyTime> keys = {
        {U'a', 100.0, false}, {U'b', 100.0, true}, {U'c', 100.0, true},
    };
    PairEvents events = extractPairEvents(keys, 800.0);
    EXPECT_FALSE(events.bigrams[0].correct);
    EXPECT_TRUE(events.bigrams[1].correct);
    EXPECT_FALSE(events.trigrams[0].correct);
}

// ─── Hesitation Tests ──────────────────────────────────────────

TEST(ExtractionTest, HesitationFlag) {
    std::vector<KeyTime> keys = {
        {U'a', 2000.0, true}, {U'b', 100.0, true}, {U'c', 900.0, true},
    };
    PairEvents events = extractPairEvents(keys, 800.0);
    // The first symbol's time does not belong to the transition
    EXPECT_FALSE(events.bigrams[0].hesitation);
    EXPECT_TRUE(events.bigrams[1].hesitation);
    EXPECT_TRUE(events.trigrams[0].hesitation);
}

TEST(ExtractionTest, HesitationThresholdAdaptsToPace) {
    EXPECT_DOUBLE_EQ(hesitationThreshold(0.0), 800.0);
    EXPECT_DOUBLE_EQ(hesitationThreshold(200.0), 800.0);
    EXPECT_DOUBLE_EQ(hesitationThreshold(400.0), 1000.0);
    EXPECT_DOUBLE_EQ(hesitationThreshold(400.0, 500.0, 2.0), 800.0);
}

TEST(ExtractionTest, Median) {
    EXPECT_DOUBLE_EQ(computeMedian({}), 0.0);
    EXPECT_DOUBLE_EQ(computeMedian({3.0, 1.0, 2.0}), 2.0);
    EXPECT_DOUBLE_EQ(computeMedian({4.0, 1.0, 3.0, 2.0}), 2.5);
}
