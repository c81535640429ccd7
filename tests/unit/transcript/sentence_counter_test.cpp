#include <gtest/gtest.h>
#include <citestream/transcript/sentence_counter.h>

using namespace citestream::transcript;

class SentenceCounterTest : public ::testing::Test {
protected:
    SentenceCounter counter_;
};

TEST_F(SentenceCounterTest, CountsTerminators) {
    EXPECT_EQ(counter_.countSentences("One. Two! Three?"), 3u);
    EXPECT_EQ(counter_.countSentences("no terminator here"), 0u);
    EXPECT_EQ(counter_.countSentences(""), 0u);
}

TEST_F(SentenceCounterTest, DoubleTerminatorIsOneSentence) {
    EXPECT_EQ(counter_.countSentences("Really?! Yes."), 2u);
}

TEST_F(SentenceCounterTest, EllipsisIsNotASentenceEnd) {
    EXPECT_EQ(counter_.countSentences("Well... I think so."), 1u);
}

TEST_F(SentenceCounterTest, AbbreviationsAreSkipped) {
    EXPECT_EQ(counter_.countSentences("Dr. Smith arrived. He sat down."), 2u);
    EXPECT_EQ(counter_.countSentences("Apples, pears, etc. are fruit."), 1u);
    EXPECT_EQ(counter_.countSentences("(Prof. Lee) spoke."), 1u);
}

TEST_F(SentenceCounterTest, GluedPeriodsAreSkipped) {
    EXPECT_EQ(counter_.countSentences("Pi is 3.14 roughly."), 1u);
    EXPECT_EQ(counter_.countSentences("Version v1.2 shipped."), 1u);
}

TEST_F(SentenceCounterTest, CustomAbbreviations) {
    SentenceCounter custom({"approx."});
    EXPECT_EQ(custom.countSentences("It is approx. ten. Done."), 2u);
    EXPECT_EQ(custom.countSentences("Dr. Who."), 2u);
}

TEST(SentenceCounterWordsTest, CountsWhitespaceSeparatedWords) {
    EXPECT_EQ(SentenceCounter::countWords(""), 0u);
    EXPECT_EQ(SentenceCounter::countWords("   "), 0u);
    EXPECT_EQ(SentenceCounter::countWords("one"), 1u);
    EXPECT_EQ(SentenceCounter::countWords("  one\ttwo\nthree  "), 3u);
}
