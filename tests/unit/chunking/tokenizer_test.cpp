#include <gtest/gtest.h>
#include <docseek/chunking/tokenizer.h>

#include <string>

using namespace docseek::chunking;

TEST(TokenCounterTest, EmptyTextHasNoUnits) {
    EXPECT_EQ(TokenCounter::count(""), 0u);
    EXPECT_TRUE(TokenCounter::segment("").empty());
}

TEST(TokenCounterTest, ShortWordsCostOneUnit) {
    EXPECT_EQ(TokenCounter::count("hello"), 1u);
    // Leading space is folded into the following word
    EXPECT_EQ(TokenCounter::count("hello world"), 2u);
    EXPECT_EQ(TokenCounter::count("one two three four"), 4u);
}

TEST(TokenCounterTest, LongWordsSplitIntoPieces) {
    // 20 letters -> ceil(20 / 6)
    EXPECT_EQ(TokenCounter::count("internationalization"), 4u);
    EXPECT_EQ(TokenCounter::count("abcdef"), 1u);
    EXPECT_EQ(TokenCounter::count("abcdefg"), 2u);
}

TEST(TokenCounterTest, DigitsPunctuationAndWhitespace) {
    EXPECT_EQ(TokenCounter::count("12345"), 2u);
    EXPECT_EQ(TokenCounter::count("a.b"), 3u);
    EXPECT_EQ(TokenCounter::count("\n\n\n"), 1u);
    // "a", " ", " b"
    EXPECT_EQ(TokenCounter::count("a  b"), 3u);
    EXPECT_EQ(TokenCounter::count("0x1C"), 4u);
}

TEST(TokenCounterTest, MultiByteSequenceIsOneUnit) {
    EXPECT_EQ(TokenCounter::count("\xC3\xA9"), 1u);
    EXPECT_EQ(TokenCounter::count("\xE2\x80\xA6"), 1u);
}

TEST(TokenCounterTest, SpansCoverWholeInput) {
    const std::string text = "Address offset: 0x1C\n\n| Bit | Field |\nReset value 0x0000_0000.";
    auto spans = TokenCounter::segment(text);
    ASSERT_FALSE(spans.empty());
    EXPECT_EQ(spans.front().begin, 0u);
    for (size_t i = 1; i < spans.size(); ++i) {
        EXPECT_EQ(spans[i].begin, spans[i - 1].end);
        EXPECT_GT(spans[i].size(), 0u);
    }
    EXPECT_EQ(spans.back().end, text.size());
}

TEST(TokenCounterTest, HeadAndTail) {
    const std::string text = "alpha beta gamma";
    EXPECT_EQ(TokenCounter::head(text, 2), "alpha beta");
    EXPECT_EQ(TokenCounter::tail(text, 1), " gamma");
    EXPECT_EQ(TokenCounter::tail(text, 2), " beta gamma");
    EXPECT_EQ(TokenCounter::head(text, 10), text);
    EXPECT_EQ(TokenCounter::tail(text, 10), text);
    EXPECT_TRUE(TokenCounter::head(text, 0).empty());
    EXPECT_TRUE(TokenCounter::tail("", 3).empty());
}

TEST(TokenCounterTest, HeadUnitsNeverExceedRequest) {
    const std::string text = "The GPIOx_CRL register configures pins 0 to 7 of the port.";
    for (size_t n = 1; n < 12; ++n) {
        EXPECT_LE(TokenCounter::count(TokenCounter::head(text, n)), n) << "n=" << n;
    }
}
