#include <gtest/gtest.h>
#include <docseek/chunking/text_normalizer.h>

using namespace docseek::chunking;

TEST(TextNormalizerTest, LineSignatureCollapsesDigitRuns) {
    EXPECT_EQ(lineSignature("  Page 12 of 40 "), "Page # of #");
    EXPECT_EQ(lineSignature("612/709 RM0041 Rev 6"), "#/# RM# Rev #");
    EXPECT_EQ(lineSignature("no digits"), "no digits");
}

TEST(TextNormalizerTest, RemovesRunningHeadersAcrossPages) {
    TextNormalizer normalizer;
    auto pages = normalizer.normalizePages({"612/709 RM0041 Rev 6\nGPIO overview text",
                                            "613/709 RM0041 Rev 6\nAFIO overview text"});
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0], "GPIO overview text");
    EXPECT_EQ(pages[1], "AFIO overview text");
}

TEST(TextNormalizerTest, SingleOccurrenceIsKept) {
    TextNormalizer normalizer;
    auto out = normalizer.normalize("12\nThe port has 16 pins.");
    EXPECT_EQ(out, "12\nThe port has 16 pins.");
}

TEST(TextNormalizerTest, RepeatedHeaderInOneTextIsRemoved) {
    TextNormalizer normalizer;
    auto out = normalizer.normalize(
        "RM0041 Reference manual\nfirst part\nRM0041 Reference manual\nsecond part");
    EXPECT_EQ(out, "first part\nsecond part");
}

TEST(TextNormalizerTest, MinRepeatsIsConfigurable) {
    ChunkingConfig config;
    config.header_min_repeats = 3;
    TextNormalizer normalizer(config);
    auto out = normalizer.normalize("Page 1\nalpha\nPage 2\nbeta");
    EXPECT_EQ(out, "Page 1\nalpha\nPage 2\nbeta");
}

TEST(TextNormalizerTest, LongLinesAreNeverHeaders) {
    ChunkingConfig config;
    config.header_max_line_length = 10;
    TextNormalizer normalizer(config);
    auto out = normalizer.normalize("RM0041 Reference manual\nx\nRM0041 Reference manual\ny");
    EXPECT_EQ(out, "RM0041 Reference manual\nx\nRM0041 Reference manual\ny");
}

TEST(TextNormalizerTest, ExtraPatternsAndInvalidPatterns) {
    ChunkingConfig config;
    config.extra_header_patterns = {"^CONFIDENTIAL$", "([unclosed"};
    TextNormalizer normalizer(config);
    auto out = normalizer.normalize("CONFIDENTIAL\nbody one\nCONFIDENTIAL\nbody two");
    EXPECT_EQ(out, "body one\nbody two");
}

TEST(TextNormalizerTest, CollapsesBlankRunsAndTrailingSpace) {
    TextNormalizer normalizer;
    EXPECT_EQ(normalizer.normalize("a   \n\n\n\n\nb\t\n"), "a\n\nb");
    EXPECT_EQ(normalizer.normalize("\n\n  \n"), "");
}

TEST(TextNormalizerTest, RepeatedPinListLinesAreContent) {
    TextNormalizer normalizer;
    auto out = normalizer.normalize(
        "Pin configuration:\nPA0 input floating\nPA1 input floating\nPB6 alternate push-pull\n");
    EXPECT_EQ(out,
              "Pin configuration:\nPA0 input floating\nPA1 input floating\nPB6 alternate push-pull");
}
