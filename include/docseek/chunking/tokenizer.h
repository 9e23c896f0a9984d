#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Byte range of one unit inside the measured text
 */
struct TokenSpan {
    size_t begin = 0;
    size_t end = 0;

    size_t size() const { return end - begin; }
};

/**
 * @brief Length measurer used for every chunk budget
 *
 * Approximates the subword units of a byte-level BPE tokenizer without a
 * vocabulary:
 *   - a letter run (with its single leading space folded in) costs one unit
 *     per started group of kCharsPerWordPiece letters
 *   - a digit run costs one unit per three digits
 *   - every punctuation or symbol byte is one unit
 *   - a run of newlines is one unit, any other whitespace run is one unit
 *   - every multi-byte UTF-8 sequence is one unit
 *
 * The segmentation is deterministic, so head()/tail() slices are stable
 * across runs and re-ingestion produces identical text.
 */
class TokenCounter {
public:
    static constexpr size_t kCharsPerWordPiece = 6;
    static constexpr size_t kDigitsPerUnit = 3;

    /**
     * @brief Split text into unit spans covering the whole input
     */
    static std::vector<TokenSpan> segment(std::string_view text);

    /**
     * @brief Number of units in text
     */
    static size_t count(std::string_view text);

    /**
     * @brief Text covered by the first n units
     */
    static std::string head(std::string_view text, size_t n);

    /**
     * @brief Text covered by the last n units
     */
    static std::string tail(std::string_view text, size_t n);
};

} // namespace docseek::chunking
