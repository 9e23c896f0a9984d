#pragma once

#include <docseek/chunking/chunk.h>
#include <docseek/chunking/chunking_config.h>

#include <cstddef>
#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * Boundary levels, most preferred first
 */
enum class SplitLevel { Paragraph = 0, Line, Sentence, Word };

/**
 * @brief Section-aware recursive text splitter
 *
 * Splits at the coarsest boundary whose pieces fit the unit budget, greedily
 * packing pieces into chunks and recursing one level down for any piece that
 * is too large on its own. A piece still over budget after the word level is
 * emitted whole rather than truncated.
 */
class RecursiveChunker {
public:
    explicit RecursiveChunker(const ChunkingConfig& config = {});

    /**
     * @brief Split arbitrary text into pieces of at most `budget` units
     */
    std::vector<std::string> split(const std::string& text, size_t budget) const;

    /**
     * @brief Chunk one section
     *
     * A section that fits entirely (heading line included) becomes a single
     * chunk. Otherwise the body is split with the heading cost reserved and
     * the heading line is prepended to every chunk.
     */
    std::vector<Chunk> chunkSection(const Section& section) const;

private:
    std::vector<std::string> splitAt(const std::string& text, SplitLevel level,
                                     size_t budget) const;

    ChunkingConfig config_;
};

/**
 * @brief Pieces of text at one boundary level plus the joiner that restores them
 */
std::vector<std::string> splitOnBoundary(const std::string& text, SplitLevel level);
const char* boundaryJoiner(SplitLevel level);

} // namespace docseek::chunking
