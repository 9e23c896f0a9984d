#pragma once

#include <docseek/chunking/chunk.h>
#include <docseek/chunking/chunk_annotator.h>
#include <docseek/chunking/chunking_config.h>
#include <docseek/chunking/overlap_stitcher.h>
#include <docseek/chunking/recursive_chunker.h>
#include <docseek/chunking/section_splitter.h>
#include <docseek/chunking/text_normalizer.h>
#include <docseek/chunking/toc_filter.h>
#include <docseek/core/types.h>
#include <docseek/extraction/raw_document.h>

#include <chrono>
#include <vector>

namespace docseek::chunking {

/**
 * Statistics for chunking operations
 */
struct ChunkingStats {
    size_t sections_found = 0;
    size_t sections_dropped = 0; // table-of-contents noise
    size_t chunks = 0;
    size_t register_definitions = 0;
    size_t overviews = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Ingestion pipeline for one document
 *
 * normalize -> split sections -> drop TOC noise -> chunk each section ->
 * classify/annotate -> stitch overlap across the whole document.
 *
 * Pure and synchronous: the same document and config always produce the
 * same chunks, so separate documents can be chunked on separate threads.
 */
class DocumentChunker {
public:
    explicit DocumentChunker(const ChunkingConfig& config = {});

    std::vector<Chunk> chunkDocument(const extraction::RawDocument& document,
                                     const MetadataMap& user_metadata = {},
                                     ChunkingStats* stats = nullptr) const;

    const ChunkingConfig& config() const { return config_; }

private:
    ChunkingConfig config_;
    TextNormalizer normalizer_;
    SectionSplitter splitter_;
    TocFilter tocFilter_;
    RecursiveChunker chunker_;
    ChunkAnnotator annotator_;
    OverlapStitcher stitcher_;
};

} // namespace docseek::chunking
