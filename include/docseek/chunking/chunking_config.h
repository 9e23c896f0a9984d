#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * Configuration for the ingestion pipeline (normalize, split, chunk,
 * annotate, stitch). All sizes are in TokenCounter units unless noted.
 */
struct ChunkingConfig {
    size_t chunk_size = 500;     // Budget per chunk before overlap stitching
    size_t chunk_overlap = 50;   // Overlap budget; each neighbour contributes half
    size_t toc_min_chars = 50;   // Sections whose stripped body is shorter are dropped
    size_t overview_min_identifiers = 4;
    size_t max_field_names = 8;  // Bit-field names listed in a register key prefix

    // Running header/footer detection
    size_t header_max_line_length = 80;
    size_t header_min_repeats = 2;
    std::vector<std::string> extra_header_patterns; // ECMAScript regexes, whole line

    size_t halfOverlap() const { return chunk_overlap / 2; }
};

} // namespace docseek::chunking
