#pragma once

#include <docseek/core/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Structural classification of a chunk
 */
enum class ChunkKind { Regular, RegisterDefinition, Overview };

constexpr const char* chunkKindToString(ChunkKind kind) {
    switch (kind) {
        case ChunkKind::Regular:
            return "regular";
        case ChunkKind::RegisterDefinition:
            return "register_definition";
        case ChunkKind::Overview:
            return "overview";
    }
    return "regular";
}

/**
 * @brief Heading-scoped or page-scoped slice of a document
 *
 * Produced by the section splitter and never modified afterwards.
 */
struct Section {
    std::string heading;      // Heading text without markers, empty for preamble/pages
    int level = 0;            // Number of heading markers, 0 when there is no heading
    std::string body;         // Body text (lines joined with '\n')
    std::string document_id;  // Owning document
    std::optional<int> page;  // 1-based page for page-scoped sources
    std::string section_path; // Ancestor headings joined by " > "

    // Heading rendered back as a markdown line ("## Title"), empty without heading
    std::string headingLine() const {
        if (heading.empty()) {
            return {};
        }
        return std::string(static_cast<size_t>(level > 0 ? level : 1), '#') + " " + heading;
    }
};

/**
 * @brief Unit of retrieval
 *
 * Created by the recursive chunker, annotated by the classifier and
 * stitched with neighbour context before it is embedded and stored.
 */
struct Chunk {
    std::string body;              // Chunked text (heading line included), pre-annotation
    size_t unit_length = 0;        // TokenCounter::count(body)
    size_t section_ordinal = 0;    // Position within the owning section
    size_t document_ordinal = 0;   // Position within the document
    ChunkKind kind = ChunkKind::Regular;
    std::optional<std::string> title;      // "REGISTER DEFINITION: ..." line
    std::optional<std::string> key_prefix; // "[KEY: ...]" line
    std::string leading_overlap;   // Delimited predecessor context, empty for none
    std::string trailing_overlap;  // Delimited successor context, empty for none

    // Source metadata copied from the owning section
    std::string document_id;
    std::string source;
    std::optional<int> page;
    std::string section;

    MetadataMap user_metadata;

    /**
     * @brief Title and key-term prefix followed by the body
     */
    std::string annotatedText() const;

    /**
     * @brief Final text as stored: overlap blocks around the annotated text
     */
    std::string text() const;

    /**
     * @brief Stable identifier "<document_id>#<document_ordinal>"
     */
    std::string chunkId() const;

    /**
     * @brief Metadata persisted with the chunk (source metadata + user metadata)
     */
    MetadataMap metadata() const;
};

} // namespace docseek::chunking
