#include <docseek/chunking/document_chunker.h>

#include <spdlog/spdlog.h>

namespace docseek::chunking {

DocumentChunker::DocumentChunker(const ChunkingConfig& config)
    : config_(config), normalizer_(config), tocFilter_(config.toc_min_chars), chunker_(config),
      annotator_(config), stitcher_(config.halfOverlap()) {}

std::vector<Chunk> DocumentChunker::chunkDocument(const extraction::RawDocument& document,
                                                  const MetadataMap& user_metadata,
                                                  ChunkingStats* stats) const {
    auto start = std::chrono::steady_clock::now();

    std::vector<Section> sections;
    if (document.layout == extraction::DocumentLayout::PageScoped) {
        sections =
            splitter_.splitByPages(normalizer_.normalizePages(document.pages), document.document_id);
    } else {
        sections =
            splitter_.splitByHeadings(normalizer_.normalize(document.text), document.document_id);
    }
    const size_t found = sections.size();
    sections = tocFilter_.filter(std::move(sections));

    std::vector<Chunk> chunks;
    for (const auto& section : sections) {
        auto sectionChunks = chunker_.chunkSection(section);
        for (auto& chunk : sectionChunks) {
            chunk.document_ordinal = chunks.size();
            chunk.source = document.source;
            chunk.user_metadata = user_metadata;
            annotator_.annotate(chunk, section.heading);
            chunks.push_back(std::move(chunk));
        }
    }

    stitcher_.stitch(chunks);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (stats) {
        stats->sections_found = found;
        stats->sections_dropped = found - sections.size();
        stats->chunks = chunks.size();
        stats->register_definitions = 0;
        stats->overviews = 0;
        for (const auto& c : chunks) {
            if (c.kind == ChunkKind::RegisterDefinition)
                ++stats->register_definitions;
            else if (c.kind == ChunkKind::Overview)
                ++stats->overviews;
        }
        stats->elapsed = elapsed;
    }

    spdlog::debug("Chunked '{}': {} sections ({} dropped), {} chunks in {}ms",
                  document.document_id, found, found - sections.size(), chunks.size(),
                  elapsed.count());
    return chunks;
}

} // namespace docseek::chunking
