#include <docseek/chunking/chunk.h>

namespace docseek::chunking {

std::string Chunk::annotatedText() const {
    std::string out;
    if (title) {
        out += *title;
        out += '\n';
    }
    if (key_prefix) {
        out += *key_prefix;
        out += '\n';
    }
    if (!out.empty()) {
        out += '\n';
    }
    out += body;
    return out;
}

std::string Chunk::text() const {
    std::string out;
    if (!leading_overlap.empty()) {
        out += leading_overlap;
        out += "\n\n";
    }
    out += annotatedText();
    if (!trailing_overlap.empty()) {
        out += "\n\n";
        out += trailing_overlap;
    }
    return out;
}

std::string Chunk::chunkId() const {
    return document_id + "#" + std::to_string(document_ordinal);
}

MetadataMap Chunk::metadata() const {
    // User metadata first so the source fields below always win
    MetadataMap meta = user_metadata;
    meta["document_id"] = document_id;
    meta["source"] = source;
    if (page) {
        meta["page"] = std::to_string(*page);
    } else {
        meta["section"] = section;
    }
    meta["chunk_index"] = std::to_string(document_ordinal);
    meta["kind"] = chunkKindToString(kind);
    return meta;
}

} // namespace docseek::chunking
