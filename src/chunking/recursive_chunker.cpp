#include <docseek/chunking/recursive_chunker.h>
#include <docseek/chunking/tokenizer.h>
#include <docseek/common/utf8_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace docseek::chunking {

namespace {

constexpr size_t kMaxSectionLabel = 100;

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::vector<std::string> splitOnString(const std::string& text, const std::string& sep) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            pieces.push_back(text.substr(start));
            break;
        }
        pieces.push_back(text.substr(start, pos - start));
        start = pos + sep.size();
    }
    return pieces;
}

// Sentence pieces keep their terminal punctuation; the single space after it
// is the separator.
std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> pieces;
    size_t start = 0;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        char c = text[i];
        if ((c == '.' || c == '!' || c == '?') && text[i + 1] == ' ') {
            pieces.push_back(text.substr(start, i + 1 - start));
            start = i + 2;
            ++i;
        }
    }
    pieces.push_back(text.substr(std::min(start, text.size())));
    return pieces;
}

} // namespace

std::vector<std::string> splitOnBoundary(const std::string& text, SplitLevel level) {
    switch (level) {
        case SplitLevel::Paragraph:
            return splitOnString(text, "\n\n");
        case SplitLevel::Line:
            return splitOnString(text, "\n");
        case SplitLevel::Sentence:
            return splitSentences(text);
        case SplitLevel::Word:
            return splitOnString(text, " ");
    }
    return {text};
}

const char* boundaryJoiner(SplitLevel level) {
    switch (level) {
        case SplitLevel::Paragraph:
            return "\n\n";
        case SplitLevel::Line:
            return "\n";
        case SplitLevel::Sentence:
        case SplitLevel::Word:
            return " ";
    }
    return " ";
}

RecursiveChunker::RecursiveChunker(const ChunkingConfig& config) : config_(config) {
    if (config_.chunk_size == 0) {
        spdlog::warn("RecursiveChunker: chunk_size 0 is invalid, using 1");
        config_.chunk_size = 1;
    }
}

std::vector<std::string> RecursiveChunker::split(const std::string& text, size_t budget) const {
    return splitAt(text, SplitLevel::Paragraph, std::max<size_t>(budget, 1));
}

std::vector<std::string> RecursiveChunker::splitAt(const std::string& text, SplitLevel level,
                                                   size_t budget) const {
    if (isBlank(text)) {
        return {};
    }
    if (TokenCounter::count(text) <= budget) {
        return {text};
    }
    if (level > SplitLevel::Word) {
        spdlog::warn("Unsplittable text of {} units exceeds chunk budget {}; emitting as-is",
                     TokenCounter::count(text), budget);
        return {text};
    }

    const auto next = static_cast<SplitLevel>(static_cast<int>(level) + 1);
    const std::string joiner = boundaryJoiner(level);

    std::vector<std::string> chunks;
    std::string current;
    auto pushCurrent = [&]() {
        if (!current.empty() && !isBlank(current)) {
            chunks.push_back(current);
        }
        current.clear();
    };

    for (const auto& piece : splitOnBoundary(text, level)) {
        std::string candidate = current.empty() ? piece : current + joiner + piece;
        if (TokenCounter::count(candidate) <= budget) {
            current = std::move(candidate);
            continue;
        }

        pushCurrent();
        if (TokenCounter::count(piece) > budget) {
            auto sub = splitAt(piece, next, budget);
            chunks.insert(chunks.end(), std::make_move_iterator(sub.begin()),
                          std::make_move_iterator(sub.end()));
        } else {
            current = piece;
        }
    }
    pushCurrent();

    return chunks;
}

std::vector<Chunk> RecursiveChunker::chunkSection(const Section& section) const {
    const size_t budget = config_.chunk_size;
    const std::string headingLine = section.headingLine();

    std::vector<std::string> bodies;
    std::string full = headingLine.empty() ? section.body : headingLine + "\n\n" + section.body;
    if (TokenCounter::count(full) <= budget) {
        if (!isBlank(full)) {
            bodies.push_back(std::move(full));
        }
    } else {
        std::string prefix = headingLine.empty() ? std::string{} : headingLine + "\n\n";
        size_t prefixCost = TokenCounter::count(prefix);
        if (prefixCost >= budget) {
            spdlog::warn("Heading '{}' alone exceeds chunk budget {}; not repeating it",
                         section.heading, budget);
            prefix.clear();
            prefixCost = 0;
        }
        for (auto& piece : split(section.body, budget - prefixCost)) {
            bodies.push_back(prefix + piece);
        }
    }

    std::vector<Chunk> chunks;
    chunks.reserve(bodies.size());
    for (size_t i = 0; i < bodies.size(); ++i) {
        Chunk c;
        c.unit_length = TokenCounter::count(bodies[i]);
        c.body = std::move(bodies[i]);
        c.section_ordinal = i;
        c.document_id = section.document_id;
        c.page = section.page;
        c.section = common::utf8Truncate(section.heading, kMaxSectionLabel);
        chunks.push_back(std::move(c));
    }
    return chunks;
}

} // namespace docseek::chunking
