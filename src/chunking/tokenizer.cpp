#include <docseek/chunking/tokenizer.h>

#include <algorithm>

namespace docseek::chunking {

namespace {

bool isAsciiLetter(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiDigit(unsigned char c) {
    return c >= '0' && c <= '9';
}

bool isHorizontalSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

size_t utf8SequenceLength(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1; // stray continuation byte
}

// Emits spans of at most `width` bytes over [begin, end); the first span also
// covers `prefix` bytes placed before begin (a folded leading space).
void emitPieces(std::vector<TokenSpan>& out, size_t begin, size_t end, size_t width,
                size_t prefix) {
    size_t pos = begin;
    bool first = true;
    while (pos < end) {
        size_t next = std::min(end, pos + width);
        out.push_back({first ? pos - prefix : pos, next});
        first = false;
        pos = next;
    }
}

} // namespace

std::vector<TokenSpan> TokenCounter::segment(std::string_view text) {
    std::vector<TokenSpan> spans;
    spans.reserve(text.size() / 3 + 1);

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (c == '\n') {
            size_t j = i;
            while (j < n && text[j] == '\n')
                ++j;
            spans.push_back({i, j});
            i = j;
            continue;
        }

        if (isHorizontalSpace(c)) {
            size_t j = i;
            while (j < n && isHorizontalSpace(static_cast<unsigned char>(text[j])))
                ++j;
            // A single space directly before a word belongs to that word
            const bool foldIntoWord =
                j < n && text[j - 1] == ' ' && isAsciiLetter(static_cast<unsigned char>(text[j]));
            const size_t runEnd = foldIntoWord ? j - 1 : j;
            if (runEnd > i) {
                spans.push_back({i, runEnd});
            }
            if (foldIntoWord) {
                size_t k = j;
                while (k < n && isAsciiLetter(static_cast<unsigned char>(text[k])))
                    ++k;
                emitPieces(spans, j, k, kCharsPerWordPiece, 1);
                i = k;
            } else {
                i = j;
            }
            continue;
        }

        if (isAsciiLetter(c)) {
            size_t j = i;
            while (j < n && isAsciiLetter(static_cast<unsigned char>(text[j])))
                ++j;
            emitPieces(spans, i, j, kCharsPerWordPiece, 0);
            i = j;
            continue;
        }

        if (isAsciiDigit(c)) {
            size_t j = i;
            while (j < n && isAsciiDigit(static_cast<unsigned char>(text[j])))
                ++j;
            emitPieces(spans, i, j, kDigitsPerUnit, 0);
            i = j;
            continue;
        }

        if (c >= 0x80) {
            size_t len = std::min(utf8SequenceLength(c), n - i);
            spans.push_back({i, i + len});
            i += len;
            continue;
        }

        // Punctuation, symbols and control characters
        spans.push_back({i, i + 1});
        ++i;
    }

    return spans;
}

size_t TokenCounter::count(std::string_view text) {
    return segment(text).size();
}

std::string TokenCounter::head(std::string_view text, size_t n) {
    if (n == 0 || text.empty()) {
        return {};
    }
    auto spans = segment(text);
    if (n >= spans.size()) {
        return std::string(text);
    }
    return std::string(text.substr(0, spans[n - 1].end));
}

std::string TokenCounter::tail(std::string_view text, size_t n) {
    if (n == 0 || text.empty()) {
        return {};
    }
    auto spans = segment(text);
    if (n >= spans.size()) {
        return std::string(text);
    }
    return std::string(text.substr(spans[spans.size() - n].begin));
}

} // namespace docseek::chunking
