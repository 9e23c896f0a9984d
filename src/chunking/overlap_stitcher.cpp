#include <docseek/chunking/overlap_stitcher.h>
#include <docseek/chunking/tokenizer.h>

namespace docseek::chunking {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

void OverlapStitcher::stitch(std::vector<Chunk>& chunks) const {
    if (chunks.size() <= 1 || units_ == 0) {
        return;
    }

    // Read neighbours' bodies before anything is modified; bodies themselves
    // are never touched here, only the overlap fields.
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].leading_overlap.clear();
        chunks[i].trailing_overlap.clear();

        if (i > 0) {
            auto tail = trim(TokenCounter::tail(chunks[i - 1].body, units_));
            if (!tail.empty()) {
                chunks[i].leading_overlap = std::string(kMarker) + " " + tail;
            }
        }
        if (i + 1 < chunks.size()) {
            auto head = trim(TokenCounter::head(chunks[i + 1].body, units_));
            if (!head.empty()) {
                chunks[i].trailing_overlap = head + " " + kMarker;
            }
        }
    }
}

} // namespace docseek::chunking
