#pragma once

#include <docseek/chunking/chunk.h>

#include <cstddef>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Attaches neighbour context to every chunk of one document
 *
 * Chunk i receives "[...] <tail>" built from the last `units` of chunk i-1's
 * original body and "<head> [...]" built from the first `units` of chunk
 * i+1's original body. Section boundaries do not stop the overlap. The
 * "[...]" marker keeps overlap text distinguishable from primary content.
 */
class OverlapStitcher {
public:
    static constexpr const char* kMarker = "[...]";

    explicit OverlapStitcher(size_t units) : units_(units) {}

    void stitch(std::vector<Chunk>& chunks) const;

private:
    size_t units_;
};

} // namespace docseek::chunking
