#pragma once

#include <docseek/chunking/chunk.h>

#include <cstddef>
#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Drops table-of-contents sections
 *
 * Every body line loses its dot-leader tail ("Overview . . . . 12") and bare
 * page-number lines disappear. A section whose remaining trimmed body is
 * shorter than minChars is table-of-contents noise.
 */
class TocFilter {
public:
    explicit TocFilter(size_t minChars = 50) : minChars_(minChars) {}

    bool isTocNoise(const Section& section) const;

    std::vector<Section> filter(std::vector<Section> sections) const;

    // Body with dot-leader tails and bare page-number lines removed, trimmed
    static std::string strip(const std::string& body);

private:
    size_t minChars_;
};

} // namespace docseek::chunking
