#pragma once

#include <docseek/chunking/chunk.h>

#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Divides normalized text into heading-scoped or page-scoped sections
 *
 * Heading lines are 1-4 '#' markers followed by a space. Content before the
 * first heading forms a section with an empty heading. Sections without any
 * body line are dropped.
 */
class SectionSplitter {
public:
    static constexpr int kMaxHeadingLevel = 4;

    std::vector<Section> splitByHeadings(const std::string& text,
                                         const std::string& document_id) const;

    // One section per non-empty page; pages are numbered from 1
    std::vector<Section> splitByPages(const std::vector<std::string>& pages,
                                      const std::string& document_id) const;

    // Returns the heading level (1-4) of a line, 0 if it is not a heading
    static int headingLevel(const std::string& line);
};

} // namespace docseek::chunking
