#pragma once

#include <docseek/chunking/chunking_config.h>

#include <regex>
#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Strips layout artifacts from extracted text
 *
 * Removes running headers and footers (short lines matching a page-number
 * or document-tag pattern that recur across the document), trims trailing
 * whitespace on every line and collapses three or more consecutive newlines
 * into a single blank line. Always produces output, possibly empty.
 */
class TextNormalizer {
public:
    explicit TextNormalizer(const ChunkingConfig& config = {});

    std::string normalize(const std::string& text) const;

    // Same as normalize() but recurring lines are detected across all pages
    std::vector<std::string> normalizePages(const std::vector<std::string>& pages) const;

private:
    bool isHeaderCandidate(const std::string& line) const;
    std::vector<std::string> recurringSignatures(const std::vector<std::string>& texts) const;
    std::string clean(const std::string& text, const std::vector<std::string>& recurring) const;

    ChunkingConfig config_;
    std::vector<std::regex> headerPatterns_;
};

// Digit runs replaced by '#' and surrounding whitespace trimmed
std::string lineSignature(const std::string& line);

} // namespace docseek::chunking
