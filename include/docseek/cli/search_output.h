#pragma once

#include <docseek/search/search_types.h>

#include <string>

namespace docseek::cli {

inline constexpr size_t kPreviewChars = 200;
inline constexpr size_t kSectionLabelChars = 30;

/**
 * @brief Location label: "Page: n", "Section: <first 30 chars>" or empty
 */
std::string formatLocation(const search::SearchResult& result);

/**
 * @brief Cut text to at most @p maxChars characters, appending "..." when cut
 *
 * Counts UTF-8 code points so multi-byte characters are never split.
 */
std::string truncatePreview(const std::string& text, size_t maxChars = kPreviewChars);

/**
 * @brief Render a search response the way the search command prints it
 */
std::string formatSearchResponse(const std::string& query, const search::SearchResponse& response,
                                 bool showScoreDetail = false);

} // namespace docseek::cli
