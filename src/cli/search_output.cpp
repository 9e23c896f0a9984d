#include <docseek/cli/search_output.h>
#include <docseek/common/utf8_utils.h>

#include <iomanip>
#include <sstream>

namespace docseek::cli {

using common::utf8Prefix;

std::string formatLocation(const search::SearchResult& result) {
    if (result.page) {
        return "Page: " + *result.page;
    }
    if (result.section && !result.section->empty()) {
        return "Section: " + result.section->substr(0, utf8Prefix(*result.section,
                                                                   kSectionLabelChars));
    }
    return {};
}

std::string truncatePreview(const std::string& text, size_t maxChars) {
    size_t cut = utf8Prefix(text, maxChars);
    if (cut >= text.size()) {
        return text;
    }
    return text.substr(0, cut) + "...";
}

std::string formatSearchResponse(const std::string& query, const search::SearchResponse& response,
                                 bool showScoreDetail) {
    std::ostringstream out;
    for (const auto& stage : response.degraded_stages) {
        out << "Warning: " << stage << " stage failed and was skipped\n";
    }

    if (response.results.empty()) {
        out << "No results found.\n";
        return out.str();
    }

    out << "\nSearch results for: \"" << query << "\"\n\n";
    size_t i = 1;
    for (const auto& result : response.results) {
        out << "[" << i++ << "] Score: " << std::fixed << std::setprecision(2) << result.score
            << " | Source: " << (result.source.empty() ? "unknown" : result.source) << " | "
            << formatLocation(result) << "\n";
        if (showScoreDetail) {
            out << "    (base " << std::setprecision(3) << result.base_score << ", boost +"
                << result.keyword_boost << ", retrieval rank " << result.original_rank + 1
                << ")\n";
        }
        out << "    \"" << truncatePreview(result.text) << "\"\n\n";
    }

    out << "Search time: " << response.elapsed.count() << "ms\n";
    return out.str();
}

} // namespace docseek::cli
