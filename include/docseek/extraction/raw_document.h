#pragma once

#include <string>
#include <vector>

namespace docseek::extraction {

/**
 * @brief Structure hint delivered with extracted text
 */
enum class DocumentLayout {
    HeadingScoped, // Markdown / plain text: sections come from heading markers
    PageScoped     // PDF: one section per physical page
};

/**
 * @brief Raw text of one document as produced by a reader
 */
struct RawDocument {
    std::string document_id;        // Stable identifier (file name)
    std::string source;             // Display name of the source file
    DocumentLayout layout = DocumentLayout::HeadingScoped;
    std::string text;               // HeadingScoped content
    std::vector<std::string> pages; // PageScoped content, index 0 is page 1

    bool empty() const {
        if (layout == DocumentLayout::PageScoped) {
            for (const auto& p : pages) {
                if (p.find_first_not_of(" \t\r\n") != std::string::npos)
                    return false;
            }
            return true;
        }
        return text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
};

} // namespace docseek::extraction
