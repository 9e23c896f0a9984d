#include <docseek/chunking/text_normalizer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace docseek::chunking {

namespace {

// Reference-manual style running headers ("612/709 RM0041 Rev 6") and plain
// page numbers ("12", "Page 12", "12 of 40", "12/40").
const char* const kDefaultHeaderPatterns[] = {
    R"(^\d+/\d+\s+RM\d+\s+Rev\s+\d+$)",
    R"(^RM\d+\s+Rev\s+\d+\s+\d+/\d+$)",
    R"(^RM\d+\s+[A-Za-z].*$)",
    R"(^(?:[Pp]age\s+)?\d+(?:\s*(?:/|of)\s*\d+)?$)",
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream in(text);
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (!text.empty() && text.back() == '\n') {
        lines.emplace_back();
    }
    return lines;
}

void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string lineSignature(const std::string& line) {
    std::string sig;
    bool inDigits = false;
    for (unsigned char c : trimmed(line)) {
        if (std::isdigit(c)) {
            if (!inDigits) {
                sig.push_back('#');
            }
            inDigits = true;
        } else {
            sig.push_back(static_cast<char>(c));
            inDigits = false;
        }
    }
    return sig;
}

TextNormalizer::TextNormalizer(const ChunkingConfig& config) : config_(config) {
    for (const char* pattern : kDefaultHeaderPatterns) {
        headerPatterns_.emplace_back(pattern);
    }
    for (const auto& pattern : config_.extra_header_patterns) {
        try {
            headerPatterns_.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            spdlog::warn("Ignoring invalid header pattern '{}': {}", pattern, e.what());
        }
    }
}

bool TextNormalizer::isHeaderCandidate(const std::string& line) const {
    auto t = trimmed(line);
    if (t.empty() || t.size() > config_.header_max_line_length) {
        return false;
    }
    return std::any_of(headerPatterns_.begin(), headerPatterns_.end(),
                       [&](const std::regex& re) { return std::regex_match(t, re); });
}

std::vector<std::string>
TextNormalizer::recurringSignatures(const std::vector<std::string>& texts) const {
    std::unordered_map<std::string, size_t> counts;
    for (const auto& text : texts) {
        for (const auto& line : splitLines(text)) {
            if (isHeaderCandidate(line)) {
                ++counts[lineSignature(line)];
            }
        }
    }

    std::vector<std::string> recurring;
    for (const auto& [sig, n] : counts) {
        if (n >= config_.header_min_repeats) {
            recurring.push_back(sig);
        }
    }
    std::sort(recurring.begin(), recurring.end());
    return recurring;
}

std::string TextNormalizer::clean(const std::string& text,
                                  const std::vector<std::string>& recurring) const {
    std::string out;
    out.reserve(text.size());
    size_t removed = 0;

    for (auto& line : splitLines(text)) {
        if (!recurring.empty() && isHeaderCandidate(line) &&
            std::binary_search(recurring.begin(), recurring.end(), lineSignature(line))) {
            ++removed;
            continue;
        }
        rtrim(line);
        out += line;
        out += '\n';
    }

    if (removed > 0) {
        spdlog::debug("TextNormalizer removed {} running header/footer lines", removed);
    }

    // Collapse runs of 3+ newlines into one blank line
    std::string collapsed;
    collapsed.reserve(out.size());
    size_t newlines = 0;
    for (char c : out) {
        if (c == '\n') {
            ++newlines;
            if (newlines <= 2) {
                collapsed.push_back(c);
            }
        } else {
            newlines = 0;
            collapsed.push_back(c);
        }
    }

    return trimmed(collapsed);
}

std::string TextNormalizer::normalize(const std::string& text) const {
    return clean(text, recurringSignatures({text}));
}

std::vector<std::string>
TextNormalizer::normalizePages(const std::vector<std::string>& pages) const {
    auto recurring = recurringSignatures(pages);
    std::vector<std::string> out;
    out.reserve(pages.size());
    for (const auto& page : pages) {
        out.push_back(clean(page, recurring));
    }
    return out;
}

} // namespace docseek::chunking
