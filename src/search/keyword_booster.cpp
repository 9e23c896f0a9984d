#include <docseek/search/keyword_booster.h>
#include <docseek/chunking/chunk_annotator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace docseek::search {

namespace {

// AFIO_MAPR2, GPIO_CRL, TIM1_CH1, ...
const std::regex& queryIdentifierPattern() {
    static const std::regex re(R"(\b([A-Z]{2,}[0-9]*_[A-Z0-9_]+)\b)");
    return re;
}

std::string toUpper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view trim(std::string_view line) {
    size_t b = 0;
    while (b < line.size() && (line[b] == ' ' || line[b] == '\t'))
        ++b;
    size_t e = line.size();
    while (e > b && (line[e - 1] == ' ' || line[e - 1] == '\t' || line[e - 1] == '\r'))
        --e;
    return line.substr(b, e - b);
}

} // namespace

std::vector<std::string> KeywordBooster::extractQueryIdentifiers(std::string_view query) {
    const std::string upper = toUpper(query);
    std::vector<std::string> identifiers;
    for (auto it = std::sregex_iterator(upper.begin(), upper.end(), queryIdentifierPattern());
         it != std::sregex_iterator(); ++it) {
        std::string token = (*it)[1].str();
        if (std::find(identifiers.begin(), identifiers.end(), token) == identifiers.end()) {
            identifiers.push_back(std::move(token));
        }
    }
    return identifiers;
}

bool KeywordBooster::containsToken(std::string_view upperText, std::string_view token) {
    if (token.empty())
        return false;
    size_t pos = upperText.find(token);
    while (pos != std::string_view::npos) {
        bool leftOk = pos == 0 || !isWordChar(upperText[pos - 1]);
        size_t end = pos + token.size();
        bool rightOk = end == upperText.size() || !isWordChar(upperText[end]);
        if (leftOk && rightOk)
            return true;
        pos = upperText.find(token, pos + 1);
    }
    return false;
}

MatchRegion KeywordBooster::locate(std::string_view text, std::string_view token) {
    const std::string upper = toUpper(text);
    // Title and key tiers need the exact lines ChunkAnnotator writes
    const std::string titleLine = toUpper(std::string(chunking::ChunkAnnotator::kTitlePrefix) +
                                          " " + std::string(token) +
                                          chunking::ChunkAnnotator::kTitleSuffix);
    const std::string keyPrefix = toUpper(chunking::ChunkAnnotator::kKeyPrefix);

    bool inTitle = false, inKey = false, inBody = false;
    std::string_view rest(upper);
    while (!rest.empty()) {
        size_t nl = rest.find('\n');
        std::string_view line = rest.substr(0, nl);
        rest = nl == std::string_view::npos ? std::string_view{} : rest.substr(nl + 1);

        if (!containsToken(line, token))
            continue;
        std::string_view trimmed = trim(line);
        if (trimmed == titleLine) {
            inTitle = true;
        } else if (trimmed.starts_with(keyPrefix) && trimmed.ends_with(']')) {
            inKey = true;
        } else {
            inBody = true;
        }
    }

    if (inTitle)
        return MatchRegion::Title;
    if (inKey)
        return MatchRegion::KeyTerms;
    if (inBody)
        return MatchRegion::Body;
    return MatchRegion::None;
}

float KeywordBooster::boostFor(MatchRegion region) const {
    switch (region) {
        case MatchRegion::Title:
            return config_.title_boost;
        case MatchRegion::KeyTerms:
            return config_.key_boost;
        case MatchRegion::Body:
            return config_.body_boost;
        case MatchRegion::None:
            break;
    }
    return 0.0f;
}

float KeywordBooster::computeBoost(const std::vector<std::string>& identifiers,
                                   std::string_view text) const {
    float boost = 0.0f;
    for (const auto& token : identifiers) {
        boost += boostFor(locate(text, token));
    }
    return boost;
}

bool KeywordBooster::apply(std::string_view query, std::vector<Candidate>& candidates) const {
    auto identifiers = extractQueryIdentifiers(query);
    if (identifiers.empty()) {
        spdlog::debug("Keyword boost: no identifiers in query, scores unchanged");
        return false;
    }

    for (auto& candidate : candidates) {
        float boost = computeBoost(identifiers, candidate.text);
        candidate.keyword_boost = boost;
        candidate.score += boost;
    }
    spdlog::debug("Keyword boost applied for {} identifier(s) over {} candidates",
                  identifiers.size(), candidates.size());
    return true;
}

} // namespace docseek::search
