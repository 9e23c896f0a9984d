#pragma once

#include <docseek/search/search_types.h>

#include <string>
#include <string_view>
#include <vector>

namespace docseek::search {

/**
 * @brief Region of a stored chunk text in which a query identifier matched
 */
enum class MatchRegion {
    None,
    Body,     // anywhere outside the annotation lines
    KeyTerms, // a whole "[KEY: ...]" line
    Title     // the generated "REGISTER DEFINITION: <token> - ..." line naming the token
};

/**
 * @brief Exact-identifier score boost applied after retrieval and rerank
 *
 * Query identifiers look like register names (AFIO_MAPR2, GPIO_CRL,
 * TIM1_CH1). Each one is looked up with word boundaries, so AFIO_MAPR does
 * not match inside AFIO_MAPR2, and contributes the boost of the strongest
 * region it occurs in. Boosts add up across identifiers and are not capped.
 */
class KeywordBooster {
public:
    explicit KeywordBooster(RefinerConfig config = {}) : config_(config) {}

    /**
     * @brief Identifiers in the upper-cased query, first occurrence order, no duplicates
     */
    static std::vector<std::string> extractQueryIdentifiers(std::string_view query);

    /**
     * @brief Word-boundary match of an upper-case token in upper-cased text
     */
    static bool containsToken(std::string_view upperText, std::string_view token);

    /**
     * @brief Highest-priority region of @p text containing @p token
     */
    static MatchRegion locate(std::string_view text, std::string_view token);

    /**
     * @brief Total boost for a chunk text given the query identifiers
     */
    float computeBoost(const std::vector<std::string>& identifiers, std::string_view text) const;

    /**
     * @brief Add boosts to the candidates' scores in place
     * @return false when the query has no identifiers and nothing changed
     */
    bool apply(std::string_view query, std::vector<Candidate>& candidates) const;

private:
    float boostFor(MatchRegion region) const;

    RefinerConfig config_;
};

} // namespace docseek::search
