#pragma once

#include <docseek/chunking/chunk.h>
#include <docseek/chunking/chunking_config.h>

#include <optional>
#include <string>
#include <vector>

namespace docseek::chunking {

/**
 * @brief Register fields recognised in a register-definition chunk
 */
struct RegisterInfo {
    std::string name;
    std::string offset;
    std::optional<std::string> reset;
    std::vector<std::string> fields;
};

/**
 * @brief Outcome of classifying one chunk
 */
struct Classification {
    ChunkKind kind = ChunkKind::Regular;
    std::optional<std::string> title;
    std::optional<std::string> key_prefix;
    std::vector<std::string> identifiers; // distinct register identifiers, first-seen order
};

/**
 * @brief Structural classifier and annotator
 *
 * Rules are evaluated in a fixed order and exactly one applies:
 *   1. RegisterDefinition - a table plus an "Address offset:" line
 *   2. Overview           - overview_min_identifiers or more distinct register
 *                           identifiers; the identifiers are deliberately not
 *                           listed as key terms
 *   3. Regular            - identifiers (if any) listed as key terms
 */
class ChunkAnnotator {
public:
    static constexpr const char* kTitlePrefix = "REGISTER DEFINITION:";
    static constexpr const char* kTitleSuffix = " - Complete bit field specification";
    static constexpr const char* kKeyPrefix = "[KEY:";
    static constexpr const char* kTableMarker = "TABLE:register_bitfields";
    static constexpr const char* kOverviewMarker = "OVERVIEW:register_list";

    explicit ChunkAnnotator(const ChunkingConfig& config = {});

    Classification classify(const std::string& text, const std::string& heading) const;

    // Classifies chunk.body and stores kind, title and key prefix on the chunk
    void annotate(Chunk& chunk, const std::string& heading) const;

    // Register-like identifiers (GPIOx_CRL, AFIO_MAPR2, TIM1_CCR1) in first-seen order
    static std::vector<std::string> findIdentifiers(const std::string& text);

    static bool hasTable(const std::string& text);
    static std::optional<std::string> findAddressOffset(const std::string& text);
    static std::optional<std::string> findResetValue(const std::string& text);
    std::vector<std::string> findFieldNames(const std::string& text,
                                            const std::string& registerName) const;

private:
    ChunkingConfig config_;
};

} // namespace docseek::chunking
