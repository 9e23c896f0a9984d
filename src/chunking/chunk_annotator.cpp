#include <docseek/chunking/chunk_annotator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace docseek::chunking {

namespace {

const std::regex& identifierPattern() {
    static const std::regex re(R"(\b[A-Z]{2,}[0-9]*x?_[A-Z0-9_]+\b)");
    return re;
}

const std::regex& tableSeparatorRow() {
    static const std::regex re(R"(^\s*\|[\s\-:]+\|[\s\-:|]+$)");
    return re;
}

const std::regex& addressOffsetPattern() {
    static const std::regex re(R"(Address offset:\s*(0x[0-9A-Fa-f]+|\d+))");
    return re;
}

const std::regex& resetValuePattern() {
    static const std::regex re(R"(Reset value:\s*(0x[0-9A-Fa-f_]+|\d+))");
    return re;
}

// "Bit 7 EVOE:" / "Bits 3:0 PIN[3:0]:"
const std::regex& bitFieldLinePattern() {
    static const std::regex re(R"(Bits?\s+\d+(?::\d+)?\s+([A-Z][A-Z0-9_]*(?:\[\d+(?::\d+)?\])?)\s*:)");
    return re;
}

const std::regex& fieldCellPattern() {
    static const std::regex re(R"(^[A-Z][A-Z0-9_]*(?:\[\d+(?::\d+)?\])?$)");
    return re;
}

const std::unordered_set<std::string>& accessTypeCells() {
    static const std::unordered_set<std::string> cells = {
        "R", "W", "RW", "RO", "WO", "RC", "RS", "RT", "RES", "W1C", "RC_W0", "RC_W1", "NA"};
    return cells;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

size_t countOf(const std::string& line, char delim) {
    return static_cast<size_t>(std::count(line.begin(), line.end(), delim));
}

void appendUnique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

ChunkAnnotator::ChunkAnnotator(const ChunkingConfig& config) : config_(config) {}

std::vector<std::string> ChunkAnnotator::findIdentifiers(const std::string& text) {
    std::vector<std::string> ids;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), identifierPattern());
         it != std::sregex_iterator(); ++it) {
        appendUnique(ids, it->str());
    }
    return ids;
}

bool ChunkAnnotator::hasTable(const std::string& text) {
    auto lines = splitLines(text);

    for (const auto& line : lines) {
        if (std::regex_match(line, tableSeparatorRow())) {
            return true;
        }
    }

    // Three or more consecutive lines sharing the same column-delimiter count
    for (char delim : {'|', '\t'}) {
        size_t run = 0;
        size_t previous = 0;
        for (const auto& line : lines) {
            size_t n = countOf(line, delim);
            if (n >= 2 && n == previous) {
                ++run;
            } else {
                run = n >= 2 ? 1 : 0;
            }
            previous = n;
            if (run >= 3) {
                return true;
            }
        }
    }
    return false;
}

std::optional<std::string> ChunkAnnotator::findAddressOffset(const std::string& text) {
    std::smatch m;
    if (std::regex_search(text, m, addressOffsetPattern())) {
        return m[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> ChunkAnnotator::findResetValue(const std::string& text) {
    std::smatch m;
    if (std::regex_search(text, m, resetValuePattern())) {
        return m[1].str();
    }
    return std::nullopt;
}

std::vector<std::string> ChunkAnnotator::findFieldNames(const std::string& text,
                                                        const std::string& registerName) const {
    std::vector<std::string> fields;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), bitFieldLinePattern());
         it != std::sregex_iterator(); ++it) {
        appendUnique(fields, (*it)[1].str());
    }

    for (const auto& line : splitLines(text)) {
        if (countOf(line, '|') < 2 || std::regex_match(line, tableSeparatorRow())) {
            continue;
        }
        std::istringstream cells(line);
        std::string cell;
        while (std::getline(cells, cell, '|')) {
            cell = trim(cell);
            if (cell.size() < 2 || cell == registerName || accessTypeCells().count(cell) > 0) {
                continue;
            }
            if (std::regex_match(cell, fieldCellPattern())) {
                appendUnique(fields, cell);
            }
        }
    }

    if (fields.size() > config_.max_field_names) {
        fields.resize(config_.max_field_names);
    }
    return fields;
}

Classification ChunkAnnotator::classify(const std::string& text,
                                        const std::string& heading) const {
    Classification result;
    result.identifiers = findIdentifiers(text);

    auto offset = findAddressOffset(text);
    if (offset && hasTable(text)) {
        RegisterInfo info;
        auto headingIds = findIdentifiers(heading);
        if (!headingIds.empty()) {
            info.name = headingIds.front();
        } else if (!result.identifiers.empty()) {
            info.name = result.identifiers.front();
        } else if (!heading.empty()) {
            info.name = heading;
        } else {
            info.name = "UNKNOWN";
        }
        info.offset = *offset;
        info.reset = findResetValue(text);
        info.fields = findFieldNames(text, info.name);

        std::vector<std::string> terms{kTableMarker, info.name, "offset:" + info.offset};
        if (info.reset) {
            terms.push_back("reset:" + *info.reset);
        }
        if (!info.fields.empty()) {
            terms.push_back("fields:" + join(info.fields, ","));
        }

        result.kind = ChunkKind::RegisterDefinition;
        result.title = std::string(kTitlePrefix) + " " + info.name + kTitleSuffix;
        result.key_prefix = std::string(kKeyPrefix) + " " + join(terms, " | ") + "]";
        return result;
    }

    if (result.identifiers.size() >= config_.overview_min_identifiers) {
        result.kind = ChunkKind::Overview;
        result.key_prefix = std::string(kKeyPrefix) + " " + kOverviewMarker + "]";
        return result;
    }

    result.kind = ChunkKind::Regular;
    if (!result.identifiers.empty()) {
        result.key_prefix = std::string(kKeyPrefix) + " " + join(result.identifiers, " | ") + "]";
    }
    return result;
}

void ChunkAnnotator::annotate(Chunk& chunk, const std::string& heading) const {
    auto c = classify(chunk.body, heading);
    chunk.kind = c.kind;
    chunk.title = std::move(c.title);
    chunk.key_prefix = std::move(c.key_prefix);
    if (chunk.kind != ChunkKind::Regular) {
        spdlog::debug("Chunk {} classified as {}", chunk.chunkId(), chunkKindToString(chunk.kind));
    }
}

} // namespace docseek::chunking
