#include <docseek/chunking/toc_filter.h>

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>

namespace docseek::chunking {

namespace {

const std::regex& dotLeaderTail() {
    static const std::regex re(R"((?:\.|_|·|…)(?:\s|\.|_|·|…)+\d+\s*$)");
    return re;
}

const std::regex& barePageNumber() {
    static const std::regex re(R"(^\s*\d+\s*$)");
    return re;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string TocFilter::strip(const std::string& body) {
    std::string out;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (std::regex_match(line, barePageNumber())) {
            continue;
        }
        out += std::regex_replace(line, dotLeaderTail(), "");
        out += '\n';
    }
    return trim(out);
}

bool TocFilter::isTocNoise(const Section& section) const {
    return strip(section.body).size() < minChars_;
}

std::vector<Section> TocFilter::filter(std::vector<Section> sections) const {
    std::vector<Section> kept;
    kept.reserve(sections.size());
    for (auto& section : sections) {
        if (isTocNoise(section)) {
            spdlog::debug("TocFilter dropped section '{}'", section.heading);
            continue;
        }
        kept.push_back(std::move(section));
    }
    return kept;
}

} // namespace docseek::chunking
