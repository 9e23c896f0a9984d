#include <docseek/chunking/section_splitter.h>

#include <spdlog/spdlog.h>

#include <sstream>

namespace docseek::chunking {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string joinPath(const std::vector<std::string>& trail) {
    std::string out;
    for (const auto& part : trail) {
        if (part.empty())
            continue;
        if (!out.empty())
            out += " > ";
        out += part;
    }
    return out;
}

} // namespace

int SectionSplitter::headingLevel(const std::string& line) {
    int level = 0;
    while (level < static_cast<int>(line.size()) && line[level] == '#') {
        ++level;
    }
    if (level < 1 || level > kMaxHeadingLevel) {
        return 0;
    }
    if (static_cast<size_t>(level) >= line.size() || (line[level] != ' ' && line[level] != '\t')) {
        return 0;
    }
    // "# " with nothing after it is not a heading
    if (trim(line.substr(static_cast<size_t>(level))).empty()) {
        return 0;
    }
    return level;
}

std::vector<Section> SectionSplitter::splitByHeadings(const std::string& text,
                                                      const std::string& document_id) const {
    std::vector<Section> sections;

    // Heading trail indexed by level-1, used for section_path
    std::vector<std::string> trail(kMaxHeadingLevel);

    Section current;
    current.document_id = document_id;
    std::vector<std::string> bodyLines;

    auto flush = [&]() {
        std::string body;
        for (size_t i = 0; i < bodyLines.size(); ++i) {
            if (i > 0)
                body += '\n';
            body += bodyLines[i];
        }
        body = trim(body);
        if (!body.empty()) {
            current.body = std::move(body);
            sections.push_back(current);
        }
        bodyLines.clear();
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        int level = headingLevel(line);
        if (level == 0) {
            bodyLines.push_back(line);
            continue;
        }

        flush();

        std::string heading = trim(line.substr(static_cast<size_t>(level)));
        trail[static_cast<size_t>(level - 1)] = heading;
        for (size_t i = static_cast<size_t>(level); i < trail.size(); ++i) {
            trail[i].clear();
        }

        current = Section{};
        current.document_id = document_id;
        current.heading = std::move(heading);
        current.level = level;
        current.section_path = joinPath(trail);
    }
    flush();

    spdlog::debug("SectionSplitter: {} sections in '{}'", sections.size(), document_id);
    return sections;
}

std::vector<Section> SectionSplitter::splitByPages(const std::vector<std::string>& pages,
                                                   const std::string& document_id) const {
    std::vector<Section> sections;
    for (size_t i = 0; i < pages.size(); ++i) {
        std::string body = trim(pages[i]);
        if (body.empty()) {
            continue;
        }
        Section s;
        s.document_id = document_id;
        s.body = std::move(body);
        s.page = static_cast<int>(i + 1);
        sections.push_back(std::move(s));
    }
    return sections;
}

} // namespace docseek::chunking
