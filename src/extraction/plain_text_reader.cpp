#include <docseek/extraction/document_reader.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace docseek::extraction {

RawDocument PlainTextReader::fromText(std::string text, std::string document_id) {
    RawDocument doc;
    doc.source = document_id;
    doc.document_id = std::move(document_id);
    doc.layout = DocumentLayout::HeadingScoped;
    doc.text = std::move(text);
    return doc;
}

Result<RawDocument> PlainTextReader::read(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::InvalidData, "Cannot open file: " + path.string()};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    // Strip UTF-8 BOM
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        text.erase(0, 3);
    }

    if (text.find('\0') != std::string::npos) {
        return Error{ErrorCode::InvalidData, "File looks binary: " + path.string()};
    }

    spdlog::debug("PlainTextReader read {} bytes from {}", text.size(), path.string());
    return fromText(std::move(text), path.filename().string());
}

DocumentReaderRegistry DocumentReaderRegistry::withDefaults() {
    DocumentReaderRegistry registry;
    registry.registerReader(PlainTextReader{}.supportedExtensions(),
                            [] { return std::make_unique<PlainTextReader>(); });
#ifdef DOCSEEK_HAVE_QPDF
    registry.registerReader(PdfReader{}.supportedExtensions(),
                            [] { return std::make_unique<PdfReader>(); });
#endif
    return registry;
}

void DocumentReaderRegistry::registerReader(const std::vector<std::string>& extensions,
                                            ReaderCreator creator) {
    for (const auto& ext : extensions) {
        creators_[ext] = creator;
    }
}

Result<std::unique_ptr<IDocumentReader>>
DocumentReaderRegistry::forPath(const std::filesystem::path& path) const {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = creators_.find(ext);
    if (it == creators_.end()) {
        std::string supported;
        for (const auto& e : supportedExtensions()) {
            if (!supported.empty())
                supported += ", ";
            supported += e;
        }
        return Error{ErrorCode::NotSupported,
                     "Unsupported file type '" + ext + "'. Supported: " + supported};
    }
    return it->second();
}

std::vector<std::string> DocumentReaderRegistry::supportedExtensions() const {
    std::vector<std::string> exts;
    exts.reserve(creators_.size());
    for (const auto& [ext, _] : creators_) {
        exts.push_back(ext);
    }
    std::sort(exts.begin(), exts.end());
    return exts;
}

} // namespace docseek::extraction
