#pragma once

#include <docseek/core/types.h>
#include <docseek/extraction/raw_document.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace docseek::extraction {

/**
 * @brief Base interface for document readers
 *
 * A reader turns a file into raw text plus a structure hint; it does no
 * cleaning or chunking of its own.
 */
class IDocumentReader {
public:
    virtual ~IDocumentReader() = default;

    /**
     * @brief Read a file
     * @return Raw document, or FileNotFound / InvalidData
     */
    virtual Result<RawDocument> read(const std::filesystem::path& path) = 0;

    /**
     * @brief Supported extensions, lower case with leading dot
     */
    virtual std::vector<std::string> supportedExtensions() const = 0;

    virtual std::string name() const = 0;

    virtual bool canRead(const std::filesystem::path& path) const {
        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto supported = supportedExtensions();
        return std::find(supported.begin(), supported.end(), ext) != supported.end();
    }
};

/**
 * @brief Reader for Markdown and plain text files (heading-scoped)
 */
class PlainTextReader : public IDocumentReader {
public:
    Result<RawDocument> read(const std::filesystem::path& path) override;
    std::vector<std::string> supportedExtensions() const override {
        return {".md", ".markdown", ".txt"};
    }
    std::string name() const override { return "Plain Text Reader"; }

    // Builds a heading-scoped document from text already in memory
    static RawDocument fromText(std::string text, std::string document_id);
};

#ifdef DOCSEEK_HAVE_QPDF
/**
 * @brief Reader for PDF files (page-scoped) built on QPDF content parsing
 */
class PdfReader : public IDocumentReader {
public:
    Result<RawDocument> read(const std::filesystem::path& path) override;
    std::vector<std::string> supportedExtensions() const override { return {".pdf"}; }
    std::string name() const override { return "PDF Reader"; }
};
#endif

/**
 * @brief Maps file extensions to readers
 */
class DocumentReaderRegistry {
public:
    using ReaderCreator = std::function<std::unique_ptr<IDocumentReader>()>;

    /**
     * @brief Registry with the built-in readers
     */
    static DocumentReaderRegistry withDefaults();

    void registerReader(const std::vector<std::string>& extensions, ReaderCreator creator);

    /**
     * @brief Reader for a path, NotSupported if the extension is unknown
     */
    Result<std::unique_ptr<IDocumentReader>> forPath(const std::filesystem::path& path) const;

    std::vector<std::string> supportedExtensions() const;

private:
    std::unordered_map<std::string, ReaderCreator> creators_;
};

} // namespace docseek::extraction
