#include <docseek/extraction/document_reader.h>

#include <spdlog/spdlog.h>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <sstream>

namespace docseek::extraction {

namespace {

// Collects operands until their operator arrives, then renders text-showing
// operators. Line-moving operators start a new line so running headers and
// footers stay on lines of their own.
class PageTextCallback : public QPDFObjectHandle::ParserCallbacks {
public:
    explicit PageTextCallback(std::ostringstream& out) : out_(out) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }

        const std::string op = obj.getOperatorValue();
        if (op == "Td" || op == "TD" || op == "T*" || op == "ET") {
            newline();
        } else if (op == "Tj") {
            showStrings();
        } else if (op == "'" || op == "\"") {
            newline();
            showStrings();
        } else if (op == "TJ") {
            for (auto& operand : operands_) {
                if (!operand.isArray())
                    continue;
                for (auto& item : operand.getArrayAsVector()) {
                    if (item.isString()) {
                        out_ << item.getUTF8Value();
                    } else if (item.isNumber() && item.getNumericValue() < -200.0) {
                        // Large negative kerning is a word gap
                        out_ << ' ';
                    }
                }
            }
            lineHasText_ = true;
        }
        operands_.clear();
    }

    void handleEOF() override { newline(); }

private:
    void showStrings() {
        for (auto& operand : operands_) {
            if (operand.isString()) {
                out_ << operand.getUTF8Value();
                lineHasText_ = true;
            }
        }
    }

    void newline() {
        if (lineHasText_) {
            out_ << '\n';
            lineHasText_ = false;
        }
    }

    std::ostringstream& out_;
    std::vector<QPDFObjectHandle> operands_;
    bool lineHasText_ = false;
};

std::string extractPageText(QPDFPageObjectHelper& page) {
    std::ostringstream text;
    PageTextCallback callback(text);
    page.parseContents(&callback);
    return text.str();
}

} // namespace

Result<RawDocument> PdfReader::read(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "PDF not found: " + path.string()};
    }

    RawDocument doc;
    doc.document_id = path.filename().string();
    doc.source = doc.document_id;
    doc.layout = DocumentLayout::PageScoped;

    try {
        QPDF pdf;
        pdf.processFile(path.string().c_str());

        auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
        if (pages.empty()) {
            return Error{ErrorCode::InvalidData, "PDF has no pages: " + path.string()};
        }

        doc.pages.reserve(pages.size());
        for (size_t i = 0; i < pages.size(); ++i) {
            try {
                doc.pages.push_back(extractPageText(pages[i]));
            } catch (const std::exception& e) {
                // Keep page numbering intact for the remaining pages
                spdlog::warn("Failed to extract text from page {} of {}: {}", i + 1,
                             path.string(), e.what());
                doc.pages.emplace_back();
            }
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, "Failed to load PDF: " + std::string(e.what())};
    }

    spdlog::debug("PdfReader extracted {} pages from {}", doc.pages.size(), path.string());
    return doc;
}

} // namespace docseek::extraction
