#include <docseek/chunking/document_chunker.h>
#include <docseek/cli/command.h>
#include <docseek/cli/docseek_cli.h>
#include <docseek/extraction/document_reader.h>
#include <docseek/ingest/ingestion_service.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace docseek::cli {

class IngestCommand : public ICommand {
public:
    std::string getName() const override { return "ingest"; }

    std::string getDescription() const override {
        return "Ingest PDF, Markdown or text files into a database";
    }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("db", db_, "Target database name")->required();
        cmd->add_option("files", files_, "Files to ingest (.pdf, .md, .markdown, .txt)")
            ->required();
        cmd->add_option("--meta", meta_, "Extra metadata (key=value), can be repeated")
            ->allow_extra_args(false);

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Ingest failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        auto metadata = DocseekCLI::parseKeyValues(meta_, "--meta");
        if (!metadata) {
            return metadata.error();
        }

        auto store = cli_->databases().open(db_);
        if (!store) {
            return store.error();
        }
        auto embedder = cli_->embeddingProvider();
        if (!embedder) {
            return embedder.error();
        }

        const auto& settings = cli_->settings();
        auto readers = extraction::DocumentReaderRegistry::withDefaults();
        chunking::DocumentChunker chunker(settings.chunking);
        ingest::IngestionService service(readers, chunker, *embedder.value(), *store.value(),
                                         settings.embedding.batch_size);

        if (files_.size() == 1) {
            return ingestOne(service, metadata.value());
        }

        std::vector<std::filesystem::path> paths(files_.begin(), files_.end());
        std::cout << "Processing " << paths.size() << " files\n";
        auto results = service.ingestFiles(paths, metadata.value(), cli_->stopToken());

        size_t failures = 0;
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& result = results[i];
            if (!result) {
                ++failures;
                std::cout << "  " << paths[i].filename().string()
                          << ": failed: " << result.error().message << "\n";
                continue;
            }
            report(result.value());
        }
        if (failures) {
            return Error{ErrorCode::InvalidState, std::to_string(failures) + " of " +
                                                      std::to_string(paths.size()) +
                                                      " files failed to ingest"};
        }
        return Result<void>();
    }

private:
    Result<void> ingestOne(const ingest::IngestionService& service, const MetadataMap& metadata) {
        std::filesystem::path path(files_.front());
        std::cout << "Processing: " << path.filename().string() << "\n";

        auto progress = [](size_t batch, size_t total) {
            std::cout << "\r  Embedding batch " << batch << "/" << total << "..." << std::flush;
        };
        auto result = service.ingestFile(path, metadata, cli_->stopToken(), progress);
        if (!result) {
            return result.error();
        }
        if (result.value().chunks_written > 0) {
            std::cout << "\n";
        }
        report(result.value());
        return Result<void>();
    }

    void report(const ingest::IngestReport& r) const {
        if (r.no_content) {
            std::cout << "  " << r.document_id << ": no content extracted\n";
            return;
        }
        std::cout << "  Extracted " << r.stats.chunks << " chunks from " << r.document_id << " ("
                  << r.stats.register_definitions << " register definitions, "
                  << r.stats.overviews << " overviews)\n";
        std::cout << "  Added " << r.chunks_written << " chunks to database '" << db_ << "'\n";
    }

    DocseekCLI* cli_ = nullptr;
    std::string db_;
    std::vector<std::string> files_;
    std::vector<std::string> meta_;
};

std::unique_ptr<ICommand> createIngestCommand() {
    return std::make_unique<IngestCommand>();
}

} // namespace docseek::cli
