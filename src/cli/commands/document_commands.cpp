#include <docseek/cli/command.h>
#include <docseek/cli/docseek_cli.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace docseek::cli {

class ListDocsCommand : public ICommand {
public:
    std::string getName() const override { return "list-docs"; }

    std::string getDescription() const override { return "List documents in a database"; }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("db", db_, "Database name")->required();

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("list-docs failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        auto store = cli_->databases().open(db_);
        if (!store) {
            return store.error();
        }
        auto docs = store.value()->listDocuments();
        if (!docs) {
            return docs.error();
        }

        if (docs.value().empty()) {
            std::cout << "No documents in database '" << db_ << "'.\n";
            return Result<void>();
        }
        std::cout << "Documents in '" << db_ << "':\n";
        for (const auto& doc : docs.value()) {
            std::cout << "  - " << doc << "\n";
        }
        return Result<void>();
    }

private:
    DocseekCLI* cli_ = nullptr;
    std::string db_;
};

class DeleteDocCommand : public ICommand {
public:
    std::string getName() const override { return "delete-doc"; }

    std::string getDescription() const override {
        return "Delete all chunks of a document from a database";
    }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("db", db_, "Database name")->required();
        cmd->add_option("document", document_, "Document name as shown by list-docs")->required();

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("delete-doc failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        auto store = cli_->databases().open(db_);
        if (!store) {
            return store.error();
        }
        auto removed = store.value()->deleteDocument(document_);
        if (!removed) {
            return removed.error();
        }
        if (removed.value() == 0) {
            return Error{ErrorCode::NotFound,
                         "Document '" + document_ + "' not found in database '" + db_ + "'"};
        }
        std::cout << "Deleted " << removed.value() << " chunks from '" << document_ << "'\n";
        return Result<void>();
    }

private:
    DocseekCLI* cli_ = nullptr;
    std::string db_;
    std::string document_;
};

std::unique_ptr<ICommand> createListDocsCommand() {
    return std::make_unique<ListDocsCommand>();
}

std::unique_ptr<ICommand> createDeleteDocCommand() {
    return std::make_unique<DeleteDocCommand>();
}

} // namespace docseek::cli
