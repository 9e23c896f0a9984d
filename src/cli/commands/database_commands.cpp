#include <docseek/cli/command.h>
#include <docseek/cli/docseek_cli.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace docseek::cli {

class CreateDbCommand : public ICommand {
public:
    std::string getName() const override { return "create-db"; }

    std::string getDescription() const override { return "Create a new database"; }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("name", name_, "Name of the database to create")->required();

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("create-db failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        if (auto r = cli_->databases().create(name_); !r) {
            return r;
        }
        std::cout << "Created database: " << name_ << "\n";
        return Result<void>();
    }

private:
    DocseekCLI* cli_ = nullptr;
    std::string name_;
};

class ListDbsCommand : public ICommand {
public:
    std::string getName() const override { return "list-dbs"; }

    std::string getDescription() const override { return "List all databases"; }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("list-dbs failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        auto names = cli_->databases().list();
        if (!names) {
            return names.error();
        }
        if (names.value().empty()) {
            std::cout << "No databases found.\n";
            return Result<void>();
        }

        std::cout << "Available databases:\n";
        for (const auto& name : names.value()) {
            auto store = cli_->databases().open(name);
            if (!store) {
                std::cout << "  - " << name << " (unreadable: " << store.error().message << ")\n";
                continue;
            }
            auto chunks = store.value()->count();
            auto docs = store.value()->listDocuments();
            if (!chunks || !docs) {
                std::cout << "  - " << name << " (unreadable)\n";
                continue;
            }
            std::cout << "  - " << name << " (" << chunks.value() << " chunks, "
                      << docs.value().size() << " documents)\n";
        }
        return Result<void>();
    }

private:
    DocseekCLI* cli_ = nullptr;
};

class DeleteDbCommand : public ICommand {
public:
    std::string getName() const override { return "delete-db"; }

    std::string getDescription() const override { return "Delete a database"; }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("name", name_, "Name of the database to delete")->required();

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("delete-db failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        if (auto r = cli_->databases().remove(name_); !r) {
            return r;
        }
        std::cout << "Deleted database: " << name_ << "\n";
        return Result<void>();
    }

private:
    DocseekCLI* cli_ = nullptr;
    std::string name_;
};

std::unique_ptr<ICommand> createCreateDbCommand() {
    return std::make_unique<CreateDbCommand>();
}

std::unique_ptr<ICommand> createListDbsCommand() {
    return std::make_unique<ListDbsCommand>();
}

std::unique_ptr<ICommand> createDeleteDbCommand() {
    return std::make_unique<DeleteDbCommand>();
}

} // namespace docseek::cli
