#pragma once

#include <docseek/core/types.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

namespace docseek::cli {

// Forward declarations
class DocseekCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "ingest", "search")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, DocseekCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

// Command factories
std::unique_ptr<ICommand> createCreateDbCommand();
std::unique_ptr<ICommand> createListDbsCommand();
std::unique_ptr<ICommand> createDeleteDbCommand();
std::unique_ptr<ICommand> createIngestCommand();
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createListDocsCommand();
std::unique_ptr<ICommand> createDeleteDocCommand();

} // namespace docseek::cli
