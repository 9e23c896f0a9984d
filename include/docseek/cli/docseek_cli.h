#pragma once

#include <docseek/app/database_manager.h>
#include <docseek/cli/command.h>
#include <docseek/config/settings.h>
#include <docseek/ml/provider.h>
#include <docseek/net/http_client.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace docseek::cli {

/**
 * Main CLI application class
 *
 * Global options are parsed before any command runs; settings, logging and
 * collaborators are set up lazily by the first command that needs them.
 */
class DocseekCLI {
public:
    DocseekCLI();
    ~DocseekCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Apply the log level and resolve settings (once)
     */
    Result<void> ensureInitialized();

    const config::Settings& settings() const { return *settings_; }
    const app::DatabaseManager& databases() const { return *databases_; }

    std::shared_ptr<net::IHttpClient> httpClient();

    /**
     * Embedding provider chosen by the settings, created on first use
     */
    Result<ml::IEmbeddingProvider*> embeddingProvider();

    std::stop_token stopToken() const { return stopSource_.get_stop_token(); }
    void requestStop() { stopSource_.request_stop(); }

    /**
     * Parse "key=value" strings into a metadata map
     * @return InvalidArgument for an entry without '=' or with an empty key
     */
    static Result<MetadataMap> parseKeyValues(const std::vector<std::string>& entries,
                                              const std::string& what);

private:
    void registerBuiltinCommands();
    void applyLogLevel() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    std::string dataDir_;
    bool verbose_ = false;

    std::optional<config::Settings> settings_;
    std::unique_ptr<app::DatabaseManager> databases_;
    std::shared_ptr<net::IHttpClient> http_;
    std::unique_ptr<ml::IEmbeddingProvider> embedder_;
    std::stop_source stopSource_;
};

} // namespace docseek::cli
