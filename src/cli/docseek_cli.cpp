#include <docseek/cli/docseek_cli.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace docseek::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

DocseekCLI::DocseekCLI() {
    app_ = std::make_unique<CLI::App>("docseek - semantic search over technical documents");
    app_->require_subcommand(1);
    app_->add_option("--config", configPath_, "Config file (default: XDG config dir)");
    app_->add_option("--data-dir", dataDir_, "Directory holding the databases");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
}

DocseekCLI::~DocseekCLI() = default;

void DocseekCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void DocseekCLI::registerBuiltinCommands() {
    registerCommand(createCreateDbCommand());
    registerCommand(createListDbsCommand());
    registerCommand(createDeleteDbCommand());
    registerCommand(createIngestCommand());
    registerCommand(createSearchCommand());
    registerCommand(createListDocsCommand());
    registerCommand(createDeleteDocCommand());
}

int DocseekCLI::run(int argc, char* argv[]) {
    registerBuiltinCommands();
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }
    return 0;
}

void DocseekCLI::applyLogLevel() const {
    // Precedence: env DOCSEEK_LOG_LEVEL > --verbose > warn
    if (const char* envLvl = std::getenv("DOCSEEK_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown DOCSEEK_LOG_LEVEL '{}'", envLvl);
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

Result<void> DocseekCLI::ensureInitialized() {
    if (settings_) {
        return Result<void>();
    }
    applyLogLevel();

    auto loaded = config::loadSettings(configPath_);
    if (!loaded) {
        return loaded.error();
    }
    settings_ = std::move(loaded).value();
    if (!dataDir_.empty()) {
        settings_->storage.data_dir = config::expand_tilde(dataDir_);
    }
    databases_ = std::make_unique<app::DatabaseManager>(settings_->storage.data_dir);

    spdlog::debug("Data directory: {}", settings_->storage.data_dir.string());
    if (!settings_->config_file.empty()) {
        spdlog::debug("Config file: {}", settings_->config_file.string());
    }
    return Result<void>();
}

std::shared_ptr<net::IHttpClient> DocseekCLI::httpClient() {
    if (!http_) {
        http_ = net::makeDefaultHttpClient();
    }
    return http_;
}

Result<ml::IEmbeddingProvider*> DocseekCLI::embeddingProvider() {
    if (auto r = ensureInitialized(); !r) {
        return r.error();
    }
    if (!embedder_) {
        auto created = ml::createEmbeddingProvider(settings_->embedding, httpClient());
        if (!created) {
            return created.error();
        }
        embedder_ = std::move(created).value();
    }
    return embedder_.get();
}

Result<MetadataMap> DocseekCLI::parseKeyValues(const std::vector<std::string>& entries,
                                               const std::string& what) {
    MetadataMap out;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid " + what + " '" + entry + "': expected key=value"};
        }
        out[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return out;
}

} // namespace docseek::cli
