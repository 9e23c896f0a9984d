#include <docseek/cli/command.h>
#include <docseek/cli/docseek_cli.h>
#include <docseek/cli/search_output.h>
#include <docseek/search/reranker.h>
#include <docseek/search/search_refiner.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace docseek::cli {

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override { return "Search a database"; }

    void registerCommand(CLI::App& app, DocseekCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("db", db_, "Database to search")->required();
        cmd->add_option("query", query_, "Search query")->required();
        cmd->add_option("-k,--top-k", topK_, "Number of results (default: TOP_K_RESULTS or 5)");
        cmd->add_option("--filter", filters_, "Filter by metadata (key=value), can be repeated")
            ->allow_extra_args(false);

        // Only one reranker may be chosen
        auto* rerankGroup = cmd->add_option_group("reranker");
        rerankGroup->add_flag("--rerank", rerankCloud_, "Rerank with the Cohere API");
        rerankGroup->add_flag("--rerank-local", rerankLocal_,
                              "Rerank with a local MiniLM cross-encoder server");
        rerankGroup->add_flag("--rerank-bge", rerankBge_,
                              "Rerank with a local BGE reranker v2 m3 server");
        rerankGroup->require_option(0, 1);

        cmd->add_flag("--keyword-boost", keywordBoost_,
                      "Boost results containing exact register/identifier names from the query");
        cmd->add_flag("--allow-degraded", allowDegraded_,
                      "Return un-reranked results when the reranker fails");
        cmd->add_flag("--explain", explain_, "Show base score, boost and retrieval rank");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Search failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureInitialized(); !r) {
            return r;
        }
        const auto& settings = cli_->settings();

        search::SearchQuery query;
        query.text = query_;
        query.top_k = topK_ ? topK_ : settings.top_k;
        query.keyword_boost = keywordBoost_;
        query.allow_degraded = allowDegraded_;
        query.rerank = rerankCloud_ || rerankLocal_ || rerankBge_;
        if (rerankBge_) {
            query.rerank_backend = search::RerankBackend::LocalLarge;
        } else if (rerankLocal_) {
            query.rerank_backend = search::RerankBackend::LocalSmall;
        }

        auto filter = DocseekCLI::parseKeyValues(filters_, "--filter");
        if (!filter) {
            return filter.error();
        }
        query.filter = std::move(filter).value();

        auto store = cli_->databases().open(db_);
        if (!store) {
            return store.error();
        }
        auto embedder = cli_->embeddingProvider();
        if (!embedder) {
            return embedder.error();
        }

        std::unique_ptr<search::IReranker> reranker;
        bool rerankUnavailable = false;
        if (query.rerank) {
            auto created =
                search::createReranker(query.rerank_backend, settings.rerank, cli_->httpClient());
            if (!created) {
                if (!query.allow_degraded) {
                    return created.error();
                }
                spdlog::warn("Reranking disabled: {}", created.error().message);
                query.rerank = false;
                rerankUnavailable = true;
            } else {
                reranker = std::move(created).value();
            }
        }

        search::HybridSearchRefiner refiner(*embedder.value(), *store.value(), settings.refiner,
                                            reranker.get());
        auto response = refiner.search(query, cli_->stopToken());
        if (!response) {
            return response.error();
        }
        if (rerankUnavailable) {
            response.value().degraded_stages.push_back("rerank");
        }

        std::cout << formatSearchResponse(query_, response.value(), explain_);
        return Result<void>();
    }

private:
    DocseekCLI* cli_ = nullptr;
    std::string db_;
    std::string query_;
    size_t topK_ = 0;
    std::vector<std::string> filters_;
    bool rerankCloud_ = false;
    bool rerankLocal_ = false;
    bool rerankBge_ = false;
    bool keywordBoost_ = false;
    bool allowDegraded_ = false;
    bool explain_ = false;
};

std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

} // namespace docseek::cli
