#include <gtest/gtest.h>
#include <docseek/config/settings.h>

#include "../../common/test_helpers.h"

#include <map>
#include <optional>
#include <string>

using namespace docseek;
using namespace docseek::config;

namespace {

EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

} // namespace

class SettingsTest : public ::testing::Test {
protected:
    // An empty config file keeps the user's real config out of the tests
    std::filesystem::path emptyConfig() {
        return docseek::tests::write_file(dir_.path() / "empty.toml", "");
    }

    std::filesystem::path config(const std::string& body) {
        return docseek::tests::write_file(dir_.path() / "config.toml", body);
    }

    docseek::tests::TempDir dir_;
};

TEST_F(SettingsTest, Defaults) {
    auto settings = loadSettings(emptyConfig(), fakeEnv({}));
    ASSERT_TRUE(settings) << settings.error().message;
    const auto& s = settings.value();
    EXPECT_EQ(s.chunking.chunk_size, 500u);
    EXPECT_EQ(s.chunking.chunk_overlap, 50u);
    EXPECT_EQ(s.top_k, 5u);
    EXPECT_EQ(s.embedding.provider, "openai");
    EXPECT_EQ(s.embedding.model, "text-embedding-3-small");
    EXPECT_TRUE(s.embedding.api_key.empty());
    EXPECT_EQ(s.refiner.expansion_factor, 5u);
    EXPECT_FLOAT_EQ(s.refiner.title_boost, 0.20f);
    EXPECT_FALSE(s.storage.data_dir.empty());
    EXPECT_TRUE(s.config_file.empty());
}

TEST_F(SettingsTest, ReadsConfigFile) {
    auto path = config("[chunking]\n"
                       "size = 400\n"
                       "overlap = 40\n"
                       "header_pattern = \"^Confidential$\"\n"
                       "\n"
                       "[search]\n"
                       "top_k = 8\n"
                       "key_boost = 0.15\n"
                       "\n"
                       "[embedding]\n"
                       "timeout_ms = 2500\n"
                       "\n"
                       "[storage]\n"
                       "data_dir = \"/srv/docseek\"\n");

    auto settings = loadSettings(path, fakeEnv({}));
    ASSERT_TRUE(settings) << settings.error().message;
    const auto& s = settings.value();
    EXPECT_EQ(s.config_file, path);
    EXPECT_EQ(s.chunking.chunk_size, 400u);
    EXPECT_EQ(s.chunking.chunk_overlap, 40u);
    ASSERT_EQ(s.chunking.extra_header_patterns.size(), 1u);
    EXPECT_EQ(s.chunking.extra_header_patterns[0], "^Confidential$");
    EXPECT_EQ(s.top_k, 8u);
    EXPECT_FLOAT_EQ(s.refiner.key_boost, 0.15f);
    EXPECT_EQ(s.embedding.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(s.storage.data_dir, std::filesystem::path("/srv/docseek"));
}

TEST_F(SettingsTest, EnvironmentOverridesFile) {
    auto path = config("[chunking]\nsize = 400\n[embedding]\nmodel = \"from-file\"\n");
    auto settings = loadSettings(path, fakeEnv({{"CHUNK_SIZE", "300"},
                                                {"CHUNK_OVERLAP", "30"},
                                                {"TOP_K_RESULTS", "12"},
                                                {"EMBEDDING_PROVIDER", "mock"},
                                                {"EMBEDDING_MODEL", "from-env"},
                                                {"OPENAI_API_KEY", "sk-env"},
                                                {"COHERE_API_KEY", "co-env"},
                                                {"DOCSEEK_DATA_DIR", "/tmp/ds"}}));
    ASSERT_TRUE(settings) << settings.error().message;
    const auto& s = settings.value();
    EXPECT_EQ(s.chunking.chunk_size, 300u);
    EXPECT_EQ(s.chunking.chunk_overlap, 30u);
    EXPECT_EQ(s.top_k, 12u);
    EXPECT_EQ(s.embedding.provider, "mock");
    EXPECT_EQ(s.embedding.model, "from-env");
    EXPECT_EQ(s.embedding.api_key, "sk-env");
    EXPECT_EQ(s.rerank.cohere_api_key, "co-env");
    EXPECT_EQ(s.storage.data_dir, std::filesystem::path("/tmp/ds"));
}

TEST_F(SettingsTest, RejectsUnparsableNumbers) {
    auto bad = loadSettings(emptyConfig(), fakeEnv({{"CHUNK_SIZE", "big"}}));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(bad.error().message.find("chunking.size"), std::string::npos);

    auto trailing = loadSettings(emptyConfig(), fakeEnv({{"TOP_K_RESULTS", "5x"}}));
    ASSERT_FALSE(trailing);
    EXPECT_EQ(trailing.error().code, ErrorCode::InvalidArgument);

    auto boost = loadSettings(config("[search]\ntitle_boost = high\n"), fakeEnv({}));
    ASSERT_FALSE(boost);
    EXPECT_EQ(boost.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SettingsTest, RejectsOutOfRangeValues) {
    auto overlap = loadSettings(emptyConfig(),
                                fakeEnv({{"CHUNK_SIZE", "100"}, {"CHUNK_OVERLAP", "100"}}));
    ASSERT_FALSE(overlap);
    EXPECT_EQ(overlap.error().code, ErrorCode::InvalidArgument);

    auto zeroSize = loadSettings(emptyConfig(), fakeEnv({{"CHUNK_SIZE", "0"}}));
    ASSERT_FALSE(zeroSize);
    EXPECT_EQ(zeroSize.error().code, ErrorCode::InvalidArgument);

    auto zeroTopK = loadSettings(emptyConfig(), fakeEnv({{"TOP_K_RESULTS", "0"}}));
    ASSERT_FALSE(zeroTopK);
    EXPECT_EQ(zeroTopK.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SettingsTest, MissingExplicitConfigIsAnError) {
    auto settings = loadSettings(dir_.path() / "nope.toml", fakeEnv({}));
    ASSERT_FALSE(settings);
    EXPECT_EQ(settings.error().code, ErrorCode::FileNotFound);
}

TEST_F(SettingsTest, MalformedConfigIsInvalidData) {
    auto settings = loadSettings(config("[chunking]\nsize\n"), fakeEnv({}));
    ASSERT_FALSE(settings);
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidData);
}

TEST_F(SettingsTest, UnknownKeysAreIgnored) {
    auto settings = loadSettings(config("[chunking]\nsize = 250\nflavour = vanilla\n"), fakeEnv({}));
    ASSERT_TRUE(settings) << settings.error().message;
    EXPECT_EQ(settings.value().chunking.chunk_size, 250u);
}

TEST(ApplyConfigValuesTest, AppliesOnTopOfExistingSettings) {
    Settings settings;
    settings.top_k = 3;
    ASSERT_TRUE(applyConfigValues(settings, {{"rerank.cohere_model", "rerank-english-v3.0"},
                                             {"embedding.batch_size", "16"}}));
    EXPECT_EQ(settings.top_k, 3u);
    EXPECT_EQ(settings.rerank.cohere_model, "rerank-english-v3.0");
    EXPECT_EQ(settings.embedding.batch_size, 16u);
}
