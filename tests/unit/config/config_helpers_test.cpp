/**
 * Tests for config file parsing and XDG path resolution.
 *
 * Resolution order for the config file:
 *   1. Explicit path (with ~ expansion)
 *   2. $XDG_CONFIG_HOME/docseek/config.toml
 *   3. ~/.config/docseek/config.toml
 */

#include <gtest/gtest.h>
#include <docseek/config/config_helpers.h>

#include "../../common/test_helpers.h"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace docseek;
using namespace docseek::config;

namespace {

/**
 * RAII helper to set and restore environment variables.
 */
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            hadValue_ = true;
            oldValue_ = old;
        }
        if (value) {
            setenv(name_.c_str(), value, 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ~ScopedEnv() {
        if (hadValue_) {
            setenv(name_.c_str(), oldValue_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string oldValue_;
    bool hadValue_{false};
};

} // namespace

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");

    EXPECT_EQ(unquote("\"text-embedding-3-small\""), "text-embedding-3-small");
    EXPECT_EQ(unquote("  'single'  "), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
    EXPECT_EQ(unquote("\""), "\"");
}

TEST(ConfigHelpersTest, ExpandsTilde) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/docs"), fs::path("/home/tester/docs"));
    EXPECT_EQ(expand_tilde("/abs/path"), fs::path("/abs/path"));
    EXPECT_EQ(expand_tilde("~user/x"), fs::path("~user/x"));
}

TEST(ConfigHelpersTest, ParsesSectionsAndDottedKeys) {
    docseek::tests::TempDir dir;
    auto path = docseek::tests::write_file(dir.path() / "config.toml",
                                           "# docseek settings\n"
                                           "verbose = true\n"
                                           "\n"
                                           "[chunking]\n"
                                           "size = 400   # tokens\n"
                                           "overlap = 40\n"
                                           "\n"
                                           "[ embedding ]\n"
                                           "model = \"text-embedding-3-large\"\n"
                                           "api_key = 'sk-#notacomment'\n"
                                           "search.top_k = 8\n");

    auto values = parse_config_file(path);
    ASSERT_TRUE(values) << values.error().message;
    const auto& v = values.value();
    EXPECT_EQ(v.at("verbose"), "true");
    EXPECT_EQ(v.at("chunking.size"), "400");
    EXPECT_EQ(v.at("chunking.overlap"), "40");
    EXPECT_EQ(v.at("embedding.model"), "text-embedding-3-large");
    EXPECT_EQ(v.at("embedding.api_key"), "sk-#notacomment");
    EXPECT_EQ(v.at("search.top_k"), "8");
    EXPECT_EQ(v.size(), 6u);
}

TEST(ConfigHelpersTest, MissingFileIsEmpty) {
    docseek::tests::TempDir dir;
    auto values = parse_config_file(dir.path() / "absent.toml");
    ASSERT_TRUE(values);
    EXPECT_TRUE(values.value().empty());
}

TEST(ConfigHelpersTest, RejectsMalformedLines) {
    docseek::tests::TempDir dir;
    auto noEquals =
        docseek::tests::write_file(dir.path() / "a.toml", "[chunking]\nsize 400\n");
    auto result = parse_config_file(noEquals);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_NE(result.error().message.find(":2:"), std::string::npos);

    auto openHeader = docseek::tests::write_file(dir.path() / "b.toml", "[chunking\n");
    auto header = parse_config_file(openHeader);
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, ErrorCode::InvalidData);
}

TEST(ConfigHelpersTest, ConfigPathResolution) {
    ScopedEnv home("HOME", "/home/tester");
    {
        ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg/config");
        EXPECT_EQ(get_config_path(), fs::path("/xdg/config/docseek/config.toml"));
        EXPECT_EQ(get_config_path("~/custom.toml"), fs::path("/home/tester/custom.toml"));
    }
    {
        ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
        EXPECT_EQ(get_config_path(), fs::path("/home/tester/.config/docseek/config.toml"));
    }
}

TEST(ConfigHelpersTest, DataDirResolution) {
    ScopedEnv home("HOME", "/home/tester");
    {
        ScopedEnv xdg("XDG_DATA_HOME", "/xdg/data");
        EXPECT_EQ(get_data_dir(), fs::path("/xdg/data/docseek"));
    }
    {
        ScopedEnv xdg("XDG_DATA_HOME", "");
        EXPECT_EQ(get_data_dir(), fs::path("/home/tester/.local/share/docseek"));
    }
}
