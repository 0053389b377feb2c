#include <gtest/gtest.h>
#include <star_etl/config/engine_config.h>

namespace star_etl {

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(EngineConfigTest, Defaults) {
    auto config = ParseEngineConfig("{}");
    ASSERT_TRUE(config.ok()) << config.status().ToString();
    EXPECT_EQ(config->null_policy, NullPolicy::Sentinel);
    EXPECT_EQ(config->template_cache_capacity, 16384u);
    EXPECT_EQ(config->blank_node_prefix, "r");
    EXPECT_TRUE(config->vectorized_subjects);
    EXPECT_FALSE(config->emit_run_metadata);
    EXPECT_EQ(config->output_format, OutputFormat::NQuads);
}

TEST_F(EngineConfigTest, AllKeys) {
    auto config = ParseEngineConfig(R"({
        "search_directories": ["data", "/srv/etl"],
        "null_policy": "skip",
        "template_cache_capacity": 128,
        "blank_node_prefix": "b",
        "vectorized_subjects": false,
        "emit_run_metadata": true,
        "output_format": "trig",
        "unknown_key": 1
    })");
    ASSERT_TRUE(config.ok()) << config.status().ToString();
    EXPECT_EQ(config->search_directories, (std::vector<std::string>{"data", "/srv/etl"}));
    EXPECT_EQ(config->null_policy, NullPolicy::Skip);
    EXPECT_EQ(config->template_cache_capacity, 128u);
    EXPECT_EQ(config->blank_node_prefix, "b");
    EXPECT_FALSE(config->vectorized_subjects);
    EXPECT_TRUE(config->emit_run_metadata);
    EXPECT_EQ(config->output_format, OutputFormat::TriG);

    ExecutorOptions options = config->ToExecutorOptions("/maps");
    EXPECT_EQ(options.base_directory, "/maps");
    EXPECT_EQ(options.search_directories.size(), 2u);
    EXPECT_EQ(options.template_options.null_policy, NullPolicy::Skip);
    EXPECT_EQ(options.template_options.cache_capacity, 128u);
    EXPECT_EQ(options.blank_node_prefix, "b");
    EXPECT_FALSE(options.vectorized_subjects);
}

TEST_F(EngineConfigTest, InvalidValues) {
    EXPECT_TRUE(ParseEngineConfig("not json").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig("[]").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"null_policy": "drop"})").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"template_cache_capacity": 0})").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"template_cache_capacity": -5})").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"vectorized_subjects": "yes"})").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"search_directories": "data"})").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"output_format": "rdfxml"})").status().IsInvalid());
    EXPECT_TRUE(ParseEngineConfig(R"({"blank_node_prefix": ""})").status().IsInvalid());
}

TEST_F(EngineConfigTest, LoadFromFile) {
    auto config = LoadEngineConfig(std::string(STAR_ETL_TEST_DATA_DIR) + "/engine_config.json");
    ASSERT_TRUE(config.ok()) << config.status().ToString();
    EXPECT_EQ(config->null_policy, NullPolicy::Skip);
    EXPECT_EQ(config->blank_node_prefix, "ann");
    EXPECT_EQ(config->output_format, OutputFormat::TriG);

    EXPECT_TRUE(LoadEngineConfig("/nonexistent/config.json").status().IsIOError());
}

} // namespace star_etl
