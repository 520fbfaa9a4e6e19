#include <gtest/gtest.h>
#include "splatlink/core/config.hpp"
#include "splatlink/transfer/pipeline_config.hpp"
#include <fstream>
#include <filesystem>

using namespace splatlink::core;
using splatlink::transfer::PipelineConfig;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_splatlink_config.txt";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("server.url", "http://10.0.0.5:9000");

    auto value = config.get("server.url");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "http://10.0.0.5:9000");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "yes");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int.bad", "42abc");
    config.set("string.value", "assets/generated.ply");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_int("int.bad", 7), 7);
    EXPECT_EQ(config.get_string("string.value"), "assets/generated.ply");
    EXPECT_FALSE(config.get_as<long>("int.bad").has_value());
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, SetDefaults) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_string("server.url"), "http://127.0.0.1:8000");
    EXPECT_EQ(config.get_int("upload.timeout_ms"), 120000);
    EXPECT_EQ(config.get_int("download.metadata_timeout_ms"), 10000);
    EXPECT_EQ(config.get_int("download.chunk_timeout_ms"), 30000);
    EXPECT_EQ(config.get_int("download.max_parallel_chunks"), 0);
    EXPECT_EQ(config.get_string("artifact.path"), "assets/generated.ply");
    EXPECT_EQ(config.get_int("cache.max_age_seconds"), 86400);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "server.url=http://gpu-box:8000\n";
    file << "artifact.path = out/model.ply \n";
    file << "not a setting\n";
    file << "download.max_parallel_chunks=8\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("server.url"), "http://gpu-box:8000");
    EXPECT_EQ(config.get_string("artifact.path"), "out/model.ply");
    EXPECT_EQ(config.get_int("download.max_parallel_chunks"), 8);
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, PipelineConfigFromDefaults) {
    Config config;
    config.set_defaults();

    auto pipeline = PipelineConfig::from_config(config);

    EXPECT_EQ(pipeline.server_url, "http://127.0.0.1:8000");
    EXPECT_EQ(pipeline.upload_timeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(pipeline.download.metadata_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(pipeline.download.chunk_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(pipeline.download.max_parallel_chunks, 0u);
    EXPECT_EQ(pipeline.artifact_path, std::filesystem::path("assets/generated.ply"));
    EXPECT_EQ(pipeline.cache_max_age, std::chrono::seconds(86400));
    EXPECT_TRUE(pipeline.validate().success());
}

TEST_F(ConfigTest, PipelineConfigOverrides) {
    Config config;
    config.set_defaults();
    config.set("download.chunk_timeout_ms", "500");
    config.set("download.max_parallel_chunks", "4");
    config.set("cache.max_age_seconds", "60");

    auto pipeline = PipelineConfig::from_config(config);

    EXPECT_EQ(pipeline.download.chunk_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(pipeline.download.max_parallel_chunks, 4u);
    EXPECT_EQ(pipeline.cache_max_age, std::chrono::seconds(60));
}

TEST_F(ConfigTest, PipelineConfigValidation) {
    PipelineConfig pipeline;
    EXPECT_TRUE(pipeline.validate().success());

    pipeline.server_url = "https://example.com";
    EXPECT_EQ(pipeline.validate().error, ErrorCode::INVALID_ARGUMENT);

    pipeline = PipelineConfig();
    pipeline.download.chunk_timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(pipeline.validate());

    pipeline = PipelineConfig();
    pipeline.artifact_path = "assets/";
    EXPECT_FALSE(pipeline.validate());

    pipeline = PipelineConfig();
    pipeline.cache_max_age = std::chrono::seconds(0);
    EXPECT_FALSE(pipeline.validate());
}
