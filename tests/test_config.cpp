#include <gtest/gtest.h>
#include "config.h"
#include "fs.h"
#include <nlohmann/json.hpp>

using namespace remotefm;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        delete_file(config_path_);
    }

    void TearDown() override {
        delete_file(config_path_);
    }

    const std::string config_path_ = "test_filemanager_config.json";
};

TEST_F(ConfigTest, Defaults) {
    FileManagerConfig config;
    EXPECT_EQ(config.download_directory, "downloads");
    EXPECT_EQ(config.sub_directory, "");
    EXPECT_EQ(config.chunk_size, 65535u);
    EXPECT_EQ(config.max_concurrent_uploads, 2u);
    EXPECT_EQ(config.get_base_download_path(), "downloads");

    config.sub_directory = "client-7";
    EXPECT_EQ(config.get_base_download_path(), "downloads/client-7");
}

TEST_F(ConfigTest, SaveAndLoad) {
    FileManagerConfig config;
    config.download_directory = "incoming";
    config.chunk_size = 4096;
    ASSERT_TRUE(save_config_file(config_path_, config));

    FileManagerConfig loaded;
    ASSERT_TRUE(load_config_file(config_path_, loaded));
    EXPECT_EQ(loaded.download_directory, "incoming");
    EXPECT_EQ(loaded.chunk_size, 4096u);
    EXPECT_EQ(loaded.max_concurrent_uploads, 2u);
}

TEST_F(ConfigTest, AbsentKeysKeepCurrentValues) {
    ASSERT_TRUE(create_file(config_path_, std::string("{\"sub_directory\": \"peer-a\"}")));

    FileManagerConfig config;
    config.chunk_size = 1024;
    ASSERT_TRUE(load_config_file(config_path_, config));
    EXPECT_EQ(config.sub_directory, "peer-a");
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_EQ(config.download_directory, "downloads");
}

TEST_F(ConfigTest, RejectedFilesLeaveConfigUntouched) {
    FileManagerConfig config;
    config.download_directory = "keep";

    EXPECT_FALSE(load_config_file("no_such_config.json", config));

    ASSERT_TRUE(create_file(config_path_, std::string("{ not json")));
    EXPECT_FALSE(load_config_file(config_path_, config));

    ASSERT_TRUE(create_file(config_path_, std::string("[1, 2, 3]")));
    EXPECT_FALSE(load_config_file(config_path_, config));

    ASSERT_TRUE(create_file(config_path_, std::string("{\"download_directory\": \"x\", \"chunk_size\": 0}")));
    EXPECT_FALSE(load_config_file(config_path_, config));

    ASSERT_TRUE(create_file(config_path_, std::string("{\"chunk_size\": \"big\"}")));
    EXPECT_FALSE(load_config_file(config_path_, config));

    EXPECT_EQ(config.download_directory, "keep");
    EXPECT_EQ(config.chunk_size, 65535u);
}
