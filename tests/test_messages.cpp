#include <gtest/gtest.h>
#include "messages.h"
#include <stdexcept>

using namespace remotefm;
using nlohmann::json;

TEST(MessagesTest, ChunkTravelsAsBinary) {
    FileTransferChunkMessage message;
    message.id = 5;
    message.chunk.offset = 64;
    message.chunk.data = {0x00, 0xFF, 0x10};
    message.file_path = "/remote/a.bin";
    message.file_size = 67;

    json j = message;
    EXPECT_EQ(j["id"], 5);
    EXPECT_TRUE(j["chunk"]["data"].is_binary());
    EXPECT_EQ(j["file_path"], "/remote/a.bin");

    // Binary survives a CBOR encode, the way a binary-capable transport carries it
    auto decoded = json::from_cbor(json::to_cbor(j)).get<FileTransferChunkMessage>();
    EXPECT_EQ(decoded.chunk.data, message.chunk.data);
    EXPECT_EQ(decoded.chunk.offset, 64u);
    EXPECT_EQ(decoded.file_size, 67u);
}

TEST(MessagesTest, ChunkAcceptsPlainByteArray) {
    json j = {
        {"id", 3},
        {"chunk", {{"offset", 0}, {"data", {1, 2, 3}}}},
        {"file_size", 3}
    };

    auto message = j.get<FileTransferChunkMessage>();
    EXPECT_EQ(message.chunk.data, (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(message.file_path, "");
}

TEST(MessagesTest, MalformedChunkThrows) {
    json missing_id = {{"chunk", {{"data", json::array()}}}, {"file_size", 0}};
    EXPECT_THROW(missing_id.get<FileTransferChunkMessage>(), json::exception);

    json bad_data = {{"id", 1}, {"chunk", {{"data", "text"}}}, {"file_size", 0}};
    EXPECT_THROW(bad_data.get<FileTransferChunkMessage>(), std::invalid_argument);
}

TEST(MessagesTest, CancelReasonIsOptional) {
    FileTransferCancel request;
    request.id = 9;
    json j = request;
    EXPECT_FALSE(j.contains("reason"));

    auto notice = json{{"id", 9}, {"reason", "Canceled by peer"}}.get<FileTransferCancel>();
    EXPECT_EQ(notice.reason, "Canceled by peer");

    auto bare = json{{"id", 9}}.get<FileTransferCancel>();
    EXPECT_EQ(bare.id, 9);
    EXPECT_EQ(bare.reason, "");
}

TEST(MessagesTest, DirectoryResponseWithoutItemsIsEmpty) {
    auto missing = json{{"remote_path", "C:\\"}}.get<GetDirectoryResponse>();
    EXPECT_EQ(missing.remote_path, "C:\\");
    EXPECT_TRUE(missing.items.empty());

    auto null_items = json{{"remote_path", "/"}, {"items", nullptr}}.get<GetDirectoryResponse>();
    EXPECT_TRUE(null_items.items.empty());
}

TEST(MessagesTest, DirectoryEntries) {
    json j = {
        {"remote_path", "/home"},
        {"items", {
            {{"name", ".."}, {"entry_type", "back"}},
            {{"name", "docs"}, {"entry_type", "directory"}, {"last_access_time_utc", 1700000000}},
            {{"name", "a.txt"}, {"entry_type", "file"}, {"size", 12}, {"content_type", "text/plain"}}
        }}
    };

    auto response = j.get<GetDirectoryResponse>();
    ASSERT_EQ(response.items.size(), 3u);
    EXPECT_EQ(response.items[0].entry_type, FileType::BACK);
    EXPECT_EQ(response.items[1].entry_type, FileType::DIRECTORY);
    ASSERT_TRUE(response.items[1].last_access_time_utc.has_value());
    EXPECT_EQ(*response.items[1].last_access_time_utc, 1700000000);
    EXPECT_FALSE(response.items[1].content_type.has_value());
    EXPECT_EQ(response.items[2].size, 12u);
    EXPECT_EQ(response.items[2].content_type.value_or(""), "text/plain");

    json unknown_type = {{"remote_path", "/"}, {"items", {{{"name", "x"}, {"entry_type", "socket"}}}}};
    EXPECT_THROW(unknown_type.get<GetDirectoryResponse>(), std::invalid_argument);
}

TEST(MessagesTest, DrivesResponse) {
    json j = {{"drives", {{{"display_name", "System"}, {"root_directory", "C:\\"}}}}};
    auto response = j.get<GetDrivesResponse>();
    ASSERT_EQ(response.drives.size(), 1u);
    EXPECT_EQ(response.drives[0].display_name, "System");
    EXPECT_EQ(response.drives[0].root_directory, "C:\\");

    EXPECT_TRUE(json::object().get<GetDrivesResponse>().drives.empty());
}

TEST(MessagesTest, PathCommands) {
    DoPathRename rename;
    rename.path = "/a";
    rename.new_path = "/b";
    rename.path_type = FileType::DIRECTORY;
    json j = rename;
    EXPECT_EQ(j["path_type"], "directory");
    EXPECT_EQ(j.get<DoPathRename>().new_path, "/b");

    DoPathDelete del;
    del.path = "/a";
    json d = del;
    EXPECT_EQ(d["path_type"], "file");

    EXPECT_TRUE(json(GetDrives()).is_object());
    EXPECT_STREQ(GetDrives::TYPE, "get_drives");
}

TEST(MessagesTest, ProcessResponse) {
    auto response = json{{"action", "start"}, {"result", true}}.get<DoProcessResponse>();
    EXPECT_EQ(response.action, ProcessAction::START);
    EXPECT_TRUE(response.result);

    EXPECT_THROW((json{{"action", "restart"}, {"result", true}}.get<DoProcessResponse>()),
                 std::invalid_argument);
}

TEST(MessagesTest, EnumStrings) {
    FileType type;
    EXPECT_TRUE(file_type_from_string("drive", type));
    EXPECT_EQ(type, FileType::DRIVE);
    EXPECT_FALSE(file_type_from_string("Drive", type));
    EXPECT_STREQ(file_type_to_string(FileType::BACK), "back");

    ProcessAction action;
    EXPECT_TRUE(process_action_from_string("end", action));
    EXPECT_EQ(action, ProcessAction::END);
}
