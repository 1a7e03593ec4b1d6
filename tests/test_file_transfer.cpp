#include <gtest/gtest.h>
#include "file_transfer.h"

using namespace remotefm;

TEST(FileTransferProgressTest, RoundsToTwoDecimals) {
    EXPECT_DOUBLE_EQ(calculate_progress(100000, 300000), 33.33);
    EXPECT_DOUBLE_EQ(calculate_progress(200000, 300000), 66.67);
    EXPECT_DOUBLE_EQ(calculate_progress(300000, 300000), 100.0);
    EXPECT_DOUBLE_EQ(calculate_progress(1, 8), 12.5);
    EXPECT_DOUBLE_EQ(calculate_progress(0, 10), 0.0);
}

TEST(FileTransferProgressTest, ZeroSizeCountsAsComplete) {
    EXPECT_DOUBLE_EQ(calculate_progress(0, 0), 100.0);

    FileTransfer transfer;
    transfer.size = 0;
    EXPECT_DOUBLE_EQ(transfer.get_progress_percentage(), 100.0);
}

TEST(FileTransferProgressTest, FormatsWithoutTrailingZeros) {
    EXPECT_EQ(format_progress(33.33), "33.33");
    EXPECT_EQ(format_progress(66.67), "66.67");
    EXPECT_EQ(format_progress(12.5), "12.5");
    EXPECT_EQ(format_progress(100.0), "100");
    EXPECT_EQ(format_progress(0.0), "0");
    EXPECT_EQ(format_progress(10.0), "10");
}

TEST(FileTransferProgressTest, StatusStrings) {
    EXPECT_EQ(make_progress_status(TransferType::UPLOAD, 33.33), "Uploading...(33.33%)");
    EXPECT_EQ(make_progress_status(TransferType::DOWNLOAD, 100.0), "Downloading...(100%)");

    EXPECT_STREQ(STATUS_PENDING, "Pending...");
    EXPECT_STREQ(STATUS_COMPLETED, "Completed");
    EXPECT_STREQ(STATUS_CANCELED, "Canceled");
    EXPECT_STREQ(STATUS_ERROR_READING, "Error reading file");
    EXPECT_STREQ(STATUS_ERROR_WRITING, "Error writing file");
}

TEST(FileTransferTest, SnapshotIsDeepAndDropsFileHandle) {
    FileTransfer transfer;
    transfer.id = 42;
    transfer.type = TransferType::UPLOAD;
    transfer.local_path = "local.bin";
    transfer.remote_path = "/remote/local.bin";
    transfer.status = STATUS_PENDING;
    transfer.size = 10;
    transfer.file_split = std::make_shared<FileSplit>("local.bin", FileAccess::READ);

    FileTransfer snapshot = transfer.snapshot();
    transfer.transferred_size = 5;
    transfer.status = "changed";

    EXPECT_EQ(snapshot.id, 42);
    EXPECT_EQ(snapshot.type, TransferType::UPLOAD);
    EXPECT_EQ(snapshot.local_path, "local.bin");
    EXPECT_EQ(snapshot.remote_path, "/remote/local.bin");
    EXPECT_EQ(snapshot.status, "Pending...");
    EXPECT_EQ(snapshot.transferred_size, 0u);
    EXPECT_EQ(snapshot.size, 10u);
    EXPECT_EQ(snapshot.file_split, nullptr);
}

TEST(FileTransferTest, EnumStrings) {
    EXPECT_STREQ(transfer_type_to_string(TransferType::UPLOAD), "upload");
    EXPECT_STREQ(transfer_type_to_string(TransferType::DOWNLOAD), "download");
    EXPECT_STREQ(transfer_state_to_string(TransferState::IN_PROGRESS), "in_progress");

    EXPECT_FALSE(is_terminal_state(TransferState::PENDING));
    EXPECT_FALSE(is_terminal_state(TransferState::IN_PROGRESS));
    EXPECT_TRUE(is_terminal_state(TransferState::COMPLETED));
    EXPECT_TRUE(is_terminal_state(TransferState::CANCELED));
    EXPECT_TRUE(is_terminal_state(TransferState::ERRORED));
}
