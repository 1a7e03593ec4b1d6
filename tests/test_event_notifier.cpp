#include <gtest/gtest.h>
#include "event_notifier.h"
#include "execution_context.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace remotefm;

TEST(ExecutionContextTest, ManualContextRunsInPostingOrder) {
    ManualExecutionContext context;
    std::vector<int> order;

    context.post([&]() { order.push_back(1); });
    context.post([&]() {
        order.push_back(2);
        context.post([&]() { order.push_back(4); });
    });
    context.post([&]() { order.push_back(3); });

    EXPECT_EQ(context.pending_count(), 3u);
    EXPECT_EQ(context.run_pending(), 4u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(context.pending_count(), 0u);
}

TEST(ExecutionContextTest, ThrowingTaskDoesNotStopTheQueue) {
    ManualExecutionContext context;
    bool ran = false;
    context.post([]() { throw std::runtime_error("handler failure"); });
    context.post([&]() { ran = true; });

    EXPECT_EQ(context.run_pending(), 2u);
    EXPECT_TRUE(ran);
}

TEST(ExecutionContextTest, SerialContextRunsOnOneBackgroundThread) {
    std::vector<int> order;
    std::vector<std::thread::id> threads;
    {
        SerialExecutionContext context;
        for (int i = 0; i < 50; ++i) {
            context.post([&order, &threads, i]() {
                order.push_back(i);
                threads.push_back(std::this_thread::get_id());
            });
        }
        // Destruction drains the queue before joining
    }

    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[i], i);
    }
    for (const auto& id : threads) {
        EXPECT_EQ(id, threads.front());
        EXPECT_NE(id, std::this_thread::get_id());
    }
}

TEST(ExecutionContextTest, SerialContextDropsTasksAfterStop) {
    SerialExecutionContext context;
    context.stop();

    std::atomic<bool> ran(false);
    context.post([&]() { ran = true; });
    context.stop();
    EXPECT_FALSE(ran.load());
}

class EventNotifierTest : public ::testing::Test {
protected:
    ManualExecutionContext context_;
};

TEST_F(EventNotifierTest, EventsWaitForTheContext) {
    EventNotifier notifier(context_);
    std::string report;
    notifier.set_report_callback([&](const std::string& message) { report = message; });

    notifier.notify_report("Rename failed");
    EXPECT_EQ(report, "") << "Handlers must not run on the notifying thread";

    context_.run_pending();
    EXPECT_EQ(report, "Rename failed");
}

TEST_F(EventNotifierTest, TransferSnapshotIsTakenAtNotifyTime) {
    EventNotifier notifier(context_);
    std::vector<FileTransfer> seen;
    notifier.set_transfer_updated_callback([&](const FileTransfer& transfer) { seen.push_back(transfer); });

    FileTransfer transfer;
    transfer.id = 3;
    transfer.status = "Uploading...(50%)";
    transfer.transferred_size = 50;
    notifier.notify_transfer_updated(transfer);

    transfer.status = "Completed";
    transfer.transferred_size = 100;
    notifier.notify_transfer_updated(transfer);

    context_.run_pending();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].status, "Uploading...(50%)");
    EXPECT_EQ(seen[0].transferred_size, 50u);
    EXPECT_EQ(seen[1].status, "Completed");
}

TEST_F(EventNotifierTest, HandlerIsResolvedWhenTheEventRuns) {
    EventNotifier notifier(context_);
    int first = 0;
    int second = 0;
    notifier.set_drives_changed_callback([&](const std::vector<Drive>&) { ++first; });

    notifier.notify_drives_changed({Drive{"System", "C:\\"}});
    notifier.set_drives_changed_callback([&](const std::vector<Drive>& drives) {
        ++second;
        EXPECT_EQ(drives.size(), 1u);
    });
    context_.run_pending();

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST_F(EventNotifierTest, ClearedHandlersAndMissingHandlersAreSkipped) {
    int calls = 0;
    {
        EventNotifier notifier(context_);
        notifier.set_directory_changed_callback(
            [&](const std::string&, const std::vector<FileSystemEntry>&) { ++calls; });
        notifier.notify_directory_changed("/", {});
        notifier.clear_callbacks();
        notifier.notify_report("nobody listens");
        // Notifier goes away before delivery
    }

    EXPECT_EQ(context_.run_pending(), 2u);
    EXPECT_EQ(calls, 0);
}

TEST_F(EventNotifierTest, DirectoryEventCarriesPathAndEntries) {
    EventNotifier notifier(context_);
    std::string path;
    size_t count = 0;
    notifier.set_directory_changed_callback(
        [&](const std::string& remote_path, const std::vector<FileSystemEntry>& entries) {
            path = remote_path;
            count = entries.size();
        });

    std::vector<FileSystemEntry> entries(2);
    entries[0].name = "a";
    entries[1].name = "b";
    notifier.notify_directory_changed("/home", entries);
    context_.run_pending();

    EXPECT_EQ(path, "/home");
    EXPECT_EQ(count, 2u);
}
