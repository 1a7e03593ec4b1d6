#include <gtest/gtest.h>
#include "message_router.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace remotefm;

TEST(MessageRouterTest, DispatchesToRegisteredHandler) {
    MessageRouter router;
    int calls = 0;
    std::string seen;

    router.on("ping", [&](const nlohmann::json& payload) {
        ++calls;
        seen = payload.value("text", "");
    });

    EXPECT_TRUE(router.has_handler("ping"));
    EXPECT_TRUE(router.dispatch("ping", {{"text", "hello"}}));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, "hello");

    EXPECT_FALSE(router.dispatch("pong", nlohmann::json::object())) << "Unknown types are not handled";
}

TEST(MessageRouterTest, OnReplacesAndOffRemoves) {
    MessageRouter router;
    int first = 0;
    int second = 0;

    router.on("ping", [&](const nlohmann::json&) { ++first; });
    router.on("ping", [&](const nlohmann::json&) { ++second; });
    router.dispatch("ping", nullptr);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);

    EXPECT_TRUE(router.off("ping"));
    EXPECT_FALSE(router.off("ping"));
    EXPECT_FALSE(router.dispatch("ping", nullptr));
}

TEST(MessageRouterTest, HandlerExceptionsAreContained) {
    MessageRouter router;
    router.on("bad", [](const nlohmann::json& payload) {
        payload.at("missing").get<int>();
    });
    router.on("boom", [](const nlohmann::json&) {
        throw std::runtime_error("boom");
    });

    EXPECT_NO_THROW(router.dispatch("bad", nlohmann::json::object()));
    EXPECT_NO_THROW(router.dispatch("boom", nullptr));
}

TEST(MessageRouterTest, HandlerMayUnregisterItself) {
    MessageRouter router;
    int calls = 0;
    router.on("once", [&](const nlohmann::json&) {
        ++calls;
        router.off("once");
    });

    router.dispatch("once", nullptr);
    router.dispatch("once", nullptr);
    EXPECT_EQ(calls, 1);
}

TEST(MessageRouterTest, OffWaitsForHandlerRunningOnAnotherThread) {
    MessageRouter router;
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    std::atomic<bool> handler_done{false};

    router.on("slow", [&](const nlohmann::json&) {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
        handler_done = true;
    });

    std::thread receiver([&router]() { router.dispatch("slow", nullptr); });
    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] { return entered; }));
    }

    std::atomic<bool> off_returned{false};
    std::thread remover([&]() {
        EXPECT_TRUE(router.off("slow"));
        off_returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(off_returned.load());
    EXPECT_FALSE(router.has_handler("slow")) << "New messages no longer reach the handler";

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    receiver.join();
    remover.join();

    EXPECT_TRUE(handler_done.load());
    EXPECT_TRUE(off_returned.load());
}
