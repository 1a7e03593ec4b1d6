#include <gtest/gtest.h>
#include "task_manager_handler.h"
#include "fake_peer_connection.h"

using namespace remotefm;
using remotefm::testing_support::RecordingPeerConnection;

TEST(TaskManagerHandlerTest, StartProcessSendsRequest) {
    RecordingPeerConnection peer;
    TaskManagerHandler handler(peer);

    EXPECT_TRUE(handler.start_process("C:\\tools\\run.exe"));
    auto sent = peer.messages_of_type(message_types::DO_PROCESS_START);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].payload["file_path"], "C:\\tools\\run.exe");
}

TEST(TaskManagerHandlerTest, EmptyPathOrFailedSendIsReported) {
    RecordingPeerConnection peer;
    TaskManagerHandler handler(peer);

    EXPECT_FALSE(handler.start_process(""));
    EXPECT_EQ(peer.messages().size(), 0u);

    peer.set_fail_sends(true);
    EXPECT_FALSE(handler.start_process("/bin/true"));
}

TEST(TaskManagerHandlerTest, ResponsesReachTheCallbackWhileRegistered) {
    RecordingPeerConnection peer;
    MessageRouter router;
    TaskManagerHandler handler(peer);

    int calls = 0;
    ProcessAction last_action = ProcessAction::END;
    bool last_result = false;
    handler.set_process_action_callback([&](ProcessAction action, bool result) {
        ++calls;
        last_action = action;
        last_result = result;
    });

    handler.register_handlers(router);
    EXPECT_TRUE(router.dispatch(message_types::DO_PROCESS_RESPONSE, {{"action", "start"}, {"result", true}}));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last_action, ProcessAction::START);
    EXPECT_TRUE(last_result);

    // Malformed responses are dropped by the router
    router.dispatch(message_types::DO_PROCESS_RESPONSE, {{"action", "start"}});
    EXPECT_EQ(calls, 1);

    handler.unregister_handlers(router);
    EXPECT_FALSE(router.dispatch(message_types::DO_PROCESS_RESPONSE, {{"action", "end"}, {"result", false}}));
    EXPECT_EQ(calls, 1);
}
