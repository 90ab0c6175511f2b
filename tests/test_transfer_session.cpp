#include <gtest/gtest.h>
#include <managers/transfer_session.hpp>
#include <core/event_queue.hpp>
#include <stdexcept>
#include "fakes.hpp"

class TransferSessionTest : public ::testing::Test {
protected:
    FakeLauncher launcher;
    EventQueue events;
    RecordingNotifier notifier;
    TransferCommand command;

    void SetUp() override {
        command.argv = {"rsync", "-a", "/src/a", "u@h:/dst/"};
    }

    std::shared_ptr<TransferSession> make() {
        return std::make_shared<TransferSession>(launcher, events, notifier);
    }
};

TEST_F(TransferSessionTest, RunLaunchesArgv) {
    auto session = make();
    EXPECT_EQ(session->run(command), SessionState::Running);
    ASSERT_EQ(launcher.launches.size(), 1u);
    EXPECT_EQ(launcher.launches[0], command.argv);
    EXPECT_FALSE(session->finished());
}

TEST_F(TransferSessionTest, SuccessRunsCallbackOnceAfterNotification) {
    auto session = make();
    int calls = 0;
    size_t messages_at_callback = 0;
    session->run(command, [&] {
        ++calls;
        messages_at_callback = notifier.messages.size();
    });

    launcher.exit_with(0);
    // Nothing happens until the queue is drained
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(session->state(), SessionState::Running);

    events.drain();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(session->state(), SessionState::Succeeded);
    EXPECT_EQ(session->exit_code(), 0);
    ASSERT_GE(messages_at_callback, 1u);
    EXPECT_EQ(notifier.messages[0].first, "rsync completed successfully");

    // A second exit report is ignored
    launcher.on_exit(0);
    events.drain();
    EXPECT_EQ(calls, 1);
}

TEST_F(TransferSessionTest, FailureSkipsCallback) {
    auto session = make();
    bool called = false;
    session->run(command, [&] { called = true; });

    launcher.exit_with(23);
    events.drain();

    EXPECT_FALSE(called);
    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_EQ(session->exit_code(), 23);
    EXPECT_EQ(notifier.last(), "rsync exited with code 23");
    EXPECT_EQ(notifier.last_severity(), Severity::Error);
    auto tail = session->transcript().tail(1);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0], "[ERROR] rsync exited with code 23");
}

TEST_F(TransferSessionTest, LaunchFailureIsFailedWithoutCallback) {
    launcher.fail_launch = true;
    auto session = make();
    bool called = false;

    EXPECT_EQ(session->run(command, [&] { called = true; }), SessionState::Failed);
    EXPECT_TRUE(session->finished());
    EXPECT_EQ(session->exit_code(), -1);
    EXPECT_EQ(notifier.last_severity(), Severity::Error);
    events.drain();
    EXPECT_FALSE(called);
}

TEST_F(TransferSessionTest, OutputReachesTranscriptAndSink) {
    auto session = make();
    std::string sunk;
    session->set_output_sink([&](const std::string& chunk) { sunk += chunk; });
    session->run(command);

    launcher.emit("sending incremental file list\r\n");
    launcher.emit("a\r\n");
    launcher.exit_with(0);
    events.drain();

    EXPECT_EQ(sunk, "sending incremental file list\r\na\r\n");
    auto lines = session->transcript().tail(3);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "sending incremental file list");
    EXPECT_EQ(lines[1], "a");
    EXPECT_EQ(lines[2], "[DONE] rsync completed successfully");
}

TEST_F(TransferSessionTest, ThrowingCallbackIsReported) {
    auto session = make();
    session->run(command, [] { throw std::runtime_error("disk gone"); });

    launcher.exit_with(0);
    EXPECT_NO_THROW(events.drain());
    EXPECT_EQ(session->state(), SessionState::Succeeded);
    EXPECT_TRUE(notifier.saw("Post-transfer step failed: disk gone"));
}

TEST_F(TransferSessionTest, NonStandardThrowIsReported) {
    auto session = make();
    session->run(command, [] { throw 42; });

    launcher.exit_with(0);
    EXPECT_NO_THROW(events.drain());
    EXPECT_EQ(session->state(), SessionState::Succeeded);
    EXPECT_EQ(notifier.last(), "Post-transfer step failed: unknown error");
    EXPECT_EQ(notifier.last_severity(), Severity::Error);
}

TEST_F(TransferSessionTest, PendingCallbacksKeepSessionAlive) {
    bool called = false;
    {
        auto session = make();
        session->run(command, [&] { called = true; });
    }
    launcher.exit_with(0);
    events.drain();
    EXPECT_TRUE(called);
}
