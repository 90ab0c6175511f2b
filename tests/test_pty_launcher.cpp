#include <gtest/gtest.h>
#include <managers/pty_launcher.hpp>
#include <managers/transfer_session.hpp>
#include <core/event_queue.hpp>
#include <platform/terminal.hpp>
#include <chrono>
#include "fakes.hpp"

class PtyLauncherTest : public ::testing::Test {
protected:
    PtyLauncher launcher;
    EventQueue events;
    RecordingNotifier notifier;

    // Drain the queue until the session ends or the deadline passes.
    bool run_to_end(const std::shared_ptr<TransferSession>& session, int timeout_ms = 10000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (!session->finished()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            platform::poll_two(events.wait_fd(), -1, 100);
            events.drain();
        }
        return true;
    }

    std::shared_ptr<TransferSession> start(const std::vector<std::string>& argv) {
        auto session = std::make_shared<TransferSession>(launcher, events, notifier);
        TransferCommand command;
        command.argv = argv;
        EXPECT_EQ(session->run(command), SessionState::Running);
        return session;
    }
};

TEST_F(PtyLauncherTest, FindsShell) {
    EXPECT_TRUE(launcher.program_available("sh"));
    EXPECT_FALSE(launcher.program_available("marksync-no-such-program"));
}

TEST_F(PtyLauncherTest, OutputArrivesBeforeExitCode) {
    auto session = start({"sh", "-c", "echo hi; exit 23"});
    ASSERT_TRUE(run_to_end(session));

    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_EQ(session->exit_code(), 23);
    auto tail = session->transcript().tail(2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0], "hi");
    EXPECT_EQ(tail[1], "[ERROR] rsync exited with code 23");
}

TEST_F(PtyLauncherTest, BackToBackLaunchesReuseLauncher) {
    for (int i = 0; i < 3; ++i) {
        auto session = start({"true"});
        ASSERT_TRUE(run_to_end(session));
        EXPECT_EQ(session->state(), SessionState::Succeeded);
        EXPECT_EQ(session->exit_code(), 0);
    }
}

TEST_F(PtyLauncherTest, SecondLaunchWhileRunningIsBusy) {
    auto session = start({"sh", "-c", "read line; exit 0"});

    auto second = launcher.launch({"true"}, nullptr, nullptr);
    EXPECT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::Busy);

    // Answer the read so the first run can end
    EXPECT_TRUE(launcher.send_input("go\n"));
    ASSERT_TRUE(run_to_end(session));
    EXPECT_EQ(session->state(), SessionState::Succeeded);
}

TEST_F(PtyLauncherTest, MissingProgramFailsWithExitCode) {
    auto session = start({"marksync-no-such-program"});
    ASSERT_TRUE(run_to_end(session));
    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_EQ(session->exit_code(), 127);
}
