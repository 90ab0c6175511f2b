#include <gtest/gtest.h>
#include <managers/session_transcript.hpp>

TEST(SessionTranscript, PlainLines) {
    SessionTranscript t(1024);
    t.append("one\ntwo\n");
    EXPECT_EQ(t.text(), "one\ntwo\n");
    EXPECT_EQ(t.tail(5), (std::vector<std::string>{"one", "two"}));
}

TEST(SessionTranscript, CrLfIsANewline) {
    SessionTranscript t(1024);
    t.append("a\r\nb\r\n");
    EXPECT_EQ(t.text(), "a\nb\n");
}

TEST(SessionTranscript, ProgressRedrawKeepsLastFrame) {
    SessionTranscript t(1024);
    t.append("file.bin\n");
    t.append("  10%\r");
    t.append("  55%\r");
    t.append(" 100%\r\n");
    EXPECT_EQ(t.tail(2), (std::vector<std::string>{"file.bin", " 100%"}));
}

TEST(SessionTranscript, EscapeSequencesDropped) {
    SessionTranscript t(1024);
    t.append("\033[1mbold\033[0m plain\n");
    EXPECT_EQ(t.text(), "bold plain\n");
}

TEST(SessionTranscript, EscapeSplitAcrossChunks) {
    SessionTranscript t(1024);
    t.append("x\033[3");
    t.append("2mgreen\033");
    t.append("[0m\n");
    EXPECT_EQ(t.text(), "xgreen\n");
}

TEST(SessionTranscript, Backspace) {
    SessionTranscript t(1024);
    t.append("abc\b\bZ\n");
    EXPECT_EQ(t.text(), "aZ\n");
}

TEST(SessionTranscript, StatusLineStartsOnItsOwnLine) {
    SessionTranscript t(1024);
    t.append("partial");
    t.append_line("[DONE] ok");
    EXPECT_EQ(t.tail(2), (std::vector<std::string>{"partial", "[DONE] ok"}));
}

TEST(SessionTranscript, CapDropsOldestWholeLines) {
    SessionTranscript t(16);
    t.append("first line\nsecond\nthird\n");
    EXPECT_LE(t.text().size(), 16u);
    EXPECT_EQ(t.text(), "second\nthird\n");
}
