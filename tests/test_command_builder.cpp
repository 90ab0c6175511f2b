#include <gtest/gtest.h>
#include <managers/command_builder.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class CommandBuilderTest : public ::testing::Test {
protected:
    fs::path test_dir;
    ProgramLocator found = [](const std::string&) { return true; };

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "marksync_builder_test";
        fs::create_directories(test_dir / "dir");
        std::ofstream(test_dir / "file.txt") << "x";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string dir() const { return (test_dir / "dir").string(); }
    std::string file() const { return (test_dir / "file.txt").string(); }

    static TransferConfig config(std::vector<std::string> base) {
        TransferConfig t;
        t.destination = "u@h:/dst/";
        t.base_flags = std::move(base);
        return t;
    }

    static long count(const std::vector<std::string>& argv, const std::string& word) {
        return std::count(argv.begin(), argv.end(), word);
    }
};

// ── Layout ───────────────────────────────────────────────────

TEST_F(CommandBuilderTest, DefaultLayout) {
    auto r = build_transfer_command({file()}, config({"-avhP", "--progress"}), found);
    ASSERT_TRUE(r.is_ok());
    std::vector<std::string> expected = {"rsync", "-avhP", "--progress", file(), "u@h:/dst/"};
    EXPECT_EQ(r.value.argv, expected);
}

TEST_F(CommandBuilderTest, PathsAreSorted) {
    auto r = build_transfer_command({"/z/b", "/a/c", "/m"}, config({"-a"}), found);
    ASSERT_TRUE(r.is_ok());
    std::vector<std::string> expected = {"rsync", "-a", "/a/c", "/m", "/z/b", "u@h:/dst/"};
    EXPECT_EQ(r.value.argv, expected);
}

TEST_F(CommandBuilderTest, BaseFlagsNormalized) {
    auto r = build_transfer_command({file()}, config({"v", " ", "", "-h"}), found);
    ASSERT_TRUE(r.is_ok());
    std::vector<std::string> expected = {"rsync", "-v", "-h", file(), "u@h:/dst/"};
    EXPECT_EQ(r.value.argv, expected);
}

TEST_F(CommandBuilderTest, RelativeAndExtraFlagsOrder) {
    auto t = config({"-a"});
    t.preserve_relative_paths = true;
    t.extra_flags = {"--delete", "", "--dry-run"};

    auto r = build_transfer_command({file()}, t, found);
    ASSERT_TRUE(r.is_ok());
    std::vector<std::string> expected = {
        "rsync", "-a", "--relative", "--delete", "--dry-run", file(), "u@h:/dst/"};
    EXPECT_EQ(r.value.argv, expected);
}

TEST_F(CommandBuilderTest, TransportArgsBecomeRemoteShell) {
    auto t = config({"-a"});
    t.transport_args = {"-p", "2222", "-i", "/keys/my key"};

    auto r = build_transfer_command({file()}, t, found);
    ASSERT_TRUE(r.is_ok());
    const auto& argv = r.value.argv;
    auto e = std::find(argv.begin(), argv.end(), "-e");
    ASSERT_NE(e, argv.end());
    ASSERT_NE(e + 1, argv.end());
    EXPECT_EQ(*(e + 1), "ssh -p 2222 -i '/keys/my key'");
}

TEST_F(CommandBuilderTest, MissingToolIsReported) {
    ProgramLocator missing = [](const std::string&) { return false; };
    auto r = build_transfer_command({file()}, config({"-a"}), missing);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ToolNotFound);
}

// ── Recursion inference ──────────────────────────────────────

TEST_F(CommandBuilderTest, DirectoryWithoutArchiveGetsRecursive) {
    auto r = build_transfer_command({dir()}, config({"-vh"}), found);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(count(r.value.argv, "-r"), 1);
}

TEST_F(CommandBuilderTest, DirectoryWithArchiveClusterNoExtraRecursive) {
    auto r = build_transfer_command({dir()}, config({"-avhP"}), found);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(count(r.value.argv, "-r"), 0);
}

TEST_F(CommandBuilderTest, RecursiveInExtraFlagsCounts) {
    auto t = config({"-v"});
    t.extra_flags = {"--recursive"};
    auto r = build_transfer_command({dir()}, t, found);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(count(r.value.argv, "-r"), 0);
}

TEST_F(CommandBuilderTest, FilesOnlyNoRecursive) {
    auto r = build_transfer_command({file()}, config({"-v"}), found);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(count(r.value.argv, "-r"), 0);
}

TEST(FlagClassification, ShortAndLongForms) {
    EXPECT_TRUE(is_archive_flag("-a"));
    EXPECT_TRUE(is_archive_flag("-avhP"));
    EXPECT_TRUE(is_archive_flag("--archive"));
    EXPECT_FALSE(is_archive_flag("--partial"));
    EXPECT_TRUE(is_recursive_flag("-r"));
    EXPECT_TRUE(is_recursive_flag("-vr"));
    EXPECT_TRUE(is_recursive_flag("--recursive"));
    EXPECT_FALSE(is_recursive_flag("--progress"));
}

// ── Rendering ────────────────────────────────────────────────

TEST(ShellQuote, SafeWordsAreBare) {
    EXPECT_EQ(shell_quote("u@h:/dst/a-b_c.txt"), "u@h:/dst/a-b_c.txt");
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\"'\"'s'");
}

TEST(RenderRoundTrip, ShellSplitsBackToArgv) {
    TransferCommand cmd;
    cmd.argv = {"printf", "%s\\n", "My Report (final).pdf", "it's", "$HOME", "a\"b", "", "semi;colon"};

    FILE* pipe = popen(cmd.render().c_str(), "r");
    ASSERT_NE(pipe, nullptr);
    std::string out;
    char buf[256];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);
    ASSERT_EQ(pclose(pipe), 0);

    std::string expected;
    for (size_t i = 2; i < cmd.argv.size(); ++i) expected += cmd.argv[i] + "\n";
    EXPECT_EQ(out, expected);
}
