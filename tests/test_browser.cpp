#include <gtest/gtest.h>
#include <listing/browser.hpp>
#include <managers/mark_store.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class BrowserTest : public ::testing::Test {
protected:
    fs::path test_dir;
    Browser browser;
    MarkStore marks{browser};

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "marksync_browser_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "zdir");
        fs::create_directories(test_dir / "adir");
        write_file("b.txt");
        write_file("a.txt");
        browser.on_reload([this](ViewId view) { marks.on_view_reset(view); });
        browser.on_close([this](ViewId view) { marks.on_view_reset(view); });
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& name) {
        std::ofstream(test_dir / name) << "content\n";
    }

    ViewId open_test_dir() {
        auto r = browser.open(test_dir);
        EXPECT_TRUE(r.is_ok());
        return r.value;
    }
};

TEST_F(BrowserTest, ListingOrder) {
    ViewId id = open_test_dir();
    const View* v = browser.view(id);
    ASSERT_NE(v, nullptr);

    std::vector<std::string> expected = {"../", "./", "adir/", "zdir/", "a.txt", "b.txt"};
    EXPECT_EQ(v->lines, expected);
    EXPECT_EQ(v->cursor, 3);
    EXPECT_EQ(v->kind, ViewKind::Listing);
}

TEST_F(BrowserTest, CursorContextCarriesWholeEntry) {
    write_file("it's here.txt");
    open_test_dir();
    ASSERT_TRUE(browser.find_entry("it's here.txt").is_ok());

    auto ctx = browser.cursor_context();
    ASSERT_TRUE(ctx.has_value());
    EXPECT_TRUE(ctx->whole_entry);
    EXPECT_EQ(ctx->line_text, "it's here.txt");
    EXPECT_EQ(ctx->directory, test_dir.lexically_normal());
}

TEST_F(BrowserTest, TextViewHasNoCursorContext) {
    ASSERT_TRUE(browser.open(test_dir / "a.txt").is_ok());
    EXPECT_EQ(browser.active()->kind, ViewKind::Text);
    EXPECT_FALSE(browser.cursor_context().has_value());
    EXPECT_FALSE(browser.is_listing_view(browser.active()->id));
}

TEST_F(BrowserTest, AnnotationsLeaveLineTextAlone) {
    ViewId id = open_test_dir();
    auto before = browser.view(id)->lines;

    marks.toggle((test_dir / "a.txt").string(), id, 5);
    EXPECT_EQ(browser.view(id)->lines, before);
    EXPECT_EQ(browser.annotated_lines(id), std::set<int>{5});
}

TEST_F(BrowserTest, ReloadClearsIndexKeepsMarks) {
    ViewId id = open_test_dir();
    std::string a = (test_dir / "a.txt").string();
    marks.toggle(a, id, 5);

    write_file("0new.txt");
    ASSERT_TRUE(browser.reload().is_ok());

    EXPECT_TRUE(marks.contains(a));
    EXPECT_EQ(marks.annotation_count(id), 0u);
    EXPECT_TRUE(browser.annotated_lines(id).empty());
    EXPECT_EQ(browser.view(id)->lines[4], "0new.txt");
}

TEST_F(BrowserTest, ChangeDirectoryResetsView) {
    ViewId id = open_test_dir();
    std::string a = (test_dir / "a.txt").string();
    marks.toggle(a, id, 5);

    ASSERT_TRUE(browser.change_directory("adir/").is_ok());
    EXPECT_EQ(browser.view(id)->path, test_dir / "adir");
    EXPECT_EQ(marks.annotation_count(id), 0u);
    EXPECT_TRUE(marks.contains(a));

    EXPECT_TRUE(browser.change_directory("missing").is_err());
    EXPECT_EQ(browser.view(id)->path, test_dir / "adir");
}

TEST_F(BrowserTest, CloseDropsIndexAndActivatesAnother) {
    ViewId first = open_test_dir();
    ViewId second = open_test_dir();
    marks.toggle((test_dir / "a.txt").string(), second, 5);

    ASSERT_TRUE(browser.close(second).is_ok());
    EXPECT_EQ(marks.annotation_count(second), 0u);
    EXPECT_EQ(marks.size(), 1u);
    ASSERT_NE(browser.active(), nullptr);
    EXPECT_EQ(browser.active()->id, first);
    EXPECT_EQ(browser.listing_views(), std::vector<ViewId>{first});

    EXPECT_TRUE(browser.close(second).is_err());
}
