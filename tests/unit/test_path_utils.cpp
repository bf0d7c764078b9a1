#include <gtest/gtest.h>
#include "tools/path_utils.hpp"
#include <fstream>
#include <random>

using namespace termineer;

namespace {

class TempWorkspace {
public:
    TempWorkspace() {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("termineer_path_" + std::to_string(rd()));
        fs::create_directories(root_ / "work" / "src");
        fs::create_directories(root_ / "outside");
        root_ = fs::canonical(root_);
    }
    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    fs::path work() const { return root_ / "work"; }
    fs::path outside() const { return root_ / "outside"; }
    void write(const fs::path& p, const std::string& text) {
        std::ofstream f(p);
        f << text;
    }
private:
    fs::path root_;
};

TEST(PathUtilsTest, RelativePathResolvesInsideWorkdir) {
    TempWorkspace ws;
    ws.write(ws.work() / "src" / "a.txt", "x");
    EXPECT_EQ(validate_path(ws.work(), "src/a.txt"), ws.work() / "src" / "a.txt");
    EXPECT_EQ(validate_path(ws.work(), "src/new.txt"), ws.work() / "src" / "new.txt");
}

TEST(PathUtilsTest, DotDotEscapeIsDenied) {
    TempWorkspace ws;
    try {
        validate_path(ws.work(), "../outside/secret.txt");
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_TRUE(e.denied());
    }
}

TEST(PathUtilsTest, AbsolutePathOutsideIsDenied) {
    TempWorkspace ws;
    ws.write(ws.outside() / "f.txt", "x");
    try {
        validate_path(ws.work(), (ws.outside() / "f.txt").string());
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_TRUE(e.denied());
    }
}

TEST(PathUtilsTest, SymlinkEscapeIsDenied) {
    TempWorkspace ws;
    ws.write(ws.outside() / "f.txt", "x");
    fs::create_directory_symlink(ws.outside(), ws.work() / "link");
    EXPECT_THROW(validate_path(ws.work(), "link/f.txt"), PathError);
}

TEST(PathUtilsTest, DanglingSymlinkToOutsideIsDenied) {
    TempWorkspace ws;
    fs::create_symlink(ws.outside() / "pwned.txt", ws.work() / "link");
    try {
        validate_path(ws.work(), "link");
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_TRUE(e.denied());
    }

    // A chain of links is followed to its end.
    fs::create_symlink("link", ws.work() / "link2");
    EXPECT_THROW(validate_path(ws.work(), "link2"), PathError);
    EXPECT_FALSE(fs::exists(ws.outside() / "pwned.txt"));
}

TEST(PathUtilsTest, SymlinkInsideWorkdirResolvesToTarget) {
    TempWorkspace ws;
    fs::create_symlink(ws.work() / "src" / "new.txt", ws.work() / "alias");
    EXPECT_EQ(validate_path(ws.work(), "alias"), ws.work() / "src" / "new.txt");
}

TEST(PathUtilsTest, MissingParentIsNotADenial) {
    TempWorkspace ws;
    try {
        validate_path(ws.work(), "no/such/dir/file.txt");
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_FALSE(e.denied());
    }
    EXPECT_THROW(validate_path(ws.work(), "  "), PathError);
}

TEST(PathUtilsTest, SiblingWithSharedPrefixIsOutside) {
    EXPECT_FALSE(path_within("/tmp/work", "/tmp/workspace/file"));
    EXPECT_TRUE(path_within("/tmp/work", "/tmp/work/file"));
    EXPECT_TRUE(path_within("/tmp/work/", "/tmp/work/a/b"));
}

TEST(GlobTest, StarStaysInComponent) {
    EXPECT_TRUE(glob_match("*.cpp", "main.cpp"));
    EXPECT_FALSE(glob_match("*.cpp", "src/main.cpp"));
    EXPECT_TRUE(glob_match("src/*.cpp", "src/main.cpp"));
    EXPECT_TRUE(glob_match("**/*.cpp", "main.cpp"));
    EXPECT_TRUE(glob_match("**/*.cpp", "src/tools/shell.cpp"));
    EXPECT_TRUE(glob_match("file?.txt", "file1.txt"));
    EXPECT_FALSE(glob_match("file?.txt", "file10.txt"));
}

TEST(GlobTest, GlobFilesSkipsBuildDirectories) {
    TempWorkspace ws;
    ws.write(ws.work() / "src" / "a.cpp", "a");
    ws.write(ws.work() / "b.cpp", "b");
    fs::create_directories(ws.work() / "build");
    ws.write(ws.work() / "build" / "gen.cpp", "g");

    auto found = glob_files(ws.work(), "**/*.cpp");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].filename(), "b.cpp");
    EXPECT_EQ(found[1].filename(), "a.cpp");
}

TEST(GlobTest, GlobFilesSkipsLinksLeavingWorkdir) {
    TempWorkspace ws;
    ws.write(ws.outside() / "secret.txt", "s");
    ws.write(ws.work() / "src" / "notes.txt", "n");
    fs::create_symlink(ws.outside() / "secret.txt", ws.work() / "src" / "leak.txt");

    auto found = glob_files(ws.work(), "**/*.txt");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].filename(), "notes.txt");
    EXPECT_TRUE(glob_files(ws.work(), "src/leak.txt").empty());
}

} // namespace
