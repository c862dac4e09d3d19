#include <gtest/gtest.h>
#include <shellsage/context/history.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace shellsage;

TEST(History, EvictsOldestBeyondCapacity) {
    CommandHistory h(3);
    for (int i = 0; i < 5; ++i) h.push("cmd" + std::to_string(i));
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.entries().front(), "cmd2");
    EXPECT_EQ(h.entries().back(), "cmd4");
}

TEST(History, DefaultCapacityIsTwenty) {
    CommandHistory h;
    for (int i = 0; i < 30; ++i) h.push("c" + std::to_string(i));
    EXPECT_EQ(h.size(), 20u);
    EXPECT_EQ(h.capacity(), 20u);
}

TEST(History, SkipsConsecutiveDuplicateAndBlank) {
    CommandHistory h;
    h.push("ls"); h.push("ls"); h.push("  "); h.push("pwd"); h.push("ls");
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.entries()[1], "pwd");
    EXPECT_EQ(h.entries()[2], "ls");
}

TEST(History, AnyContainsIgnoresCase) {
    CommandHistory h;
    h.push("GIT ADD notes.txt");
    EXPECT_TRUE(h.any_contains("git add"));
    EXPECT_FALSE(h.any_contains("git push"));
}

TEST(History, RelevantFilesNewestFirstSkippingLatest) {
    CommandHistory h;
    h.push("touch a.txt");
    h.push("git add b.txt");
    h.push("vim c.cpp");
    h.push("ls -la");
    h.push("cat missing.txt"); // the failing command
    auto files = relevant_files(h);
    EXPECT_EQ(files, (std::vector<std::string>{"c.cpp", "b.txt", "a.txt"}));
}

TEST(History, RelevantFilesStopsAtThree) {
    CommandHistory h;
    for (auto f : {"a", "b", "c", "d", "e"}) h.push(std::string("touch ") + f);
    h.push("make");
    EXPECT_EQ(relevant_files(h), (std::vector<std::string>{"e", "d", "c"}));
}

TEST(History, GitNeedsThreeWords) {
    CommandHistory h;
    h.push("git push");
    h.push("git status x");
    h.push("git commit -m msg");
    h.push("false");
    EXPECT_EQ(relevant_files(h), (std::vector<std::string>{"msg"}));
}

TEST(History, LoadFileKeepsTail) {
    std::string path = ::testing::TempDir() + "shellsage_hist.txt";
    {
        std::ofstream out(path);
        out << "#1700000000\n";
        for (int i = 0; i < 25; ++i) out << "echo " << i << "\n";
    }
    CommandHistory h;
    EXPECT_EQ(h.load_file(path), 20u);
    EXPECT_EQ(h.entries().front(), "echo 5");
    EXPECT_EQ(h.entries().back(), "echo 24");
    std::remove(path.c_str());
    EXPECT_EQ(CommandHistory().load_file(path), 0u);
}
