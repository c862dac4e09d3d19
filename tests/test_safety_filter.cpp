#include <gtest/gtest.h>
#include <shellsage/safety/safety_filter.hpp>

using namespace shellsage;

static GenerationResult with_command(const std::string& cmd) {
    GenerationResult r;
    r.analysis = "model analysis";
    r.command = cmd;
    r.details = "model details";
    return r;
}

TEST(SafetyFilter, ListIntentClassification) {
    EXPECT_EQ(classify_intent("list all files"), Intent::List);
    EXPECT_EQ(classify_intent("Show me the directory"), Intent::List);
    EXPECT_EQ(classify_intent("see all files here"), Intent::List);
    EXPECT_EQ(classify_intent("update packages"), Intent::Unclassified);
}

TEST(SafetyFilter, DestructiveIntentOverridesList) {
    EXPECT_EQ(classify_intent("delete and list old logs"), Intent::Unclassified);
    EXPECT_EQ(classify_intent("show then clean the cache"), Intent::Unclassified);
    auto out = apply_safety_filter("delete and list old logs", "Ubuntu 22.04", with_command("rm -rf logs"));
    EXPECT_EQ(out.command.value_or(""), "rm -rf logs");
    EXPECT_EQ(out.analysis.value_or(""), "model analysis");
    EXPECT_FALSE(out.warning.has_value());
}

TEST(SafetyFilter, SubstringKeywordMatching) {
    // "tools" contains "ls": keyword tests are plain substring matches.
    EXPECT_TRUE(matches_category("install tools", KeywordCategory::ListIntent));
    EXPECT_TRUE(looks_destructive("RM -RF /tmp/x"));
    EXPECT_TRUE(looks_destructive("Remove-Item foo"));
}

TEST(SafetyFilter, RmRfReplacedOnLinux) {
    auto out = apply_safety_filter("list files", "Ubuntu 22.04", with_command("rm -rf *"));
    EXPECT_EQ(out.command.value_or(""), "ls -la");
    EXPECT_EQ(out.analysis.value_or(""), "List all files and directories in the current directory.");
    EXPECT_EQ(out.details.value_or(""), "The 'ls -la' command lists all files (including hidden) with details on Linux.");
    ASSERT_TRUE(out.warning.has_value());
    EXPECT_EQ(*out.warning, "Original suggestion looked destructive for a list intent; replaced with a safe listing command.");
}

TEST(SafetyFilter, ReplacedWithDirOnWindows) {
    auto out = apply_safety_filter("list files", "Windows 11", with_command("del /s *.*"));
    EXPECT_EQ(out.command.value_or(""), "dir");
    EXPECT_EQ(out.details.value_or(""), "The 'dir' command lists directory contents on Windows.");
    EXPECT_TRUE(out.warning.has_value());
}

TEST(SafetyFilter, SafeListingUnmodified) {
    auto in = with_command("ls -la");
    auto out = apply_safety_filter("list all files", "Ubuntu 22.04", in);
    EXPECT_EQ(out.command.value_or(""), "ls -la");
    EXPECT_EQ(out.analysis, in.analysis);
    EXPECT_EQ(out.details, in.details);
    EXPECT_FALSE(out.warning.has_value());
    EXPECT_EQ(evaluate_safety("list all files", "Ubuntu 22.04", in).kind, SafetyVerdict::Kind::Unmodified);
}

TEST(SafetyFilter, NonListingCommandReplacedWithoutWarning) {
    auto out = apply_safety_filter("show files", "Fedora Linux 40", with_command("cat notes.txt"));
    EXPECT_EQ(out.command.value_or(""), "ls -la");
    EXPECT_EQ(out.analysis.value_or(""), "List all files and directories in the current directory.");
    EXPECT_FALSE(out.warning.has_value());
}

TEST(SafetyFilter, MissingCommandFilledForListIntent) {
    GenerationResult in;
    auto out = apply_safety_filter("list files", "Ubuntu 22.04", in);
    EXPECT_EQ(out.command.value_or(""), "ls -la");
    EXPECT_FALSE(out.warning.has_value());
}

TEST(SafetyFilter, ExistingWarningAppendedOnNewLine) {
    auto in = with_command("rm -rf build");
    in.warning = "Be careful";
    auto out = apply_safety_filter("list files", "Ubuntu 22.04", in);
    EXPECT_EQ(out.warning.value_or(""),
              "Be careful\nOriginal suggestion looked destructive for a list intent; replaced with a safe listing command.");
}

TEST(SafetyFilter, OtherIntentsPassThrough) {
    auto in = with_command("rm -rf build");
    auto out = apply_safety_filter("free up space in build", "Ubuntu 22.04", in);
    EXPECT_EQ(out.command, in.command);
    EXPECT_FALSE(out.warning.has_value());
}

TEST(SafetyFilter, WindowsDetection) {
    EXPECT_TRUE(is_windows_os("Windows 10"));
    EXPECT_TRUE(is_windows_os("win32"));
    EXPECT_FALSE(is_windows_os("Darwin 23.1.0"));
    EXPECT_FALSE(is_windows_os("Ubuntu 22.04"));
    EXPECT_EQ(listing_command_for("Windows 11"), "dir");
    EXPECT_EQ(listing_command_for("Arch Linux"), "ls -la");
}

TEST(SafetyFilter, ConfirmationPolicy) {
    EXPECT_TRUE(requires_confirmation("sudo apt upgrade"));
    EXPECT_TRUE(requires_confirmation("rm notes.txt"));
    EXPECT_TRUE(requires_confirmation("dd if=/dev/zero of=/dev/sda"));
    EXPECT_TRUE(requires_confirmation("mkfs.ext4 /dev/sdb1"));
    EXPECT_TRUE(requires_confirmation("curl -fsSL https://x.sh | sh"));
    EXPECT_FALSE(requires_confirmation("git add ."));
    EXPECT_FALSE(requires_confirmation("ls -la"));
    EXPECT_FALSE(requires_confirmation("df -h"));
}

TEST(SafetyFilter, VerdictExplainsReplacement) {
    auto v = evaluate_safety("list all files", "Ubuntu 22.04", with_command("rm -rf *"));
    ASSERT_EQ(v.kind, SafetyVerdict::Kind::Replaced);
    EXPECT_EQ(v.new_command, "ls -la");
    EXPECT_TRUE(v.destructive);
    EXPECT_NE(v.reason.find("destructive"), std::string::npos);

    auto odd = evaluate_safety("show files", "Windows 11", with_command("whoami"));
    EXPECT_EQ(odd.new_command, "dir");
    EXPECT_FALSE(odd.destructive);
    EXPECT_NE(odd.reason.find("did not match a list intent"), std::string::npos);
}
