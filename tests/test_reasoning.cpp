#include <gtest/gtest.h>
#include <shellsage/parse/reasoning.hpp>

using namespace shellsage;

TEST(Reasoning, SinglePairTrimmed) {
    auto r = extract_reasoning("<think>  check files \n</think>\nfinal answer");
    ASSERT_EQ(r.fragments.size(), 1u);
    EXPECT_EQ(r.fragments[0], "check files");
    EXPECT_EQ(r.remainder, "final answer");
}

TEST(Reasoning, MultiplePairsInDocumentOrder) {
    auto r = extract_reasoning("<think>one</think>a\n<think>two</think>b\n<think>three</think>");
    ASSERT_EQ(r.fragments.size(), 3u);
    EXPECT_EQ(r.fragments[0], "one");
    EXPECT_EQ(r.fragments[1], "two");
    EXPECT_EQ(r.fragments[2], "three");
    EXPECT_EQ(r.remainder, "a\nb");
}

TEST(Reasoning, TextBeforeOpenIsKept) {
    auto r = extract_reasoning("pre<think>x</think>post");
    ASSERT_EQ(r.fragments.size(), 1u);
    EXPECT_EQ(r.remainder, "prepost");
}

TEST(Reasoning, NestedOpenPairsWithFirstClose) {
    auto r = extract_reasoning("<think>a<think>b</think>c</think>");
    ASSERT_EQ(r.fragments.size(), 1u);
    EXPECT_EQ(r.fragments[0], "a<think>b");
    EXPECT_EQ(r.remainder, "c</think>");
}

TEST(Reasoning, UnpairedDelimitersLeftInPlace) {
    auto r = extract_reasoning("<think>never closed");
    EXPECT_TRUE(r.fragments.empty());
    EXPECT_EQ(r.remainder, "<think>never closed");
    auto r2 = extract_reasoning("answer</think>");
    EXPECT_TRUE(r2.fragments.empty());
    EXPECT_EQ(r2.remainder, "answer</think>");
}

TEST(Reasoning, EmptyPairYieldsEmptyFragment) {
    auto r = extract_reasoning("<think></think>ok");
    ASSERT_EQ(r.fragments.size(), 1u);
    EXPECT_EQ(r.fragments[0], "");
    EXPECT_EQ(r.remainder, "ok");
}

TEST(Reasoning, NoDelimiters) {
    auto r = extract_reasoning("  plain text  ");
    EXPECT_TRUE(r.fragments.empty());
    EXPECT_EQ(r.remainder, "plain text");
}
