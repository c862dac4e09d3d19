#include <gtest/gtest.h>
#include <shellsage/parse/diagnosis_parser.hpp>

using namespace shellsage;

TEST(DiagnosisParser, GlyphLabelledSections) {
    auto r = parse_diagnosis_response(
        "<think>look at the error</think>\n"
        "🔍 Root Cause: notes.txt does not exist\n"
        "🛠️ Fix: `touch notes.txt`\n"
        "📚 Technical Explanation: cat needs an existing path\n"
        "⚠️ Potential Risks: none\n"
        "🔒 Prevention Tip: check paths with ls first");
    ASSERT_EQ(r.thoughts.size(), 1u);
    EXPECT_EQ(r.thoughts[0], "look at the error");
    EXPECT_EQ(r.cause.value_or(""), "notes.txt does not exist");
    EXPECT_EQ(r.fix.value_or(""), "touch notes.txt");
    EXPECT_EQ(r.explanation.value_or(""), "cat needs an existing path");
    EXPECT_EQ(r.risk.value_or(""), "none");
    EXPECT_EQ(r.prevention.value_or(""), "check paths with ls first");
    EXPECT_FALSE(r.failure.has_value());
}

TEST(DiagnosisParser, PlainLabelsMarkdownAndNumbering) {
    auto r = parse_diagnosis_response(
        "1. **Root Cause**: typo in the command\n\n"
        "2. **Fix**: `git status`\n"
        "3. **Technical Explanation**: git has no 'stauts' subcommand");
    EXPECT_EQ(r.cause.value_or(""), "typo in the command");
    EXPECT_EQ(r.fix.value_or(""), "git status");
    EXPECT_EQ(r.explanation.value_or(""), "git has no 'stauts' subcommand");
    EXPECT_FALSE(r.risk.has_value());
    EXPECT_FALSE(r.prevention.has_value());
}

TEST(DiagnosisParser, SegmentRunsToNextLabel) {
    auto r = parse_diagnosis_response("Root Cause: line one\nline two\nPrevention Tip: later");
    EXPECT_EQ(r.cause.value_or(""), "line one\nline two");
    EXPECT_EQ(r.prevention.value_or(""), "later");
}

TEST(DiagnosisParser, FirstOccurrenceWins) {
    auto r = parse_diagnosis_response("Root Cause: first\nRoot Cause: second");
    EXPECT_EQ(r.cause.value_or(""), "first");
}

TEST(DiagnosisParser, FixWithoutBackticksKeepsText) {
    auto r = parse_diagnosis_response("Fix: chmod +x run.sh");
    EXPECT_EQ(r.fix.value_or(""), "chmod +x run.sh");
}

TEST(DiagnosisParser, FixTakesFirstCodeSpan) {
    auto r = parse_diagnosis_response("Fix: `sudo apt install tree` then retry");
    EXPECT_EQ(r.fix.value_or(""), "sudo apt install tree");
}

TEST(DiagnosisParser, LabelInsideWordIgnored) {
    auto r = parse_diagnosis_response("Root Cause: a prefix: mismatch");
    EXPECT_EQ(r.cause.value_or(""), "a prefix: mismatch");
    EXPECT_FALSE(r.fix.has_value());

    auto mid = parse_diagnosis_response("Root Cause: the quick fix: was never applied\nFix: `git add .`");
    EXPECT_EQ(mid.cause.value_or(""), "the quick fix: was never applied");
    EXPECT_EQ(mid.fix.value_or(""), "git add .");
}

TEST(DiagnosisParser, DuplicateLinesSuppressed) {
    auto r = parse_diagnosis_response("Technical Explanation: same\nsame\nother");
    EXPECT_EQ(r.explanation.value_or(""), "same\nother");
}

TEST(DiagnosisParser, MalformedYieldsEmpty) {
    auto r = parse_diagnosis_response("the model rambled without labels");
    EXPECT_TRUE(r.empty());
    EXPECT_TRUE(to_records(r).empty());
}

TEST(DiagnosisParser, EmptyLabelIsAbsent) {
    auto r = parse_diagnosis_response("Potential Risks:\nPrevention Tip: keep backups");
    EXPECT_FALSE(r.risk.has_value());
    EXPECT_EQ(r.prevention.value_or(""), "keep backups");
}

TEST(DiagnosisParser, NormalizeDropsBlankLinesAndBold) {
    EXPECT_EQ(normalize_diagnosis_text("**a**\n\n  \n1. b\nversion 2. x"), "a\nb\nversion 2. x");
}

TEST(DiagnosisParser, RecordsInVocabularyOrder) {
    auto r = parse_diagnosis_response("<think>t</think>Prevention Tip: p\nRoot Cause: c");
    auto recs = to_records(r);
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].type, "thinking");
    EXPECT_EQ(recs[1].type, "cause");
    EXPECT_EQ(recs[2].type, "prevention");
}
