#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "clauses/SectionSegmenter.hpp"
#include "text/TextNormalizer.hpp"

using namespace clausefind;

static std::vector<PageText> one_page(const std::string& text) {
    return {PageText{1, text}};
}

static std::string join_bodies(const ClauseStore& store) {
    std::string out;
    for (const auto& c : store.clauses()) {
        if (!out.empty()) out.push_back(' ');
        out += c.body;
    }
    return out;
}

TEST(SectionSegmenter, SplitsNumberedSections) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page(
        "1. Coverage\nDental treatment is covered up to Rs 50000 per year.\n"
        "2. Exclusions\nPre-existing conditions excluded."));

    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(0).id, 0u);
    EXPECT_EQ(store.at(0).title, "1. Coverage");
    EXPECT_EQ(store.at(0).body, "Dental treatment is covered up to Rs 50000 per year.");
    EXPECT_EQ(store.at(0).page, 1);
    EXPECT_EQ(store.at(1).id, 1u);
    EXPECT_EQ(store.at(1).title, "2. Exclusions");
    EXPECT_EQ(store.at(1).body, "Pre-existing conditions excluded.");
}

TEST(SectionSegmenter, MultiLineBodiesAreJoinedWithSpaces) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("BENEFITS\nHospitalization expenses\n\nDay care procedures"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).title, "BENEFITS");
    EXPECT_EQ(store.at(0).body, "Hospitalization expenses Day care procedures");
}

TEST(SectionSegmenter, PageWithoutHeadingBecomesOneClause) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("This policy is a contract of insurance\nbetween the insurer and you"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).title, "Section 1");
    EXPECT_EQ(store.at(0).body, "This policy is a contract of insurance between the insurer and you");
    EXPECT_EQ(store.at(0).page, 1);
}

TEST(SectionSegmenter, PreambleGetsSynthesizedTitle) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("Welcome to your policy\n1. Coverage\nAmbulance charges are covered"));
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(0).title, "Section 1");
    EXPECT_EQ(store.at(0).body, "Welcome to your policy");
    EXPECT_EQ(store.at(1).title, "1. Coverage");
}

TEST(SectionSegmenter, HeadedClauseSpansPages) {
    SectionSegmenter seg;
    auto store = seg.segment({
        PageText{1, "1. Coverage\nDental is covered"},
        PageText{2, "up to a limit of two lakh per year"},
        PageText{3, "2. Exclusions\nCosmetic treatment"},
    });
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(0).body, "Dental is covered up to a limit of two lakh per year");
    EXPECT_EQ(store.at(0).page, 1);
    EXPECT_EQ(store.at(1).page, 3);
}

TEST(SectionSegmenter, SynthesizedClauseClosesAtPageEnd) {
    SectionSegmenter seg;
    auto store = seg.segment({
        PageText{1, "Intro text on page one"},
        PageText{2, "More intro text on page two"},
    });
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(0).title, "Section 1");
    EXPECT_EQ(store.at(0).page, 1);
    EXPECT_EQ(store.at(1).title, "Section 2");
    EXPECT_EQ(store.at(1).page, 2);
}

TEST(SectionSegmenter, DropsBoilerplateLines) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("1. Coverage\nPage 3\nDental is covered\nUIN: ABC123\n3 of 12"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).body, "Dental is covered");

    EXPECT_TRUE(SectionSegmenter::is_boilerplate("Page 3 of 12"));
    EXPECT_TRUE(SectionSegmenter::is_boilerplate("Toll-free: 1800 123 456"));
    EXPECT_FALSE(SectionSegmenter::is_boilerplate("Dental is covered"));
    EXPECT_FALSE(SectionSegmenter::is_boilerplate("Pages of the policy schedule"));
}

TEST(SectionSegmenter, KeepsNumericBodyLines) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("2. Room Rent\nDaily room rent is capped at\n5000\n"
                                      "rupees for a single room\n1000\n- 7 -"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).body, "Daily room rent is capped at 5000 rupees for a single room 1000");

    EXPECT_FALSE(SectionSegmenter::is_boilerplate("5000"));
    EXPECT_FALSE(SectionSegmenter::is_boilerplate("12"));
    EXPECT_TRUE(SectionSegmenter::is_boilerplate("- 7 -"));
    EXPECT_TRUE(SectionSegmenter::is_boilerplate("page 12"));
}

TEST(SectionSegmenter, BoilerplateCanBeKept) {
    SegmenterConfig cfg;
    cfg.drop_boilerplate = false;
    SectionSegmenter seg(cfg);
    auto store = seg.segment(one_page("1. Coverage\nPage 3\nDental is covered"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).body, "Page 3 Dental is covered");
}

TEST(SectionSegmenter, HeadingsOnlyStillYieldsAClause) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("1. Coverage\n2. Exclusions"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).title, "Section 1");
    EXPECT_EQ(store.at(0).body, "1. Coverage 2. Exclusions");
}

TEST(SectionSegmenter, HeadingWithoutBodyEmitsNothing) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("1. Coverage\n2. Exclusions\nCosmetic surgery"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).id, 0u);
    EXPECT_EQ(store.at(0).title, "2. Exclusions");
}

TEST(SectionSegmenter, DuplicateClausesAreNotRepeated) {
    SectionSegmenter seg;
    auto store = seg.segment(one_page("1. Coverage\nSame text\n1. Coverage\nSame text\n2. Other\nText"));
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(1).id, 1u);
    EXPECT_EQ(store.at(1).title, "2. Other");
}

TEST(SectionSegmenter, ShortBodiesCanBeFiltered) {
    SegmenterConfig cfg;
    cfg.min_body_chars = 20;
    SectionSegmenter seg(cfg);
    auto store = seg.segment(one_page("1. A\nshort\n2. B\nthis body is definitely long enough"));
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(0).id, 0u);
    EXPECT_EQ(store.at(0).title, "2. B");
}

TEST(SectionSegmenter, EmptyInputGivesNoClauses) {
    SectionSegmenter seg;
    EXPECT_TRUE(seg.segment({}).empty());
    EXPECT_TRUE(seg.segment({PageText{1, "   \n\t"}, PageText{2, ""}}).empty());
}

TEST(SectionSegmenter, BodiesPartitionTheNormalizedText) {
    const std::string raw =
        "Preamble line one\n"
        "1. Coverage\n"
        "Hospital expenses are paid\n"
        "for in-patient care lasting more than\n"
        "twenty four hours\n"
        "\n"
        "GENERAL EXCLUSIONS\n"
        "War and nuclear perils\n"
        "Definitions\n"
        "Hospital means an institution registered with the local authority\n"
        "(a) Room Rent\n"
        "Capped at one percent of sum insured per day\n";

    SectionSegmenter seg;
    auto store = seg.segment(one_page(raw));
    ASSERT_EQ(store.size(), 5u);

    TextNormalizer norm;
    std::string expected;
    for (const auto& line : TextNormalizer::split_lines(norm.normalize(raw))) {
        if (line.empty()) continue;
        if (headings::classify(line, seg.config().headings) != HeadingKind::None) continue;
        if (!expected.empty()) expected.push_back(' ');
        expected += line;
    }
    EXPECT_EQ(join_bodies(store), expected);

    for (size_t i = 0; i < store.size(); ++i) EXPECT_EQ(store.at(static_cast<uint32_t>(i)).id, i);
}

TEST(SectionSegmenter, GarbageInputNeverThrows) {
    std::mt19937 gen(7);
    std::uniform_int_distribution<int> byte(0, 255);

    std::string junk;
    for (int i = 0; i < 4000; ++i) junk.push_back(static_cast<char>(byte(gen)));

    SectionSegmenter seg;
    ClauseStore store;
    EXPECT_NO_THROW(store = seg.segment(one_page(junk)));

    TextNormalizer norm;
    if (!norm.normalize(junk).empty()) EXPECT_GE(store.size(), 1u);
}
