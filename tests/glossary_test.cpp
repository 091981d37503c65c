#include "glossary.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace {

std::vector<std::string> terms(const OrderedTermSet& set) {
    return set.items();
}

using Terms = std::vector<std::string>;

}  // namespace

TEST(OrderedTermSet, KeepsFirstSeenOrder) {
    OrderedTermSet set;
    EXPECT_TRUE(set.insert("Beta"));
    EXPECT_TRUE(set.insert("Alpha"));
    EXPECT_FALSE(set.insert("Beta"));
    EXPECT_EQ(terms(set), (Terms{"Beta", "Alpha"}));
}

TEST(SourceTerms, CapitalizedWordsAndLiteral) {
    EXPECT_EQ(terms(extract_source_terms("The Foundation studies SCP-999")), (Terms{"Foundation", "SCP"}));
}

TEST(SourceTerms, HyphenJoinsTwoCapitalizedWords) {
    EXPECT_EQ(terms(extract_source_terms("Agent-Smith met Mobile-task force")), (Terms{"Agent-Smith", "Mobile"}));
}

TEST(SourceTerms, UppercaseRuns) {
    EXPECT_EQ(terms(extract_source_terms("the O5 council and MTF units")), (Terms{"MTF"}));
    EXPECT_EQ(terms(extract_source_terms("KETER class")), (Terms{"KETER"}));
}

TEST(SourceTerms, EarlierAlternativesWin) {
    // The literal is taken before the uppercase run can see the whole acronym.
    EXPECT_EQ(terms(extract_source_terms("SCPX")), (Terms{"SCP"}));
    // A capitalized word matches before the compound and digit forms.
    EXPECT_EQ(terms(extract_source_terms("CamelCase")), (Terms{"Camel", "Case"}));
    EXPECT_EQ(terms(extract_source_terms("Class3")), (Terms{"Class"}));
}

TEST(SourceTerms, StopWordsAndShortTokensAreDropped) {
    EXPECT_TRUE(extract_source_terms("The And It Is I").empty());
    EXPECT_TRUE(extract_source_terms("lowercase only text").empty());
    EXPECT_TRUE(is_source_stop_word("Their"));
    EXPECT_FALSE(is_source_stop_word("the"));
}

TEST(SourceTerms, DeduplicatesWithinUnit) {
    EXPECT_EQ(terms(extract_source_terms("Alpha meets Alpha and Beta")), (Terms{"Alpha", "Beta"}));
}

TEST(TargetTerms, KatakanaAndKanjiRuns) {
    EXPECT_EQ(terms(extract_target_terms("財団のエージェント")), (Terms{"財団", "エージェント"}));
}

TEST(TargetTerms, KanjiWithKatakanaTailIsOneTerm) {
    EXPECT_EQ(terms(extract_target_terms("日本語テキストです")), (Terms{"日本語テキスト"}));
}

TEST(TargetTerms, SingleCharactersAndHiraganaAreRejected) {
    EXPECT_TRUE(extract_target_terms("人がいる").empty());
    EXPECT_TRUE(extract_target_terms("ひらがなだけ").empty());
    EXPECT_TRUE(extract_target_terms("ア").empty());
    EXPECT_TRUE(extract_target_terms("Latin only").empty());
}

TEST(TargetTerms, DeduplicatesWithinUnit) {
    EXPECT_EQ(terms(extract_target_terms("収容、収容、オブジェクト")), (Terms{"収容", "オブジェクト"}));
}

TEST(BuildGlossary, SingleCandidatesAreAligned) {
    GlossaryResult glossary;
    build_glossary({{"u1", "SCP-999 is harmless", "それはオブジェクトです"}}, glossary);

    ASSERT_EQ(glossary.pairs.size(), 1u);
    const auto& pair = glossary.pairs.begin()->second;
    EXPECT_EQ(pair.source_term, "SCP");
    EXPECT_EQ(pair.target_term, "オブジェクト");
    EXPECT_EQ(pair.count, 1u);
    EXPECT_EQ(pair.example_ids, (std::set<std::string>{"u1"}));
    EXPECT_TRUE(glossary.source_unmatched.empty());
    EXPECT_TRUE(glossary.target_unmatched.empty());
}

TEST(BuildGlossary, SeveralSourceCandidatesGoUnmatched) {
    GlossaryResult glossary;
    build_glossary({{"u7", "Alpha met Bravo", "それはオブジェクトです"}}, glossary);

    EXPECT_TRUE(glossary.pairs.empty());
    EXPECT_EQ(glossary.source_unmatched.at("Alpha"), (std::set<std::string>{"u7"}));
    EXPECT_EQ(glossary.source_unmatched.at("Bravo"), (std::set<std::string>{"u7"}));
    EXPECT_EQ(glossary.target_unmatched.at("オブジェクト"), (std::set<std::string>{"u7"}));
}

TEST(BuildGlossary, NoTargetCandidateSendsSourceToUnmatched) {
    GlossaryResult glossary;
    build_glossary({{"u2", "Keter", "けてる"}}, glossary);

    EXPECT_TRUE(glossary.pairs.empty());
    EXPECT_EQ(glossary.source_unmatched.size(), 1u);
    EXPECT_TRUE(glossary.target_unmatched.empty());
}

TEST(BuildGlossary, RepeatedPairsAccumulate) {
    GlossaryResult glossary;
    build_glossary({
        {"u1", "Keter", "ケテル"},
        {"u2", "Keter", "ケテル"},
        {"u2", "Keter", "ケテル"},
    }, glossary);

    ASSERT_EQ(glossary.pairs.size(), 1u);
    const auto& pair = glossary.pairs.at(PairKey{"Keter", "ケテル"});
    EXPECT_EQ(pair.count, 3u);
    EXPECT_EQ(pair.example_ids, (std::set<std::string>{"u1", "u2"}));
}

TEST(BuildGlossary, UnitOrderDoesNotMatter) {
    std::vector<TranslationUnit> units = {
        {"a", "Keter", "ケテル"},
        {"b", "Euclid", "ユークリッド"},
        {"c", "Alpha and Bravo", "アルファとブラボー"},
        {"d", "Keter", "ケテル"},
        {"e", "Bravo", "何か"},
    };

    GlossaryResult forward;
    build_glossary(units, forward);

    std::reverse(units.begin(), units.end());
    GlossaryResult backward;
    build_glossary(units, backward);

    ASSERT_EQ(forward.pairs.size(), backward.pairs.size());
    for (const auto& [key, pair] : forward.pairs) {
        const auto& other = backward.pairs.at(key);
        EXPECT_EQ(pair.count, other.count);
        EXPECT_EQ(pair.example_ids, other.example_ids);
    }
    EXPECT_EQ(forward.source_unmatched, backward.source_unmatched);
    EXPECT_EQ(forward.target_unmatched, backward.target_unmatched);
}

TEST(SortedPairs, CountDescendingThenSourceAscending) {
    GlossaryResult glossary;
    build_glossary({
        {"1", "Zeta", "ゼータ"},
        {"2", "Beta", "ベータ"},
        {"3", "Alpha", "アルファ"},
        {"4", "Zeta", "ゼータ"},
    }, glossary);

    const auto pairs = sorted_pairs(glossary);
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].source_term, "Zeta");
    EXPECT_EQ(pairs[1].source_term, "Alpha");
    EXPECT_EQ(pairs[2].source_term, "Beta");
}

TEST(SortedTerms, IdCountDescendingThenTermAscending) {
    TermOccurrences occurrences = {
        {"Gamma", {"1"}},
        {"Alpha", {"2"}},
        {"Beta", {"1", "2", "3"}},
    };

    const auto entries = sorted_terms(occurrences);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].term, "Beta");
    EXPECT_EQ(entries[1].term, "Alpha");
    EXPECT_EQ(entries[2].term, "Gamma");
}
