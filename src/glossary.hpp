#pragma once

#include "unit.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// Insertion-ordered set of terms; the first occurrence fixes the position.
class OrderedTermSet {
public:
    bool insert(const std::string& term);

    const std::vector<std::string>& items() const { return items_; }
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

private:
    std::vector<std::string> items_;
    std::unordered_set<std::string> seen_;
};

// Source role: Latin-script terms (capitalized words, acronyms).
OrderedTermSet extract_source_terms(const std::string& text);

// Target role: Japanese katakana/kanji runs.
OrderedTermSet extract_target_terms(const std::string& text);

bool is_source_stop_word(const std::string& term);

struct GlossaryPair {
    std::string source_term;
    std::string target_term;
    std::size_t count = 0;
    std::set<std::string> example_ids;
};

struct TermEntry {
    std::string term;
    std::set<std::string> example_ids;
};

using PairKey = std::pair<std::string, std::string>;
using TermOccurrences = std::map<std::string, std::set<std::string>>;

struct GlossaryResult {
    std::map<PairKey, GlossaryPair> pairs;
    TermOccurrences source_unmatched;
    TermOccurrences target_unmatched;
};

// A unit becomes a pair only with exactly one term on each side; otherwise
// every term it produced goes to the unmatched bins.
void add_unit_to_glossary(const TranslationUnit& unit, GlossaryResult& glossary);

void build_glossary(const std::vector<TranslationUnit>& units, GlossaryResult& out_glossary);

// Descending count, then ascending source term.
std::vector<GlossaryPair> sorted_pairs(const GlossaryResult& glossary);

// Descending number of unit ids, then ascending term.
std::vector<TermEntry> sorted_terms(const TermOccurrences& occurrences);
