#include "glossary.hpp"

#include "text_normalize.hpp"

#include <unicode/uchar.h>

#include <algorithm>
#include <array>
#include <cstddef>

namespace {

using CodePoints = std::vector<char32_t>;

// Returns the match length at pos, 0 when the pattern does not match there.
using TokenMatcher = std::size_t (*)(const CodePoints& text, std::size_t pos);

bool is_ascii_upper(char32_t cp) {
    return cp >= U'A' && cp <= U'Z';
}

bool is_ascii_lower(char32_t cp) {
    return cp >= U'a' && cp <= U'z';
}

bool is_decimal_digit(char32_t cp) {
    return u_isdigit(static_cast<UChar32>(cp)) != 0;
}

bool is_katakana(char32_t cp) {
    return (cp >= 0x30A1 && cp <= 0x30FA) || cp == 0x30FC;
}

bool is_kanji(char32_t cp) {
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

bool is_hiragana(char32_t cp) {
    return cp >= 0x3040 && cp <= 0x309F;
}

template <typename Pred>
std::size_t run_length(const CodePoints& text, std::size_t pos, Pred pred) {
    std::size_t end = pos;
    while (end < text.size() && pred(text[end])) {
        ++end;
    }
    return end - pos;
}

// [A-Z][a-z]+
std::size_t capitalized_word(const CodePoints& text, std::size_t pos) {
    if (pos >= text.size() || !is_ascii_upper(text[pos])) {
        return 0;
    }
    const std::size_t tail = run_length(text, pos + 1, is_ascii_lower);
    return tail == 0 ? 0 : tail + 1;
}

std::size_t match_literal(const CodePoints& text, std::size_t pos) {
    static constexpr std::array<char32_t, 3> kLiteral = {U'S', U'C', U'P'};
    if (pos + kLiteral.size() > text.size()) {
        return 0;
    }
    return std::equal(kLiteral.begin(), kLiteral.end(), text.begin() + static_cast<std::ptrdiff_t>(pos))
        ? kLiteral.size()
        : 0;
}

// Capitalized word, optionally "-" and a second capitalized word.
std::size_t match_hyphenated_word(const CodePoints& text, std::size_t pos) {
    const std::size_t head = capitalized_word(text, pos);
    if (head == 0) {
        return 0;
    }
    const std::size_t dash = pos + head;
    if (dash < text.size() && text[dash] == U'-') {
        const std::size_t second = capitalized_word(text, dash + 1);
        if (second > 0) {
            return head + 1 + second;
        }
    }
    return head;
}

std::size_t match_upper_run(const CodePoints& text, std::size_t pos) {
    const std::size_t len = run_length(text, pos, is_ascii_upper);
    return len >= 2 ? len : 0;
}

std::size_t match_camel_compound(const CodePoints& text, std::size_t pos) {
    const std::size_t head = capitalized_word(text, pos);
    if (head == 0) {
        return 0;
    }
    const std::size_t second = capitalized_word(text, pos + head);
    return second == 0 ? 0 : head + second;
}

std::size_t match_word_with_digits(const CodePoints& text, std::size_t pos) {
    const std::size_t head = capitalized_word(text, pos);
    if (head == 0) {
        return 0;
    }
    const std::size_t digits = run_length(text, pos + head, is_decimal_digit);
    return digits == 0 ? 0 : head + digits;
}

std::size_t match_katakana_run(const CodePoints& text, std::size_t pos) {
    const std::size_t len = run_length(text, pos, is_katakana);
    return len >= 2 ? len : 0;
}

// Kanji run with an optional katakana tail.
std::size_t match_kanji_compound(const CodePoints& text, std::size_t pos) {
    const std::size_t kanji = run_length(text, pos, is_kanji);
    if (kanji == 0) {
        return 0;
    }
    return kanji + run_length(text, pos + kanji, is_katakana);
}

std::size_t match_kanji_run(const CodePoints& text, std::size_t pos) {
    const std::size_t len = run_length(text, pos, is_kanji);
    return len >= 2 ? len : 0;
}

// Priority order matters: at each position the first matcher that succeeds wins.
constexpr std::array<TokenMatcher, 5> kSourceMatchers = {
    match_literal,
    match_hyphenated_word,
    match_upper_run,
    match_camel_compound,
    match_word_with_digits,
};

constexpr std::array<TokenMatcher, 3> kTargetMatchers = {
    match_katakana_run,
    match_kanji_compound,
    match_kanji_run,
};

template <std::size_t N>
std::vector<CodePoints> scan_tokens(const CodePoints& text, const std::array<TokenMatcher, N>& matchers) {
    std::vector<CodePoints> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t len = 0;
        for (const auto matcher : matchers) {
            len = matcher(text, pos);
            if (len > 0) {
                break;
            }
        }
        if (len == 0) {
            ++pos;
            continue;
        }
        tokens.emplace_back(text.begin() + static_cast<std::ptrdiff_t>(pos),
                            text.begin() + static_cast<std::ptrdiff_t>(pos + len));
        pos += len;
    }
    return tokens;
}

std::string encode(const CodePoints& cps) {
    std::string out;
    for (char32_t cp : cps) {
        append_utf8(out, cp);
    }
    return out;
}

CodePoints trim_hyphens(const CodePoints& token) {
    std::size_t begin = 0;
    std::size_t end = token.size();
    while (begin < end && token[begin] == U'-') {
        ++begin;
    }
    while (end > begin && token[end - 1] == U'-') {
        --end;
    }
    return CodePoints(token.begin() + static_cast<std::ptrdiff_t>(begin),
                      token.begin() + static_cast<std::ptrdiff_t>(end));
}

}  // namespace

bool OrderedTermSet::insert(const std::string& term) {
    if (!seen_.insert(term).second) {
        return false;
    }
    items_.push_back(term);
    return true;
}

bool is_source_stop_word(const std::string& term) {
    static const std::unordered_set<std::string> stop_words = {
        "The", "A", "An", "And", "Or", "But", "If", "Of", "For", "To",
        "In", "On", "At", "It", "You", "I", "We", "He", "She", "They",
        "Them", "Is", "Are", "Am", "Be", "Been", "Was", "Were", "This", "That",
        "These", "Those", "My", "Your", "Our", "Their", "With", "As", "Not", "Have",
        "Has", "Had", "Will", "Can", "Do", "Did", "So", "All", "Any"
    };
    return stop_words.contains(term);
}

OrderedTermSet extract_source_terms(const std::string& text) {
    OrderedTermSet terms;
    for (const auto& raw : scan_tokens(decode_utf8(text), kSourceMatchers)) {
        const CodePoints token = trim_hyphens(raw);
        if (token.size() < 2) {
            continue;
        }
        const std::string term = encode(token);
        if (is_source_stop_word(term)) {
            continue;
        }
        terms.insert(term);
    }
    return terms;
}

OrderedTermSet extract_target_terms(const std::string& text) {
    OrderedTermSet terms;
    for (const auto& token : scan_tokens(decode_utf8(text), kTargetMatchers)) {
        if (std::all_of(token.begin(), token.end(), is_hiragana)) {
            continue;
        }
        if (token.size() < 2) {
            continue;
        }
        terms.insert(encode(token));
    }
    return terms;
}

void add_unit_to_glossary(const TranslationUnit& unit, GlossaryResult& glossary) {
    const OrderedTermSet source_terms = extract_source_terms(unit.source_text);
    const OrderedTermSet target_terms = extract_target_terms(unit.target_text);

    if (source_terms.size() == 1 && target_terms.size() == 1) {
        PairKey key{source_terms.items().front(), target_terms.items().front()};
        auto& pair = glossary.pairs[key];
        if (pair.count == 0) {
            pair.source_term = key.first;
            pair.target_term = key.second;
        }
        ++pair.count;
        pair.example_ids.insert(unit.id);
        return;
    }

    for (const auto& term : source_terms.items()) {
        glossary.source_unmatched[term].insert(unit.id);
    }
    for (const auto& term : target_terms.items()) {
        glossary.target_unmatched[term].insert(unit.id);
    }
}

void build_glossary(const std::vector<TranslationUnit>& units, GlossaryResult& out_glossary) {
    out_glossary = GlossaryResult{};
    for (const auto& unit : units) {
        add_unit_to_glossary(unit, out_glossary);
    }
}

std::vector<GlossaryPair> sorted_pairs(const GlossaryResult& glossary) {
    std::vector<GlossaryPair> pairs;
    pairs.reserve(glossary.pairs.size());
    for (const auto& [key, pair] : glossary.pairs) {
        pairs.push_back(pair);
    }

    std::stable_sort(pairs.begin(), pairs.end(), [](const GlossaryPair& a, const GlossaryPair& b) {
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.source_term < b.source_term;
    });
    return pairs;
}

std::vector<TermEntry> sorted_terms(const TermOccurrences& occurrences) {
    std::vector<TermEntry> entries;
    entries.reserve(occurrences.size());
    for (const auto& [term, ids] : occurrences) {
        entries.push_back(TermEntry{term, ids});
    }

    std::stable_sort(entries.begin(), entries.end(), [](const TermEntry& a, const TermEntry& b) {
        if (a.example_ids.size() != b.example_ids.size()) {
            return a.example_ids.size() > b.example_ids.size();
        }
        return a.term < b.term;
    });
    return entries;
}
