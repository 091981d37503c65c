#include "text_normalize.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

std::string remove_all(const std::string& s, const std::string& marker) {
    std::string out;
    out.reserve(s.size());

    std::size_t pos = 0;
    while (true) {
        const auto hit = s.find(marker, pos);
        if (hit == std::string::npos) {
            out.append(s, pos, std::string::npos);
            return out;
        }
        out.append(s, pos, hit - pos);
        pos = hit + marker.size();
    }
}

}  // namespace

std::vector<char32_t> decode_utf8(const std::string& s) {
    std::vector<char32_t> out;
    out.reserve(s.size());

    const auto* data = reinterpret_cast<const uint8_t*>(s.data());
    const auto length = static_cast<int32_t>(s.size());
    int32_t offset = 0;
    while (offset < length) {
        UChar32 cp;
        U8_NEXT(data, offset, length, cp);
        out.push_back(cp < 0 ? kReplacementChar : static_cast<char32_t>(cp));
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    UBool is_error = false;
    U8_APPEND(buf, len, U8_MAX_LENGTH, static_cast<UChar32>(cp), is_error);
    if (is_error) {
        out.append("\xEF\xBF\xBD");
        return;
    }
    out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
}

bool is_unicode_space(char32_t cp) {
    return u_isspace(static_cast<UChar32>(cp)) != 0;
}

std::string strip_markup(const std::string& s) {
    return remove_all(remove_all(s, "**"), "//");
}

std::string normalize_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : decode_utf8(s)) {
        if (is_unicode_space(cp)) {
            continue;
        }
        append_utf8(out, static_cast<char32_t>(u_tolower(static_cast<UChar32>(cp))));
    }
    return out;
}

std::size_t char_len(const std::string& s) {
    std::size_t count = 0;
    for (char32_t cp : decode_utf8(s)) {
        if (!is_unicode_space(cp)) {
            ++count;
        }
    }
    return count;
}

double ascii_ratio(const std::string& s) {
    std::size_t ascii = 0;
    std::size_t total = 0;
    for (char32_t cp : decode_utf8(s)) {
        if (is_unicode_space(cp)) {
            continue;
        }
        ++total;
        if (cp < 128) {
            ++ascii;
        }
    }
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(ascii) / static_cast<double>(total);
}

bool has_ascii_letter(const std::string& s) {
    for (unsigned char ch : s) {
        if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z')) {
            return true;
        }
    }
    return false;
}

std::string trim_whitespace(const std::string& s) {
    const auto cps = decode_utf8(s);
    std::size_t begin = 0;
    std::size_t end = cps.size();
    while (begin < end && is_unicode_space(cps[begin])) {
        ++begin;
    }
    while (end > begin && is_unicode_space(cps[end - 1])) {
        --end;
    }

    std::string out;
    out.reserve(s.size());
    for (std::size_t i = begin; i < end; ++i) {
        append_utf8(out, cps[i]);
    }
    return out;
}

std::string make_preview(const std::string& s, std::size_t max_chars) {
    const auto cps = decode_utf8(trim_whitespace(s));

    std::string out;
    for (std::size_t i = 0; i < cps.size() && i < max_chars; ++i) {
        append_utf8(out, cps[i] == U'\n' ? U' ' : cps[i]);
    }
    return out;
}
