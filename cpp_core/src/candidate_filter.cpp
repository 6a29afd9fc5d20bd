#include "candidate_filter.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <locale.h>
#include <wctype.h>

namespace {
const std::array<const char*, 3> kBannedWords = {"lv.", "llv.", "alpha"};
const std::string kMergedLevel = "llv.";

// UTF-8 character classification locale, created once. Null when the system
// has no UTF-8 locale; classification then covers ASCII only.
locale_t Utf8Locale() {
    static locale_t locale = []() {
        for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
            locale_t created = newlocale(LC_CTYPE_MASK, name, static_cast<locale_t>(0));
            if (created != static_cast<locale_t>(0)) return created;
        }
        std::cerr << "[Filter] No UTF-8 locale available, non-ASCII names will be ignored" << std::endl;
        return static_cast<locale_t>(0);
    }();
    return locale;
}

// Reads the code point at `pos`. Malformed sequences come back one byte at a
// time as U+FFFD so that they never classify as letters.
char32_t DecodeUtf8(const std::string& text, size_t& pos) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    int length = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return 0xFFFD;
    }

    if (pos + length > text.size()) {
        ++pos;
        return 0xFFFD;
    }
    for (int i = 1; i < length; ++i) {
        const unsigned char next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            ++pos;
            return 0xFFFD;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    pos += length;
    return cp;
}

void AppendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool IsUpper(char32_t cp) {
    locale_t locale = Utf8Locale();
    if (locale == static_cast<locale_t>(0)) return cp < 0x80 && cp >= 'A' && cp <= 'Z';
    return iswupper_l(static_cast<wint_t>(cp), locale) != 0;
}

bool IsSpace(char32_t cp) {
    locale_t locale = Utf8Locale();
    if (locale == static_cast<locale_t>(0)) return cp == ' ' || (cp >= '\t' && cp <= '\r');
    return iswspace_l(static_cast<wint_t>(cp), locale) != 0;
}

char32_t ToLowerChar(char32_t cp) {
    locale_t locale = Utf8Locale();
    if (locale == static_cast<locale_t>(0)) return (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
    return static_cast<char32_t>(towlower_l(static_cast<wint_t>(cp), locale));
}

bool StartsUppercase(const std::string& word) {
    if (word.empty()) return false;
    size_t pos = 0;
    return IsUpper(DecodeUtf8(word, pos));
}

std::string ToLower(const std::string& word) {
    std::string lower;
    lower.reserve(word.size());
    for (size_t pos = 0; pos < word.size();) {
        const size_t start = pos;
        const char32_t cp = DecodeUtf8(word, pos);
        if (cp == 0xFFFD && pos - start == 1) {
            lower += word[start];  // keep malformed bytes as they are
        } else {
            AppendUtf8(lower, ToLowerChar(cp));
        }
    }
    return lower;
}

bool HasDigitOrSpace(const std::string& word) {
    for (size_t pos = 0; pos < word.size();) {
        const char32_t cp = DecodeUtf8(word, pos);
        if ((cp >= '0' && cp <= '9') || IsSpace(cp)) return true;
    }
    return false;
}

bool HasBannedWord(const std::string& word) {
    return std::any_of(kBannedWords.begin(), kBannedWords.end(), [&word](const char* banned) {
        return word.find(banned) != std::string::npos;
    });
}

std::string StripAll(const std::string& word, const std::string& needle) {
    std::string out;
    size_t start = 0;
    for (size_t pos = word.find(needle); pos != std::string::npos; pos = word.find(needle, start)) {
        out.append(word, start, pos - start);
        start = pos + needle.size();
    }
    out.append(word, start, std::string::npos);
    return out;
}
}

std::vector<std::string> FilterCandidates(const std::vector<TextLine>& lines) {
    std::vector<std::string> names;
    for (const auto& line : lines) {
        if (line.ToString().find(kLevelMarker) == std::string::npos) continue;

        for (const auto& word : line.words) {
            if (!StartsUppercase(word)) continue;

            // Length is counted in bytes.
            std::string name = ToLower(word);
            if (name.size() <= 3 || HasDigitOrSpace(name) || HasBannedWord(name)) continue;

            names.push_back(StripAll(name, kMergedLevel));
        }
    }
    return names;
}
