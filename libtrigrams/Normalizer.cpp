#include "Normalizer.h"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <istream>
#include <vector>

#include "Core.h"

namespace {

constexpr char32_t APOSTROPHE = 0x27;
constexpr char32_t HYPHEN = 0x2D;
constexpr char32_t SPACE = 0x20;

bool is_token_char(char32_t chr) {
    uint32_t mask = U_GET_GC_MASK(static_cast<UChar32>(chr));
    if ((mask & (U_GC_L_MASK | U_GC_M_MASK)) != 0) {
        return true;
    }
    return chr == APOSTROPHE || chr == HYPHEN;
}

}  // namespace

std::string normalize_text(std::string_view raw) {
    if (raw.size() > MAX_TEXT_SIZE) {
        throw text_size_error("text is too large (" +
                              std::to_string(raw.size()) + " bytes)");
    }

    icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(raw.data(), static_cast<int32_t>(raw.size())));
    text.toLower(icu::Locale::getRoot());

    // Every code point is either a part of a token or a plain space. Whitespace
    // of any kind (newlines included) becomes a plain space as well.
    std::u32string chars;
    chars.reserve(text.length());
    for (int32_t i = 0; i < text.length(); i = text.moveIndex32(i, 1)) {
        auto chr = static_cast<char32_t>(text.char32At(i));
        if (is_token_char(chr)) {
            chars.push_back(chr);
        } else {
            chars.push_back(SPACE);
        }
    }

    // Split into tokens, remembering whether the text had surrounding spaces.
    std::vector<std::u32string> tokens;
    bool leading_space = !chars.empty() && chars.front() == SPACE;
    bool trailing_space = !chars.empty() && chars.back() == SPACE;
    size_t pos = 0;
    while (pos < chars.size()) {
        size_t end = chars.find(SPACE, pos);
        if (end == std::u32string::npos) {
            end = chars.size();
        }
        if (end > pos) {
            tokens.emplace_back(chars, pos, end - pos);
        }
        pos = end + 1;
    }

    // A lone apostrophe with spaces on both sides is dropped.
    std::u32string joined;
    joined.reserve(chars.size());
    for (size_t i = 0; i < tokens.size(); i++) {
        bool space_before = i > 0 || leading_space;
        bool space_after = i + 1 < tokens.size() || trailing_space;
        if (tokens[i].size() == 1 && tokens[i][0] == APOSTROPHE &&
            space_before && space_after) {
            continue;
        }
        if (!joined.empty()) {
            joined.push_back(SPACE);
        }
        joined += tokens[i];
    }

    icu::UnicodeString result = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32 *>(joined.data()),
        static_cast<int32_t>(joined.size()));

    std::string out;
    result.toUTF8String(out);
    return out;
}

std::string normalize_lines(std::istream &in) {
    std::string text;
    std::string line;
    while (std::getline(in, line)) {
        std::string normalized = normalize_text(line);
        if (normalized.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += normalized;
    }
    return text;
}
