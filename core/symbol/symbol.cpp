#include "symbol/symbol.hpp"

#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace keydr {
namespace symbols {

namespace {

struct KeyLabels {
    const char* name;
    const char* short_label;
};

const std::unordered_map<Symbol, KeyLabels>& labelTable() {
    static const std::unordered_map<Symbol, KeyLabels> table = {
        {kBackspace, {"Backspace", "Bksp"}},
        {kTab,       {"Tab",       "Tab"}},
        {kEnter,     {"Enter",     "Ent"}},
        {kSpace,     {"Space",     "Spc"}},
    };
    return table;
}

constexpr Symbol kMaxCodePoint = 0x10FFFF;

bool isSurrogate(Symbol s) {
    return s >= 0xD800 && s <= 0xDFFF;
}

// Returns the number of bytes consumed, 0 on malformed input.
// Overlong forms, surrogates and values past U+10FFFF are malformed.
size_t decodeOne(const std::string& text, size_t pos, Symbol& out) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    size_t len = 0;
    Symbol cp = 0;
    Symbol min_cp = 0;
    if (lead < 0x80) {
        out = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
        min_cp = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
        min_cp = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
        min_cp = 0x10000;
    } else {
        return 0;
    }
    if (pos + len > text.size()) return 0;
    for (size_t i = 1; i < len; i++) {
        unsigned char c = byte(pos + i);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min_cp || cp > kMaxCodePoint || isSurrogate(cp)) return 0;
    out = cp;
    return len;
}

} // namespace

bool isSentinel(Symbol s) {
    return s == kBackspace || s == kTab || s == kEnter;
}

bool isWordBoundary(Symbol s) {
    return s == kSpace || s == kTab || s == kEnter;
}

bool isCorrectionMarker(Symbol s) {
    return s == kBackspace;
}

std::string displayName(Symbol s) {
    auto it = labelTable().find(s);
    return it != labelTable().end() ? it->second.name : "";
}

std::string shortLabel(Symbol s) {
    auto it = labelTable().find(s);
    return it != labelTable().end() ? it->second.short_label : "";
}

std::string toUtf8(Symbol s) {
    if (s > kMaxCodePoint || isSurrogate(s)) {
        throw std::invalid_argument("Not a Unicode scalar value: " + std::to_string(static_cast<uint32_t>(s)));
    }
    std::string out;
    if (s < 0x80) {
        out += static_cast<char>(s);
    } else if (s < 0x800) {
        out += static_cast<char>(0xC0 | (s >> 6));
        out += static_cast<char>(0x80 | (s & 0x3F));
    } else if (s < 0x10000) {
        out += static_cast<char>(0xE0 | (s >> 12));
        out += static_cast<char>(0x80 | ((s >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (s & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (s >> 18));
        out += static_cast<char>(0x80 | ((s >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((s >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (s & 0x3F));
    }
    return out;
}

std::u32string decodeUtf8(const std::string& text) {
    std::u32string result;
    size_t pos = 0;
    while (pos < text.size()) {
        Symbol cp = 0;
        size_t used = decodeOne(text, pos, cp);
        if (used == 0) {
            throw std::invalid_argument("Malformed UTF-8 at byte " + std::to_string(pos));
        }
        result.push_back(cp);
        pos += used;
    }
    return result;
}

Symbol fromUtf8(const std::string& text) {
    std::u32string decoded = decodeUtf8(text);
    if (decoded.size() != 1) {
        throw std::invalid_argument("Expected a single symbol, got \"" + text + "\"");
    }
    return decoded[0];
}

} // namespace symbols
} // namespace keydr
