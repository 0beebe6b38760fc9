#pragma once

#include <string>

namespace keydr {

// ─── Symbol ────────────────────────────────────────────────────
// A typed key, identified by its code point. Non-printable keys are
// first-class symbols with sentinel values. Every rule that depends on
// a specific character lives in this module; the rest of the engine
// only asks questions through these functions.

using Symbol = char32_t;

namespace symbols {

constexpr Symbol kBackspace = 0x08;
constexpr Symbol kTab = 0x09;
constexpr Symbol kEnter = 0x0A;
constexpr Symbol kSpace = 0x20;

/// True for the sentinels that have no printable glyph.
bool isSentinel(Symbol s);

/// Word boundaries split pair windows: space, tab and enter.
bool isWordBoundary(Symbol s);

/// Correction markers are dropped before pair extraction.
bool isCorrectionMarker(Symbol s);

/// Human-readable name ("Backspace", "Space", ...). Empty for printable
/// symbols; callers use toUtf8() for those.
std::string displayName(Symbol s);

/// Short label for compact displays ("Bksp", "Spc", ...). Empty for
/// printable symbols.
std::string shortLabel(Symbol s);

/// Encode as UTF-8. Used as the storage key and for display.
/// Throws std::invalid_argument for surrogates and values past U+10FFFF.
std::string toUtf8(Symbol s);

/// Decode a storage key holding exactly one UTF-8 encoded code point.
/// Throws std::invalid_argument on malformed or multi-symbol input.
Symbol fromUtf8(const std::string& text);

/// Decode every code point of a UTF-8 string.
std::u32string decodeUtf8(const std::string& text);

} // namespace symbols

} // namespace keydr
