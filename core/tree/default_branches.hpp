#pragma once

#include "tree/skill_tree.hpp"

namespace keydr {

namespace branches {
constexpr const char* kLowercase = "lowercase";
constexpr const char* kCapitals = "capitals";
constexpr const char* kNumbers = "numbers";
constexpr const char* kProsePunctuation = "prose_punctuation";
constexpr const char* kWhitespace = "whitespace";
constexpr const char* kCodeSymbols = "code_symbols";
} // namespace branches

/// Number of lowercase letters unlocked before one-at-a-time unlocking.
constexpr size_t kLowercaseStarterCount = 6;

/// The built-in tree: lowercase (root) unlocks capitals, numbers, prose
/// punctuation, whitespace and code symbols. '-' and '!' are shared
/// between prose punctuation and code symbols.
SkillTreeDefinition defaultSkillTreeDefinition();

} // namespace keydr
