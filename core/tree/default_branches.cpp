#include "tree/default_branches.hpp"

namespace keydr {

namespace {

std::vector<Symbol> toSymbols(const std::u32string& text) {
    return std::vector<Symbol>(text.begin(), text.end());
}

LevelDefinition level(const std::string& name, const std::u32string& symbols) {
    return LevelDefinition{name, toSymbols(symbols)};
}

// Frequency order; the first kLowercaseStarterCount form the starter
// level, every later letter gets a level of its own.
BranchDefinition lowercaseBranch() {
    const std::u32string order = U"etaoinshrdlcumwfgypbvkjxqz";

    BranchDefinition branch;
    branch.id = branches::kLowercase;
    branch.name = "Lowercase a-z";
    branch.cumulative = true;
    branch.levels.push_back(level("Starter Letters", order.substr(0, kLowercaseStarterCount)));
    for (size_t i = kLowercaseStarterCount; i < order.size(); i++) {
        std::string name = "Letter ";
        name += static_cast<char>(order[i]);
        branch.levels.push_back(level(name, order.substr(i, 1)));
    }
    return branch;
}

} // namespace

SkillTreeDefinition defaultSkillTreeDefinition() {
    SkillTreeDefinition def;
    def.root_branch = branches::kLowercase;

    def.branches.push_back(lowercaseBranch());

    def.branches.push_back(BranchDefinition{
        branches::kCapitals, "Capitals A-Z", {
            level("Common Sentence Capitals", U"TIASWHBM"),
            level("Name Capitals", U"JDRCENPLFG"),
            level("Remaining Capitals", U"OUKVYXQZ"),
        }, false});

    def.branches.push_back(BranchDefinition{
        branches::kNumbers, "Numbers 0-9", {
            level("Common Digits", U"12345"),
            level("All Digits", U"06789"),
        }, false});

    def.branches.push_back(BranchDefinition{
        branches::kProsePunctuation, "Prose Punctuation", {
            level("Essential", U".,'"),
            level("Common", U";:\"-"),
            level("Expressive", U"?!()"),
        }, false});

    def.branches.push_back(BranchDefinition{
        branches::kWhitespace, "Whitespace", {
            LevelDefinition{"Enter/Return", {symbols::kEnter}},
            LevelDefinition{"Tab/Indent", {symbols::kTab}},
        }, false});

    def.branches.push_back(BranchDefinition{
        branches::kCodeSymbols, "Code Symbols", {
            level("Arithmetic & Assignment", U"=+*/-"),
            level("Grouping", U"{}[]<>"),
            level("Logic & Reference", U"&|^~!"),
            level("Special", U"@#$%_\\`"),
        }, false});

    return def;
}

} // namespace keydr
