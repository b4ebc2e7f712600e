#pragma once

#include "hid_reports.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

struct AvailableKeys {
    std::vector<std::string> letters;
    std::vector<std::string> numbers;
    std::vector<std::string> function;
    std::vector<std::string> navigation;
    std::vector<std::string> modifiers;
    std::vector<std::string> special;
};

// Lowercase and strip surrounding whitespace.
std::string normalizeKeyName(std::string_view name);

/*
    Immutable name -> usage tables for the boot keyboard.

    Entries keep their declaration order so that listings are stable.
    Names are stored normalized; lookups normalize their argument.
*/
class KeyTable {
public:
    using KeyEntries = std::vector<std::pair<std::string, KeyCode>>;
    using ModifierEntries = std::vector<std::pair<std::string, ModifierMask>>;
    using ShiftEntries = std::vector<std::pair<char, std::string>>;

    KeyTable(KeyEntries keys, ModifierEntries modifiers, ShiftEntries shifted);

    static std::shared_ptr<const KeyTable> standard();

    [[nodiscard]] std::optional<KeyCode> resolveKey(std::string_view name) const;
    [[nodiscard]] std::optional<ModifierMask> resolveModifier(std::string_view name) const;
    [[nodiscard]] std::optional<std::string> shiftedBaseChar(char ch) const;

    [[nodiscard]] AvailableKeys availableKeys() const;

private:
    KeyEntries keys_;
    ModifierEntries modifiers_;
    std::unordered_map<std::string, KeyCode> keyIndex_;
    std::unordered_map<std::string, ModifierMask> modifierIndex_;
    std::unordered_map<char, std::string> shifted_;
};
