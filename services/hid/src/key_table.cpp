#include "key_table.hpp"

#include <algorithm>
#include <cctype>

namespace {

const char* const kNavigationKeys[] = {"up", "down", "left", "right", "home", "end", "pageup", "pagedown"};

bool isNavigationKey(const std::string& name)
{
    return std::find(std::begin(kNavigationKeys), std::end(kNavigationKeys), name) != std::end(kNavigationKeys);
}

bool isFunctionKey(const std::string& name)
{
    if (name.size() < 2 || name[0] != 'f') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

KeyTable::KeyEntries standardKeys()
{
    KeyTable::KeyEntries keys;
    for (char ch = 'a'; ch <= 'z'; ++ch) {
        keys.emplace_back(std::string(1, ch), static_cast<KeyCode>(0x04 + (ch - 'a')));
    }
    for (char ch = '1'; ch <= '9'; ++ch) {
        keys.emplace_back(std::string(1, ch), static_cast<KeyCode>(0x1E + (ch - '1')));
    }
    keys.emplace_back("0", 0x27);

    const KeyTable::KeyEntries named = {
        {"enter", 0x28}, {"return", 0x28}, {"escape", 0x29}, {"esc", 0x29},
        {"backspace", 0x2A}, {"tab", 0x2B}, {"space", 0x2C}, {"spacebar", 0x2C},

        {"-", 0x2D}, {"minus", 0x2D}, {"=", 0x2E}, {"equal", 0x2E}, {"[", 0x2F}, {"]", 0x30},
        {"\\", 0x31}, {"backslash", 0x31}, {";", 0x33}, {"semicolon", 0x33}, {"'", 0x34}, {"quote", 0x34},
        {"`", 0x35}, {"grave", 0x35}, {",", 0x36}, {"comma", 0x36}, {".", 0x37}, {"period", 0x37},
        {"/", 0x38}, {"slash", 0x38},
    };
    keys.insert(keys.end(), named.begin(), named.end());

    for (int i = 1; i <= 12; ++i) {
        keys.emplace_back("f" + std::to_string(i), static_cast<KeyCode>(0x3A + (i - 1)));
    }

    const KeyTable::KeyEntries system = {
        {"insert", 0x49}, {"home", 0x4A}, {"pageup", 0x4B}, {"pagedown", 0x4E}, {"delete", 0x4C},
        {"end", 0x4D}, {"right", 0x4F}, {"left", 0x50}, {"down", 0x51}, {"up", 0x52},

        {"printscreen", 0x46}, {"scrolllock", 0x47}, {"pause", 0x48}, {"capslock", 0x39}, {"numlock", 0x53},

        {"kp_divide", 0x54}, {"kp_multiply", 0x55}, {"kp_minus", 0x56}, {"kp_plus", 0x57}, {"kp_enter", 0x58},
    };
    keys.insert(keys.end(), system.begin(), system.end());

    for (int i = 1; i <= 9; ++i) {
        keys.emplace_back("kp_" + std::to_string(i), static_cast<KeyCode>(0x59 + (i - 1)));
    }
    keys.emplace_back("kp_0", 0x62);
    keys.emplace_back("kp_period", 0x63);
    return keys;
}

KeyTable::ModifierEntries standardModifiers()
{
    return {
        {"ctrl", kModifierLeftCtrl}, {"lctrl", kModifierLeftCtrl},
        {"shift", kModifierLeftShift}, {"lshift", kModifierLeftShift},
        {"alt", kModifierLeftAlt}, {"lalt", kModifierLeftAlt},
        {"meta", kModifierLeftMeta}, {"lmeta", kModifierLeftMeta}, {"cmd", kModifierLeftMeta}, {"super", kModifierLeftMeta},
        {"rctrl", kModifierRightCtrl},
        {"rshift", kModifierRightShift},
        {"ralt", kModifierRightAlt}, {"altgr", kModifierRightAlt},
        {"rmeta", kModifierRightMeta}, {"rcmd", kModifierRightMeta},
    };
}

KeyTable::ShiftEntries standardShifted()
{
    KeyTable::ShiftEntries shifted = {
        {'!', "1"}, {'@', "2"}, {'#', "3"}, {'$', "4"}, {'%', "5"},
        {'^', "6"}, {'&', "7"}, {'*', "8"}, {'(', "9"}, {')', "0"},
        {'_', "-"}, {'+', "="}, {'{', "["}, {'}', "]"}, {'|', "\\"},
        {':', ";"}, {'"', "'"}, {'~', "`"}, {'<', ","}, {'>', "."}, {'?', "/"},
    };
    for (char ch = 'A'; ch <= 'Z'; ++ch) {
        shifted.emplace_back(ch, std::string(1, static_cast<char>(ch - 'A' + 'a')));
    }
    return shifted;
}

} // namespace

std::string normalizeKeyName(std::string_view name)
{
    const auto notSpace = [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
    const auto first = std::find_if(name.begin(), name.end(), notSpace);
    const auto last = std::find_if(name.rbegin(), name.rend(), notSpace).base();

    std::string normalized;
    if (first < last) {
        normalized.assign(first, last);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

KeyTable::KeyTable(KeyEntries keys, ModifierEntries modifiers, ShiftEntries shifted)
{
    // a later entry with an already-seen name is shadowed and not listed
    for (const auto& [name, code] : keys) {
        auto normalized = normalizeKeyName(name);
        if (keyIndex_.emplace(normalized, code).second) {
            keys_.emplace_back(std::move(normalized), code);
        }
    }
    for (const auto& [name, mask] : modifiers) {
        auto normalized = normalizeKeyName(name);
        if (modifierIndex_.emplace(normalized, mask).second) {
            modifiers_.emplace_back(std::move(normalized), mask);
        }
    }
    for (const auto& [ch, base] : shifted) {
        shifted_.emplace(ch, normalizeKeyName(base));
    }
}

std::shared_ptr<const KeyTable> KeyTable::standard()
{
    static const auto table = std::make_shared<const KeyTable>(standardKeys(), standardModifiers(), standardShifted());
    return table;
}

std::optional<KeyCode> KeyTable::resolveKey(std::string_view name) const
{
    if (auto it = keyIndex_.find(normalizeKeyName(name)); it != keyIndex_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<ModifierMask> KeyTable::resolveModifier(std::string_view name) const
{
    if (auto it = modifierIndex_.find(normalizeKeyName(name)); it != modifierIndex_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<std::string> KeyTable::shiftedBaseChar(char ch) const
{
    if (auto it = shifted_.find(ch); it != shifted_.end()) {
        return it->second;
    }
    return std::nullopt;
}

AvailableKeys KeyTable::availableKeys() const
{
    AvailableKeys result;
    for (const auto& [name, code] : keys_) {
        (void)code;
        if (name.size() == 1 && name[0] >= 'a' && name[0] <= 'z') {
            result.letters.push_back(name);
        } else if (name.size() == 1 && std::isdigit(static_cast<unsigned char>(name[0]))) {
            result.numbers.push_back(name);
        } else if (isFunctionKey(name)) {
            result.function.push_back(name);
        } else if (isNavigationKey(name)) {
            result.navigation.push_back(name);
        } else {
            result.special.push_back(name);
        }
    }
    for (const auto& [name, mask] : modifiers_) {
        (void)mask;
        result.modifiers.push_back(name);
    }
    return result;
}
