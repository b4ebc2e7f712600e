#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using KeyCode = uint8_t;
using ModifierMask = uint8_t;

constexpr std::size_t kKeyboardReportSize = 8;
constexpr std::size_t kMaxReportKeys = 6;

constexpr ModifierMask kModifierLeftCtrl = 0x01;
constexpr ModifierMask kModifierLeftShift = 0x02;
constexpr ModifierMask kModifierLeftAlt = 0x04;
constexpr ModifierMask kModifierLeftMeta = 0x08;
constexpr ModifierMask kModifierRightCtrl = 0x10;
constexpr ModifierMask kModifierRightShift = 0x20;
constexpr ModifierMask kModifierRightAlt = 0x40;
constexpr ModifierMask kModifierRightMeta = 0x80;

using KeyboardReport = std::array<uint8_t, kKeyboardReportSize>;

// Boot keyboard layout: [modifiers, reserved, key1..key6].
// Throws KeyboardError(InvalidReportInput) for more than six keys.
KeyboardReport makeKeyboardReport(ModifierMask modifiers, const std::vector<KeyCode>& keys);
const KeyboardReport& makeKeyboardReleaseReport();

std::string formatReport(const KeyboardReport& report);
