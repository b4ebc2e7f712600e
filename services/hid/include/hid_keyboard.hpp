#pragma once

#include "hid_config.hpp"
#include "hid_device.hpp"
#include "hid_reports.hpp"
#include "key_table.hpp"
#include "keyboard_errors.hpp"
#include "keyboard_events.hpp"
#include "sleeper.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Unset fields fall back to the engine's KeyboardConfig.
struct PressOptions {
    std::vector<std::string> modifiers;
    std::optional<uint32_t> holdTimeMs;
    std::optional<bool> autoRelease;
};

struct HeldPressOptions {
    std::optional<uint32_t> holdTimeMs;
};

struct TypeOptions {
    std::optional<uint32_t> delayMs;
    bool preserveCase{true};
};

struct KeyAction {
    std::string key; // single key name or "mod+...+key"
    PressOptions options;
};

struct TextAction {
    std::string text;
    TypeOptions options;
};

struct DelayAction {
    uint32_t durationMs{100};
};

struct ReleaseAction {
};

using KeyboardAction = std::variant<KeyAction, TextAction, DelayAction, ReleaseAction>;

struct KeyCombination {
    std::vector<std::string> modifiers;
    std::string key;
};

struct TypeResult {
    std::size_t typed{0};
    std::size_t skipped{0};
};

/*
    USB HID boot keyboard engine.

    Owns the gadget device handle and the held modifier/key state, and is
    the only writer of the device. Every public operation runs to completion,
    including its hold and settle delays, before the next one starts;
    callers are served in arrival order.

    Failures throw KeyboardError. A failed operation leaves the held state
    as it was before the call. disconnect() never throws.
*/
class HIDKeyboard {
public:
    explicit HIDKeyboard(KeyboardConfig config,
                         std::shared_ptr<const KeyTable> table = KeyTable::standard(),
                         std::unique_ptr<HidDevice> device = nullptr,
                         std::shared_ptr<Sleeper> sleeper = nullptr,
                         std::shared_ptr<KeyboardEventQueue> events = nullptr);
    ~HIDKeyboard();

    HIDKeyboard(const HIDKeyboard&) = delete;
    HIDKeyboard& operator=(const HIDKeyboard&) = delete;

    void connect();
    void disconnect();

    // Low-level write; modifiers must be within 0..255 and keys at most six.
    void sendReport(int modifiers, const std::vector<KeyCode>& keys);
    void releaseAll();

    void holdKey(const std::string& name);
    void releaseKey(const std::string& name);

    void pressKey(const std::string& name, const PressOptions& options = {});
    void pressWithHeld(const std::string& name, const HeldPressOptions& options = {});
    KeyCombination sendKeyCombination(const std::string& combination, const PressOptions& options = {});
    TypeResult typeText(const std::string& text, const TypeOptions& options = {});
    void executeSequence(const std::vector<KeyboardAction>& actions);

    [[nodiscard]] AvailableKeys getAvailableKeys() const;

    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] ModifierMask heldModifiers() const;
    [[nodiscard]] std::vector<KeyCode> heldKeys() const;

    [[nodiscard]] const KeyboardConfig& config() const noexcept;
    [[nodiscard]] const std::shared_ptr<KeyboardEventQueue>& events() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
