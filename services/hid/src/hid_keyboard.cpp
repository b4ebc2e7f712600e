#include "hid_keyboard.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace {

constexpr std::chrono::milliseconds kSettleDelay{10};

// Ticket lock: waiters acquire in the order they called lock().
class FifoMutex {
public:
    void lock()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const uint64_t ticket = nextTicket_++;
        cv_.wait(lock, [&]() { return serving_ == ticket; });
    }

    void unlock()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++serving_;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t nextTicket_{0};
    uint64_t serving_{0};
};

bool containsKey(const std::vector<KeyCode>& keys, KeyCode code)
{
    return std::find(keys.begin(), keys.end(), code) != keys.end();
}

std::size_t utf8SequenceLength(unsigned char lead)
{
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

std::vector<std::string> splitCombination(const std::string& combination)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        const auto plus = combination.find('+', start);
        parts.push_back(normalizeKeyName(combination.substr(start, plus == std::string::npos ? std::string::npos : plus - start)));
        if (plus == std::string::npos) {
            break;
        }
        start = plus + 1;
    }
    return parts;
}

} // namespace

class HIDKeyboard::Impl {
public:
    Impl(KeyboardConfig config,
         std::shared_ptr<const KeyTable> table,
         std::unique_ptr<HidDevice> device,
         std::shared_ptr<Sleeper> sleeper,
         std::shared_ptr<KeyboardEventQueue> events)
        : config_(std::move(config))
        , events_(events ? std::move(events) : std::make_shared<KeyboardEventQueue>())
        , table_(table ? std::move(table) : KeyTable::standard())
        , device_(device ? std::move(device) : std::make_unique<FileHidDevice>())
        , sleeper_(sleeper ? std::move(sleeper) : std::make_shared<ThreadSleeper>())
    {
        trace("HIDKeyboard initialized: device=", config_.devicePath,
              " defaultDelay=", config_.defaultDelayMs, "ms keyHoldTime=", config_.keyHoldTimeMs,
              "ms autoRelease=", config_.autoRelease ? "true" : "false");
    }

    void connect()
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        if (connected_) {
            trace("Already connected to HID device");
            return;
        }

        try {
            device_->open(config_.devicePath);
        } catch (const KeyboardError& ex) {
            connected_ = false;
            KeyboardError error(KeyboardErrorCode::DeviceUnavailable, std::string("Failed to connect to HID device: ") + ex.what());
            reportError(error);
            throw error;
        }

        connected_ = true;
        std::cout << "[hid] Connected to HID device " << config_.devicePath << std::endl;
        emit(KeyboardEvent{KeyboardEventType::Connected, {}, config_.devicePath});
    }

    void disconnect()
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        if (!connected_) {
            return;
        }

        // Never leave keys latched on the host.
        try {
            releaseAllLocked();
        } catch (const std::exception& ex) {
            reportError(ex, "Error releasing keys during disconnect: ");
        }

        try {
            device_->close();
        } catch (const std::exception& ex) {
            reportError(ex, "Error closing HID device: ");
        }

        connected_ = false;
        commitState(0, {});
        std::cout << "[hid] Disconnected from HID device" << std::endl;
        emit(KeyboardEvent{KeyboardEventType::Disconnected, {}, config_.devicePath});
    }

    void sendReport(int modifiers, const std::vector<KeyCode>& keys)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        sendReportLocked(modifiers, keys);
    }

    void releaseAll()
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        releaseAllLocked();
    }

    void holdKey(const std::string& name)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);

        if (const auto modifier = table_->resolveModifier(name); modifier.has_value()) {
            const ModifierMask mask = heldModifiers_ | *modifier;
            sendReportLocked(mask, heldKeys_);
            commitState(mask, heldKeys_);
            trace("Holding modifier: ", name);

            KeyboardEvent event{KeyboardEventType::KeyHeld, name, "modifier"};
            event.modifiers = *modifier;
            emit(std::move(event));
            return;
        }

        const KeyCode code = resolveKeyOrThrow(name);
        if (containsKey(heldKeys_, code)) {
            trace("Key already held: ", name);
            return;
        }
        if (heldKeys_.size() >= kMaxReportKeys) {
            throw KeyboardError(KeyboardErrorCode::MaxKeysExceeded,
                                "Maximum " + std::to_string(kMaxReportKeys) + " keys can be held simultaneously");
        }

        auto keys = heldKeys_;
        keys.push_back(code);
        sendReportLocked(heldModifiers_, keys);
        commitState(heldModifiers_, keys);
        trace("Holding key: ", name);

        KeyboardEvent event{KeyboardEventType::KeyHeld, name, "key"};
        event.keys = {code};
        emit(std::move(event));
    }

    void releaseKey(const std::string& name)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);

        if (const auto modifier = table_->resolveModifier(name); modifier.has_value()) {
            const ModifierMask mask = heldModifiers_ & static_cast<ModifierMask>(~*modifier);
            sendReportLocked(mask, heldKeys_);
            commitState(mask, heldKeys_);
            trace("Released modifier: ", name);

            KeyboardEvent event{KeyboardEventType::KeyReleased, name, "modifier"};
            event.modifiers = *modifier;
            emit(std::move(event));
            return;
        }

        const auto code = table_->resolveKey(name);
        if (!code) {
            trace("Cannot release unknown key: ", name);
            return;
        }

        auto keys = heldKeys_;
        const auto it = std::find(keys.begin(), keys.end(), *code);
        if (it == keys.end()) {
            trace("Key was not held: ", name);
            return;
        }
        keys.erase(it);

        sendReportLocked(heldModifiers_, keys);
        commitState(heldModifiers_, keys);
        trace("Released key: ", name);

        KeyboardEvent event{KeyboardEventType::KeyReleased, name, "key"};
        event.keys = {*code};
        emit(std::move(event));
    }

    void pressKey(const std::string& name, const PressOptions& options)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        pressKeyLocked(name, options);
    }

    void pressWithHeld(const std::string& name, const HeldPressOptions& options)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);

        const KeyCode code = resolveKeyOrThrow(name);
        const auto holdTime = std::chrono::milliseconds(options.holdTimeMs.value_or(config_.keyHoldTimeMs));

        auto keys = heldKeys_;
        if (!containsKey(keys, code) && keys.size() < kMaxReportKeys) {
            keys.push_back(code);
        }

        sendReportLocked(heldModifiers_, keys);
        trace("Pressed ", name, " with held keys/modifiers");
        sleep(holdTime);

        sendReportLocked(heldModifiers_, heldKeys_);
        sleep(kSettleDelay);

        KeyboardEvent event{KeyboardEventType::KeyPressedWithHeld, name};
        event.modifiers = heldModifiers_;
        event.keys = heldKeys_;
        emit(std::move(event));
    }

    KeyCombination sendKeyCombination(const std::string& combination, const PressOptions& options)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        return sendKeyCombinationLocked(combination, options);
    }

    TypeResult typeText(const std::string& text, const TypeOptions& options)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        return typeTextLocked(text, options);
    }

    void executeSequence(const std::vector<KeyboardAction>& actions)
    {
        std::lock_guard<FifoMutex> lock(executionMutex_);
        trace("Executing sequence of ", actions.size(), " actions");

        for (std::size_t i = 0; i < actions.size(); ++i) {
            const auto& action = actions[i];
            try {
                if (const auto* keyAction = std::get_if<KeyAction>(&action)) {
                    if (keyAction->key.find('+') != std::string::npos) {
                        sendKeyCombinationLocked(keyAction->key, keyAction->options);
                    } else {
                        pressKeyLocked(keyAction->key, keyAction->options);
                    }
                } else if (const auto* textAction = std::get_if<TextAction>(&action)) {
                    typeTextLocked(textAction->text, textAction->options);
                } else if (const auto* delayAction = std::get_if<DelayAction>(&action)) {
                    sleep(std::chrono::milliseconds(delayAction->durationMs));
                } else {
                    releaseAllLocked();
                }
            } catch (const KeyboardError& ex) {
                std::cerr << "[hid] Error executing action " << i << ": " << ex.what() << std::endl;
                KeyboardEvent event{KeyboardEventType::SequenceError, {}, ex.what()};
                event.index = i;
                emit(std::move(event));
                throw SequenceError(i, ex);
            }

            KeyboardEvent event{KeyboardEventType::ActionExecuted};
            event.index = i;
            emit(std::move(event));
        }

        trace("Sequence execution completed");
        KeyboardEvent event{KeyboardEventType::SequenceCompleted};
        event.count = actions.size();
        emit(std::move(event));
    }

    AvailableKeys getAvailableKeys() const
    {
        return table_->availableKeys();
    }

    bool isConnected() const noexcept
    {
        return connected_;
    }

    ModifierMask heldModifiers() const
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return heldModifiers_;
    }

    std::vector<KeyCode> heldKeys() const
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return heldKeys_;
    }

    KeyboardConfig config_;
    std::shared_ptr<KeyboardEventQueue> events_;

private:
    template <typename... Args>
    void trace(const Args&... args) const
    {
        if (!config_.enableLogging) {
            return;
        }
        std::ostringstream oss;
        (oss << ... << args);
        std::cout << "[hid] " << oss.str() << std::endl;
    }

    void emit(KeyboardEvent event)
    {
        events_->push(std::move(event));
    }

    void reportError(const std::exception& ex, const std::string& context = {})
    {
        std::cerr << "[hid] " << context << ex.what() << std::endl;
        KeyboardEvent event{KeyboardEventType::Error, {}, context + ex.what()};
        emit(std::move(event));
    }

    void sleep(std::chrono::milliseconds duration)
    {
        if (duration.count() > 0) {
            sleeper_->sleepFor(duration);
        }
    }

    // Held state is only written under executionMutex_; stateMutex_ lets
    // observers read a consistent snapshot while an operation is running.
    void commitState(ModifierMask modifiers, std::vector<KeyCode> keys)
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        heldModifiers_ = modifiers;
        heldKeys_ = std::move(keys);
    }

    KeyCode resolveKeyOrThrow(const std::string& name) const
    {
        const auto code = table_->resolveKey(name);
        if (!code) {
            throw KeyboardError(KeyboardErrorCode::UnknownKey, "Unknown key: " + name);
        }
        return *code;
    }

    ModifierMask calculateModifierMask(const std::vector<std::string>& modifiers) const
    {
        ModifierMask mask = 0;
        for (const auto& modifier : modifiers) {
            if (const auto value = table_->resolveModifier(modifier); value.has_value()) {
                mask |= *value;
            } else {
                trace("Warning: Unknown modifier '", modifier, "'");
            }
        }
        return mask;
    }

    void sendReportLocked(int modifiers, const std::vector<KeyCode>& keys)
    {
        if (!connected_ || !device_->isOpen()) {
            throw KeyboardError(KeyboardErrorCode::NotConnected, "Not connected to HID device");
        }
        if (modifiers < 0 || modifiers > 0xFF) {
            throw KeyboardError(KeyboardErrorCode::InvalidReportInput, "Invalid modifier bitmask: " + std::to_string(modifiers));
        }

        const auto mask = static_cast<ModifierMask>(modifiers);
        const auto report = makeKeyboardReport(mask, keys);

        try {
            device_->write(report);
        } catch (const KeyboardError& ex) {
            reportError(ex, "Failed to send HID report: ");
            throw;
        }

        trace("Sent HID report: ", formatReport(report));

        KeyboardEvent event{KeyboardEventType::ReportSent};
        event.modifiers = mask;
        event.keys = keys;
        event.report = report;
        emit(std::move(event));
    }

    void releaseAllLocked()
    {
        sendReportLocked(0, {});
        commitState(0, {});
        trace("Released all keys");
    }

    void pressKeyLocked(const std::string& name, const PressOptions& options)
    {
        const KeyCode code = resolveKeyOrThrow(name);
        const ModifierMask mask = calculateModifierMask(options.modifiers);
        const auto holdTime = std::chrono::milliseconds(options.holdTimeMs.value_or(config_.keyHoldTimeMs));
        const bool autoRelease = options.autoRelease.value_or(config_.autoRelease);

        // Without auto-release the press is folded into the held state; check
        // the slot limit before anything reaches the device.
        auto foldedKeys = heldKeys_;
        if (!autoRelease && !containsKey(foldedKeys, code)) {
            if (foldedKeys.size() >= kMaxReportKeys) {
                throw KeyboardError(KeyboardErrorCode::MaxKeysExceeded,
                                    "Maximum " + std::to_string(kMaxReportKeys) + " keys can be held simultaneously");
            }
            foldedKeys.push_back(code);
        }
        const ModifierMask foldedMask = heldModifiers_ | mask;

        sendReportLocked(mask, {code});
        trace("Pressed key: ", name, " with modifier mask ", static_cast<unsigned>(mask));
        sleep(holdTime);

        if (autoRelease) {
            releaseAllLocked();
            sleep(kSettleDelay);
        } else {
            if (foldedMask != mask || foldedKeys != std::vector<KeyCode>{code}) {
                sendReportLocked(foldedMask, foldedKeys);
            }
            commitState(foldedMask, std::move(foldedKeys));
        }

        KeyboardEvent event{KeyboardEventType::KeyPressed, name, autoRelease ? "autoRelease" : "held"};
        event.modifiers = mask;
        event.keys = {code};
        emit(std::move(event));
    }

    KeyCombination sendKeyCombinationLocked(const std::string& combination, const PressOptions& options)
    {
        auto parts = splitCombination(combination);
        if (parts.size() < 2) {
            throw KeyboardError(KeyboardErrorCode::InvalidCombination,
                                "Key combination must have at least 2 parts (e.g. \"ctrl+c\"): " + combination);
        }

        KeyCombination parsed;
        parsed.key = parts.back();
        parts.pop_back();
        for (auto& modifier : parts) {
            if (!table_->resolveModifier(modifier)) {
                throw KeyboardError(KeyboardErrorCode::UnknownModifier, "Unknown modifier: " + modifier);
            }
        }
        parsed.modifiers = std::move(parts);

        auto pressOptions = options;
        pressOptions.modifiers = parsed.modifiers;
        pressKeyLocked(parsed.key, pressOptions);
        trace("Sent key combination: ", combination);

        emit(KeyboardEvent{KeyboardEventType::CombinationSent, parsed.key, combination});
        return parsed;
    }

    TypeResult typeTextLocked(const std::string& text, const TypeOptions& options)
    {
        const auto delay = std::chrono::milliseconds(options.delayMs.value_or(config_.defaultDelayMs));
        trace("Typing text: \"", text, "\"");

        PressOptions plain;
        plain.autoRelease = true;
        PressOptions shifted = plain;
        shifted.modifiers = {"shift"};

        TypeResult result;
        std::size_t position = 0;
        std::size_t i = 0;
        while (i < text.size()) {
            const char ch = text[i];
            const auto length = std::min(utf8SequenceLength(static_cast<unsigned char>(ch)), text.size() - i);
            const std::string character = text.substr(i, length);
            const bool last = i + length >= text.size();
            i += length;

            std::optional<std::string> keyName;
            const PressOptions* pressOptions = &plain;
            if (length == 1) {
                if (options.preserveCase) {
                    if (auto base = table_->shiftedBaseChar(ch); base.has_value()) {
                        keyName = std::move(base);
                        pressOptions = &shifted;
                    }
                }
                if (!keyName) {
                    if (ch == ' ') {
                        keyName = "space";
                    } else if (const auto lower = normalizeKeyName(character); !lower.empty() && table_->resolveKey(lower)) {
                        keyName = lower;
                    }
                }
            }

            if (!keyName) {
                trace("Warning: Cannot type character '", character, "' (skipping)");
                KeyboardEvent event{KeyboardEventType::CharacterSkipped, character};
                event.index = position;
                emit(std::move(event));
                ++result.skipped;
                ++position;
                continue;
            }

            pressKeyLocked(*keyName, *pressOptions);
            ++result.typed;
            ++position;

            if (!last) {
                sleep(delay);
            }
        }

        trace("Finished typing text");
        KeyboardEvent event{KeyboardEventType::TextTyped, {}, text};
        event.count = result.typed;
        emit(std::move(event));
        return result;
    }

    std::shared_ptr<const KeyTable> table_;
    std::unique_ptr<HidDevice> device_;
    std::shared_ptr<Sleeper> sleeper_;

    std::atomic<bool> connected_{false};
    ModifierMask heldModifiers_{0};
    std::vector<KeyCode> heldKeys_;

    FifoMutex executionMutex_;
    mutable std::mutex stateMutex_;
};

HIDKeyboard::HIDKeyboard(KeyboardConfig config,
                         std::shared_ptr<const KeyTable> table,
                         std::unique_ptr<HidDevice> device,
                         std::shared_ptr<Sleeper> sleeper,
                         std::shared_ptr<KeyboardEventQueue> events)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(table), std::move(device), std::move(sleeper), std::move(events)))
{
}

HIDKeyboard::~HIDKeyboard()
{
    impl_->disconnect();
}

void HIDKeyboard::connect()
{
    impl_->connect();
}

void HIDKeyboard::disconnect()
{
    impl_->disconnect();
}

void HIDKeyboard::sendReport(int modifiers, const std::vector<KeyCode>& keys)
{
    impl_->sendReport(modifiers, keys);
}

void HIDKeyboard::releaseAll()
{
    impl_->releaseAll();
}

void HIDKeyboard::holdKey(const std::string& name)
{
    impl_->holdKey(name);
}

void HIDKeyboard::releaseKey(const std::string& name)
{
    impl_->releaseKey(name);
}

void HIDKeyboard::pressKey(const std::string& name, const PressOptions& options)
{
    impl_->pressKey(name, options);
}

void HIDKeyboard::pressWithHeld(const std::string& name, const HeldPressOptions& options)
{
    impl_->pressWithHeld(name, options);
}

KeyCombination HIDKeyboard::sendKeyCombination(const std::string& combination, const PressOptions& options)
{
    return impl_->sendKeyCombination(combination, options);
}

TypeResult HIDKeyboard::typeText(const std::string& text, const TypeOptions& options)
{
    return impl_->typeText(text, options);
}

void HIDKeyboard::executeSequence(const std::vector<KeyboardAction>& actions)
{
    impl_->executeSequence(actions);
}

AvailableKeys HIDKeyboard::getAvailableKeys() const
{
    return impl_->getAvailableKeys();
}

bool HIDKeyboard::isConnected() const noexcept
{
    return impl_->isConnected();
}

ModifierMask HIDKeyboard::heldModifiers() const
{
    return impl_->heldModifiers();
}

std::vector<KeyCode> HIDKeyboard::heldKeys() const
{
    return impl_->heldKeys();
}

const KeyboardConfig& HIDKeyboard::config() const noexcept
{
    return impl_->config_;
}

const std::shared_ptr<KeyboardEventQueue>& HIDKeyboard::events() const noexcept
{
    return impl_->events_;
}
