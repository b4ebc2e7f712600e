#pragma once

#include "hid_reports.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class KeyboardEventType {
    Connected,
    Disconnected,
    KeyHeld,
    KeyReleased,
    KeyPressed,
    KeyPressedWithHeld,
    CombinationSent,
    ReportSent,
    Error,
    CharacterSkipped,
    TextTyped,
    ActionExecuted,
    SequenceError,
    SequenceCompleted
};

const char* keyboardEventName(KeyboardEventType type) noexcept;

// Fields not relevant to a given event type stay at their defaults.
struct KeyboardEvent {
    KeyboardEventType type{KeyboardEventType::ReportSent};
    std::string key;
    std::string detail;
    ModifierMask modifiers{0};
    std::vector<KeyCode> keys;
    std::optional<KeyboardReport> report;
    std::size_t index{0};
    std::size_t count{0};
};

/*
    Bounded, thread-safe notification queue.

    The engine pushes, observers drain. When full the oldest event is
    dropped so an absent observer never grows memory without bound.
*/
class KeyboardEventQueue {
public:
    explicit KeyboardEventQueue(std::size_t capacity = 256);

    void push(KeyboardEvent event);
    std::vector<KeyboardEvent> drain();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] uint64_t droppedCount() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<KeyboardEvent> events_;
    uint64_t dropped_{0};
};
