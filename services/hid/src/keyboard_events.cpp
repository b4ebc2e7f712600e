#include "keyboard_events.hpp"

#include <iterator>
#include <utility>

const char* keyboardEventName(KeyboardEventType type) noexcept
{
    switch (type) {
    case KeyboardEventType::Connected:
        return "connected";
    case KeyboardEventType::Disconnected:
        return "disconnected";
    case KeyboardEventType::KeyHeld:
        return "keyHeld";
    case KeyboardEventType::KeyReleased:
        return "keyReleased";
    case KeyboardEventType::KeyPressed:
        return "keyPressed";
    case KeyboardEventType::KeyPressedWithHeld:
        return "keyPressedWithHeld";
    case KeyboardEventType::CombinationSent:
        return "combinationSent";
    case KeyboardEventType::ReportSent:
        return "reportSent";
    case KeyboardEventType::Error:
        return "error";
    case KeyboardEventType::CharacterSkipped:
        return "characterSkipped";
    case KeyboardEventType::TextTyped:
        return "textTyped";
    case KeyboardEventType::ActionExecuted:
        return "actionExecuted";
    case KeyboardEventType::SequenceError:
        return "sequenceError";
    case KeyboardEventType::SequenceCompleted:
        return "sequenceCompleted";
    }
    return "unknown";
}

KeyboardEventQueue::KeyboardEventQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

void KeyboardEventQueue::push(KeyboardEvent event)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        events_.pop_front();
        ++dropped_;
    }
    events_.push_back(std::move(event));
}

std::vector<KeyboardEvent> KeyboardEventQueue::drain()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeyboardEvent> result(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
    events_.clear();
    return result;
}

std::size_t KeyboardEventQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t KeyboardEventQueue::droppedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
