#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

enum class KeyboardErrorCode {
    DeviceUnavailable,
    NotConnected,
    UnknownKey,
    UnknownModifier,
    MaxKeysExceeded,
    InvalidCombination,
    InvalidReportInput
};

const char* keyboardErrorName(KeyboardErrorCode code) noexcept;

class KeyboardError : public std::runtime_error {
public:
    KeyboardError(KeyboardErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {
    }

    [[nodiscard]] KeyboardErrorCode code() const noexcept { return code_; }

private:
    KeyboardErrorCode code_;
};

// Raised by executeSequence; carries the failing action's code and position.
class SequenceError : public KeyboardError {
public:
    SequenceError(std::size_t index, const KeyboardError& cause)
        : KeyboardError(cause.code(), "Action " + std::to_string(index) + " failed: " + cause.what())
        , index_(index)
    {
    }

    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};
