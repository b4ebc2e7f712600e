#include "keyboard_errors.hpp"

const char* keyboardErrorName(KeyboardErrorCode code) noexcept
{
    switch (code) {
    case KeyboardErrorCode::DeviceUnavailable:
        return "DeviceUnavailable";
    case KeyboardErrorCode::NotConnected:
        return "NotConnected";
    case KeyboardErrorCode::UnknownKey:
        return "UnknownKey";
    case KeyboardErrorCode::UnknownModifier:
        return "UnknownModifier";
    case KeyboardErrorCode::MaxKeysExceeded:
        return "MaxKeysExceeded";
    case KeyboardErrorCode::InvalidCombination:
        return "InvalidCombination";
    case KeyboardErrorCode::InvalidReportInput:
        return "InvalidReportInput";
    }
    return "Unknown";
}
