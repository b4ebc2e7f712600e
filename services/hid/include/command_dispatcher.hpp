#pragma once

#include "hid_keyboard.hpp"

#include <string>

struct CommandResponse {
    int status{200};
    std::string body;
};

std::string jsonEscape(const std::string& value);

/*
    Maps JSON command messages onto HIDKeyboard operations.

    Request:  {"type": "pressKey", "key": "w", "options": {"holdTime": 50}}
    Success:  {"type": "keyPressed", "key": "w", "options": {...}}
    Failure:  {"type": "error", "code": "UnknownKey", "message": "..."}

    Malformed requests answer 400 without touching the keyboard.
*/
class CommandDispatcher {
public:
    explicit CommandDispatcher(HIDKeyboard& keyboard);

    CommandResponse dispatch(const std::string& body);

    [[nodiscard]] std::string healthJson() const;
    [[nodiscard]] std::string statusJson() const;
    std::string drainEventsJson();

private:
    HIDKeyboard& keyboard_;
};
