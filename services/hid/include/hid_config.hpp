#pragma once

#include <cstdint>
#include <string>

struct HTTPConfig {
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{3000};
};

struct KeyboardConfig {
    std::string devicePath{"/dev/hidg0"};
    uint32_t defaultDelayMs{50};
    uint32_t keyHoldTimeMs{100};
    bool autoRelease{true};
    bool enableLogging{false};
    bool connectOnStart{true};
};

struct EventConfig {
    uint32_t queueCapacity{256};
};

struct HIDConfig {
    KeyboardConfig keyboard;
    HTTPConfig http;
    EventConfig events;
};

HIDConfig loadHIDConfig(const std::string& path);
