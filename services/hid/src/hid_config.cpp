#include "hid_config.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace {

std::string resolveEnvTokens(std::string value)
{
    if (value.size() < 4 || value[0] != '$' || value[1] != '{' || value.back() != '}') {
        return value;
    }

    const auto inner = value.substr(2, value.size() - 3);
    const auto colonPos = inner.find(':');
    const auto key = inner.substr(0, colonPos);
    std::string defaultValue;
    if (colonPos != std::string::npos) {
        defaultValue = inner.substr(colonPos + 1);
    }

    if (const char* envValue = std::getenv(key.c_str()); envValue != nullptr) {
        return envValue;
    }

    return defaultValue;
}

std::optional<YAML::Node> child(const YAML::Node& node, std::string_view key)
{
    if (!node || !node.IsMap()) {
        return std::nullopt;
    }
    const auto value = node[std::string{key}];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    return value;
}

std::string getString(const YAML::Node& node, std::string_view key, const std::string& fallback)
{
    const auto value = child(node, key);
    if (!value) {
        return fallback;
    }
    return resolveEnvTokens(value->as<std::string>());
}

template <typename T>
T getUnsigned(const YAML::Node& node, std::string_view key, T fallback)
{
    const auto value = child(node, key);
    if (!value) {
        return fallback;
    }

    const auto raw = resolveEnvTokens(value->as<std::string>());
    try {
        if (!raw.empty() && raw.front() == '-') {
            throw std::out_of_range("negative value");
        }
        std::size_t consumed = 0;
        const auto parsed = std::stoull(raw, &consumed, 0);
        if (consumed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (parsed > std::numeric_limits<T>::max()) {
            throw std::out_of_range("value out of range");
        }
        return static_cast<T>(parsed);
    } catch (const std::exception& ex) {
        throw std::runtime_error("Failed to parse numeric value for key '" + std::string(key) + "': " + ex.what());
    }
}

bool getBool(const YAML::Node& node, std::string_view key, bool fallback)
{
    const auto value = child(node, key);
    if (!value) {
        return fallback;
    }

    const auto valueStr = resolveEnvTokens(value->as<std::string>());
    if (valueStr == "1" || valueStr == "true" || valueStr == "True" || valueStr == "yes") {
        return true;
    }
    if (valueStr == "0" || valueStr == "false" || valueStr == "False" || valueStr == "no") {
        return false;
    }
    throw std::runtime_error("Failed to parse boolean for key '" + std::string(key) + "'");
}

} // namespace

HIDConfig loadHIDConfig(const std::string& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("HID configuration file not found: " + path);
    }

    const auto root = YAML::LoadFile(path);
    HIDConfig config;

    if (const auto keyboardNode = child(root, "keyboard"); keyboardNode) {
        config.keyboard.devicePath = getString(*keyboardNode, "device_path", config.keyboard.devicePath);
        if (config.keyboard.devicePath.empty()) {
            throw std::runtime_error("keyboard.device_path must not be empty");
        }
        config.keyboard.defaultDelayMs = getUnsigned<uint32_t>(*keyboardNode, "default_delay_ms", config.keyboard.defaultDelayMs);
        config.keyboard.keyHoldTimeMs = getUnsigned<uint32_t>(*keyboardNode, "key_hold_time_ms", config.keyboard.keyHoldTimeMs);
        config.keyboard.autoRelease = getBool(*keyboardNode, "auto_release", config.keyboard.autoRelease);
        config.keyboard.enableLogging = getBool(*keyboardNode, "enable_logging", config.keyboard.enableLogging);
        config.keyboard.connectOnStart = getBool(*keyboardNode, "connect_on_start", config.keyboard.connectOnStart);
    }

    if (const auto httpNode = child(root, "http"); httpNode) {
        config.http.bindAddress = getString(*httpNode, "bind", config.http.bindAddress);
        config.http.port = getUnsigned<uint16_t>(*httpNode, "port", config.http.port);
    }

    if (const auto eventsNode = child(root, "events"); eventsNode) {
        config.events.queueCapacity = getUnsigned<uint32_t>(*eventsNode, "queue_capacity", config.events.queueCapacity);
        if (config.events.queueCapacity == 0) {
            config.events.queueCapacity = 1;
        }
    }

    return config;
}
