#include "command_dispatcher.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::optional<YAML::Node> field(const YAML::Node& node, const char* key)
{
    if (!node || !node.IsMap()) {
        return std::nullopt;
    }
    const auto value = node[key];
    if (!value || value.IsNull()) {
        return std::nullopt;
    }
    return value;
}

std::string requireString(const YAML::Node& node, const char* key)
{
    const auto value = field(node, key);
    if (!value || !value->IsScalar() || value->as<std::string>().empty()) {
        throw BadRequest(std::string("'") + key + "' is required");
    }
    return value->as<std::string>();
}

std::optional<uint32_t> optionalMillis(const YAML::Node& node, const char* key)
{
    const auto value = field(node, key);
    if (!value) {
        return std::nullopt;
    }
    const auto parsed = value->as<long long>();
    if (parsed < 0 || parsed > std::numeric_limits<uint32_t>::max()) {
        throw BadRequest(std::string("'") + key + "' must be a non-negative number of milliseconds");
    }
    return static_cast<uint32_t>(parsed);
}

std::optional<bool> optionalBool(const YAML::Node& node, const char* key)
{
    const auto value = field(node, key);
    if (!value) {
        return std::nullopt;
    }
    return value->as<bool>();
}

YAML::Node optionsNode(const YAML::Node& payload)
{
    if (const auto options = field(payload, "options"); options) {
        if (!options->IsMap()) {
            throw BadRequest("'options' must be an object");
        }
        return *options;
    }
    return YAML::Node(YAML::NodeType::Map);
}

PressOptions parsePressOptions(const YAML::Node& options)
{
    PressOptions result;
    if (const auto modifiers = field(options, "modifiers"); modifiers) {
        if (!modifiers->IsSequence()) {
            throw BadRequest("'modifiers' must be a list of names");
        }
        for (const auto& modifier : *modifiers) {
            result.modifiers.push_back(modifier.as<std::string>());
        }
    }
    result.holdTimeMs = optionalMillis(options, "holdTime");
    result.autoRelease = optionalBool(options, "autoRelease");
    return result;
}

TypeOptions parseTypeOptions(const YAML::Node& options)
{
    TypeOptions result;
    result.delayMs = optionalMillis(options, "delay");
    if (const auto preserveCase = optionalBool(options, "preserveCase"); preserveCase) {
        result.preserveCase = *preserveCase;
    }
    return result;
}

std::vector<KeyboardAction> parseActions(const YAML::Node& payload)
{
    const auto actions = field(payload, "actions");
    if (!actions || !actions->IsSequence()) {
        throw BadRequest("'actions' must be a list");
    }

    std::vector<KeyboardAction> result;
    std::size_t index = 0;
    for (const auto& action : *actions) {
        const auto type = field(action, "type") ? requireString(action, "type") : std::string{};
        if (type == "key") {
            result.emplace_back(KeyAction{requireString(action, "key"), parsePressOptions(optionsNode(action))});
        } else if (type == "text") {
            const auto text = field(action, "text");
            if (!text || !text->IsScalar()) {
                throw BadRequest("'text' is required for text action " + std::to_string(index));
            }
            result.emplace_back(TextAction{text->as<std::string>(), parseTypeOptions(optionsNode(action))});
        } else if (type == "delay") {
            result.emplace_back(DelayAction{optionalMillis(action, "duration").value_or(100)});
        } else if (type == "release") {
            result.emplace_back(ReleaseAction{});
        } else {
            throw BadRequest("Unknown action type '" + type + "' at index " + std::to_string(index));
        }
        ++index;
    }
    return result;
}

std::string quoted(const std::string& value)
{
    return "\"" + jsonEscape(value) + "\"";
}

template <typename Container>
std::string stringArray(const Container& values)
{
    std::ostringstream oss;
    oss << '[';
    bool first = true;
    for (const auto& value : values) {
        if (!first) {
            oss << ',';
        }
        first = false;
        oss << quoted(value);
    }
    oss << ']';
    return oss.str();
}

template <typename Container>
std::string numberArray(const Container& values)
{
    std::ostringstream oss;
    oss << '[';
    bool first = true;
    for (const auto value : values) {
        if (!first) {
            oss << ',';
        }
        first = false;
        oss << static_cast<unsigned>(value);
    }
    oss << ']';
    return oss.str();
}

std::string pressOptionsJson(const PressOptions& options)
{
    std::ostringstream oss;
    oss << "{\"modifiers\":" << stringArray(options.modifiers);
    if (options.holdTimeMs) {
        oss << ",\"holdTime\":" << *options.holdTimeMs;
    }
    if (options.autoRelease) {
        oss << ",\"autoRelease\":" << (*options.autoRelease ? "true" : "false");
    }
    oss << '}';
    return oss.str();
}

int statusForError(KeyboardErrorCode code)
{
    switch (code) {
    case KeyboardErrorCode::DeviceUnavailable:
        return 503;
    case KeyboardErrorCode::NotConnected:
        return 409;
    default:
        return 400;
    }
}

CommandResponse errorResponse(int status, const std::string& code, const std::string& message,
                              std::optional<std::size_t> index = std::nullopt)
{
    std::ostringstream oss;
    oss << "{\"type\":\"error\",\"code\":" << quoted(code) << ",\"message\":" << quoted(message);
    if (index) {
        oss << ",\"index\":" << *index;
    }
    oss << '}';
    return CommandResponse{status, oss.str()};
}

} // namespace

std::string jsonEscape(const std::string& value)
{
    std::ostringstream oss;
    for (char ch : value) {
        switch (ch) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20) {
                static const char* hex = "0123456789abcdef";
                oss << "\\u00" << hex[(ch >> 4) & 0x0F] << hex[ch & 0x0F];
            } else {
                oss << ch;
            }
        }
    }
    return oss.str();
}

CommandDispatcher::CommandDispatcher(HIDKeyboard& keyboard)
    : keyboard_(keyboard)
{
}

CommandResponse CommandDispatcher::dispatch(const std::string& body)
{
    try {
        const auto payload = YAML::Load(body);
        if (!payload.IsMap()) {
            throw BadRequest("Command must be a JSON object");
        }
        const auto type = requireString(payload, "type");

        std::ostringstream oss;
        if (type == "connect") {
            keyboard_.connect();
            oss << "{\"type\":\"connected\",\"success\":true}";
        } else if (type == "disconnect") {
            keyboard_.disconnect();
            oss << "{\"type\":\"disconnected\"}";
        } else if (type == "holdKey") {
            const auto key = requireString(payload, "key");
            keyboard_.holdKey(key);
            oss << "{\"type\":\"keyHeld\",\"key\":" << quoted(key) << '}';
        } else if (type == "releaseKey") {
            const auto key = requireString(payload, "key");
            keyboard_.releaseKey(key);
            oss << "{\"type\":\"keyReleased\",\"key\":" << quoted(key) << '}';
        } else if (type == "pressKey") {
            const auto key = requireString(payload, "key");
            const auto options = parsePressOptions(optionsNode(payload));
            keyboard_.pressKey(key, options);
            oss << "{\"type\":\"keyPressed\",\"key\":" << quoted(key) << ",\"options\":" << pressOptionsJson(options) << '}';
        } else if (type == "pressWithHeld") {
            const auto key = requireString(payload, "key");
            HeldPressOptions options;
            options.holdTimeMs = optionalMillis(optionsNode(payload), "holdTime");
            keyboard_.pressWithHeld(key, options);
            oss << "{\"type\":\"keyPressedWithHeld\",\"key\":" << quoted(key);
            if (options.holdTimeMs) {
                oss << ",\"options\":{\"holdTime\":" << *options.holdTimeMs << '}';
            }
            oss << '}';
        } else if (type == "releaseAll") {
            keyboard_.releaseAll();
            oss << "{\"type\":\"allKeysReleased\"}";
        } else if (type == "typeText") {
            const auto text = field(payload, "text");
            if (!text || !text->IsScalar()) {
                throw BadRequest("'text' is required");
            }
            const auto value = text->as<std::string>();
            const auto result = keyboard_.typeText(value, parseTypeOptions(optionsNode(payload)));
            oss << "{\"type\":\"textTyped\",\"text\":" << quoted(value) << ",\"typed\":" << result.typed
                << ",\"skipped\":" << result.skipped << '}';
        } else if (type == "sendKeyCombination") {
            const auto combination = requireString(payload, "combination");
            const auto parsed = keyboard_.sendKeyCombination(combination, parsePressOptions(optionsNode(payload)));
            oss << "{\"type\":\"combinationSent\",\"combination\":" << quoted(combination)
                << ",\"modifiers\":" << stringArray(parsed.modifiers) << ",\"key\":" << quoted(parsed.key) << '}';
        } else if (type == "executeSequence") {
            const auto actions = parseActions(payload);
            keyboard_.executeSequence(actions);
            oss << "{\"type\":\"sequenceCompleted\",\"actionCount\":" << actions.size() << '}';
        } else {
            throw BadRequest("Unknown message type: " + type);
        }
        return CommandResponse{200, oss.str()};
    } catch (const SequenceError& ex) {
        return errorResponse(statusForError(ex.code()), keyboardErrorName(ex.code()), ex.what(), ex.index());
    } catch (const KeyboardError& ex) {
        return errorResponse(statusForError(ex.code()), keyboardErrorName(ex.code()), ex.what());
    } catch (const BadRequest& ex) {
        return errorResponse(400, "BadRequest", ex.what());
    } catch (const YAML::Exception& ex) {
        return errorResponse(400, "BadRequest", std::string("Malformed command: ") + ex.what());
    }
}

std::string CommandDispatcher::healthJson() const
{
    std::ostringstream oss;
    oss << "{\"status\":\"ok\",\"connected\":" << (keyboard_.isConnected() ? "true" : "false") << '}';
    return oss.str();
}

std::string CommandDispatcher::statusJson() const
{
    const auto keys = keyboard_.getAvailableKeys();
    std::ostringstream oss;
    oss << "{\"connected\":" << (keyboard_.isConnected() ? "true" : "false")
        << ",\"heldModifiers\":" << static_cast<unsigned>(keyboard_.heldModifiers())
        << ",\"heldKeys\":" << numberArray(keyboard_.heldKeys())
        << ",\"pendingEvents\":" << keyboard_.events()->size()
        << ",\"droppedEvents\":" << keyboard_.events()->droppedCount()
        << ",\"availableKeys\":{"
        << "\"letters\":" << stringArray(keys.letters)
        << ",\"numbers\":" << stringArray(keys.numbers)
        << ",\"function\":" << stringArray(keys.function)
        << ",\"navigation\":" << stringArray(keys.navigation)
        << ",\"modifiers\":" << stringArray(keys.modifiers)
        << ",\"special\":" << stringArray(keys.special)
        << "}}";
    return oss.str();
}

std::string CommandDispatcher::drainEventsJson()
{
    const auto events = keyboard_.events()->drain();

    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (i != 0) {
            oss << ',';
        }
        oss << "{\"type\":" << quoted(keyboardEventName(event.type));
        if (!event.key.empty()) {
            oss << ",\"key\":" << quoted(event.key);
        }
        if (!event.detail.empty()) {
            oss << ",\"detail\":" << quoted(event.detail);
        }
        switch (event.type) {
        case KeyboardEventType::ReportSent:
        case KeyboardEventType::KeyHeld:
        case KeyboardEventType::KeyReleased:
        case KeyboardEventType::KeyPressed:
        case KeyboardEventType::KeyPressedWithHeld:
            oss << ",\"modifiers\":" << static_cast<unsigned>(event.modifiers) << ",\"keys\":" << numberArray(event.keys);
            break;
        case KeyboardEventType::CharacterSkipped:
        case KeyboardEventType::ActionExecuted:
        case KeyboardEventType::SequenceError:
            oss << ",\"index\":" << event.index;
            break;
        case KeyboardEventType::TextTyped:
        case KeyboardEventType::SequenceCompleted:
            oss << ",\"count\":" << event.count;
            break;
        default:
            break;
        }
        if (event.report) {
            oss << ",\"report\":" << numberArray(*event.report);
        }
        oss << '}';
    }
    oss << ']';
    return oss.str();
}
