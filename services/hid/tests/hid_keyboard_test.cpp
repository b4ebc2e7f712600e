#include "test_helpers.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

// Parks the first sleep (a press's hold) until release() is called.
class GateSleeper : public Sleeper {
public:
    void sleepFor(std::chrono::milliseconds duration) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        sleeps_.push_back(duration.count());
        if (sleeps_.size() == 1) {
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return released_; });
        }
    }

    void waitUntilEntered()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return entered_; });
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    std::vector<long long> sleeps() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<long long> sleeps_;
    bool entered_{false};
    bool released_{false};
};

} // namespace

TEST_CASE("Connect is idempotent and disconnect without connect does nothing", "[HIDKeyboard]")
{
    KeyboardFixture fixture;

    fixture.keyboard.disconnect();
    CHECK(fixture.log->calls.empty());

    fixture.keyboard.connect();
    fixture.keyboard.connect();
    CHECK(fixture.keyboard.isConnected());
    CHECK(fixture.log->opens == 1);
    CHECK(fixture.log->calls == std::vector<std::string>{"open /dev/hidg0"});
}

TEST_CASE("Connect failure leaves the keyboard disconnected", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.log->failOpen = true;

    try {
        fixture.keyboard.connect();
        FAIL("connect should have thrown");
    } catch (const KeyboardError& ex) {
        CHECK(ex.code() == KeyboardErrorCode::DeviceUnavailable);
        CHECK(std::string(ex.what()).find("Failed to connect to HID device") != std::string::npos);
    }
    CHECK_FALSE(fixture.keyboard.isConnected());

    const auto types = fixture.eventTypes();
    CHECK(std::count(types.begin(), types.end(), KeyboardEventType::Error) == 1);
    CHECK(std::count(types.begin(), types.end(), KeyboardEventType::Connected) == 0);
}

TEST_CASE("Operations require a connection", "[HIDKeyboard]")
{
    KeyboardFixture fixture;

    const auto expectNotConnected = [](auto&& operation) {
        try {
            operation();
            FAIL("expected NotConnected");
        } catch (const KeyboardError& ex) {
            CHECK(ex.code() == KeyboardErrorCode::NotConnected);
        }
    };
    expectNotConnected([&]() { fixture.keyboard.sendReport(0, {}); });
    expectNotConnected([&]() { fixture.keyboard.pressKey("a"); });
    expectNotConnected([&]() { fixture.keyboard.holdKey("shift"); });
    expectNotConnected([&]() { fixture.keyboard.releaseAll(); });

    CHECK(fixture.log->reports.empty());
    CHECK(fixture.keyboard.heldModifiers() == 0);
}

TEST_CASE("Raw reports are written verbatim", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    fixture.keyboard.sendReport(0x03, {0x04, 0x05});
    REQUIRE(fixture.log->reports.size() == 1);
    CHECK(fixture.log->reports[0] == KeyboardReport{0x03, 0x00, 0x04, 0x05, 0x00, 0x00, 0x00, 0x00});

    CHECK_THROWS_AS(fixture.keyboard.sendReport(0x100, {}), KeyboardError);
    CHECK_THROWS_AS(fixture.keyboard.sendReport(-1, {}), KeyboardError);
    CHECK_THROWS_AS(fixture.keyboard.sendReport(0, {1, 2, 3, 4, 5, 6, 7}), KeyboardError);
    CHECK(fixture.log->reports.size() == 1);
}

TEST_CASE("Hold and release modifiers", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    fixture.keyboard.holdKey("Shift");
    CHECK(fixture.keyboard.heldModifiers() == kModifierLeftShift);
    fixture.keyboard.holdKey("ctrl");
    CHECK(fixture.keyboard.heldModifiers() == (kModifierLeftShift | kModifierLeftCtrl));

    fixture.keyboard.releaseKey("shift");
    CHECK(fixture.keyboard.heldModifiers() == kModifierLeftCtrl);

    fixture.keyboard.releaseKey("CTRL");
    CHECK(fixture.keyboard.heldModifiers() == 0);

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x02),
        report(0x03),
        report(0x01),
        makeKeyboardReleaseReport(),
    });
}

TEST_CASE("Hold and release keys", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    fixture.keyboard.holdKey("a");
    fixture.keyboard.holdKey("b");
    fixture.keyboard.holdKey("a");
    CHECK(fixture.keyboard.heldKeys() == std::vector<KeyCode>{0x04, 0x05});
    CHECK(fixture.log->reports.size() == 2);

    fixture.keyboard.releaseKey("a");
    CHECK(fixture.keyboard.heldKeys() == std::vector<KeyCode>{0x05});
    CHECK(fixture.log->reports.back() == report(0x00, {0x05}));

    // not held, unknown: both are silent
    fixture.keyboard.releaseKey("z");
    fixture.keyboard.releaseKey("pineapple");
    CHECK(fixture.log->reports.size() == 3);

    CHECK_THROWS_AS(fixture.keyboard.holdKey("pineapple"), KeyboardError);
}

TEST_CASE("Seventh held key is rejected", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    for (const auto* key : {"a", "b", "c", "d", "e", "f"}) {
        fixture.keyboard.holdKey(key);
    }
    REQUIRE(fixture.keyboard.heldKeys().size() == 6);
    const auto written = fixture.log->reports.size();

    try {
        fixture.keyboard.holdKey("g");
        FAIL("holdKey should have thrown");
    } catch (const KeyboardError& ex) {
        CHECK(ex.code() == KeyboardErrorCode::MaxKeysExceeded);
    }

    CHECK(fixture.keyboard.heldKeys() == std::vector<KeyCode>{0x04, 0x05, 0x06, 0x07, 0x08, 0x09});
    CHECK(fixture.log->reports.size() == written);

    // modifiers do not take a key slot
    fixture.keyboard.holdKey("alt");
    CHECK(fixture.keyboard.heldModifiers() == kModifierLeftAlt);
}

TEST_CASE("Release all clears held state", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    fixture.keyboard.holdKey("shift");
    fixture.keyboard.holdKey("x");
    fixture.keyboard.releaseAll();

    CHECK(fixture.keyboard.heldModifiers() == 0);
    CHECK(fixture.keyboard.heldKeys().empty());
    CHECK(fixture.log->reports.back() == makeKeyboardReleaseReport());
}

TEST_CASE("Press key with auto-release", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    PressOptions options;
    options.modifiers = {"ctrl", "bogus"};
    options.holdTimeMs = 25;
    fixture.keyboard.pressKey("C", options);

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x01, {0x06}),
        makeKeyboardReleaseReport(),
    });
    CHECK(fixture.sleeper->sleeps == std::vector<long long>{25, 10});

    const auto events = fixture.events->drain();
    REQUIRE_FALSE(events.empty());
    CHECK(events.back().type == KeyboardEventType::KeyPressed);
    CHECK(events.back().detail == "autoRelease");
    CHECK(events.back().modifiers == kModifierLeftCtrl);
}

TEST_CASE("Press key without auto-release stays held", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    PressOptions options;
    options.autoRelease = false;
    fixture.keyboard.pressKey("a", options);
    CHECK(fixture.log->reports == std::vector<KeyboardReport>{report(0x00, {0x04})});
    CHECK(fixture.keyboard.heldKeys() == std::vector<KeyCode>{0x04});

    options.modifiers = {"shift"};
    fixture.keyboard.pressKey("b", options);
    CHECK(fixture.log->reports.size() == 3);
    CHECK(fixture.log->reports[1] == report(0x02, {0x05}));
    CHECK(fixture.log->reports[2] == report(0x02, {0x04, 0x05}));
    CHECK(fixture.keyboard.heldModifiers() == kModifierLeftShift);
    CHECK(fixture.keyboard.heldKeys() == std::vector<KeyCode>{0x04, 0x05});

    CHECK(fixture.sleeper->sleeps == std::vector<long long>{100, 100});
}

TEST_CASE("Unknown key writes nothing", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();
    fixture.keyboard.holdKey("shift");
    fixture.keyboard.holdKey("a");
    const auto written = fixture.log->reports.size();

    try {
        fixture.keyboard.pressKey("pineapple");
        FAIL("pressKey should have thrown");
    } catch (const KeyboardError& ex) {
        CHECK(ex.code() == KeyboardErrorCode::UnknownKey);
        CHECK(std::string(ex.what()) == "Unknown key: pineapple");
    }
    CHECK(fixture.log->reports.size() == written);
    CHECK(fixture.keyboard.heldModifiers() == kModifierLeftShift);
    CHECK(fixture.keyboard.heldKeys() == std::vector<KeyCode>{0x04});
    CHECK(fixture.sleeper->sleeps.empty());
}

TEST_CASE("Press with held keys restores the held state", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    fixture.keyboard.holdKey("ctrl");
    HeldPressOptions options;
    options.holdTimeMs = 30;
    fixture.keyboard.pressWithHeld("c", options);

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x01),
        report(0x01, {0x06}),
        report(0x01),
    });
    CHECK(fixture.sleeper->sleeps == std::vector<long long>{30, 10});
    CHECK(fixture.keyboard.heldModifiers() == kModifierLeftCtrl);
    CHECK(fixture.keyboard.heldKeys().empty());
}

TEST_CASE("Key combinations", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    const auto parsed = fixture.keyboard.sendKeyCombination("Ctrl + Shift + A");
    CHECK(parsed.modifiers == std::vector<std::string>{"ctrl", "shift"});
    CHECK(parsed.key == "a");
    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        KeyboardReport{0x03, 0x00, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00},
        makeKeyboardReleaseReport(),
    });

    SECTION("single part is not a combination")
    {
        try {
            fixture.keyboard.sendKeyCombination("a");
            FAIL("expected InvalidCombination");
        } catch (const KeyboardError& ex) {
            CHECK(ex.code() == KeyboardErrorCode::InvalidCombination);
        }
    }

    SECTION("unknown modifier is rejected before writing")
    {
        try {
            fixture.keyboard.sendKeyCombination("hyper+a");
            FAIL("expected UnknownModifier");
        } catch (const KeyboardError& ex) {
            CHECK(ex.code() == KeyboardErrorCode::UnknownModifier);
        }
    }

    SECTION("unknown key")
    {
        CHECK_THROWS_AS(fixture.keyboard.sendKeyCombination("ctrl+pineapple"), KeyboardError);
    }

    CHECK(fixture.log->reports.size() == 2);
}

TEST_CASE("Type text with shifted characters", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    const auto result = fixture.keyboard.typeText("Hi!");
    CHECK(result.typed == 3);
    CHECK(result.skipped == 0);

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x02, {0x0B}),
        makeKeyboardReleaseReport(),
        report(0x00, {0x0C}),
        makeKeyboardReleaseReport(),
        report(0x02, {0x1E}),
        makeKeyboardReleaseReport(),
    });
    // hold, settle, inter-character delay; none after the last character
    CHECK(fixture.sleeper->sleeps == std::vector<long long>{100, 10, 50, 100, 10, 50, 100, 10});
}

TEST_CASE("Type text without preserving case", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    TypeOptions options;
    options.preserveCase = false;
    options.delayMs = 0;
    const auto result = fixture.keyboard.typeText("A b", options);
    CHECK(result.typed == 3);

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x00, {0x04}),
        makeKeyboardReleaseReport(),
        report(0x00, {0x2C}),
        makeKeyboardReleaseReport(),
        report(0x00, {0x05}),
        makeKeyboardReleaseReport(),
    });
}

TEST_CASE("Type text skips control and untypeable characters", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    TypeOptions options;
    options.delayMs = 0;
    const auto result = fixture.keyboard.typeText("a\r\n\t\xC3\xA9" "b", options);
    CHECK(result.typed == 2);
    CHECK(result.skipped == 4);

    std::vector<KeyCode> pressed;
    for (const auto& written : fixture.log->reports) {
        if (written[2] != 0) {
            pressed.push_back(written[2]);
        }
    }
    CHECK(pressed == std::vector<KeyCode>{0x04, 0x05});

    std::vector<KeyboardEvent> skipped;
    for (auto& event : fixture.events->drain()) {
        if (event.type == KeyboardEventType::CharacterSkipped) {
            skipped.push_back(event);
        }
    }
    REQUIRE(skipped.size() == 4);
    CHECK(skipped[0].key == "\r");
    CHECK(skipped[0].index == 1);
    CHECK(skipped[1].key == "\n");
    CHECK(skipped[2].key == "\t");
    CHECK(skipped[3].key == "\xC3\xA9");
    CHECK(skipped[3].index == 4);
}

TEST_CASE("Disconnect releases keys before closing", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();
    fixture.keyboard.holdKey("shift");
    fixture.keyboard.holdKey("a");

    fixture.keyboard.disconnect();
    CHECK_FALSE(fixture.keyboard.isConnected());
    CHECK(fixture.keyboard.heldModifiers() == 0);
    CHECK(fixture.keyboard.heldKeys().empty());

    REQUIRE(fixture.log->calls.size() >= 2);
    CHECK(fixture.log->calls.back() == "close");
    CHECK(fixture.log->calls[fixture.log->calls.size() - 2] == "write");
    CHECK(fixture.log->reports.back() == makeKeyboardReleaseReport());
    CHECK(fixture.log->closes == 1);

    fixture.keyboard.disconnect();
    CHECK(fixture.log->closes == 1);
}

TEST_CASE("Disconnect still closes when the release report fails", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();
    fixture.log->failWriteAt = 0;

    CHECK_NOTHROW(fixture.keyboard.disconnect());
    CHECK(fixture.log->closes == 1);
    CHECK_FALSE(fixture.keyboard.isConnected());
}

TEST_CASE("Device write errors propagate", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();
    fixture.log->failWriteAt = 0;

    try {
        fixture.keyboard.pressKey("a");
        FAIL("pressKey should have thrown");
    } catch (const KeyboardError& ex) {
        CHECK(ex.code() == KeyboardErrorCode::DeviceUnavailable);
    }

    const auto types = fixture.eventTypes();
    CHECK(std::find(types.begin(), types.end(), KeyboardEventType::Error) != types.end());
    CHECK(std::find(types.begin(), types.end(), KeyboardEventType::KeyPressed) == types.end());
}

TEST_CASE("Execute sequence", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();
    fixture.events->drain();

    TypeOptions typeOptions;
    typeOptions.delayMs = 0;
    fixture.keyboard.executeSequence({
        KeyAction{"ctrl+a", {}},
        DelayAction{250},
        TextAction{"x", typeOptions},
        ReleaseAction{},
    });

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x01, {0x04}),
        makeKeyboardReleaseReport(),
        report(0x00, {0x1B}),
        makeKeyboardReleaseReport(),
        makeKeyboardReleaseReport(),
    });
    CHECK(fixture.sleeper->sleeps == std::vector<long long>{100, 10, 250, 100, 10});

    const auto events = fixture.events->drain();
    REQUIRE_FALSE(events.empty());
    CHECK(events.back().type == KeyboardEventType::SequenceCompleted);
    CHECK(events.back().count == 4);
    CHECK(std::count_if(events.begin(), events.end(), [](const KeyboardEvent& event) {
              return event.type == KeyboardEventType::ActionExecuted;
          }) == 4);
}

TEST_CASE("Execute sequence stops at the failing action", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    fixture.keyboard.connect();

    try {
        fixture.keyboard.executeSequence({
            KeyAction{"a", {}},
            KeyAction{"pineapple", {}},
            KeyAction{"b", {}},
        });
        FAIL("executeSequence should have thrown");
    } catch (const SequenceError& ex) {
        CHECK(ex.index() == 1);
        CHECK(ex.code() == KeyboardErrorCode::UnknownKey);
        CHECK(std::string(ex.what()) == "Action 1 failed: Unknown key: pineapple");
    }

    CHECK(fixture.log->reports == std::vector<KeyboardReport>{
        report(0x00, {0x04}),
        makeKeyboardReleaseReport(),
    });

    const auto types = fixture.eventTypes();
    CHECK(std::find(types.begin(), types.end(), KeyboardEventType::SequenceError) != types.end());
    CHECK(std::find(types.begin(), types.end(), KeyboardEventType::SequenceCompleted) == types.end());
}

TEST_CASE("Available keys are grouped", "[HIDKeyboard]")
{
    KeyboardFixture fixture;
    const auto keys = fixture.keyboard.getAvailableKeys();

    CHECK(keys.letters.size() == 26);
    CHECK(keys.numbers.size() == 10);
    CHECK(keys.function.size() == 12);
    CHECK(keys.navigation.size() == 8);
    CHECK(std::find(keys.modifiers.begin(), keys.modifiers.end(), "altgr") != keys.modifiers.end());
    CHECK(std::find(keys.special.begin(), keys.special.end(), "enter") != keys.special.end());
    CHECK(std::find(keys.special.begin(), keys.special.end(), "kp_enter") != keys.special.end());
}

TEST_CASE("Concurrent callers run one at a time in arrival order", "[HIDKeyboard]")
{
    auto log = std::make_shared<FakeDeviceLog>();
    auto sleeper = std::make_shared<GateSleeper>();
    HIDKeyboard keyboard(KeyboardConfig{}, KeyTable::standard(), std::make_unique<FakeHidDevice>(log), sleeper);
    keyboard.connect();

    std::thread press([&]() { keyboard.pressKey("a"); });
    sleeper->waitUntilEntered();
    REQUIRE(log->reports.size() == 1);

    std::thread holdB([&]() { keyboard.holdKey("b"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::thread holdC([&]() { keyboard.holdKey("c"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // both holds are queued behind the press's hold delay
    CHECK(log->reports.size() == 1);

    sleeper->release();
    press.join();
    holdB.join();
    holdC.join();

    CHECK(log->reports == std::vector<KeyboardReport>{
        report(0x00, {0x04}),
        makeKeyboardReleaseReport(),
        report(0x00, {0x05}),
        report(0x00, {0x05, 0x06}),
    });
    CHECK(sleeper->sleeps() == std::vector<long long>{100, 10});
    CHECK(keyboard.heldKeys() == std::vector<KeyCode>{0x05, 0x06});
}
