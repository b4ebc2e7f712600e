#include "command_dispatcher.hpp"
#include "hid_config.hpp"
#include "hid_keyboard.hpp"
#include "http_api.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <memory>

namespace {
std::promise<void> shutdownPromise;
std::atomic<bool> signalHandled{false};

void handleSignal(int)
{
    if (!signalHandled.exchange(true)) {
        shutdownPromise.set_value();
    }
}
} // namespace

int main(int argc, char** argv)
{
    try {
        // hidkbd [config.yml]; otherwise $HIDKBD_CONFIG, then the installed default
        std::string configPath = "/etc/hidkbd/hid.yml";
        if (argc > 1) {
            configPath = argv[1];
        } else if (const char* envPath = std::getenv("HIDKBD_CONFIG")) {
            configPath = envPath;
        }

        const auto config = loadHIDConfig(configPath);

        auto events = std::make_shared<KeyboardEventQueue>(config.events.queueCapacity);
        HIDKeyboard keyboard(config.keyboard, KeyTable::standard(), nullptr, nullptr, events);

        if (config.keyboard.connectOnStart) {
            try {
                keyboard.connect();
            } catch (const KeyboardError& ex) {
                // Clients can retry with a connect command once the gadget is up.
                std::cerr << "[hid] " << ex.what() << std::endl;
            }
        }

        CommandDispatcher dispatcher(keyboard);
        HIDHttpApi httpServer(dispatcher, config.http);
        httpServer.start();

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        shutdownPromise.get_future().wait();

        std::cout << "[hid] Shutting down" << std::endl;
        httpServer.stop();
        keyboard.disconnect();

    } catch (const std::exception& ex) {
        std::cerr << "[hid] Fatal error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
