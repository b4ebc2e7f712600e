#pragma once

#include "command_dispatcher.hpp"
#include "hid_config.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

class HIDHttpApi {
public:
    HIDHttpApi(CommandDispatcher& dispatcher, const HTTPConfig& config);
    ~HIDHttpApi();

    void start();
    void stop();

private:
    void serverLoop();
    void handleClient(int clientFd);
    void route(int clientFd, const std::string& method, const std::string& target, const std::string& body);
    void sendResponse(int clientFd, int statusCode, const std::string& body, const std::string& contentType = "application/json") const;

    CommandDispatcher& dispatcher_;
    HTTPConfig config_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<int> serverFd_{-1};
};
