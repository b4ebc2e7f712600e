#include "http_api.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cctype>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <strings.h>

namespace {

constexpr std::size_t kMaxRequestBytes = 64 * 1024;

struct HttpRequest {
    std::string method;
    std::string target;
    std::string body;
};

std::string trim(std::string value)
{
    const auto notSpace = [](int ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::string statusText(int status)
{
    switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Error";
    }
}

std::string errorJson(const std::string& message)
{
    return "{\"type\":\"error\",\"code\":\"BadRequest\",\"message\":\"" + jsonEscape(message) + "\"}";
}

int openListenSocket(const HTTPConfig& config)
{
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("Failed to create server socket: ") + std::strerror(errno));
    }

    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config.port);
    if (config.bindAddress == "0.0.0.0" || config.bindAddress == "*") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, config.bindAddress.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw std::runtime_error("Invalid bind address: " + config.bindAddress);
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("Bind failed on " + config.bindAddress + ":" + std::to_string(config.port) + ": " + reason);
    }

    if (::listen(fd, 8) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw std::runtime_error("Listen failed: " + reason);
    }

    return fd;
}

// Reads one request; returns nullopt if the peer went away first.
std::optional<HttpRequest> readRequest(int clientFd, bool& tooLarge)
{
    std::string data;
    data.reserve(1024);

    char buffer[1024];
    std::size_t headerEnd = std::string::npos;
    while (headerEnd == std::string::npos) {
        const ssize_t received = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (received <= 0) {
            return std::nullopt;
        }
        data.append(buffer, buffer + received);
        if (data.size() > kMaxRequestBytes) {
            tooLarge = true;
            return std::nullopt;
        }
        headerEnd = data.find("\r\n\r\n");
    }

    std::istringstream headerStream(data.substr(0, headerEnd));
    std::string requestLine;
    std::getline(headerStream, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    std::size_t contentLength = 0;
    std::string line;
    while (std::getline(headerStream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto key = trim(line.substr(0, colon));
        if (strcasecmp(key.c_str(), "Content-Length") == 0) {
            try {
                contentLength = static_cast<std::size_t>(std::stoul(trim(line.substr(colon + 1))));
            } catch (const std::exception&) {
                contentLength = 0;
            }
        }
    }
    if (contentLength > kMaxRequestBytes) {
        tooLarge = true;
        return std::nullopt;
    }

    HttpRequest request;
    request.body = data.substr(headerEnd + 4);
    while (request.body.size() < contentLength) {
        const ssize_t received = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (received <= 0) {
            break;
        }
        request.body.append(buffer, buffer + received);
    }

    std::istringstream requestLineStream(requestLine);
    std::string version;
    requestLineStream >> request.method >> request.target >> version;
    return request;
}

} // namespace

HIDHttpApi::HIDHttpApi(CommandDispatcher& dispatcher, const HTTPConfig& config)
    : dispatcher_(dispatcher)
    , config_(config)
{
}

HIDHttpApi::~HIDHttpApi()
{
    stop();
}

void HIDHttpApi::start()
{
    if (running_) {
        return;
    }

    // Bind on the caller's thread so address errors reach main().
    serverFd_ = openListenSocket(config_);
    running_ = true;
    std::cout << "[hid] HTTP API listening on " << config_.bindAddress << ":" << config_.port << std::endl;

    serverThread_ = std::thread([this]() { serverLoop(); });
}

void HIDHttpApi::stop()
{
    if (!running_.exchange(false)) {
        return;
    }

    const int fd = serverFd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }
}

void HIDHttpApi::serverLoop()
{
    while (running_) {
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        const int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&client), &len);
        if (clientFd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (running_) {
                std::cerr << "[hid] Accept failed: " << std::strerror(errno) << std::endl;
            }
            break;
        }

        handleClient(clientFd);
    }
}

void HIDHttpApi::handleClient(int clientFd)
{
    bool tooLarge = false;
    const auto request = readRequest(clientFd, tooLarge);
    if (tooLarge) {
        sendResponse(clientFd, 413, errorJson("Request too large"));
    } else if (request) {
        try {
            route(clientFd, request->method, request->target, request->body);
        } catch (const std::exception& ex) {
            std::cerr << "[hid] Request " << request->method << " " << request->target << " failed: " << ex.what() << std::endl;
            sendResponse(clientFd, 500, errorJson(ex.what()));
        }
    }

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

void HIDHttpApi::route(int clientFd, const std::string& method, const std::string& target, const std::string& body)
{
    if (target == "/health") {
        if (method != "GET") {
            sendResponse(clientFd, 405, errorJson("Use GET"));
            return;
        }
        sendResponse(clientFd, 200, dispatcher_.healthJson());
    } else if (target == "/api/status") {
        if (method != "GET") {
            sendResponse(clientFd, 405, errorJson("Use GET"));
            return;
        }
        sendResponse(clientFd, 200, dispatcher_.statusJson());
    } else if (target == "/api/events") {
        if (method != "GET") {
            sendResponse(clientFd, 405, errorJson("Use GET"));
            return;
        }
        sendResponse(clientFd, 200, dispatcher_.drainEventsJson());
    } else if (target == "/api/command") {
        if (method != "POST") {
            sendResponse(clientFd, 405, errorJson("Use POST"));
            return;
        }
        const auto response = dispatcher_.dispatch(body);
        sendResponse(clientFd, response.status, response.body);
    } else {
        sendResponse(clientFd, 404, errorJson("Unknown endpoint"));
    }
}

void HIDHttpApi::sendResponse(int clientFd, int statusCode, const std::string& body, const std::string& contentType) const
{
    std::ostringstream response;
    response << "HTTP/1.1 " << statusCode << ' ' << statusText(statusCode) << "\r\n";
    response << "Content-Type: " << contentType << "\r\n";
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << body;

    const auto responseStr = response.str();
    std::size_t sent = 0;
    while (sent < responseStr.size()) {
        const ssize_t n = ::send(clientFd, responseStr.data() + sent, responseStr.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            std::cerr << "[hid] Failed to send response: " << std::strerror(errno) << std::endl;
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}
