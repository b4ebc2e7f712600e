#pragma once

#include "hid_reports.hpp"

#include <string>

/*
    Sink for 8-byte boot keyboard reports.

    Implementations report failures by throwing KeyboardError with
    DeviceUnavailable. Writes are whole reports only.
*/
class HidDevice {
public:
    virtual ~HidDevice() = default;

    virtual void open(const std::string& path) = 0;
    virtual void close() = 0;
    virtual void write(const KeyboardReport& report) = 0;

    [[nodiscard]] virtual bool isOpen() const noexcept = 0;
};

// USB gadget node such as /dev/hidg0, driven through a POSIX descriptor.
class FileHidDevice : public HidDevice {
public:
    FileHidDevice() = default;
    ~FileHidDevice() override;

    FileHidDevice(const FileHidDevice&) = delete;
    FileHidDevice& operator=(const FileHidDevice&) = delete;

    void open(const std::string& path) override;
    void close() override;
    void write(const KeyboardReport& report) override;

    [[nodiscard]] bool isOpen() const noexcept override { return fd_ >= 0; }

private:
    int fd_{-1};
    std::string path_;
};
