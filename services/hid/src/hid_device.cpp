#include "hid_device.hpp"

#include "keyboard_errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

FileHidDevice::~FileHidDevice()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FileHidDevice::open(const std::string& path)
{
    if (fd_ >= 0) {
        return;
    }

    if (::access(path.c_str(), F_OK | R_OK | W_OK) != 0) {
        throw KeyboardError(KeyboardErrorCode::DeviceUnavailable,
                            "HID device not found or inaccessible: " + path + " (" + std::strerror(errno) + ")");
    }

    const int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        throw KeyboardError(KeyboardErrorCode::DeviceUnavailable,
                            "Failed to open HID device " + path + ": " + std::strerror(errno));
    }

    fd_ = fd;
    path_ = path;
}

void FileHidDevice::close()
{
    if (fd_ < 0) {
        return;
    }

    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw KeyboardError(KeyboardErrorCode::DeviceUnavailable,
                            "Failed to close HID device " + path_ + ": " + std::strerror(errno));
    }
}

void FileHidDevice::write(const KeyboardReport& report)
{
    if (fd_ < 0) {
        throw KeyboardError(KeyboardErrorCode::NotConnected, "Not connected to HID device");
    }

    ssize_t written = 0;
    do {
        written = ::write(fd_, report.data(), report.size());
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        throw KeyboardError(KeyboardErrorCode::DeviceUnavailable,
                            "Failed to write HID device " + path_ + ": " + std::strerror(errno));
    }
    if (static_cast<std::size_t>(written) != report.size()) {
        throw KeyboardError(KeyboardErrorCode::DeviceUnavailable,
                            "Short write to HID device " + path_ + ": " + std::to_string(written) + " of "
                                + std::to_string(report.size()) + " bytes");
    }
}
