#include "PortEnumerator.hpp"
#include "Logger.hpp"
#include <libudev.h>
#include <algorithm>
#include <stdexcept>

namespace UrSerial {

PortEnumerator::PortEnumerator(std::vector<std::string> devicePathFilters)
    : devicePathFilters_(std::move(devicePathFilters)) {}

std::vector<std::string> PortEnumerator::defaultFilters() {
    return {"/dev/ttyUSB", "/dev/ttyACM", "/dev/ttyS", "/dev/ttyAMA"};
}

bool PortEnumerator::matchesFilter(const std::string& devicePath) const {
    if (devicePathFilters_.empty()) {
        return true;
    }
    for (const auto& filter : devicePathFilters_) {
        if (devicePath.find(filter) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> PortEnumerator::enumerate() const {
    std::vector<std::string> ports;

    struct udev* udev = udev_new();
    if (!udev) {
        LOG_ERROR("Failed to create udev context");
        throw std::runtime_error("Failed to create udev context");
    }

    struct udev_enumerate* enumerate = udev_enumerate_new(udev);
    if (!enumerate) {
        LOG_ERROR("Failed to create udev enumerate");
        udev_unref(udev);
        throw std::runtime_error("Failed to create udev enumerate");
    }

    if (udev_enumerate_add_match_subsystem(enumerate, "tty") < 0 ||
        udev_enumerate_scan_devices(enumerate) < 0) {
        LOG_ERROR("Failed to scan tty devices");
        udev_enumerate_unref(enumerate);
        udev_unref(udev);
        throw std::runtime_error("Failed to scan tty devices");
    }

    struct udev_list_entry* devices = udev_enumerate_get_list_entry(enumerate);
    struct udev_list_entry* entry;

    udev_list_entry_foreach(entry, devices) {
        const char* syspath = udev_list_entry_get_name(entry);
        struct udev_device* dev = udev_device_new_from_syspath(udev, syspath);
        if (!dev) continue;

        const char* devnode = udev_device_get_devnode(dev);
        if (devnode) {
            std::string devicePath(devnode);
            if (matchesFilter(devicePath)) {
                ports.push_back(devicePath);
            }
        }

        udev_device_unref(dev);
    }

    udev_enumerate_unref(enumerate);
    udev_unref(udev);

    std::sort(ports.begin(), ports.end());
    LOG_DEBUG("Found " + std::to_string(ports.size()) + " serial port(s)");
    return ports;
}

} // namespace UrSerial
